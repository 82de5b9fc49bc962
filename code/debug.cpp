#if defined(_WIN32) || defined(_WIN64) || defined(WIN32)
	#define PLATFORM_WINDOWS
	#define WIN32_LEAN_AND_MEAN
	#define NOMINMAX
	#include <Windows.h>
	#include <io.h>
	#define MINILOGO_ISATTY(FD) _isatty(FD)
#else
	#include <unistd.h>
	#define MINILOGO_ISATTY(FD) isatty(FD)
#endif
#include <cstdio>
#include <cstdlib>
#include "debug.hpp"

#if defined(_MSC_VER) && !defined(__clang__)
	#include <intrin.h>
	#define MINILOGO_BREAKPOINT __debugbreak()
#else
	#define MINILOGO_BREAKPOINT std::abort()
#endif

namespace minilogo {
	static bool trace_enabled = false;
	static bool stderr_is_terminal = false;

	bool debug_init() {
#ifdef PLATFORM_WINDOWS
		if(!SetConsoleOutputCP(CP_UTF8)) {
			minilogo::eprint("Couldn't set console output code page to UTF-8.\n");
			return false;
		}
		DWORD console_mode = 0;
		if(GetConsoleMode(GetStdHandle(STD_ERROR_HANDLE),&console_mode)) {
			console_mode |= (ENABLE_VIRTUAL_TERMINAL_PROCESSING | ENABLE_PROCESSED_OUTPUT);
			if(!SetConsoleMode(GetStdHandle(STD_ERROR_HANDLE),console_mode)) {
				minilogo::eprint("Couldn't enable ANSI escape codes.\n");
				return false;
			}
		}
		stderr_is_terminal = MINILOGO_ISATTY(2) != 0;
#else
		stderr_is_terminal = MINILOGO_ISATTY(STDERR_FILENO) != 0;
#endif
		return true;
	}

	void debug_term() {
		std::fflush(stdout);
		std::fflush(stderr);
	}

	void set_trace_enabled(bool enabled) {
		trace_enabled = enabled;
	}

	bool is_trace_enabled() {
		return trace_enabled;
	}

	bool _print_stdout_char32_t(char32_t c) {
		auto code_units = minilogo::make_code_units(c);
		return std::fwrite(code_units.data,1,code_units.length,stdout) == code_units.length;
	}

	bool _print_stderr_char32_t(char32_t c) {
		auto code_units = minilogo::make_code_units(c);
		return std::fwrite(code_units.data,1,code_units.length,stderr) == code_units.length;
	}

	void _begin_stderr_highlight() {
		std::fflush(stdout);
		if(stderr_is_terminal) std::fputs("\x1B[38;5;9m",stderr);
	}

	void _end_stderr_highlight() {
		if(stderr_is_terminal) std::fputs("\x1B[0m",stderr);
	}

	void assert(bool condition,std::source_location loc) {
		if(condition) return;
		minilogo::eprint("******** Assertion failed at %:% ********\n",loc.file_name(),loc.line());
		MINILOGO_BREAKPOINT;
	}

	void unreachable(std::source_location loc) {
		minilogo::eprint("******** Unreachable block at %:% ********\n",loc.file_name(),loc.line());
		MINILOGO_BREAKPOINT;
		std::abort();
	}
}
