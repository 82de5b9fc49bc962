#ifndef MINILOGO_DEBUG_HPP
#define MINILOGO_DEBUG_HPP

#include <source_location>
#include "string.hpp"

namespace minilogo {
	bool debug_init();
	void debug_term();
	void set_trace_enabled(bool enabled);
	[[nodiscard]] bool is_trace_enabled();
	bool _print_stdout_char32_t(char32_t c);
	bool _print_stderr_char32_t(char32_t c);
	void _begin_stderr_highlight();
	void _end_stderr_highlight();

	template<typename... Args>
	void print(Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		minilogo::format_into(minilogo::_print_stdout_char32_t,format,std::forward<Args>(args)...);
	}
	template<typename... Args>
	void eprint(Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		minilogo::_begin_stderr_highlight();
		minilogo::format_into(minilogo::_print_stderr_char32_t,format,std::forward<Args>(args)...);
		minilogo::_end_stderr_highlight();
	}
	//Verbose log channel, silent unless enabled with 'set_trace_enabled'.
	template<typename... Args>
	void trace(Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		if(!minilogo::is_trace_enabled()) return;
		minilogo::format_into(minilogo::_print_stdout_char32_t,"[trace] ");
		minilogo::format_into(minilogo::_print_stdout_char32_t,format,std::forward<Args>(args)...);
		minilogo::_print_stdout_char32_t('\n');
	}

	void assert(bool condition,std::source_location loc = std::source_location::current());
	[[noreturn]] void unreachable(std::source_location loc = std::source_location::current());
}

#endif
