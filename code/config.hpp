#ifndef MINILOGO_CONFIG_HPP
#define MINILOGO_CONFIG_HPP

#include <cstdint>
#include "utils.hpp"
#include "error.hpp"
#include "string.hpp"

namespace minilogo {
	struct Run_Config {
		String_View input_path;
		String_View output_path;
		std::int32_t height;
		std::int32_t width;
		bool verbose;
	};

	//Expects "<input> <output> <height> <width>" with an optional "--verbose" anywhere after the program name.
	[[nodiscard]] Option<Run_Config> parse_run_config(int argc,const char* const* argv,Error* error);
	void print_usage(String_View program_name);
}

#endif
