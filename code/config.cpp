#include "debug.hpp"
#include "config.hpp"

namespace minilogo {
	[[nodiscard]] static Option<std::int32_t> parse_dimension(String_View name,String_View text,Error* error) {
		auto [value,success] = minilogo::parse_int32(text);
		if(!success || value <= 0) {
			minilogo::report_invalid_argument(error,name,text,"a positive 32 bit integer");
			return {};
		}
		return value;
	}

	Option<Run_Config> parse_run_config(int argc,const char* const* argv,Error* error) {
		Run_Config config{};
		String_View positional[4] = {};
		std::size_t positional_count = 0;
		for(int i = 1;i < argc;i += 1) {
			String_View argument = argv[i];
			if(minilogo::strings_equal(argument,"--verbose")) {
				config.verbose = true;
				continue;
			}
			if(positional_count == minilogo::array_length(positional)) {
				minilogo::report_invalid_argument(error,"command line",argument,"exactly 4 positional arguments");
				return {};
			}
			positional[positional_count++] = argument;
		}
		if(positional_count != minilogo::array_length(positional)) {
			Array_String<32> got{};
			minilogo::format(&got,"% arguments",positional_count);
			minilogo::report_invalid_argument(error,"command line",got.view(),"exactly 4 positional arguments");
			return {};
		}

		config.input_path = positional[0];
		config.output_path = positional[1];
		auto [height,success0] = minilogo::parse_dimension("height",positional[2],error);
		if(!success0) return {};
		auto [width,success1] = minilogo::parse_dimension("width",positional[3],error);
		if(!success1) return {};
		config.height = height;
		config.width = width;
		return config;
	}

	void print_usage(String_View program_name) {
		minilogo::eprint("Usage: % <input.lg> <output.svg|output.png> <height> <width> [--verbose]\n",program_name);
	}
}
