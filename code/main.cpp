#include "utils.hpp"
#include "debug.hpp"
#include "error.hpp"
#include "config.hpp"
#include "parser.hpp"
#include "file_io.hpp"
#include "interpreter.hpp"

namespace minilogo {
	[[nodiscard]] static bool run(const Run_Config& config,Error* error) {
		Option<Heap_Array<char>> file = minilogo::read_file(config.input_path,error);
		if(!file.has_value) {
			minilogo::print_error(*error,{});
			return false;
		}
		Heap_Array<char>& file_bytes = file.value;
		defer[&]{file_bytes.destroy();};
		String_View source(file_bytes.data,file_bytes.length);

		Option<Program> parsed = minilogo::parse_program(source,error);
		if(!parsed.has_value) {
			minilogo::print_error(*error,source);
			return false;
		}
		Program& program = parsed.value;
		defer[&]{program.destroy();};
		minilogo::trace("Parsed % top level command(s).",program.commands.length);

		Interpreter_Context context{};
		defer[&]{minilogo::destroy_interpreter(&context);};
		if(!minilogo::init_interpreter(&context,config.width,config.height,error)) {
			minilogo::print_error(*error,source);
			return false;
		}
		if(!minilogo::execute_program(&context,program,error)) {
			minilogo::print_error(*error,source);
			return false;
		}
		minilogo::print("Program executed successfully.\n");

		if(!minilogo::save_image(&context,config.output_path,error)) {
			minilogo::print_error(*error,source);
			return false;
		}
		minilogo::print("Image written to %.\n",config.output_path);
		return true;
	}
}

int main(int argc,char** argv) {
	if(!minilogo::debug_init()) return 1;
	defer[]{minilogo::debug_term();};

	minilogo::Error error{};
	defer[&]{error.destroy();};

	auto [config,config_parsed] = minilogo::parse_run_config(argc,argv,&error);
	if(!config_parsed) {
		minilogo::print_error(error,{});
		minilogo::print_usage((argc > 0) ? argv[0] : "minilogo");
		return 1;
	}
	minilogo::set_trace_enabled(config.verbose);
	return minilogo::run(config,&error) ? 0 : 1;
}
