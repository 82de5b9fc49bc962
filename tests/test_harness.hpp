#ifndef MINILOGO_TEST_HARNESS_HPP
#define MINILOGO_TEST_HARNESS_HPP

#include <cstdint>
#include <source_location>
#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parser.hpp"
#include "string.hpp"
#include "containers.hpp"
#include "interpreter.hpp"

namespace minilogo {
	struct Test_Context {
		std::size_t failed_expectation_count;
	};
	struct Test_Case {
		const char* name;
		void(*function)(Test_Context*);
	};

	//Records a failure with its location, the test keeps running.
	void expect(Test_Context* context,bool condition,std::source_location loc = std::source_location::current());
	[[nodiscard]] bool string_contains(String_View string,String_View part);
	//Same type and same payload, no coercion.
	[[nodiscard]] bool values_identical(const Value& a,const Value& b);

	//Everything one parse and run of a source text leaves behind.
	struct Test_Run {
		Program program;
		Interpreter_Context context;
		Error error;
		bool parsed;
		bool executed;
		void destroy();
	};
	void run_source(Test_Run* run,String_View source,std::int32_t width = 200,std::int32_t height = 200);
	[[nodiscard]] Option<std::int32_t> get_global_number(const Test_Run& run,String_View name);

	[[nodiscard]] Array_View<Test_Case> get_value_tests();
	[[nodiscard]] Array_View<Test_Case> get_lexer_tests();
	[[nodiscard]] Array_View<Test_Case> get_parser_tests();
	[[nodiscard]] Array_View<Test_Case> get_operator_tests();
	[[nodiscard]] Array_View<Test_Case> get_environment_tests();
	[[nodiscard]] Array_View<Test_Case> get_turtle_tests();
	[[nodiscard]] Array_View<Test_Case> get_interpreter_tests();
	[[nodiscard]] Array_View<Test_Case> get_config_tests();
	[[nodiscard]] Array_View<Test_Case> get_error_tests();
}

#endif
