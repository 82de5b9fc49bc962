#include "config.hpp"
#include "test_harness.hpp"

namespace minilogo {
	static void test_positional_arguments(Test_Context* context) {
		const char* argv[] = {"minilogo","house.lg","house.svg","300","400"};
		Error error{};
		auto [config,success] = minilogo::parse_run_config(static_cast<int>(minilogo::array_length(argv)),argv,&error);
		minilogo::expect(context,success);
		minilogo::expect(context,minilogo::strings_equal(config.input_path,"house.lg"));
		minilogo::expect(context,minilogo::strings_equal(config.output_path,"house.svg"));
		minilogo::expect(context,config.height == 300 && config.width == 400);
		minilogo::expect(context,!config.verbose);
	}

	static void test_verbose_anywhere(Test_Context* context) {
		const char* argv[] = {"minilogo","in.lg","--verbose","out.png","10","20"};
		Error error{};
		auto [config,success] = minilogo::parse_run_config(static_cast<int>(minilogo::array_length(argv)),argv,&error);
		minilogo::expect(context,success && config.verbose);
		minilogo::expect(context,minilogo::strings_equal(config.output_path,"out.png"));
		minilogo::expect(context,config.height == 10 && config.width == 20);
	}

	static void test_wrong_argument_count(Test_Context* context) {
		{
			const char* argv[] = {"minilogo","in.lg","out.svg","10"};
			Error error{};
			minilogo::expect(context,!minilogo::parse_run_config(static_cast<int>(minilogo::array_length(argv)),argv,&error).has_value);
			minilogo::expect(context,error.type == Error_Type::Invalid_Argument);
			minilogo::expect(context,minilogo::strings_equal(error.argument.view(),"3 arguments"));
		}
		{
			const char* argv[] = {"minilogo","in.lg","out.svg","10","10","extra"};
			Error error{};
			minilogo::expect(context,!minilogo::parse_run_config(static_cast<int>(minilogo::array_length(argv)),argv,&error).has_value);
			minilogo::expect(context,minilogo::strings_equal(error.argument.view(),"extra"));
		}
	}

	static void test_invalid_dimensions(Test_Context* context) {
		struct Case {
			const char* height;
			const char* width;
			String_View command;
			String_View argument;
		};
		const Case cases[] = {
			{"0","10","height","0"},
			{"abc","10","height","abc"},
			{"10","-5","width","-5"},
			{"10","99999999999","width","99999999999"}
		};
		for(const auto& test_case : cases) {
			const char* argv[] = {"minilogo","in.lg","out.svg",test_case.height,test_case.width};
			Error error{};
			minilogo::expect(context,!minilogo::parse_run_config(static_cast<int>(minilogo::array_length(argv)),argv,&error).has_value);
			minilogo::expect(context,error.type == Error_Type::Invalid_Argument);
			minilogo::expect(context,minilogo::strings_equal(error.command.view(),test_case.command));
			minilogo::expect(context,minilogo::strings_equal(error.argument.view(),test_case.argument));
			minilogo::expect(context,minilogo::strings_equal(error.expected.view(),"a positive 32 bit integer"));
		}
	}

	Array_View<Test_Case> get_config_tests() {
		static const Test_Case Tests[] = {
			{"config: positional arguments",test_positional_arguments},
			{"config: --verbose anywhere",test_verbose_anywhere},
			{"config: wrong argument count",test_wrong_argument_count},
			{"config: invalid dimensions",test_invalid_dimensions}
		};
		return {Tests,minilogo::array_length(Tests)};
	}
}
