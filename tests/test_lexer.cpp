#include "lexer.hpp"
#include "test_harness.hpp"

namespace minilogo {
	static void test_token_kinds_and_lines(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"FORWARD 10 // move\n[MAKE \"x_1 :y]\nPENUP",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,success);
		if(!success) return;

		struct Expected_Token {
			Token_Type type;
			std::size_t line_index;
		};
		static const Expected_Token Expected[] = {
			{Token_Type::Keyword_Forward,1},
			{Token_Type::Int_Literal,1},
			{Token_Type::Left_Bracket,2},
			{Token_Type::Keyword_Make,2},
			{Token_Type::String_Literal,2},
			{Token_Type::Variable_Ref,2},
			{Token_Type::Right_Bracket,2},
			{Token_Type::Keyword_Penup,3}
		};
		minilogo::expect(context,lexer.tokens.length == minilogo::array_length(Expected));
		for(const auto& expected : Expected) {
			auto result = minilogo::get_next_token(&lexer);
			minilogo::expect(context,result.status == Lexing_Status::Success);
			if(result.status != Lexing_Status::Success) return;
			minilogo::expect(context,result.token->type == expected.type);
			minilogo::expect(context,result.token->line_index == expected.line_index);
		}
		minilogo::expect(context,minilogo::get_next_token(&lexer).status == Lexing_Status::Out_Of_Tokens);

		minilogo::expect(context,lexer.tokens[1].int_value == 10);
		minilogo::expect(context,lexer.tokens[2].offset == 19);
		minilogo::expect(context,minilogo::strings_equal(lexer.tokens[4].name,"x_1"));
		minilogo::expect(context,minilogo::strings_equal(lexer.tokens[5].name,"y"));
	}

	static void test_keywords_are_case_sensitive(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"forward TRUE FALSE -7",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,success && lexer.tokens.length == 4);
		if(!success || lexer.tokens.length != 4) return;
		minilogo::expect(context,lexer.tokens[0].type == Token_Type::Identifier);
		minilogo::expect(context,lexer.tokens[1].type == Token_Type::Bool_Literal && lexer.tokens[1].bool_value);
		minilogo::expect(context,lexer.tokens[2].type == Token_Type::Bool_Literal && !lexer.tokens[2].bool_value);
		minilogo::expect(context,lexer.tokens[3].type == Token_Type::Int_Literal && lexer.tokens[3].int_value == -7);
	}

	static void test_invalid_token_span(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"FORWARD 10 @",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,!success);
		minilogo::expect(context,error.type == Error_Type::Parse_Error);
		minilogo::expect(context,error.span_start == 11 && error.span_length == 1);
		minilogo::expect(context,minilogo::strings_equal(error.message.view(),"Invalid token '@'."));
	}

	static void test_integer_literal_out_of_range(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"FORWARD\n2147483648",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,!success);
		minilogo::expect(context,error.type == Error_Type::Parse_Error);
		minilogo::expect(context,error.line_index == 2);
		minilogo::expect(context,minilogo::string_contains(error.message.view(),"does not fit in a 32 bit signed integer"));
	}

	static void test_invalid_string_literal(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"MAKE \"a.b 1",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,!success);
		minilogo::expect(context,minilogo::strings_equal(error.message.view(),"Invalid string literal '\"a.b'."));
		minilogo::expect(context,error.span_start == 5 && error.span_length == 4);
	}

	static void test_brackets_split_words(Test_Context* context) {
		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"[PENUP]//done",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,success && lexer.tokens.length == 3);
		if(!success || lexer.tokens.length != 3) return;
		minilogo::expect(context,lexer.tokens[0].type == Token_Type::Left_Bracket);
		minilogo::expect(context,lexer.tokens[1].type == Token_Type::Keyword_Penup);
		minilogo::expect(context,lexer.tokens[2].type == Token_Type::Right_Bracket);
	}

	static void test_names_are_ascii_only(Test_Context* context) {
		struct Case {
			String_View source;
			String_View message;
		};
		const Case cases[] = {
			{"MAKE \"café 1","Invalid string literal '\"café'."},
			{"MAKE \"zażółć 1","Invalid string literal '\"zażółć'."},
			{"FORWARD :naïve","Invalid variable reference ':naïve'."},
			{"straße 1","Invalid token 'straße'."}
		};
		for(const auto& test_case : cases) {
			Lexer lexer{};
			Error error{};
			bool success = minilogo::init_lexer(&lexer,test_case.source,&error);
			defer[&]{minilogo::term_lexer(&lexer);};
			minilogo::expect(context,!success);
			minilogo::expect(context,error.type == Error_Type::Parse_Error);
			minilogo::expect(context,minilogo::strings_equal(error.message.view(),test_case.message));
		}

		Lexer lexer{};
		Error error{};
		bool success = minilogo::init_lexer(&lexer,"MAKE \"Side_2-b :Side_2 // żółw café",&error);
		defer[&]{minilogo::term_lexer(&lexer);};
		minilogo::expect(context,success && lexer.tokens.length == 3);
		if(!success || lexer.tokens.length != 3) return;
		minilogo::expect(context,minilogo::strings_equal(lexer.tokens[1].name,"Side_2-b"));
		minilogo::expect(context,minilogo::strings_equal(lexer.tokens[2].name,"Side_2"));
	}

	Array_View<Test_Case> get_lexer_tests() {
		static const Test_Case Tests[] = {
			{"lexer: token kinds and line numbers",test_token_kinds_and_lines},
			{"lexer: keywords are case sensitive",test_keywords_are_case_sensitive},
			{"lexer: invalid token span",test_invalid_token_span},
			{"lexer: integer literal out of range",test_integer_literal_out_of_range},
			{"lexer: invalid string literal",test_invalid_string_literal},
			{"lexer: brackets and comments split words",test_brackets_split_words},
			{"lexer: names are ASCII only",test_names_are_ascii_only}
		};
		return {Tests,minilogo::array_length(Tests)};
	}
}
