#include "test_harness.hpp"

namespace minilogo {
	static void test_extra_argument_names_command(Test_Context* context) {
		struct Case {
			String_View source;
			String_View command;
			String_View argument;
			String_View expected;
		};
		const Case cases[] = {
			{"PENUP 5","PENUP","5","no arguments"},
			{"PENDOWN :x","PENDOWN",":x","no arguments"},
			{"FORWARD 1 2","FORWARD","2","only one argument"},
			{"BACK 1 \"a","BACK","\"a","only one argument"},
			{"LEFT 1 + 2 3","LEFT","+","only one argument"},
			{"RIGHT 1 XCOR","RIGHT","XCOR","only one argument"},
			{"SETPENCOLOR 1 2","SETPENCOLOR","2","only one argument"},
			{"TURN 1 2","TURN","2","only one argument"},
			{"SETHEADING 1 2","SETHEADING","2","only one argument"},
			{"SETX 1 2","SETX","2","only one argument"},
			{"SETY 1 2","SETY","2","only one argument"},
			{"ADDASSIGN \"x 1 2","ADDASSIGN","2","only two arguments"}
		};
		for(const auto& test_case : cases) {
			Error error{};
			auto [program,success] = minilogo::parse_program(test_case.source,&error);
			minilogo::expect(context,!success);
			if(success) {
				program.destroy();
				continue;
			}
			minilogo::expect(context,error.type == Error_Type::Invalid_Argument);
			minilogo::expect(context,minilogo::strings_equal(error.command.view(),test_case.command));
			minilogo::expect(context,minilogo::strings_equal(error.argument.view(),test_case.argument));
			minilogo::expect(context,minilogo::strings_equal(error.expected.view(),test_case.expected));
		}
	}

	static void test_unmatched_end_reports_line(Test_Context* context) {
		String_View source = "FORWARD 1\nPENUP\n  END\nPENDOWN";
		Error error{};
		auto [program,success] = minilogo::parse_program(source,&error);
		minilogo::expect(context,!success);
		if(success) {
			program.destroy();
			return;
		}
		minilogo::expect(context,error.type == Error_Type::Parse_Error);
		minilogo::expect(context,error.line_index == 3);
		minilogo::expect(context,error.span_start == 18 && error.span_length == 3);
		minilogo::expect(context,minilogo::string_contains(error.message.view(),"on line 3 without matching 'TO'"));
	}

	static void test_unmatched_end_inside_block(Test_Context* context) {
		Error error{};
		auto [program,success] = minilogo::parse_program("IF TRUE [\nPENUP\nEND\n]",&error);
		minilogo::expect(context,!success && error.type == Error_Type::Parse_Error && error.line_index == 3);
		if(success) program.destroy();
	}

	static void test_unterminated_procedure(Test_Context* context) {
		String_View source = "PENDOWN\nTO square :len\nFORWARD :len\nRIGHT 90\n";
		Error error{};
		auto [program,success] = minilogo::parse_program(source,&error);
		minilogo::expect(context,!success);
		if(success) {
			program.destroy();
			return;
		}
		minilogo::expect(context,error.type == Error_Type::Parse_Error);
		minilogo::expect(context,minilogo::strings_equal(error.message.view(),"Unterminated procedure definition 'square': Expected 'END' keyword after 2 commands"));
		minilogo::expect(context,error.line_index == 2);
		minilogo::expect(context,error.span_start == 23);
		minilogo::expect(context,error.span_start + error.span_length == source.byte_length());
	}

	static void test_unterminated_procedure_counts_grouped_commands(Test_Context* context) {
		Error error{};
		auto [program,success] = minilogo::parse_program("TO f [ PENUP PENDOWN ] FORWARD 1 ]",&error);
		minilogo::expect(context,!success);
		if(success) {
			program.destroy();
			return;
		}
		minilogo::expect(context,minilogo::strings_equal(error.message.view(),"Unterminated procedure definition 'f': Expected 'END' keyword after 3 commands"));
	}

	static void test_procedure_definition_shape(Test_Context* context) {
		Error error{};
		Option<Program> parsed = minilogo::parse_program("TO double :n \"unused [ MAKE \"result * :n 2 ] END\ndouble 21 5",&error);
		minilogo::expect(context,parsed.has_value);
		if(!parsed.has_value) return;
		Program& program = parsed.value;
		defer[&]{program.destroy();};

		minilogo::expect(context,program.commands.length == 2);
		if(program.commands.length != 2) return;
		const auto& definition_command = program.commands[0];
		minilogo::expect(context,definition_command.type == Ast_Command_Type::Procedure_Definition);
		const auto& definition = definition_command.procedure_definition;
		minilogo::expect(context,minilogo::strings_equal(definition.name,"double"));
		minilogo::expect(context,definition.parameters.length == 2);
		if(definition.parameters.length == 2) {
			minilogo::expect(context,minilogo::strings_equal(definition.parameters[0].name,"n") && definition.parameters[0].is_variable_style);
			minilogo::expect(context,minilogo::strings_equal(definition.parameters[1].name,"unused") && !definition.parameters[1].is_variable_style);
		}
		minilogo::expect(context,definition.body_commands.length == 1);
		if(definition.body_commands.length == 1) minilogo::expect(context,definition.body_commands[0].type == Ast_Command_Type::Make);

		const auto& call_command = program.commands[1];
		minilogo::expect(context,call_command.type == Ast_Command_Type::Procedure_Call);
		minilogo::expect(context,call_command.line_index == 2);
		minilogo::expect(context,minilogo::strings_equal(call_command.procedure_call.name,"double"));
		minilogo::expect(context,call_command.procedure_call.arguments.length == 2);
	}

	static void test_prefix_operators_nest(Test_Context* context) {
		Error error{};
		Option<Program> parsed = minilogo::parse_program("MAKE \"x + 1 * 2 3",&error);
		minilogo::expect(context,parsed.has_value);
		if(!parsed.has_value) return;
		Program& program = parsed.value;
		defer[&]{program.destroy();};

		minilogo::expect(context,program.commands.length == 1);
		if(program.commands.length != 1) return;
		const Ast_Expression& value_expr = program.commands[0].make.value_expr;
		minilogo::expect(context,value_expr.type == Ast_Expression_Type::Binary_Operator);
		if(value_expr.type != Ast_Expression_Type::Binary_Operator) return;
		const Ast_Binary_Operator& plus = *value_expr.binary_operator;
		minilogo::expect(context,plus.type == Ast_Binary_Operator_Type::Plus);
		minilogo::expect(context,plus.left->type == Ast_Expression_Type::Value && plus.left->value.number_v == 1);
		minilogo::expect(context,plus.right->type == Ast_Expression_Type::Binary_Operator);
		if(plus.right->type == Ast_Expression_Type::Binary_Operator) {
			minilogo::expect(context,plus.right->binary_operator->type == Ast_Binary_Operator_Type::Multiply);
		}
	}

	static void test_keywords_before_procedure_calls(Test_Context* context) {
		Error error{};
		Option<Program> parsed = minilogo::parse_program("PENUP\nforward 10\nWHILE LT XCOR 3 [ SETX + XCOR 1 ]",&error);
		minilogo::expect(context,parsed.has_value);
		if(!parsed.has_value) return;
		Program& program = parsed.value;
		defer[&]{program.destroy();};

		minilogo::expect(context,program.commands.length == 3);
		if(program.commands.length != 3) return;
		minilogo::expect(context,program.commands[0].type == Ast_Command_Type::Pen_Up);
		minilogo::expect(context,program.commands[1].type == Ast_Command_Type::Procedure_Call);
		minilogo::expect(context,program.commands[2].type == Ast_Command_Type::While);
		minilogo::expect(context,program.commands[2].while_command.body_commands.length == 1);
	}

	static void test_whitespace_only_source(Test_Context* context) {
		Error error{};
		auto [program,success] = minilogo::parse_program("  \n\t// nothing to do\n\n",&error);
		minilogo::expect(context,success);
		if(!success) return;
		minilogo::expect(context,program.commands.length == 0);
		program.destroy();
	}

	static void test_structural_errors(Test_Context* context) {
		struct Case {
			String_View source;
			String_View message;
			std::size_t span_start;
		};
		const Case cases[] = {
			{"FORWARD","'FORWARD' expects an argument.",7},
			{"FORWARD + 1","Operator '+' expects two operands.",8},
			{"IF TRUE PENUP","Expected '[' to start the body of 'IF'.",8},
			{"WHILE TRUE [\nPENUP","Expected ']' to close the block opened on line 1.",18},
			{"PENUP ]","Unexpected token ']'.",6},
			{"TO 5","Expected a procedure name after 'TO'.",3}
		};
		for(const auto& test_case : cases) {
			Error error{};
			auto [program,success] = minilogo::parse_program(test_case.source,&error);
			minilogo::expect(context,!success);
			if(success) {
				program.destroy();
				continue;
			}
			minilogo::expect(context,error.type == Error_Type::Parse_Error);
			minilogo::expect(context,minilogo::strings_equal(error.message.view(),test_case.message));
			minilogo::expect(context,error.span_start == test_case.span_start);
		}
	}

	Array_View<Test_Case> get_parser_tests() {
		static const Test_Case Tests[] = {
			{"parser: extra argument names the command",test_extra_argument_names_command},
			{"parser: unmatched END reports its line",test_unmatched_end_reports_line},
			{"parser: unmatched END inside a block",test_unmatched_end_inside_block},
			{"parser: unterminated TO names procedure and count",test_unterminated_procedure},
			{"parser: grouped body commands are counted",test_unterminated_procedure_counts_grouped_commands},
			{"parser: procedure definition and call shape",test_procedure_definition_shape},
			{"parser: prefix operators nest",test_prefix_operators_nest},
			{"parser: keywords win over procedure calls",test_keywords_before_procedure_calls},
			{"parser: whitespace only source is empty",test_whitespace_only_source},
			{"parser: structural errors carry spans",test_structural_errors}
		};
		return {Tests,minilogo::array_length(Tests)};
	}
}
