#include "procedures.hpp"
#include "environment.hpp"
#include "test_harness.hpp"

namespace minilogo {
	static void test_set_normalizes_values(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		defer[&]{
			variables.destroy();
			memory.destroy();
		};
		Error error{};

		minilogo::expect(context,variables.set("x",minilogo::make_string_value("5"),&memory,&error));
		minilogo::expect(context,variables.set("flag",minilogo::make_string_value("TRUE"),&memory,&error));
		minilogo::expect(context,variables.set("name",minilogo::make_string_value("turtle"),&memory,&error));

		const Value* x = variables.get("x");
		minilogo::expect(context,x && x->type == Value_Type::Number && x->number_v == 5);
		const Value* flag = variables.get("flag");
		minilogo::expect(context,flag && flag->type == Value_Type::Boolean && flag->bool_v);
		const Value* name = variables.get("name");
		minilogo::expect(context,name && name->type == Value_Type::String);
		minilogo::expect(context,variables.get("missing") == nullptr);
	}

	static void test_set_overwrites_in_place(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		defer[&]{
			variables.destroy();
			memory.destroy();
		};
		Error error{};

		char name_buffer[] = "count";
		minilogo::expect(context,variables.set(String_View(name_buffer,5),minilogo::make_number_value(1),&memory,&error));
		//The stored name must not depend on the caller's buffer.
		name_buffer[0] = 'm';
		minilogo::expect(context,variables.set("count",minilogo::make_number_value(2),&memory,&error));
		minilogo::expect(context,variables.variables.length == 1);
		const Value* count = variables.get("count");
		minilogo::expect(context,count && count->number_v == 2);
	}

	static void test_undefined_variable_lists_names(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		Error error{};
		defer[&]{
			error.destroy();
			variables.destroy();
			memory.destroy();
		};

		minilogo::expect(context,variables.set("a",minilogo::make_number_value(1),&memory,&error));
		minilogo::expect(context,variables.set("b",minilogo::make_number_value(2),&memory,&error));
		minilogo::report_undefined_variable(&error,"c",variables);
		minilogo::expect(context,error.type == Error_Type::Undefined_Variable);
		minilogo::expect(context,minilogo::strings_equal(error.variable_name.view(),"c"));
		minilogo::expect(context,error.defined_variables.length == 2);
		if(error.defined_variables.length == 2) {
			minilogo::expect(context,minilogo::strings_equal(error.defined_variables[0],"a"));
			minilogo::expect(context,minilogo::strings_equal(error.defined_variables[1],"b"));
		}
	}

	static void test_parameter_frames_shadow_outward(Test_Context* context) {
		Procedure_Registry registry{};
		defer[&]{registry.destroy();};
		Error error{};

		const String_View parameters[] = {"a","b"};
		Procedure procedure{};
		procedure.name = "p";
		procedure.parameters = {parameters,2};

		const Value outer_arguments[] = {minilogo::make_number_value(1),minilogo::make_number_value(2)};
		minilogo::expect(context,registry.push_frame(procedure,{outer_arguments,2},&error));
		const String_View inner_parameters[] = {"a"};
		Procedure inner{};
		inner.name = "q";
		inner.parameters = {inner_parameters,1};
		const Value inner_arguments[] = {minilogo::make_number_value(10)};
		minilogo::expect(context,registry.push_frame(inner,{inner_arguments,1},&error));

		const Value* a = registry.find_parameter("a");
		minilogo::expect(context,a && a->number_v == 10);
		const Value* b = registry.find_parameter("b");
		minilogo::expect(context,b && b->number_v == 2);

		registry.pop_frame();
		a = registry.find_parameter("a");
		minilogo::expect(context,a && a->number_v == 1);
		registry.pop_frame();
		minilogo::expect(context,registry.find_parameter("a") == nullptr);
		minilogo::expect(context,registry.frames.is_empty());
	}

	static void test_push_frame_checks_arity(Test_Context* context) {
		Procedure_Registry registry{};
		defer[&]{registry.destroy();};
		Error error{};

		const String_View parameters[] = {"n"};
		Procedure procedure{};
		procedure.name = "double";
		procedure.parameters = {parameters,1};
		const Value arguments[] = {minilogo::make_number_value(1),minilogo::make_number_value(2)};
		minilogo::expect(context,!registry.push_frame(procedure,{arguments,2},&error));
		minilogo::expect(context,error.type == Error_Type::Invalid_Argument);
		minilogo::expect(context,minilogo::strings_equal(error.command.view(),"procedure call"));
		minilogo::expect(context,minilogo::strings_equal(error.expected.view(),"1 arguments"));
		minilogo::expect(context,minilogo::strings_equal(error.argument.view(),"2 arguments"));
		minilogo::expect(context,registry.frames.is_empty());
	}

	static void test_definition_time_parameter_names(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		Procedure_Registry registry{};
		Program program{};
		Error error{};
		defer[&]{
			program.destroy();
			registry.destroy();
			variables.destroy();
			memory.destroy();
		};

		auto [parsed,success] = minilogo::parse_program("TO f :alias :plain \"literal\nEND",&error);
		minilogo::expect(context,success);
		if(!success) return;
		program = parsed;

		minilogo::expect(context,variables.set("alias",minilogo::make_string_value("size"),&memory,&error));
		minilogo::expect(context,variables.set("plain",minilogo::make_number_value(3),&memory,&error));
		minilogo::expect(context,registry.define(program.commands[0].procedure_definition,variables,&memory,&error));

		auto [procedure,found] = registry.find("f");
		minilogo::expect(context,found && procedure.parameters.length == 3);
		if(!found || procedure.parameters.length != 3) return;
		minilogo::expect(context,minilogo::strings_equal(procedure.parameters[0],"size"));
		minilogo::expect(context,minilogo::strings_equal(procedure.parameters[1],"plain"));
		minilogo::expect(context,minilogo::strings_equal(procedure.parameters[2],"literal"));
		minilogo::expect(context,!registry.find("g").has_value);
	}

	static void test_redefinition_overwrites(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		Procedure_Registry registry{};
		Program program{};
		Error error{};
		defer[&]{
			program.destroy();
			registry.destroy();
			variables.destroy();
			memory.destroy();
		};

		auto [parsed,success] = minilogo::parse_program("TO f :a\nEND\nTO f\nPENUP\nEND",&error);
		minilogo::expect(context,success);
		if(!success) return;
		program = parsed;

		minilogo::expect(context,registry.define(program.commands[0].procedure_definition,variables,&memory,&error));
		minilogo::expect(context,registry.define(program.commands[1].procedure_definition,variables,&memory,&error));
		minilogo::expect(context,registry.procedures.length == 1);
		auto [procedure,found] = registry.find("f");
		minilogo::expect(context,found && procedure.parameters.length == 0 && procedure.body.length == 1);
	}

	static void test_repeated_definition_keeps_parameters(Test_Context* context) {
		Arena_Allocator memory{};
		Variable_Environment variables{};
		Procedure_Registry registry{};
		Program program{};
		Error error{};
		defer[&]{
			program.destroy();
			registry.destroy();
			variables.destroy();
			memory.destroy();
		};

		auto [parsed,success] = minilogo::parse_program("TO f :a :b\nEND",&error);
		minilogo::expect(context,success);
		if(!success) return;
		program = parsed;
		const Ast_Procedure_Definition& definition = program.commands[0].procedure_definition;

		minilogo::expect(context,registry.define(definition,variables,&memory,&error));
		auto [first,found0] = registry.find("f");
		minilogo::expect(context,registry.define(definition,variables,&memory,&error));
		auto [second,found1] = registry.find("f");
		minilogo::expect(context,found0 && found1 && first.parameters.ptr == second.parameters.ptr);

		//Different names at definition time get a new array.
		minilogo::expect(context,variables.set("a",minilogo::make_string_value("size"),&memory,&error));
		minilogo::expect(context,registry.define(definition,variables,&memory,&error));
		auto [third,found2] = registry.find("f");
		minilogo::expect(context,found2 && third.parameters.ptr != first.parameters.ptr);
		minilogo::expect(context,found2 && minilogo::strings_equal(third.parameters[0],"size"));
		minilogo::expect(context,minilogo::strings_equal(first.parameters[0],"a"));
		minilogo::expect(context,registry.procedures.length == 1);
	}

	Array_View<Test_Case> get_environment_tests() {
		static const Test_Case Tests[] = {
			{"environment: set normalizes values",test_set_normalizes_values},
			{"environment: set overwrites in place",test_set_overwrites_in_place},
			{"environment: undefined variable lists defined names",test_undefined_variable_lists_names},
			{"procedures: parameter frames shadow outward",test_parameter_frames_shadow_outward},
			{"procedures: push_frame checks arity",test_push_frame_checks_arity},
			{"procedures: parameter names are computed at definition",test_definition_time_parameter_names},
			{"procedures: redefinition overwrites",test_redefinition_overwrites},
			{"procedures: repeated definition keeps its parameters",test_repeated_definition_keeps_parameters}
		};
		return {Tests,minilogo::array_length(Tests)};
	}
}
