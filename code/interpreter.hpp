#ifndef MINILOGO_INTERPRETER_HPP
#define MINILOGO_INTERPRETER_HPP

#include <cstdint>
#include "error.hpp"
#include "value.hpp"
#include "turtle.hpp"
#include "parser.hpp"
#include "procedures.hpp"
#include "environment.hpp"
#include "memory_arena.hpp"
#include "operand_stack.hpp"

namespace minilogo {
	//Everything one run mutates. Procedures keep views into the executed 'Program', so it has to outlive the context.
	struct Interpreter_Context {
		Arena_Allocator memory;
		Variable_Environment variables;
		Procedure_Registry procedures;
		Operand_Stack stack;
		Turtle turtle;
	};

	bool init_interpreter(Interpreter_Context* context,std::int32_t width,std::int32_t height,Error* error);
	void destroy_interpreter(Interpreter_Context* context);
	//Stops at the first error. 'error->line_index' is set to the line of the innermost failing command.
	bool execute_program(Interpreter_Context* context,const Program& program,Error* error);
	[[nodiscard]] Option<Value> compute_expression(Interpreter_Context* context,const Ast_Expression& expression,Error* error);
	[[nodiscard]] Option<Value> resolve_variable(Interpreter_Context* context,String_View name,Error* error);
	bool save_image(const Interpreter_Context* context,String_View file_path,Error* error);
}

#endif
