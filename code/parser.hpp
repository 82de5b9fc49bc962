#ifndef MINILOGO_PARSER_HPP
#define MINILOGO_PARSER_HPP

#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "string.hpp"
#include "containers.hpp"
#include "memory_arena.hpp"

namespace minilogo {
	struct Ast_Binary_Operator;
	struct Ast_Command;

	enum struct Ast_Query_Type {
		Xcor,
		Ycor,
		Heading,
		Color
	};

	enum struct Ast_Expression_Type {
		Value,
		Binary_Operator,
		Query
	};
	struct Ast_Expression {
		Ast_Expression_Type type;
		union {
			Value value;
			Ast_Binary_Operator* binary_operator;
			Ast_Query_Type query;
		};
		Ast_Expression() : type(),value() {}
	};

	enum struct Ast_Binary_Operator_Type {
		Plus,
		Minus,
		Multiply,
		Divide,
		Equal,
		Unequal,
		Greater_Than,
		Less_Than,
		And,
		Or
	};
	[[nodiscard]] String_View binary_operator_name(Ast_Binary_Operator_Type type);
	struct Ast_Binary_Operator {
		Ast_Binary_Operator_Type type;
		Ast_Expression* left;
		Ast_Expression* right;
	};

	struct Ast_Make {
		Ast_Expression name_expr;
		Ast_Expression value_expr;
	};

	struct Ast_Add_Assign {
		String_View target_name;
		//Written as ':name', so 'target_name' holds the name of the real target.
		bool is_indirect;
		Ast_Expression amount_expr;
	};

	struct Ast_Conditional_Block {
		Ast_Expression condition_expr;
		Heap_Array<Ast_Command> body_commands;
	};

	struct Ast_Parameter {
		String_View name;
		bool is_variable_style;
	};

	struct Ast_Procedure_Definition {
		String_View name;
		Heap_Array<Ast_Parameter> parameters;
		Heap_Array<Ast_Command> body_commands;
	};

	struct Ast_Procedure_Call {
		String_View name;
		Heap_Array<Ast_Expression> arguments;
	};

	enum struct Ast_Command_Type {
		Pen_Up,
		Pen_Down,
		Forward,
		Back,
		Left,
		Right,
		Set_Pen_Color,
		Turn,
		Set_Heading,
		Set_X,
		Set_Y,
		Make,
		Add_Assign,
		If,
		While,
		Expression,
		Procedure_Definition,
		Procedure_Call
	};
	struct Ast_Command {
		Ast_Command_Type type;
		std::size_t line_index;
		union {
			Ast_Expression argument_expr;
			Ast_Make make;
			Ast_Add_Assign add_assign;
			Ast_Conditional_Block if_command;
			Ast_Conditional_Block while_command;
			Ast_Expression expression;
			Ast_Procedure_Definition procedure_definition;
			Ast_Procedure_Call procedure_call;
		};
		Ast_Command() : type(),line_index(),argument_expr() {}
	};

	struct Program {
		Arena_Allocator memory;
		Heap_Array<Ast_Command> commands;
		void destroy();
	};
	//Whitespace and comment only sources give an empty program.
	[[nodiscard]] Option<Program> parse_program(String_View source,Error* error);
}

#endif
