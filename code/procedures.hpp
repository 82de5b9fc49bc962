#ifndef MINILOGO_PROCEDURES_HPP
#define MINILOGO_PROCEDURES_HPP

#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parser.hpp"
#include "string.hpp"
#include "containers.hpp"
#include "environment.hpp"
#include "memory_arena.hpp"

namespace minilogo {
	//Copies of a procedure stay valid after it is redefined, the views point into arena and AST memory.
	struct Procedure {
		String_View name;
		Array_View<String_View> parameters;
		Array_View<Ast_Command> body;
	};

	struct Parameter_Frame {
		Heap_Array<Variable> bindings;
	};

	struct Procedure_Registry {
		Heap_Array<Procedure> procedures;
		//Innermost call last.
		Heap_Array<Parameter_Frame> frames;

		void destroy();
		//Formal parameter names are computed from 'variables' as they are right now.
		bool define(const Ast_Procedure_Definition& definition,const Variable_Environment& variables,Arena_Allocator* memory,Error* error);
		[[nodiscard]] Option<Procedure> find(String_View name) const;
		bool push_frame(const Procedure& procedure,Array_View<Value> arguments,Error* error);
		void pop_frame();
		//Searches the frames from the innermost one outward.
		[[nodiscard]] const Value* find_parameter(String_View name) const;
	};
}

#endif
