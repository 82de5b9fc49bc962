#ifndef MINILOGO_ENVIRONMENT_HPP
#define MINILOGO_ENVIRONMENT_HPP

#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "string.hpp"
#include "containers.hpp"
#include "memory_arena.hpp"

namespace minilogo {
	struct Variable {
		String_View name;
		Value value;
	};

	//The single global scope of a run. Names are compared byte for byte.
	struct Variable_Environment {
		Heap_Array<Variable> variables;

		void destroy();
		//Normalizes 'value' before storing it. New names are copied into 'memory'.
		bool set(String_View name,const Value& value,Arena_Allocator* memory,Error* error);
		[[nodiscard]] const Value* get(String_View name) const;
	};

	[[nodiscard]] const Variable* find_variable(Array_View<Variable> variables,String_View name);
	//Fills the error with 'name' and every name currently defined in 'environment'.
	void report_undefined_variable(Error* error,String_View name,const Variable_Environment& environment);
}

#endif
