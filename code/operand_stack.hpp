#ifndef MINILOGO_OPERAND_STACK_HPP
#define MINILOGO_OPERAND_STACK_HPP

#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "containers.hpp"

namespace minilogo {
	struct Operand_Stack {
		Heap_Array<Value> values;

		void destroy();
		bool push(const Value& value,Error* error);
		//Popping an empty stack is a 'Stack_Underflow' error.
		[[nodiscard]] Option<Value> pop(Error* error);
		[[nodiscard]] std::size_t depth() const;
	};
}

#endif
