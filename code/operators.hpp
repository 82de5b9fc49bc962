#ifndef MINILOGO_OPERATORS_HPP
#define MINILOGO_OPERATORS_HPP

#include "utils.hpp"
#include "error.hpp"
#include "value.hpp"
#include "parser.hpp"
#include "operand_stack.hpp"

namespace minilogo {
	//Pops the right operand, then the left one, and returns the result without pushing it.
	[[nodiscard]] Option<Value> apply_binary_operator(Operand_Stack* stack,Ast_Binary_Operator_Type type,Error* error);
	[[nodiscard]] Option<bool> values_equal(const Value& left,const Value& right,Error* error);
}

#endif
