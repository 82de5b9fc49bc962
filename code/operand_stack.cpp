#include "operand_stack.hpp"

namespace minilogo {
	void Operand_Stack::destroy() {
		values.destroy();
	}

	bool Operand_Stack::push(const Value& value,Error* error) {
		if(!values.push_back(value)) {
			minilogo::report_out_of_memory(error,sizeof(Value));
			return false;
		}
		return true;
	}

	Option<Value> Operand_Stack::pop(Error* error) {
		if(values.is_empty()) {
			minilogo::report_error(error,Error_Type::Stack_Underflow,"Tried to pop a value from an empty operand stack.");
			return {};
		}
		Value value = values.back();
		values.pop_back();
		return value;
	}

	std::size_t Operand_Stack::depth() const {
		return values.length;
	}
}
