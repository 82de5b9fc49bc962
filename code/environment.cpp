#include "debug.hpp"
#include "environment.hpp"

namespace minilogo {
	void Variable_Environment::destroy() {
		variables.destroy();
	}

	const Variable* find_variable(Array_View<Variable> variables,String_View name) {
		for(const auto& variable : variables) {
			if(minilogo::strings_equal(variable.name,name)) return &variable;
		}
		return nullptr;
	}

	bool Variable_Environment::set(String_View name,const Value& value,Arena_Allocator* memory,Error* error) {
		Value normalized = minilogo::normalize_value(value);
		if(minilogo::is_trace_enabled()) {
			auto description = minilogo::describe_value(normalized);
			minilogo::trace("MAKE % = %",name,description);
		}

		for(auto& variable : variables) {
			if(minilogo::strings_equal(variable.name,name)) {
				variable.value = normalized;
				return true;
			}
		}

		auto [name_copy,success] = memory->copy_string(name);
		if(!success) {
			minilogo::report_out_of_memory(error,name.byte_length() + 1);
			return false;
		}
		Variable variable{};
		variable.name = name_copy;
		variable.value = normalized;
		if(!variables.push_back(variable)) {
			minilogo::report_out_of_memory(error,sizeof(Variable));
			return false;
		}
		return true;
	}

	const Value* Variable_Environment::get(String_View name) const {
		const Variable* variable = minilogo::find_variable(variables.view(),name);
		return variable ? &variable->value : nullptr;
	}

	void report_undefined_variable(Error* error,String_View name,const Variable_Environment& environment) {
		minilogo::report_error(error,Error_Type::Undefined_Variable,"Undefined variable '%'",name);
		error->variable_name.clear();
		error->variable_name.append(name);
		error->defined_variables.destroy();
		for(const auto& variable : environment.variables) {
			//A truncated list is reported as is.
			if(!error->defined_variables.push_back(variable.name)) break;
		}
	}
}
