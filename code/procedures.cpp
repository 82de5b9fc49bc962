#include "debug.hpp"
#include "procedures.hpp"

namespace minilogo {
	void Procedure_Registry::destroy() {
		for(auto& frame : frames) frame.bindings.destroy();
		frames.destroy();
		procedures.destroy();
	}

	[[nodiscard]] static String_View compute_formal_parameter_name(const Ast_Parameter& parameter,const Variable_Environment& variables) {
		if(!parameter.is_variable_style) return parameter.name;
		const Value* value = variables.get(parameter.name);
		if(value && value->type == Value_Type::String) return value->string_v;
		return parameter.name;
	}

	[[nodiscard]] static bool parameter_names_match(Array_View<String_View> parameters,const Ast_Procedure_Definition& definition,const Variable_Environment& variables) {
		if(parameters.length != definition.parameters.length) return false;
		for(auto i : Range(parameters.length)) {
			String_View name = minilogo::compute_formal_parameter_name(definition.parameters[i],variables);
			if(!minilogo::strings_equal(parameters[i],name)) return false;
		}
		return true;
	}

	bool Procedure_Registry::define(const Ast_Procedure_Definition& definition,const Variable_Environment& variables,Arena_Allocator* memory,Error* error) {
		std::size_t parameter_count = definition.parameters.length;
		Procedure* existing = nullptr;
		for(auto& procedure : procedures) {
			if(minilogo::strings_equal(procedure.name,definition.name)) {
				existing = &procedure;
				break;
			}
		}

		Procedure procedure{};
		procedure.name = definition.name;
		procedure.body = definition.body_commands.view();
		//A TO executed again with the same names keeps its parameter array.
		if(existing && minilogo::parameter_names_match(existing->parameters,definition,variables)) {
			procedure.parameters = existing->parameters;
		}
		else {
			String_View* parameters = memory->construct_array<String_View>(parameter_count);
			if(!parameters) {
				minilogo::report_out_of_memory(error,sizeof(String_View) * parameter_count);
				return false;
			}
			for(auto i : Range(parameter_count)) {
				parameters[i] = minilogo::compute_formal_parameter_name(definition.parameters[i],variables);
			}
			procedure.parameters = {parameters,parameter_count};
		}

		if(minilogo::is_trace_enabled()) {
			Array_String<256> parameter_list{};
			for(auto parameter : procedure.parameters) {
				parameter_list.append(U' ');
				parameter_list.append(parameter);
			}
			minilogo::trace("TO % with % parameter(s):%",procedure.name,parameter_count,parameter_list);
		}

		if(existing) {
			*existing = procedure;
			return true;
		}
		if(!procedures.push_back(procedure)) {
			minilogo::report_out_of_memory(error,sizeof(Procedure));
			return false;
		}
		return true;
	}

	Option<Procedure> Procedure_Registry::find(String_View name) const {
		for(const auto& procedure : procedures) {
			if(minilogo::strings_equal(procedure.name,name)) return procedure;
		}
		return {};
	}

	bool Procedure_Registry::push_frame(const Procedure& procedure,Array_View<Value> arguments,Error* error) {
		if(arguments.length != procedure.parameters.length) {
			Array_String<64> expected{};
			minilogo::format(&expected,"% arguments",procedure.parameters.length);
			Array_String<64> got{};
			minilogo::format(&got,"% arguments",arguments.length);
			minilogo::report_invalid_argument(error,"procedure call",got.view(),expected.view());
			return false;
		}

		Parameter_Frame frame{};
		for(auto i : Range(arguments.length)) {
			Variable binding{};
			binding.name = procedure.parameters[i];
			binding.value = arguments[i];
			if(!frame.bindings.push_back(binding)) {
				frame.bindings.destroy();
				minilogo::report_out_of_memory(error,sizeof(Variable) * arguments.length);
				return false;
			}
		}
		if(!frames.push_back(frame)) {
			frame.bindings.destroy();
			minilogo::report_out_of_memory(error,sizeof(Parameter_Frame));
			return false;
		}
		return true;
	}

	void Procedure_Registry::pop_frame() {
		minilogo::assert(!frames.is_empty());
		frames.back().bindings.destroy();
		frames.pop_back();
	}

	const Value* Procedure_Registry::find_parameter(String_View name) const {
		for(std::size_t i = frames.length;i > 0;i -= 1) {
			const Variable* binding = minilogo::find_variable(frames[i - 1].bindings.view(),name);
			if(binding) return &binding->value;
		}
		return nullptr;
	}
}
