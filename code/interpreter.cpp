#include "debug.hpp"
#include "operators.hpp"
#include "interpreter.hpp"

namespace minilogo {
	bool init_interpreter(Interpreter_Context* context,std::int32_t width,std::int32_t height,Error* error) {
		*context = {};
		return context->turtle.init(width,height,error);
	}

	void destroy_interpreter(Interpreter_Context* context) {
		context->turtle.destroy();
		context->stack.destroy();
		context->procedures.destroy();
		context->variables.destroy();
		context->memory.destroy();
	}

	Option<Value> resolve_variable(Interpreter_Context* context,String_View name,Error* error) {
		const Value* value = context->procedures.find_parameter(name);
		if(!value) value = context->variables.get(name);
		if(!value) {
			minilogo::report_undefined_variable(error,name,context->variables);
			return {};
		}

		//A string like ":name" refers to another global, only one level deep.
		if(value->type == Value_Type::String && minilogo::string_starts_with(value->string_v,':')) {
			String_View target_name = value->string_v.drop_prefix(1);
			const Value* target = context->variables.get(target_name);
			if(!target) {
				minilogo::report_undefined_variable(error,target_name,context->variables);
				return {};
			}
			return *target;
		}
		return *value;
	}

	[[nodiscard]] static Option<Value> compute_literal(Interpreter_Context* context,const Value& value,Error* error) {
		switch(value.type) {
			case Value_Type::Variable_Ref: return minilogo::resolve_variable(context,value.variable_name_v,error);
			case Value_Type::String: {
				if(minilogo::strings_equal_ignore_case(value.string_v,"TRUE")) return minilogo::make_bool_value(true);
				if(minilogo::strings_equal_ignore_case(value.string_v,"FALSE")) return minilogo::make_bool_value(false);
				return value;
			}
			case Value_Type::Number:
			case Value_Type::Boolean: return value;
			default: minilogo::unreachable();
		}
	}

	[[nodiscard]] static std::int32_t compute_query(const Interpreter_Context* context,Ast_Query_Type query) {
		switch(query) {
			case Ast_Query_Type::Xcor: return context->turtle.x;
			case Ast_Query_Type::Ycor: return context->turtle.y;
			case Ast_Query_Type::Heading: return context->turtle.heading;
			case Ast_Query_Type::Color: return context->turtle.pen_color_index;
			default: minilogo::unreachable();
		}
	}

	Option<Value> compute_expression(Interpreter_Context* context,const Ast_Expression& expression,Error* error) {
		Value result{};
		switch(expression.type) {
			case Ast_Expression_Type::Value: {
				auto [value,success] = minilogo::compute_literal(context,expression.value,error);
				if(!success) return {};
				result = value;
				break;
			}
			case Ast_Expression_Type::Binary_Operator: {
				//Both operands are left on the stack, 'apply_binary_operator' takes them back off.
				auto [left,success0] = minilogo::compute_expression(context,*expression.binary_operator->left,error);
				if(!success0) return {};
				auto [right,success1] = minilogo::compute_expression(context,*expression.binary_operator->right,error);
				if(!success1) return {};
				auto [value,success2] = minilogo::apply_binary_operator(&context->stack,expression.binary_operator->type,error);
				if(!success2) return {};
				result = value;
				break;
			}
			case Ast_Expression_Type::Query: {
				result = minilogo::make_number_value(minilogo::compute_query(context,expression.query));
				break;
			}
			default: minilogo::unreachable();
		}
		if(!context->stack.push(result,error)) return {};
		return result;
	}

	//Computes the expression and takes its value back off the operand stack.
	[[nodiscard]] static Option<Value> evaluate_argument(Interpreter_Context* context,const Ast_Expression& expression,Error* error) {
		auto [value,success] = minilogo::compute_expression(context,expression,error);
		if(!success) return {};
		return context->stack.pop(error);
	}

	[[nodiscard]] static Option<std::int32_t> evaluate_int_argument(Interpreter_Context* context,const Ast_Expression& expression,Error* error) {
		auto [value,success] = minilogo::evaluate_argument(context,expression,error);
		if(!success) return {};
		return minilogo::value_to_int(value,error);
	}

	[[nodiscard]] static Option<bool> evaluate_condition(Interpreter_Context* context,const Ast_Expression& expression,Error* error) {
		auto [value,success] = minilogo::evaluate_argument(context,expression,error);
		if(!success) return {};
		return minilogo::value_to_bool(value,error);
	}

	[[nodiscard]] static bool execute_commands(Interpreter_Context* context,Array_View<Ast_Command> commands,Error* error);

	[[nodiscard]] static bool execute_movement(Interpreter_Context* context,const Ast_Command& command,Error* error) {
		auto [distance,success] = minilogo::evaluate_int_argument(context,command.argument_expr,error);
		if(!success) return false;
		Turtle& turtle = context->turtle;
		switch(command.type) {
			case Ast_Command_Type::Forward: return turtle.forward(distance,error);
			case Ast_Command_Type::Back: return turtle.back(distance,error);
			case Ast_Command_Type::Left: return turtle.left(distance,error);
			case Ast_Command_Type::Right: return turtle.right(distance,error);
			case Ast_Command_Type::Set_Pen_Color: return turtle.set_pen_color(distance,error);
			case Ast_Command_Type::Turn: return turtle.turn(distance,error);
			case Ast_Command_Type::Set_Heading: turtle.set_heading(distance); return true;
			case Ast_Command_Type::Set_X: turtle.set_x(distance); return true;
			case Ast_Command_Type::Set_Y: turtle.set_y(distance); return true;
			default: minilogo::unreachable();
		}
	}

	[[nodiscard]] static bool execute_make(Interpreter_Context* context,const Ast_Make& make,Error* error) {
		auto [name_value,success0] = minilogo::evaluate_argument(context,make.name_expr,error);
		if(!success0) return false;
		Number_Text name_buffer{};
		auto [name,success1] = minilogo::value_to_string(name_value,&name_buffer,error);
		if(!success1) return false;
		auto [value,success2] = minilogo::evaluate_argument(context,make.value_expr,error);
		if(!success2) return false;
		return context->variables.set(name,value,&context->memory,error);
	}

	[[nodiscard]] static Option<String_View> resolve_add_assign_target(Interpreter_Context* context,const Ast_Add_Assign& add_assign,Number_Text* name_buffer,Error* error) {
		if(add_assign.is_indirect) {
			auto [target,success] = minilogo::resolve_variable(context,add_assign.target_name,error);
			if(!success) return {};
			return minilogo::value_to_string(target,name_buffer,error);
		}
		const Value* named = context->variables.get(add_assign.target_name);
		if(named && named->type == Value_Type::String) return named->string_v;
		return add_assign.target_name;
	}

	[[nodiscard]] static bool execute_add_assign(Interpreter_Context* context,const Ast_Add_Assign& add_assign,Error* error) {
		auto [amount,success0] = minilogo::evaluate_int_argument(context,add_assign.amount_expr,error);
		if(!success0) return false;
		Number_Text name_buffer{};
		auto [target_name,success1] = minilogo::resolve_add_assign_target(context,add_assign,&name_buffer,error);
		if(!success1) return false;

		const Value* current = context->variables.get(target_name);
		if(!current) {
			minilogo::report_undefined_variable(error,target_name,context->variables);
			return false;
		}
		auto [current_number,success2] = minilogo::value_to_int(*current,error);
		if(!success2) return false;
		auto [sum,fits] = minilogo::narrow_to_int32(static_cast<std::int64_t>(current_number) + amount);
		if(!fits) {
			minilogo::report_error(error,Error_Type::Overflow,"Adding % to '%' (%) overflows a 32 bit signed integer.",amount,target_name,current_number);
			return false;
		}
		return context->variables.set(target_name,minilogo::make_number_value(sum),&context->memory,error);
	}

	[[nodiscard]] static bool execute_procedure_call(Interpreter_Context* context,const Ast_Procedure_Call& call,Error* error) {
		auto [procedure,found] = context->procedures.find(call.name);
		if(!found) {
			minilogo::report_invalid_argument(error,"procedure call",call.name,"a defined procedure name");
			return false;
		}

		Heap_Array<Value> arguments{};
		defer[&]{arguments.destroy();};
		for(const auto& argument_expr : call.arguments) {
			auto [argument,success] = minilogo::evaluate_argument(context,argument_expr,error);
			if(!success) return false;
			if(!arguments.push_back(argument)) {
				minilogo::report_out_of_memory(error,sizeof(Value));
				return false;
			}
		}

		if(!context->procedures.push_frame(procedure,arguments.view(),error)) return false;
		defer[&]{context->procedures.pop_frame();};
		minilogo::trace("CALL % with % argument(s)",call.name,arguments.length);
		return minilogo::execute_commands(context,procedure.body,error);
	}

	[[nodiscard]] static bool execute_command(Interpreter_Context* context,const Ast_Command& command,Error* error) {
		switch(command.type) {
			case Ast_Command_Type::Pen_Up: {
				context->turtle.pen_up();
				return true;
			}
			case Ast_Command_Type::Pen_Down: {
				context->turtle.pen_down();
				return true;
			}
			case Ast_Command_Type::Forward:
			case Ast_Command_Type::Back:
			case Ast_Command_Type::Left:
			case Ast_Command_Type::Right:
			case Ast_Command_Type::Set_Pen_Color:
			case Ast_Command_Type::Turn:
			case Ast_Command_Type::Set_Heading:
			case Ast_Command_Type::Set_X:
			case Ast_Command_Type::Set_Y: {
				return minilogo::execute_movement(context,command,error);
			}
			case Ast_Command_Type::Make: {
				return minilogo::execute_make(context,command.make,error);
			}
			case Ast_Command_Type::Add_Assign: {
				return minilogo::execute_add_assign(context,command.add_assign,error);
			}
			case Ast_Command_Type::If: {
				auto [condition,success] = minilogo::evaluate_condition(context,command.if_command.condition_expr,error);
				if(!success) return false;
				if(condition) return minilogo::execute_commands(context,command.if_command.body_commands.view(),error);
				return true;
			}
			case Ast_Command_Type::While: {
				while(true) {
					auto [condition,success] = minilogo::evaluate_condition(context,command.while_command.condition_expr,error);
					if(!success) return false;
					if(!condition) break;
					if(!minilogo::execute_commands(context,command.while_command.body_commands.view(),error)) return false;
				}
				return true;
			}
			case Ast_Command_Type::Expression: {
				auto [value,success] = minilogo::evaluate_argument(context,command.expression,error);
				return success;
			}
			case Ast_Command_Type::Procedure_Definition: {
				return context->procedures.define(command.procedure_definition,context->variables,&context->memory,error);
			}
			case Ast_Command_Type::Procedure_Call: {
				return minilogo::execute_procedure_call(context,command.procedure_call,error);
			}
			default: minilogo::unreachable();
		}
	}

	static bool execute_commands(Interpreter_Context* context,Array_View<Ast_Command> commands,Error* error) {
		for(const auto& command : commands) {
			if(!minilogo::execute_command(context,command,error)) {
				if(error->line_index == 0) error->line_index = command.line_index;
				return false;
			}
		}
		return true;
	}

	bool execute_program(Interpreter_Context* context,const Program& program,Error* error) {
		if(!minilogo::execute_commands(context,program.commands.view(),error)) return false;
		minilogo::assert(context->stack.depth() == 0);
		return true;
	}

	bool save_image(const Interpreter_Context* context,String_View file_path,Error* error) {
		return context->turtle.save_image(file_path,error);
	}
}
