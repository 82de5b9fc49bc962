#include "debug.hpp"
#include "operators.hpp"

namespace minilogo {
	//Compares a number with the text of a string, the text has to be an integer.
	[[nodiscard]] static Option<bool> number_equals_text(std::int32_t number,String_View text,Error* error) {
		auto [parsed,success] = minilogo::parse_int32(text);
		if(!success) {
			minilogo::report_error(error,Error_Type::Type_Mismatch,"Cannot compare the number % with the string \"%\".",number,text);
			return {};
		}
		return parsed == number;
	}

	Option<bool> values_equal(const Value& left,const Value& right,Error* error) {
		if(left.type == Value_Type::Number && right.type == Value_Type::Number) return left.number_v == right.number_v;
		if(left.type == Value_Type::String && right.type == Value_Type::String) return minilogo::strings_equal_ignore_case(left.string_v,right.string_v);
		if(left.type == Value_Type::Boolean && right.type == Value_Type::Boolean) return left.bool_v == right.bool_v;
		if(left.type == Value_Type::Number && right.type == Value_Type::String) return minilogo::number_equals_text(left.number_v,right.string_v,error);
		if(left.type == Value_Type::String && right.type == Value_Type::Number) return minilogo::number_equals_text(right.number_v,left.string_v,error);

		auto left_description = minilogo::describe_value(left);
		auto right_description = minilogo::describe_value(right);
		minilogo::report_error(error,Error_Type::Type_Mismatch,"Cannot compare % with %.",left_description,right_description);
		return {};
	}

	[[nodiscard]] static Option<Value> compute_arithmetic_operation(Ast_Binary_Operator_Type type,std::int32_t left,std::int32_t right,Error* error) {
		auto wide_left = static_cast<std::int64_t>(left);
		auto wide_right = static_cast<std::int64_t>(right);
		std::int64_t result = 0;
		switch(type) {
			case Ast_Binary_Operator_Type::Plus: result = wide_left + wide_right; break;
			case Ast_Binary_Operator_Type::Minus: result = wide_left - wide_right; break;
			case Ast_Binary_Operator_Type::Multiply: result = wide_left * wide_right; break;
			case Ast_Binary_Operator_Type::Divide: {
				if(right == 0) {
					minilogo::report_error(error,Error_Type::Division_By_Zero,"Cannot divide % by zero.",left);
					return {};
				}
				result = wide_left / wide_right;
				break;
			}
			default: minilogo::unreachable();
		}
		auto [narrowed,fits] = minilogo::narrow_to_int32(result);
		if(!fits) {
			minilogo::report_error(error,Error_Type::Overflow,"Operation '% % %' overflows a 32 bit signed integer.",minilogo::binary_operator_name(type),left,right);
			return {};
		}
		return minilogo::make_number_value(narrowed);
	}

	Option<Value> apply_binary_operator(Operand_Stack* stack,Ast_Binary_Operator_Type type,Error* error) {
		auto [right,success0] = stack->pop(error);
		if(!success0) return {};
		auto [left,success1] = stack->pop(error);
		if(!success1) return {};

		switch(type) {
			case Ast_Binary_Operator_Type::Equal: {
				auto [equal,success] = minilogo::values_equal(left,right,error);
				if(!success) return {};
				return minilogo::make_bool_value(equal);
			}
			case Ast_Binary_Operator_Type::And:
			case Ast_Binary_Operator_Type::Or: {
				auto [left_bool,success2] = minilogo::value_to_bool(left,error);
				if(!success2) return {};
				auto [right_bool,success3] = minilogo::value_to_bool(right,error);
				if(!success3) return {};
				if(type == Ast_Binary_Operator_Type::And) return minilogo::make_bool_value(left_bool && right_bool);
				return minilogo::make_bool_value(left_bool || right_bool);
			}
			default: break;
		}

		auto [left_number,success2] = minilogo::value_to_int(left,error);
		if(!success2) return {};
		auto [right_number,success3] = minilogo::value_to_int(right,error);
		if(!success3) return {};

		switch(type) {
			case Ast_Binary_Operator_Type::Unequal: return minilogo::make_bool_value(left_number != right_number);
			case Ast_Binary_Operator_Type::Greater_Than: return minilogo::make_bool_value(left_number > right_number);
			case Ast_Binary_Operator_Type::Less_Than: return minilogo::make_bool_value(left_number < right_number);
			default: return minilogo::compute_arithmetic_operation(type,left_number,right_number,error);
		}
	}
}
