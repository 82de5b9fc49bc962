#include "debug.hpp"
#include "value.hpp"

namespace minilogo {
	Value make_number_value(std::int32_t number) {
		Value value{};
		value.type = Value_Type::Number;
		value.number_v = number;
		return value;
	}

	Value make_string_value(String_View string) {
		Value value{};
		value.type = Value_Type::String;
		value.string_v = string;
		return value;
	}

	Value make_variable_ref_value(String_View name) {
		Value value{};
		value.type = Value_Type::Variable_Ref;
		value.variable_name_v = name;
		return value;
	}

	Value make_bool_value(bool boolean) {
		Value value{};
		value.type = Value_Type::Boolean;
		value.bool_v = boolean;
		return value;
	}

	Option<std::int32_t> value_to_int(const Value& value,Error* error) {
		switch(value.type) {
			case Value_Type::Number: return value.number_v;
			case Value_Type::String: {
				auto [number,success] = minilogo::parse_int32(value.string_v);
				if(!success) {
					minilogo::report_unexpected_value(error,"a number",value.string_v);
					return {};
				}
				return number;
			}
			case Value_Type::Boolean: return value.bool_v ? 1 : 0;
			case Value_Type::Variable_Ref: {
				minilogo::report_error(error,Error_Type::Type_Mismatch,"Variable reference ':%' cannot be used as a number before it is resolved.",value.variable_name_v);
				return {};
			}
			default: minilogo::unreachable();
		}
	}

	Option<bool> value_to_bool(const Value& value,Error* error) {
		switch(value.type) {
			case Value_Type::Boolean: return value.bool_v;
			case Value_Type::String: return minilogo::strings_equal_ignore_case(value.string_v,"TRUE");
			case Value_Type::Number: return value.number_v != 0;
			case Value_Type::Variable_Ref: {
				minilogo::report_error(error,Error_Type::Type_Mismatch,"Variable reference ':%' cannot be used as a boolean before it is resolved.",value.variable_name_v);
				return {};
			}
			default: minilogo::unreachable();
		}
	}

	Option<String_View> value_to_string(const Value& value,Number_Text* buffer,Error* error) {
		switch(value.type) {
			case Value_Type::String: return value.string_v;
			case Value_Type::Boolean: return String_View(value.bool_v ? "true" : "false");
			case Value_Type::Number: {
				buffer->clear();
				minilogo::format(buffer,"%",value.number_v);
				return buffer->view();
			}
			case Value_Type::Variable_Ref: {
				minilogo::report_error(error,Error_Type::Type_Mismatch,"Variable reference ':%' cannot be used as text before it is resolved.",value.variable_name_v);
				return {};
			}
			default: minilogo::unreachable();
		}
	}

	Value normalize_value(const Value& value) {
		if(value.type != Value_Type::String) return value;
		if(minilogo::strings_equal_ignore_case(value.string_v,"TRUE")) return minilogo::make_bool_value(true);
		if(minilogo::strings_equal_ignore_case(value.string_v,"FALSE")) return minilogo::make_bool_value(false);
		auto [number,is_number] = minilogo::parse_int32(value.string_v);
		if(is_number) return minilogo::make_number_value(number);
		return value;
	}

	Array_String<160> describe_value(const Value& value) {
		Array_String<160> description{};
		switch(value.type) {
			case Value_Type::Number: minilogo::format(&description,"number %",value.number_v); break;
			case Value_Type::String: minilogo::format(&description,"string \"%\"",value.string_v); break;
			case Value_Type::Variable_Ref: minilogo::format(&description,"variable reference :%",value.variable_name_v); break;
			case Value_Type::Boolean: minilogo::format(&description,"boolean %",value.bool_v ? "TRUE" : "FALSE"); break;
			default: minilogo::unreachable();
		}
		return description;
	}
}
