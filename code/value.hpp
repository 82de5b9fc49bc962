#ifndef MINILOGO_VALUE_HPP
#define MINILOGO_VALUE_HPP

#include <cstdint>
#include "utils.hpp"
#include "error.hpp"
#include "string.hpp"

namespace minilogo {
	enum struct Value_Type {
		Number,
		String,
		Variable_Ref,
		Boolean
	};
	struct Value {
		Value_Type type;
		union {
			std::int32_t number_v;
			String_View string_v;
			String_View variable_name_v;
			bool bool_v;
		};
		Value() : type(),number_v() {}
	};
	[[nodiscard]] Value make_number_value(std::int32_t number);
	[[nodiscard]] Value make_string_value(String_View string);
	[[nodiscard]] Value make_variable_ref_value(String_View name);
	[[nodiscard]] Value make_bool_value(bool boolean);

	[[nodiscard]] Option<std::int32_t> value_to_int(const Value& value,Error* error);
	[[nodiscard]] Option<bool> value_to_bool(const Value& value,Error* error);
	using Number_Text = Array_String<16>;
	//Number texts are written to 'buffer', the result views it.
	[[nodiscard]] Option<String_View> value_to_string(const Value& value,Number_Text* buffer,Error* error);
	//"TRUE"/"FALSE" in any case become booleans, integer texts become numbers.
	[[nodiscard]] Value normalize_value(const Value& value);
	[[nodiscard]] Array_String<160> describe_value(const Value& value);
}

#endif
