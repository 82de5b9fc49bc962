#ifndef MINILOGO_ERROR_HPP
#define MINILOGO_ERROR_HPP

#include <cstddef>
#include "string.hpp"
#include "containers.hpp"

namespace minilogo {
	enum struct Error_Type {
		None,
		Parse_Error,
		Invalid_Argument,
		Undefined_Variable,
		Stack_Underflow,
		Division_By_Zero,
		Type_Mismatch,
		Overflow,
		Unexpected_Value,
		Draw_Error,
		Image_Save_Error,
		IO_Error,
		Out_Of_Memory
	};
	[[nodiscard]] String_View error_type_name(Error_Type type);

	//First error of a parse or a run. 'message' is always filled, the other fields depend on 'type'.
	struct Error {
		Error_Type type;
		Array_String<512> message;
		Array_String<128> command;
		Array_String<128> argument;
		Array_String<128> expected;
		Array_String<128> got;
		Array_String<128> variable_name;
		//Views into the variable environment that raised the error.
		Heap_Array<String_View> defined_variables;
		std::size_t span_start;
		std::size_t span_length;
		std::size_t line_index;

		void destroy();
	};

	template<typename... Args>
	void report_error(Error* error,Error_Type type,Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		error->type = type;
		error->message.clear();
		minilogo::format(&error->message,format,std::forward<Args>(args)...);
	}
	void report_invalid_argument(Error* error,String_View command,String_View argument,String_View expected);
	void report_unexpected_value(Error* error,String_View expected,String_View got);
	void report_out_of_memory(Error* error,std::size_t byte_count);

	void _write_error(bool(*callback)(char32_t,const void*),const void* callback_arg,const Error& error,String_View source);

	//Parse errors are shown with the surrounding source lines and a caret under the span.
	template<typename Callback>
	void write_error(const Callback& callback,const Error& error,String_View source) {
		auto lambda = [](char32_t c,const void* arg) -> bool { return (*reinterpret_cast<const Callback*>(arg))(c); };
		minilogo::_write_error(lambda,reinterpret_cast<const void*>(&callback),error,source);
	}
	//Writes the 'write_error' report to stderr.
	void print_error(const Error& error,String_View source);
}

#endif
