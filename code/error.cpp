#include "debug.hpp"
#include "error.hpp"

namespace minilogo {
	String_View error_type_name(Error_Type type) {
		switch(type) {
			case Error_Type::None: return "None";
			case Error_Type::Parse_Error: return "ParseError";
			case Error_Type::Invalid_Argument: return "InvalidArgument";
			case Error_Type::Undefined_Variable: return "UndefinedVariable";
			case Error_Type::Stack_Underflow: return "StackUnderflow";
			case Error_Type::Division_By_Zero: return "DivisionByZero";
			case Error_Type::Type_Mismatch: return "TypeMismatch";
			case Error_Type::Overflow: return "Overflow";
			case Error_Type::Unexpected_Value: return "UnexpectedValue";
			case Error_Type::Draw_Error: return "DrawError";
			case Error_Type::Image_Save_Error: return "ImageSaveError";
			case Error_Type::IO_Error: return "IOError";
			case Error_Type::Out_Of_Memory: return "OutOfMemory";
			default: minilogo::unreachable();
		}
	}

	void Error::destroy() {
		defined_variables.destroy();
	}

	void report_invalid_argument(Error* error,String_View command,String_View argument,String_View expected) {
		minilogo::report_error(error,Error_Type::Invalid_Argument,"Invalid argument for '%': expected %, got '%'",command,expected,argument);
		error->command.clear();
		error->command.append(command);
		error->argument.clear();
		error->argument.append(argument);
		error->expected.clear();
		error->expected.append(expected);
	}

	void report_unexpected_value(Error* error,String_View expected,String_View got) {
		minilogo::report_error(error,Error_Type::Unexpected_Value,"Expected %, got %",expected,got);
		error->expected.clear();
		error->expected.append(expected);
		error->got.clear();
		error->got.append(got);
	}

	void report_out_of_memory(Error* error,std::size_t byte_count) {
		minilogo::report_error(error,Error_Type::Out_Of_Memory,"Couldn't allocate % bytes of memory.",byte_count);
	}

	struct Source_Line {
		String_View text;
		std::size_t number;
		std::size_t begin_offset;
	};

	[[nodiscard]] static Source_Line find_source_line(String_View source,std::size_t offset) {
		if(offset > source.byte_length()) offset = source.byte_length();
		Source_Line line{};
		line.number = 1;
		line.begin_offset = 0;
		for(auto i : Range(offset)) {
			if(source.begin_ptr[i] == '\n') {
				line.number += 1;
				line.begin_offset = i + 1;
			}
		}
		std::size_t end_offset = line.begin_offset;
		while(end_offset < source.byte_length() && source.begin_ptr[end_offset] != '\n') end_offset += 1;
		if(end_offset > line.begin_offset && source.begin_ptr[end_offset - 1] == '\r') end_offset -= 1;
		line.text = String_View(source.begin_ptr + line.begin_offset,end_offset - line.begin_offset);
		return line;
	}

	[[nodiscard]] static String_View get_line_text(String_View source,std::size_t line_number) {
		std::size_t current = 1;
		std::size_t begin = 0;
		for(auto i : Range(source.byte_length())) {
			if(current == line_number) break;
			if(source.begin_ptr[i] == '\n') {
				current += 1;
				begin = i + 1;
			}
		}
		std::size_t end = begin;
		while(end < source.byte_length() && source.begin_ptr[end] != '\n') end += 1;
		if(end > begin && source.begin_ptr[end - 1] == '\r') end -= 1;
		return String_View(source.begin_ptr + begin,end - begin);
	}

	//Sends formatted text to the callback given to 'write_error'.
	struct Error_Writer {
		bool(*callback)(char32_t,const void*);
		const void* callback_arg;

		template<typename... Args>
		void write(Format_String<std::type_identity_t<Args>...> format,Args&&... args) const {
			auto sink = [this](char32_t c) { return callback(c,callback_arg); };
			minilogo::format_into(sink,format,std::forward<Args>(args)...);
		}
	};

	static void write_parse_error(const Error_Writer& writer,const Error& error,String_View source) {
		static constexpr std::size_t Context_Line_Count = 2;

		auto line = minilogo::find_source_line(source,error.span_start);
		std::size_t column = error.span_start - line.begin_offset;
		writer.write("Error: %\n",error.message);
		writer.write(" --> line %, column %\n",line.number,column + 1);

		std::size_t first_line = (line.number > Context_Line_Count) ? (line.number - Context_Line_Count) : 1;
		for(auto number : Range(first_line,line.number)) {
			writer.write("% | %\n",number,minilogo::get_line_text(source,number));
		}
		writer.write("% | %\n",line.number,line.text);

		Array_String<32> gutter{};
		minilogo::format(&gutter,"%",line.number);
		Array_String<1024> marker{};
		for(auto i : Range(gutter.byte_length)) {
			(void) i;
			marker.append(U' ');
		}
		marker.append(" | ");
		for(auto i : Range(column)) {
			marker.append((i < line.text.byte_length() && line.text.begin_ptr[i] == '\t') ? U'\t' : U' ');
		}

		std::size_t caret_length = error.span_length;
		std::size_t remaining = (column < line.text.byte_length()) ? (line.text.byte_length() - column) : 0;
		if(caret_length > remaining) caret_length = remaining;
		if(caret_length == 0) caret_length = 1;
		for(auto i : Range(caret_length)) {
			(void) i;
			marker.append(U'^');
		}
		writer.write("%\n",marker);
		writer.write("Hint: Check the syntax near the highlighted region.\n");
	}

	static void write_runtime_error_line(const Error_Writer& writer,const Error& error,String_View source) {
		if(error.line_index == 0) return;
		writer.write(" --> line %\n",error.line_index);
		writer.write("% | %\n",error.line_index,minilogo::get_line_text(source,error.line_index));
	}

	void _write_error(bool(*callback)(char32_t,const void*),const void* callback_arg,const Error& error,String_View source) {
		Error_Writer writer{callback,callback_arg};
		switch(error.type) {
			case Error_Type::Parse_Error: {
				minilogo::write_parse_error(writer,error,source);
				break;
			}
			case Error_Type::Undefined_Variable: {
				writer.write("Error: %\n",error.message);
				minilogo::write_runtime_error_line(writer,error,source);
				if(error.defined_variables.is_empty()) {
					writer.write("No variables are defined.\n");
					break;
				}
				writer.write("Defined variables:");
				for(const auto& name : error.defined_variables) writer.write(" %",name);
				writer.write("\n");
				break;
			}
			default: {
				writer.write("Error (%): %\n",minilogo::error_type_name(error.type),error.message);
				minilogo::write_runtime_error_line(writer,error,source);
				break;
			}
		}
	}

	void print_error(const Error& error,String_View source) {
		minilogo::_begin_stderr_highlight();
		minilogo::write_error([](char32_t c) { return minilogo::_print_stderr_char32_t(c); },error,source);
		minilogo::_end_stderr_highlight();
	}
}
