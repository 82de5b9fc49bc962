#include "debug.hpp"
#include "lexer.hpp"

namespace minilogo {
	struct Keyword {
		String_View text;
		Token_Type type;
	};
	static const Keyword Keywords[] = {
		{"TRUE",Token_Type::Bool_Literal},
		{"FALSE",Token_Type::Bool_Literal},
		{"+",Token_Type::Operator_Plus},
		{"-",Token_Type::Operator_Minus},
		{"*",Token_Type::Operator_Multiply},
		{"/",Token_Type::Operator_Divide},
		{"EQ",Token_Type::Operator_Equal},
		{"NE",Token_Type::Operator_Unequal},
		{"GT",Token_Type::Operator_Greater_Than},
		{"LT",Token_Type::Operator_Less_Than},
		{"AND",Token_Type::Operator_And},
		{"OR",Token_Type::Operator_Or},
		{"XCOR",Token_Type::Query_Xcor},
		{"YCOR",Token_Type::Query_Ycor},
		{"HEADING",Token_Type::Query_Heading},
		{"COLOR",Token_Type::Query_Color},
		{"PENUP",Token_Type::Keyword_Penup},
		{"PENDOWN",Token_Type::Keyword_Pendown},
		{"FORWARD",Token_Type::Keyword_Forward},
		{"BACK",Token_Type::Keyword_Back},
		{"LEFT",Token_Type::Keyword_Left},
		{"RIGHT",Token_Type::Keyword_Right},
		{"SETPENCOLOR",Token_Type::Keyword_Setpencolor},
		{"TURN",Token_Type::Keyword_Turn},
		{"SETHEADING",Token_Type::Keyword_Setheading},
		{"SETX",Token_Type::Keyword_Setx},
		{"SETY",Token_Type::Keyword_Sety},
		{"MAKE",Token_Type::Keyword_Make},
		{"ADDASSIGN",Token_Type::Keyword_Addassign},
		{"IF",Token_Type::Keyword_If},
		{"WHILE",Token_Type::Keyword_While},
		{"TO",Token_Type::Keyword_To},
		{"END",Token_Type::Keyword_End}
	};

	bool is_token_type_operator(Token_Type type) {
		switch(type) {
			case Token_Type::Operator_Plus:
			case Token_Type::Operator_Minus:
			case Token_Type::Operator_Multiply:
			case Token_Type::Operator_Divide:
			case Token_Type::Operator_Equal:
			case Token_Type::Operator_Unequal:
			case Token_Type::Operator_Greater_Than:
			case Token_Type::Operator_Less_Than:
			case Token_Type::Operator_And:
			case Token_Type::Operator_Or:
				return true;
			default: return false;
		}
	}
	bool is_token_type_query(Token_Type type) {
		return minilogo::is_one_of(type,Token_Type::Query_Xcor,Token_Type::Query_Ycor,Token_Type::Query_Heading,Token_Type::Query_Color);
	}
	bool is_token_type_literal(Token_Type type) {
		return minilogo::is_one_of(type,Token_Type::Int_Literal,Token_Type::String_Literal,Token_Type::Bool_Literal,Token_Type::Variable_Ref);
	}
	bool is_token_type_value_like(Token_Type type) {
		return minilogo::is_token_type_literal(type) || minilogo::is_token_type_operator(type) || minilogo::is_token_type_query(type);
	}

	template<typename... Args>
	static void report_lexer_error(Error* error,std::size_t offset,std::size_t length,std::size_t line_index,Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		minilogo::report_error(error,Error_Type::Parse_Error,format,std::forward<Args>(args)...);
		error->span_start = offset;
		error->span_length = length;
		error->line_index = line_index;
	}

	//Names are ASCII only, other code points are allowed in comments.
	[[nodiscard]] static bool is_code_point_alpha(char32_t code_point) {
		return (code_point >= 'a' && code_point <= 'z') || (code_point >= 'A' && code_point <= 'Z');
	}
	[[nodiscard]] static bool is_code_point_digit(char32_t code_point) {
		return code_point >= '0' && code_point <= '9';
	}
	[[nodiscard]] static bool is_code_point_whitespace(char32_t code_point) {
		return code_point == ' ' || code_point == '\t' || code_point == '\r' || code_point == '\n';
	}
	[[nodiscard]] static bool is_name_code_point(char32_t code_point) {
		return minilogo::is_code_point_alpha(code_point) || minilogo::is_code_point_digit(code_point) || code_point == U'_';
	}

	[[nodiscard]] static bool is_name(String_View string,bool allow_dash) {
		if(string.is_empty()) return false;
		for(auto c : string) {
			if(minilogo::is_name_code_point(c)) continue;
			if(allow_dash && c == '-') continue;
			return false;
		}
		return true;
	}

	[[nodiscard]] static bool is_number_text(String_View string) {
		if(minilogo::string_starts_with(string,'-')) string = string.drop_prefix(1);
		if(string.is_empty()) return false;
		for(auto c : string) {
			if(!minilogo::is_code_point_digit(c)) return false;
		}
		return true;
	}

	[[nodiscard]] static bool validate_utf8(String_View source,Error* error) {
		std::size_t line_index = 1;
		std::size_t remaining_byte_count = 0;
		for(auto i : Range(source.byte_length())) {
			auto byte = static_cast<unsigned char>(source.begin_ptr[i]);
			if(remaining_byte_count == 0) {
				if(byte == '\n') line_index += 1;
				if(byte == '\0') {
					minilogo::report_lexer_error(error,i,1,line_index,"Null bytes are not allowed.");
					return false;
				}
				if((byte & 0b10000000) == 0) continue;
				else if((byte & 0b11100000) == 0b11000000) remaining_byte_count = 1;
				else if((byte & 0b11110000) == 0b11100000) remaining_byte_count = 2;
				else if((byte & 0b11111000) == 0b11110000) remaining_byte_count = 3;
				else {
					minilogo::report_lexer_error(error,i,1,line_index,"Invalid byte (%) in an UTF-8 sequence.",static_cast<std::uint_least32_t>(byte));
					return false;
				}
			}
			else {
				if((byte & 0b11000000) != 0b10000000) {
					minilogo::report_lexer_error(error,i,1,line_index,"Invalid byte (%) in an UTF-8 sequence.",static_cast<std::uint_least32_t>(byte));
					return false;
				}
				remaining_byte_count -= 1;
			}
		}
		if(remaining_byte_count != 0) {
			minilogo::report_lexer_error(error,source.byte_length(),0,line_index,"Truncated UTF-8 sequence at the end of the input.");
			return false;
		}
		return true;
	}

	[[nodiscard]] static bool is_word_terminator(const char* ptr,const char* end) {
		if(minilogo::is_code_point_whitespace(static_cast<char32_t>(*ptr))) return true;
		if(*ptr == '[' || *ptr == ']') return true;
		return *ptr == '/' && (ptr + 1) < end && *(ptr + 1) == '/';
	}

	[[nodiscard]] static bool classify_word(Token* token,Error* error) {
		String_View word = token->string;
		if(minilogo::string_starts_with(word,'"')) {
			token->name = word.drop_prefix(1);
			if(!minilogo::is_name(token->name,true)) {
				minilogo::report_lexer_error(error,token->offset,word.byte_length(),token->line_index,"Invalid string literal '%'.",word);
				return false;
			}
			token->type = Token_Type::String_Literal;
			return true;
		}
		if(minilogo::string_starts_with(word,':')) {
			token->name = word.drop_prefix(1);
			if(!minilogo::is_name(token->name,false)) {
				minilogo::report_lexer_error(error,token->offset,word.byte_length(),token->line_index,"Invalid variable reference '%'.",word);
				return false;
			}
			token->type = Token_Type::Variable_Ref;
			return true;
		}
		if(minilogo::is_number_text(word)) {
			auto [number,success] = minilogo::parse_int32(word);
			if(!success) {
				minilogo::report_lexer_error(error,token->offset,word.byte_length(),token->line_index,"Integer literal '%' does not fit in a 32 bit signed integer",word);
				return false;
			}
			token->type = Token_Type::Int_Literal;
			token->int_value = number;
			return true;
		}
		for(const auto& keyword : Keywords) {
			if(!minilogo::strings_equal(word,keyword.text)) continue;
			token->type = keyword.type;
			token->bool_value = minilogo::strings_equal(word,"TRUE");
			return true;
		}
		if(minilogo::is_name(word,false)) {
			token->type = Token_Type::Identifier;
			token->name = word;
			return true;
		}
		minilogo::report_lexer_error(error,token->offset,word.byte_length(),token->line_index,"Invalid token '%'.",word);
		return false;
	}

	bool init_lexer(Lexer* lexer,String_View source,Error* error) {
		lexer->source = source;
		lexer->tokens = {};
		lexer->current_token_index = 0;
		if(!minilogo::validate_utf8(source,error)) return false;

		const char* ptr = source.begin_ptr;
		const char* end = source.end_ptr;
		std::size_t line_index = 1;
		while(ptr < end) {
			if(*ptr == '\n') {
				line_index += 1;
				ptr += 1;
				continue;
			}
			if(minilogo::is_code_point_whitespace(static_cast<char32_t>(*ptr))) {
				ptr += 1;
				continue;
			}
			if(*ptr == '/' && (ptr + 1) < end && *(ptr + 1) == '/') {
				while(ptr < end && *ptr != '\n') ptr += 1;
				continue;
			}

			Token token{};
			token.offset = static_cast<std::size_t>(ptr - source.begin_ptr);
			token.line_index = line_index;
			if(*ptr == '[' || *ptr == ']') {
				token.type = (*ptr == '[') ? Token_Type::Left_Bracket : Token_Type::Right_Bracket;
				token.string = String_View(ptr,1);
				ptr += 1;
			}
			else {
				String_Const_Iterator it{ptr};
				while(it.ptr < end && !minilogo::is_word_terminator(it.ptr,end)) ++it;
				token.string = String_View(ptr,static_cast<std::size_t>(it.ptr - ptr));
				ptr = it.ptr;
				if(!minilogo::classify_word(&token,error)) {
					lexer->tokens.destroy();
					return false;
				}
			}
			if(!lexer->tokens.push_back(token)) {
				lexer->tokens.destroy();
				minilogo::report_out_of_memory(error,sizeof(Token));
				return false;
			}
		}
		return true;
	}

	void term_lexer(Lexer* lexer) {
		lexer->tokens.destroy();
	}

	Lexing_Result get_next_token(Lexer* lexer) {
		if(lexer->current_token_index >= lexer->tokens.length) return Lexing_Status::Out_Of_Tokens;
		return lexer->tokens[lexer->current_token_index++];
	}

	Lexing_Result peek_next_token(const Lexer* lexer) {
		if(lexer->current_token_index >= lexer->tokens.length) return Lexing_Status::Out_Of_Tokens;
		return lexer->tokens[lexer->current_token_index];
	}

	bool is_next_token_of_type(const Lexer* lexer,Token_Type type) {
		auto result = minilogo::peek_next_token(lexer);
		return result.status == Lexing_Status::Success && result.token->type == type;
	}
}
