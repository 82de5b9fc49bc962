#ifndef MINILOGO_LEXER_HPP
#define MINILOGO_LEXER_HPP

#include <cstddef>
#include <cstdint>
#include "error.hpp"
#include "string.hpp"
#include "containers.hpp"

namespace minilogo {
	enum struct Token_Type {
		None,
		Left_Bracket,
		Right_Bracket,
		Int_Literal,
		String_Literal,
		Bool_Literal,
		Variable_Ref,
		Identifier,
		Operator_Plus,
		Operator_Minus,
		Operator_Multiply,
		Operator_Divide,
		Operator_Equal,
		Operator_Unequal,
		Operator_Greater_Than,
		Operator_Less_Than,
		Operator_And,
		Operator_Or,
		Query_Xcor,
		Query_Ycor,
		Query_Heading,
		Query_Color,
		Keyword_Penup,
		Keyword_Pendown,
		Keyword_Forward,
		Keyword_Back,
		Keyword_Left,
		Keyword_Right,
		Keyword_Setpencolor,
		Keyword_Turn,
		Keyword_Setheading,
		Keyword_Setx,
		Keyword_Sety,
		Keyword_Make,
		Keyword_Addassign,
		Keyword_If,
		Keyword_While,
		Keyword_To,
		Keyword_End
	};
	[[nodiscard]] bool is_token_type_operator(Token_Type type);
	[[nodiscard]] bool is_token_type_query(Token_Type type);
	[[nodiscard]] bool is_token_type_literal(Token_Type type);
	//Tokens that can begin an expression.
	[[nodiscard]] bool is_token_type_value_like(Token_Type type);

	struct Token {
		Token_Type type;
		//Whole token text as written in the source.
		String_View string;
		//Text after the '"' or ':' prefix for string literals and variable references.
		String_View name;
		std::size_t offset;
		std::size_t line_index;
		std::int32_t int_value;
		bool bool_value;
	};

	enum struct Lexing_Status {
		Success,
		Out_Of_Tokens
	};
	struct Lexing_Result {
		const Token* token;
		Lexing_Status status;
		Lexing_Result(const Token& _token) : token(&_token),status(Lexing_Status::Success) {}
		Lexing_Result(Lexing_Status _status) : token(),status(_status) {}
	};

	struct Lexer {
		String_View source;
		Heap_Array<Token> tokens;
		std::size_t current_token_index;
	};

	[[nodiscard]] bool init_lexer(Lexer* lexer,String_View source,Error* error);
	void term_lexer(Lexer* lexer);
	[[nodiscard]] Lexing_Result get_next_token(Lexer* lexer);
	[[nodiscard]] Lexing_Result peek_next_token(const Lexer* lexer);
	[[nodiscard]] bool is_next_token_of_type(const Lexer* lexer,Token_Type type);
}

#endif
