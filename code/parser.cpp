#include "lexer.hpp"
#include "debug.hpp"
#include "parser.hpp"

namespace minilogo {
	String_View binary_operator_name(Ast_Binary_Operator_Type type) {
		switch(type) {
			case Ast_Binary_Operator_Type::Plus: return "+";
			case Ast_Binary_Operator_Type::Minus: return "-";
			case Ast_Binary_Operator_Type::Multiply: return "*";
			case Ast_Binary_Operator_Type::Divide: return "/";
			case Ast_Binary_Operator_Type::Equal: return "EQ";
			case Ast_Binary_Operator_Type::Unequal: return "NE";
			case Ast_Binary_Operator_Type::Greater_Than: return "GT";
			case Ast_Binary_Operator_Type::Less_Than: return "LT";
			case Ast_Binary_Operator_Type::And: return "AND";
			case Ast_Binary_Operator_Type::Or: return "OR";
			default: minilogo::unreachable();
		}
	}

	[[nodiscard]] static Ast_Binary_Operator_Type token_type_to_ast_binary_operator_type(Token_Type type) {
		switch(type) {
			case Token_Type::Operator_Plus: return Ast_Binary_Operator_Type::Plus;
			case Token_Type::Operator_Minus: return Ast_Binary_Operator_Type::Minus;
			case Token_Type::Operator_Multiply: return Ast_Binary_Operator_Type::Multiply;
			case Token_Type::Operator_Divide: return Ast_Binary_Operator_Type::Divide;
			case Token_Type::Operator_Equal: return Ast_Binary_Operator_Type::Equal;
			case Token_Type::Operator_Unequal: return Ast_Binary_Operator_Type::Unequal;
			case Token_Type::Operator_Greater_Than: return Ast_Binary_Operator_Type::Greater_Than;
			case Token_Type::Operator_Less_Than: return Ast_Binary_Operator_Type::Less_Than;
			case Token_Type::Operator_And: return Ast_Binary_Operator_Type::And;
			case Token_Type::Operator_Or: return Ast_Binary_Operator_Type::Or;
			default: minilogo::unreachable();
		}
	}
	[[nodiscard]] static Ast_Query_Type token_type_to_ast_query_type(Token_Type type) {
		switch(type) {
			case Token_Type::Query_Xcor: return Ast_Query_Type::Xcor;
			case Token_Type::Query_Ycor: return Ast_Query_Type::Ycor;
			case Token_Type::Query_Heading: return Ast_Query_Type::Heading;
			case Token_Type::Query_Color: return Ast_Query_Type::Color;
			default: minilogo::unreachable();
		}
	}
	[[nodiscard]] static Ast_Command_Type token_type_to_single_argument_command_type(Token_Type type) {
		switch(type) {
			case Token_Type::Keyword_Forward: return Ast_Command_Type::Forward;
			case Token_Type::Keyword_Back: return Ast_Command_Type::Back;
			case Token_Type::Keyword_Left: return Ast_Command_Type::Left;
			case Token_Type::Keyword_Right: return Ast_Command_Type::Right;
			case Token_Type::Keyword_Setpencolor: return Ast_Command_Type::Set_Pen_Color;
			case Token_Type::Keyword_Turn: return Ast_Command_Type::Turn;
			case Token_Type::Keyword_Setheading: return Ast_Command_Type::Set_Heading;
			case Token_Type::Keyword_Setx: return Ast_Command_Type::Set_X;
			case Token_Type::Keyword_Sety: return Ast_Command_Type::Set_Y;
			default: minilogo::unreachable();
		}
	}

	static void destroy_commands(Heap_Array<Ast_Command>* commands);

	static void destroy_command(Ast_Command* command) {
		switch(command->type) {
			case Ast_Command_Type::If: {
				minilogo::destroy_commands(&command->if_command.body_commands);
				break;
			}
			case Ast_Command_Type::While: {
				minilogo::destroy_commands(&command->while_command.body_commands);
				break;
			}
			case Ast_Command_Type::Procedure_Definition: {
				minilogo::destroy_commands(&command->procedure_definition.body_commands);
				command->procedure_definition.parameters.destroy();
				break;
			}
			case Ast_Command_Type::Procedure_Call: {
				command->procedure_call.arguments.destroy();
				break;
			}
			default: break;
		}
	}

	static void destroy_commands(Heap_Array<Ast_Command>* commands) {
		for(auto& command : *commands) minilogo::destroy_command(&command);
		commands->destroy();
	}

	void Program::destroy() {
		minilogo::destroy_commands(&commands);
		memory.destroy();
	}

	struct Parser {
		Lexer lexer;
		Program* program;
		Error* error;
	};

	enum struct Command_Context {
		Top_Level,
		Block,
		Procedure_Body
	};

	enum struct Parsing_Status {
		Continue,
		Error,
		Complete
	};
	struct Parsing_Status_Info {
		Parsing_Status status;
		Ast_Command command;
		Parsing_Status_Info(Parsing_Status _status) : status(_status),command() {}
		Parsing_Status_Info(const Ast_Command& _command) : status(Parsing_Status::Continue),command(_command) {}
	};

	struct Token_Location {
		std::size_t offset;
		std::size_t length;
		std::size_t line_index;
	};

	//Location of the next token, or an empty span at the end of the source.
	[[nodiscard]] static Token_Location get_current_location(const Parser* parser) {
		auto next = minilogo::peek_next_token(&parser->lexer);
		if(next.status == Lexing_Status::Success) {
			return {next.token->offset,next.token->string.byte_length(),next.token->line_index};
		}
		Token_Location location{};
		location.offset = parser->lexer.source.byte_length();
		location.line_index = 1;
		for(auto c : parser->lexer.source) {
			if(c == '\n') location.line_index += 1;
		}
		return location;
	}

	template<typename... Args>
	static void report_parser_error(Parser* parser,Token_Location location,Format_String<std::type_identity_t<Args>...> format,Args&&... args) {
		minilogo::report_error(parser->error,Error_Type::Parse_Error,format,std::forward<Args>(args)...);
		parser->error->span_start = location.offset;
		parser->error->span_length = location.length;
		parser->error->line_index = location.line_index;
	}

	[[nodiscard]] static Token_Location get_token_location(const Token& token) {
		return {token.offset,token.string.byte_length(),token.line_index};
	}

	[[nodiscard]] static Option<String_View> copy_name(Parser* parser,String_View name) {
		auto [copy,success] = parser->program->memory.copy_string(name);
		if(!success) {
			minilogo::report_out_of_memory(parser->error,name.byte_length() + 1);
			return {};
		}
		return copy;
	}

	[[nodiscard]] static Ast_Expression* construct_expression(Parser* parser,const Ast_Expression& expression) {
		auto* node = parser->program->memory.construct<Ast_Expression>();
		if(!node) {
			minilogo::report_out_of_memory(parser->error,sizeof(Ast_Expression));
			return nullptr;
		}
		*node = expression;
		return node;
	}

	[[nodiscard]] static bool is_next_token_value_like(const Parser* parser) {
		auto next = minilogo::peek_next_token(&parser->lexer);
		return next.status == Lexing_Status::Success && minilogo::is_token_type_value_like(next.token->type);
	}

	[[nodiscard]] static Option<Ast_Expression> parse_expression(Parser* parser) {
		auto location = minilogo::get_current_location(parser);
		auto next = minilogo::get_next_token(&parser->lexer);
		if(next.status == Lexing_Status::Out_Of_Tokens || !minilogo::is_token_type_value_like(next.token->type)) {
			minilogo::report_parser_error(parser,location,"Expected an expression.");
			return {};
		}
		const Token& token = *next.token;

		Ast_Expression expression{};
		switch(token.type) {
			case Token_Type::Int_Literal: {
				expression.type = Ast_Expression_Type::Value;
				expression.value = minilogo::make_number_value(token.int_value);
				return expression;
			}
			case Token_Type::Bool_Literal: {
				expression.type = Ast_Expression_Type::Value;
				expression.value = minilogo::make_bool_value(token.bool_value);
				return expression;
			}
			case Token_Type::String_Literal:
			case Token_Type::Variable_Ref: {
				auto [name,success] = minilogo::copy_name(parser,token.name);
				if(!success) return {};
				expression.type = Ast_Expression_Type::Value;
				if(token.type == Token_Type::String_Literal) expression.value = minilogo::make_string_value(name);
				else expression.value = minilogo::make_variable_ref_value(name);
				return expression;
			}
			default: break;
		}

		if(minilogo::is_token_type_query(token.type)) {
			expression.type = Ast_Expression_Type::Query;
			expression.query = minilogo::token_type_to_ast_query_type(token.type);
			return expression;
		}

		auto* binary_operator = parser->program->memory.construct<Ast_Binary_Operator>();
		if(!binary_operator) {
			minilogo::report_out_of_memory(parser->error,sizeof(Ast_Binary_Operator));
			return {};
		}
		binary_operator->type = minilogo::token_type_to_ast_binary_operator_type(token.type);
		Ast_Expression** operands[] = {&binary_operator->left,&binary_operator->right};
		for(auto* operand : operands) {
			if(!minilogo::is_next_token_value_like(parser)) {
				minilogo::report_parser_error(parser,minilogo::get_token_location(token),"Operator '%' expects two operands.",token.string);
				return {};
			}
			auto [operand_expr,success] = minilogo::parse_expression(parser);
			if(!success) return {};
			*operand = minilogo::construct_expression(parser,operand_expr);
			if(!*operand) return {};
		}
		expression.type = Ast_Expression_Type::Binary_Operator;
		expression.binary_operator = binary_operator;
		return expression;
	}

	[[nodiscard]] static Option<Ast_Expression> parse_required_argument(Parser* parser,const Token& command_token) {
		if(!minilogo::is_next_token_value_like(parser)) {
			minilogo::report_parser_error(parser,minilogo::get_current_location(parser),"'%' expects an argument.",command_token.string);
			return {};
		}
		return minilogo::parse_expression(parser);
	}

	[[nodiscard]] static bool ensure_no_extra_argument(Parser* parser,const Token& command_token,String_View expected) {
		if(!minilogo::is_next_token_value_like(parser)) return true;
		const Token& extra = *minilogo::peek_next_token(&parser->lexer).token;
		minilogo::report_invalid_argument(parser->error,command_token.string,extra.string,expected);
		parser->error->span_start = extra.offset;
		parser->error->span_length = extra.string.byte_length();
		parser->error->line_index = extra.line_index;
		return false;
	}

	[[nodiscard]] static Parsing_Status_Info parse_command(Parser* parser,Command_Context context);

	//Parses '[' commands ']' and appends the commands to 'commands'.
	[[nodiscard]] static bool parse_command_block(Parser* parser,Heap_Array<Ast_Command>* commands,String_View owner_name,std::size_t* parsed_count = nullptr) {
		auto open_location = minilogo::get_current_location(parser);
		if(!minilogo::is_next_token_of_type(&parser->lexer,Token_Type::Left_Bracket)) {
			minilogo::report_parser_error(parser,open_location,"Expected '[' to start the body of '%'.",owner_name);
			return false;
		}
		(void) minilogo::get_next_token(&parser->lexer);

		while(true) {
			auto info = minilogo::parse_command(parser,Command_Context::Block);
			if(info.status == Parsing_Status::Error) return false;
			if(info.status == Parsing_Status::Complete) break;
			if(!commands->push_back(info.command)) {
				minilogo::destroy_command(&info.command);
				minilogo::report_out_of_memory(parser->error,sizeof(Ast_Command));
				return false;
			}
			if(parsed_count) *parsed_count += 1;
		}

		if(!minilogo::is_next_token_of_type(&parser->lexer,Token_Type::Right_Bracket)) {
			minilogo::report_parser_error(parser,minilogo::get_current_location(parser),"Expected ']' to close the block opened on line %.",open_location.line_index);
			return false;
		}
		(void) minilogo::get_next_token(&parser->lexer);
		return true;
	}

	[[nodiscard]] static Parsing_Status_Info parse_procedure_definition(Parser* parser) {
		const Token& to_token = *minilogo::get_next_token(&parser->lexer).token;

		Ast_Command command{};
		command.type = Ast_Command_Type::Procedure_Definition;
		command.line_index = to_token.line_index;
		command.procedure_definition = {};
		auto& definition = command.procedure_definition;
		bool successful_return = false;
		defer[&]{
			if(!successful_return) minilogo::destroy_command(&command);
		};

		if(!minilogo::is_next_token_of_type(&parser->lexer,Token_Type::Identifier)) {
			minilogo::report_parser_error(parser,minilogo::get_current_location(parser),"Expected a procedure name after 'TO'.");
			return Parsing_Status::Error;
		}
		const Token& name_token = *minilogo::get_next_token(&parser->lexer).token;
		auto [name,name_copied] = minilogo::copy_name(parser,name_token.name);
		if(!name_copied) return Parsing_Status::Error;
		definition.name = name;

		while(true) {
			auto next = minilogo::peek_next_token(&parser->lexer);
			if(next.status != Lexing_Status::Success) break;
			if(!minilogo::is_one_of(next.token->type,Token_Type::Variable_Ref,Token_Type::String_Literal)) break;
			(void) minilogo::get_next_token(&parser->lexer);

			auto [parameter_name,success] = minilogo::copy_name(parser,next.token->name);
			if(!success) return Parsing_Status::Error;
			Ast_Parameter parameter{};
			parameter.name = parameter_name;
			parameter.is_variable_style = (next.token->type == Token_Type::Variable_Ref);
			if(!definition.parameters.push_back(parameter)) {
				minilogo::report_out_of_memory(parser->error,sizeof(parameter));
				return Parsing_Status::Error;
			}
		}

		auto body_location = minilogo::get_current_location(parser);
		std::size_t parsed_count = 0;
		auto report_unterminated = [&] {
			Token_Location location{};
			location.offset = body_location.offset;
			location.length = parser->lexer.source.byte_length() - body_location.offset;
			location.line_index = to_token.line_index;
			minilogo::report_parser_error(parser,location,"Unterminated procedure definition '%': Expected 'END' keyword after % commands",definition.name,parsed_count);
		};

		while(true) {
			auto next = minilogo::peek_next_token(&parser->lexer);
			if(next.status == Lexing_Status::Out_Of_Tokens) {
				report_unterminated();
				return Parsing_Status::Error;
			}
			if(next.token->type == Token_Type::Keyword_End) {
				(void) minilogo::get_next_token(&parser->lexer);
				break;
			}
			if(next.token->type == Token_Type::Left_Bracket) {
				if(!minilogo::parse_command_block(parser,&definition.body_commands,definition.name,&parsed_count)) return Parsing_Status::Error;
				continue;
			}

			auto info = minilogo::parse_command(parser,Command_Context::Procedure_Body);
			if(info.status == Parsing_Status::Error) return Parsing_Status::Error;
			if(info.status == Parsing_Status::Complete) {
				report_unterminated();
				return Parsing_Status::Error;
			}
			if(!definition.body_commands.push_back(info.command)) {
				minilogo::destroy_command(&info.command);
				minilogo::report_out_of_memory(parser->error,sizeof(Ast_Command));
				return Parsing_Status::Error;
			}
			parsed_count += 1;
		}

		successful_return = true;
		return command;
	}

	[[nodiscard]] static Parsing_Status_Info parse_conditional_block(Parser* parser,const Token& keyword_token) {
		(void) minilogo::get_next_token(&parser->lexer);

		Ast_Command command{};
		command.line_index = keyword_token.line_index;
		Ast_Conditional_Block block{};
		auto [condition,success] = minilogo::parse_required_argument(parser,keyword_token);
		if(!success) return Parsing_Status::Error;
		block.condition_expr = condition;
		if(!minilogo::parse_command_block(parser,&block.body_commands,keyword_token.string)) {
			minilogo::destroy_commands(&block.body_commands);
			return Parsing_Status::Error;
		}

		if(keyword_token.type == Token_Type::Keyword_If) {
			command.type = Ast_Command_Type::If;
			command.if_command = block;
		}
		else {
			command.type = Ast_Command_Type::While;
			command.while_command = block;
		}
		return command;
	}

	[[nodiscard]] static Parsing_Status_Info parse_procedure_call(Parser* parser,const Token& name_token) {
		(void) minilogo::get_next_token(&parser->lexer);

		Ast_Command command{};
		command.type = Ast_Command_Type::Procedure_Call;
		command.line_index = name_token.line_index;
		command.procedure_call = {};
		auto& call = command.procedure_call;
		auto [name,name_copied] = minilogo::copy_name(parser,name_token.name);
		if(!name_copied) return Parsing_Status::Error;
		call.name = name;

		while(minilogo::is_next_token_value_like(parser)) {
			auto [argument,success] = minilogo::parse_expression(parser);
			if(!success || !call.arguments.push_back(argument)) {
				if(success) minilogo::report_out_of_memory(parser->error,sizeof(Ast_Expression));
				call.arguments.destroy();
				return Parsing_Status::Error;
			}
		}
		return command;
	}

	[[nodiscard]] static Parsing_Status_Info parse_command(Parser* parser,Command_Context context) {
		auto next = minilogo::peek_next_token(&parser->lexer);
		if(next.status == Lexing_Status::Out_Of_Tokens) return Parsing_Status::Complete;
		const Token& token = *next.token;

		Ast_Command command{};
		command.line_index = token.line_index;
		switch(token.type) {
			case Token_Type::Right_Bracket: return Parsing_Status::Complete;
			case Token_Type::Keyword_End: {
				if(context == Command_Context::Procedure_Body) return Parsing_Status::Complete;
				Token_Location location = minilogo::get_token_location(token);
				minilogo::report_parser_error(parser,location,"Found 'END' command on line % without matching 'TO' procedure definition. Each 'END' must be paired with a 'TO' procedure definition.",token.line_index);
				return Parsing_Status::Error;
			}
			case Token_Type::Keyword_To: {
				if(context == Command_Context::Procedure_Body) return Parsing_Status::Complete;
				return minilogo::parse_procedure_definition(parser);
			}
			case Token_Type::Keyword_Penup:
			case Token_Type::Keyword_Pendown: {
				(void) minilogo::get_next_token(&parser->lexer);
				command.type = (token.type == Token_Type::Keyword_Penup) ? Ast_Command_Type::Pen_Up : Ast_Command_Type::Pen_Down;
				if(!minilogo::ensure_no_extra_argument(parser,token,"no arguments")) return Parsing_Status::Error;
				return command;
			}
			case Token_Type::Keyword_Forward:
			case Token_Type::Keyword_Back:
			case Token_Type::Keyword_Left:
			case Token_Type::Keyword_Right:
			case Token_Type::Keyword_Setpencolor:
			case Token_Type::Keyword_Turn:
			case Token_Type::Keyword_Setheading:
			case Token_Type::Keyword_Setx:
			case Token_Type::Keyword_Sety: {
				(void) minilogo::get_next_token(&parser->lexer);
				command.type = minilogo::token_type_to_single_argument_command_type(token.type);
				auto [argument,success] = minilogo::parse_required_argument(parser,token);
				if(!success) return Parsing_Status::Error;
				command.argument_expr = argument;
				if(!minilogo::ensure_no_extra_argument(parser,token,"only one argument")) return Parsing_Status::Error;
				return command;
			}
			case Token_Type::Keyword_Make: {
				(void) minilogo::get_next_token(&parser->lexer);
				command.type = Ast_Command_Type::Make;
				command.make = {};
				auto [name_expr,success0] = minilogo::parse_required_argument(parser,token);
				if(!success0) return Parsing_Status::Error;
				auto [value_expr,success1] = minilogo::parse_required_argument(parser,token);
				if(!success1) return Parsing_Status::Error;
				command.make.name_expr = name_expr;
				command.make.value_expr = value_expr;
				return command;
			}
			case Token_Type::Keyword_Addassign: {
				(void) minilogo::get_next_token(&parser->lexer);
				command.type = Ast_Command_Type::Add_Assign;
				command.add_assign = {};

				auto target = minilogo::peek_next_token(&parser->lexer);
				if(target.status != Lexing_Status::Success || !minilogo::is_one_of(target.token->type,Token_Type::String_Literal,Token_Type::Variable_Ref)) {
					minilogo::report_parser_error(parser,minilogo::get_current_location(parser),"'ADDASSIGN' expects a variable name written as \"name or :name.");
					return Parsing_Status::Error;
				}
				(void) minilogo::get_next_token(&parser->lexer);
				auto [target_name,name_copied] = minilogo::copy_name(parser,target.token->name);
				if(!name_copied) return Parsing_Status::Error;
				command.add_assign.target_name = target_name;
				command.add_assign.is_indirect = (target.token->type == Token_Type::Variable_Ref);

				auto [amount_expr,success] = minilogo::parse_required_argument(parser,token);
				if(!success) return Parsing_Status::Error;
				command.add_assign.amount_expr = amount_expr;
				if(!minilogo::ensure_no_extra_argument(parser,token,"only two arguments")) return Parsing_Status::Error;
				return command;
			}
			case Token_Type::Keyword_If:
			case Token_Type::Keyword_While: {
				return minilogo::parse_conditional_block(parser,token);
			}
			case Token_Type::Identifier: {
				return minilogo::parse_procedure_call(parser,token);
			}
			default: break;
		}

		if(minilogo::is_token_type_value_like(token.type)) {
			auto [expression,success] = minilogo::parse_expression(parser);
			if(!success) return Parsing_Status::Error;
			command.type = Ast_Command_Type::Expression;
			command.expression = expression;
			return command;
		}
		return Parsing_Status::Complete;
	}

	Option<Program> parse_program(String_View source,Error* error) {
		Program program{};
		Parser parser{};
		parser.program = &program;
		parser.error = error;
		if(!minilogo::init_lexer(&parser.lexer,source,error)) return {};
		defer[&]{minilogo::term_lexer(&parser.lexer);};

		while(true) {
			auto info = minilogo::parse_command(&parser,Command_Context::Top_Level);
			if(info.status == Parsing_Status::Error) {
				program.destroy();
				return {};
			}
			if(info.status == Parsing_Status::Complete) {
				auto next = minilogo::peek_next_token(&parser.lexer);
				if(next.status == Lexing_Status::Success) {
					minilogo::report_parser_error(&parser,minilogo::get_token_location(*next.token),"Unexpected token '%'.",next.token->string);
					program.destroy();
					return {};
				}
				break;
			}
			if(!program.commands.push_back(info.command)) {
				minilogo::destroy_command(&info.command);
				minilogo::report_out_of_memory(error,sizeof(Ast_Command));
				program.destroy();
				return {};
			}
		}
		return program;
	}
}
