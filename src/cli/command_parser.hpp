/**
 * @file command_parser.hpp
 * @brief 生成された字句解析器・パーサーの宣言
 */
#ifndef RUNE_LOCK_CLI_COMMAND_PARSER_HPP
#define RUNE_LOCK_CLI_COMMAND_PARSER_HPP

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init_extra(ParserContext* extra, yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

#endif // RUNE_LOCK_CLI_COMMAND_PARSER_HPP
