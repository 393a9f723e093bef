/**
 * @file parser_context.hpp
 * @brief コマンドパーサーと字句解析器が共有する状態
 */
#ifndef RUNE_LOCK_CLI_PARSER_CONTEXT_HPP
#define RUNE_LOCK_CLI_PARSER_CONTEXT_HPP

#include "rune_lock/cli/command.hpp"
#include <optional>
#include <string>

struct ParserContext {
    std::optional<rune_lock::cli::Command> command;
    bool has_error = false;
    std::string error_message;

    /**
     * @brief エラーを記録（最初のメッセージを優先）
     * @return 常に false
     */
    bool fail(const std::string& message) {
        has_error = true;
        if (error_message.empty()) {
            error_message = message;
        }
        return false;
    }
};

namespace rune_lock {
namespace cli {

// 文法アクションから呼ばれる。範囲外の値は ctx にエラーを記録して false を返す
bool build_assume(ParserContext& ctx, long long position, long long activation);
bool build_view(ParserContext& ctx, long long node);
bool build_explain(ParserContext& ctx, long long fact, std::optional<long long> depth);
bool build_try_position(ParserContext& ctx, long long position);
bool build_try_activation(ParserContext& ctx, long long activation);

} // namespace cli
} // namespace rune_lock

#endif // RUNE_LOCK_CLI_PARSER_CONTEXT_HPP
