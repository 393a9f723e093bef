/**
 * @file command.hpp
 * @brief 対話ループのコマンドとその構文解析
 */
#ifndef RUNE_LOCK_CLI_COMMAND_HPP
#define RUNE_LOCK_CLI_COMMAND_HPP

#include "rune_lock/activation.hpp"
#include "rune_lock/fact.hpp"
#include "rune_lock/position.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace rune_lock {
namespace cli {

/// assume POSITION ACTIVATION
struct AssumeCommand {
    Position position;
    Activation activation;
};

/// view NODE
struct ViewCommand {
    size_t node;
};

/// explain FACT [DEPTH]
struct ExplainCommand {
    FactHandle fact;
    std::optional<size_t> depth;
};

/// tryposition POSITION
struct TryPositionCommand {
    Position position;
};

/// tryactivation ACTIVATION
struct TryActivationCommand {
    Activation activation;
};

struct DumpCommand {};
struct HelpCommand {};
struct QuitCommand {};

using Command = std::variant<AssumeCommand, ViewCommand, ExplainCommand,
                             TryPositionCommand, TryActivationCommand,
                             DumpCommand, HelpCommand, QuitCommand>;

/**
 * @brief 1行のコマンドを解析
 * @throws std::runtime_error 解析できない場合（メッセージはそのまま表示できる）
 */
Command parse_command(const std::string& line);

/**
 * @brief コマンド一覧
 */
const char* help_text();

} // namespace cli
} // namespace rune_lock

#endif // RUNE_LOCK_CLI_COMMAND_HPP
