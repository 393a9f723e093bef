#include "rune_lock/cli/command.hpp"
#include "command_parser.hpp"
#include "parser.hpp"
#include <stdexcept>

namespace rune_lock {
namespace cli {

Command parse_command(const std::string& line) {
    ParserContext ctx;

    yyscan_t scanner;
    if (yylex_init_extra(&ctx, &scanner) != 0) {
        throw std::runtime_error("Cannot initialize command scanner");
    }

    YY_BUFFER_STATE buffer = yy_scan_string(line.c_str(), scanner);
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    if (result != 0 || ctx.has_error || !ctx.command) {
        throw std::runtime_error(ctx.error_message.empty() ? "Invalid command"
                                                           : ctx.error_message);
    }
    return *ctx.command;
}

const char* help_text() {
    return "Commands:\n"
           "  assume (a) POSITION ACTIVATION   assume ACTIVATION (1-12) at POSITION (0-11)\n"
           "  view (v) NODE                    move to tree node NODE\n"
           "  explain (e) FACT [DEPTH]         explain fact FACT of the current node\n"
           "  tryposition (tp) POSITION        try every open activation at POSITION\n"
           "  tryactivation (ta) ACTIVATION    try every open position for ACTIVATION\n"
           "  dump (d)                         print the knowledge grid\n"
           "  help (h)                         print this list\n"
           "  quit (q)                         leave\n";
}

// ============================================================================
// Grammar actions
// ============================================================================

bool build_assume(ParserContext& ctx, long long position, long long activation) {
    auto p = Position::from_index(position);
    if (!p) {
        return ctx.fail("Position is out of bounds: " + std::to_string(position));
    }
    auto a = Activation::from_human(activation);
    if (!a) {
        return ctx.fail("Activation is out of bounds: " + std::to_string(activation));
    }
    ctx.command = AssumeCommand{*p, *a};
    return true;
}

bool build_view(ParserContext& ctx, long long node) {
    if (node < 0) {
        return ctx.fail("Node must not be negative: " + std::to_string(node));
    }
    ctx.command = ViewCommand{static_cast<size_t>(node)};
    return true;
}

bool build_explain(ParserContext& ctx, long long fact, std::optional<long long> depth) {
    if (fact < 0) {
        return ctx.fail("Fact must not be negative: " + std::to_string(fact));
    }
    if (depth && *depth < 0) {
        return ctx.fail("Depth must not be negative: " + std::to_string(*depth));
    }
    ExplainCommand command{FactHandle{static_cast<size_t>(fact)}, std::nullopt};
    if (depth) {
        command.depth = static_cast<size_t>(*depth);
    }
    ctx.command = command;
    return true;
}

bool build_try_position(ParserContext& ctx, long long position) {
    auto p = Position::from_index(position);
    if (!p) {
        return ctx.fail("Position is out of bounds: " + std::to_string(position));
    }
    ctx.command = TryPositionCommand{*p};
    return true;
}

bool build_try_activation(ParserContext& ctx, long long activation) {
    auto a = Activation::from_human(activation);
    if (!a) {
        return ctx.fail("Activation is out of bounds: " + std::to_string(activation));
    }
    ctx.command = TryActivationCommand{*a};
    return true;
}

} // namespace cli
} // namespace rune_lock
