#include "rune_lock/cli/command.hpp"
#include "rune_lock/factual_solver.hpp"
#include "rune_lock/puzzle.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-v] [-d DEPTH]\n";
    std::cerr << "  -v        Verbose mode (print propagation progress)\n";
    std::cerr << "  -d DEPTH  Default depth for explain (default: 10)\n";
    std::cerr << "  -h        Show this help\n";
}

/**
 * @brief コマンドを1つ実行
 * @return quit なら false
 */
bool execute(rune_lock::FactualSolver& solver, const rune_lock::cli::Command& command) {
    using namespace rune_lock;
    using namespace rune_lock::cli;

    return std::visit([&solver](const auto& cmd) -> bool {
        using T = std::decay_t<decltype(cmd)>;

        if constexpr (std::is_same_v<T, AssumeCommand>) {
            if (!solver.assume(cmd.activation, cmd.position)) {
                std::cout << "Error: Node " << solver.current() << " is "
                          << solver.current_node().status << ", no further assumptions\n";
            }
        } else if constexpr (std::is_same_v<T, ViewCommand>) {
            auto handle = solver.get_handle(cmd.node);
            if (!handle) {
                std::cout << "Error: Node " << cmd.node << " does not exist\n";
            } else {
                solver.set_current(*handle);
            }
        } else if constexpr (std::is_same_v<T, ExplainCommand>) {
            solver.explain(cmd.fact, cmd.depth.value_or(solver.explain_depth()), std::cout);
        } else if constexpr (std::is_same_v<T, TryPositionCommand>) {
            solver.try_possibilities(View::of(cmd.position));
        } else if constexpr (std::is_same_v<T, TryActivationCommand>) {
            solver.try_possibilities(View::of(cmd.activation));
        } else if constexpr (std::is_same_v<T, DumpCommand>) {
            solver.dump_knowledge(std::cout);
        } else if constexpr (std::is_same_v<T, HelpCommand>) {
            std::cout << help_text();
        } else if constexpr (std::is_same_v<T, QuitCommand>) {
            return false;
        }
        return true;
    }, command);
}

int main(int argc, char* argv[]) {
    bool verbose = false;
    long depth = 10;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-v") == 0) {
            verbose = true;
        } else if (std::strcmp(argv[i], "-d") == 0 && i + 1 < argc) {
            depth = std::atol(argv[++i]);
            if (depth < 0) {
                std::cerr << "Depth must not be negative: " << depth << "\n";
                return 1;
            }
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    try {
        rune_lock::Lock lock = rune_lock::make_standard_lock();
        rune_lock::FactualSolver solver(lock);
        solver.set_verbose(verbose);
        solver.set_explain_depth(static_cast<size_t>(depth));

        solver.display(std::cout);

        std::string line;
        while (std::getline(std::cin, line)) {
            if (line.find_first_not_of(" \t\r") == std::string::npos) {
                continue;
            }

            std::optional<rune_lock::cli::Command> command;
            try {
                command = rune_lock::cli::parse_command(line);
            } catch (const std::runtime_error& e) {
                std::cout << "Error: " << e.what() << "\n";
                continue;
            }

            if (!execute(solver, *command)) {
                break;
            }
            solver.display(std::cout);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
