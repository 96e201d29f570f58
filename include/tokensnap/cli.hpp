#pragma once

#include "config.hpp"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tokensnap::cli {

    enum class command_kind : uint8_t { none, pending, accept, reject, fmt, eq, diff, tree_diff };

    constexpr std::string_view to_string(command_kind kind) {
        switch (kind) {
            case command_kind::none:
                return "none"sv;
            case command_kind::pending:
                return "pending"sv;
            case command_kind::accept:
                return "accept"sv;
            case command_kind::reject:
                return "reject"sv;
            case command_kind::fmt:
                return "fmt"sv;
            case command_kind::eq:
                return "eq"sv;
            case command_kind::diff:
                return "diff"sv;
            case command_kind::tree_diff:
                return "tree-diff"sv;
        }
        return "none"sv;
    }

    // Subcommand selected on the command line; `paths` holds its positional arguments in order
    struct command_request {
        command_kind kind{command_kind::none};
        std::vector<std::string> paths{};
    };

    // Returns an exit code when the process should stop right away (help, --version, bad arguments)
    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request);

    int run_command(const startup_config& cfg, const command_request& request, std::ostream& out, std::ostream& err);

    void print_config(const startup_config& cfg, std::ostream& os);

}  // namespace tokensnap::cli
