#pragma once

#include "utils.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tokensnap {

    using namespace std::string_view_literals;

    /*
     * tokensnap Startup Config Options
     *
     * Output and UX
     * - color_mode: ANSI color behavior for diff output.
     * - output_mode: Machine/human output shape ("table" or "json").
     * - quiet/verbose: Coarse output verbosity knobs.
     *
     * Review commands
     * - root: Directory searched for pending updates and `.snap.new` files.
     * - excluded_dirs: Directory names skipped while searching and listing trees.
     * - directive_macro: Macro name that introduces inline snapshot directives.
     *
     * Formatting commands
     * - raw: Print the canonical raw token rendering instead of the formatted one.
     * - keep_docs: Keep doc attributes when formatting and comparing.
     *
     * Introspection flags (one-shot startup actions)
     * - print_config: Print resolved startup config and exit.
     *
     * Process environment, read by the assertion runtime
     * - TOKENSNAP_UPDATE: no | new | always | pending (default new, or no when CI is set).
     * - TOKENSNAP_FORCE_PASS: 1/true turns snapshot failures into passes.
     * - TOKENSNAP_WORKSPACE: Root used to resolve relative source paths and to label snapshot sources.
     */

    enum class output_mode { table, json };
    enum class color_mode { automatic, always, never };

    /*
     * - no: report mismatches only
     * - write_new: write snapshots that do not exist yet; mismatches go to `.snap.new` files and pending records
     * - always: overwrite file snapshots; inline mismatches are recorded as pending and the assertion passes
     * - pending: every change goes to `.snap.new` files and pending records, accepted files are never touched
     */
    enum class update_mode { no, write_new, always, pending };

    inline constexpr std::string_view to_string(output_mode mode) {
        switch (mode) {
            case output_mode::table:
                return "table"sv;
            case output_mode::json:
                return "json"sv;
        }
        return "table"sv;
    }

    inline constexpr std::string_view to_string(color_mode mode) {
        switch (mode) {
            case color_mode::automatic:
                return "auto"sv;
            case color_mode::always:
                return "always"sv;
            case color_mode::never:
                return "never"sv;
        }
        return "auto"sv;
    }

    inline constexpr std::string_view to_string(update_mode mode) {
        switch (mode) {
            case update_mode::no:
                return "no"sv;
            case update_mode::write_new:
                return "new"sv;
            case update_mode::always:
                return "always"sv;
            case update_mode::pending:
                return "pending"sv;
        }
        return "new"sv;
    }

    inline constexpr bool try_parse_output_mode(std::string_view text, output_mode& out) {
        if (utils::str_case_eq(text, "table"sv)) {
            out = output_mode::table;
            return true;
        }
        if (utils::str_case_eq(text, "json"sv)) {
            out = output_mode::json;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_color_mode(std::string_view text, color_mode& out) {
        if (utils::str_case_eq(text, "auto"sv) || utils::str_case_eq(text, "automatic"sv)) {
            out = color_mode::automatic;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv)) {
            out = color_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "never"sv)) {
            out = color_mode::never;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_update_mode(std::string_view text, update_mode& out) {
        if (utils::str_case_eq(text, "no"sv)) {
            out = update_mode::no;
            return true;
        }
        if (utils::str_case_eq(text, "new"sv) || utils::str_case_eq(text, "auto"sv)) {
            out = update_mode::write_new;
            return true;
        }
        if (utils::str_case_eq(text, "always"sv) || utils::str_case_eq(text, "overwrite"sv)) {
            out = update_mode::always;
            return true;
        }
        if (utils::str_case_eq(text, "pending"sv)) {
            out = update_mode::pending;
            return true;
        }
        return false;
    }

    inline constexpr bool try_parse_flag(std::string_view text, bool& out) {
        if (utils::str_case_eq(text, "1"sv) || utils::str_case_eq(text, "true"sv) || utils::str_case_eq(text, "yes"sv)) {
            out = true;
            return true;
        }
        if (utils::str_case_eq(text, "0"sv) || utils::str_case_eq(text, "false"sv) || utils::str_case_eq(text, "no"sv) ||
            text.empty()) {
            out = false;
            return true;
        }
        return false;
    }

    struct startup_config {
        color_mode color{color_mode::automatic};
        output_mode output{output_mode::table};
        bool quiet{false};
        bool verbose{false};

        std::filesystem::path root{"."};
        std::vector<std::string> excluded_dirs{".git", "target", "build"};
        std::string directive_macro{"TOKENSNAP_ASSERT_SNAPSHOT"};

        bool raw{false};
        bool keep_docs{false};

        bool print_config{false};
    };

    struct runtime_config {
        update_mode update{update_mode::write_new};
        bool force_pass{false};
        std::optional<std::filesystem::path> workspace{};
    };

    // Reads TOKENSNAP_UPDATE, TOKENSNAP_FORCE_PASS, TOKENSNAP_WORKSPACE and CI; throws on unparsable values
    runtime_config runtime_config_from_env();

}  // namespace tokensnap
