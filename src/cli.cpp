#include "tokensnap/cli.hpp"

#include "tokensnap/diff.hpp"
#include "tokensnap/format.hpp"
#include "tokensnap/normalize.hpp"
#include "tokensnap/patch.hpp"
#include "tokensnap/printer.hpp"
#include "tokensnap/settings.hpp"
#include "tokensnap/snapshot.hpp"
#include "tokensnap/tokens.hpp"

#include <glaze/glaze.hpp>

#include <CLI/CLI.hpp>

extern "C" {
#include <unistd.h>
}

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace tokensnap::literals;

namespace tokensnap::cli { namespace detail {

    using namespace std::string_view_literals;
    namespace fs = std::filesystem;

    inline constexpr auto version_string = "tokensnap 0.1.0"sv;

    struct pending_entry {
        std::string kind{};
        std::string file{};
        std::size_t line{};
        std::string diff{};
        std::string proposed{};
    };

    struct pending_listing {
        int schema_version{1};
        std::vector<pending_entry> entries{};
    };

    struct accept_entry {
        std::string file{};
        bool success{};
        std::size_t applied{};
        std::string error{};
    };

    struct accept_listing {
        int schema_version{1};
        std::vector<accept_entry> files{};
    };

}}  // namespace tokensnap::cli::detail

namespace glz {

    template <>
    struct meta<tokensnap::cli::detail::pending_entry> {
        using T = tokensnap::cli::detail::pending_entry;
        static constexpr auto value = object(
                "kind", &T::kind, "file", &T::file, "line", &T::line, "diff", &T::diff, "proposed", &T::proposed);
    };

    template <>
    struct meta<tokensnap::cli::detail::pending_listing> {
        using T = tokensnap::cli::detail::pending_listing;
        static constexpr auto value = object("schema_version", &T::schema_version, "entries", &T::entries);
    };

    template <>
    struct meta<tokensnap::cli::detail::accept_entry> {
        using T = tokensnap::cli::detail::accept_entry;
        static constexpr auto value =
                object("file", &T::file, "success", &T::success, "applied", &T::applied, "error", &T::error);
    };

    template <>
    struct meta<tokensnap::cli::detail::accept_listing> {
        using T = tokensnap::cli::detail::accept_listing;
        static constexpr auto value = object("schema_version", &T::schema_version, "files", &T::files);
    };

}  // namespace glz

namespace tokensnap::cli { namespace detail {

    static bool use_color(const startup_config& cfg) {
        switch (cfg.color) {
            case color_mode::always:
                return true;
            case color_mode::never:
                return false;
            case color_mode::automatic:
                break;
        }
        return std::getenv("NO_COLOR") == nullptr && ::isatty(STDOUT_FILENO) == 1;
    }

    static void print_diff(std::string_view diff, bool color, std::ostream& os) {
        if (!color) {
            os << diff;
            return;
        }
        for (auto line : utils::split_lines(diff)) {
            if (line.starts_with("---"sv) || line.starts_with("+++"sv)) {
                os << "\x1b[1m" << line << "\x1b[0m\n";
            }
            else if (line.starts_with("@@"sv)) {
                os << "\x1b[36m" << line << "\x1b[0m\n";
            }
            else if (line.starts_with('+')) {
                os << "\x1b[32m" << line << "\x1b[0m\n";
            }
            else if (line.starts_with('-')) {
                os << "\x1b[31m" << line << "\x1b[0m\n";
            }
            else {
                os << line << '\n';
            }
        }
    }

    template <typename T>
    static void write_json(const T& value, std::ostream& os) {
        std::string json{};
        auto ec = glz::write_json(value, json);
        if (ec) {
            throw std::runtime_error("failed to serialize command output");
        }
        os << json << '\n';
    }

    static std::string read_input(std::string_view path) {
        if (path.empty() || path == "-"sv) {
            return std::string{std::istreambuf_iterator<char>{std::cin}, std::istreambuf_iterator<char>{}};
        }
        return read_source_file(fs::path{path});
    }

    static std::optional<token_stream> parse_input(std::string_view label, std::string_view text, std::ostream& err) {
        try {
            return token_stream::parse(text);
        } catch (const tokenize_error& e) {
            err << "error: {}:{}:{}: {}\n"_format(label, e.line(), e.column(), e.what());
            return std::nullopt;
        }
    }

    static int run_pending(const startup_config& cfg, std::ostream& out) {
        auto inventory = find_pending(cfg.root, cfg.excluded_dirs);
        auto color = use_color(cfg);

        pending_listing listing{};
        for (const auto& pending_file : inventory.pending_files) {
            for (const auto& update : read_pending_updates(pending_file)) {
                auto record = describe_pending(update);
                listing.entries.push_back(pending_entry{
                        .kind = "inline",
                        .file = record.file.string(),
                        .line = record.line,
                        .diff = std::move(record.diff),
                        .proposed = std::move(record.proposed)});
            }
        }
        for (const auto& new_snapshot : inventory.new_snapshots) {
            auto record = describe_new_snapshot(new_snapshot);
            listing.entries.push_back(pending_entry{
                    .kind = "file",
                    .file = record.file.string(),
                    .line = record.line,
                    .diff = std::move(record.diff),
                    .proposed = std::move(record.proposed)});
        }

        if (cfg.output == output_mode::json) {
            write_json(listing, out);
            return 0;
        }

        if (listing.entries.empty()) {
            if (!cfg.quiet) {
                out << "no pending snapshots\n";
            }
            return 0;
        }
        for (const auto& entry : listing.entries) {
            if (entry.kind == "inline"sv) {
                out << "{}:{}\n"_format(entry.file, entry.line);
            }
            else {
                out << "{}\n"_format(entry.file);
            }
            if (!cfg.quiet) {
                print_diff(entry.diff, color, out);
            }
        }
        if (!cfg.quiet) {
            out << "{} pending snapshot(s)\n"_format(listing.entries.size());
        }
        return 0;
    }

    static int run_accept(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        auto inventory = find_pending(cfg.root, cfg.excluded_dirs);

        accept_listing listing{};
        for (const auto& pending_file : inventory.pending_files) {
            std::vector<pending_update> updates{};
            try {
                updates = read_pending_updates(pending_file);
            } catch (const std::exception& e) {
                listing.files.push_back(
                        accept_entry{.file = pending_file.string(), .success = false, .applied = 0U, .error = e.what()});
                continue;
            }
            if (cfg.verbose) {
                err << "{}: {} update(s)\n"_format(pending_file.string(), updates.size());
            }

            auto report = apply_pending_updates(updates, cfg.directive_macro);
            for (const auto& result : report.files) {
                listing.files.push_back(accept_entry{
                        .file = result.file.string(),
                        .success = result.success,
                        .applied = result.applied,
                        .error = result.error});
            }
            if (report.all_succeeded()) {
                std::error_code ec{};
                fs::remove(pending_file, ec);
                if (ec) {
                    err << "failed to remove {}: {}\n"_format(pending_file.string(), ec.message());
                }
            }
        }

        for (const auto& new_snapshot : inventory.new_snapshots) {
            auto accepted = new_snapshot;
            accepted.replace_extension();
            std::error_code ec{};
            fs::rename(new_snapshot, accepted, ec);
            listing.files.push_back(accept_entry{
                    .file = accepted.string(),
                    .success = !ec,
                    .applied = ec ? 0U : 1U,
                    .error = ec ? ec.message() : std::string{}});
        }

        size_t failures = 0U;
        for (const auto& entry : listing.files) {
            if (!entry.success) {
                ++failures;
            }
        }

        if (cfg.output == output_mode::json) {
            write_json(listing, out);
        }
        else {
            for (const auto& entry : listing.files) {
                if (entry.success) {
                    if (!cfg.quiet) {
                        out << "accepted {} ({} update(s))\n"_format(entry.file, entry.applied);
                    }
                }
                else {
                    out << "failed {}: {}\n"_format(entry.file, entry.error);
                }
            }
            if (listing.files.empty() && !cfg.quiet) {
                out << "no pending snapshots\n";
            }
        }
        return failures == 0U ? 0 : 1;
    }

    static int run_reject(const startup_config& cfg, std::ostream& out, std::ostream& err) {
        auto inventory = find_pending(cfg.root, cfg.excluded_dirs);
        int rc = 0;
        auto discard = [&](const fs::path& path) {
            std::error_code ec{};
            fs::remove(path, ec);
            if (ec) {
                err << "failed to remove {}: {}\n"_format(path.string(), ec.message());
                rc = 1;
                return;
            }
            if (!cfg.quiet) {
                out << "rejected {}\n"_format(path.string());
            }
        };
        for (const auto& path : inventory.pending_files) {
            discard(path);
        }
        for (const auto& path : inventory.new_snapshots) {
            discard(path);
        }
        return rc;
    }

    static int run_fmt(
            const startup_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
        std::string_view path = request.paths.empty() ? "-"sv : std::string_view{request.paths.front()};
        auto text = read_input(path);
        auto tokens = parse_input(path == "-"sv ? "<stdin>"sv : path, text, err);
        if (!tokens) {
            return 1;
        }
        auto rendered = with_settings(
                settings_frame{.format_tokens = !cfg.raw, .ignore_docs_for_tokens = !cfg.keep_docs},
                [&] { return render(*tokens); });
        out << rendered;
        if (!rendered.empty() && !rendered.ends_with('\n')) {
            out << '\n';
        }
        return 0;
    }

    static int run_eq(const startup_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
        const auto& lhs_path = request.paths.at(0);
        const auto& rhs_path = request.paths.at(1);
        std::string lhs_text{};
        std::string rhs_text{};
        try {
            lhs_text = read_input(lhs_path);
            rhs_text = read_input(rhs_path);
        } catch (const std::runtime_error& e) {
            err << "error: {}\n"_format(e.what());
            return 2;
        }
        auto lhs = parse_input(lhs_path, lhs_text, err);
        auto rhs = parse_input(rhs_path, rhs_text, err);
        if (!lhs || !rhs) {
            return 2;
        }
        auto equal = with_settings(
                settings_frame{.ignore_docs_for_tokens = !cfg.keep_docs}, [&] { return tokens_equal(*lhs, *rhs); });
        if (!cfg.quiet) {
            out << (equal ? "equal\n" : "different\n");
        }
        return equal ? 0 : 1;
    }

    static int run_diff(const startup_config& cfg, const command_request& request, std::ostream& out) {
        const auto& lhs_path = request.paths.at(0);
        const auto& rhs_path = request.paths.at(1);
        auto diff = unified_diff(
                read_source_file(lhs_path), read_source_file(rhs_path), diff_labels{.before = lhs_path, .after = rhs_path});
        print_diff(diff, use_color(cfg), out);
        return diff.empty() ? 0 : 1;
    }

    static int run_tree_diff(const startup_config& cfg, const command_request& request, std::ostream& out) {
        auto before = list_directory(request.paths.at(0), cfg.excluded_dirs);
        auto after = list_directory(request.paths.at(1), cfg.excluded_dirs);
        auto diff = tree_diff(before, after);
        print_diff(diff, use_color(cfg), out);
        return diff.empty() ? 0 : 1;
    }

}}  // namespace tokensnap::cli::detail

namespace tokensnap::cli {

    void print_config(const startup_config& cfg, std::ostream& os) {
        os << "color={}\n"_format(cfg.color);
        os << "output={}\n"_format(cfg.output);
        os << "quiet=" << (cfg.quiet ? "true" : "false") << '\n';
        os << "verbose=" << (cfg.verbose ? "true" : "false") << '\n';
        os << "root=" << cfg.root.string() << '\n';
        os << "excluded_dirs=" << utils::join_with_separator(cfg.excluded_dirs, ","sv) << '\n';
        os << "directive_macro=" << cfg.directive_macro << '\n';
        os << "raw=" << (cfg.raw ? "true" : "false") << '\n';
        os << "keep_docs=" << (cfg.keep_docs ? "true" : "false") << '\n';
    }

    std::optional<int> parse_cli(int argc, char** argv, startup_config& cfg, command_request& request) {
        CLI::App app{"tokensnap: review and apply token snapshots"};
        app.require_subcommand(0, 1);

        bool show_version = false;
        std::string output_arg{std::string{to_string(cfg.output)}};
        std::string color_arg{std::string{to_string(cfg.color)}};
        std::string root_arg{cfg.root.string()};
        std::vector<std::string> exclude_args{};

        app.add_flag("--version", show_version, "Print version and exit");
        app.add_option("--output", output_arg, "Output mode: table|json");
        app.add_option("--color", color_arg, "Color mode: auto|always|never");
        app.add_flag("--no-color", "Force color mode to never");
        app.add_option("--exclude", exclude_args, "Additional directory names to skip while searching");
        app.add_option("--macro", cfg.directive_macro, "Macro name of inline snapshot directives");
        app.add_flag("--print-config", cfg.print_config, "Print resolved config and exit");
        app.add_flag("--quiet", cfg.quiet, "Suppress non-essential output");
        app.add_flag("--verbose", cfg.verbose, "Enable verbose output");

        bool json_flag = false;

        auto* pending = app.add_subcommand("pending", "List pending inline updates and .snap.new files");
        pending->add_option("--root", root_arg, "Directory to search");
        pending->add_flag("--json", json_flag, "Shorthand for --output json");

        auto* accept = app.add_subcommand("accept", "Apply every pending snapshot update");
        accept->add_option("--root", root_arg, "Directory to search");

        auto* reject = app.add_subcommand("reject", "Discard every pending snapshot update");
        reject->add_option("--root", root_arg, "Directory to search");

        std::string fmt_path{};
        auto* fmt = app.add_subcommand("fmt", "Render a token file the way snapshots show it");
        fmt->add_option("file", fmt_path, "Token file; stdin when omitted");
        fmt->add_flag("--raw", cfg.raw, "Print the canonical raw rendering");
        fmt->add_flag("--keep-docs", cfg.keep_docs, "Keep doc attributes");

        std::string lhs_path{};
        std::string rhs_path{};
        auto* eq = app.add_subcommand("eq", "Exit 0 when two token files are equivalent");
        auto token_file = CLI::ExistingFile | CLI::IsMember({"-"});
        eq->add_option("a", lhs_path, "First token file, - for stdin")->required()->check(token_file);
        eq->add_option("b", rhs_path, "Second token file, - for stdin")->required()->check(token_file);
        eq->add_flag("--keep-docs", cfg.keep_docs, "Compare doc attributes too");

        auto* diff = app.add_subcommand("diff", "Unified line diff of two files");
        diff->add_option("a", lhs_path, "Original file")->required()->check(CLI::ExistingFile);
        diff->add_option("b", rhs_path, "Updated file")->required()->check(CLI::ExistingFile);

        auto* tree = app.add_subcommand("tree-diff", "Diff of two directory listings");
        tree->add_option("a", lhs_path, "Original directory")->required()->check(CLI::ExistingDirectory);
        tree->add_option("b", rhs_path, "Updated directory")->required()->check(CLI::ExistingDirectory);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            // help requests exit 0; every argument error exits 2
            return std::optional<int>{app.exit(e) == 0 ? 0 : 2};
        }

        if (cfg.quiet && cfg.verbose) {
            std::cerr << "--quiet and --verbose are mutually exclusive\n";
            return std::optional<int>{2};
        }
        if (!try_parse_output_mode(output_arg, cfg.output)) {
            std::cerr << "invalid --output value: " << output_arg << " (expected table|json)\n";
            return std::optional<int>{2};
        }
        if (!try_parse_color_mode(color_arg, cfg.color)) {
            std::cerr << "invalid --color value: " << color_arg << " (expected auto|always|never)\n";
            return std::optional<int>{2};
        }
        if (utils::trim_view(cfg.directive_macro).empty()) {
            std::cerr << "--macro must be non-empty\n";
            return std::optional<int>{2};
        }

        if (app.get_option("--no-color")->count() > 0U) {
            cfg.color = color_mode::never;
        }
        if (json_flag) {
            cfg.output = output_mode::json;
        }
        for (auto& dir : exclude_args) {
            cfg.excluded_dirs.push_back(std::move(dir));
        }
        cfg.root = root_arg;

        if (show_version) {
            std::cout << detail::version_string << '\n';
            return std::optional<int>{0};
        }

        if (cfg.print_config) {
            print_config(cfg, std::cout);
            return std::optional<int>{0};
        }

        request = command_request{};
        if (pending->parsed()) {
            request.kind = command_kind::pending;
        }
        else if (accept->parsed()) {
            request.kind = command_kind::accept;
        }
        else if (reject->parsed()) {
            request.kind = command_kind::reject;
        }
        else if (fmt->parsed()) {
            request.kind = command_kind::fmt;
            if (!fmt_path.empty()) {
                request.paths.push_back(fmt_path);
            }
        }
        else if (eq->parsed() || diff->parsed() || tree->parsed()) {
            request.kind = eq->parsed() ? command_kind::eq
                         : diff->parsed() ? command_kind::diff
                                          : command_kind::tree_diff;
            request.paths = {lhs_path, rhs_path};
        }
        else {
            std::cout << app.help();
            return std::optional<int>{0};
        }

        return std::nullopt;
    }

    int run_command(const startup_config& cfg, const command_request& request, std::ostream& out, std::ostream& err) {
        debug_log{"running ", to_string(request.kind)};
        switch (request.kind) {
            case command_kind::none:
                return 0;
            case command_kind::pending:
                return detail::run_pending(cfg, out);
            case command_kind::accept:
                return detail::run_accept(cfg, out, err);
            case command_kind::reject:
                return detail::run_reject(cfg, out, err);
            case command_kind::fmt:
                return detail::run_fmt(cfg, request, out, err);
            case command_kind::eq:
                return detail::run_eq(cfg, request, out, err);
            case command_kind::diff:
                return detail::run_diff(cfg, request, out);
            case command_kind::tree_diff:
                return detail::run_tree_diff(cfg, request, out);
        }
        return 0;
    }

}  // namespace tokensnap::cli
