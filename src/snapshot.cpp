#include "tokensnap/snapshot.hpp"

#include "tokensnap/diff.hpp"
#include "tokensnap/format.hpp"
#include "tokensnap/normalize.hpp"
#include "tokensnap/printer.hpp"
#include "tokensnap/settings.hpp"
#include "tokensnap/utils.hpp"

#include <glaze/glaze.hpp>

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <algorithm>
#include <mutex>

using namespace tokensnap::literals;
namespace fs = std::filesystem;

namespace tokensnap {

    namespace detail {

        struct pending_record {
            std::string file{};
            size_t line{};
            std::string old_text{};
            std::string new_text{};
            std::string form{};
            std::string expression{};
            struct glaze {
                using T = pending_record;
                static constexpr auto value =
                        glz::object(&T::file, &T::line, &T::old_text, &T::new_text, &T::form, &T::expression);
            };
        };

        static std::mutex pending_mutex{};

        static const diff_labels snapshot_labels{.before = "old snapshot", .after = "new results"};

        static std::string single_line(std::string_view value) {
            std::string out{value};
            std::ranges::replace(out, '\n', ' ');
            return out;
        }

        static std::string display_content(std::string_view content) {
            if (content.find('\n') == std::string_view::npos) {
                return std::string{utils::trim_view(content)};
            }
            return normalize_inline_content(content);
        }

        static std::string source_label(const fs::path& source, const runtime_config& config) {
            if (config.workspace) {
                std::error_code ec{};
                auto rel = fs::relative(source, *config.workspace, ec);
                if (!ec && !rel.empty() && !rel.native().starts_with("..")) {
                    return rel.generic_string();
                }
            }
            return source.filename().generic_string();
        }

        static fs::path new_snapshot_path(const fs::path& path) {
            auto out = path;
            out += new_snapshot_extension;
            return out;
        }

        static void remove_stale(const fs::path& path) {
            std::error_code ec{};
            if (fs::remove(path, ec)) {
                debug_log{"removed stale ", path.string()};
            }
        }

        static assertion_status conclude(mismatch_record record, const runtime_config& config, bool left_for_review) {
            if (config.force_pass) {
                return left_for_review ? assertion_status::recorded : assertion_status::ignored;
            }
            throw snapshot_mismatch{std::move(record)};
        }

        static bool ends_with(const fs::path& path, std::string_view suffix) {
            return path.filename().native().ends_with(suffix);
        }

    }  // namespace detail

    snapshot_mismatch::snapshot_mismatch(mismatch_record record)
        : std::runtime_error{"snapshot assertion failed at {}:{}\n{}"_format(
                  record.file.string(), record.line, record.diff)},
          record_{std::move(record)} {}

    std::string serialize_snapshot(const snapshot_file& snapshot) {
        std::string out{"---\n"};
        out += "source: {}\n"_format(detail::single_line(snapshot.metadata.source));
        out += "expression: {}\n"_format(detail::single_line(snapshot.metadata.expression));
        if (!snapshot.metadata.description.empty()) {
            out += "description: {}\n"_format(detail::single_line(snapshot.metadata.description));
        }
        out += "---\n";
        out += snapshot.contents;
        out += '\n';
        return out;
    }

    snapshot_file parse_snapshot(std::string_view text) {
        snapshot_file snapshot{};
        if (!text.starts_with("---\n"sv)) {
            snapshot.contents = std::string{utils::trim_right_view(text)};
            return snapshot;
        }
        auto close = text.find("\n---\n"sv, 3U);
        if (close == std::string_view::npos) {
            snapshot.contents = std::string{utils::trim_right_view(text)};
            return snapshot;
        }
        for (auto line : utils::split_lines(text.substr(4U, close - 4U + 1U))) {
            auto colon = line.find(':');
            if (colon == std::string_view::npos) {
                continue;
            }
            auto key = utils::trim_view(line.substr(0U, colon));
            auto value = std::string{utils::trim_view(line.substr(colon + 1U))};
            if (key == "source"sv) {
                snapshot.metadata.source = std::move(value);
            }
            else if (key == "expression"sv) {
                snapshot.metadata.expression = std::move(value);
            }
            else if (key == "description"sv) {
                snapshot.metadata.description = std::move(value);
            }
        }
        snapshot.contents = std::string{utils::trim_right_view(text.substr(close + 5U))};
        return snapshot;
    }

    snapshot_file read_snapshot(const fs::path& path) {
        return parse_snapshot(read_source_file(path));
    }

    void write_snapshot(const fs::path& path, const snapshot_file& snapshot) {
        std::error_code ec{};
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("failed to create {}: {}"_format(path.parent_path().string(), ec.message()));
        }
        write_file_atomic(path, serialize_snapshot(snapshot));
        debug_log{"wrote snapshot ", path.string()};
    }

    fs::path snapshot_file_path(const fs::path& source_file, std::string_view name) {
        auto& settings = settings_context::current();

        std::string file_name{};
        if (settings.prepend_module_to_snapshot()) {
            file_name += source_file.stem().string();
            file_name += "__";
        }
        file_name += name;
        std::ranges::replace(file_name, '/', '_');
        std::ranges::replace(file_name, '\\', '_');
        if (auto suffix = settings.snapshot_suffix(); !suffix.empty()) {
            file_name += "@" + suffix;
        }
        file_name += ".snap";

        auto dir = settings.snapshot_path();
        if (dir.is_relative()) {
            dir = source_file.parent_path() / dir;
        }
        return dir / file_name;
    }

    fs::path resolve_source_path(const fs::path& source_file, const runtime_config& config) {
        if (source_file.is_absolute()) {
            return source_file.lexically_normal();
        }
        auto base = config.workspace.value_or(fs::current_path());
        return (base / source_file).lexically_normal();
    }

    fs::path pending_file_for(const fs::path& source_file) {
        auto out = source_file;
        out += pending_extension;
        return out;
    }

    void append_pending_update(const pending_update& update) {
        detail::pending_record record{
                .file = update.file.string(),
                .line = update.line,
                .old_text = update.old_text,
                .new_text = update.new_text,
                .form = std::string{to_string(update.form)},
                .expression = update.expression};

        std::string json{};
        auto ec = glz::write_json(record, json);
        if (ec) {
            throw std::runtime_error("failed to serialize pending update for {}"_format(update.file.string()));
        }
        json += '\n';

        auto path = pending_file_for(update.file);
        std::lock_guard lock{detail::pending_mutex};
        int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_APPEND, 0644);
        if (fd < 0) {
            throw std::runtime_error("failed to open {}"_format(path.string()));
        }
        if (flock(fd, LOCK_EX) != 0) {
            ::close(fd);
            throw std::runtime_error("failed to lock: {}"_format(path.string()));
        }
        try {
            write_all(fd, json, path);
        } catch (...) {
            flock(fd, LOCK_UN);
            ::close(fd);
            throw;
        }
        flock(fd, LOCK_UN);
        ::close(fd);
        debug_log{"recorded pending update for ", update.file.string(), ":", update.line};
    }

    std::vector<pending_update> read_pending_updates(const fs::path& pending_file) {
        auto text = read_source_file(pending_file);
        std::vector<pending_update> updates{};
        size_t line_number = 0U;
        for (auto line : utils::split_lines(text)) {
            ++line_number;
            if (utils::trim_view(line).empty()) {
                continue;
            }
            detail::pending_record record{};
            std::string json{line};
            auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(record, json);
            if (ec) {
                throw std::runtime_error(
                        "failed to parse pending update in {}:{}"_format(pending_file.string(), line_number));
            }
            pending_update update{
                    .file = record.file,
                    .line = record.line,
                    .old_text = std::move(record.old_text),
                    .new_text = std::move(record.new_text),
                    .expression = std::move(record.expression)};
            if (!try_parse_placeholder_form(record.form, update.form)) {
                throw std::runtime_error(
                        "unknown literal form '{}' in {}:{}"_format(record.form, pending_file.string(), line_number));
            }
            updates.push_back(std::move(update));
        }
        return updates;
    }

    pending_inventory find_pending(const fs::path& root, const std::vector<std::string>& excluded) {
        pending_inventory inventory{};
        std::error_code ec{};
        fs::recursive_directory_iterator it{root, ec};
        if (ec) {
            throw std::runtime_error("failed to search {}: {}"_format(root.string(), ec.message()));
        }
        for (; it != fs::recursive_directory_iterator{}; it.increment(ec)) {
            if (ec) {
                throw std::runtime_error("failed to search {}: {}"_format(root.string(), ec.message()));
            }
            const auto& entry = *it;
            if (entry.is_directory(ec)) {
                if (std::ranges::find(excluded, entry.path().filename().string()) != excluded.end()) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (detail::ends_with(entry.path(), pending_extension)) {
                inventory.pending_files.push_back(entry.path());
            }
            else if (detail::ends_with(entry.path(), ".snap.new"sv)) {
                inventory.new_snapshots.push_back(entry.path());
            }
        }
        std::ranges::sort(inventory.pending_files);
        std::ranges::sort(inventory.new_snapshots);
        return inventory;
    }

    mismatch_record describe_pending(const pending_update& update) {
        std::string old_content{update.old_text};
        if (auto decoded = decode_literal(utils::trim_view(update.old_text))) {
            old_content = decoded->content;
        }
        auto before = detail::display_content(old_content);
        auto after = detail::display_content(update.new_text);
        return mismatch_record{
                .file = update.file,
                .line = update.line,
                .diff = unified_diff(before, after, detail::snapshot_labels),
                .proposed = update.new_text};
    }

    mismatch_record describe_new_snapshot(const fs::path& new_snapshot) {
        auto accepted = new_snapshot;
        accepted.replace_extension();
        std::string before{};
        if (std::error_code ec{}; fs::exists(accepted, ec)) {
            before = read_snapshot(accepted).contents;
        }
        auto after = read_snapshot(new_snapshot).contents;
        return mismatch_record{
                .file = accepted, .line = 0U, .diff = unified_diff(before, after, detail::snapshot_labels), .proposed = after};
    }

    assertion_status assert_token_snapshot(
            std::string_view name,
            const token_stream& value,
            std::string_view expression,
            const std::source_location& location) {
        return assert_token_snapshot(name, value, expression, location, runtime_config_from_env());
    }

    assertion_status assert_token_snapshot(
            std::string_view name,
            const token_stream& value,
            std::string_view expression,
            const std::source_location& location,
            const runtime_config& config) {
        auto source = resolve_source_path(location.file_name(), config);
        auto path = snapshot_file_path(source, name);
        auto pending_path = detail::new_snapshot_path(path);
        auto rendered = render(value);

        std::optional<snapshot_file> existing{};
        if (std::error_code ec{}; fs::exists(path, ec)) {
            existing = read_snapshot(path);
            if (existing->contents == rendered || tokens_equal(token_stream::parse(existing->contents), value)) {
                detail::remove_stale(pending_path);
                return assertion_status::matched;
            }
        }

        snapshot_file fresh{
                .metadata =
                        {.source = detail::source_label(source, config),
                         .expression = std::string{expression},
                         .description = settings_context::current().description()},
                .contents = rendered};
        mismatch_record record{
                .file = source,
                .line = location.line(),
                .diff = unified_diff(existing ? existing->contents : std::string{}, rendered, detail::snapshot_labels),
                .proposed = rendered};

        switch (config.update) {
            case update_mode::always:
                write_snapshot(path, fresh);
                detail::remove_stale(pending_path);
                return assertion_status::written;
            case update_mode::write_new:
                if (!existing) {
                    write_snapshot(path, fresh);
                    return assertion_status::written;
                }
                write_snapshot(pending_path, fresh);
                return detail::conclude(std::move(record), config, true);
            case update_mode::pending:
                write_snapshot(pending_path, fresh);
                return detail::conclude(std::move(record), config, true);
            case update_mode::no:
                break;
        }
        return detail::conclude(std::move(record), config, false);
    }

    assertion_status assert_inline_token_snapshot(
            const token_stream& value,
            std::string_view literal,
            std::string_view expression,
            const std::source_location& location) {
        return assert_inline_token_snapshot(value, literal, expression, location, runtime_config_from_env());
    }

    assertion_status assert_inline_token_snapshot(
            const token_stream& value,
            std::string_view literal,
            std::string_view expression,
            const std::source_location& location,
            const runtime_config& config) {
        auto decoded = decode_literal(utils::trim_view(literal));
        if (!decoded) {
            throw std::runtime_error("malformed inline snapshot literal: {}"_format(literal));
        }
        const auto& policy = policy_for(decoded->form);
        auto proposed = render_for_literal(value);

        // string literals hold token text too when the tokens would not survive stringizing
        std::string before{};
        if (decoded->form == placeholder_form::string_literal) {
            before = normalize_inline_content(decoded->content);
            try {
                if (tokens_equal(token_stream::parse(before), value)) {
                    return assertion_status::matched;
                }
            } catch (const tokenize_error& e) {
                debug_log{"recorded literal does not tokenize: ", e.what()};
            }
        }
        else {
            auto recorded = token_stream::parse(decoded->content);
            if (tokens_equal(recorded, value)) {
                return assertion_status::matched;
            }
            before = render(recorded);
        }

        auto source = resolve_source_path(location.file_name(), config);
        mismatch_record record{
                .file = source,
                .line = location.line(),
                .diff = unified_diff(before, render(value), detail::snapshot_labels),
                .proposed = proposed};

        if (config.update == update_mode::no) {
            return detail::conclude(std::move(record), config, false);
        }
        append_pending_update(pending_update{
                .file = source,
                .line = location.line(),
                .old_text = std::string{literal},
                .new_text = proposed,
                .form = policy.form_for(proposed),
                .expression = std::string{expression}});
        if (config.update == update_mode::always) {
            return assertion_status::recorded;
        }
        return detail::conclude(std::move(record), config, true);
    }

}  // namespace tokensnap
