#pragma once

#include "config.hpp"
#include "patch.hpp"
#include "tokens.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace tokensnap {

    // What a reviewer sees for one failed assertion
    struct mismatch_record {
        std::filesystem::path file{};
        size_t line{};
        std::string diff{};
        std::string proposed{};
    };

    class snapshot_mismatch : public std::runtime_error {
      public:
        explicit snapshot_mismatch(mismatch_record record);

        const mismatch_record& record() const noexcept { return record_; }

      private:
        mismatch_record record_;
    };

    enum class assertion_status : uint8_t {
        matched,   // recorded content is equivalent
        written,   // accepted snapshot written directly
        recorded,  // a `.snap.new` file or pending inline update was left for review
        ignored,   // mismatch turned into a pass by TOKENSNAP_FORCE_PASS
    };

    struct snapshot_metadata {
        std::string source{};
        std::string expression{};
        std::string description{};
    };

    struct snapshot_file {
        snapshot_metadata metadata{};
        std::string contents{};
    };

    // `---` header with `source:`, `expression:` and optional `description:`, then the contents
    std::string serialize_snapshot(const snapshot_file& snapshot);

    // Files without a header are read as plain content
    snapshot_file parse_snapshot(std::string_view text);

    snapshot_file read_snapshot(const std::filesystem::path& path);
    void write_snapshot(const std::filesystem::path& path, const snapshot_file& snapshot);

    // `<source dir>/<snapshot_path>/<module>__<name>[@suffix].snap` per the current settings
    std::filesystem::path snapshot_file_path(const std::filesystem::path& source_file, std::string_view name);

    // Relative source paths are resolved against TOKENSNAP_WORKSPACE, else the working directory
    std::filesystem::path resolve_source_path(const std::filesystem::path& source_file, const runtime_config& config);

    // ── pending inline updates ────────────────────────────────────────────

    inline constexpr auto pending_extension = ".pending-snap"sv;
    inline constexpr auto new_snapshot_extension = ".new"sv;

    std::filesystem::path pending_file_for(const std::filesystem::path& source_file);

    // Appends one JSON line; serialized across threads and processes
    void append_pending_update(const pending_update& update);

    std::vector<pending_update> read_pending_updates(const std::filesystem::path& pending_file);

    // `.pending-snap` files and `.snap.new` files below `root`
    struct pending_inventory {
        std::vector<std::filesystem::path> pending_files{};
        std::vector<std::filesystem::path> new_snapshots{};

        bool empty() const { return pending_files.empty() && new_snapshots.empty(); }
    };

    pending_inventory find_pending(const std::filesystem::path& root, const std::vector<std::string>& excluded = {});

    mismatch_record describe_pending(const pending_update& update);
    mismatch_record describe_new_snapshot(const std::filesystem::path& new_snapshot);

    // ── assertions ────────────────────────────────────────────────────────

    assertion_status assert_token_snapshot(
            std::string_view name,
            const token_stream& value,
            std::string_view expression,
            const std::source_location& location = std::source_location::current());

    assertion_status assert_token_snapshot(
            std::string_view name,
            const token_stream& value,
            std::string_view expression,
            const std::source_location& location,
            const runtime_config& config);

    // `literal` is the stringized `@...` argument of the directive
    assertion_status assert_inline_token_snapshot(
            const token_stream& value,
            std::string_view literal,
            std::string_view expression,
            const std::source_location& location = std::source_location::current());

    assertion_status assert_inline_token_snapshot(
            const token_stream& value,
            std::string_view literal,
            std::string_view expression,
            const std::source_location& location,
            const runtime_config& config);

}  // namespace tokensnap

// Inline snapshot: TOKENSNAP_ASSERT_SNAPSHOT(tokens, @{ struct Foo; })
#define TOKENSNAP_ASSERT_SNAPSHOT(value, ...) \
    ::tokensnap::assert_inline_token_snapshot((value), #__VA_ARGS__, #value, ::std::source_location::current())

// File snapshot: TOKENSNAP_ASSERT_FILE_SNAPSHOT("name", tokens)
#define TOKENSNAP_ASSERT_FILE_SNAPSHOT(name, value) \
    ::tokensnap::assert_token_snapshot((name), (value), #value, ::std::source_location::current())
