#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tokensnap {

    /*
     * Ambient snapshot settings
     *
     * Every thread owns a stack of override frames. Lookups walk the stack from the innermost frame outwards
     * and fall back to the compiled-in default when no frame sets a value. Frames are pushed and popped by
     * `settings_scope`, which restores the previous visible state on every exit path.
     *
     * - format_tokens: pretty-print token snapshots (default true); raw token rendering otherwise.
     * - ignore_docs_for_tokens: strip doc attributes before comparing or printing (default true).
     * - snapshot_path: directory of file snapshots, relative to the test source directory.
     * - snapshot_suffix: appended to file snapshot names as `name@suffix`.
     * - prepend_module_to_snapshot: prefix file snapshot names with the test module name.
     * - description: free text written into the snapshot file header.
     */
    struct settings_frame {
        std::optional<bool> format_tokens{};
        std::optional<bool> ignore_docs_for_tokens{};
        std::optional<std::filesystem::path> snapshot_path{};
        std::optional<std::string> snapshot_suffix{};
        std::optional<bool> prepend_module_to_snapshot{};
        std::optional<std::string> description{};
    };

    namespace defaults {
        inline constexpr bool format_tokens = true;
        inline constexpr bool ignore_docs_for_tokens = true;
        inline constexpr bool prepend_module_to_snapshot = true;
        inline constexpr auto snapshot_path = "snapshots";
    }  // namespace defaults

    class settings_context {
      public:
        // The calling thread's context
        static settings_context& current();

        bool format_tokens() const;
        bool ignore_docs_for_tokens() const;
        std::filesystem::path snapshot_path() const;
        std::string snapshot_suffix() const;
        bool prepend_module_to_snapshot() const;
        std::string description() const;

        size_t depth() const { return frames_.size(); }

        void push(settings_frame frame);
        void truncate(size_t depth);

      private:
        template <typename T>
        std::optional<T> lookup(std::optional<T> settings_frame::* field) const;

        std::vector<settings_frame> frames_{};
    };

    class settings_scope {
      public:
        explicit settings_scope(settings_frame frame);
        settings_scope(settings_context& context, settings_frame frame);
        ~settings_scope();

        settings_scope(const settings_scope&) = delete;
        settings_scope& operator=(const settings_scope&) = delete;
        settings_scope(settings_scope&&) = delete;
        settings_scope& operator=(settings_scope&&) = delete;

      private:
        settings_context* context_;
        size_t restore_depth_;
    };

    template <typename F>
    decltype(auto) with_settings(settings_frame frame, F&& fn) {
        settings_scope scope{std::move(frame)};
        return std::forward<F>(fn)();
    }

}  // namespace tokensnap
