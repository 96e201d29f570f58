#include "tokensnap/settings.hpp"

namespace tokensnap {

    settings_context& settings_context::current() {
        thread_local settings_context context{};
        return context;
    }

    template <typename T>
    std::optional<T> settings_context::lookup(std::optional<T> settings_frame::* field) const {
        for (auto it = frames_.rbegin(); it != frames_.rend(); ++it) {
            if (auto& value = (*it).*field) {
                return value;
            }
        }
        return std::nullopt;
    }

    bool settings_context::format_tokens() const {
        return lookup(&settings_frame::format_tokens).value_or(defaults::format_tokens);
    }

    bool settings_context::ignore_docs_for_tokens() const {
        return lookup(&settings_frame::ignore_docs_for_tokens).value_or(defaults::ignore_docs_for_tokens);
    }

    std::filesystem::path settings_context::snapshot_path() const {
        return lookup(&settings_frame::snapshot_path).value_or(std::filesystem::path{defaults::snapshot_path});
    }

    std::string settings_context::snapshot_suffix() const {
        return lookup(&settings_frame::snapshot_suffix).value_or(std::string{});
    }

    bool settings_context::prepend_module_to_snapshot() const {
        return lookup(&settings_frame::prepend_module_to_snapshot).value_or(defaults::prepend_module_to_snapshot);
    }

    std::string settings_context::description() const {
        return lookup(&settings_frame::description).value_or(std::string{});
    }

    void settings_context::push(settings_frame frame) {
        frames_.push_back(std::move(frame));
    }

    void settings_context::truncate(size_t depth) {
        if (depth < frames_.size()) {
            frames_.resize(depth);
        }
    }

    settings_scope::settings_scope(settings_frame frame) : settings_scope{settings_context::current(), std::move(frame)} {}

    settings_scope::settings_scope(settings_context& context, settings_frame frame)
            : context_{&context}, restore_depth_{context.depth()} {
        context_->push(std::move(frame));
    }

    // Restores the depth seen at construction, dropping any frames pushed above it
    settings_scope::~settings_scope() {
        context_->truncate(restore_depth_);
    }

}  // namespace tokensnap
