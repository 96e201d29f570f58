#include "tokensnap/config.hpp"

#include "tokensnap/format.hpp"

#include <cstdlib>
#include <stdexcept>

using namespace tokensnap::literals;

namespace tokensnap {

    namespace detail {
        static std::optional<std::string_view> env(const char* name) {
            if (const char* value = std::getenv(name)) {
                return std::string_view{value};
            }
            return std::nullopt;
        }
    }  // namespace detail

    runtime_config runtime_config_from_env() {
        runtime_config cfg{};

        if (auto ci = detail::env("CI"); ci && !ci->empty() && *ci != "0" && !utils::str_case_eq(*ci, "false"sv)) {
            cfg.update = update_mode::no;
        }
        if (auto value = detail::env("TOKENSNAP_UPDATE")) {
            if (!try_parse_update_mode(*value, cfg.update)) {
                throw std::runtime_error(
                        "invalid TOKENSNAP_UPDATE value: {} (expected no, new, always or pending)"_format(*value));
            }
        }
        if (auto value = detail::env("TOKENSNAP_FORCE_PASS")) {
            if (!try_parse_flag(*value, cfg.force_pass)) {
                throw std::runtime_error("invalid TOKENSNAP_FORCE_PASS value: {}"_format(*value));
            }
        }
        if (auto value = detail::env("TOKENSNAP_WORKSPACE"); value && !value->empty()) {
            cfg.workspace = std::filesystem::path{*value};
        }
        return cfg;
    }

}  // namespace tokensnap
