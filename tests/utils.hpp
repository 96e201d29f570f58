#pragma once

#include "tokensnap.hpp"

#include <catch2/catch_test_macros.hpp>
#include <glaze/glaze.hpp>

extern "C" {
#include <stdlib.h>
#include <unistd.h>
}

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace tokensnap::test { namespace detail {
    namespace fs = std::filesystem;

    struct temp_dir {
        fs::path path{};

        explicit temp_dir(std::string_view prefix) {
            auto now = std::chrono::system_clock::now().time_since_epoch().count();
            std::ostringstream dir_name{};
            dir_name << prefix << "_" << static_cast<long>(::getpid()) << "_" << now;
            path = fs::temp_directory_path() / dir_name.str();
            fs::create_directories(path);
        }

        ~temp_dir() {
            std::error_code ec{};
            fs::remove_all(path, ec);
        }
    };

    // Sets or clears an environment variable for the lifetime of the guard
    struct scoped_env {
        std::string name{};
        std::optional<std::string> original{};

        scoped_env(std::string var, const char* value) : name{std::move(var)} {
            if (const char* current = ::getenv(name.c_str())) {
                original = current;
            }
            if (value != nullptr) {
                ::setenv(name.c_str(), value, 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }

        ~scoped_env() {
            if (original) {
                ::setenv(name.c_str(), original->c_str(), 1);
            }
            else {
                ::unsetenv(name.c_str());
            }
        }
    };

    inline void write_text_file(const fs::path& path, std::string_view text) {
        auto parent = path.parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent);
        }
        std::ofstream out{path, std::ios::binary};
        REQUIRE(out.good());
        out << text;
        REQUIRE(out.good());
    }

    inline std::string read_text_file(const fs::path& path) {
        std::ifstream in{path, std::ios::binary};
        REQUIRE(in.good());
        std::ostringstream ss{};
        ss << in.rdbuf();
        return ss.str();
    }

    inline token_stream tokens(std::string_view source) {
        return token_stream::parse(source);
    }

}}  // namespace tokensnap::test::detail
