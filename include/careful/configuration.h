#pragma once

#include <careful/fwd/errors.h>

#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/stringview.h>

#include <functional>
#include <map>
#include <string>

namespace careful
{
    // Everything cargo-careful reads from its environment, captured once at startup.
    struct CarefulConfiguration
    {
        void imbue_from_environment();
        void imbue_from_fake_environment(const std::map<std::string, std::string, std::less<>>& env);

        std::string cargo = "cargo";
        std::string rustc = "rustc";

        Optional<std::string> rust_lib_src;
        Optional<std::string> cargo_encoded_rustflags;
        Optional<std::string> rustflags;

        bool asan_options_set = false;
        bool is_ci = false;
        bool debugging = false;

        // Root of the per-user sysroot cache; nullopt if no suitable base directory is known.
        Optional<Path> cache_root;

        ExpectedC<Path> cache_directory() const;

    private:
        void imbue_from_environment_impl(std::function<Optional<std::string>(ZStringView)> get_env);
    };
}
