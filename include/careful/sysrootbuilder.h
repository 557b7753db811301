#pragma once

#include <careful/base/fwd/files.h>

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/stringview.h>

#include <careful/toolchain.h>

#include <string>
#include <vector>

namespace careful
{
    struct SysrootBuildRequest
    {
        std::string target;
        ToolchainIdentity toolchain;
        Path source_tree;
        // the sanitizer, if any
        Optional<std::string> variant;
        std::vector<std::string> extra_rustflags;
        Path sysroot_dir;
        BuildOutput output = BuildOutput::Quiet;
    };

    // Targets that have no `std`, following the rules rustbuild uses.
    bool is_no_std_target(StringView target);

    // `value` as a TOML basic string, including the surrounding quotes.
    std::string toml_basic_string(StringView value);

    std::string generate_sysroot_manifest(const Path& source_tree, bool no_std);

    // Baseline flags, then `extra_rustflags`, then the sanitizer flag.
    std::vector<std::string> sysroot_rustflags(const std::vector<std::string>& extra_rustflags,
                                               const Optional<std::string>& variant);

    // The infix rustc uses for a sanitizer's runtime library, such as `asan` for `address`.
    StringView sanitizer_runtime_short_name(StringView sanitizer);

    // Returns the first entry of `entries` that is a directory, or nullptr.
    const Path* find_first_directory(const ReadOnlyFilesystem& fs, const std::vector<Path>& entries);

    // Compiles the standard library for `request.target` into `request.sysroot_dir`, replacing whatever was there.
    // Does not write the cache marker.
    ExpectedC<Path> build_sysroot(const Filesystem& fs,
                                  const ToolchainProvider& provider,
                                  const SysrootBuildRequest& request);
}
