#pragma once

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/system.process.h>

#include <careful/sourcelocator.h>
#include <careful/toolchain.h>

#include <string>
#include <utility>
#include <vector>

namespace careful::Test
{
    // Answers toolchain queries from its fields and "compiles" by writing `artifacts` into the requested target
    // directory.
    struct MockToolchainProvider final : ToolchainProvider
    {
        ExpectedC<ToolchainIdentity> identity() const override;
        ExpectedC<Path> rustc_sysroot() const override;
        ExpectedC<std::string> target_spec_json(StringView target) const override;
        ExpectedC<Path> target_libdir(StringView target) const override;
        ExpectedL<std::string> cargo_config_rustflags(const std::vector<std::string>& config_args) const override;
        ExpectedL<Unit> build_sysroot_crate(const Path& manifest,
                                            StringView target,
                                            const Environment& environment,
                                            BuildOutput output) const override;

        ToolchainIdentity toolchain{"x86_64-unknown-linux-gnu", std::string("0123456789abcdef")};
        Path sysroot;
        Path libdir;
        std::string target_spec = R"({"arch": "x86_64", "supported-sanitizers": ["address", "leak", "thread"]})";
        // nullopt makes `cargo config` fail, as it does when build.rustflags is not set
        Optional<std::string> config_rustflags_output;
        // file name and contents of each compiled artifact
        std::vector<std::pair<std::string, std::string>> artifacts{{"libstd-cargo-careful.rlib", "std"},
                                                                   {"libcore-cargo-careful.rlib", "core"}};
        bool fail_build = false;

        mutable int compilations = 0;
        mutable std::vector<std::string> config_args_seen;
        mutable Environment last_build_environment;
        mutable std::string last_manifest;
    };

    // Counts invocations. When `install_into` is set, remediating creates a library source tree there.
    struct MockSourceRemediation final : SourceRemediation
    {
        ExpectedC<Unit> remediate() const override;

        bool succeed = true;
        Path install_into;
        mutable int remediations = 0;
    };
}
