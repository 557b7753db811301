#pragma once

#include <careful/base/fwd/system.process.h>

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/stringview.h>

#include <memory>
#include <string>
#include <vector>

namespace careful
{
    struct CarefulConfiguration;

    // The identity of the active rustc, as reported by `rustc -vV`.
    struct ToolchainIdentity
    {
        std::string host;
        // nullopt when rustc reports `unknown` or omits the line
        Optional<std::string> commit;
    };

    ExpectedL<ToolchainIdentity> parse_rustc_version(StringView rustc_vv_output);

    enum class BuildOutput
    {
        // captured and only echoed when debugging
        Quiet,
        // passed through to the terminal
        Live,
    };

    // Every interaction with rustc and cargo goes through this interface.
    struct ToolchainProvider
    {
        virtual ~ToolchainProvider() = default;

        // rustc -vV
        virtual ExpectedC<ToolchainIdentity> identity() const = 0;

        // rustc --print sysroot
        virtual ExpectedC<Path> rustc_sysroot() const = 0;

        // rustc -Z unstable-options --print target-spec-json --target <target>
        virtual ExpectedC<std::string> target_spec_json(StringView target) const = 0;

        // rustc --print target-libdir --target <target>
        virtual ExpectedC<Path> target_libdir(StringView target) const = 0;

        // cargo config build.rustflags --format=json-value -Zunstable-options <config_args...>
        // Returns the captured standard output.
        virtual ExpectedL<std::string> cargo_config_rustflags(const std::vector<std::string>& config_args) const = 0;

        // cargo build --release --manifest-path <manifest> --target <target>
        virtual ExpectedL<Unit> build_sysroot_crate(const Path& manifest,
                                                    StringView target,
                                                    const Environment& environment,
                                                    BuildOutput output) const = 0;
    };

    std::unique_ptr<ToolchainProvider> make_real_toolchain_provider(const CarefulConfiguration& config);

    // Joins `flags` with the 0x1F separator cargo expects in CARGO_ENCODED_RUSTFLAGS.
    std::string encode_rustflags(const std::vector<std::string>& flags);

    // The flags the user asked for: CARGO_ENCODED_RUSTFLAGS, then RUSTFLAGS, then `build.rustflags` from cargo's
    // configuration. `config_args` are the `--config` and `--manifest-path` switches to forward to `cargo config`.
    std::vector<std::string> get_rustflags(const CarefulConfiguration& config,
                                           const ToolchainProvider& provider,
                                           const std::vector<std::string>& config_args);

    // Whether `target`'s specification lists `sanitizer` among its supported sanitizers.
    ExpectedC<bool> sanitizer_supported(const ToolchainProvider& provider, StringView sanitizer, StringView target);
}
