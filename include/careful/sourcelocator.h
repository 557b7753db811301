#pragma once

#include <careful/base/fwd/files.h>

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>

#include <iosfwd>
#include <string>

namespace careful
{
    struct CarefulConfiguration;
    struct ToolchainProvider;

    // Invoked at most once when the toolchain's library sources are missing.
    struct SourceRemediation
    {
        virtual ~SourceRemediation() = default;
        virtual ExpectedC<Unit> remediate() const = 0;
    };

    // Asks for confirmation (unless running in CI or during an explicit setup) and then runs
    // `rustup component add rust-src`.
    struct RustSrcInstaller final : SourceRemediation
    {
        RustSrcInstaller(const CarefulConfiguration& config, bool automatic, std::istream& answers);

        ExpectedC<Unit> remediate() const override;

    private:
        bool m_ask;
        std::istream& m_answers;
    };

    // Interprets an answer to a `[Y/n]` question; an empty answer means yes.
    ExpectedC<Unit> parse_confirmation(StringView answer);

    // Determines the `library` directory of a Rust source checkout, from `override_path` if one is given and from the
    // active toolchain's `rust-src` component otherwise.
    ExpectedC<Path> resolve_source_tree(const ReadOnlyFilesystem& fs,
                                        const ToolchainProvider& provider,
                                        const SourceRemediation& remediation,
                                        const Optional<std::string>& override_path);
}
