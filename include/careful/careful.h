#pragma once

#include <careful/base/fwd/files.h>
#include <careful/base/fwd/message_sinks.h>

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>

#include <careful/invocationplanner.h>

#include <string>
#include <vector>

namespace careful
{
    struct CarefulConfiguration;
    struct SourceRemediation;
    struct ToolchainProvider;

    // Resolves the toolchain and source tree, makes sure a current sysroot exists and plans the delegated cargo
    // invocation. Returns nullopt for `setup`, which stops once the sysroot is ready.
    ExpectedC<Optional<DelegatedInvocation>> prepare_invocation(const CarefulConfiguration& config,
                                                                const Filesystem& fs,
                                                                const ToolchainProvider& provider,
                                                                const SourceRemediation& remediation,
                                                                const CarefulArguments& args,
                                                                MessageSink& status_sink);

    // `args` excludes the program name. Returns the exit code of the delegated tool; errors exit the process.
    int run_careful(const CarefulConfiguration& config,
                    const Filesystem& fs,
                    const ToolchainProvider& provider,
                    const std::vector<std::string>& args);
}
