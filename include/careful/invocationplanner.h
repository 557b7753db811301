#pragma once

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/system.process.h>

#include <string>
#include <vector>

namespace careful
{
    struct CarefulConfiguration;

    struct CarefulArguments
    {
        // `setup`, or the cargo subcommand to delegate to
        std::string subcommand;
        // from the last `-Zcareful-sanitizer[=<name>]`
        Optional<std::string> sanitizer;
        // from the first `--target`
        Optional<std::string> explicit_target;
        // number of `-v` before `--`
        int verbosity = 0;
        // everything before `--` that is not a `-Zcareful-` flag
        std::vector<std::string> cargo_args;
        // everything after `--`
        std::vector<std::string> trailing_args;
        // `--config` and `--manifest-path` switches, for querying cargo's configuration
        std::vector<std::string> cargo_config_args;

        bool is_setup() const noexcept;
    };

    // Splits the arguments following the program name, which must begin with `careful <subcommand>`.
    ExpectedC<CarefulArguments> parse_arguments(const std::vector<std::string>& args);

    // Baseline flags, `ambient_rustflags`, the sanitizer flag and finally `--sysroot <sysroot_dir>`.
    std::vector<std::string> careful_rustflags(const std::vector<std::string>& ambient_rustflags,
                                               const Optional<std::string>& variant,
                                               const Path& sysroot_dir);

    struct DelegatedInvocation
    {
        Command command;
        Environment environment;
        std::vector<std::string> rustflags;
    };

    DelegatedInvocation plan(const CarefulConfiguration& config,
                             const CarefulArguments& args,
                             StringView target,
                             const std::vector<std::string>& ambient_rustflags,
                             const Optional<std::string>& variant,
                             const Path& sysroot_dir);

    // `[cargo-careful] KEY="value" ... cargo ...`, as echoed at verbosity 1 or more.
    std::string format_verbose_echo(const DelegatedInvocation& invocation);
}
