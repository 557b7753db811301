#include <careful/base/strings.h>

#include <careful/configuration.h>
#include <careful/contractual-constants.h>
#include <careful/errors.h>
#include <careful/invocationplanner.h>
#include <careful/toolchain.h>

namespace
{
    using namespace careful;

    constexpr StringLiteral delegated_subcommands[] = {"test", "t", "run", "r", "build", "b", "nextest"};
    constexpr StringLiteral setup_subcommand = "setup";

    bool is_supported_subcommand(StringView subcommand)
    {
        if (subcommand == setup_subcommand)
        {
            return true;
        }

        for (auto&& candidate : delegated_subcommands)
        {
            if (subcommand == candidate)
            {
                return true;
            }
        }

        return false;
    }

    // Handles `-Zcareful-<key>[=<value>]`; `flag` has already been stripped of the prefix.
    ExpectedC<Unit> apply_careful_flag(CarefulArguments& result, StringView original, StringView flag)
    {
        static constexpr StringLiteral sanitizer_key = "sanitizer";
        if (flag == sanitizer_key)
        {
            result.sanitizer = DefaultSanitizer.to_string();
            return Unit{};
        }

        if (flag.starts_with(sanitizer_key) && flag.size() > sanitizer_key.size() &&
            flag[sanitizer_key.size()] == '=')
        {
            result.sanitizer = flag.substr(sanitizer_key.size() + 1).to_string();
            return Unit{};
        }

        return make_error(ErrorKind::InvalidArguments, msgUnsupportedCarefulFlag, msg::option = original);
    }

    // If `arg` is `<name>=<value>` returns the value. If `arg` is exactly `<name>`, returns the following argument.
    Optional<std::string> switch_value(StringView name,
                                       std::vector<std::string>::const_iterator it,
                                       std::vector<std::string>::const_iterator last)
    {
        StringView arg = *it;
        if (!arg.starts_with(name))
        {
            return nullopt;
        }

        auto suffix = arg.substr(name.size());
        if (suffix.empty())
        {
            if (it + 1 == last)
            {
                return nullopt;
            }

            return *(it + 1);
        }

        if (suffix[0] == '=')
        {
            return suffix.substr(1).to_string();
        }

        return nullopt;
    }

    void append_env_assignment(std::string& out, const EnvironmentEntry& entry)
    {
        out.append(entry.key);
        out.push_back('=');
        if (auto value = entry.value.get())
        {
            out.push_back('"');
            for (auto ch : *value)
            {
                if (ch == '"' || ch == '\\')
                {
                    out.push_back('\\');
                }

                out.push_back(ch);
            }

            out.push_back('"');
        }
        else
        {
            // values are always quoted, so this cannot be confused with a variable set to "<deleted>"
            out.append("<deleted>");
        }

        out.push_back(' ');
    }
}

namespace careful
{
    bool CarefulArguments::is_setup() const noexcept { return subcommand == setup_subcommand; }

    ExpectedC<CarefulArguments> parse_arguments(const std::vector<std::string>& args)
    {
        if (args.empty())
        {
            return make_error(ErrorKind::InvalidArguments, msgCarefulCalledWithoutFirstArgument);
        }

        if (args[0] != CarefulFirstArgument)
        {
            return make_error(ErrorKind::InvalidArguments, msgCarefulCalledWithBadFirstArgument);
        }

        if (args.size() < 2)
        {
            return make_error(ErrorKind::InvalidArguments, msgMissingSubcommand);
        }

        CarefulArguments result;
        result.subcommand = args[1];
        if (!is_supported_subcommand(result.subcommand))
        {
            return make_error(ErrorKind::InvalidArguments, msgUnsupportedSubcommand);
        }

        const auto last = args.end();
        auto it = args.begin() + 2;
        for (; it != last; ++it)
        {
            StringView arg = *it;
            if (arg == "--")
            {
                ++it;
                break;
            }

            if (arg.starts_with(CarefulFlagPrefix))
            {
                auto applied = apply_careful_flag(result, arg, arg.substr(CarefulFlagPrefix.size()));
                if (!applied)
                {
                    return std::move(applied).error();
                }

                continue;
            }

            if (arg == SwitchVerbose)
            {
                ++result.verbosity;
            }
            else if (!result.explicit_target.has_value())
            {
                result.explicit_target = switch_value(SwitchTarget, it, last);
            }

            for (auto&& name : {SwitchConfig, SwitchManifestPath})
            {
                auto maybe_value = switch_value(name, it, last);
                if (auto value = maybe_value.get())
                {
                    result.cargo_config_args.push_back(name.to_string());
                    result.cargo_config_args.push_back(std::move(*value));
                }
            }

            result.cargo_args.push_back(*it);
        }

        result.trailing_args.assign(it, last);
        return result;
    }

    std::vector<std::string> careful_rustflags(const std::vector<std::string>& ambient_rustflags,
                                               const Optional<std::string>& variant,
                                               const Path& sysroot_dir)
    {
        std::vector<std::string> flags;
        for (auto&& flag : CarefulBaselineFlags)
        {
            flags.push_back(flag.to_string());
        }

        flags.insert(flags.end(), ambient_rustflags.begin(), ambient_rustflags.end());
        if (auto sanitizer = variant.get())
        {
            flags.push_back(Strings::concat("-Zsanitizer=", *sanitizer));
        }

        flags.push_back(SwitchSysroot.to_string());
        flags.push_back(sysroot_dir.native());
        return flags;
    }

    DelegatedInvocation plan(const CarefulConfiguration& config,
                             const CarefulArguments& args,
                             StringView target,
                             const std::vector<std::string>& ambient_rustflags,
                             const Optional<std::string>& variant,
                             const Path& sysroot_dir)
    {
        DelegatedInvocation result;
        result.rustflags = careful_rustflags(ambient_rustflags, variant, sysroot_dir);

        result.command.string_arg(config.cargo).string_arg(args.subcommand);
        // keeps build scripts and proc macros, which run on the host, out of the sanitizer
        if (variant.has_value() && !args.explicit_target.has_value())
        {
            result.command.string_arg(SwitchTarget).string_arg(target);
        }

        result.command.forwarded_args(args.cargo_args).string_arg("--").forwarded_args(args.trailing_args);

        const auto encoded = encode_rustflags(result.rustflags);
        result.environment.add_entry(EnvironmentVariableCargoEncodedRustFlags, encoded);
        result.environment.add_entry(EnvironmentVariableCargoEncodedRustDocFlags, encoded);
        result.environment.remove_entry(EnvironmentVariableRustFlags);
        result.environment.remove_entry(EnvironmentVariableRustDocFlags);

        // leaks are not a memory safety issue
        if (auto sanitizer = variant.get())
        {
            if (*sanitizer == DefaultSanitizer && !config.asan_options_set)
            {
                result.environment.add_entry(EnvironmentVariableAsanOptions, AsanOptionsWithoutLeakDetection);
            }
        }

        return result;
    }

    std::string format_verbose_echo(const DelegatedInvocation& invocation)
    {
        std::string result = CarefulVerbosePrefix.to_string();
        for (auto&& entry : invocation.environment.entries())
        {
            append_env_assignment(result, entry);
        }

        result.append(invocation.command.command_line().data(), invocation.command.command_line().size());
        return result;
    }
}
