#include <careful/base/json.h>
#include <careful/base/strings.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.process.h>

#include <careful/configuration.h>
#include <careful/contractual-constants.h>
#include <careful/errors.h>
#include <careful/toolchain.h>

namespace
{
    using namespace careful;

    CarefulError query_failed(const LocalizedString& heading, const LocalizedString& details)
    {
        return make_error(ErrorKind::ConfigQueryFailed, LocalizedString(heading).append_raw('\n').append(details));
    }

    struct RealToolchainProvider final : ToolchainProvider
    {
        explicit RealToolchainProvider(const CarefulConfiguration& config)
            : m_cargo(config.cargo), m_rustc(config.rustc)
        {
        }

        ExpectedC<ToolchainIdentity> identity() const override
        {
            auto maybe_output =
                flatten_out(cmd_execute_and_capture_output(Command{m_rustc}.string_arg("-vV")), m_rustc);
            if (auto output = maybe_output.get())
            {
                auto maybe_identity = parse_rustc_version(*output);
                if (auto identity = maybe_identity.get())
                {
                    return std::move(*identity);
                }

                return query_failed(msg::format(msgToolchainVersionQueryFailed), maybe_identity.error());
            }

            return query_failed(msg::format(msgToolchainVersionQueryFailed), maybe_output.error());
        }

        ExpectedC<Path> rustc_sysroot() const override
        {
            auto maybe_output = flatten_out(
                cmd_execute_and_capture_output(Command{m_rustc}.string_arg("--print").string_arg("sysroot")), m_rustc);
            if (auto output = maybe_output.get())
            {
                return Path(Strings::trim(*output));
            }

            return query_failed(msg::format(msgSysrootQueryFailed), maybe_output.error());
        }

        ExpectedC<std::string> target_spec_json(StringView target) const override
        {
            auto cmd = Command{m_rustc}
                           .string_arg("-Z")
                           .string_arg("unstable-options")
                           .string_arg("--print")
                           .string_arg("target-spec-json")
                           .string_arg(SwitchTarget)
                           .string_arg(target);
            auto maybe_output = flatten_out(cmd_execute_and_capture_output(cmd), m_rustc);
            if (auto output = maybe_output.get())
            {
                return std::move(*output);
            }

            return query_failed(msg::format(msgSanitizerQueryFailed), maybe_output.error());
        }

        ExpectedC<Path> target_libdir(StringView target) const override
        {
            auto cmd = Command{m_rustc}
                           .string_arg("--print")
                           .string_arg("target-libdir")
                           .string_arg(SwitchTarget)
                           .string_arg(target);
            auto maybe_output = flatten_out(cmd_execute_and_capture_output(cmd), m_rustc);
            if (auto output = maybe_output.get())
            {
                return Path(Strings::trim(*output));
            }

            return query_failed(msg::format(msgTargetLibdirQueryFailed), maybe_output.error());
        }

        ExpectedL<std::string> cargo_config_rustflags(const std::vector<std::string>& config_args) const override
        {
            auto cmd = Command{m_cargo}
                           .string_arg("config")
                           .string_arg("build.rustflags")
                           .string_arg("--format=json-value")
                           .string_arg(SwitchZUnstableOptions)
                           .forwarded_args(config_args);
            // cargo complains on stderr when the key is not set, which is the common case
#if defined(_WIN32)
            cmd.raw_arg("2>NUL");
#else
            cmd.raw_arg("2>/dev/null");
#endif
            return flatten_out(cmd_execute_and_capture_output(cmd), m_cargo);
        }

        ExpectedL<Unit> build_sysroot_crate(const Path& manifest,
                                            StringView target,
                                            const Environment& environment,
                                            BuildOutput output) const override
        {
            auto cmd = Command{m_cargo}
                           .string_arg("build")
                           .string_arg("--release")
                           .string_arg("--manifest-path")
                           .string_arg(manifest)
                           .string_arg(SwitchTarget)
                           .string_arg(target);
            if (output == BuildOutput::Quiet)
            {
                RedirectedProcessLaunchSettings settings;
                settings.environment = environment;
                settings.capture_stderr = true;
                settings.echo_in_debug = EchoInDebug::Show;
                return flatten(cmd_execute_and_capture_output(cmd, settings), m_cargo);
            }

            ProcessLaunchSettings settings;
            settings.environment = environment;
            auto maybe_exit = cmd_execute(cmd, settings);
            if (auto exit_code = maybe_exit.get())
            {
                if (*exit_code == 0)
                {
                    return Unit{};
                }

                return msg::format(msgProgramReturnedNonzeroExitCode,
                                   msg::tool_name = m_cargo,
                                   msg::exit_code = *exit_code);
            }

            return msg::format(msgLaunchingProgramFailed, msg::tool_name = m_cargo)
                .append_raw(' ')
                .append(maybe_exit.error());
        }

    private:
        std::string m_cargo;
        std::string m_rustc;
    };
}

namespace careful
{
    ExpectedL<ToolchainIdentity> parse_rustc_version(StringView rustc_vv_output)
    {
        static constexpr StringLiteral host_prefix = "host:";
        static constexpr StringLiteral commit_prefix = "commit-hash:";

        ToolchainIdentity result;
        for (auto&& line : Strings::split(rustc_vv_output, '\n'))
        {
            StringView sv = line;
            if (sv.starts_with(host_prefix))
            {
                result.host = Strings::trim(sv.substr(host_prefix.size())).to_string();
            }
            else if (sv.starts_with(commit_prefix))
            {
                auto commit = Strings::trim(sv.substr(commit_prefix.size()));
                if (!commit.empty() && commit != "unknown")
                {
                    result.commit = commit.to_string();
                }
            }
        }

        if (result.host.empty())
        {
            return msg::format(msgToolchainHostMissing);
        }

        return result;
    }

    std::unique_ptr<ToolchainProvider> make_real_toolchain_provider(const CarefulConfiguration& config)
    {
        return std::make_unique<RealToolchainProvider>(config);
    }

    std::string encode_rustflags(const std::vector<std::string>& flags)
    {
        return Strings::join("\x1f", flags);
    }

    std::vector<std::string> get_rustflags(const CarefulConfiguration& config,
                                           const ToolchainProvider& provider,
                                           const std::vector<std::string>& config_args)
    {
        if (auto encoded = config.cargo_encoded_rustflags.get())
        {
            if (encoded->empty())
            {
                return {};
            }

            return Strings::split_keep_empty(*encoded, EncodedRustFlagsSeparator);
        }

        if (auto legacy = config.rustflags.get())
        {
            auto flags = Strings::split(*legacy, ' ');
            Strings::inplace_trim_all_and_remove_whitespace_strings(flags);
            return flags;
        }

        // `cargo config` fails when build.rustflags is not set
        auto maybe_output = provider.cargo_config_rustflags(config_args);
        if (auto output = maybe_output.get())
        {
            auto maybe_flags = Json::parse_string_array(*output, "cargo config build.rustflags");
            if (auto flags = maybe_flags.get())
            {
                return std::move(*flags);
            }

            Debug::println("ignoring unparsable build.rustflags: ", maybe_flags.error().data());
            return {};
        }

        Debug::println("no build.rustflags configured: ", maybe_output.error().data());
        return {};
    }

    ExpectedC<bool> sanitizer_supported(const ToolchainProvider& provider, StringView sanitizer, StringView target)
    {
        auto maybe_spec = provider.target_spec_json(target);
        auto spec = maybe_spec.get();
        if (!spec)
        {
            return std::move(maybe_spec).error();
        }

        auto maybe_value = Json::parse(*spec, "target-spec-json");
        auto value = maybe_value.get();
        if (!value)
        {
            return query_failed(msg::format(msgSanitizerQueryFailed), maybe_value.error());
        }

        auto object = value->maybe_object();
        if (!object)
        {
            return query_failed(msg::format(msgSanitizerQueryFailed), msg::format(msgTargetSpecUnexpectedStructure));
        }

        // the list of supported sanitizers is the "supported-sanitizers" array of the target specification
        auto supported = object->get("supported-sanitizers");
        if (!supported)
        {
            return false;
        }

        auto supported_array = supported->maybe_array();
        if (!supported_array)
        {
            return query_failed(msg::format(msgSanitizerQueryFailed), msg::format(msgTargetSpecSanitizersNotArray));
        }

        for (auto&& entry : *supported_array)
        {
            auto name = entry.maybe_string();
            if (name && *name == sanitizer)
            {
                return true;
            }
        }

        return false;
    }
}
