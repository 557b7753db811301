#include <careful/base/checks.h>
#include <careful/base/files.h>
#include <careful/base/message_sinks.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.process.h>

#include <careful/careful.h>
#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/sourcelocator.h>
#include <careful/sysrootbuilder.h>
#include <careful/sysrootcache.h>
#include <careful/toolchain.h>

#include <iostream>

namespace careful
{
    ExpectedC<Optional<DelegatedInvocation>> prepare_invocation(const CarefulConfiguration& config,
                                                                const Filesystem& fs,
                                                                const ToolchainProvider& provider,
                                                                const SourceRemediation& remediation,
                                                                const CarefulArguments& args,
                                                                MessageSink& status_sink)
    {
        auto maybe_identity = provider.identity();
        auto identity = maybe_identity.get();
        if (!identity)
        {
            return std::move(maybe_identity).error();
        }

        const std::string target = args.explicit_target.value_or(identity->host);
        Debug::println("host: ", identity->host, ", target: ", target);

        if (auto sanitizer = args.sanitizer.get())
        {
            auto maybe_supported = sanitizer_supported(provider, *sanitizer, target);
            auto supported = maybe_supported.get();
            if (!supported)
            {
                return std::move(maybe_supported).error();
            }

            if (!*supported)
            {
                return make_error(ErrorKind::VariantUnsupported,
                                  msgSanitizerNotSupported,
                                  msg::sanitizer = *sanitizer,
                                  msg::target = target);
            }

            status_sink.println(msgUsingSanitizer, msg::sanitizer = *sanitizer);
        }

        const auto ambient_rustflags = get_rustflags(config, provider, args.cargo_config_args);

        auto maybe_source_tree = resolve_source_tree(fs, provider, remediation, config.rust_lib_src);
        auto source_tree = maybe_source_tree.get();
        if (!source_tree)
        {
            return std::move(maybe_source_tree).error();
        }

        auto maybe_cache_root = config.cache_directory();
        auto cache_root = maybe_cache_root.get();
        if (!cache_root)
        {
            return std::move(maybe_cache_root).error();
        }

        SysrootBuildRequest request;
        request.target = target;
        request.toolchain = *identity;
        request.source_tree = *source_tree;
        request.variant = args.sanitizer;
        request.extra_rustflags = ambient_rustflags;
        request.sysroot_dir = sysroot_dir_for(*cache_root, args.sanitizer);
        request.output = args.is_setup() ? BuildOutput::Live : BuildOutput::Quiet;

        auto maybe_sysroot = ensure(fs, provider, request, status_sink);
        auto sysroot = maybe_sysroot.get();
        if (!sysroot)
        {
            return std::move(maybe_sysroot).error();
        }

        if (args.is_setup())
        {
            return Optional<DelegatedInvocation>{};
        }

        return Optional<DelegatedInvocation>{plan(config, args, target, ambient_rustflags, args.sanitizer, *sysroot)};
    }

    int run_careful(const CarefulConfiguration& config,
                    const Filesystem& fs,
                    const ToolchainProvider& provider,
                    const std::vector<std::string>& args)
    {
        auto maybe_args = parse_arguments(args);
        auto parsed = maybe_args.get();
        if (!parsed)
        {
            Checks::msg_exit_with_fatal_error(CAREFUL_LINE_INFO, maybe_args.error().message);
        }

        const RustSrcInstaller remediation(config, !parsed->is_setup(), std::cin);
        auto maybe_invocation = prepare_invocation(config, fs, provider, remediation, *parsed, stderr_sink);
        auto invocation = maybe_invocation.get();
        if (!invocation)
        {
            const auto& error = maybe_invocation.error();
            Debug::println("failed with ", to_string_literal(error.kind));
            Checks::msg_exit_with_fatal_error(CAREFUL_LINE_INFO, error.message);
        }

        auto delegated = invocation->get();
        if (!delegated)
        {
            return 0;
        }

        if (parsed->verbosity > 0)
        {
            msg::write_unlocalized_text_to_stderr(Color::none, format_verbose_echo(*delegated).append("\n"));
        }

        ProcessLaunchSettings settings;
        settings.environment = delegated->environment;
        auto maybe_exit = cmd_execute_in_place(delegated->command, settings);
        if (auto exit_code = maybe_exit.get())
        {
            return static_cast<int>(*exit_code);
        }

        Checks::msg_exit_with_fatal_error(CAREFUL_LINE_INFO, maybe_exit.error());
    }
}
