#include <careful/base/files.h>
#include <careful/base/strings.h>
#include <careful/base/system.process.h>

#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/sourcelocator.h>
#include <careful/toolchain.h>

#include <stdio.h>

#include <istream>

namespace
{
    using namespace careful;

    Command rustup_add_rust_src()
    {
        return Command{"rustup"}.string_arg("component").string_arg("add").string_arg("rust-src");
    }

    bool looks_like_library_source(const ReadOnlyFilesystem& fs, const Path& candidate)
    {
        return fs.exists(candidate / "std" / "src" / "lib.rs", IgnoreErrors{});
    }
}

namespace careful
{
    RustSrcInstaller::RustSrcInstaller(const CarefulConfiguration& config, bool automatic, std::istream& answers)
        : m_ask(automatic && !config.is_ci), m_answers(answers)
    {
    }

    ExpectedC<Unit> parse_confirmation(StringView answer)
    {
        const auto normalized = Strings::ascii_to_lowercase(Strings::trim(answer));
        if (normalized.empty() || normalized == "y" || normalized == "yes")
        {
            return Unit{};
        }

        if (normalized == "n" || normalized == "no")
        {
            return make_error(ErrorKind::UserAborted, msgAbortingAsRequested);
        }

        return make_error(ErrorKind::UserAborted, msgInvalidAnswer, msg::value = normalized);
    }

    ExpectedC<Unit> RustSrcInstaller::remediate() const
    {
        const auto cmd = rustup_add_rust_src();
        const auto action = msg::format(msgInstallRustSrcAction);
        if (m_ask)
        {
            msg::print(msg::format(msgAskToRun, msg::command_line = cmd.command_line(), msg::action = action));
            fflush(stdout);
            std::string answer;
            std::getline(m_answers, answer);
            auto confirmed = parse_confirmation(answer);
            if (!confirmed)
            {
                return confirmed;
            }
        }
        else
        {
            msg::write_unlocalized_text_to_stderr(
                Color::none,
                msg::format(msgRunningToAction, msg::command_line = cmd.command_line(), msg::action = action)
                    .append_raw('\n'));
        }

        if (succeeded(cmd_execute(cmd)))
        {
            return Unit{};
        }

        return make_error(ErrorKind::ConfigQueryFailed, msgFailedToAction, msg::action = action);
    }

    ExpectedC<Path> resolve_source_tree(const ReadOnlyFilesystem& fs,
                                        const ToolchainProvider& provider,
                                        const SourceRemediation& remediation,
                                        const Optional<std::string>& override_path)
    {
        if (auto explicit_path = override_path.get())
        {
            std::error_code ec;
            Path source_tree = fs.almost_canonical(*explicit_path, ec);
            if (ec)
            {
                source_tree = fs.absolute(*explicit_path, ec);
                if (ec)
                {
                    source_tree = *explicit_path;
                }
            }

            if (!looks_like_library_source(fs, source_tree))
            {
                return make_error(ErrorKind::SourceNotFound, msgRustSrcNotFound, msg::path = source_tree);
            }

            return source_tree;
        }

        auto maybe_sysroot = provider.rustc_sysroot();
        auto sysroot = maybe_sysroot.get();
        if (!sysroot)
        {
            return std::move(maybe_sysroot).error();
        }

        auto candidate = *sysroot / "lib" / "rustlib" / "src" / "rust" / "library";
        if (fs.exists(candidate, IgnoreErrors{}))
        {
            return candidate;
        }

        auto remediated = remediation.remediate();
        if (!remediated)
        {
            return std::move(remediated).error();
        }

        if (!fs.exists(candidate, IgnoreErrors{}))
        {
            return make_error(ErrorKind::SourceMissing, msgRustSrcMissing, msg::path = candidate);
        }

        return candidate;
    }
}
