#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/base/files.h>

#include <careful/contractual-constants.h>
#include <careful/errors.h>

namespace careful::Test
{
    ExpectedC<ToolchainIdentity> MockToolchainProvider::identity() const { return toolchain; }

    ExpectedC<Path> MockToolchainProvider::rustc_sysroot() const { return sysroot; }

    ExpectedC<std::string> MockToolchainProvider::target_spec_json(StringView) const { return target_spec; }

    ExpectedC<Path> MockToolchainProvider::target_libdir(StringView) const { return libdir; }

    ExpectedL<std::string> MockToolchainProvider::cargo_config_rustflags(
        const std::vector<std::string>& config_args) const
    {
        config_args_seen = config_args;
        if (auto output = config_rustflags_output.get())
        {
            return *output;
        }

        return LocalizedString::from_raw("error: config value `build.rustflags` is not set");
    }

    ExpectedL<Unit> MockToolchainProvider::build_sysroot_crate(const Path& manifest,
                                                               StringView target,
                                                               const Environment& environment,
                                                               BuildOutput) const
    {
        ++compilations;
        last_build_environment = environment;
        std::error_code ec;
        last_manifest = real_filesystem.read_contents(manifest, ec);
        CHECK_EC(ec);
        if (fail_build)
        {
            return LocalizedString::from_raw("error[E0463]: can't find crate for `core`");
        }

        auto target_dir = environment.value_of(EnvironmentVariableCargoTargetDir);
        REQUIRE(target_dir != nullptr);
        const auto deps = Path(*target_dir) / target / "release" / "deps";
        for (auto&& artifact : artifacts)
        {
            real_filesystem.write_contents_and_dirs(deps / artifact.first, artifact.second, ec);
            CHECK_EC(ec);
        }

        return Unit{};
    }

    ExpectedC<Unit> MockSourceRemediation::remediate() const
    {
        ++remediations;
        if (!succeed)
        {
            return make_error(ErrorKind::UserAborted, msgAbortingAsRequested);
        }

        if (!install_into.empty())
        {
            make_fake_library_source(real_filesystem, install_into);
        }

        return Unit{};
    }
}
