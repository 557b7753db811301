#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/base/files.h>

#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/sourcelocator.h>

#include <sstream>

using namespace careful;
using Test::MockSourceRemediation;
using Test::MockToolchainProvider;

TEST_CASE ("confirmation answers", "[sourcelocator]")
{
    CHECK(parse_confirmation("").has_value());
    CHECK(parse_confirmation("\n").has_value());
    CHECK(parse_confirmation("y").has_value());
    CHECK(parse_confirmation(" Yes\r\n").has_value());

    auto no = parse_confirmation("N");
    REQUIRE(!no.has_value());
    CHECK(no.error().kind == ErrorKind::UserAborted);
    CHECK(no.error().message.data() == "aborting as per your request");

    auto garbage = parse_confirmation("maybe");
    REQUIRE(!garbage.has_value());
    CHECK(garbage.error().kind == ErrorKind::UserAborted);
    CHECK(garbage.error().message.data() == "invalid answer `maybe`");
}

TEST_CASE ("declining the rust-src installation", "[sourcelocator]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({});
    std::istringstream answers("no\n");
    const RustSrcInstaller installer(config, true, answers);
    auto result = installer.remediate();
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ErrorKind::UserAborted);
}

TEST_CASE ("source tree from the toolchain", "[sourcelocator]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::make_clean_directory(fs, "source-from-sysroot");

    MockToolchainProvider provider;
    provider.sysroot = root / "toolchain";
    const auto rust_root = provider.sysroot / "lib" / "rustlib" / "src" / "rust";

    SECTION ("present")
    {
        const auto library = Test::make_fake_library_source(fs, rust_root);
        MockSourceRemediation remediation;
        CHECK(resolve_source_tree(fs, provider, remediation, nullopt).value_or_exit(CAREFUL_LINE_INFO) == library);
        CHECK(remediation.remediations == 0);
    }

    SECTION ("installed on demand")
    {
        MockSourceRemediation remediation;
        remediation.install_into = rust_root;
        CHECK(resolve_source_tree(fs, provider, remediation, nullopt).value_or_exit(CAREFUL_LINE_INFO) ==
              rust_root / "library");
        CHECK(remediation.remediations == 1);
    }

    SECTION ("still missing after remediation")
    {
        MockSourceRemediation remediation;
        auto result = resolve_source_tree(fs, provider, remediation, nullopt);
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::SourceMissing);
        CHECK(remediation.remediations == 1);
    }

    SECTION ("remediation declined")
    {
        MockSourceRemediation remediation;
        remediation.succeed = false;
        auto result = resolve_source_tree(fs, provider, remediation, nullopt);
        REQUIRE(!result.has_value());
        CHECK(result.error().kind == ErrorKind::UserAborted);
    }
}

TEST_CASE ("source tree override", "[sourcelocator]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::make_clean_directory(fs, "source-override");
    const auto library = Test::make_fake_library_source(fs, root / "checkout");

    MockToolchainProvider provider;
    MockSourceRemediation remediation;
    CHECK(resolve_source_tree(fs, provider, remediation, library.native()).value_or_exit(CAREFUL_LINE_INFO) ==
          library);

    auto not_a_source = resolve_source_tree(fs, provider, remediation, (root / "checkout").native());
    REQUIRE(!not_a_source.has_value());
    CHECK(not_a_source.error().kind == ErrorKind::SourceNotFound);

    auto missing = resolve_source_tree(fs, provider, remediation, (root / "nonexistent").native());
    REQUIRE(!missing.has_value());
    CHECK(missing.error().kind == ErrorKind::SourceNotFound);
    CHECK(remediation.remediations == 0);
}
