#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/base/files.h>

#include <careful/careful.h>
#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/sysrootcache.h>

using namespace careful;
using Test::MockSourceRemediation;
using Test::MockToolchainProvider;

namespace
{
    struct Scenario
    {
        explicit Scenario(StringView name) : root(Test::make_clean_directory(real_filesystem, name))
        {
            provider.sysroot = root / "toolchain";
            source_tree =
                Test::make_fake_library_source(real_filesystem, provider.sysroot / "lib" / "rustlib" / "src" / "rust");
            config.imbue_from_fake_environment({});
            config.cache_root = root / "cache";
        }

        ExpectedC<Optional<DelegatedInvocation>> run(const std::vector<std::string>& args)
        {
            auto parsed = parse_arguments(args).value_or_exit(CAREFUL_LINE_INFO);
            return prepare_invocation(config, real_filesystem, provider, remediation, parsed, status);
        }

        Path root;
        Path source_tree;
        CarefulConfiguration config;
        MockToolchainProvider provider;
        MockSourceRemediation remediation;
        Test::CapturingMessageSink status;
    };
}

TEST_CASE ("setup records the current key", "[careful]")
{
    Scenario scenario("scenario-setup");
    auto result = scenario.run({"careful", "setup"}).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(!result.has_value());
    CHECK(scenario.provider.compilations == 1);

    const SysrootLayout layout(scenario.root / "cache", "x86_64-unknown-linux-gnu");
    const auto expected = current_key(scenario.provider.toolchain, scenario.source_tree, nullopt);
    CHECK(real_filesystem.read_contents(layout.marker_file(), CAREFUL_LINE_INFO) == expected.to_string());
    CHECK(StringView{scenario.status.output}.contains("A sysroot is now available in"));
}

TEST_CASE ("test on a fresh cache delegates without compiling", "[careful]")
{
    Scenario scenario("scenario-test");
    scenario.run({"careful", "setup"}).value_or_exit(CAREFUL_LINE_INFO);
    REQUIRE(scenario.provider.compilations == 1);

    scenario.status.output.clear();
    auto result = scenario.run({"careful", "test", "--", "--nocapture"}).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(scenario.provider.compilations == 1);
    auto invocation = result.get();
    REQUIRE(invocation != nullptr);

    const auto sysroot = scenario.root / "cache";
    CHECK(invocation->rustflags == std::vector<std::string>{"-Cdebug-assertions=on",
                                                            "-Zextra-const-ub-checks",
                                                            "-Zstrict-init-checks",
                                                            "--cfg",
                                                            "careful",
                                                            "--sysroot",
                                                            sysroot.native()});
    CHECK(invocation->command.command_line() == "cargo test -- --nocapture");
    CHECK(scenario.status.output == "Preparing a careful sysroot (target: x86_64-unknown-linux-gnu)... done\n");
}

TEST_CASE ("sanitized run", "[careful]")
{
    Scenario scenario("scenario-sanitizer");
    auto result = scenario.run({"careful", "run", "-Zcareful-sanitizer"}).value_or_exit(CAREFUL_LINE_INFO);
    auto invocation = result.get();
    REQUIRE(invocation != nullptr);
    CHECK(StringView{scenario.status.output}.starts_with("Using sanitizer `address`.\n"));
    CHECK(invocation->command.command_line() == "cargo run --target x86_64-unknown-linux-gnu --");
    CHECK(invocation->rustflags.back() == (scenario.root / "cache" / "address").native());
    REQUIRE(invocation->environment.value_of("ASAN_OPTIONS") != nullptr);

    auto unsupported = scenario.run({"careful", "run", "-Zcareful-sanitizer=memtag"});
    REQUIRE(!unsupported.has_value());
    CHECK(unsupported.error().kind == ErrorKind::VariantUnsupported);
    CHECK(unsupported.error().message.data() ==
          "sanitizer `memtag` not supported by target `x86_64-unknown-linux-gnu`");
    CHECK(scenario.provider.compilations == 1);
}

TEST_CASE ("missing cache root", "[careful]")
{
    Scenario scenario("scenario-no-cache-root");
    scenario.config.cache_root = nullopt;
    auto result = scenario.run({"careful", "build"});
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ErrorKind::ConfigQueryFailed);
    CHECK(scenario.provider.compilations == 0);
}
