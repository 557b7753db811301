#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/toolchain.h>

using namespace careful;
using Test::MockToolchainProvider;

TEST_CASE ("parse rustc -vV", "[toolchain]")
{
    auto identity = parse_rustc_version(R"(rustc 1.80.0-nightly (ada5e2c7b 2024-05-31)
binary: rustc
commit-hash: ada5e2c7b5427a591e30baeeee2698a5eb6db0bd
commit-date: 2024-05-31
host: x86_64-unknown-linux-gnu
release: 1.80.0-nightly
LLVM version: 18.1.6
)")
                        .value_or_exit(CAREFUL_LINE_INFO);
    CHECK(identity.host == "x86_64-unknown-linux-gnu");
    CHECK(identity.commit == std::string("ada5e2c7b5427a591e30baeeee2698a5eb6db0bd"));

    auto unknown = parse_rustc_version("rustc 1.80.0-dev\r\ncommit-hash: unknown\r\nhost: aarch64-apple-darwin\r\n")
                       .value_or_exit(CAREFUL_LINE_INFO);
    CHECK(unknown.host == "aarch64-apple-darwin");
    CHECK(!unknown.commit.has_value());

    CHECK(!parse_rustc_version("rustc 1.80.0\ncommit-hash: abc\n").has_value());
}

TEST_CASE ("encoded rustflags take precedence", "[toolchain]")
{
    MockToolchainProvider provider;
    provider.config_rustflags_output = R"(["-Cfrom-config"])";

    CarefulConfiguration config;
    config.imbue_from_fake_environment(
        {{"CARGO_ENCODED_RUSTFLAGS", "-Cfoo\x1f--cfg\x1fhas space"}, {"RUSTFLAGS", "-Cbar"}});
    CHECK(get_rustflags(config, provider, {}) == std::vector<std::string>{"-Cfoo", "--cfg", "has space"});
    CHECK(provider.config_args_seen.empty());

    config.imbue_from_fake_environment({{"CARGO_ENCODED_RUSTFLAGS", ""}, {"RUSTFLAGS", "-Cbar"}});
    CHECK(get_rustflags(config, provider, {}).empty());
}

TEST_CASE ("RUSTFLAGS is split on spaces", "[toolchain]")
{
    MockToolchainProvider provider;
    provider.config_rustflags_output = R"(["-Cfrom-config"])";

    CarefulConfiguration config;
    config.imbue_from_fake_environment({{"RUSTFLAGS", "  -Cbar   --cfg  baz "}});
    CHECK(get_rustflags(config, provider, {}) == std::vector<std::string>{"-Cbar", "--cfg", "baz"});

    config.imbue_from_fake_environment({{"RUSTFLAGS", ""}});
    CHECK(get_rustflags(config, provider, {}).empty());
}

TEST_CASE ("cargo config is the last resort", "[toolchain]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({});

    MockToolchainProvider provider;
    provider.config_rustflags_output = "[\"-Cfrom-config\", \"--cfg\", \"x\"]\n";
    const std::vector<std::string> config_args{"--config", "a=1", "--manifest-path", "Cargo.toml"};
    CHECK(get_rustflags(config, provider, config_args) ==
          std::vector<std::string>{"-Cfrom-config", "--cfg", "x"});
    CHECK(provider.config_args_seen == config_args);

    provider.config_rustflags_output = nullopt;
    CHECK(get_rustflags(config, provider, {}).empty());

    provider.config_rustflags_output = "{\"not\": \"an array\"}";
    CHECK(get_rustflags(config, provider, {}).empty());

    provider.config_rustflags_output = "[1, 2]";
    CHECK(get_rustflags(config, provider, {}).empty());
}

TEST_CASE ("encode rustflags", "[toolchain]")
{
    CHECK(encode_rustflags({}).empty());
    CHECK(encode_rustflags({"a"}) == "a");
    CHECK(encode_rustflags({"a b", "", "c"}) == "a b\x1f\x1f"
                                                "c");
}

TEST_CASE ("sanitizer support comes from the target specification", "[toolchain]")
{
    MockToolchainProvider provider;
    CHECK(sanitizer_supported(provider, "address", "x86_64-unknown-linux-gnu").value_or_exit(CAREFUL_LINE_INFO));
    CHECK(!sanitizer_supported(provider, "memtag", "x86_64-unknown-linux-gnu").value_or_exit(CAREFUL_LINE_INFO));

    provider.target_spec = R"({"arch": "wasm32"})";
    CHECK(!sanitizer_supported(provider, "address", "wasm32-unknown-unknown").value_or_exit(CAREFUL_LINE_INFO));

    provider.target_spec = R"({"supported-sanitizers": "address"})";
    auto not_array = sanitizer_supported(provider, "address", "x86_64-unknown-linux-gnu");
    REQUIRE(!not_array.has_value());
    CHECK(not_array.error().kind == ErrorKind::ConfigQueryFailed);
    CHECK(StringView{not_array.error().message.data()}.contains("unexpected type"));

    provider.target_spec = R"(["address"])";
    auto not_object = sanitizer_supported(provider, "address", "x86_64-unknown-linux-gnu");
    REQUIRE(!not_object.has_value());
    CHECK(not_object.error().kind == ErrorKind::ConfigQueryFailed);

    provider.target_spec = "{";
    auto malformed = sanitizer_supported(provider, "address", "x86_64-unknown-linux-gnu");
    REQUIRE(!malformed.has_value());
    CHECK(malformed.error().kind == ErrorKind::ConfigQueryFailed);
}
