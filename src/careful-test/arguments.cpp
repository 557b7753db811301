#include <careful-test/util.h>

#include <careful/configuration.h>
#include <careful/errors.h>
#include <careful/invocationplanner.h>

using namespace careful;

namespace
{
    CarefulArguments parse_ok(const std::vector<std::string>& args)
    {
        return parse_arguments(args).value_or_exit(CAREFUL_LINE_INFO);
    }

    ErrorKind parse_error_kind(const std::vector<std::string>& args)
    {
        auto maybe_args = parse_arguments(args);
        REQUIRE(!maybe_args.has_value());
        return maybe_args.error().kind;
    }
}

TEST_CASE ("arguments after -- are trailing", "[arguments]")
{
    auto args = parse_ok({"careful", "test", "x", "y", "--", "z", "w"});
    CHECK(args.subcommand == "test");
    CHECK(args.cargo_args == std::vector<std::string>{"x", "y"});
    CHECK(args.trailing_args == std::vector<std::string>{"z", "w"});
    CHECK(!args.is_setup());
}

TEST_CASE ("careful flags after -- are not interpreted", "[arguments]")
{
    auto args = parse_ok({"careful", "run", "--", "-Zcareful-sanitizer", "-Zcareful-bogus", "-v"});
    CHECK(!args.sanitizer.has_value());
    CHECK(args.verbosity == 0);
    CHECK(args.cargo_args.empty());
    CHECK(args.trailing_args == std::vector<std::string>{"-Zcareful-sanitizer", "-Zcareful-bogus", "-v"});
}

TEST_CASE ("sanitizer flags", "[arguments]")
{
    SECTION ("bare flag selects address")
    {
        auto args = parse_ok({"careful", "test", "-Zcareful-sanitizer"});
        CHECK(args.sanitizer == std::string("address"));
        CHECK(args.cargo_args.empty());
    }

    SECTION ("explicit value")
    {
        auto args = parse_ok({"careful", "test", "-Zcareful-sanitizer=thread", "--lib"});
        CHECK(args.sanitizer == std::string("thread"));
        CHECK(args.cargo_args == std::vector<std::string>{"--lib"});
    }

    SECTION ("last occurrence wins")
    {
        CHECK(parse_ok({"careful", "t", "-Zcareful-sanitizer=thread", "-Zcareful-sanitizer"}).sanitizer ==
              std::string("address"));
        CHECK(parse_ok({"careful", "t", "-Zcareful-sanitizer", "-Zcareful-sanitizer=memory"}).sanitizer ==
              std::string("memory"));
    }

    SECTION ("unknown careful flag")
    {
        auto maybe_args = parse_arguments({"careful", "test", "-Zcareful-sanitizers"});
        REQUIRE(!maybe_args.has_value());
        CHECK(maybe_args.error().kind == ErrorKind::InvalidArguments);
        CHECK(maybe_args.error().message.data() == "unsupported careful flag `-Zcareful-sanitizers`");
    }
}

TEST_CASE ("target and verbosity", "[arguments]")
{
    auto args = parse_ok({"careful",
                          "build",
                          "-v",
                          "--target",
                          "aarch64-unknown-linux-gnu",
                          "--target-dir",
                          "out",
                          "-v",
                          "--target=x86_64-pc-windows-msvc",
                          "--",
                          "-v"});
    CHECK(args.explicit_target == std::string("aarch64-unknown-linux-gnu"));
    CHECK(args.verbosity == 2);
    CHECK(args.cargo_args == std::vector<std::string>{"-v",
                                                      "--target",
                                                      "aarch64-unknown-linux-gnu",
                                                      "--target-dir",
                                                      "out",
                                                      "-v",
                                                      "--target=x86_64-pc-windows-msvc"});

    CHECK(parse_ok({"careful", "b", "--target=thumbv7em-none-eabihf"}).explicit_target ==
          std::string("thumbv7em-none-eabihf"));
    CHECK(!parse_ok({"careful", "b", "--target-dir=out"}).explicit_target.has_value());
}

TEST_CASE ("cargo config switches are collected", "[arguments]")
{
    auto args = parse_ok({"careful",
                          "test",
                          "--config",
                          "build.rustflags=['-Zfoo']",
                          "--manifest-path=sub/Cargo.toml",
                          "--features",
                          "x",
                          "--",
                          "--config",
                          "ignored"});
    CHECK(args.cargo_config_args == std::vector<std::string>{
                                        "--config", "build.rustflags=['-Zfoo']", "--manifest-path", "sub/Cargo.toml"});
    CHECK(args.cargo_args.size() == 5);
}

TEST_CASE ("cargo config switches keep long values intact", "[arguments]")
{
    const std::string config_value = "target.x86_64-unknown-linux-gnu.rustflags=['-Zsome-long-unstable-option']";
    const std::string manifest = "some/considerably/longer/workspace/member/directory/Cargo.toml";
    auto args = parse_ok({"careful", "build", "--config", config_value, "--manifest-path=" + manifest});
    CHECK(args.cargo_config_args == std::vector<std::string>{"--config", config_value, "--manifest-path", manifest});
    CHECK(args.cargo_args == std::vector<std::string>{"--config", config_value, "--manifest-path=" + manifest});
}

TEST_CASE ("subcommands", "[arguments]")
{
    for (auto&& subcommand : {"setup", "test", "t", "run", "r", "build", "b", "nextest"})
    {
        CHECK(parse_ok({"careful", subcommand}).subcommand == subcommand);
    }

    CHECK(parse_ok({"careful", "setup"}).is_setup());
    CHECK(parse_error_kind({"careful", "check"}) == ErrorKind::InvalidArguments);
    CHECK(parse_error_kind({"careful"}) == ErrorKind::InvalidArguments);
    CHECK(parse_error_kind({"test"}) == ErrorKind::InvalidArguments);
    CHECK(parse_error_kind({}) == ErrorKind::InvalidArguments);

    auto missing = parse_arguments({"careful"});
    REQUIRE(!missing.has_value());
    CHECK(StringView{missing.error().message.data()}.contains("needs to be called with a subcommand"));
}

TEST_CASE ("plan pins the target only for sanitized builds", "[arguments]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({{"CARGO", "/opt/cargo"}});

    auto args = parse_ok({"careful", "test", "--lib", "--", "--nocapture"});
    auto plain = plan(config, args, "x86_64-unknown-linux-gnu", {}, nullopt, "/cache");
    CHECK(plain.command.command_line() == "/opt/cargo test --lib -- --nocapture");

    auto sanitized = plan(config, args, "x86_64-unknown-linux-gnu", {}, std::string("address"), "/cache/address");
    CHECK(sanitized.command.command_line() ==
          "/opt/cargo test --target x86_64-unknown-linux-gnu --lib -- --nocapture");

    auto explicit_args = parse_ok({"careful", "test", "--target", "aarch64-apple-darwin"});
    auto explicit_plan = plan(config, explicit_args, "aarch64-apple-darwin", {}, std::string("address"), "/c");
    CHECK(explicit_plan.command.command_line() == "/opt/cargo test --target aarch64-apple-darwin --");
}

TEST_CASE ("plan environment", "[arguments]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({});
    auto args = parse_ok({"careful", "run"});

    auto plain = plan(config, args, "x86_64-unknown-linux-gnu", {"-Cfoo"}, nullopt, "/cache");
    const std::string expected_flags =
        "-Cdebug-assertions=on\x1f-Zextra-const-ub-checks\x1f-Zstrict-init-checks\x1f--cfg\x1f"
        "careful\x1f-Cfoo\x1f--sysroot\x1f/cache";
    REQUIRE(plain.environment.value_of("CARGO_ENCODED_RUSTFLAGS") != nullptr);
    CHECK(*plain.environment.value_of("CARGO_ENCODED_RUSTFLAGS") == expected_flags);
    REQUIRE(plain.environment.value_of("CARGO_ENCODED_RUSTDOCFLAGS") != nullptr);
    CHECK(*plain.environment.value_of("CARGO_ENCODED_RUSTDOCFLAGS") == expected_flags);
    CHECK(plain.environment.removes("RUSTFLAGS"));
    CHECK(plain.environment.removes("RUSTDOCFLAGS"));
    CHECK(plain.environment.value_of("ASAN_OPTIONS") == nullptr);

    auto asan = plan(config, args, "x86_64-unknown-linux-gnu", {}, std::string("address"), "/cache/address");
    REQUIRE(asan.environment.value_of("ASAN_OPTIONS") != nullptr);
    CHECK(*asan.environment.value_of("ASAN_OPTIONS") == "detect_leaks=0");

    auto tsan = plan(config, args, "x86_64-unknown-linux-gnu", {}, std::string("thread"), "/cache/thread");
    CHECK(tsan.environment.value_of("ASAN_OPTIONS") == nullptr);

    CarefulConfiguration user_asan;
    user_asan.imbue_from_fake_environment({{"ASAN_OPTIONS", "detect_leaks=1"}});
    auto kept = plan(user_asan, args, "x86_64-unknown-linux-gnu", {}, std::string("address"), "/cache/address");
    CHECK(kept.environment.value_of("ASAN_OPTIONS") == nullptr);
}

TEST_CASE ("careful rustflags order", "[arguments]")
{
    CHECK(careful_rustflags({"-Ctarget-cpu=native"}, std::string("address"), "/s") ==
          std::vector<std::string>{"-Cdebug-assertions=on",
                                   "-Zextra-const-ub-checks",
                                   "-Zstrict-init-checks",
                                   "--cfg",
                                   "careful",
                                   "-Ctarget-cpu=native",
                                   "-Zsanitizer=address",
                                   "--sysroot",
                                   "/s"});
}

TEST_CASE ("verbose echo", "[arguments]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({});
    auto args = parse_ok({"careful", "build"});
    auto invocation = plan(config, args, "x86_64-unknown-linux-gnu", {}, nullopt, "/c");
    const auto echo = format_verbose_echo(invocation);
    CHECK(StringView{echo}.starts_with("[cargo-careful] CARGO_ENCODED_RUSTFLAGS=\"-Cdebug-assertions=on"));
    CHECK(StringView{echo}.contains("RUSTFLAGS=<deleted> RUSTDOCFLAGS=<deleted> cargo build --"));
}
