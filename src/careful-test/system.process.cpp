#include <careful-test/util.h>

#include <careful/base/system.process.h>

using namespace careful;

TEST_CASE ("shell escaping", "[system.process]")
{
    CHECK(Command{"cargo"}.string_arg("test").command_line() == "cargo test");
    CHECK(Command{"cargo"}.string_arg("").command_line() == "cargo \"\"");
#if defined(_WIN32)
    CHECK(Command{"cargo"}.string_arg("a b").command_line() == "cargo \"a b\"");
    CHECK(Command{"cargo"}.string_arg(R"(C:\x y\)").command_line() == R"(cargo "C:\x y\\")");
#else
    CHECK(Command{"cargo"}.string_arg("a b").command_line() == "cargo \"a b\"");
    CHECK(Command{"cargo"}.string_arg("$HOME `x` \"q\" \\").command_line() ==
          R"(cargo "\$HOME \`x\` \"q\" \\")");
    CHECK(Command{"cargo"}.string_arg("-Cfoo\x1f--cfg").command_line() == "cargo \"-Cfoo\x1f--cfg\"");
#endif
    CHECK(Command{"cargo"}.raw_arg("2>/dev/null").command_line() == "cargo 2>/dev/null");
    CHECK(Command{"cargo"}.forwarded_args({"build", "--features", "a b"}).command_line() ==
          "cargo build --features \"a b\"");
}

TEST_CASE ("environment changes", "[system.process]")
{
    Environment environment;
    CHECK(environment.empty());
    CHECK(environment.get().empty());

    environment.add_entry("CARGO_ENCODED_RUSTFLAGS", "--cfg\x1f"
                                                     "careful");
    environment.remove_entry("RUSTFLAGS");
    environment.add_entry("ASAN_OPTIONS", "detect_leaks=0");
    CHECK(!environment.empty());
    CHECK(environment.entries().size() == 3);

    REQUIRE(environment.value_of("ASAN_OPTIONS") != nullptr);
    CHECK(*environment.value_of("ASAN_OPTIONS") == "detect_leaks=0");
    CHECK(environment.value_of("RUSTFLAGS") == nullptr);
    CHECK(environment.value_of("PATH") == nullptr);
    CHECK(environment.removes("RUSTFLAGS"));
    CHECK(!environment.removes("ASAN_OPTIONS"));

    CHECK(environment.get() == "env -u RUSTFLAGS CARGO_ENCODED_RUSTFLAGS=\"--cfg\x1f"
                               "careful\" ASAN_OPTIONS=detect_leaks=0 ");

    environment.add_entry("RUSTFLAGS", "-Cfoo");
    CHECK(!environment.removes("RUSTFLAGS"));
    REQUIRE(environment.value_of("RUSTFLAGS") != nullptr);
    CHECK(*environment.value_of("RUSTFLAGS") == "-Cfoo");
}

#if !defined(_WIN32)
TEST_CASE ("format command line", "[system.process]")
{
    Environment environment;
    environment.add_entry("A", "1");
    CHECK(format_command_line(Command{"cargo"}.string_arg("build"), Path("/tmp/x y"), environment) ==
          "cd \"/tmp/x y\" && env A=1 cargo build");
    CHECK(format_command_line(Command{"cargo"}, nullopt, nullopt) == "cargo");
}

TEST_CASE ("captures output", "[system.process]")
{
    auto run = cmd_execute_and_capture_output(Command{"echo"}.string_arg("hello world"))
                   .value_or_exit(CAREFUL_LINE_INFO);
    CHECK(run.exit_code == 0);
    CHECK(run.output == "hello world\n");

    RedirectedProcessLaunchSettings settings;
    settings.environment.emplace();
    settings.environment.get()->add_entry("CAREFUL_TEST_VALUE", "from parent");
    auto with_env = cmd_execute_and_capture_output(Command{"printenv"}.string_arg("CAREFUL_TEST_VALUE"), settings)
                        .value_or_exit(CAREFUL_LINE_INFO);
    CHECK(with_env.output == "from parent\n");
}

TEST_CASE ("captures standard error on request", "[system.process]")
{
    const auto cmd = Command{"sh"}.string_arg("-c").string_arg("echo out; echo err 1>&2; exit 3");
    RedirectedProcessLaunchSettings settings;
    settings.capture_stderr = true;
    auto run = cmd_execute_and_capture_output(cmd, settings).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(run.exit_code == 3);
    CHECK(run.output == "out\nerr\n");

    auto flattened = flatten(cmd_execute_and_capture_output(cmd, settings), "sh");
    REQUIRE(!flattened.has_value());
    CHECK(StringView{flattened.error().data()}.contains("sh failed with exit code: (3)."));
    CHECK(StringView{flattened.error().data()}.contains("err"));
}

TEST_CASE ("exit codes", "[system.process]")
{
    CHECK(succeeded(cmd_execute(Command{"true"})));
    CHECK(!succeeded(cmd_execute(Command{"false"})));
    CHECK(cmd_execute(Command{"sh"}.string_arg("-c").string_arg("exit 7")).value_or_exit(CAREFUL_LINE_INFO) == 7);

    CHECK(flatten_out(cmd_execute_and_capture_output(Command{"printf"}.string_arg("x")), "printf")
              .value_or_exit(CAREFUL_LINE_INFO) == "x");
    CHECK(!flatten_out(cmd_execute_and_capture_output(Command{"false"}), "false").has_value());
}
#endif
