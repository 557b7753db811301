#include <careful-test/util.h>

#include <careful/configuration.h>
#include <careful/errors.h>

using namespace careful;

TEST_CASE ("configuration defaults", "[configuration]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({});
    CHECK(config.cargo == "cargo");
    CHECK(config.rustc == "rustc");
    CHECK(!config.rust_lib_src.has_value());
    CHECK(!config.cargo_encoded_rustflags.has_value());
    CHECK(!config.rustflags.has_value());
    CHECK(!config.asan_options_set);
    CHECK(!config.is_ci);
    CHECK(!config.debugging);
    CHECK(!config.cache_root.has_value());

    auto maybe_cache = config.cache_directory();
    REQUIRE(!maybe_cache.has_value());
    CHECK(maybe_cache.error().kind == ErrorKind::ConfigQueryFailed);
}

TEST_CASE ("configuration from the environment", "[configuration]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({{"CARGO", "/home/u/.cargo/bin/cargo"},
                                        {"RUSTC", ""},
                                        {"RUST_LIB_SRC", "/src/rust/library"},
                                        {"CARGO_ENCODED_RUSTFLAGS", ""},
                                        {"RUSTFLAGS", "-Cfoo"},
                                        {"ASAN_OPTIONS", ""},
                                        {"CARGO_CAREFUL_DEBUG", "1"}});
    CHECK(config.cargo == "/home/u/.cargo/bin/cargo");
    CHECK(config.rustc == "rustc");
    CHECK(config.rust_lib_src == std::string("/src/rust/library"));
    CHECK(config.cargo_encoded_rustflags == std::string());
    CHECK(config.rustflags == std::string("-Cfoo"));
    CHECK(config.asan_options_set);
    CHECK(config.debugging);

    config.imbue_from_fake_environment({{"CARGO_CAREFUL_DEBUG", "true"}});
    CHECK(!config.debugging);
}

TEST_CASE ("ci detection", "[configuration]")
{
    CarefulConfiguration config;
    config.imbue_from_fake_environment({{"CI", "true"}});
    CHECK(config.is_ci);
    config.imbue_from_fake_environment({{"TF_BUILD", "True"}});
    CHECK(config.is_ci);
    config.imbue_from_fake_environment({{"GITHUB_ACTIONS", "true"}});
    CHECK(!config.is_ci);
}

TEST_CASE ("cache root", "[configuration]")
{
    CarefulConfiguration config;
#if defined(_WIN32)
    config.imbue_from_fake_environment({{"LOCALAPPDATA", "C:\\Users\\u\\AppData\\Local"}});
    CHECK(config.cache_directory().value_or_exit(CAREFUL_LINE_INFO) ==
          Path("C:\\Users\\u\\AppData\\Local") / "ralfj" / "cargo-careful" / "cache");
#elif defined(__APPLE__)
    config.imbue_from_fake_environment({{"HOME", "/Users/u"}, {"XDG_CACHE_HOME", "/xdg"}});
    CHECK(config.cache_directory().value_or_exit(CAREFUL_LINE_INFO) ==
          Path("/Users/u/Library/Caches/de.ralfj.cargo-careful"));
#else
    config.imbue_from_fake_environment({{"HOME", "/home/u"}});
    CHECK(config.cache_directory().value_or_exit(CAREFUL_LINE_INFO) == Path("/home/u/.cache/cargo-careful"));

    config.imbue_from_fake_environment({{"HOME", "/home/u"}, {"XDG_CACHE_HOME", "/var/cache/u"}});
    CHECK(config.cache_directory().value_or_exit(CAREFUL_LINE_INFO) == Path("/var/cache/u/cargo-careful"));

    // relative XDG_CACHE_HOME values are ignored
    config.imbue_from_fake_environment({{"HOME", "/home/u"}, {"XDG_CACHE_HOME", "cache"}});
    CHECK(config.cache_directory().value_or_exit(CAREFUL_LINE_INFO) == Path("/home/u/.cache/cargo-careful"));

    config.imbue_from_fake_environment({{"XDG_CACHE_HOME", "cache"}});
    auto maybe_cache = config.cache_directory();
    REQUIRE(!maybe_cache.has_value());
    CHECK(maybe_cache.error().message.data() == "unable to determine the cache directory: HOME is not set");
#endif
}
