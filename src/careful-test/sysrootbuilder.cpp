#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/base/files.h>

#include <careful/errors.h>
#include <careful/sysrootbuilder.h>
#include <careful/sysrootcache.h>

using namespace careful;
using Test::MockToolchainProvider;

namespace
{
    SysrootBuildRequest make_request(const Path& root, const Path& source_tree)
    {
        SysrootBuildRequest request;
        request.target = "x86_64-unknown-linux-gnu";
        request.toolchain = ToolchainIdentity{"x86_64-unknown-linux-gnu", std::string("0123456789abcdef")};
        request.source_tree = source_tree;
        request.sysroot_dir = root / "sysroot";
        return request;
    }
}

TEST_CASE ("no_std targets", "[sysrootbuilder]")
{
    CHECK(is_no_std_target("thumbv7em-none-eabihf"));
    CHECK(is_no_std_target("nvptx64-nvidia-cuda"));
    CHECK(is_no_std_target("aarch64-nintendo-switch-freestanding"));
    CHECK(is_no_std_target("x86_64-unknown-uefi"));
    CHECK(!is_no_std_target("x86_64-unknown-linux-gnu"));
    CHECK(!is_no_std_target("aarch64-apple-darwin"));
}

TEST_CASE ("toml basic strings", "[sysrootbuilder]")
{
    CHECK(toml_basic_string("/home/user/library") == "\"/home/user/library\"");
    CHECK(toml_basic_string(R"(C:\Users\a "b")") == R"("C:\\Users\\a \"b\"")");
    CHECK(toml_basic_string("") == "\"\"");

    // control characters
    CHECK(toml_basic_string("/tmp/new\nline\tdir") == R"("/tmp/new\nline\tdir")");
    CHECK(toml_basic_string("a\rb\bc\fd") == R"("a\rb\bc\fd")");
    CHECK(toml_basic_string("bell\x07" "del\x7f" "esc\x1b") == R"("bell\u0007del\u007fesc\u001b")");
    CHECK(toml_basic_string("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
}

TEST_CASE ("sysroot manifest", "[sysrootbuilder]")
{
    const auto std_manifest = generate_sysroot_manifest("/src/library", false);
    CHECK(std_manifest == R"([package]
authors = ["The Rust Project Developers"]
name = "sysroot"
version = "0.0.0"

[lib]
path = "lib.rs"

[dependencies.std]
features = ["panic_unwind", "backtrace"]
path = "/src/library/std"

[dependencies.test]
path = "/src/library/test"

[patch.crates-io.rustc-std-workspace-core]
path = "/src/library/rustc-std-workspace-core"

[patch.crates-io.rustc-std-workspace-alloc]
path = "/src/library/rustc-std-workspace-alloc"

[patch.crates-io.rustc-std-workspace-std]
path = "/src/library/rustc-std-workspace-std"
)");

    const auto core_manifest = generate_sysroot_manifest("/src/library", true);
    CHECK(StringView{core_manifest}.contains("[dependencies.core]\npath = \"/src/library/core\"\n"));
    CHECK(StringView{core_manifest}.contains("[dependencies.alloc]\npath = \"/src/library/alloc\"\n"));
    CHECK(!StringView{core_manifest}.contains("dependencies.std"));
    CHECK(!StringView{core_manifest}.contains("rustc-std-workspace-std"));
    CHECK(StringView{core_manifest}.contains("rustc-std-workspace-core"));
}

TEST_CASE ("sysroot rustflags", "[sysrootbuilder]")
{
    CHECK(sysroot_rustflags({"-Cfoo"}, std::string("thread")) == std::vector<std::string>{"-Cdebug-assertions=on",
                                                                                          "-Zextra-const-ub-checks",
                                                                                          "-Zstrict-init-checks",
                                                                                          "--cfg",
                                                                                          "careful",
                                                                                          "-Cfoo",
                                                                                          "-Zsanitizer=thread"});
    CHECK(sysroot_rustflags({}, nullopt).size() == 5);
}

TEST_CASE ("sanitizer runtime names", "[sysrootbuilder]")
{
    CHECK(sanitizer_runtime_short_name("address") == "asan");
    CHECK(sanitizer_runtime_short_name("hwaddress") == "hwasan");
    CHECK(sanitizer_runtime_short_name("leak") == "lsan");
    CHECK(sanitizer_runtime_short_name("memory") == "msan");
    CHECK(sanitizer_runtime_short_name("thread") == "tsan");
    CHECK(sanitizer_runtime_short_name("kcfi") == "kcfi");
}

TEST_CASE ("build output must be flat", "[sysrootbuilder]")
{
    const auto& fs = real_filesystem;
    const auto dir = Test::make_clean_directory(fs, "flat-output");
    std::error_code ec;
    fs.write_contents(dir / "libcore.rlib", "core", ec);
    CHECK_EC(ec);
    auto entries = fs.get_files_non_recursive(dir, CAREFUL_LINE_INFO);
    CHECK(find_first_directory(fs, entries) == nullptr);

    fs.create_directories(dir / "incremental", ec);
    CHECK_EC(ec);
    entries = fs.get_files_non_recursive(dir, CAREFUL_LINE_INFO);
    auto directory = find_first_directory(fs, entries);
    REQUIRE(directory != nullptr);
    CHECK(directory->filename() == "incremental");
}

TEST_CASE ("artifacts are copied verbatim", "[sysrootbuilder]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::make_clean_directory(fs, "build-artifacts");
    const auto source_tree = Test::make_fake_library_source(fs, root / "rust");
    auto request = make_request(root, source_tree);

    MockToolchainProvider provider;
    provider.artifacts = {{"libstd-cargo-careful.rlib", std::string("std\0\x01\xff", 6)},
                          {"libstd-cargo-careful.so", "shared"}};

    // stale files from a previous build are removed
    const SysrootLayout layout(request.sysroot_dir, request.target);
    std::error_code ec;
    fs.write_contents_and_dirs(layout.artifact_dir() / "stale.rlib", "stale", ec);
    CHECK_EC(ec);

    CHECK(build_sysroot(fs, provider, request).value_or_exit(CAREFUL_LINE_INFO) == request.sysroot_dir);
    CHECK(provider.compilations == 1);
    CHECK(fs.read_contents(layout.artifact_dir() / "libstd-cargo-careful.rlib", CAREFUL_LINE_INFO) ==
          std::string("std\0\x01\xff", 6));
    CHECK(fs.read_contents(layout.artifact_dir() / "libstd-cargo-careful.so", CAREFUL_LINE_INFO) == "shared");
    CHECK(!fs.exists(layout.artifact_dir() / "stale.rlib", IgnoreErrors{}));

    // the marker is the cache's business
    CHECK(!fs.exists(layout.marker_file(), IgnoreErrors{}));

    CHECK(StringView{provider.last_manifest}.contains(toml_basic_string(source_tree / "std")));
    const auto& environment = provider.last_build_environment;
    REQUIRE(environment.value_of("__CARGO_DEFAULT_LIB_METADATA") != nullptr);
    CHECK(*environment.value_of("__CARGO_DEFAULT_LIB_METADATA") == "cargo-careful");
    REQUIRE(environment.value_of("CARGO_ENCODED_RUSTFLAGS") != nullptr);
    CHECK(*environment.value_of("CARGO_ENCODED_RUSTFLAGS") ==
          "-Cdebug-assertions=on\x1f-Zextra-const-ub-checks\x1f-Zstrict-init-checks\x1f--cfg\x1f"
          "careful");

    // the synthetic project is cleaned up
    const auto* target_dir = environment.value_of("CARGO_TARGET_DIR");
    REQUIRE(target_dir != nullptr);
    CHECK(!fs.exists(Path(*target_dir), IgnoreErrors{}));
}

TEST_CASE ("missing lockfile", "[sysrootbuilder]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::make_clean_directory(fs, "build-no-lockfile");
    const auto source_tree = Test::make_fake_library_source(fs, root / "rust");
    std::error_code ec;
    fs.remove_all(root / "rust" / "Cargo.lock", ec);
    CHECK_EC(ec);

    MockToolchainProvider provider;
    auto built = build_sysroot(fs, provider, make_request(root, source_tree));
    REQUIRE(!built.has_value());
    CHECK(built.error().kind == ErrorKind::LockfileMissing);
    CHECK(provider.compilations == 0);
}

TEST_CASE ("sanitizer runtime on apple targets", "[sysrootbuilder]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::make_clean_directory(fs, "build-apple-runtime");
    const auto source_tree = Test::make_fake_library_source(fs, root / "rust");
    auto request = make_request(root, source_tree);
    request.target = "aarch64-apple-darwin";
    request.variant = std::string("thread");

    MockToolchainProvider provider;
    provider.libdir = root / "target-libdir";

    auto missing = build_sysroot(fs, provider, request);
    REQUIRE(!missing.has_value());
    CHECK(missing.error().kind == ErrorKind::CopyFailed);

    std::error_code ec;
    fs.write_contents_and_dirs(provider.libdir / "librustc-nightly_rt.tsan.dylib", "runtime", ec);
    CHECK_EC(ec);
    build_sysroot(fs, provider, request).value_or_exit(CAREFUL_LINE_INFO);
    const SysrootLayout layout(request.sysroot_dir, request.target);
    CHECK(fs.read_contents(layout.artifact_dir() / "librustc-nightly_rt.tsan.dylib", CAREFUL_LINE_INFO) ==
          "runtime");
}
