#include <careful-test/mocktoolchainprovider.h>
#include <careful-test/util.h>

#include <careful/base/files.h>

#include <careful/errors.h>
#include <careful/sysrootbuilder.h>
#include <careful/sysrootcache.h>
#include <careful/toolchain.h>

#include <chrono>
#include <mutex>
#include <thread>

using namespace careful;
using Test::MockToolchainProvider;

namespace
{
    ToolchainIdentity nightly(StringView commit)
    {
        return ToolchainIdentity{"x86_64-unknown-linux-gnu", commit.to_string()};
    }

    struct CacheFixture
    {
        CacheFixture(StringView name)
            : root(Test::make_clean_directory(real_filesystem, name))
            , source_tree(Test::make_fake_library_source(real_filesystem, root / "rust"))
        {
            request.target = "x86_64-unknown-linux-gnu";
            request.toolchain = provider.toolchain;
            request.source_tree = source_tree;
            request.sysroot_dir = root / "cache";
        }

        Path root;
        Path source_tree;
        MockToolchainProvider provider;
        SysrootBuildRequest request;
        Test::CapturingMessageSink status;
    };

    // Capturing sink that can be read while another thread prints to it.
    struct SharedCapturingMessageSink final : MessageSink
    {
        void print(Color, StringView sv) override
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_output.append(sv.data(), sv.size());
        }
        using MessageSink::print;

        std::string output() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_output;
        }

    private:
        mutable std::mutex m_mutex;
        std::string m_output;
    };

    // Whether the lock on `lock_file` can be taken without waiting; the lock is dropped again before returning.
    bool lock_is_free(const Filesystem& fs, const Path& lock_file)
    {
        Test::CapturingMessageSink sink;
        std::error_code ec;
        auto lock = fs.take_exclusive_file_lock(lock_file, sink, ec);
        CHECK_EC(ec);
        return lock && sink.output.empty();
    }
}

TEST_CASE ("cache key fields are separated", "[sysrootcache]")
{
    const Path source("/src/library");
    const auto baseline = current_key(nightly("abc"), source, nullopt);
    CHECK(baseline == current_key(nightly("abc"), source, nullopt));
    CHECK(baseline != current_key(nightly("abd"), source, nullopt));
    CHECK(baseline != current_key(nightly("abc"), source, std::string("address")));
    CHECK(current_key(nightly("abc"), source, std::string("address")) !=
          current_key(nightly("abc"), source, std::string("thread")));

    // moving bytes between fields must change the key
    CHECK(current_key(nightly("bc"), "/src/librarya", nullopt) != baseline);

    ToolchainIdentity unknown{"x86_64-unknown-linux-gnu", nullopt};
    CHECK(current_key(unknown, source, nullopt) != baseline);
    CHECK(current_key(unknown, source, nullopt) == current_key(unknown, source, nullopt));
}

TEST_CASE ("sysroot directory per variant", "[sysrootcache]")
{
    CHECK(sysroot_dir_for("/cache", nullopt) == Path("/cache"));
    CHECK(sysroot_dir_for("/cache", std::string("address")) == Path("/cache") / "address");

    SysrootLayout layout(Path("/cache") / "address", "x86_64-unknown-linux-gnu");
    CHECK(layout.artifact_dir() ==
          Path("/cache") / "address" / "lib" / "rustlib" / "x86_64-unknown-linux-gnu" / "lib");
    CHECK(layout.marker_file().filename() == ".cargo-careful-hash");
    CHECK(layout.lock_file() == Path("/cache") / "address" / ".cargo-careful.lock");
}

TEST_CASE ("marker freshness", "[sysrootcache]")
{
    const auto& fs = real_filesystem;
    const auto dir = Test::make_clean_directory(fs, "marker-freshness");
    const SysrootLayout layout(dir, "x86_64-unknown-linux-gnu");
    const CacheKey key{12345678901234567890ull};

    CHECK(!is_fresh(fs, layout, key));

    REQUIRE(record(fs, layout, key).has_value());
    CHECK(fs.read_contents(layout.marker_file(), CAREFUL_LINE_INFO) == "12345678901234567890");
    CHECK(is_fresh(fs, layout, key));
    CHECK(!is_fresh(fs, layout, CacheKey{42}));

    std::error_code ec;
    fs.write_contents(layout.marker_file(), "  12345678901234567890\n", ec);
    CHECK_EC(ec);
    CHECK(is_fresh(fs, layout, key));

    fs.write_contents(layout.marker_file(), "not a number", ec);
    CHECK_EC(ec);
    CHECK(!is_fresh(fs, layout, key));
}

TEST_CASE ("ensure builds once", "[sysrootcache]")
{
    CacheFixture fixture("ensure-idempotent");
    const auto& fs = real_filesystem;

    auto first = ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(first == fixture.request.sysroot_dir);
    CHECK(fixture.provider.compilations == 1);
    CHECK(fixture.status.output == "Preparing a careful sysroot (target: x86_64-unknown-linux-gnu)... done\n");

    auto second = ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(second == first);
    CHECK(fixture.provider.compilations == 1);

    const SysrootLayout layout(fixture.request.sysroot_dir, fixture.request.target);
    CHECK(fs.read_contents(layout.marker_file(), CAREFUL_LINE_INFO) ==
          current_key(fixture.request.toolchain, fixture.source_tree, nullopt).to_string());
    CHECK(fs.exists(layout.lock_file(), IgnoreErrors{}));

    // a new toolchain invalidates the cache
    fixture.request.toolchain = nightly("fedcba9876543210");
    ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(fixture.provider.compilations == 2);
}

TEST_CASE ("variants do not share artifacts", "[sysrootcache]")
{
    CacheFixture fixture("ensure-variants");
    const auto& fs = real_filesystem;
    const auto cache_root = fixture.request.sysroot_dir;

    ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(fixture.provider.compilations == 1);

    fixture.request.variant = std::string("address");
    fixture.request.sysroot_dir = sysroot_dir_for(cache_root, fixture.request.variant);
    fixture.status.output.clear();
    auto sanitized = ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(sanitized == cache_root / "address");
    CHECK(fixture.provider.compilations == 2);
    CHECK(fixture.status.output ==
          "Preparing a careful sysroot (target: x86_64-unknown-linux-gnu, sanitizer: address)... done\n");

    const auto* encoded = fixture.provider.last_build_environment.value_of("CARGO_ENCODED_RUSTFLAGS");
    REQUIRE(encoded != nullptr);
    CHECK(StringView{*encoded}.contains("\x1f-Zsanitizer=address"));

    // both variants stay fresh side by side
    fixture.request.variant = nullopt;
    fixture.request.sysroot_dir = cache_root;
    ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(fixture.provider.compilations == 2);
}

TEST_CASE ("failed builds leave no marker", "[sysrootcache]")
{
    CacheFixture fixture("ensure-failure");
    const auto& fs = real_filesystem;
    const SysrootLayout layout(fixture.request.sysroot_dir, fixture.request.target);

    fixture.provider.fail_build = true;
    auto failed = ensure(fs, fixture.provider, fixture.request, fixture.status);
    REQUIRE(!failed.has_value());
    CHECK(failed.error().kind == ErrorKind::BuildFailed);
    CHECK(StringView{failed.error().message.data()}.contains("run `cargo careful setup` to see what went wrong"));
    CHECK(StringView{failed.error().message.data()}.contains("can't find crate for `core`"));
    CHECK(fixture.status.output == "Preparing a careful sysroot (target: x86_64-unknown-linux-gnu)... \n");
    CHECK(!fs.exists(layout.marker_file(), IgnoreErrors{}));

    fixture.provider.fail_build = false;
    ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(fixture.provider.compilations == 2);
    CHECK(is_fresh(fs, layout, current_key(fixture.request.toolchain, fixture.source_tree, nullopt)));
}

TEST_CASE ("setup output", "[sysrootcache]")
{
    CacheFixture fixture("ensure-setup");
    fixture.request.output = BuildOutput::Live;
    const auto sysroot =
        ensure(real_filesystem, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
    CHECK(fixture.status.output == fmt::format("Preparing a careful sysroot (target: x86_64-unknown-linux-gnu)... \n"
                                               "A sysroot is now available in `{}`.\n",
                                               sysroot));
}

TEST_CASE ("ensure waits for a contended sysroot lock", "[sysrootcache]")
{
    CacheFixture fixture("ensure-contended");
    const auto& fs = real_filesystem;
    const SysrootLayout layout(fixture.request.sysroot_dir, fixture.request.target);

    std::error_code ec;
    fs.create_directories(layout.sysroot_dir(), ec);
    CHECK_EC(ec);
    Test::CapturingMessageSink holder_status;
    auto held = fs.take_exclusive_file_lock(layout.lock_file(), holder_status, ec);
    CHECK_EC(ec);
    REQUIRE(held);
    CHECK(holder_status.output.empty());

    SharedCapturingMessageSink waiter_status;
    Optional<ExpectedC<Path>> result;
    std::thread waiter([&] { result.emplace(ensure(fs, fixture.provider, fixture.request, waiter_status)); });

    const auto waiting_line = fmt::format("waiting to take filesystem lock on {}...\n", layout.lock_file());
    bool waited = false;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
    while (!waited && std::chrono::steady_clock::now() < deadline)
    {
        waited = waiter_status.output() == waiting_line;
        if (!waited)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    const int compilations_while_held = waited ? fixture.provider.compilations : -1;
    held.reset();
    waiter.join();

    CHECK(waited);
    CHECK(compilations_while_held == 0);
    CHECK(fixture.provider.compilations == 1);
    REQUIRE(result.has_value());
    REQUIRE(result.get()->has_value());
    CHECK(waiter_status.output() ==
          waiting_line + "Preparing a careful sysroot (target: x86_64-unknown-linux-gnu)... done\n");
    CHECK(lock_is_free(fs, layout.lock_file()));
}

TEST_CASE ("ensure releases the sysroot lock", "[sysrootcache]")
{
    CacheFixture fixture("ensure-releases-lock");
    const auto& fs = real_filesystem;
    const SysrootLayout layout(fixture.request.sysroot_dir, fixture.request.target);

    SECTION ("after a failed build")
    {
        fixture.provider.fail_build = true;
        REQUIRE(!ensure(fs, fixture.provider, fixture.request, fixture.status).has_value());
        CHECK(lock_is_free(fs, layout.lock_file()));
    }

    SECTION ("after a build and after a cache hit")
    {
        ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
        CHECK(lock_is_free(fs, layout.lock_file()));
        ensure(fs, fixture.provider, fixture.request, fixture.status).value_or_exit(CAREFUL_LINE_INFO);
        CHECK(fixture.provider.compilations == 1);
        CHECK(lock_is_free(fs, layout.lock_file()));
    }
}
