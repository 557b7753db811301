#include <careful-test/util.h>

#include <careful/base/path.h>

using namespace careful;

TEST_CASE ("path concatenation", "[path]")
{
#if defined(_WIN32)
    CHECK((Path("C:\\cache") / "address").native() == "C:\\cache\\address");
#else
    CHECK((Path("/cache") / "address").native() == "/cache/address");
    CHECK((Path("/cache/") / "address").native() == "/cache/address");
    CHECK((Path("/cache") / "/elsewhere").native() == "/elsewhere");
    CHECK((Path("relative") / "lib" / "rustlib").native() == "relative/lib/rustlib");
#endif
}

TEST_CASE ("path decomposition", "[path]")
{
    const Path lockfile("/home/u/.rustup/toolchains/nightly/lib/rustlib/src/rust/Cargo.lock");
    CHECK(lockfile.filename() == "Cargo.lock");
    CHECK(lockfile.extension() == ".lock");
    CHECK(lockfile.stem() == "Cargo");
    CHECK(lockfile.parent_path() == "/home/u/.rustup/toolchains/nightly/lib/rustlib/src/rust");

    Path library("/src/rust/library");
    CHECK(Path(library.parent_path()) / "Cargo.lock" == Path("/src/rust/Cargo.lock"));
    CHECK(library.make_parent_path());
    CHECK(library.native() == "/src/rust");

    Path root("/");
    CHECK(!root.make_parent_path());
}

TEST_CASE ("absolute paths", "[path]")
{
#if defined(_WIN32)
    CHECK(Path("C:\\x").is_absolute());
    CHECK(!Path("\\x").is_absolute());
#else
    CHECK(Path("/x").is_absolute());
#endif
    CHECK(Path("x/y").is_relative());
    CHECK(Path("").is_relative());
}
