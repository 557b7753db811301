#include <careful-test/util.h>

#include <careful/base/files.h>

#include <string>

using namespace careful;

TEST_CASE ("write_contents reports why the file could not be opened", "[files]")
{
    const auto& fs = real_filesystem;
    const auto dir = Test::make_clean_directory(fs, "files-write-errors");

    std::error_code ec;
    fs.write_contents(dir / "missing" / "marker", "1", ec);
    CHECK(ec == std::errc::no_such_file_or_directory);

#if !defined(_WIN32)
    fs.write_contents(dir, "1", ec);
    CHECK(ec == std::errc::is_a_directory);
#endif

    fs.write_contents_and_dirs(dir / "missing" / "marker", "1", ec);
    CHECK_EC(ec);
    CHECK(fs.read_contents(dir / "missing" / "marker", CAREFUL_LINE_INFO) == "1");
}

TEST_CASE ("read_contents", "[files]")
{
    const auto& fs = real_filesystem;
    const auto dir = Test::make_clean_directory(fs, "files-read");

    std::error_code ec;
    CHECK(fs.read_contents(dir / "absent", ec).empty());
    CHECK(ec == std::errc::no_such_file_or_directory);

    // larger than one read buffer, with embedded NULs
    std::string rlib(10000, 'x');
    rlib[0] = '\0';
    rlib[4096] = '\0';
    rlib.back() = '\n';
    fs.write_contents(dir / "libcore.rlib", rlib, ec);
    CHECK_EC(ec);
    CHECK(fs.read_contents(dir / "libcore.rlib", ec) == rlib);
    CHECK_EC(ec);

    fs.write_contents(dir / "libcore.rlib", "", ec);
    CHECK_EC(ec);
    CHECK(fs.read_contents(dir / "libcore.rlib", ec).empty());
    CHECK_EC(ec);
}
