#include <careful-test/util.h>

#include <careful/base/system.h>

namespace careful::Test
{
    static Path internal_base_temporary_directory()
    {
#if defined(_WIN32)
        return Path(careful::get_environment_variable("TEMP").value_or_exit(CAREFUL_LINE_INFO)) / "careful-test";
#else
        return "/tmp/careful-test";
#endif
    }

    const Path& base_temporary_directory() noexcept
    {
        const static Path BASE_TEMPORARY_DIRECTORY = internal_base_temporary_directory();
        return BASE_TEMPORARY_DIRECTORY;
    }

    Path make_clean_directory(const Filesystem& fs, StringView name)
    {
        auto dir = base_temporary_directory() / name;
        std::error_code ec;
        fs.remove_all(dir, ec);
        CHECK_EC(ec);
        fs.create_directories(dir, ec);
        CHECK_EC(ec);
        return dir;
    }

    Path make_fake_library_source(const Filesystem& fs, const Path& root)
    {
        const auto library = root / "library";
        std::error_code ec;
        fs.write_contents_and_dirs(library / "std" / "src" / "lib.rs", "#![no_std]\n", ec);
        CHECK_EC(ec);
        fs.write_contents(root / "Cargo.lock", "# This file is automatically @generated by Cargo.\nversion = 3\n", ec);
        CHECK_EC(ec);
        return library;
    }
}
