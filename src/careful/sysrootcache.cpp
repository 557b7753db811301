#include <careful/base/files.h>
#include <careful/base/hash.h>
#include <careful/base/message_sinks.h>
#include <careful/base/strings.h>
#include <careful/base/system.debug.h>

#include <careful/contractual-constants.h>
#include <careful/errors.h>
#include <careful/sysrootbuilder.h>
#include <careful/sysrootcache.h>
#include <careful/toolchain.h>

namespace careful
{
    std::string CacheKey::to_string() const { return fmt::format("{}", value); }
    void CacheKey::to_string(std::string& out) const { fmt::format_to(std::back_inserter(out), "{}", value); }

    CacheKey current_key(const ToolchainIdentity& toolchain,
                         const Path& source_tree,
                         const Optional<std::string>& variant)
    {
        Hash::Fnv1a64Hasher hasher;
        hasher.add_field(source_tree);
        if (auto commit = toolchain.commit.get())
        {
            hasher.add_field(*commit);
        }
        else
        {
            hasher.add_field(UnknownCommitSentinel);
        }

        if (auto sanitizer = variant.get())
        {
            hasher.add_field(*sanitizer);
        }
        else
        {
            hasher.add_field(StringView{});
        }

        return CacheKey{hasher.get_hash()};
    }

    Path sysroot_dir_for(const Path& cache_root, const Optional<std::string>& variant)
    {
        if (auto sanitizer = variant.get())
        {
            return cache_root / *sanitizer;
        }

        return cache_root;
    }

    SysrootLayout::SysrootLayout(Path sysroot_dir, std::string target)
        : m_sysroot_dir(std::move(sysroot_dir)), m_target(std::move(target))
    {
    }

    Path SysrootLayout::rustlib_target_dir() const { return m_sysroot_dir / "lib" / "rustlib" / m_target; }
    Path SysrootLayout::artifact_dir() const { return rustlib_target_dir() / "lib"; }
    Path SysrootLayout::marker_file() const { return rustlib_target_dir() / FileCacheMarker; }
    Path SysrootLayout::lock_file() const { return m_sysroot_dir / FileCacheLock; }

    bool is_fresh(const ReadOnlyFilesystem& fs, const SysrootLayout& layout, const CacheKey& key)
    {
        std::error_code ec;
        const auto marker = layout.marker_file();
        const auto contents = fs.read_contents(marker, ec);
        if (ec)
        {
            Debug::println("no usable cache marker at ", marker, ": ", ec.message());
            return false;
        }

        const auto recorded = Strings::strto<unsigned long long>(Strings::trim(contents));
        if (auto value = recorded.get())
        {
            return *value == key.value;
        }

        Debug::println("ignoring malformed cache marker at ", marker);
        return false;
    }

    ExpectedC<Unit> record(const Filesystem& fs, const SysrootLayout& layout, const CacheKey& key)
    {
        std::error_code ec;
        const auto marker = layout.marker_file();
        fs.write_contents_and_dirs(marker, key.to_string(), ec);
        if (ec)
        {
            return make_error(ErrorKind::CopyFailed,
                              msg::format(msgFailedToWriteCacheMarker, msg::path = marker)
                                  .append_raw('\n')
                                  .append(format_filesystem_call_error(ec, "write_contents_and_dirs", {marker})));
        }

        return Unit{};
    }

    ExpectedC<Path> ensure(const Filesystem& fs,
                           const ToolchainProvider& provider,
                           const SysrootBuildRequest& request,
                           MessageSink& status_sink)
    {
        const SysrootLayout layout(request.sysroot_dir, request.target);
        const bool automatic = request.output == BuildOutput::Quiet;

        std::error_code ec;
        fs.create_directories(layout.sysroot_dir(), ec);
        if (ec)
        {
            return make_error(
                ErrorKind::CopyFailed,
                msg::format(msgFailedToCreateDirectory, msg::path = layout.sysroot_dir())
                    .append_raw('\n')
                    .append(format_filesystem_call_error(ec, "create_directories", {layout.sysroot_dir()})));
        }

        const auto lock_file = layout.lock_file();
        const auto lock = fs.take_exclusive_file_lock(lock_file, status_sink, ec);
        if (ec)
        {
            return make_error(ErrorKind::CopyFailed,
                              format_filesystem_call_error(ec, "take_exclusive_file_lock", {lock_file}));
        }

        if (auto sanitizer = request.variant.get())
        {
            status_sink.print(
                msgPreparingSysrootWithSanitizer, msg::target = request.target, msg::sanitizer = *sanitizer);
        }
        else
        {
            status_sink.print(msgPreparingSysroot, msg::target = request.target);
        }

        if (!automatic)
        {
            status_sink.print(Color::none, "\n");
        }

        const auto key = current_key(request.toolchain, request.source_tree, request.variant);
        if (is_fresh(fs, layout, key))
        {
            Debug::println("sysroot in ", layout.sysroot_dir(), " is up to date (", key, ')');
        }
        else
        {
            auto built = build_sysroot(fs, provider, request);
            if (!built)
            {
                if (automatic)
                {
                    status_sink.print(Color::none, "\n");
                }

                return built;
            }

            auto recorded = record(fs, layout, key);
            if (!recorded)
            {
                return std::move(recorded).error();
            }
        }

        if (automatic)
        {
            status_sink.println(msgSysrootBuildDone);
        }
        else
        {
            status_sink.println(msgSysrootAvailable, msg::path = layout.sysroot_dir());
        }

        return layout.sysroot_dir();
    }
}
