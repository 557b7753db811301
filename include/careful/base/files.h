#pragma once

#include <careful/base/fwd/files.h>
#include <careful/base/fwd/message_sinks.h>

#include <careful/base/expected.h>
#include <careful/base/lineinfo.h>
#include <careful/base/messages.h>
#include <careful/base/path.h>
#include <careful/base/stringview.h>

#include <initializer_list>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace careful
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);

    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);

    struct IgnoreErrors
    {
        operator std::error_code&();

    private:
        std::error_code ec;
    };

    struct IExclusiveFileLock
    {
        virtual ~IExclusiveFileLock() = default;
    };

    struct ReadOnlyFilesystem
    {
        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const = 0;
        std::string read_contents(const Path& file_path, LineInfo li) const;

        // Returns every entry of `dir`, files and directories alike, without recursing.
        virtual std::vector<Path> get_files_non_recursive(const Path& dir, std::error_code& ec) const = 0;
        std::vector<Path> get_files_non_recursive(const Path& dir, LineInfo li) const;

        virtual bool exists(const Path& target, std::error_code& ec) const = 0;

        virtual bool is_directory(const Path& target) const = 0;

        virtual Path absolute(const Path& target, std::error_code& ec) const = 0;

        // absolute + lexically_normal, resolving symlinks when the target exists
        virtual Path almost_canonical(const Path& target, std::error_code& ec) const = 0;

    protected:
        ~ReadOnlyFilesystem() = default;
    };

    struct Filesystem : ReadOnlyFilesystem
    {
        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;

        virtual void write_contents_and_dirs(const Path& file_path, StringView data, std::error_code& ec) const = 0;

        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;

        virtual void remove_all(const Path& base, std::error_code& ec) const = 0;

        virtual bool copy_file(const Path& source,
                               const Path& destination,
                               CopyOptions options,
                               std::error_code& ec) const = 0;

        // Creates a new, uniquely named directory under the system temporary directory.
        virtual Path create_temporary_directory(StringView prefix, std::error_code& ec) const = 0;

        // If `lockfile` does not exist it is created, but its parent directories are not.
        // Waits forever for the lock, printing a status line once if the lock is contended.
        virtual std::unique_ptr<IExclusiveFileLock> take_exclusive_file_lock(const Path& lockfile,
                                                                             MessageSink& status_sink,
                                                                             std::error_code& ec) const = 0;

    protected:
        ~Filesystem() = default;
    };

    extern const Filesystem& real_filesystem;

    // Owns a directory for the lifetime of the guard and removes it recursively on destruction.
    struct TemporaryDirectory
    {
        TemporaryDirectory(const Filesystem& fs, Path path) noexcept;
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        ~TemporaryDirectory();

        const Path& path() const noexcept { return m_path; }

    private:
        const Filesystem& m_fs;
        Path m_path;
    };
}
