#include <careful/base/checks.h>
#include <careful/base/files.h>
#include <careful/base/message_sinks.h>
#include <careful/base/strings.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.h>

#include <errno.h>
#include <stdio.h>

#include <chrono>
#include <filesystem>
#include <iterator>
#include <thread>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#else
#include <fcntl.h>
#include <stdlib.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace stdfs = std::filesystem;

namespace
{
    using namespace careful;

    stdfs::path to_stdfs_path(const Path& p) { return stdfs::path(p.native()); }

    Path from_stdfs_path(const stdfs::path& p) { return Path(p.string()); }

    enum class OpenMode
    {
        Read,
        Write,
    };

    struct FilePointer
    {
        FilePointer(const Path& path, OpenMode mode, std::error_code& ec) noexcept
        {
#if defined(_WIN32)
            ec.assign(::_wfopen_s(&m_fs, to_stdfs_path(path).c_str(), mode == OpenMode::Write ? L"wb" : L"rb"),
                      std::generic_category());
#else  // ^^^ _WIN32 / !_WIN32 vvv
            m_fs = ::fopen(path.c_str(), mode == OpenMode::Write ? "wb" : "rb");
            if (m_fs)
            {
                ec.clear();
            }
            else
            {
                ec.assign(errno, std::generic_category());
            }
#endif // ^^^ !_WIN32
        }

        FilePointer(const FilePointer&) = delete;
        FilePointer& operator=(const FilePointer&) = delete;

        void write(StringView data, std::error_code& ec) const noexcept
        {
            if (::fwrite(data.data(), 1, data.size(), m_fs) != data.size())
            {
                ec.assign(errno, std::generic_category());
            }
        }

        std::string read_to_end(std::error_code& ec) const
        {
            std::string output;
            char buffer[4096];
            size_t count;
            while ((count = ::fread(buffer, 1, sizeof(buffer), m_fs)) != 0)
            {
                output.append(buffer, count);
            }

            if (::ferror(m_fs))
            {
                ec.assign(errno, std::generic_category());
                output.clear();
            }

            return output;
        }

        // Flushes and closes; a failed flush is reported in `ec`.
        void close(std::error_code& ec) noexcept
        {
            if (m_fs && ::fclose(std::exchange(m_fs, nullptr)) != 0)
            {
                ec.assign(errno, std::generic_category());
            }
        }

        ~FilePointer()
        {
            if (m_fs)
            {
                ::fclose(m_fs);
            }
        }

    private:
        FILE* m_fs = nullptr;
    };

#if !defined(_WIN32)
    struct PosixFd
    {
        PosixFd() = default;

        PosixFd(const char* path, int oflag, mode_t mode, std::error_code& ec) noexcept : fd(::open(path, oflag, mode))
        {
            if (fd < 0)
            {
                ec.assign(errno, std::generic_category());
            }
            else
            {
                ec.clear();
            }
        }

        PosixFd(const PosixFd&) = delete;
        PosixFd& operator=(const PosixFd&) = delete;

        int flock(int operation) const noexcept { return ::flock(fd, operation); }

        explicit operator bool() const noexcept { return fd >= 0; }

        ~PosixFd()
        {
            if (fd >= 0)
            {
                Checks::check_exit(CAREFUL_LINE_INFO, ::close(fd) == 0);
            }
        }

    private:
        int fd = -1;
    };
#endif

    struct ExclusiveFileLock final : IExclusiveFileLock
    {
#if defined(_WIN32)
        HANDLE handle = INVALID_HANDLE_VALUE;
        std::string native;
        ExclusiveFileLock(const Path& path, std::error_code& ec) : native(path.native()) { ec.clear(); }

        bool lock_attempt(std::error_code& ec)
        {
            Checks::check_exit(CAREFUL_LINE_INFO, handle == INVALID_HANDLE_VALUE);
            handle = CreateFileA(native.c_str(),
                                 GENERIC_READ,
                                 0 /* no sharing */,
                                 nullptr /* no security attributes */,
                                 OPEN_ALWAYS,
                                 FILE_ATTRIBUTE_NORMAL,
                                 nullptr /* no template file */);
            if (handle != INVALID_HANDLE_VALUE)
            {
                ec.clear();
                return true;
            }

            const auto err = GetLastError();
            if (err == ERROR_SHARING_VIOLATION)
            {
                ec.clear();
                return false;
            }

            ec.assign(err, std::system_category());
            return false;
        }

        ~ExclusiveFileLock() override
        {
            if (handle != INVALID_HANDLE_VALUE)
            {
                Checks::check_exit(CAREFUL_LINE_INFO, CloseHandle(handle) != 0);
            }
        }
#else
        PosixFd fd;
        bool locked = false;
        ExclusiveFileLock(const Path& path, std::error_code& ec)
            : fd(path.c_str(), O_RDWR | O_CREAT, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH, ec)
        {
        }

        bool lock_attempt(std::error_code& ec)
        {
            if (fd.flock(LOCK_EX | LOCK_NB) == 0)
            {
                ec.clear();
                locked = true;
                return true;
            }

            if (errno == EWOULDBLOCK)
            {
                ec.clear();
                return false;
            }

            ec.assign(errno, std::generic_category());
            return false;
        }

        ~ExclusiveFileLock() override
        {
            if (locked)
            {
                Checks::check_exit(CAREFUL_LINE_INFO, fd && fd.flock(LOCK_UN) == 0);
            }
        }
#endif
    };

    struct RealFilesystem final : Filesystem
    {
        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            FilePointer file(file_path, OpenMode::Read, ec);
            if (ec)
            {
                Debug::print("Failed to open: ", file_path, '\n');
                return std::string();
            }

            return file.read_to_end(ec);
        }

        virtual std::vector<Path> get_files_non_recursive(const Path& dir, std::error_code& ec) const override
        {
            std::vector<Path> ret;
            stdfs::directory_iterator b(to_stdfs_path(dir), ec), e{};
            if (ec)
            {
                return ret;
            }

            for (; b != e; b.increment(ec))
            {
                if (ec)
                {
                    return ret;
                }

                ret.push_back(from_stdfs_path(b->path()));
            }

            return ret;
        }

        virtual bool exists(const Path& target, std::error_code& ec) const override
        {
            return stdfs::exists(to_stdfs_path(target), ec);
        }

        virtual bool is_directory(const Path& target) const override
        {
            std::error_code ec;
            return stdfs::is_directory(to_stdfs_path(target), ec);
        }

        virtual Path absolute(const Path& target, std::error_code& ec) const override
        {
            return from_stdfs_path(stdfs::absolute(to_stdfs_path(target), ec));
        }

        virtual Path almost_canonical(const Path& target, std::error_code& ec) const override
        {
            const auto native = to_stdfs_path(target);
            if (stdfs::exists(native, ec))
            {
                return from_stdfs_path(stdfs::canonical(native, ec));
            }

            if (ec)
            {
                return target;
            }

            auto result = stdfs::absolute(native, ec);
            return from_stdfs_path(result.lexically_normal());
        }

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            FilePointer file(file_path, OpenMode::Write, ec);
            if (ec)
            {
                return;
            }

            file.write(data, ec);
            if (ec)
            {
                return;
            }

            file.close(ec);
        }

        virtual void write_contents_and_dirs(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            write_contents(file_path, data, ec);
            if (ec)
            {
                create_directories(Path(file_path.parent_path()), ec);
                if (ec)
                {
                    return;
                }

                write_contents(file_path, data, ec);
            }
        }

        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            return stdfs::create_directories(to_stdfs_path(new_directory), ec);
        }

        virtual void remove_all(const Path& base, std::error_code& ec) const override
        {
            stdfs::remove_all(to_stdfs_path(base), ec);
        }

        virtual bool copy_file(const Path& source,
                               const Path& destination,
                               CopyOptions options,
                               std::error_code& ec) const override
        {
            auto stdfs_options = stdfs::copy_options::none;
            if (options == CopyOptions::overwrite_existing)
            {
                stdfs_options = stdfs::copy_options::overwrite_existing;
            }

            return stdfs::copy_file(to_stdfs_path(source), to_stdfs_path(destination), stdfs_options, ec);
        }

        virtual Path create_temporary_directory(StringView prefix, std::error_code& ec) const override
        {
#if defined(_WIN32)
            const auto base = stdfs::temp_directory_path(ec);
            if (ec)
            {
                return Path();
            }

            for (unsigned int attempt = 0; attempt < 100; ++attempt)
            {
                auto candidate =
                    base / fmt::format("{}-{}-{}", prefix, ::GetCurrentProcessId(), ::GetTickCount64() + attempt);
                if (stdfs::create_directory(candidate, ec))
                {
                    return from_stdfs_path(candidate);
                }

                if (ec)
                {
                    return Path();
                }
            }

            ec = std::make_error_code(std::errc::file_exists);
            return Path();
#else
            Path templ(get_environment_variable("TMPDIR").value_or(std::string("/tmp")));
            templ /= prefix;
            templ += "-XXXXXX";
            std::string buffer = std::move(templ).native();
            if (::mkdtemp(buffer.data()) == nullptr)
            {
                ec.assign(errno, std::generic_category());
                return Path();
            }

            ec.clear();
            return Path(std::move(buffer));
#endif
        }

        virtual std::unique_ptr<IExclusiveFileLock> take_exclusive_file_lock(const Path& lockfile,
                                                                             MessageSink& status_sink,
                                                                             std::error_code& ec) const override
        {
            auto result = std::make_unique<ExclusiveFileLock>(lockfile, ec);
            if (!ec && !result->lock_attempt(ec) && !ec)
            {
                status_sink.println(msgWaitingToTakeFilesystemLock, msg::path = lockfile);
                do
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1000));
                } while (!result->lock_attempt(ec) && !ec);
            }

            return result;
        }
    };

    const RealFilesystem real_filesystem_instance{};
}

namespace careful
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        auto arguments = args.size() == 0 ? "()" : "(\"" + Strings::join("\", \"", args.begin(), args.end()) + "\")";
        return LocalizedString::from_raw(Strings::concat(call_name, arguments, ": ", ec.message()));
    }

    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        Checks::msg_exit_with_message(li, format_filesystem_call_error(ec, call_name, args));
    }

    IgnoreErrors::operator std::error_code&() { return ec; }

    std::string ReadOnlyFilesystem::read_contents(const Path& file_path, LineInfo li) const
    {
        std::error_code ec;
        auto maybe_contents = this->read_contents(file_path, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }

        return maybe_contents;
    }

    std::vector<Path> ReadOnlyFilesystem::get_files_non_recursive(const Path& dir, LineInfo li) const
    {
        std::error_code ec;
        auto maybe_files = this->get_files_non_recursive(dir, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {dir});
        }

        return maybe_files;
    }

    const Filesystem& real_filesystem = real_filesystem_instance;

    TemporaryDirectory::TemporaryDirectory(const Filesystem& fs, Path path) noexcept
        : m_fs(fs), m_path(std::move(path))
    {
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        m_fs.remove_all(m_path, ec);
        if (ec)
        {
            Debug::println(format_filesystem_call_error(ec, "remove_all", {m_path}));
        }
    }
}
