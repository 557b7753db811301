#include <careful/base/checks.h>
#include <careful/base/files.h>
#include <careful/base/strings.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.process.h>

#include <careful/contractual-constants.h>
#include <careful/errors.h>
#include <careful/sysrootbuilder.h>
#include <careful/sysrootcache.h>

namespace
{
    using namespace careful;

    CarefulError filesystem_error(ErrorKind kind,
                                  LocalizedString&& heading,
                                  const std::error_code& ec,
                                  StringView call_name,
                                  std::initializer_list<StringView> args)
    {
        heading.append_raw('\n').append(format_filesystem_call_error(ec, call_name, args));
        return make_error(kind, std::move(heading));
    }

    void append_dependency(std::string& manifest, StringLiteral table, const Path& path)
    {
        Strings::append(manifest, "\n[", table, "]\npath = ", toml_basic_string(path), '\n');
    }

    ExpectedC<Unit> write_synthetic_project(const Filesystem& fs,
                                            const Path& project_dir,
                                            const SysrootBuildRequest& request)
    {
        std::error_code ec;
        const auto manifest_path = project_dir / FileCargoToml;
        fs.write_contents(
            manifest_path, generate_sysroot_manifest(request.source_tree, is_no_std_target(request.target)), ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::BuildFailed,
                                    msg::format(msgFailedToWriteFile, msg::path = manifest_path),
                                    ec,
                                    "write_contents",
                                    {manifest_path});
        }

        const auto lib_path = project_dir / FileLibRs;
        fs.write_contents(lib_path, StringView{}, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::BuildFailed,
                                    msg::format(msgFailedToWriteFile, msg::path = lib_path),
                                    ec,
                                    "write_contents",
                                    {lib_path});
        }

        Path lockfile(request.source_tree.parent_path());
        lockfile /= FileCargoLock;
        if (!fs.exists(lockfile, IgnoreErrors{}))
        {
            return make_error(ErrorKind::LockfileMissing, msgLockfileMissing, msg::path = lockfile);
        }

        const auto lockfile_destination = project_dir / FileCargoLock;
        fs.copy_file(lockfile, lockfile_destination, CopyOptions::overwrite_existing, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::LockfileMissing,
                                    msg::format(msgLockfileMissing, msg::path = lockfile),
                                    ec,
                                    "copy_file",
                                    {lockfile, lockfile_destination});
        }

        return Unit{};
    }

    ExpectedC<Unit> copy_artifacts(const Filesystem& fs, const Path& out_dir, const SysrootLayout& layout)
    {
        std::error_code ec;
        const auto artifact_dir = layout.artifact_dir();
        fs.create_directories(artifact_dir, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::CopyFailed,
                                    msg::format(msgFailedToCreateDirectory, msg::path = artifact_dir),
                                    ec,
                                    "create_directories",
                                    {artifact_dir});
        }

        auto entries = fs.get_files_non_recursive(out_dir, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::CopyFailed,
                                    msg::format(msgFailedToReadBuildOutput, msg::path = out_dir),
                                    ec,
                                    "get_files_non_recursive",
                                    {out_dir});
        }

        if (auto directory = find_first_directory(fs, entries))
        {
            Checks::unreachable(CAREFUL_LINE_INFO,
                                msg::format(msgBuildOutputContainsDirectory, msg::path = *directory));
        }

        for (auto&& entry : entries)
        {
            const auto destination = artifact_dir / entry.filename();
            fs.copy_file(entry, destination, CopyOptions::overwrite_existing, ec);
            if (ec)
            {
                return filesystem_error(ErrorKind::CopyFailed,
                                        msg::format(msgFailedToCopyArtifact, msg::path = entry),
                                        ec,
                                        "copy_file",
                                        {entry, destination});
            }
        }

        Debug::println("copied ", entries.size(), " artifacts to ", artifact_dir);
        return Unit{};
    }

    // The sanitizer runtime is linked dynamically on Apple targets, so it has to live next to the artifacts.
    ExpectedC<Unit> copy_darwin_sanitizer_runtime(const Filesystem& fs,
                                                  const ToolchainProvider& provider,
                                                  const SysrootLayout& layout,
                                                  StringView sanitizer)
    {
        auto maybe_libdir = provider.target_libdir(layout.target());
        auto libdir = maybe_libdir.get();
        if (!libdir)
        {
            return std::move(maybe_libdir).error();
        }

        const auto runtime_name =
            Strings::concat("librustc-nightly_rt.", sanitizer_runtime_short_name(sanitizer), ".dylib");
        const auto runtime = *libdir / runtime_name;
        if (!fs.exists(runtime, IgnoreErrors{}))
        {
            return make_error(
                ErrorKind::CopyFailed, msgSanitizerRuntimeMissing, msg::sanitizer = sanitizer, msg::path = runtime);
        }

        std::error_code ec;
        const auto destination = layout.artifact_dir() / runtime_name;
        fs.copy_file(runtime, destination, CopyOptions::overwrite_existing, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::CopyFailed,
                                    msg::format(msgFailedToCopyArtifact, msg::path = runtime),
                                    ec,
                                    "copy_file",
                                    {runtime, destination});
        }

        return Unit{};
    }
}

namespace careful
{
    bool is_no_std_target(StringView target)
    {
        return target.contains("-none") || target.contains("nvptx") || target.contains("switch") ||
               target.contains("-uefi");
    }

    std::string toml_basic_string(StringView value)
    {
        std::string result;
        result.reserve(value.size() + 2);
        result.push_back('"');
        for (auto ch : value)
        {
            switch (ch)
            {
                case '\\': result.append("\\\\"); break;
                case '"': result.append("\\\""); break;
                case '\b': result.append("\\b"); break;
                case '\t': result.append("\\t"); break;
                case '\n': result.append("\\n"); break;
                case '\f': result.append("\\f"); break;
                case '\r': result.append("\\r"); break;
                default:
                    if (static_cast<unsigned char>(ch) < 0x20 || ch == '\x7f')
                    {
                        fmt::format_to(std::back_inserter(result), "\\u{:04x}", static_cast<unsigned char>(ch));
                    }
                    else
                    {
                        result.push_back(ch);
                    }
                    break;
            }
        }

        result.push_back('"');
        return result;
    }

    std::string generate_sysroot_manifest(const Path& source_tree, bool no_std)
    {
        std::string manifest = R"([package]
authors = ["The Rust Project Developers"]
name = "sysroot"
version = "0.0.0"

[lib]
path = "lib.rs"
)";

        if (no_std)
        {
            append_dependency(manifest, "dependencies.core", source_tree / "core");
            append_dependency(manifest, "dependencies.alloc", source_tree / "alloc");
        }
        else
        {
            Strings::append(manifest,
                            "\n[dependencies.std]\nfeatures = [",
                            Strings::join(", ", StdFeatures, toml_basic_string),
                            "]\npath = ",
                            toml_basic_string(source_tree / "std"),
                            '\n');
            append_dependency(manifest, "dependencies.test", source_tree / "test");
        }

        append_dependency(
            manifest, "patch.crates-io.rustc-std-workspace-core", source_tree / "rustc-std-workspace-core");
        append_dependency(
            manifest, "patch.crates-io.rustc-std-workspace-alloc", source_tree / "rustc-std-workspace-alloc");
        if (!no_std)
        {
            append_dependency(
                manifest, "patch.crates-io.rustc-std-workspace-std", source_tree / "rustc-std-workspace-std");
        }

        return manifest;
    }

    std::vector<std::string> sysroot_rustflags(const std::vector<std::string>& extra_rustflags,
                                               const Optional<std::string>& variant)
    {
        std::vector<std::string> flags;
        for (auto&& flag : CarefulBaselineFlags)
        {
            flags.push_back(flag.to_string());
        }

        flags.insert(flags.end(), extra_rustflags.begin(), extra_rustflags.end());
        if (auto sanitizer = variant.get())
        {
            flags.push_back(Strings::concat("-Zsanitizer=", *sanitizer));
        }

        return flags;
    }

    StringView sanitizer_runtime_short_name(StringView sanitizer)
    {
        if (sanitizer == "address") return "asan";
        if (sanitizer == "hwaddress") return "hwasan";
        if (sanitizer == "leak") return "lsan";
        if (sanitizer == "memory") return "msan";
        if (sanitizer == "thread") return "tsan";
        return sanitizer;
    }

    const Path* find_first_directory(const ReadOnlyFilesystem& fs, const std::vector<Path>& entries)
    {
        for (auto&& entry : entries)
        {
            if (fs.is_directory(entry))
            {
                return &entry;
            }
        }

        return nullptr;
    }

    ExpectedC<Path> build_sysroot(const Filesystem& fs,
                                  const ToolchainProvider& provider,
                                  const SysrootBuildRequest& request)
    {
        const SysrootLayout layout(request.sysroot_dir, request.target);

        std::error_code ec;
        const auto rustlib_target_dir = layout.rustlib_target_dir();
        if (fs.exists(rustlib_target_dir, IgnoreErrors{}))
        {
            fs.remove_all(rustlib_target_dir, ec);
            if (ec)
            {
                return filesystem_error(ErrorKind::CopyFailed,
                                        msg::format(msgFailedToCleanSysroot, msg::path = rustlib_target_dir),
                                        ec,
                                        "remove_all",
                                        {rustlib_target_dir});
            }
        }

        auto project_path = fs.create_temporary_directory(DirectoryTempPrefix, ec);
        if (ec)
        {
            return filesystem_error(ErrorKind::BuildFailed,
                                    msg::format(msgFailedToCreateTempDir),
                                    ec,
                                    "create_temporary_directory",
                                    {DirectoryTempPrefix});
        }

        const TemporaryDirectory project(fs, std::move(project_path));
        Debug::println("building sysroot in ", project.path());
        auto written = write_synthetic_project(fs, project.path(), request);
        if (!written)
        {
            return std::move(written).error();
        }

        const auto encoded_flags = encode_rustflags(sysroot_rustflags(request.extra_rustflags, request.variant));
        Environment environment;
        environment.add_entry(EnvironmentVariableCargoTargetDir, project.path() / "target");
        // keeps the sysroot's crate hashes distinct from crates.io builds of the same crates
        environment.add_entry(EnvironmentVariableCargoDefaultLibMetadata, CargoLibMetadata);
        environment.add_entry(EnvironmentVariableCargoEncodedRustFlags, encoded_flags);

        auto built =
            provider.build_sysroot_crate(project.path() / FileCargoToml, request.target, environment, request.output);
        if (!built)
        {
            return make_error(ErrorKind::BuildFailed,
                              msg::format(msgSysrootBuildFailed).append_raw('\n').append(built.error()));
        }

        auto copied =
            copy_artifacts(fs, project.path() / "target" / request.target / "release" / "deps", layout);
        if (!copied)
        {
            return std::move(copied).error();
        }

        if (auto sanitizer = request.variant.get())
        {
            if (request.target.find("-apple-") != std::string::npos)
            {
                auto runtime_copied = copy_darwin_sanitizer_runtime(fs, provider, layout, *sanitizer);
                if (!runtime_copied)
                {
                    return std::move(runtime_copied).error();
                }
            }
        }

        return request.sysroot_dir;
    }
}
