#pragma once

#include <careful/base/fwd/files.h>
#include <careful/base/fwd/message_sinks.h>

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>

#include <stdint.h>

#include <string>

namespace careful
{
    struct SysrootBuildRequest;
    struct ToolchainIdentity;
    struct ToolchainProvider;

    // Fingerprint of everything a built sysroot depends on.
    struct CacheKey
    {
        uint64_t value = 0;

        std::string to_string() const;
        void to_string(std::string& out) const;

        friend bool operator==(const CacheKey& lhs, const CacheKey& rhs) noexcept { return lhs.value == rhs.value; }
        friend bool operator!=(const CacheKey& lhs, const CacheKey& rhs) noexcept { return lhs.value != rhs.value; }
    };

    // FNV-1a over the source tree, the toolchain commit and the variant, each NUL terminated.
    CacheKey current_key(const ToolchainIdentity& toolchain,
                         const Path& source_tree,
                         const Optional<std::string>& variant);

    // Sanitizer variants are built in a subdirectory named after the sanitizer.
    Path sysroot_dir_for(const Path& cache_root, const Optional<std::string>& variant);

    struct SysrootLayout
    {
        SysrootLayout(Path sysroot_dir, std::string target);

        const Path& sysroot_dir() const noexcept { return m_sysroot_dir; }
        const std::string& target() const noexcept { return m_target; }

        // <sysroot>/lib/rustlib/<target>
        Path rustlib_target_dir() const;
        // <sysroot>/lib/rustlib/<target>/lib
        Path artifact_dir() const;
        // <sysroot>/lib/rustlib/<target>/.cargo-careful-hash
        Path marker_file() const;
        // <sysroot>/.cargo-careful.lock
        Path lock_file() const;

    private:
        Path m_sysroot_dir;
        std::string m_target;
    };

    // Whether the marker in `layout` holds `key`. A missing or malformed marker is simply not fresh.
    bool is_fresh(const ReadOnlyFilesystem& fs, const SysrootLayout& layout, const CacheKey& key);

    ExpectedC<Unit> record(const Filesystem& fs, const SysrootLayout& layout, const CacheKey& key);

    // Returns the sysroot directory for `request`, building it first unless the marker says it is current.
    // Concurrent callers are serialized by an advisory lock in the sysroot directory.
    ExpectedC<Path> ensure(const Filesystem& fs,
                           const ToolchainProvider& provider,
                           const SysrootBuildRequest& request,
                           MessageSink& status_sink);
}

CAREFUL_FORMAT_WITH_TO_STRING(careful::CacheKey);
