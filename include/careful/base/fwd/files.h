#pragma once

namespace careful
{
    enum class CopyOptions
    {
        none = 0,
        overwrite_existing = 0x2,
    };

    struct Path;
    struct IgnoreErrors;
    struct IExclusiveFileLock;
    struct ReadOnlyFilesystem;
    struct Filesystem;
    struct TemporaryDirectory;
}
