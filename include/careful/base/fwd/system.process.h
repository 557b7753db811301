#pragma once

namespace careful
{
    enum class EchoInDebug
    {
        Show,
        Hide
    };

    struct Command;
    struct ExitCodeAndOutput;
    struct EnvironmentEntry;
    struct Environment;
    struct ProcessLaunchSettings;
    struct RedirectedProcessLaunchSettings;

    // The integral type the operating system uses to represent exit codes.
#if defined(_WIN32)
    using ExitCodeIntegral = unsigned long; // DWORD
#else
    using ExitCodeIntegral = int;
#endif // ^^^ !_WIN32
}
