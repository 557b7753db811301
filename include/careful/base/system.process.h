#pragma once

#include <careful/base/fwd/system.process.h>

#include <careful/base/expected.h>
#include <careful/base/optional.h>
#include <careful/base/path.h>
#include <careful/base/stringview.h>

#include <string>
#include <vector>

namespace careful
{
    void append_shell_escaped(std::string& target, StringView content);

    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command& raw_arg(StringView s) &;
        Command& forwarded_args(const std::vector<std::string>& args) &;

        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };
        Command&& raw_arg(StringView s) && { return std::move(raw_arg(s)); }
        Command&& forwarded_args(const std::vector<std::string>& args) && { return std::move(forwarded_args(args)); }

        StringView command_line() const { return buf; }
        const char* c_str() const { return buf.c_str(); }

        void clear() { buf.clear(); }
        bool empty() const { return buf.empty(); }

    private:
        std::string buf;
    };

    struct ExitCodeAndOutput
    {
        ExitCodeIntegral exit_code;
        std::string output;
    };

    struct EnvironmentEntry
    {
        std::string key;
        // nullopt removes the variable from the child's environment
        Optional<std::string> value;
    };

    // Changes applied to the inherited environment of a child process.
    struct Environment
    {
        void add_entry(StringView key, StringView value);
        void remove_entry(StringView key);

        const std::vector<EnvironmentEntry>& entries() const noexcept { return m_entries; }
        bool empty() const noexcept { return m_entries.empty(); }

        // Returns the value `key` is set to, or nullptr if `key` is not set by this environment.
        const std::string* value_of(StringView key) const noexcept;
        bool removes(StringView key) const noexcept;

        // POSIX shell prefix applying these changes, such as `env -u RUSTFLAGS KEY="value" `.
        std::string get() const;

    private:
        std::vector<EnvironmentEntry> m_entries;
    };

    struct ProcessLaunchSettings
    {
        Optional<Path> working_directory;
        Optional<Environment> environment;
    };

    struct RedirectedProcessLaunchSettings
    {
        Optional<Path> working_directory;
        Optional<Environment> environment;

        // whether the child's standard error is captured along with standard output
        bool capture_stderr = false;
        // whether to echo all read content to the enclosing terminal when debugging
        EchoInDebug echo_in_debug = EchoInDebug::Hide;
    };

    // Returns the shell text that runs `cmd` in `working_directory` with `environment` applied.
    std::string format_command_line(const Command& cmd,
                                    const Optional<Path>& working_directory,
                                    const Optional<Environment>& environment);

    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd);
    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd, const ProcessLaunchSettings& settings);

    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd);
    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd,
                                                                const RedirectedProcessLaunchSettings& settings);

    // Replaces the current process with `cmd` where the platform supports it, so this only returns on failure.
    // Elsewhere the child is run to completion and its exit code is returned.
    ExpectedL<ExitCodeIntegral> cmd_execute_in_place(const Command& cmd, const ProcessLaunchSettings& settings);

    bool succeeded(const ExpectedL<ExitCodeIntegral>& maybe_exit) noexcept;

    // If exit code is 0, returns a 'success' ExpectedL.
    // Otherwise, returns an ExpectedL containing error text
    ExpectedL<Unit> flatten(const ExpectedL<ExitCodeAndOutput>& maybe_exit, StringView tool_name);

    // If exit code is 0, returns a 'success' ExpectedL containing the output
    // Otherwise, returns an ExpectedL containing error text
    ExpectedL<std::string> flatten_out(ExpectedL<ExitCodeAndOutput>&& maybe_exit, StringView tool_name);
}
