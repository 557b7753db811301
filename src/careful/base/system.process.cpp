#include <careful/base/checks.h>
#include <careful/base/strings.h>
#include <careful/base/system.debug.h>
#include <careful/base/system.h>
#include <careful/base/system.process.h>

#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#include <windows.h>
#else
#include <errno.h>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;
#endif

namespace
{
    using namespace careful;

    std::atomic<uint32_t> debug_id_counter{1000};

    LocalizedString format_system_error_message(StringLiteral api_name, int error_value)
    {
        return msg::format_error(msgSystemApiErrorMessage,
                                 msg::system_api = api_name,
                                 msg::exit_code = error_value,
                                 msg::error_msg = std::system_category().message(error_value));
    }

#if defined(_WIN32)
    // Applies an Environment to this process for the lifetime of the guard; children inherit it.
    struct ScopedEnvironment
    {
        explicit ScopedEnvironment(const Optional<Environment>& environment)
        {
            if (auto env = environment.get())
            {
                for (auto&& entry : env->entries())
                {
                    m_saved.push_back({entry.key, get_environment_variable(entry.key)});
                    if (auto value = entry.value.get())
                    {
                        set_environment_variable(entry.key, ZStringView{*value});
                    }
                    else
                    {
                        set_environment_variable(entry.key, nullopt);
                    }
                }
            }
        }

        ScopedEnvironment(const ScopedEnvironment&) = delete;
        ScopedEnvironment& operator=(const ScopedEnvironment&) = delete;

        ~ScopedEnvironment()
        {
            for (auto it = m_saved.rbegin(); it != m_saved.rend(); ++it)
            {
                if (auto value = it->value.get())
                {
                    set_environment_variable(it->key, ZStringView{*value});
                }
                else
                {
                    set_environment_variable(it->key, nullopt);
                }
            }
        }

    private:
        std::vector<EnvironmentEntry> m_saved;
    };
#else
    void close_mark_invalid(int& fd) noexcept
    {
        if (fd >= 0)
        {
            close(fd);
            fd = -1;
        }
    }

    struct AnonymousPipe
    {
        // pipefd[0] is the read end of the pipe, pipefd[1] is the write end
        int pipefd[2];

        AnonymousPipe() : pipefd{-1, -1} { }
        AnonymousPipe(const AnonymousPipe&) = delete;
        AnonymousPipe& operator=(const AnonymousPipe&) = delete;
        ~AnonymousPipe()
        {
            for (size_t idx = 0; idx < 2; ++idx)
            {
                close_mark_invalid(pipefd[idx]);
            }
        }

        ExpectedL<Unit> create()
        {
            if (pipe(pipefd))
            {
                return format_system_error_message("pipe", errno);
            }

            for (size_t idx = 0; idx < 2; ++idx)
            {
                if (fcntl(pipefd[idx], F_SETFD, FD_CLOEXEC))
                {
                    return format_system_error_message("fcntl", errno);
                }
            }

            return Unit{};
        }
    };

    struct PosixSpawnFileActions
    {
        posix_spawn_file_actions_t actions;

        PosixSpawnFileActions()
        {
            Checks::check_exit(CAREFUL_LINE_INFO, posix_spawn_file_actions_init(&actions) == 0);
        }

        ~PosixSpawnFileActions()
        {
            Checks::check_exit(CAREFUL_LINE_INFO, posix_spawn_file_actions_destroy(&actions) == 0);
        }

        PosixSpawnFileActions(const PosixSpawnFileActions&) = delete;
        PosixSpawnFileActions& operator=(const PosixSpawnFileActions&) = delete;

        ExpectedL<Unit> adddup2(int fd, int newfd)
        {
            const int error = posix_spawn_file_actions_adddup2(&actions, fd, newfd);
            if (error)
            {
                return format_system_error_message("posix_spawn_file_actions_adddup2", error);
            }

            return Unit{};
        }
    };

    struct PosixPid
    {
        pid_t pid;

        PosixPid() : pid{-1} { }

        ExpectedL<int> wait_for_termination()
        {
            int exit_code = -1;
            if (pid != -1)
            {
                int status;
                pid_t child;
                do
                {
                    child = waitpid(pid, &status, 0);
                } while (child == -1 && errno == EINTR);
                if (child != pid)
                {
                    return format_system_error_message("waitpid", errno);
                }

                if (WIFEXITED(status))
                {
                    exit_code = WEXITSTATUS(status);
                }
                else if (WIFSIGNALED(status))
                {
                    exit_code = 128 + WTERMSIG(status);
                }
                else if (WIFSTOPPED(status))
                {
                    exit_code = 128 + WSTOPSIG(status);
                }

                pid = -1;
            }

            return exit_code;
        }

        PosixPid(const PosixPid&) = delete;
        PosixPid& operator=(const PosixPid&) = delete;
    };

    // Runs `actual_cmd_line` with `sh -c`, optionally replacing the child's stdout (and stderr) with a pipe.
    ExpectedL<ExitCodeAndOutput> spawn_shell(const std::string& actual_cmd_line,
                                             bool capture,
                                             bool capture_stderr,
                                             EchoInDebug echo_in_debug)
    {
        // Flush stdout before launching external process
        fflush(stdout);

        AnonymousPipe child_output;
        PosixSpawnFileActions actions;
        if (capture)
        {
            auto created = child_output.create();
            if (!created)
            {
                return std::move(created).error();
            }

            auto duped = actions.adddup2(child_output.pipefd[1], 1);
            if (duped && capture_stderr)
            {
                duped = actions.adddup2(child_output.pipefd[1], 2);
            }

            if (!duped)
            {
                return std::move(duped).error();
            }
        }

        std::string sh_arg0 = "sh"; // as if by system()
        std::string sh_arg1 = "-c";
        std::string sh_arg2 = actual_cmd_line;
        char* argv[] = {sh_arg0.data(), sh_arg1.data(), sh_arg2.data(), nullptr};

        PosixPid pid;
        int error = posix_spawn(&pid.pid, "/bin/sh", &actions.actions, nullptr, argv, environ);
        if (error)
        {
            return format_system_error_message("posix_spawn", error);
        }

        std::string output;
        if (capture)
        {
            close_mark_invalid(child_output.pipefd[1]);
            char buf[1024];
            for (;;)
            {
                auto read_amount = read(child_output.pipefd[0], buf, sizeof(buf));
                if (read_amount < 0)
                {
                    if (errno == EINTR) continue;
                    auto read_error = format_system_error_message("read", errno);
                    // the child still has to be reaped
                    (void)pid.wait_for_termination();
                    return read_error;
                }

                if (read_amount == 0)
                {
                    break;
                }

                StringView this_read_data{buf, static_cast<size_t>(read_amount)};
                output.append(this_read_data.data(), this_read_data.size());
                if (echo_in_debug == EchoInDebug::Show && Debug::g_debugging)
                {
                    msg::write_unlocalized_text_to_stderr(Color::none, this_read_data);
                }
            }
        }

        auto maybe_exit_code = pid.wait_for_termination();
        if (auto exit_code = maybe_exit_code.get())
        {
            return ExitCodeAndOutput{*exit_code, std::move(output)};
        }

        return std::move(maybe_exit_code).error();
    }
#endif
}

namespace careful
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        if (content.empty())
        {
            target.append("\"\"");
            return;
        }

        if (Strings::find_first_of(content, " \t\n\r\"\\`$,;&^|'()<>*?!#~\x1f") != content.end())
        {
#if _WIN32
            // On Windows, `\`s before a double-quote must be doubled. Inner double-quotes must be escaped.
            target.push_back('"');
            size_t n_slashes = 0;
            for (auto ch : content)
            {
                if (ch == '\\')
                {
                    ++n_slashes;
                }
                else if (ch == '"')
                {
                    target.append(n_slashes + 1, '\\');
                    n_slashes = 0;
                }
                else
                {
                    n_slashes = 0;
                }
                target.push_back(ch);
            }
            target.append(n_slashes, '\\');
            target.push_back('"');
#else
            // On non-Windows, `\` is the escape character and always requires doubling. Inner double-quotes must be
            // escaped. Additionally, '`' and '$' must be escaped or they will retain their special meaning in the
            // shell.
            target.push_back('"');
            for (auto ch : content)
            {
                if (ch == '\\' || ch == '"' || ch == '`' || ch == '$') target.push_back('\\');
                target.push_back(ch);
            }
            target.push_back('"');
#endif
        }
        else
        {
            target.append(content.data(), content.size());
        }
    }

    Command& Command::string_arg(StringView s) &
    {
        if (!buf.empty()) buf.push_back(' ');
        append_shell_escaped(buf, s);
        return *this;
    }

    Command& Command::raw_arg(StringView s) &
    {
        if (!buf.empty())
        {
            buf.push_back(' ');
        }

        buf.append(s.data(), s.size());
        return *this;
    }

    Command& Command::forwarded_args(const std::vector<std::string>& args) &
    {
        for (auto&& arg : args)
        {
            string_arg(arg);
        }

        return *this;
    }

    void Environment::add_entry(StringView key, StringView value)
    {
        m_entries.push_back({key.to_string(), value.to_string()});
    }

    void Environment::remove_entry(StringView key) { m_entries.push_back({key.to_string(), nullopt}); }

    const std::string* Environment::value_of(StringView key) const noexcept
    {
        for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it)
        {
            if (it->key == key)
            {
                return it->value.get();
            }
        }

        return nullptr;
    }

    bool Environment::removes(StringView key) const noexcept
    {
        for (auto it = m_entries.rbegin(); it != m_entries.rend(); ++it)
        {
            if (it->key == key)
            {
                return !it->value.has_value();
            }
        }

        return false;
    }

    std::string Environment::get() const
    {
        std::string result;
        if (m_entries.empty())
        {
            return result;
        }

        result.append("env ");
        for (auto&& entry : m_entries)
        {
            if (!entry.value.has_value())
            {
                Strings::append(result, "-u ", entry.key, ' ');
            }
        }

        for (auto&& entry : m_entries)
        {
            if (auto value = entry.value.get())
            {
                Strings::append(result, entry.key, '=');
                append_shell_escaped(result, *value);
                result.push_back(' ');
            }
        }

        return result;
    }

    std::string format_command_line(const Command& cmd,
                                    const Optional<Path>& working_directory,
                                    const Optional<Environment>& environment)
    {
        std::string actual_cmd_line;
        if (auto wd = working_directory.get())
        {
#if defined(_WIN32)
            actual_cmd_line.append("cd /d ");
#else
            actual_cmd_line.append("cd ");
#endif
            append_shell_escaped(actual_cmd_line, *wd);
            actual_cmd_line.append(" && ");
        }

#if !defined(_WIN32)
        if (auto env_unpacked = environment.get())
        {
            actual_cmd_line.append(env_unpacked->get());
        }
#else
        (void)environment;
#endif

        const auto unwrapped_to_execute = cmd.command_line();
        actual_cmd_line.append(unwrapped_to_execute.data(), unwrapped_to_execute.size());
        return actual_cmd_line;
    }

    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd)
    {
        ProcessLaunchSettings default_process_launch_settings;
        return cmd_execute(cmd, default_process_launch_settings);
    }

    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd, const ProcessLaunchSettings& settings)
    {
        const auto debug_id = debug_id_counter.fetch_add(1, std::memory_order_relaxed);
        const auto actual_cmd_line = format_command_line(cmd, settings.working_directory, settings.environment);
        Debug::print(fmt::format("{}: cmd_execute({})\n", debug_id, actual_cmd_line));
#if defined(_WIN32)
        ScopedEnvironment scoped_environment(settings.environment);
        fflush(nullptr);
        const int exit_code = system(actual_cmd_line.c_str());
        if (exit_code == -1)
        {
            return format_system_error_message("system", errno);
        }

        Debug::print(fmt::format("{}: child process returned {}\n", debug_id, exit_code));
        return static_cast<ExitCodeIntegral>(exit_code);
#else
        auto maybe_result = spawn_shell(actual_cmd_line, false, false, EchoInDebug::Hide);
        if (auto result = maybe_result.get())
        {
            Debug::print(fmt::format("{}: child process returned {}\n", debug_id, result->exit_code));
            return result->exit_code;
        }

        return std::move(maybe_result).error();
#endif
    }

    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd)
    {
        RedirectedProcessLaunchSettings default_redirected_process_launch_settings;
        return cmd_execute_and_capture_output(cmd, default_redirected_process_launch_settings);
    }

    ExpectedL<ExitCodeAndOutput> cmd_execute_and_capture_output(const Command& cmd,
                                                                const RedirectedProcessLaunchSettings& settings)
    {
        const auto debug_id = debug_id_counter.fetch_add(1, std::memory_order_relaxed);
        auto actual_cmd_line = format_command_line(cmd, settings.working_directory, settings.environment);
        Debug::print(fmt::format("{}: cmd_execute_and_capture_output({})\n", debug_id, actual_cmd_line));
#if defined(_WIN32)
        ScopedEnvironment scoped_environment(settings.environment);
        if (settings.capture_stderr)
        {
            actual_cmd_line.append(" 2>&1");
        }

        fflush(nullptr);
        FILE* pipe = _popen(actual_cmd_line.c_str(), "rb");
        if (!pipe)
        {
            return format_system_error_message("_popen", errno);
        }

        std::string output;
        char buf[1024];
        size_t read_amount;
        while ((read_amount = fread(buf, 1, sizeof(buf), pipe)) != 0)
        {
            output.append(buf, read_amount);
            if (settings.echo_in_debug == EchoInDebug::Show && Debug::g_debugging)
            {
                msg::write_unlocalized_text_to_stderr(Color::none, StringView{buf, read_amount});
            }
        }

        const int exit_code = _pclose(pipe);
        Debug::print(fmt::format("{}: child process returned {}\n", debug_id, exit_code));
        return ExitCodeAndOutput{static_cast<ExitCodeIntegral>(exit_code), std::move(output)};
#else
        auto maybe_result = spawn_shell(actual_cmd_line, true, settings.capture_stderr, settings.echo_in_debug);
        if (auto result = maybe_result.get())
        {
            Debug::print(fmt::format("{}: child process returned {}\n", debug_id, result->exit_code));
        }

        return maybe_result;
#endif
    }

    ExpectedL<ExitCodeIntegral> cmd_execute_in_place(const Command& cmd, const ProcessLaunchSettings& settings)
    {
#if defined(_WIN32)
        return cmd_execute(cmd, settings);
#else
        auto actual_cmd_line = format_command_line(cmd, settings.working_directory, settings.environment);
        actual_cmd_line.insert(0, "exec ");
        Debug::print(fmt::format("cmd_execute_in_place({})\n", actual_cmd_line));
        fflush(nullptr);
        execl("/bin/sh", "sh", "-c", actual_cmd_line.c_str(), static_cast<char*>(nullptr));
        return format_system_error_message("execl", errno);
#endif
    }

    bool succeeded(const ExpectedL<ExitCodeIntegral>& maybe_exit) noexcept
    {
        if (const auto exit = maybe_exit.get())
        {
            return *exit == 0;
        }

        return false;
    }

    ExpectedL<Unit> flatten(const ExpectedL<ExitCodeAndOutput>& maybe_exit, StringView tool_name)
    {
        if (auto exit = maybe_exit.get())
        {
            if (exit->exit_code == 0)
            {
                return {Unit{}};
            }

            return {msg::format(
                        msgProgramReturnedNonzeroExitCode, msg::tool_name = tool_name, msg::exit_code = exit->exit_code)
                        .append_raw('\n')
                        .append_raw(exit->output)};
        }

        return {msg::format(msgLaunchingProgramFailed, msg::tool_name = tool_name)
                    .append_raw(' ')
                    .append_raw(maybe_exit.error().to_string())};
    }

    ExpectedL<std::string> flatten_out(ExpectedL<ExitCodeAndOutput>&& maybe_exit, StringView tool_name)
    {
        if (auto exit = maybe_exit.get())
        {
            if (exit->exit_code == 0)
            {
                return {std::move(exit->output), expected_left_tag};
            }

            return {msg::format(
                        msgProgramReturnedNonzeroExitCode, msg::tool_name = tool_name, msg::exit_code = exit->exit_code)
                        .append_raw('\n')
                        .append_raw(exit->output),
                    expected_right_tag};
        }

        return {msg::format(msgLaunchingProgramFailed, msg::tool_name = tool_name)
                    .append_raw(' ')
                    .append_raw(maybe_exit.error().to_string()),
                expected_right_tag};
    }
}
