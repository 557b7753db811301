#include <careful/base/checks.h>
#include <careful/base/files.h>
#include <careful/base/system.debug.h>

#include <careful/careful.h>
#include <careful/configuration.h>
#include <careful/toolchain.h>

#include <locale.h>

#if defined(_WIN32)
#include <Windows.h>

#include <atomic>
#endif

#include <string>
#include <vector>

using namespace careful;

namespace
{
#if defined(_WIN32)
    std::atomic<int> g_init_console_output_cp(0);
    std::atomic<bool> g_init_console_initialized(false);
#endif
}

namespace careful::Checks
{
    // Implements link seam from checks.h
    void on_final_cleanup_and_exit()
    {
#if defined(_WIN32)
        if (g_init_console_initialized)
        {
            SetConsoleOutputCP(g_init_console_output_cp);
        }
#endif
    }
}

int main(const int argc, const char* const* const argv)
{
#if defined(_WIN32)
    g_init_console_output_cp = GetConsoleOutputCP();
    g_init_console_initialized = true;
    SetConsoleOutputCP(CP_UTF8);
#else
    static const char* const utf8_locales[] = {
        "C.UTF-8",
        "POSIX.UTF-8",
        "en_US.UTF-8",
    };

    for (const char* utf8_locale : utf8_locales)
    {
        if (::setlocale(LC_ALL, utf8_locale))
        {
            break;
        }
    }
#endif

    CarefulConfiguration config;
    config.imbue_from_environment();
    Debug::g_debugging = config.debugging;

    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        args.emplace_back(argv[i]);
    }

    Debug::println("cargo-careful invoked with ", args.size(), " arguments");
    const auto provider = make_real_toolchain_provider(config);
    Checks::exit_with_code(CAREFUL_LINE_INFO, run_careful(config, real_filesystem, *provider, args));
}
