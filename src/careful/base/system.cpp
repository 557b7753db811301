#include <careful/base/checks.h>
#include <careful/base/optional.h>
#include <careful/base/stringview.h>
#include <careful/base/system.h>

#include <stdlib.h>

namespace careful
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
#if defined(_WIN32)
        char* buffer = nullptr;
        size_t size = 0;
        if (_dupenv_s(&buffer, &size, varname.c_str()) != 0 || !buffer) return nullopt;
        std::string ret(buffer);
        free(buffer);
        return ret;
#else
        auto v = getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
#endif
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
#if defined(_WIN32)
        if (auto v = value.get())
        {
            Checks::check_exit(CAREFUL_LINE_INFO, _putenv_s(varname.c_str(), v->c_str()) == 0);
        }
        else
        {
            Checks::check_exit(CAREFUL_LINE_INFO, _putenv_s(varname.c_str(), "") == 0);
        }
#else
        if (auto v = value.get())
        {
            Checks::check_exit(CAREFUL_LINE_INFO, setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(CAREFUL_LINE_INFO, unsetenv(varname.c_str()) == 0);
        }
#endif
    }
}
