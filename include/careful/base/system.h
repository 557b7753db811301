#pragma once

#include <careful/base/fwd/optional.h>
#include <careful/base/fwd/stringview.h>

#include <string>

namespace careful
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;
}
