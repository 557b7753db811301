#pragma once

#include <careful/base/fwd/fmt.h>

#include <string>

namespace careful
{
    struct LineInfo
    {
        int line_number;
        const char* file_name;
        const char* function_name;

        std::string to_string() const;
    };
}

#define CAREFUL_LINE_INFO                                                                                              \
    careful::LineInfo { __LINE__, __FILE__, __func__ }

CAREFUL_FORMAT_WITH_TO_STRING(careful::LineInfo);
