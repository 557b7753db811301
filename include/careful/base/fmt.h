#pragma once

#include <careful/base/fwd/fmt.h>

#include <careful/base/pragmas.h>

CAREFUL_MSVC_WARNING(push)
// note:
// format.h(1058): warning C6240: (<expression> && <non-zero constant>) always evaluates to the result of <expression>
// format.h(1686): warning C6326: Potential comparison of a constant with another constant.
// Both arise from macros inside fmt.
CAREFUL_MSVC_WARNING(disable : 6240 6294 6326)
#include <fmt/format.h>
#include <fmt/ranges.h>
CAREFUL_MSVC_WARNING(pop)
