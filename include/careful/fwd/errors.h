#pragma once

#include <careful/base/fwd/expected.h>

namespace careful
{
    enum class ErrorKind;
    struct CarefulError;

    template<class T>
    using ExpectedC = ExpectedT<T, CarefulError>;
}
