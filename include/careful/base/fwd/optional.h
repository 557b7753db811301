#pragma once

namespace careful
{
    struct NullOpt;

    template<class T>
    struct Optional;
}
