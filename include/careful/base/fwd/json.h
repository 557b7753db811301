#pragma once

namespace careful::Json
{
    enum class ValueKind : int;
    struct Value;
    struct Array;
    struct Object;
}
