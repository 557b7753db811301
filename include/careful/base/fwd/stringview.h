#pragma once

namespace careful
{
    struct StringView;
    struct ZStringView;
    struct StringLiteral;
}
