#pragma once

#include <careful/fwd/errors.h>

#include <careful/base/expected.h>
#include <careful/base/messages.h>

namespace careful
{
    enum class ErrorKind
    {
        SourceMissing,
        SourceNotFound,
        LockfileMissing,
        BuildFailed,
        CopyFailed,
        VariantUnsupported,
        ConfigQueryFailed,
        UserAborted,
        InvalidArguments,
    };

    StringLiteral to_string_literal(ErrorKind kind) noexcept;

    struct CarefulError
    {
        ErrorKind kind;
        LocalizedString message;
    };

    inline const LocalizedString& error_message_of(const CarefulError& e) { return e.message; }

    inline CarefulError make_error(ErrorKind kind, LocalizedString&& message)
    {
        return CarefulError{kind, std::move(message)};
    }

    template<CAREFUL_DECL_MSG_TEMPLATE>
    CarefulError make_error(ErrorKind kind, CAREFUL_DECL_MSG_ARGS)
    {
        return CarefulError{kind, msg::format(CAREFUL_EXPAND_MSG_ARGS)};
    }
}

CAREFUL_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(careful::ErrorKind);
