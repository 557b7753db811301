#include <careful/base/checks.h>

#include <careful/errors.h>

namespace careful
{
    StringLiteral to_string_literal(ErrorKind kind) noexcept
    {
        switch (kind)
        {
            case ErrorKind::SourceMissing: return "SourceMissing";
            case ErrorKind::SourceNotFound: return "SourceNotFound";
            case ErrorKind::LockfileMissing: return "LockfileMissing";
            case ErrorKind::BuildFailed: return "BuildFailed";
            case ErrorKind::CopyFailed: return "CopyFailed";
            case ErrorKind::VariantUnsupported: return "VariantUnsupported";
            case ErrorKind::ConfigQueryFailed: return "ConfigQueryFailed";
            case ErrorKind::UserAborted: return "UserAborted";
            case ErrorKind::InvalidArguments: return "InvalidArguments";
            default: Checks::unreachable(CAREFUL_LINE_INFO);
        }
    }
}
