#pragma once

#include <careful/base/lineinfo.h>
#include <careful/base/messages.h>
#include <careful/base/stringview.h>

namespace careful::Checks
{
    // This function is a link seam called by final_cleanup_and_exit.
    void on_final_cleanup_and_exit();

    [[noreturn]] void final_cleanup_and_exit(const int exit_code);

    // Indicate that an internal error has occurred and exit the tool. This should be used when invariants have been
    // broken.
    [[noreturn]] void unreachable(const LineInfo& line_info);
    [[noreturn]] void unreachable(const LineInfo& line_info, StringView message);

    [[noreturn]] void exit_with_code(const LineInfo& line_info, const int exit_code);

    // Exit the tool without an error message.
    [[noreturn]] void exit_fail(const LineInfo& line_info);

    // Display an error message to the user and exit the tool.
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message);
    template<CAREFUL_DECL_MSG_TEMPLATE>
    [[noreturn]] void msg_exit_with_message(const LineInfo& line_info, CAREFUL_DECL_MSG_ARGS)
    {
        msg_exit_with_message(line_info, msg::format(CAREFUL_EXPAND_MSG_ARGS));
    }

    // If expression is false, call exit_fail.
    void check_exit(const LineInfo& line_info, bool expression);

    // if expression is false, call exit_with_message.
    void check_exit(const LineInfo& line_info, bool expression, StringView error_message);
    void check_exit(const LineInfo& line_info, bool expression, const LocalizedString&) = delete;

    // Prints "fatal error: <message>" to stderr and exits with EXIT_FAILURE.
    [[noreturn]] void msg_exit_with_fatal_error(const LineInfo& line_info, const LocalizedString& message);
    template<CAREFUL_DECL_MSG_TEMPLATE>
    [[noreturn]] void msg_exit_with_fatal_error(const LineInfo& line_info, CAREFUL_DECL_MSG_ARGS)
    {
        msg_exit_with_fatal_error(line_info, msg::format(CAREFUL_EXPAND_MSG_ARGS));
    }
}
