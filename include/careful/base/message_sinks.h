#pragma once

#include <careful/base/fwd/message_sinks.h>

#include <careful/base/messages.h>

namespace careful
{
    struct MessageSink
    {
        virtual void print(Color c, StringView sv) = 0;

        void print(const LocalizedString& s) { this->print(Color::none, s); }
        void println(Color c, const LocalizedString& s)
        {
            this->print(c, s);
            this->print(Color::none, "\n");
        }
        void println(const LocalizedString& s) { this->println(Color::none, s); }

        template<CAREFUL_DECL_MSG_TEMPLATE>
        void print(CAREFUL_DECL_MSG_ARGS)
        {
            this->print(msg::format(CAREFUL_EXPAND_MSG_ARGS));
        }

        template<CAREFUL_DECL_MSG_TEMPLATE>
        void println(CAREFUL_DECL_MSG_ARGS)
        {
            this->println(msg::format(CAREFUL_EXPAND_MSG_ARGS));
        }

        template<CAREFUL_DECL_MSG_TEMPLATE>
        void println(Color c, CAREFUL_DECL_MSG_ARGS)
        {
            this->println(c, msg::format(CAREFUL_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };
}
