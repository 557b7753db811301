#include <careful/base/message_sinks.h>

namespace
{
    using namespace careful;

    struct StdErrMessageSink final : MessageSink
    {
        virtual void print(Color c, StringView sv) override { msg::write_unlocalized_text_to_stderr(c, sv); }
    };

    StdErrMessageSink stderr_sink_instance;
}

namespace careful
{
    MessageSink& stderr_sink = stderr_sink_instance;
}
