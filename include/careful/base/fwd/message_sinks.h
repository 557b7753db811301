#pragma once

namespace careful
{
    struct MessageSink;

    extern MessageSink& stderr_sink;
}
