#pragma once
#include "toolbridge/framing.hpp"

namespace toolbridge::testing {

struct ToolServerOptions {
    Framing framing = Framing::Newline;
    bool answer_initialize = true;
    bool malformed_initialize = false;
};

/// Serve a fixed set of scripted tools over a byte stream until end of
/// input or an "exit" call. Returns the status "exit" asked for, else 0.
///
/// Tools: echo{text}, add{a,b}, sleep{ms}, fail{}, exit{code},
/// notify_change{}, garbage{}, env{name}, cwd{}.
int run_tool_server(int in_fd, int out_fd, const ToolServerOptions& opts);

} // namespace toolbridge::testing
