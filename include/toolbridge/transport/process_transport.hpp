#pragma once
#include "stream_transport.hpp"
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

namespace toolbridge {

/// Tool server running as a child process, spoken to over its stdin/stdout.
/// The child's stderr is inherited.
class ProcessTransport : public StreamTransport {
public:
    struct Options {
        std::string command;
        std::vector<std::string> args;
        std::map<std::string, std::string> env;   // added to / overriding the parent environment
        std::optional<std::string> working_dir;
        Framing framing = Framing::Newline;
        std::chrono::milliseconds shutdown_grace{1000};
    };

    explicit ProcessTransport(Options opts);
    ~ProcessTransport() override;

    void open() override;
    std::string describe() const override;

    /// Pid of the running child, or -1 when none is running.
    [[nodiscard]] pid_t pid() const;

    /// Raw waitpid() status once the child has been reaped.
    [[nodiscard]] std::optional<int> exit_status() const;

protected:
    void on_end_of_stream() override;
    void release() override;

private:
    /// Waits up to `timeout` for the child to exit. True once it is reaped.
    bool reap(std::chrono::milliseconds timeout);

    Options opts_;
    mutable std::mutex child_mutex_;
    pid_t pid_{-1};
    std::optional<int> status_;
};

} // namespace toolbridge
