#include "toolbridge/transport/process_transport.hpp"
#include "toolbridge/error.hpp"
#include "toolbridge/log.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

#include <cerrno>
#include <cstring>
#include <thread>

namespace toolbridge {

namespace {

void close_pair(int fds[2]) {
    for (int i = 0; i < 2; ++i) {
        if (fds[i] >= 0) ::close(fds[i]);
        fds[i] = -1;
    }
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) return "exited with status " + std::to_string(WEXITSTATUS(status));
    if (WIFSIGNALED(status)) return "killed by signal " + std::to_string(WTERMSIG(status));
    return "stopped";
}

} // anonymous namespace

ProcessTransport::ProcessTransport(Options opts)
    : StreamTransport(opts.framing), opts_(std::move(opts)) {
}

ProcessTransport::~ProcessTransport() {
    close();
}

void ProcessTransport::open() {
    if (is_open()) return;
    if (opts_.command.empty()) {
        throw ConnectError("process transport has no command");
    }

    // Everything the child needs is built before fork(); only
    // async-signal-safe calls happen between fork() and exec.
    std::vector<std::string> argv_storage;
    argv_storage.push_back(opts_.command);
    argv_storage.insert(argv_storage.end(), opts_.args.begin(), opts_.args.end());
    std::vector<char*> argv;
    for (auto& a : argv_storage) argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        if (opts_.env.count(entry.substr(0, entry.find('=')))) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& [key, value] : opts_.env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& e : env_storage) envp.push_back(e.data());
    envp.push_back(nullptr);

    const char* cwd = opts_.working_dir ? opts_.working_dir->c_str() : nullptr;

    int to_child[2] = {-1, -1};
    int from_child[2] = {-1, -1};
    int exec_err[2] = {-1, -1};
    if (::pipe2(to_child, O_CLOEXEC) < 0 || ::pipe2(from_child, O_CLOEXEC) < 0
        || ::pipe2(exec_err, O_CLOEXEC) < 0) {
        int err = errno;
        close_pair(to_child);
        close_pair(from_child);
        close_pair(exec_err);
        throw ConnectError(std::string("failed to create pipes: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pair(to_child);
        close_pair(from_child);
        close_pair(exec_err);
        throw ConnectError(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        // dup2 clears O_CLOEXEC on the new descriptors
        ::dup2(to_child[0], STDIN_FILENO);
        ::dup2(from_child[1], STDOUT_FILENO);
        int err = 0;
        if (cwd && ::chdir(cwd) < 0) {
            err = errno;
        } else {
            ::execvpe(argv[0], argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = ::write(exec_err[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    ::close(to_child[0]);
    ::close(from_child[1]);
    ::close(exec_err[1]);

    // The error pipe closes on a successful exec; otherwise it carries errno.
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_err[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_err[0]);

    if (n > 0) {
        ::close(to_child[1]);
        ::close(from_child[0]);
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        throw ConnectError("failed to launch '" + opts_.command + "': " + std::strerror(child_errno));
    }

    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        pid_ = pid;
        status_.reset();
    }
    attach(from_child[0], to_child[1]);
    log::logger()->debug("spawned '{}' as pid {}", opts_.command, pid);
}

std::string ProcessTransport::describe() const {
    std::string s = "process '" + opts_.command;
    for (const auto& a : opts_.args) s += " " + a;
    return s + "'";
}

pid_t ProcessTransport::pid() const {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return pid_;
}

std::optional<int> ProcessTransport::exit_status() const {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return status_;
}

void ProcessTransport::on_end_of_stream() {
    if (!reap(opts_.shutdown_grace)) {
        throw TransportError(describe() + " closed its output but is still running");
    }
    auto status = exit_status();
    if (!status) {
        // reaped by someone else; nothing more to learn
        return;
    }
    if (WIFEXITED(*status) && WEXITSTATUS(*status) == 0) {
        log::logger()->debug("{} exited cleanly", describe());
        return;
    }
    throw TransportError(describe() + " " + describe_status(*status));
}

void ProcessTransport::release() {
    // stdin is already closed; a well-behaved server exits on its own
    if (reap(opts_.shutdown_grace)) return;

    pid_t pid = this->pid();
    if (pid <= 0) return;
    log::logger()->warn("{} did not exit after stdin closed, sending SIGTERM", describe());
    ::kill(pid, SIGTERM);
    if (reap(std::chrono::milliseconds(500))) return;

    log::logger()->warn("{} ignored SIGTERM, sending SIGKILL", describe());
    ::kill(pid, SIGKILL);
    if (!reap(std::chrono::milliseconds(2000))) {
        log::logger()->error("{} (pid {}) could not be reaped", describe(), pid);
    }
}

bool ProcessTransport::reap(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(child_mutex_);
    if (pid_ <= 0) return true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        int status = 0;
        pid_t r = ::waitpid(pid_, &status, WNOHANG);
        if (r == pid_) {
            status_ = status;
            pid_ = -1;
            return true;
        }
        if (r < 0 && errno != EINTR) {
            pid_ = -1;
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

} // namespace toolbridge
