#pragma once
#include "backoff.hpp"
#include "config.hpp"
#include "error.hpp"
#include "types.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

class ToolInvoker;

enum class TaskMode {
    Ordered,    // one step at a time; the first failure skips the rest
    Parallel    // independent steps, bounded concurrency
};

enum class StepStatus {
    Succeeded,
    Failed,
    Skipped
};

[[nodiscard]] std::string_view to_string(TaskMode mode);
[[nodiscard]] std::string_view to_string(StepStatus status);

struct TaskStep {
    std::string server;
    std::string tool;
    nlohmann::json arguments = nlohmann::json::object();
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> max_retries;   // retries after the first attempt
    /// Whether a timed-out attempt may run again. Unset: the tool's
    /// idempotentHint annotation, else no.
    std::optional<bool> idempotent;
};

/// Immutable group of steps.
class Task {
public:
    [[nodiscard]] static Task ordered(std::vector<TaskStep> steps);
    [[nodiscard]] static Task parallel(std::vector<TaskStep> steps);

    [[nodiscard]] TaskMode mode() const noexcept { return mode_; }
    [[nodiscard]] const std::vector<TaskStep>& steps() const noexcept { return steps_; }
    [[nodiscard]] size_t size() const noexcept { return steps_.size(); }

private:
    Task(TaskMode mode, std::vector<TaskStep> steps) : mode_(mode), steps_(std::move(steps)) {}

    TaskMode mode_;
    std::vector<TaskStep> steps_;
};

struct StepResult {
    size_t index = 0;
    std::string server;
    std::string tool;
    StepStatus status = StepStatus::Skipped;
    std::optional<ToolResult> result;
    std::optional<ErrorInfo> error;
    int attempts = 0;
};

struct TaskResult {
    TaskMode mode = TaskMode::Ordered;
    std::vector<StepResult> steps;
    std::optional<size_t> first_failure;

    [[nodiscard]] bool ok() const noexcept { return !first_failure; }
    [[nodiscard]] size_t count(StepStatus status) const;
    [[nodiscard]] nlohmann::json to_json() const;
};

class TaskManager {
public:
    struct Options {
        size_t max_in_flight = 4;
        int default_retries = 1;
        /// Delay before each retry. max_attempts is replaced per step by
        /// 1 + the step's retry count.
        BackoffPolicy retry_backoff{2, std::chrono::milliseconds(100), 2.0, std::chrono::milliseconds(2000)};
    };

    explicit TaskManager(ToolInvoker& invoker);
    TaskManager(ToolInvoker& invoker, Options opts);

    [[nodiscard]] static Options options_from(const ClientSettings& settings);

    /// Run every step and report each outcome. Step failures never throw.
    TaskResult run(const Task& task);

private:
    TaskResult run_ordered(const Task& task);
    TaskResult run_parallel(const Task& task);
    StepResult run_step(size_t index, const TaskStep& step);
    bool may_retry_timeout(const TaskStep& step);

    ToolInvoker& invoker_;
    Options opts_;
};

/// Build a Task from {"mode": "ordered"|"parallel", "steps": [{"server",
/// "tool", "arguments", "timeoutMs", "retries", "idempotent"}]}.
/// Throws ConfigError.
[[nodiscard]] Task parse_task(const nlohmann::json& doc);

} // namespace toolbridge
