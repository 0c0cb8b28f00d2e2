#include "toolbridge/task.hpp"
#include "toolbridge/client.hpp"
#include "toolbridge/log.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

namespace toolbridge {

std::string_view to_string(TaskMode mode) {
    switch (mode) {
        case TaskMode::Ordered:  return "ordered";
        case TaskMode::Parallel: return "parallel";
    }
    return "unknown";
}

std::string_view to_string(StepStatus status) {
    switch (status) {
        case StepStatus::Succeeded: return "succeeded";
        case StepStatus::Failed:    return "failed";
        case StepStatus::Skipped:   return "skipped";
    }
    return "unknown";
}

Task Task::ordered(std::vector<TaskStep> steps) {
    return Task(TaskMode::Ordered, std::move(steps));
}

Task Task::parallel(std::vector<TaskStep> steps) {
    return Task(TaskMode::Parallel, std::move(steps));
}

// ---------- TaskResult ----------

size_t TaskResult::count(StepStatus status) const {
    return static_cast<size_t>(std::count_if(steps.begin(), steps.end(),
        [status](const StepResult& s) { return s.status == status; }));
}

nlohmann::json TaskResult::to_json() const {
    nlohmann::json j = {
        {"mode", std::string(to_string(mode))},
        {"ok", ok()},
        {"firstFailure", first_failure ? nlohmann::json(*first_failure) : nlohmann::json(nullptr)},
        {"steps", nlohmann::json::array()}
    };
    for (const auto& s : steps) {
        nlohmann::json step = {
            {"index", s.index},
            {"server", s.server},
            {"tool", s.tool},
            {"status", std::string(to_string(s.status))},
            {"attempts", s.attempts}
        };
        if (s.result) step["result"] = *s.result;
        if (s.error) step["error"] = *s.error;
        j["steps"].push_back(std::move(step));
    }
    return j;
}

// ---------- TaskManager ----------

TaskManager::TaskManager(ToolInvoker& invoker)
    : TaskManager(invoker, Options{}) {
}

TaskManager::TaskManager(ToolInvoker& invoker, Options opts)
    : invoker_(invoker), opts_(std::move(opts)) {
    if (opts_.max_in_flight == 0) opts_.max_in_flight = 1;
    if (opts_.default_retries < 0) opts_.default_retries = 0;
}

TaskManager::Options TaskManager::options_from(const ClientSettings& settings) {
    Options opts;
    opts.max_in_flight = settings.max_in_flight;
    opts.default_retries = settings.step_retries;
    opts.retry_backoff.initial_delay = settings.reconnect_delay;
    return opts;
}

TaskResult TaskManager::run(const Task& task) {
    auto logger = log::logger();
    logger->info("task started: {} steps, {}", task.size(), to_string(task.mode()));

    TaskResult result = task.mode() == TaskMode::Ordered ? run_ordered(task) : run_parallel(task);

    logger->info("task finished: {} succeeded, {} failed, {} skipped",
                 result.count(StepStatus::Succeeded), result.count(StepStatus::Failed),
                 result.count(StepStatus::Skipped));
    return result;
}

TaskResult TaskManager::run_ordered(const Task& task) {
    TaskResult result;
    result.mode = TaskMode::Ordered;
    const auto& steps = task.steps();

    for (size_t i = 0; i < steps.size(); ++i) {
        if (result.first_failure) {
            StepResult skipped;
            skipped.index = i;
            skipped.server = steps[i].server;
            skipped.tool = steps[i].tool;
            result.steps.push_back(std::move(skipped));
            continue;
        }
        result.steps.push_back(run_step(i, steps[i]));
        if (result.steps.back().status == StepStatus::Failed) result.first_failure = i;
    }
    return result;
}

TaskResult TaskManager::run_parallel(const Task& task) {
    TaskResult result;
    result.mode = TaskMode::Parallel;
    const auto& steps = task.steps();
    result.steps.resize(steps.size());

    std::atomic<size_t> next{0};
    auto worker = [&] {
        for (size_t i = next++; i < steps.size(); i = next++) {
            result.steps[i] = run_step(i, steps[i]);
        }
    };

    size_t n = std::min(opts_.max_in_flight, steps.size());
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (size_t w = 0; w < n; ++w) workers.emplace_back(worker);
    for (auto& t : workers) t.join();

    for (size_t i = 0; i < result.steps.size(); ++i) {
        if (result.steps[i].status == StepStatus::Failed) {
            result.first_failure = i;
            break;
        }
    }
    return result;
}

StepResult TaskManager::run_step(size_t index, const TaskStep& step) {
    auto logger = log::logger();
    StepResult r;
    r.index = index;
    r.server = step.server;
    r.tool = step.tool;

    BackoffPolicy policy = opts_.retry_backoff;
    policy.max_attempts = 1 + std::max(0, step.max_retries.value_or(opts_.default_retries));
    bool timeout_retried = false;

    for (int attempt = 1; policy.allows(attempt); ++attempt) {
        if (attempt > 1) {
            auto delay = policy.delay_for(attempt);
            logger->info("step {} ({}.{}): retry {} in {} ms", index, step.server, step.tool,
                         attempt - 1, delay.count());
            std::this_thread::sleep_for(delay);
        }
        r.attempts = attempt;
        try {
            ToolResult res = invoker_.invoke(step.server, step.tool, step.arguments, step.timeout);
            if (res.is_error) {
                std::string text = res.text();
                r.status = StepStatus::Failed;
                r.error = ErrorInfo{ErrorKind::Remote, text.empty() ? "tool reported an error" : text, std::nullopt};
                r.result = std::move(res);
                logger->warn("step {} ({}.{}) failed: tool reported an error", index, step.server, step.tool);
                return r;
            }
            r.status = StepStatus::Succeeded;
            r.result = std::move(res);
            r.error.reset();
            logger->debug("step {} ({}.{}) succeeded", index, step.server, step.tool);
            return r;
        } catch (const Error& e) {
            r.error = to_error_info(e);
            if (!is_transient(e.kind())) break;
            if (e.kind() == ErrorKind::Timeout) {
                // Timeouts run again only for idempotent tools, and only once.
                if (timeout_retried || !may_retry_timeout(step)) break;
                timeout_retried = true;
            }
            logger->warn("step {} ({}.{}) attempt {} failed: {}", index, step.server, step.tool,
                         attempt, e.what());
        } catch (const std::exception& e) {
            r.error = ErrorInfo{ErrorKind::Internal, e.what(), std::nullopt};
            break;
        }
    }

    r.status = StepStatus::Failed;
    logger->warn("step {} ({}.{}) failed after {} attempt(s): {}", index, step.server, step.tool,
                 r.attempts, r.error ? r.error->message : std::string());
    return r;
}

bool TaskManager::may_retry_timeout(const TaskStep& step) {
    if (step.idempotent) return *step.idempotent;
    return invoker_.idempotent_hint(step.server, step.tool).value_or(false);
}

// ---------- parse_task ----------

Task parse_task(const nlohmann::json& doc) {
    if (!doc.is_object()) throw ConfigError("task: document must be an object");

    TaskMode mode = TaskMode::Ordered;
    if (doc.contains("mode")) {
        const auto& m = doc["mode"];
        if (m == "ordered") mode = TaskMode::Ordered;
        else if (m == "parallel") mode = TaskMode::Parallel;
        else throw ConfigError("task: 'mode' must be \"ordered\" or \"parallel\"");
    }

    auto steps_it = doc.find("steps");
    if (steps_it == doc.end() || !steps_it->is_array()) {
        throw ConfigError("task: 'steps' must be an array");
    }

    std::vector<TaskStep> steps;
    for (size_t i = 0; i < steps_it->size(); ++i) {
        const auto& s = (*steps_it)[i];
        const std::string where = "task step " + std::to_string(i);
        if (!s.is_object()) throw ConfigError(where + ": must be an object");

        TaskStep step;
        for (const char* field : {"server", "tool"}) {
            if (!s.contains(field) || !s[field].is_string() || s[field].get<std::string>().empty()) {
                throw ConfigError(where + ": '" + field + "' must be a non-empty string");
            }
        }
        step.server = s["server"].get<std::string>();
        step.tool = s["tool"].get<std::string>();
        if (s.contains("arguments")) {
            if (!s["arguments"].is_object()) throw ConfigError(where + ": 'arguments' must be an object");
            step.arguments = s["arguments"];
        }
        if (s.contains("timeoutMs")) {
            const auto& t = s["timeoutMs"];
            if (!t.is_number_integer() || t.get<long long>() <= 0) {
                throw ConfigError(where + ": 'timeoutMs' must be a positive integer");
            }
            step.timeout = std::chrono::milliseconds(t.get<long long>());
        }
        if (s.contains("retries")) {
            const auto& r = s["retries"];
            if (!r.is_number_integer() || r.get<long long>() < 0 || r.get<long long>() > MAX_STEP_RETRIES) {
                throw ConfigError(where + ": 'retries' must be an integer in [0, "
                                  + std::to_string(MAX_STEP_RETRIES) + "]");
            }
            step.max_retries = static_cast<int>(r.get<long long>());
        }
        if (s.contains("idempotent")) {
            if (!s["idempotent"].is_boolean()) throw ConfigError(where + ": 'idempotent' must be a boolean");
            step.idempotent = s["idempotent"].get<bool>();
        }
        steps.push_back(std::move(step));
    }

    return mode == TaskMode::Ordered ? Task::ordered(std::move(steps)) : Task::parallel(std::move(steps));
}

} // namespace toolbridge
