#pragma once
#include <chrono>
#include <cstdint>
#include <exception>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace toolbridge {

/// One outbound request awaiting its response.
struct PendingRequest {
    int64_t id = 0;
    std::string method;
    std::string payload;
    std::chrono::steady_clock::time_point deadline;
    std::promise<nlohmann::json> promise;
};

/// Correlation id -> PendingRequest for one session.
///
/// Every completion path (response, timeout, cancel, disconnect, close)
/// first extracts the entry under the lock and then fills the promise, so
/// each slot is written exactly once and later writers see `false`.
class PendingTable {
public:
    PendingTable() = default;
    PendingTable(const PendingTable&) = delete;
    PendingTable& operator=(const PendingTable&) = delete;

    /// Allocate the next correlation id. Ids are never reused.
    [[nodiscard]] int64_t next_id();

    /// Register an entry and return the future its completion fills.
    /// Throws the rejection error once fail_all(..., true) has run.
    [[nodiscard]] std::future<nlohmann::json> insert(int64_t id, std::string method, std::string payload,
                                                     std::chrono::steady_clock::time_point deadline);

    /// Deliver a result. Returns false if the id is unknown or already done.
    bool complete(int64_t id, nlohmann::json result);

    /// Deliver an error. Returns false if the id is unknown or already done.
    bool fail(int64_t id, std::exception_ptr error);

    /// Fail every entry with `error`. With reject_new, later insert()
    /// calls throw `error` too. Returns the number of entries failed.
    size_t fail_all(std::exception_ptr error, bool reject_new);

    [[nodiscard]] size_t size() const;

    /// Method of a pending entry, empty when unknown.
    [[nodiscard]] std::string method_of(int64_t id) const;

    /// Ids whose deadline is at or before `now`.
    [[nodiscard]] std::vector<int64_t> expired(std::chrono::steady_clock::time_point now) const;

private:
    mutable std::mutex mutex_;
    std::map<int64_t, PendingRequest> entries_;
    int64_t next_id_{1};
    std::exception_ptr rejection_;
};

} // namespace toolbridge
