#include "toolbridge/pending_table.hpp"
#include <stdexcept>

namespace toolbridge {

int64_t PendingTable::next_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_++;
}

std::future<nlohmann::json> PendingTable::insert(int64_t id, std::string method, std::string payload,
                                                 std::chrono::steady_clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rejection_) std::rethrow_exception(rejection_);

    PendingRequest req;
    req.id = id;
    req.method = std::move(method);
    req.payload = std::move(payload);
    req.deadline = deadline;
    auto future = req.promise.get_future();
    auto [it, inserted] = entries_.emplace(id, std::move(req));
    if (!inserted) {
        throw std::logic_error("correlation id " + std::to_string(id) + " is already pending");
    }
    return future;
}

bool PendingTable::complete(int64_t id, nlohmann::json result) {
    PendingRequest req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        req = std::move(it->second);
        entries_.erase(it);
    }
    req.promise.set_value(std::move(result));
    return true;
}

bool PendingTable::fail(int64_t id, std::exception_ptr error) {
    PendingRequest req;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) return false;
        req = std::move(it->second);
        entries_.erase(it);
    }
    req.promise.set_exception(error);
    return true;
}

size_t PendingTable::fail_all(std::exception_ptr error, bool reject_new) {
    std::map<int64_t, PendingRequest> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.swap(entries_);
        if (reject_new) rejection_ = error;
    }
    for (auto& [id, req] : drained) {
        req.promise.set_exception(error);
    }
    return drained.size();
}

size_t PendingTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::string PendingTable::method_of(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    return it == entries_.end() ? std::string() : it->second.method;
}

std::vector<int64_t> PendingTable::expired(std::chrono::steady_clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<int64_t> ids;
    for (const auto& [id, req] : entries_) {
        if (req.deadline <= now) ids.push_back(id);
    }
    return ids;
}

} // namespace toolbridge
