#include "resolver_pool.hpp"
#include "shyradar/logging.hpp"
#include <stdexcept>

namespace shyradar {
namespace identity {

ResolverPool::ResolverPool(IdentityResolver& resolver, int max_in_flight)
    : resolver_(resolver), max_in_flight_(max_in_flight) {
    if (max_in_flight_ <= 0) {
        throw std::invalid_argument("max_in_flight must be positive");
    }

    running_ = true;
    workers_.reserve(static_cast<size_t>(max_in_flight_));
    for (int i = 0; i < max_in_flight_; i++) {
        workers_.emplace_back(&ResolverPool::workerLoop, this);
    }
    LOG_RESOLVE(DEBUG, "Resolver pool started with %d workers", max_in_flight_);
}

ResolverPool::~ResolverPool() {
    stop();
}

bool ResolverPool::submit(const Sighting& sighting) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return false;
        }

        auto it = active_.find(sighting.device_id);
        if (it != active_.end() && it->second.epoch == epoch_) {
            if (sighting.observed_at >= it->second.latest.observed_at) {
                it->second.latest = sighting;
            }
            LOG_RESOLVE(TRACE, "Device %s already resolving, coalesced",
                        sighting.device_id.c_str());
            return false;
        }

        active_[sighting.device_id] = Active{epoch_, sighting};
        queue_.push_back(Request{epoch_, sighting});
    }
    work_cv_.notify_one();
    return true;
}

std::vector<ResolveCompletion> ResolverPool::drainCompleted() {
    std::vector<ResolveCompletion> drained;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        drained.reserve(completed_.size());
        for (auto& completion : completed_) {
            if (completion.epoch == epoch_) {
                drained.push_back(std::move(completion));
            } else {
                stale_dropped_++;
                LOG_RESOLVE(DEBUG, "Dropping stale result for device %s (epoch %llu)",
                            completion.sighting.device_id.c_str(),
                            static_cast<unsigned long long>(completion.epoch));
            }
        }
        completed_.clear();
    }
    return drained;
}

void ResolverPool::invalidate() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        epoch_++;
        queue_.clear();
        active_.clear();
        // In-flight results come back tagged with the old epoch and are dropped on drain
    }
    resolver_.invalidate();
    idle_cv_.notify_all();
}

void ResolverPool::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) {
            return;
        }
        running_ = false;
        queue_.clear();
        active_.clear();
    }
    work_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    idle_cv_.notify_all();
    LOG_RESOLVE(DEBUG, "Resolver pool stopped");
}

bool ResolverPool::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return queue_.empty() && in_flight_ == 0; });
}

uint64_t ResolverPool::epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

size_t ResolverPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + in_flight_;
}

uint64_t ResolverPool::staleDropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stale_dropped_;
}

void ResolverPool::workerLoop() {
    while (true) {
        Request request;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            work_cv_.wait(lock, [this] { return !running_ || !queue_.empty(); });
            if (!running_) {
                return;
            }
            request = std::move(queue_.front());
            queue_.pop_front();
            in_flight_++;
        }

        ResolveResult result;
        try {
            result = resolver_.resolve(request.sighting);
        } catch (const std::exception& e) {
            // Non-DirectoryError failures are reported as an outage too
            LOG_RESOLVE(ERROR, "Resolve failed for device %s: %s",
                        request.sighting.device_id.c_str(), e.what());
            result.status = ResolveStatus::DirectoryUnavailable;
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = active_.find(request.sighting.device_id);
            if (it != active_.end() && it->second.epoch == request.epoch) {
                // Report the freshest observation of this device
                request.sighting = std::move(it->second.latest);
                active_.erase(it);
            }
            completed_.push_back(ResolveCompletion{request.epoch, std::move(request.sighting),
                                                   std::move(result)});
            in_flight_--;
        }
        idle_cv_.notify_all();
    }
}

} // namespace identity
} // namespace shyradar
