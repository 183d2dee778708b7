#include "bus/in_process_bus.h"

namespace courier {

void InProcessBus::subscribe(const std::string& channel, Handler handler) {
    std::lock_guard lock(handlers_mu_);
    handlers_[channel].push_back(std::move(handler));
}

void InProcessBus::publish(const std::string& channel, const nlohmann::json& payload) {
    {
        std::lock_guard lock(mu_);
        if (is_priority_channel(channel)) {
            priority_.emplace_back(channel, payload);
        } else {
            normal_.emplace_back(channel, payload);
        }
    }
    cv_.notify_one();
}

bool InProcessBus::pop(Message& out) {
    std::lock_guard lock(mu_);
    auto& q = !priority_.empty() ? priority_ : normal_;
    if (q.empty()) return false;
    out = std::move(q.front());
    q.pop_front();
    return true;
}

size_t InProcessBus::pump(std::chrono::milliseconds timeout) {
    {
        std::unique_lock lock(mu_);
        if (pumping_) return 0;
        if (timeout.count() > 0) {
            cv_.wait_for(lock, timeout,
                         [this] { return !priority_.empty() || !normal_.empty(); });
        }
        pumping_ = true;
    }

    size_t count = 0;
    Message msg;
    while (pop(msg)) {
        std::vector<Handler> handlers;
        {
            std::lock_guard lock(handlers_mu_);
            auto it = handlers_.find(msg.first);
            if (it != handlers_.end()) handlers = it->second;
        }
        for (const auto& h : handlers) {
            dispatch_guarded("BUS", msg.first, h, msg.second);
        }
        ++count;
    }

    std::lock_guard lock(mu_);
    pumping_ = false;
    return count;
}

size_t InProcessBus::queued() const {
    std::lock_guard lock(mu_);
    return priority_.size() + normal_.size();
}

} // namespace courier
