#pragma once

#include "bus/message_bus.h"

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace courier {

// Single-process bus. publish() only enqueues; pump() drains the queue on
// the calling thread, including anything handlers publish while it runs,
// so one pump() after a tick trigger runs the whole causal chain.
// publish() is safe from any thread; pump() is not re-entrant.
class InProcessBus : public MessageBus {
public:
    void subscribe(const std::string& channel, Handler handler) override;
    void publish(const std::string& channel, const nlohmann::json& payload) override;
    size_t pump(std::chrono::milliseconds timeout) override;

    size_t queued() const;

private:
    using Message = std::pair<std::string, nlohmann::json>;

    bool pop(Message& out);

    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<Message>     priority_;
    std::deque<Message>     normal_;
    bool                    pumping_{false};

    std::mutex                                  handlers_mu_;
    std::map<std::string, std::vector<Handler>> handlers_;
};

} // namespace courier
