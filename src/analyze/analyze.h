#pragma once

#include "bus/message_bus.h"
#include "messages/messages.h"

#include <string>

namespace courier {

struct Verdict {
    Decision    decision{Decision::NoAction};
    std::string reason;
};

// First matching rule wins:
//   1. Collecting, and pending >= capacity or (pending > 0 and timeout) → StartMission
//   2. robot stuck                                                      → EnterStuck
//   3. Active/Returning, and leg blocked or obstacles changed           → Replan
//   4. Stuck and a route exists again                                    → Resume
//   5. Active and every carried order delivered                          → BeginReturn
//   6. Returning and at base                                             → CompleteMission
//   7.                                                                   → NoAction
Verdict decide(const Facts& facts);

// Consumes monitor.result, publishes analyze.result. Results not newer than
// the last one handled, or issued before a reset, are dropped.
class Analyzer {
public:
    explicit Analyzer(MessageBus& bus);

    Analyzer(const Analyzer&) = delete;
    Analyzer& operator=(const Analyzer&) = delete;

private:
    void on_result(const nlohmann::json& payload);
    void on_reset(const nlohmann::json& payload);

    MessageBus& bus_;
    uint64_t    last_seq_{0};
    uint64_t    floor_seq_{0};
};

} // namespace courier
