#pragma once

#include "analyze/analyze.h"
#include "bus/in_process_bus.h"
#include "clock/clock.h"
#include "config/config.h"
#include "environment/environment.h"
#include "execute/execute.h"
#include "knowledge/knowledge.h"
#include "monitor/monitor.h"
#include "pacer/pacer.h"
#include "planner/planner.h"

#include <atomic>
#include <string>

namespace courier {

// Every component on one InProcessBus, driven from the calling thread.
// Backs `courier all` and the end-to-end tests.
class Runtime {
public:
    explicit Runtime(const Config& config, Clock clock = wall_clock);

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    // system.init, then drain.
    void start();

    // One full Monitor → Analyze → Plan → Execute chain.
    // Returns false if Execute did not acknowledge it.
    bool tick();

    // Next id in the ORD_001, ORD_002, ... series. Throws ValidationError.
    std::string add_order(const Coord& destination);
    void add_order(const std::string& order_id, const Coord& destination);

    // Queue user.add_order with the next id and return the id; the order
    // lands on the next drain. Safe from any thread.
    std::string post_order(const Coord& destination);

    // Shared by add_order and post_order.
    std::string next_order_id();

    // Throws InvalidCellError.
    Terrain toggle_obstacle(const Coord& cell);

    // system.reset, then drain. Order numbering restarts.
    void reset();

    // Queue system.reset without draining. Safe from any thread.
    void post_reset();

    // Dispatch everything queued.
    size_t drain();

    KnowledgeSnapshot   knowledge() const { return knowledge_.snapshot(); }
    EnvironmentSnapshot environment() const { return environment_.snapshot(); }

    InProcessBus&   bus() { return bus_; }
    Pacer&          pacer() { return pacer_; }
    const Executor& executor() const { return executor_; }

private:
    Config       config_;
    Clock        clock_;
    InProcessBus bus_;

    KnowledgeStore knowledge_;
    Environment    environment_;
    Monitor        monitor_;
    Analyzer       analyzer_;
    Planner        planner_;
    Executor       executor_;
    Pacer          pacer_;

    std::atomic<int> next_order_{1};
};

} // namespace courier
