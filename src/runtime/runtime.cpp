#include "runtime/runtime.h"

#include <cstdio>

namespace courier {

Runtime::Runtime(const Config& config, Clock clock)
    : config_(config)
    , clock_(std::move(clock))
    , knowledge_(bus_, config_, clock_)
    , environment_(bus_, config_)
    , monitor_(bus_, clock_)
    , analyzer_(bus_)
    , planner_(bus_, clock_)
    , executor_(bus_, clock_)
    , pacer_(bus_, config_)
{
}

void Runtime::start() {
    pacer_.init();
    drain();
}

bool Runtime::tick() {
    const bool acked = pacer_.tick();
    drain();   // trailing knowledge.set / environment.deliver
    return acked;
}

std::string Runtime::next_order_id() {
    char id[16];
    std::snprintf(id, sizeof(id), "ORD_%03d", next_order_.fetch_add(1));
    return id;
}

std::string Runtime::add_order(const Coord& destination) {
    const std::string id = next_order_id();
    add_order(id, destination);
    return id;
}

void Runtime::add_order(const std::string& order_id, const Coord& destination) {
    knowledge_.add_order(order_id, destination, clock_());
    drain();
}

std::string Runtime::post_order(const Coord& destination) {
    const std::string id = next_order_id();
    bus_.publish(channel::kUserAddOrder, nlohmann::json{{"order_id", id}, {"destination", destination}});
    return id;
}

Terrain Runtime::toggle_obstacle(const Coord& cell) {
    const Terrain t = environment_.toggle_obstacle(cell);
    drain();
    return t;
}

void Runtime::reset() {
    post_reset();
    drain();
}

void Runtime::post_reset() {
    pacer_.reset();
    next_order_.store(1);
}

size_t Runtime::drain() {
    size_t n = 0;
    while (bus_.queued() > 0) {
        n += bus_.pump(std::chrono::milliseconds(0));
    }
    return n;
}

} // namespace courier
