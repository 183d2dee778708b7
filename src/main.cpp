#include "analyze/analyze.h"
#include "config/config.h"
#include "environment/environment.h"
#include "errors/errors.h"
#include "execute/execute.h"
#include "ipc/zmq_bus.h"
#include "knowledge/knowledge.h"
#include "messages/messages.h"
#include "monitor/monitor.h"
#include "pacer/pacer.h"
#include "planner/planner.h"
#include "runtime/runtime.h"

#include <poll.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

static std::atomic<bool> g_running{true};

static void signal_handler(int) { g_running.store(false); }

static void usage() {
    std::cerr << "usage: courier <role>\n"
                 "  all          every component in one process, commands on stdin\n"
                 "  broker       XSUB/XPUB forwarder\n"
                 "  knowledge | environment | monitor | analyze | plan | execute\n"
                 "  pacer        tick source\n";
}

// One component on its own ZeroMQ connection, pumped until shutdown.
template <typename Component, typename... Args>
static void serve(const char* name, const courier::Config& cfg, Args&&... args) {
    courier::ZmqBus bus(name, cfg.broker_pub, cfg.broker_sub);
    Component component(bus, std::forward<Args>(args)...);
    bus.connect();

    while (g_running.load()) {
        bus.pump(std::chrono::milliseconds(100));
    }
    bus.disconnect();
}

// Reads user commands while `courier all` runs:
//   order <x> <y> | toggle <x> <y> | reset | status | quit
static void console_loop(courier::Runtime& rt) {
    using nlohmann::json;

    while (g_running.load()) {
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        if (::poll(&pfd, 1, 100) <= 0) continue;

        std::string line;
        if (!std::getline(std::cin, line)) {
            // stdin closed: keep running headless.
            return;
        }
        std::istringstream in(line);
        std::string cmd;
        in >> cmd;

        courier::Coord c;
        if (cmd == "order" && in >> c.x >> c.y) {
            rt.post_order(c);
        } else if (cmd == "toggle" && in >> c.x >> c.y) {
            rt.bus().publish(courier::channel::kUserToggleObstacle, json{{"position", c}});
        } else if (cmd == "reset") {
            rt.post_reset();
        } else if (cmd == "status") {
            const auto k = rt.knowledge();
            const auto e = rt.environment();
            std::cout << "[COURIER] " << courier::to_string(k.mission_state)
                      << ", robot at " << courier::to_string(e.robot.position)
                      << ", pending " << k.pending_count()
                      << ", carried " << k.carried.size()
                      << ", delivered " << k.metrics.total_deliveries
                      << ", distance " << k.metrics.total_distance
                      << ", replans " << k.metrics.replan_count << "\n";
        } else if (cmd == "quit") {
            g_running.store(false);
        } else if (!cmd.empty()) {
            std::cerr << "[COURIER] Unknown command: " << line << "\n";
        }
    }
}

static int run_all(const courier::Config& cfg) {
    courier::Runtime rt(cfg);
    rt.start();

    std::thread console_thread([&] { console_loop(rt); });

    rt.pacer().run(g_running);

    g_running.store(false);
    console_thread.join();
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        usage();
        return 2;
    }
    const std::string role = argv[1];

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cout << "[COURIER] Delivery loop v0.1.0 starting (" << role << ")...\n";

    try {
        const courier::Config cfg = courier::load_config_from_env();

        if (role == "all") {
            run_all(cfg);
        } else if (role == "broker") {
            courier::run_forwarder(cfg.broker_pub, cfg.broker_sub, g_running);
        } else if (role == "knowledge") {
            serve<courier::KnowledgeStore>("knowledge", cfg, cfg);
        } else if (role == "environment") {
            serve<courier::Environment>("environment", cfg, cfg);
        } else if (role == "monitor") {
            serve<courier::Monitor>("monitor", cfg);
        } else if (role == "analyze") {
            serve<courier::Analyzer>("analyze", cfg);
        } else if (role == "plan") {
            serve<courier::Planner>("plan", cfg);
        } else if (role == "execute") {
            serve<courier::Executor>("execute", cfg);
        } else if (role == "pacer") {
            courier::ZmqBus bus("pacer", cfg.broker_pub, cfg.broker_sub);
            courier::Pacer pacer(bus, cfg);
            bus.connect();
            // Give subscribers time to join before the first init goes out.
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            pacer.init();
            pacer.run(g_running);
            bus.disconnect();
        } else {
            usage();
            return 2;
        }
    } catch (const courier::Error& e) {
        std::cerr << "[COURIER] Fatal: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[COURIER] Goodbye.\n";
    return 0;
}
