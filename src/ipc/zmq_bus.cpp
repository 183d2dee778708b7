#include "ipc/zmq_bus.h"

#include "errors/errors.h"

#include <zmq.h>

#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <regex>
#include <utility>
#include <vector>

namespace courier {

// ── Helpers ─────────────────────────────────────────────────────

std::string derive_sub_endpoint(const std::string& pub_endpoint) {
    // Match trailing port number, e.g. "tcp://127.0.0.1:5555"
    std::regex re(R"(^(.*:)(\d+)$)");
    std::smatch m;
    if (std::regex_match(pub_endpoint, m, re)) {
        int port = std::stoi(m[2].str()) + 1;
        return m[1].str() + std::to_string(port);
    }
    throw TransportError("cannot derive subscriber endpoint from '" +
                         pub_endpoint + "'");
}

static std::string zmq_error(const std::string& what) {
    return what + ": " + zmq_strerror(zmq_errno());
}

// Receive one frame; returns false if nothing is ready.
static bool recv_frame(void* socket, std::string& out, bool& more) {
    zmq_msg_t msg;
    zmq_msg_init(&msg);
    int rc = zmq_msg_recv(&msg, socket, ZMQ_DONTWAIT);
    if (rc == -1) {
        zmq_msg_close(&msg);
        return false;
    }
    out.assign(static_cast<char*>(zmq_msg_data(&msg)), zmq_msg_size(&msg));
    more = zmq_msg_more(&msg) != 0;
    zmq_msg_close(&msg);
    return true;
}

// ── Impl ────────────────────────────────────────────────────────

struct ZmqBus::Impl {
    std::string name;
    std::string pub_endpoint;
    std::string sub_endpoint;
    bool        connected{false};
    void*       zmq_ctx = nullptr;
    void*       zmq_pub = nullptr;
    void*       zmq_sub = nullptr;

    std::mutex                                  mu;   // guards handlers + pub socket
    std::map<std::string, std::vector<Handler>> handlers;
};

ZmqBus::ZmqBus(const std::string& name,
               const std::string& pub_endpoint,
               const std::string& sub_endpoint)
    : impl_(std::make_unique<Impl>())
{
    impl_->name         = name;
    impl_->pub_endpoint = pub_endpoint;
    impl_->sub_endpoint = sub_endpoint;
}

ZmqBus::~ZmqBus() { disconnect(); }

// ── Connect / disconnect ────────────────────────────────────────

void ZmqBus::connect() {
    std::cout << "[BUS] " << impl_->name << ": PUB to " << impl_->pub_endpoint
              << ", SUB to " << impl_->sub_endpoint << "...\n";

    impl_->zmq_ctx = zmq_ctx_new();
    if (!impl_->zmq_ctx) throw TransportError(zmq_error("zmq_ctx_new"));

    impl_->zmq_pub = zmq_socket(impl_->zmq_ctx, ZMQ_PUB);
    if (!impl_->zmq_pub || zmq_connect(impl_->zmq_pub, impl_->pub_endpoint.c_str()) != 0) {
        throw TransportError(zmq_error("PUB connect " + impl_->pub_endpoint));
    }

    impl_->zmq_sub = zmq_socket(impl_->zmq_ctx, ZMQ_SUB);
    if (!impl_->zmq_sub || zmq_connect(impl_->zmq_sub, impl_->sub_endpoint.c_str()) != 0) {
        throw TransportError(zmq_error("SUB connect " + impl_->sub_endpoint));
    }

    {
        std::lock_guard lock(impl_->mu);
        for (const auto& [channel, handlers] : impl_->handlers) {
            (void)handlers;
            zmq_setsockopt(impl_->zmq_sub, ZMQ_SUBSCRIBE, channel.data(), channel.size());
        }
    }

    impl_->connected = true;
    std::cout << "[BUS] " << impl_->name << ": connected.\n";
}

void ZmqBus::disconnect() {
    // Also releases whatever a failed connect() managed to open.
    if (!impl_ || !impl_->zmq_ctx) return;

    int linger = 0;
    if (impl_->zmq_pub) {
        zmq_setsockopt(impl_->zmq_pub, ZMQ_LINGER, &linger, sizeof(linger));
        zmq_close(impl_->zmq_pub);
    }
    if (impl_->zmq_sub) zmq_close(impl_->zmq_sub);
    if (impl_->zmq_ctx) zmq_ctx_destroy(impl_->zmq_ctx);
    impl_->zmq_pub = nullptr;
    impl_->zmq_sub = nullptr;
    impl_->zmq_ctx = nullptr;

    if (impl_->connected) {
        std::cout << "[BUS] " << impl_->name << ": disconnected.\n";
    }
    impl_->connected = false;
}

// ── Subscribe / publish ─────────────────────────────────────────

void ZmqBus::subscribe(const std::string& channel, Handler handler) {
    std::lock_guard lock(impl_->mu);
    const bool first = impl_->handlers.find(channel) == impl_->handlers.end();
    impl_->handlers[channel].push_back(std::move(handler));
    if (first && impl_->connected) {
        zmq_setsockopt(impl_->zmq_sub, ZMQ_SUBSCRIBE, channel.data(), channel.size());
    }
}

void ZmqBus::publish(const std::string& channel, const nlohmann::json& payload) {
    if (!impl_->connected) return;

    const std::string body = payload.dump();
    std::lock_guard lock(impl_->mu);
    // Fire-and-forget: a full queue drops the message.
    if (zmq_send(impl_->zmq_pub, channel.data(), channel.size(),
                 ZMQ_SNDMORE | ZMQ_DONTWAIT) == -1 ||
        zmq_send(impl_->zmq_pub, body.data(), body.size(), ZMQ_DONTWAIT) == -1) {
        std::cerr << "[BUS] " << impl_->name << ": dropped " << channel
                  << " (" << zmq_strerror(zmq_errno()) << ")\n";
    }
}

// ── Pump ────────────────────────────────────────────────────────

size_t ZmqBus::pump(std::chrono::milliseconds timeout) {
    if (!impl_->connected) return 0;

    zmq_pollitem_t item{impl_->zmq_sub, 0, ZMQ_POLLIN, 0};
    int rc = zmq_poll(&item, 1, static_cast<long>(timeout.count()));
    if (rc <= 0) return 0;

    std::vector<std::pair<std::string, std::string>> batch;
    std::string channel;
    bool more = false;
    while (recv_frame(impl_->zmq_sub, channel, more)) {
        if (!more) {
            std::cerr << "[BUS] " << impl_->name << ": single-frame message on "
                      << channel << " ignored\n";
            continue;
        }
        std::string body;
        if (!recv_frame(impl_->zmq_sub, body, more)) break;
        // Swallow any unexpected trailing frames.
        std::string extra;
        while (more && recv_frame(impl_->zmq_sub, extra, more)) {}
        batch.emplace_back(std::move(channel), std::move(body));
    }

    std::stable_partition(batch.begin(), batch.end(), [](const auto& m) {
        return is_priority_channel(m.first);
    });

    size_t count = 0;
    for (const auto& [ch, body] : batch) {
        nlohmann::json payload;
        try {
            payload = nlohmann::json::parse(body);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[BUS] " << impl_->name << ": JSON parse error on "
                      << ch << ": " << e.what() << "\n";
            continue;
        }

        std::vector<Handler> handlers;
        {
            std::lock_guard lock(impl_->mu);
            auto it = impl_->handlers.find(ch);
            if (it != impl_->handlers.end()) handlers = it->second;
        }
        for (const auto& h : handlers) {
            dispatch_guarded("BUS", ch, h, payload);
        }
        ++count;
    }
    return count;
}

// ── Forwarder ───────────────────────────────────────────────────

static void forward_message(void* from, void* to) {
    while (true) {
        zmq_msg_t msg;
        zmq_msg_init(&msg);
        if (zmq_msg_recv(&msg, from, ZMQ_DONTWAIT) == -1) {
            zmq_msg_close(&msg);
            return;
        }
        const bool more = zmq_msg_more(&msg) != 0;
        zmq_msg_send(&msg, to, more ? ZMQ_SNDMORE : 0);
        zmq_msg_close(&msg);
        if (!more) return;
    }
}

void run_forwarder(const std::string& frontend,
                   const std::string& backend,
                   std::atomic<bool>& running) {
    void* ctx = zmq_ctx_new();
    if (!ctx) throw TransportError(zmq_error("zmq_ctx_new"));

    void* xsub = zmq_socket(ctx, ZMQ_XSUB);
    void* xpub = zmq_socket(ctx, ZMQ_XPUB);
    if (!xsub || !xpub ||
        zmq_bind(xsub, frontend.c_str()) != 0 ||
        zmq_bind(xpub, backend.c_str()) != 0) {
        std::string err = zmq_error("forwarder bind " + frontend + " / " + backend);
        if (xsub) zmq_close(xsub);
        if (xpub) zmq_close(xpub);
        zmq_ctx_destroy(ctx);
        throw TransportError(err);
    }

    std::cout << "[BUS] Forwarder up: XSUB " << frontend << " → XPUB " << backend << "\n";

    zmq_pollitem_t items[] = {
        {xsub, 0, ZMQ_POLLIN, 0},
        {xpub, 0, ZMQ_POLLIN, 0},
    };
    while (running.load()) {
        if (zmq_poll(items, 2, 100) <= 0) continue;
        if (items[0].revents & ZMQ_POLLIN) forward_message(xsub, xpub);  // data
        if (items[1].revents & ZMQ_POLLIN) forward_message(xpub, xsub);  // subscriptions
    }

    int linger = 0;
    zmq_setsockopt(xpub, ZMQ_LINGER, &linger, sizeof(linger));
    zmq_close(xsub);
    zmq_close(xpub);
    zmq_ctx_destroy(ctx);
    std::cout << "[BUS] Forwarder stopped.\n";
}

} // namespace courier
