#include "bus/message_bus.h"

#include "messages/messages.h"

#include <iostream>

namespace courier {

bool is_priority_channel(const std::string& channel) {
    return channel == channel::kSystemReset || channel == channel::kSystemInit;
}

void dispatch_guarded(const char* tag,
                      const std::string& channel,
                      const MessageBus::Handler& handler,
                      const nlohmann::json& payload) {
    try {
        handler(payload);
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[" << tag << "] Malformed payload on " << channel
                  << ": " << e.what() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[" << tag << "] Error handling " << channel
                  << ": " << e.what() << "\n";
    }
}

} // namespace courier
