/**
 * @file emit.cpp
 * @brief Example: Emitting events to a principal with the Courier C++ client
 *
 * Usage: courier_emit [principal] [address]
 */

#include <courier_client/client.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

int main(int argc, char* argv[]) {
    const std::string principal = argc > 1 ? argv[1] : "user-42";
    const std::string address = argc > 2 ? argv[2] : "localhost:50061";

    try {
        courier::client::Client client(address);
        std::cout << "Emitting to " << principal << " via " << address << "\n";

        // Acknowledged delivery, queued if the principal is offline
        auto result = client.emitToPrincipal(principal, "message.new", R"({"text": "hello"})");
        if (!result.success) {
            std::cerr << "Emit failed: " << result.error_message << "\n";
            return 1;
        }
        std::cout << "Emitted: envelope_id=" << result.envelope_id
                  << ", transmitted=" << result.transmitted
                  << (result.queued ? " [QUEUED]" : "") << "\n";

        // Fire-and-forget, short-lived
        courier::client::EmitOptions typing;
        typing.fire_and_forget = true;
        typing.ttl_ms = 5000;
        result = client.emitToPrincipal(principal, "typing.start", "{}", typing);
        std::cout << "Typing indicator: transmitted=" << result.transmitted << "\n";

        // Idempotent retry: the second emit with the same id is reported as a duplicate
        courier::client::EmitOptions idempotent;
        idempotent.envelope_id = "order-1001-shipped";
        idempotent.priority = courier::core::Priority::HIGH;
        for (int i = 0; i < 2; ++i) {
            result = client.emitToPrincipal(principal, "order.shipped", R"({"order": 1001})", idempotent);
            std::cout << "Order update #" << i
                      << ": duplicate=" << (result.duplicate ? "yes" : "no") << "\n";
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }

        std::cout << "Done!\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
