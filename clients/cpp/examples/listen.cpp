/**
 * @file listen.cpp
 * @brief Example: Receiving events with the Courier C++ client
 *
 * Demonstrates supervised reconnection and replay of missed envelopes.
 *
 * Usage: courier_listen [principal] [address]
 */

#include <courier_client/client.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

std::atomic<bool> running{true};

void signalHandler(int) {
    running = false;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signalHandler);

    courier::client::ClientOptions options;
    options.principal_id = argc > 1 ? argv[1] : "user-42";
    options.max_attempts = 0;  // 0 = retry forever
    options.probe_interval = std::chrono::seconds(15);
    const std::string address = argc > 2 ? argv[2] : "localhost:50061";

    try {
        courier::client::Client client(address, options);

        // Register connection state callback
        client.setStateHandler([](courier::client::ConnectionState state, const std::string& reason) {
            std::cout << "[Connection] " << courier::client::connectionStateToString(state)
                      << " (" << reason << ")\n";
        });

        client.setEnvelopeHandler([](const courier::client::ReceivedEnvelope& env) {
            std::cout << "Event: " << env.event << "\n";
            std::cout << "  Payload: " << env.payload << "\n";
            std::cout << "  Envelope ID: " << env.envelope_id << "\n";
            std::cout << "  Created: " << env.created_at_ms << "\n";
            std::cout << "\n";
        });

        client.setDeliveryFailedHandler([](const std::string& envelope_id, const std::string& reason) {
            std::cerr << "[Failed] " << envelope_id << ": " << reason << "\n";
        });

        std::cout << "Listening as " << options.principal_id << " on " << address << "\n";
        std::cout << "Press Ctrl+C to stop\n\n";
        client.connect();

        while (running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        std::cout << "\nShutting down...\n";
        client.disconnect();
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
