#include <iostream>
#include <csignal>
#include <atomic>
#include <stdexcept>

#include "Config.hpp"
#include "CryptoBase.hpp"
#include "IdentityManager.hpp"
#include "RelayNode.hpp"
#include "WebSocketHost.hpp"

using namespace rendezvous;

static std::atomic<bool> g_running(true);

void signal_handler(int signum) {
    (void)signum;
    g_running = false;
}

int main(int argc, char** argv) {
    RelayConfig config;
    try {
        config = parseCommandLine(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    if (config.showHelp) {
        std::cout << usage(argv[0]);
        return 0;
    }

    if (!CryptoBase::initialize()) {
        std::cerr << "Error: Failed to initialize crypto (sodium)." << std::endl;
        return 1;
    }

    try {
        Identity identity = IdentityManager::loadOrCreate(config.identityPath);
        std::cout << "Local PeerID: " << identity.peerId() << std::endl;

        WebSocketHost::Options hostOptions;
        hostOptions.port = config.port;
        hostOptions.maxReservations = config.maxReservations;
        hostOptions.workerThreads = config.workerThreads;
        hostOptions.verbose = config.verbose;
        WebSocketHost host(identity, hostOptions);

        RelayNode::Options nodeOptions;
        nodeOptions.mode = config.discoveryMode;
        nodeOptions.sweepInterval = config.sweepInterval;
        nodeOptions.verbose = config.verbose;
        RelayNode node(host, nodeOptions);

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        node.start();
        std::cout << "Relay running. Press Ctrl+C to exit." << std::endl;
        node.run(g_running);

        std::cout << "Shutting down..." << std::endl;
        node.stop();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
