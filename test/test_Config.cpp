#include <gtest/gtest.h>
#include "Config.hpp"
#include <vector>

using namespace rendezvous;

namespace {
    RelayConfig parse(std::vector<const char*> args) {
        args.insert(args.begin(), "rendezvous_relay");
        return parseCommandLine(static_cast<int>(args.size()), args.data());
    }
}

TEST(ConfigTest, Defaults) {
    RelayConfig config = parse({});

    EXPECT_EQ(config.port, 4001);
    EXPECT_EQ(config.identityPath, "identity.key");
    EXPECT_EQ(config.maxReservations, 256u);
    EXPECT_EQ(config.discoveryMode, DiscoveryMode::Rooms);
    EXPECT_EQ(config.workerThreads, DEFAULT_WORKER_THREADS);
    EXPECT_EQ(config.sweepInterval.count(), 0);
    EXPECT_FALSE(config.verbose);
    EXPECT_FALSE(config.showHelp);
}

TEST(ConfigTest, ParsesSeparateAndInlineValues) {
    RelayConfig config = parse({"--port", "9000", "--identity=/tmp/relay.key", "--max-reservations", "8",
                                "--discovery=broadcast", "--threads", "4", "--sweep-interval=15", "--verbose"});

    EXPECT_EQ(config.port, 9000);
    EXPECT_EQ(config.identityPath, "/tmp/relay.key");
    EXPECT_EQ(config.maxReservations, 8u);
    EXPECT_EQ(config.discoveryMode, DiscoveryMode::Broadcast);
    EXPECT_EQ(config.workerThreads, 4u);
    EXPECT_EQ(config.sweepInterval.count(), 15);
    EXPECT_TRUE(config.verbose);
}

TEST(ConfigTest, HelpFlag) {
    EXPECT_TRUE(parse({"--help"}).showHelp);
    EXPECT_NE(usage("rendezvous_relay").find("--discovery"), std::string::npos);
}

TEST(ConfigTest, RejectsInvalidInput) {
    EXPECT_THROW(parse({"--port", "70000"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "-1"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port", "12ab"}), std::invalid_argument);
    EXPECT_THROW(parse({"--port"}), std::invalid_argument);
    EXPECT_THROW(parse({"--discovery", "mdns"}), std::invalid_argument);
    EXPECT_THROW(parse({"--threads", "0"}), std::invalid_argument);
    EXPECT_THROW(parse({"--identity="}), std::invalid_argument);
    EXPECT_THROW(parse({"--bogus"}), std::invalid_argument);
    EXPECT_THROW(parse({"--max-reservations", "99999999999999999999999"}), std::invalid_argument);
}
