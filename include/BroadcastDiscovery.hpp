#pragma once
#ifndef RENDEZVOUS_BROADCAST_DISCOVERY_HPP
#define RENDEZVOUS_BROADCAST_DISCOVERY_HPP

#include "NetworkHost.hpp"
#include "Types.hpp"
#include <atomic>
#include <string>

namespace rendezvous {

    /**
     * Topic-based discovery. The relay joins the shared topic so announcements propagate
     * through it; clients assemble membership themselves.
     */
    class BroadcastDiscovery {
        public:
            explicit BroadcastDiscovery(bool verbose = false, std::string topic = DISCOVERY_TOPIC);

            BroadcastDiscovery(const BroadcastDiscovery&) = delete;
            BroadcastDiscovery& operator=(const BroadcastDiscovery&) = delete;

            void attach(NetworkHost& host);

            void onTopicMessage(const TopicMessage& message);
            void onSubscribed(const TopicSubscribed& event);
            void onUnsubscribed(const TopicUnsubscribed& event);

            const std::string& topic() const { return discoveryTopic; }
            uint64_t announcementsObserved() const { return announcements.load(); }

        private:
            const std::string discoveryTopic;
            const bool verbose;
            std::atomic<uint64_t> announcements{0};
    };

} // namespace rendezvous

#endif // RENDEZVOUS_BROADCAST_DISCOVERY_HPP
