#include "BroadcastDiscovery.hpp"
#include <iostream>

namespace rendezvous {

    BroadcastDiscovery::BroadcastDiscovery(bool verbose, std::string topic)
        : discoveryTopic(std::move(topic)), verbose(verbose) {}

    void BroadcastDiscovery::attach(NetworkHost& host) {
        if (host.subscribe(discoveryTopic)) {
            std::cout << "Subscribed to discovery topic " << discoveryTopic << std::endl;
        }
    }

    void BroadcastDiscovery::onTopicMessage(const TopicMessage& message) {
        if (message.topic != discoveryTopic) {
            return;
        }
        ++announcements;
        if (verbose) {
            std::cout << "[debug] Announcement from " << message.source << " (" << message.data.size()
                      << " bytes, seqno " << message.seqno << ")" << std::endl;
        }
    }

    void BroadcastDiscovery::onSubscribed(const TopicSubscribed& event) {
        if (event.topic == discoveryTopic) {
            std::cout << "Peer " << event.peerId << " joined " << discoveryTopic << std::endl;
        }
    }

    void BroadcastDiscovery::onUnsubscribed(const TopicUnsubscribed& event) {
        if (event.topic == discoveryTopic) {
            std::cout << "Peer " << event.peerId << " left " << discoveryTopic << std::endl;
        }
    }

} // namespace rendezvous
