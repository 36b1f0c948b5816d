#pragma once
#ifndef RENDEZVOUS_TOPIC_ROUTER_HPP
#define RENDEZVOUS_TOPIC_ROUTER_HPP

#include "Message.hpp"
#include <deque>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include <cstdint>

namespace rendezvous {

    /**
     * Topic subscriptions per subscriber (connection id, or LOCAL_SUBSCRIBER for the node
     * itself) and the recently seen published message ids.
     */
    class TopicRouter {
        public:
            static constexpr uint64_t LOCAL_SUBSCRIBER = 0;

            explicit TopicRouter(size_t seenCacheSize = SEEN_MESSAGE_CACHE_SIZE);

            /** Returns false if `subscriber` was already on `topic` */
            bool subscribe(uint64_t subscriber, const std::string& topic);

            /** Returns false if `subscriber` was not on `topic` */
            bool unsubscribe(uint64_t subscriber, const std::string& topic);

            /** Drops every subscription of `subscriber`, returning the topics it left */
            std::vector<std::string> removeSubscriber(uint64_t subscriber);

            /**
             * @param topic Topic name.
             * @return Subscribers of `topic`, LOCAL_SUBSCRIBER included when the node joined it.
             */
            std::vector<uint64_t> subscribers(const std::string& topic) const;
            bool isSubscribed(uint64_t subscriber, const std::string& topic) const;
            size_t topicCount() const;

            /**
             * Records a message id. Returns false if it was already seen, in which case the
             * message must not be delivered again.
             */
            bool markSeen(const std::string& messageId);

            /** sha256 over source, sequence number and data */
            static std::string messageId(const PublishData& message);

        private:
            mutable std::mutex mtx;
            std::unordered_map<std::string, std::unordered_set<uint64_t>> topics;

            std::unordered_set<std::string> seenIds;
            std::deque<std::string> seenOrder;
            const size_t maxSeen;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_TOPIC_ROUTER_HPP
