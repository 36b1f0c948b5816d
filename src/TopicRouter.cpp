#include "TopicRouter.hpp"
#include "CryptoBase.hpp"

namespace rendezvous {

    TopicRouter::TopicRouter(size_t seenCacheSize) : maxSeen(seenCacheSize) {}

    bool TopicRouter::subscribe(uint64_t subscriber, const std::string& topic) {
        std::lock_guard<std::mutex> lock(mtx);
        return topics[topic].insert(subscriber).second;
    }

    bool TopicRouter::unsubscribe(uint64_t subscriber, const std::string& topic) {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = topics.find(topic);
        if (it == topics.end() || it->second.erase(subscriber) == 0) {
            return false;
        }
        if (it->second.empty()) {
            topics.erase(it);
        }
        return true;
    }

    std::vector<std::string> TopicRouter::removeSubscriber(uint64_t subscriber) {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<std::string> left;
        auto it = topics.begin();
        while (it != topics.end()) {
            if (it->second.erase(subscriber) > 0) {
                left.push_back(it->first);
            }
            if (it->second.empty()) {
                it = topics.erase(it);
            } else {
                ++it;
            }
        }
        return left;
    }

    std::vector<uint64_t> TopicRouter::subscribers(const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = topics.find(topic);
        if (it == topics.end()) {
            return {};
        }
        return std::vector<uint64_t>(it->second.begin(), it->second.end());
    }

    bool TopicRouter::isSubscribed(uint64_t subscriber, const std::string& topic) const {
        std::lock_guard<std::mutex> lock(mtx);

        auto it = topics.find(topic);
        return it != topics.end() && it->second.count(subscriber) > 0;
    }

    size_t TopicRouter::topicCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return topics.size();
    }

    bool TopicRouter::markSeen(const std::string& messageId) {
        std::lock_guard<std::mutex> lock(mtx);

        if (!seenIds.insert(messageId).second) {
            return false;
        }

        seenOrder.push_back(messageId);
        while (seenOrder.size() > maxSeen) {
            seenIds.erase(seenOrder.front());
            seenOrder.pop_front();
        }
        return true;
    }

    std::string TopicRouter::messageId(const PublishData& message) {
        PayloadWriter writer;
        writer.writeString(message.source);
        writer.writeU64(message.seqno);
        writer.writeBytes(message.data);
        return CryptoBase::sha256(writer.take());
    }

} // namespace rendezvous
