#include "RoomRegistry.hpp"

namespace rendezvous {

    RoomRegistry::RoomRegistry(Clock::duration ttl) : peerTtl(ttl) {}

    size_t RoomRegistry::pruneRoom(Room& room, Clock::time_point now) const {
        size_t removed = 0;
        auto it = room.begin();
        while (it != room.end()) {
            if (now - it->second.lastSeen >= peerTtl) {
                it = room.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::vector<PeerInfo> RoomRegistry::registerPeer(const std::string& roomName, const std::string& peerId,
                                                     std::vector<std::string> addrs, Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mtx);

        auto existing = rooms.find(roomName);
        if (existing != rooms.end()) {
            pruneRoom(existing->second, now);
        }

        Room& room = rooms[roomName];
        RoomEntry& entry = room[peerId];
        entry.addrs = std::move(addrs);
        entry.lastSeen = now;

        std::vector<PeerInfo> others;
        others.reserve(room.size() - 1);
        for (const auto& [memberId, member] : room) {
            if (memberId != peerId) {
                others.push_back(PeerInfo{memberId, member.addrs});
            }
        }

        return others;
    }

    size_t RoomRegistry::removePeer(const std::string& peerId) {
        std::lock_guard<std::mutex> lock(mtx);

        size_t removedFrom = 0;
        auto it = rooms.begin();
        while (it != rooms.end()) {
            removedFrom += it->second.erase(peerId);
            if (it->second.empty()) {
                it = rooms.erase(it);
            } else {
                ++it;
            }
        }

        return removedFrom;
    }

    size_t RoomRegistry::pruneExpired(Clock::time_point now) {
        std::lock_guard<std::mutex> lock(mtx);

        size_t removed = 0;
        auto it = rooms.begin();
        while (it != rooms.end()) {
            removed += pruneRoom(it->second, now);
            if (it->second.empty()) {
                it = rooms.erase(it);
            } else {
                ++it;
            }
        }

        return removed;
    }

    std::vector<std::string> RoomRegistry::roomNames() const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<std::string> names;
        names.reserve(rooms.size());
        for (const auto& [name, room] : rooms) {
            names.push_back(name);
        }
        return names;
    }

    std::vector<PeerInfo> RoomRegistry::members(const std::string& roomName) const {
        std::lock_guard<std::mutex> lock(mtx);

        std::vector<PeerInfo> result;
        auto it = rooms.find(roomName);
        if (it == rooms.end()) {
            return result;
        }

        result.reserve(it->second.size());
        for (const auto& [peerId, entry] : it->second) {
            result.push_back(PeerInfo{peerId, entry.addrs});
        }
        return result;
    }

    size_t RoomRegistry::roomCount() const {
        std::lock_guard<std::mutex> lock(mtx);
        return rooms.size();
    }

    size_t RoomRegistry::entryCount() const {
        std::lock_guard<std::mutex> lock(mtx);

        size_t total = 0;
        for (const auto& [name, room] : rooms) {
            total += room.size();
        }
        return total;
    }

} // namespace rendezvous
