#pragma once
#ifndef RENDEZVOUS_ROOM_REGISTRY_HPP
#define RENDEZVOUS_ROOM_REGISTRY_HPP

#include "Types.hpp"
#include <unordered_map>
#include <mutex>
#include <vector>
#include <string>
#include <chrono>

namespace rendezvous {

    /**
     * One member of a room as seen by other members.
     */
    struct PeerInfo {
        std::string peerId;
        std::vector<std::string> addrs;
    };

    struct RoomEntry {
        std::vector<std::string> addrs;
        std::chrono::steady_clock::time_point lastSeen;
    };

    /**
     * Room name -> (peer id -> entry). Every operation runs under one registry-wide lock.
     *
     * Entries older than the TTL are dropped lazily, when a registration next touches
     * their room; rooms are erased as soon as they have no entries left.
     */
    class RoomRegistry {
        public:
            using Clock = std::chrono::steady_clock;

            explicit RoomRegistry(Clock::duration ttl = PEER_TTL);
            ~RoomRegistry() = default;

            RoomRegistry(const RoomRegistry&) = delete;
            RoomRegistry& operator=(const RoomRegistry&) = delete;

            /**
             * Prunes stale entries of `room`, upserts the caller with `addrs` stamped at
             * `now`, and returns every other member of the room.
             *
             * @param room Room name; created on first registration.
             * @param peerId Registering peer. Never part of the returned list.
             * @param addrs Addresses that replace whatever the peer registered before.
             * @param now Registration time, also the reference point for the TTL.
             * @return The other live members of `room`, in no particular order.
             */
            std::vector<PeerInfo> registerPeer(const std::string& room, const std::string& peerId,
                                               std::vector<std::string> addrs, Clock::time_point now);

            /**
             * Removes `peerId` from every room. Rooms left empty are erased.
             *
             * @param peerId Peer whose connection went away.
             * @return The number of rooms it was in.
             */
            size_t removePeer(const std::string& peerId);

            /**
             * Applies the TTL rule to every room at once.
             *
             * @param now Reference time; entries at least one TTL older are stale.
             * @return The number of entries removed.
             */
            size_t pruneExpired(Clock::time_point now);

            /**
             * @return Names of the rooms that currently have members, in no particular order.
             */
            std::vector<std::string> roomNames() const;

            /**
             * Lists a room without pruning it.
             *
             * @param room Room name.
             * @return Every entry of `room`, stale ones included; empty for an unknown room.
             */
            std::vector<PeerInfo> members(const std::string& room) const;

            /** @return Number of non-empty rooms. */
            size_t roomCount() const;

            /** @return Number of (room, peer) entries across all rooms. */
            size_t entryCount() const;

            Clock::duration ttl() const { return peerTtl; }

        private:
            using Room = std::unordered_map<std::string, RoomEntry>;

            size_t pruneRoom(Room& room, Clock::time_point now) const;

            mutable std::mutex mtx;
            std::unordered_map<std::string, Room> rooms;
            const Clock::duration peerTtl;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_ROOM_REGISTRY_HPP
