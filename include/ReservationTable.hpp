#pragma once
#ifndef RENDEZVOUS_RESERVATION_TABLE_HPP
#define RENDEZVOUS_RESERVATION_TABLE_HPP

#include <mutex>
#include <string>
#include <unordered_set>

namespace rendezvous {

    /**
     * Relay reservation slots, bounded by a fixed capacity.
     */
    class ReservationTable {
        public:
            enum class Outcome {
                Accepted,
                Renewed,
                Denied
            };

            explicit ReservationTable(size_t capacity);

            /**
             * Grants a slot to `peerId`. A peer that already holds one is renewed regardless
             * of capacity.
             *
             * @param peerId Peer asking for a slot.
             * @return Accepted for a new slot, Renewed for a held one, Denied when full.
             */
            Outcome reserve(const std::string& peerId);

            /**
             * @param peerId Peer whose last connection closed.
             * @return false if it held no slot.
             */
            bool release(const std::string& peerId);

            bool holds(const std::string& peerId) const;
            size_t size() const;
            size_t capacity() const { return maxReservations; }

        private:
            mutable std::mutex mtx;
            std::unordered_set<std::string> reservations;
            const size_t maxReservations;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_RESERVATION_TABLE_HPP
