#include "ReservationTable.hpp"

namespace rendezvous {

    ReservationTable::ReservationTable(size_t capacity) : maxReservations(capacity) {}

    ReservationTable::Outcome ReservationTable::reserve(const std::string& peerId) {
        std::lock_guard<std::mutex> lock(mtx);

        if (reservations.count(peerId) > 0) {
            return Outcome::Renewed;
        }

        if (reservations.size() >= maxReservations) {
            return Outcome::Denied;
        }

        reservations.insert(peerId);
        return Outcome::Accepted;
    }

    bool ReservationTable::release(const std::string& peerId) {
        std::lock_guard<std::mutex> lock(mtx);
        return reservations.erase(peerId) > 0;
    }

    bool ReservationTable::holds(const std::string& peerId) const {
        std::lock_guard<std::mutex> lock(mtx);
        return reservations.count(peerId) > 0;
    }

    size_t ReservationTable::size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return reservations.size();
    }

} // namespace rendezvous
