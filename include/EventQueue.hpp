#pragma once
#ifndef RENDEZVOUS_EVENT_QUEUE_HPP
#define RENDEZVOUS_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace rendezvous {

    /**
     * Multi-producer, single-consumer queue between network workers and the dispatcher.
     */
    template <typename T>
    class EventQueue {
        public:
            void push(T item) {
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    if (closed) {
                        return;
                    }
                    items.push_back(std::move(item));
                }
                cv.notify_one();
            }

            std::optional<T> pop(std::chrono::milliseconds timeout) {
                std::unique_lock<std::mutex> lock(mtx);
                if (!cv.wait_for(lock, timeout, [this] { return closed || !items.empty(); })) {
                    return std::nullopt;
                }
                if (items.empty()) {
                    return std::nullopt;
                }

                T item = std::move(items.front());
                items.pop_front();
                return item;
            }

            /** Wakes the consumer; later pushes are dropped. Queued items remain poppable. */
            void close() {
                {
                    std::lock_guard<std::mutex> lock(mtx);
                    closed = true;
                }
                cv.notify_all();
            }

            void reopen() {
                std::lock_guard<std::mutex> lock(mtx);
                closed = false;
            }

            size_t size() const {
                std::lock_guard<std::mutex> lock(mtx);
                return items.size();
            }

        private:
            mutable std::mutex mtx;
            std::condition_variable cv;
            std::deque<T> items;
            bool closed = false;
    };

} // namespace rendezvous

#endif // RENDEZVOUS_EVENT_QUEUE_HPP
