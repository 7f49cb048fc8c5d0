#pragma once

#include <parley/common.hpp>

#include <deque>
#include <mutex>
#include <set>

namespace parley {

    /// Remembers the most recent sequence numbers seen from one peer
    /// Oldest entries are evicted once capacity is reached
    class SequenceWindow {
      private:
        std::set<dp::u64> seen_;
        std::deque<dp::u64> order_;
        dp::usize capacity_;
        mutable std::mutex mutex_;

      public:
        explicit SequenceWindow(dp::usize capacity = 1024) : capacity_(capacity == 0 ? 1 : capacity) {}

        /// Record a sequence number; false when it was already seen
        bool accept(dp::u64 sequence) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!seen_.insert(sequence).second) {
                return false;
            }
            order_.push_back(sequence);
            while (order_.size() > capacity_) {
                seen_.erase(order_.front());
                order_.pop_front();
            }
            return true;
        }

        bool contains(dp::u64 sequence) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return seen_.count(sequence) != 0;
        }

        dp::usize size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return order_.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            seen_.clear();
            order_.clear();
        }
    };

} // namespace parley
