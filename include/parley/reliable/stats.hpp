#pragma once

#include <atomic>
#include <datapod/datapod.hpp>

namespace parley {

    /// Counters for one reliable datagram link
    struct LinkStats {
        std::atomic<dp::u64> sent{0};          // first transmissions
        std::atomic<dp::u64> retransmitted{0}; // resends after retry_timeout
        std::atomic<dp::u64> acknowledged{0};  // pending sends cleared by an ack
        std::atomic<dp::u64> duplicates{0};    // inbound chats suppressed by the window
        std::atomic<dp::u64> exhausted{0};     // pending sends dropped at max_retries

        inline void reset() {
            sent = 0;
            retransmitted = 0;
            acknowledged = 0;
            duplicates = 0;
            exhausted = 0;
        }

        /// Share of transmissions that were resends (0.0 to 1.0)
        inline double retransmit_rate() const {
            dp::u64 total = sent.load() + retransmitted.load();
            if (total == 0)
                return 0.0;
            return static_cast<double>(retransmitted.load()) / static_cast<double>(total);
        }
    };

} // namespace parley
