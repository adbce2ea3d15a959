#ifndef SHADY_RELAY_FEEDBACK_H
#define SHADY_RELAY_FEEDBACK_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace SHADY {
    enum class Relay : uint8_t { Open, Close };

    enum class WaitResult : uint8_t { Confirmed, TimedOut, Cancelled };

    const char *relayToString(Relay relay);
    const char *waitResultToString(WaitResult result);

    /*
        Last reported ON/OFF state of the two relays of one shade, as seen
        on the bus. Only the latest value per relay is kept.
    */
    class RelayFeedback {
    public:
        RelayFeedback() = default;

        void update(Relay relay, bool on);
        bool isOn(Relay relay) const;
        bool matches(bool openOn, bool closeOn) const;

        /**
         * @brief Blocks until both relays report the requested combination.
         *
         * Waiters are woken on every update() and re-check the combination at
         * least every @p recheck. A zero @p timeout waits forever.
         */
        WaitResult waitFor(bool openOn, bool closeOn,
                           std::chrono::milliseconds recheck,
                           std::chrono::milliseconds timeout);

        /// Wakes every pending and future waitFor() with Cancelled
        void cancel();
        bool isCancelled() const;

    private:
        std::atomic<bool> _openOn{false};
        std::atomic<bool> _closeOn{false};

        mutable std::mutex _waitMutex;
        std::condition_variable _changed;
        bool _cancelled = false;
    };
}

#endif // SHADY_RELAY_FEEDBACK_H
