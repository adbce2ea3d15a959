#include <relay_feedback.h>

#include <algorithm>

namespace SHADY {
    const char *relayToString(Relay relay) {
        return relay == Relay::Open ? "open" : "close";
    }

    const char *waitResultToString(WaitResult result) {
        switch (result) {
            case WaitResult::Confirmed: return "confirmed";
            case WaitResult::TimedOut: return "timed out";
            case WaitResult::Cancelled: return "cancelled";
        }
        return "";
    }

    void RelayFeedback::update(Relay relay, bool on) {
        if (relay == Relay::Open)
            _openOn.store(on);
        else
            _closeOn.store(on);

        // Taking the lock orders the store before a waiter's predicate check
        std::lock_guard<std::mutex> lock(_waitMutex);
        _changed.notify_all();
    }

    bool RelayFeedback::isOn(Relay relay) const {
        return relay == Relay::Open ? _openOn.load() : _closeOn.load();
    }

    bool RelayFeedback::matches(bool openOn, bool closeOn) const {
        return _openOn.load() == openOn && _closeOn.load() == closeOn;
    }

    WaitResult RelayFeedback::waitFor(bool openOn, bool closeOn,
                                      std::chrono::milliseconds recheck,
                                      std::chrono::milliseconds timeout) {
        using Clock = std::chrono::steady_clock;
        const bool forever = timeout.count() <= 0;
        const auto deadline = Clock::now() + timeout;
        if (recheck.count() <= 0) recheck = std::chrono::milliseconds(1);

        std::unique_lock<std::mutex> lock(_waitMutex);
        while (true) {
            if (_cancelled) return WaitResult::Cancelled;
            if (matches(openOn, closeOn)) return WaitResult::Confirmed;

            auto slice = std::chrono::duration_cast<Clock::duration>(recheck);
            if (!forever) {
                auto now = Clock::now();
                if (now >= deadline) return WaitResult::TimedOut;
                slice = std::min(slice, deadline - now);
            }
            _changed.wait_for(lock, slice);
        }
    }

    void RelayFeedback::cancel() {
        std::lock_guard<std::mutex> lock(_waitMutex);
        _cancelled = true;
        _changed.notify_all();
    }

    bool RelayFeedback::isCancelled() const {
        std::lock_guard<std::mutex> lock(_waitMutex);
        return _cancelled;
    }
}
