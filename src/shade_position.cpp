#include <shade_position.h>
#include <shady_log.h>

#include <algorithm>
#include <cmath>

namespace SHADY {
    static const char *TAG = "ShadePosition";

    ShadePosition::ShadePosition(int maxPosition, uint32_t tickMs, uint32_t travelTimeMs)
            : maxPosition(maxPosition),
              increment(computeIncrement(maxPosition, tickMs, travelTimeMs)),
              direction(Direction::Stopped),
              position(maxPosition) {}

    int ShadePosition::computeIncrement(int maxPosition, uint32_t tickMs, uint32_t travelTimeMs) {
        if (travelTimeMs == 0) return 0;
        const double share = static_cast<double>(maxPosition) * tickMs / travelTimeMs;
        // A step longer than the full travel only ever lands on a bound
        if (share >= maxPosition) return maxPosition;
        return static_cast<int>(std::lround(share));
    }

    void ShadePosition::startOpening() {
        SHADY_LOGD(TAG, "start opening (pos=%d)", position.load());
        setDirection(Direction::Opening);
    }

    void ShadePosition::startClosing() {
        SHADY_LOGD(TAG, "start closing (pos=%d)", position.load());
        setDirection(Direction::Closing);
    }

    void ShadePosition::stop() {
        SHADY_LOGD(TAG, "stop (pos=%d)", position.load());
        setDirection(Direction::Stopped);
    }

    void ShadePosition::setDirection(Direction newDirection) {
        std::lock_guard<std::mutex> lock(directionLock);
        direction = newDirection;
    }

    int ShadePosition::advance() {
        std::lock_guard<std::mutex> lock(directionLock);
        int64_t next = static_cast<int64_t>(position.load()) + static_cast<int64_t>(direction) * increment;
        if (next < 0 || next > maxPosition) {
            direction = Direction::Stopped;
            next = std::clamp<int64_t>(next, 0, maxPosition);
        }
        position.store(static_cast<int>(next));
        return static_cast<int>(next);
    }

    int ShadePosition::getPosition() const { return position.load(); }

    ShadePosition::Direction ShadePosition::getDirection() const {
        std::lock_guard<std::mutex> lock(directionLock);
        return direction;
    }

    bool ShadePosition::isMoving() const { return getDirection() != Direction::Stopped; }

    const char *directionToString(ShadePosition::Direction direction) {
        switch (direction) {
            case ShadePosition::Direction::Closing: return "closing";
            case ShadePosition::Direction::Stopped: return "stopped";
            case ShadePosition::Direction::Opening: return "opening";
        }
        return "";
    }
}
