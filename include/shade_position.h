#ifndef SHADY_SHADE_POSITION_H
#define SHADY_SHADE_POSITION_H

#include <atomic>
#include <cstdint>
#include <mutex>

namespace SHADY {
    /*
        Open loop position estimate. There is no sensor: the position moves by a
        fixed increment every tick while a direction is set, and is clamped
        to 0 (closed) .. maxPosition (open).
    */
    class ShadePosition {
    public:
        enum class Direction : int8_t { Closing = -1, Stopped = 0, Opening = 1 };

        ShadePosition(int maxPosition, uint32_t tickMs, uint32_t travelTimeMs);

        /// round(maxPosition * tick / travelTime)
        static int computeIncrement(int maxPosition, uint32_t tickMs, uint32_t travelTimeMs);

        void startOpening();
        void startClosing();
        void stop();

        /// Moves one tick. Overshooting a bound clamps and stops the direction.
        int advance();

        int getPosition() const;
        int getMaxPosition() const { return maxPosition; }
        int getIncrement() const { return increment; }
        Direction getDirection() const;
        bool isMoving() const;

    private:
        void setDirection(Direction newDirection);

        const int maxPosition;
        const int increment;

        mutable std::mutex directionLock;
        Direction direction;
        std::atomic<int> position;
    };

    const char *directionToString(ShadePosition::Direction direction);
}

#endif // SHADY_SHADE_POSITION_H
