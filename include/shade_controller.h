#ifndef SHADY_SHADE_CONTROLLER_H
#define SHADY_SHADE_CONTROLLER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

#include <publisher.h>
#include <relay_feedback.h>
#include <shade_config.h>
#include <shade_position.h>

/*
    One controller per shade. It owns the two relays of that shade and
    reconciles three streams: cover commands, open relay feedback and close
    relay feedback. A logical state is only committed once the relays report
    the combination the command asked for.

    Activities:
      - command loop: executes queued cover commands one at a time
      - feedback:     onMessage() from the bus callback, never blocks
      - tick loop:    advances the position estimate, stops at the bounds
*/
namespace SHADY {
    enum class ShadeState : uint8_t { Stopped, Opening, Closing };

    enum class Command : uint8_t { Open, Close, Stop };

    enum class CommandResult : uint8_t {
        Done,           ///< Relays corroborated the requested state
        Ignored,        ///< Shade already moving in the requested direction
        RelayTimeout,   ///< Feedback never arrived, shade forced to stopped
        BusError,       ///< Publish failed, controller is now failed
        Cancelled       ///< Controller shut down while waiting
    };

    enum class Phase : uint8_t { Running, Stopped, Failed };

    struct ShadeStatus {
        std::string name;
        ShadeState state = ShadeState::Stopped;
        ShadePosition::Direction direction = ShadePosition::Direction::Stopped;
        int position = 0;
        int maxPosition = 0;
        bool openRelayOn = false;
        bool closeRelayOn = false;
        bool relayNotResponding = false;
        Phase phase = Phase::Running;
        size_t pendingCommands = 0;
    };

    const char *shadeStateToString(ShadeState state);
    const char *commandToString(Command command);
    const char *commandResultToString(CommandResult result);
    const char *phaseToString(Phase phase);

    class ShadeController {
    public:
        // Payloads published on the cover state topic
        static constexpr const char *STATE_OPENING = "opening";
        static constexpr const char *STATE_CLOSING = "closing";
        static constexpr const char *STATE_OPEN = "open";
        static constexpr const char *STATE_CLOSED = "closed";

        ShadeController(const ShadeEntry &entry, const ControllerSettings &settings, Publisher &publisher);
        ~ShadeController();

        ShadeController(const ShadeController &) = delete;
        ShadeController &operator=(const ShadeController &) = delete;

        const std::string &getName() const { return _name; }
        const std::string &getCommandTopic() const { return _coverCommandTopic; }
        bool ownsRelay(const std::string &relayId) const;

        /**
         * @brief Entry point for bus traffic.
         *
         * Cover commands are queued for the command loop, relay feedback is
         * applied right away. Unknown payloads are dropped.
         *
         * @return true if the topic belongs to this shade.
         */
        bool onMessage(const std::string &topic, const std::string &payload);
        void onRelayFeedback(Relay relay, bool on);
        void submit(Command command);

        /// Runs one command to completion. Commands never overlap on one shade.
        CommandResult execute(Command command);

        /// One estimator step. @return false once the controller cannot go on.
        bool tick();

        void runCommandLoop();
        void runTickLoop();

        void shutdown();
        void fail(const char *reason);

        ShadeState getState() const;
        int getPosition() const { return _position.getPosition(); }
        ShadePosition::Direction getDirection() const { return _position.getDirection(); }
        Phase getPhase() const { return _phase.load(); }
        bool isRelayNotResponding() const { return _relayNotResponding.load(); }
        ShadeStatus status() const;

    private:
        CommandResult run(Command command);
        CommandResult transition(ShadeState target);
        CommandResult recoverFromTimeout(ShadeState target);
        void commit(ShadeState target);
        bool stopAtBoundary(int bound, const char *statePayload);

        bool writeRelay(Relay relay, bool on);
        bool publish(const std::string &topic, const std::string &payload);
        bool isStopping() const { return _stopping.load(); }

        const std::string _name;
        const std::string _openRelay;
        const std::string _closeRelay;
        const std::chrono::milliseconds _tick;
        const std::chrono::milliseconds _feedbackTimeout;
        Publisher &_publisher;

        std::string _coverCommandTopic;
        std::string _coverStateTopic;
        std::string _coverPositionTopic;
        std::string _openRelayCommandTopic;
        std::string _closeRelayCommandTopic;
        std::string _openRelayStateTopic;
        std::string _closeRelayStateTopic;

        RelayFeedback _feedback;
        ShadePosition _position;

        std::mutex _commandLock;
        mutable std::mutex _stateLock;
        ShadeState _state = ShadeState::Stopped;

        mutable std::mutex _queueLock;
        std::condition_variable _queueChanged;
        std::deque<Command> _queue;

        std::mutex _tickLock;
        std::condition_variable _tickWake;

        std::atomic<bool> _stopping{false};
        std::atomic<Phase> _phase{Phase::Running};
        std::atomic<bool> _relayNotResponding{false};
    };
}

#endif // SHADY_SHADE_CONTROLLER_H
