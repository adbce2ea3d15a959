#include <shade_controller.h>
#include <shady_log.h>
#include <topic.h>

namespace SHADY {
    const char *shadeStateToString(ShadeState state) {
        switch (state) {
            case ShadeState::Stopped: return "stopped";
            case ShadeState::Opening: return "opening";
            case ShadeState::Closing: return "closing";
        }
        return "";
    }

    const char *commandToString(Command command) {
        switch (command) {
            case Command::Open: return "open";
            case Command::Close: return "close";
            case Command::Stop: return "stop";
        }
        return "";
    }

    const char *commandResultToString(CommandResult result) {
        switch (result) {
            case CommandResult::Done: return "done";
            case CommandResult::Ignored: return "ignored";
            case CommandResult::RelayTimeout: return "relay not responding";
            case CommandResult::BusError: return "bus error";
            case CommandResult::Cancelled: return "cancelled";
        }
        return "";
    }

    const char *phaseToString(Phase phase) {
        switch (phase) {
            case Phase::Running: return "running";
            case Phase::Stopped: return "stopped";
            case Phase::Failed: return "failed";
        }
        return "";
    }

    ShadeController::ShadeController(const ShadeEntry &entry, const ControllerSettings &settings, Publisher &publisher)
            : _name(entry.name),
              _openRelay(entry.openRelay),
              _closeRelay(entry.closeRelay),
              _tick(settings.tickMs),
              _feedbackTimeout(settings.feedbackTimeoutMs),
              _publisher(publisher),
              _position(settings.maxPosition, settings.tickMs, settings.travelTimeMs) {
        const char *TAG = _name.c_str();
        SHADY_LOGD(TAG, "initialize the topics");

        _coverCommandTopic = topicFor(settings.coverBase, Entity::Cover, _name, Action::Command);
        _coverStateTopic = topicFor(settings.coverBase, Entity::Cover, _name, Action::State);
        _coverPositionTopic = topicFor(settings.coverBase, Entity::Cover, _name, Action::Position);
        _openRelayCommandTopic = topicFor(settings.relayBase, Entity::Relay, _openRelay, Action::Command);
        _closeRelayCommandTopic = topicFor(settings.relayBase, Entity::Relay, _closeRelay, Action::Command);
        _openRelayStateTopic = topicFor(settings.relayBase, Entity::Relay, _openRelay, Action::State);
        _closeRelayStateTopic = topicFor(settings.relayBase, Entity::Relay, _closeRelay, Action::State);

        SHADY_LOGD(TAG, "cover command topic %s", _coverCommandTopic.c_str());
        SHADY_LOGD(TAG, "open relay %s, close relay %s", _openRelayCommandTopic.c_str(), _closeRelayCommandTopic.c_str());
        SHADY_LOGD(TAG, "position increment %d per %u ms", _position.getIncrement(),
                   static_cast<unsigned>(settings.tickMs));
    }

    ShadeController::~ShadeController() { shutdown(); }

    bool ShadeController::ownsRelay(const std::string &relayId) const {
        return relayId == _openRelay || relayId == _closeRelay;
    }

    // ---- Bus side ----

    bool ShadeController::onMessage(const std::string &topic, const std::string &payload) {
        const char *TAG = _name.c_str();
        const Payload value = parsePayload(payload);

        if (topic == _coverCommandTopic) {
            SHADY_LOGI(TAG, "cover message %s -- %s", topic.c_str(), payload.c_str());
            switch (value) {
                case Payload::Open: submit(Command::Open); break;
                case Payload::Close: submit(Command::Close); break;
                case Payload::Stop: submit(Command::Stop); break;
                default:
                    SHADY_LOGD(TAG, "ignoring cover payload '%s'", payload.c_str());
                    break;
            }
            return true;
        }

        Relay relay;
        if (topic == _openRelayStateTopic)
            relay = Relay::Open;
        else if (topic == _closeRelayStateTopic)
            relay = Relay::Close;
        else
            return false;

        SHADY_LOGI(TAG, "relays message %s -- %s", topic.c_str(), payload.c_str());
        if (value == Payload::On)
            onRelayFeedback(relay, true);
        else if (value == Payload::Off)
            onRelayFeedback(relay, false);
        else
            SHADY_LOGD(TAG, "ignoring relay payload '%s'", payload.c_str());
        return true;
    }

    void ShadeController::onRelayFeedback(Relay relay, bool on) {
        _feedback.update(relay, on);
    }

    void ShadeController::submit(Command command) {
        std::lock_guard<std::mutex> lock(_queueLock);
        _queue.push_back(command);
        _queueChanged.notify_one();
    }

    bool ShadeController::writeRelay(Relay relay, bool on) {
        SHADY_LOGI(_name.c_str(), "set %s relay %s", relayToString(relay), on ? "on" : "off");
        const std::string &topic = relay == Relay::Open ? _openRelayCommandTopic : _closeRelayCommandTopic;
        return publish(topic, payloadToString(on ? Payload::On : Payload::Off));
    }

    bool ShadeController::publish(const std::string &topic, const std::string &payload) {
        if (_publisher.publish(topic, payload)) return true;
        SHADY_LOGE(_name.c_str(), "publish to %s failed", topic.c_str());
        fail("message bus unavailable");
        return false;
    }

    // ---- Command / state machine ----

    CommandResult ShadeController::execute(Command command) {
        std::lock_guard<std::mutex> lock(_commandLock);
        if (isStopping()) return CommandResult::Cancelled;

        CommandResult result = run(command);
        SHADY_LOGD(_name.c_str(), "%s -> %s", commandToString(command), commandResultToString(result));
        return result;
    }

    CommandResult ShadeController::run(Command command) {
        const char *TAG = _name.c_str();
        const ShadeState current = getState();

        switch (command) {
            case Command::Open:
                if (current == ShadeState::Opening) return CommandResult::Ignored;
                if (current == ShadeState::Closing) {
                    SHADY_LOGD(TAG, "open on closing state");
                    CommandResult stopped = transition(ShadeState::Stopped);
                    if (stopped != CommandResult::Done) return stopped;
                } else {
                    SHADY_LOGD(TAG, "open on stopped state");
                }
                return transition(ShadeState::Opening);

            case Command::Close:
                if (current == ShadeState::Closing) return CommandResult::Ignored;
                if (current == ShadeState::Opening) {
                    SHADY_LOGD(TAG, "close on opening state");
                    CommandResult stopped = transition(ShadeState::Stopped);
                    if (stopped != CommandResult::Done) return stopped;
                } else {
                    SHADY_LOGD(TAG, "close on stopped state");
                }
                return transition(ShadeState::Closing);

            case Command::Stop:
                return transition(ShadeState::Stopped);
        }
        return CommandResult::Ignored;
    }

    CommandResult ShadeController::transition(ShadeState target) {
        const char *TAG = _name.c_str();
        bool openOn = false;
        bool closeOn = false;

        // The relay being switched off always goes first
        switch (target) {
            case ShadeState::Opening:
                if (!writeRelay(Relay::Close, false) || !writeRelay(Relay::Open, true))
                    return CommandResult::BusError;
                openOn = true;
                break;
            case ShadeState::Closing:
                if (!writeRelay(Relay::Open, false) || !writeRelay(Relay::Close, true))
                    return CommandResult::BusError;
                closeOn = true;
                break;
            case ShadeState::Stopped:
                if (!writeRelay(Relay::Close, false) || !writeRelay(Relay::Open, false))
                    return CommandResult::BusError;
                break;
        }

        SHADY_LOGD(TAG, "waiting for open relay %s -- close relay %s (now %s -- %s)",
                   openOn ? "on" : "off", closeOn ? "on" : "off",
                   _feedback.isOn(Relay::Open) ? "on" : "off", _feedback.isOn(Relay::Close) ? "on" : "off");

        switch (_feedback.waitFor(openOn, closeOn, _tick, _feedbackTimeout)) {
            case WaitResult::Confirmed:
                break;
            case WaitResult::TimedOut:
                return recoverFromTimeout(target);
            case WaitResult::Cancelled:
                return CommandResult::Cancelled;
        }

        commit(target);
        _relayNotResponding.store(false);

        if (target == ShadeState::Opening && !publish(_coverStateTopic, STATE_OPENING))
            return CommandResult::BusError;
        if (target == ShadeState::Closing && !publish(_coverStateTopic, STATE_CLOSING))
            return CommandResult::BusError;
        return CommandResult::Done;
    }

    void ShadeController::commit(ShadeState target) {
        std::lock_guard<std::mutex> lock(_stateLock);
        const ShadeState old = _state;
        _state = target;
        SHADY_LOGD(_name.c_str(), "state update from %s to %s", shadeStateToString(old), shadeStateToString(target));

        switch (target) {
            case ShadeState::Opening: _position.startOpening(); break;
            case ShadeState::Closing: _position.startClosing(); break;
            case ShadeState::Stopped: _position.stop(); break;
        }
    }

    CommandResult ShadeController::recoverFromTimeout(ShadeState target) {
        SHADY_LOGE(_name.c_str(), "relay not responding: no feedback for %s within %lld ms, stopping",
                   shadeStateToString(target), static_cast<long long>(_feedbackTimeout.count()));
        _relayNotResponding.store(true);

        if (!writeRelay(Relay::Close, false) || !writeRelay(Relay::Open, false))
            return CommandResult::BusError;
        // Motion is unknown from here on, the next command starts from stopped
        commit(ShadeState::Stopped);
        return CommandResult::RelayTimeout;
    }

    ShadeState ShadeController::getState() const {
        std::lock_guard<std::mutex> lock(_stateLock);
        return _state;
    }

    // ---- Position ----

    bool ShadeController::tick() {
        if (isStopping()) return false;

        const int position = _position.advance();
        const int maxPosition = _position.getMaxPosition();
        SHADY_LOGD(_name.c_str(), "position: %d", position);

        if (position > 0 && position < maxPosition && _position.isMoving()) {
            if (!publish(_coverPositionTopic, std::to_string(position))) return false;
        }

        if (getState() == ShadeState::Stopped) return true;
        if (position == 0) return stopAtBoundary(0, STATE_CLOSED);
        if (position == maxPosition) return stopAtBoundary(maxPosition, STATE_OPEN);
        return true;
    }

    bool ShadeController::stopAtBoundary(int bound, const char *statePayload) {
        std::lock_guard<std::mutex> lock(_commandLock);
        if (isStopping()) return false;
        // A command may have run while this tick waited for the lock
        if (getState() == ShadeState::Stopped || _position.getPosition() != bound) return true;

        SHADY_LOGI(_name.c_str(), "reached %s, stopping", statePayload);
        switch (transition(ShadeState::Stopped)) {
            case CommandResult::Done:
                break;
            case CommandResult::RelayTimeout:
            case CommandResult::Ignored:
                return true;
            case CommandResult::BusError:
            case CommandResult::Cancelled:
                return false;
        }

        return publish(_coverPositionTopic, std::to_string(bound)) && publish(_coverStateTopic, statePayload);
    }

    // ---- Activities ----

    void ShadeController::runCommandLoop() {
        SHADY_LOGI(_name.c_str(), "start listening for commands ...");
        while (true) {
            Command command;
            {
                std::unique_lock<std::mutex> lock(_queueLock);
                _queueChanged.wait(lock, [this] { return isStopping() || !_queue.empty(); });
                if (isStopping()) break;
                command = _queue.front();
                _queue.pop_front();
            }
            CommandResult result = execute(command);
            if (result == CommandResult::BusError || result == CommandResult::Cancelled) break;
        }
        SHADY_LOGD(_name.c_str(), "command loop ended");
    }

    void ShadeController::runTickLoop() {
        SHADY_LOGI(_name.c_str(), "start tracking position ...");
        auto next = std::chrono::steady_clock::now();
        while (tick()) {
            next += _tick;
            std::unique_lock<std::mutex> lock(_tickLock);
            if (_tickWake.wait_until(lock, next, [this] { return isStopping(); })) break;
        }
        SHADY_LOGD(_name.c_str(), "tick loop ended");
    }

    void ShadeController::shutdown() {
        if (_stopping.exchange(true)) return;

        Phase expected = Phase::Running;
        _phase.compare_exchange_strong(expected, Phase::Stopped);

        _feedback.cancel();
        {
            std::lock_guard<std::mutex> lock(_queueLock);
            _queueChanged.notify_all();
        }
        {
            std::lock_guard<std::mutex> lock(_tickLock);
            _tickWake.notify_all();
        }
    }

    void ShadeController::fail(const char *reason) {
        if (_phase.exchange(Phase::Failed) != Phase::Failed)
            SHADY_LOGE(_name.c_str(), "controller failed: %s", reason);
        shutdown();
    }

    ShadeStatus ShadeController::status() const {
        ShadeStatus s;
        s.name = _name;
        s.state = getState();
        s.direction = _position.getDirection();
        s.position = _position.getPosition();
        s.maxPosition = _position.getMaxPosition();
        s.openRelayOn = _feedback.isOn(Relay::Open);
        s.closeRelayOn = _feedback.isOn(Relay::Close);
        s.relayNotResponding = _relayNotResponding.load();
        s.phase = _phase.load();
        {
            std::lock_guard<std::mutex> lock(_queueLock);
            s.pendingCommands = _queue.size();
        }
        return s;
    }
}
