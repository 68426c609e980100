#include "ButtonManager.h"

#include <exception>
#include "Log.h"

static const char* buttonTypeName(ButtonType type) {
    switch (type) {
        case ButtonType::ShortPress:         return "short";
        case ButtonType::LongPress:          return "long";
        case ButtonType::RepeatingLongPress: return "repeat";
        case ButtonType::None:
        default:
            return "none";
    }
}

ButtonManager::ButtonManager(TimerQueue& timers, uint8_t keyCount, uint32_t longPressMs)
: _timers(timers), _keyCount(keyCount), _longPressMs(longPressMs), _bindings(keyCount)
{
}

ButtonManager::~ButtonManager() {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto& kv : _active) {
        cancelTimersLocked(kv.second);
    }
    _active.clear();
}

void ButtonManager::setLongPressThreshold(uint32_t ms) {
    std::lock_guard<std::mutex> lock(_mutex);
    _longPressMs = ms;
}

uint32_t ButtonManager::longPressThreshold() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _longPressMs;
}

// --- Registry ----------------------------------------------------

bool ButtonManager::validKey(uint8_t key, const char* what) const {
    if (key < _keyCount) {
        return true;
    }
    logf(LogLevel::Error, "%s: key %u out of range (key count %u)", what, key, _keyCount);
    return false;
}

bool ButtonManager::bind(uint8_t key, const KeyBinding& binding) {
    if (!validKey(key, "bind")) {
        return false;
    }
    if (binding.hold.kind == HoldKind::Repeating && binding.hold.intervalMs == 0) {
        logf(LogLevel::Error, "bind: key %u repeating hold needs an interval", key);
        return false;
    }

    std::lock_guard<std::mutex> lock(_mutex);
    _bindings[key] = binding;
    return true;
}

bool ButtonManager::registerShortPress(uint8_t key, KeyAction action) {
    if (!validKey(key, "registerShortPress")) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    _bindings[key].shortPress = std::move(action);
    logf(LogLevel::Debug, "Short press registered for key %u", key);
    return true;
}

bool ButtonManager::registerLongPress(uint8_t key, KeyAction action) {
    if (!validKey(key, "registerLongPress")) {
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    HoldBinding& hold = _bindings[key].hold;
    // A repeating hold takes precedence over a plain one.
    if (hold.kind == HoldKind::Repeating) {
        logf(LogLevel::Warn, "Key %u already repeats; long press ignored", key);
        return false;
    }
    hold.kind       = action ? HoldKind::Single : HoldKind::None;
    hold.action     = std::move(action);
    hold.intervalMs = 0;
    return true;
}

bool ButtonManager::registerRepeatingLongPress(uint8_t key, KeyAction action, uint32_t intervalMs) {
    if (!validKey(key, "registerRepeatingLongPress")) {
        return false;
    }
    if (intervalMs == 0) {
        logf(LogLevel::Error, "registerRepeatingLongPress: key %u needs an interval", key);
        return false;
    }
    std::lock_guard<std::mutex> lock(_mutex);
    HoldBinding& hold = _bindings[key].hold;
    hold.kind       = action ? HoldKind::Repeating : HoldKind::None;
    hold.action     = std::move(action);
    hold.intervalMs = intervalMs;
    return true;
}

bool ButtonManager::clear(uint8_t key) {
    return bind(key, KeyBinding());
}

KeyBinding ButtonManager::binding(uint8_t key) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (key < _keyCount) ? _bindings[key] : KeyBinding();
}

void ButtonManager::setEventObserver(EventObserver observer) {
    std::lock_guard<std::mutex> lock(_mutex);
    _observer = std::move(observer);
}

// --- Tracker -----------------------------------------------------

void ButtonManager::onKeyTransition(uint8_t key, bool pressed) {
    logf(LogLevel::Debug, "Key %u %s", key, pressed ? "pressed" : "released");
    if (pressed) {
        onPress(key);
    } else {
        onRelease(key);
    }
}

void ButtonManager::cancelTimersLocked(KeyState& st) {
    if (st.longPressTimer != TimerQueue::INVALID_TIMER) {
        _timers.cancel(st.longPressTimer);
        st.longPressTimer = TimerQueue::INVALID_TIMER;
    }
    if (st.repeatTimer != TimerQueue::INVALID_TIMER) {
        _timers.cancel(st.repeatTimer);
        st.repeatTimer = TimerQueue::INVALID_TIMER;
    }
}

void ButtonManager::onPress(uint8_t key) {
    if (!validKey(key, "onPress")) {
        return;
    }

    std::lock_guard<std::mutex> lock(_mutex);

    // A press without a release in between: drop the old cycle's timers.
    auto it = _active.find(key);
    if (it != _active.end()) {
        cancelTimersLocked(it->second);
        _active.erase(it);
    }

    KeyState st;
    st.pressedAtMs = TimerQueue::nowMs();
    st.cycle       = _nextCycle++;
    st.binding     = _bindings[key];

    if (st.binding.hold.kind != HoldKind::None) {
        const uint32_t cycle = st.cycle;
        st.longPressTimer = _timers.scheduleAfter(_longPressMs, [this, key, cycle]() {
            fireLongPress(key, cycle);
        });
    }

    _active[key] = std::move(st);
}

void ButtonManager::onRelease(uint8_t key) {
    KeyAction  shortAction;
    bool       longTriggered = false;
    uint32_t   heldMs        = 0;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _active.find(key);
        if (it == _active.end()) {
            logf(LogLevel::Debug, "Release on key %u without a press ignored", key);
            return;
        }

        KeyState& st = it->second;
        cancelTimersLocked(st);
        longTriggered = st.longPressTriggered;
        shortAction   = st.binding.shortPress;
        heldMs        = TimerQueue::nowMs() - st.pressedAtMs;
        _active.erase(it);
    }

    if (longTriggered) {
        logf(LogLevel::Info, "Long press completed for key %u (%u ms)", key, heldMs);
        return;
    }

    ButtonEvent ev;
    ev.key  = key;
    ev.type = ButtonType::ShortPress;
    dispatch(ev, shortAction);
}

void ButtonManager::fireLongPress(uint8_t key, uint32_t cycle) {
    HoldBinding hold;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _active.find(key);
        if (it == _active.end() || it->second.cycle != cycle) {
            return;  // released (or re-pressed) while this timer was in flight
        }
        KeyState& st = it->second;
        st.longPressTimer     = TimerQueue::INVALID_TIMER;
        st.longPressTriggered = true;
        hold = st.binding.hold;
    }

    logf(LogLevel::Info, "Long press triggered for key %u", key);

    ButtonEvent ev;
    ev.key  = key;
    ev.type = (hold.kind == HoldKind::Repeating) ? ButtonType::RepeatingLongPress
                                                 : ButtonType::LongPress;
    dispatch(ev, hold.action);

    if (hold.kind == HoldKind::Repeating) {
        scheduleRepeat(key, cycle, 1);
    }
}

void ButtonManager::scheduleRepeat(uint8_t key, uint32_t cycle, uint32_t tick) {
    std::lock_guard<std::mutex> lock(_mutex);
    auto it = _active.find(key);
    if (it == _active.end() || it->second.cycle != cycle) {
        return;
    }
    KeyState& st = it->second;
    st.repeatTimer = _timers.scheduleAfter(st.binding.hold.intervalMs, [this, key, cycle, tick]() {
        fireRepeat(key, cycle, tick);
    });
}

void ButtonManager::fireRepeat(uint8_t key, uint32_t cycle, uint32_t tick) {
    KeyAction action;

    {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _active.find(key);
        if (it == _active.end() || it->second.cycle != cycle) {
            return;
        }
        it->second.repeatTimer = TimerQueue::INVALID_TIMER;
        action = it->second.binding.hold.action;
    }

    ButtonEvent ev;
    ev.key  = key;
    ev.type = ButtonType::RepeatingLongPress;
    ev.tick = tick;
    dispatch(ev, action);

    // Next tick is scheduled only after this one returned.
    scheduleRepeat(key, cycle, tick + 1);
}

void ButtonManager::dispatch(const ButtonEvent& ev, const KeyAction& action) {
    EventObserver observer;
    {
        std::lock_guard<std::mutex> lock(_mutex);
        observer = _observer;
    }

    try {
        if (observer) {
            observer(ev);
        }
        if (action) {
            action();
        }
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "Error in %s press callback for key %u: %s",
             buttonTypeName(ev.type), ev.key, e.what());
    } catch (...) {
        logf(LogLevel::Error, "Error in %s press callback for key %u: unknown exception",
             buttonTypeName(ev.type), ev.key);
    }
}
