#pragma once

#include <stdint.h>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

#include "TimerQueue.h"

constexpr const uint32_t LONG_PRESS_DEFAULT_MS = 1000;

// What kind of press it was
enum class ButtonType : uint8_t {
    None = 0,
    ShortPress,
    LongPress,
    RepeatingLongPress,
};

// Single logical event produced by the tracker.
struct ButtonEvent {
    uint8_t    key  = 0;
    ButtonType type = ButtonType::None;
    uint32_t   tick = 0;   // 0 for the first long-press firing, then 1, 2, ... per repeat
};

using KeyAction = std::function<void()>;

// Hold behaviour of a key: nothing, one action after the threshold, or an
// action that keeps firing every intervalMs until release.
enum class HoldKind : uint8_t {
    None = 0,
    Single,
    Repeating,
};

struct HoldBinding {
    HoldKind  kind       = HoldKind::None;
    KeyAction action;
    uint32_t  intervalMs = 0;   // Repeating only
};

struct KeyBinding {
    KeyAction   shortPress;     // empty = release does nothing
    HoldBinding hold;

    bool empty() const { return !shortPress && hold.kind == HoldKind::None; }
};

// Debounced key tracker plus the per-key action registry.
//
// Converts raw (key, pressed) edges into ShortPress / LongPress /
// RepeatingLongPress and runs the bound actions. The surface driver must
// serialize edges for a given key; different keys may be fed concurrently.
//
// The binding in effect for a press cycle is the one registered when the key
// went down; rebinding mid-press only affects the next press.
//
// Actions run without any tracker lock held, so they may rebind keys.
// Exceptions thrown by actions are logged and never reach the caller.
//
// Timer callbacks reference this object: shut the TimerQueue down before
// destroying a ButtonManager that still has keys held.
class ButtonManager {
public:
    using EventObserver = std::function<void(const ButtonEvent&)>;

    ButtonManager(TimerQueue& timers, uint8_t keyCount,
                  uint32_t longPressMs = LONG_PRESS_DEFAULT_MS);
    ~ButtonManager();

    ButtonManager(const ButtonManager&) = delete;
    ButtonManager& operator=(const ButtonManager&) = delete;

    uint8_t keyCount() const { return _keyCount; }

    // Applies to presses that start after the call.
    void setLongPressThreshold(uint32_t ms);
    uint32_t longPressThreshold() const;

    // --- Registry ------------------------------------------------

    // Replace everything bound to key. Returns false for an invalid key
    // or a repeating hold without an interval.
    bool bind(uint8_t key, const KeyBinding& binding);
    bool registerShortPress(uint8_t key, KeyAction action);
    bool registerLongPress(uint8_t key, KeyAction action);
    bool registerRepeatingLongPress(uint8_t key, KeyAction action, uint32_t intervalMs);
    bool clear(uint8_t key);

    KeyBinding binding(uint8_t key) const;

    // Called for every logical event, before the bound action runs.
    void setEventObserver(EventObserver observer);

    // --- Tracker -------------------------------------------------

    // Inbound entry point from the surface driver.
    void onKeyTransition(uint8_t key, bool pressed);

    void onPress(uint8_t key);
    void onRelease(uint8_t key);

    bool isPressed(uint8_t key) const;
    bool isLongPressTriggered(uint8_t key) const;

private:
    // Ephemeral, exists from press to release.
    struct KeyState {
        uint32_t             pressedAtMs        = 0;
        uint32_t             cycle              = 0;
        bool                 longPressTriggered = false;
        TimerQueue::TimerId  longPressTimer     = TimerQueue::INVALID_TIMER;
        TimerQueue::TimerId  repeatTimer        = TimerQueue::INVALID_TIMER;
        KeyBinding           binding;           // snapshot taken on press
    };

    bool validKey(uint8_t key, const char* what) const;
    void cancelTimersLocked(KeyState& st);

    void fireLongPress(uint8_t key, uint32_t cycle);
    void fireRepeat(uint8_t key, uint32_t cycle, uint32_t tick);
    void scheduleRepeat(uint8_t key, uint32_t cycle, uint32_t tick);

    void dispatch(const ButtonEvent& ev, const KeyAction& action);

    TimerQueue&   _timers;
    const uint8_t _keyCount;

    mutable std::mutex          _mutex;
    uint32_t                    _longPressMs;
    std::vector<KeyBinding>     _bindings;
    std::map<uint8_t, KeyState> _active;
    uint32_t                    _nextCycle = 1;
    EventObserver               _observer;
};
