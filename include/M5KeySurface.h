#pragma once

#include <stdint.h>
#include <functional>

#include "KeySurface.h"

// Six virtual keys on the M5Stack touch display, 3 columns x 2 rows.
class M5KeySurface : public KeySurface {
public:
    using TransitionHandler = std::function<void(uint8_t key, bool pressed)>;

    M5KeySurface();

    // Takes over the whole display. Call after M5.begin().
    void begin();

    // Poll touch state (after M5.update()) and report key edges.
    void poll(const TransitionHandler& onTransition);

    uint8_t keyCount() const override { return KEY_COLUMNS * KEY_ROWS; }
    bool isConnected() const override { return _begun; }

    void renderKey(uint8_t key, const KeyFace& face) override;
    void setBrightness(uint8_t percent) override;

private:
    static constexpr uint8_t KEY_COLUMNS = 3;
    static constexpr uint8_t KEY_ROWS    = 2;
    static constexpr uint8_t NO_KEY      = 0xFF;

    uint8_t keyAt(int32_t x, int32_t y) const;

    void drawArtwork(int32_t x, int32_t y, const KeyFace& face);
    void drawTitle(int32_t x, int32_t y, const KeyFace& face);
    void drawGlyph(int32_t x, int32_t y, KeyGlyph glyph);
    void drawOverlay(int32_t x, int32_t y, KeyOverlay overlay);

    bool    _begun = false;
    int32_t _keyW  = 0;
    int32_t _keyH  = 0;
    bool    _pressed[KEY_COLUMNS * KEY_ROWS];
};
