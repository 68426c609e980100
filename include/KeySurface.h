#pragma once

#include <stdint.h>
#include <string>

// Built-in pictograms for keys that have no artwork.
enum class KeyGlyph : uint8_t {
    None = 0,
    CarouselPrevious,
    CarouselNext,
    PreviousTrack,
    NextTrack,
    NowPlayingEmpty,
};

// Small icon drawn in the lower-right corner of a key.
enum class KeyOverlay : uint8_t {
    None = 0,
    Play,
    Pause,
    Stop,
};

constexpr uint32_t KEY_BG_TEAL = 0x008080;
constexpr uint32_t KEY_BG_GRAY = 0x808080;
constexpr uint32_t KEY_BG_BLACK = 0x000000;

// Everything a surface needs to draw one key.
struct KeyFace {
    uint32_t    background = KEY_BG_BLACK;   // 0xRRGGBB
    KeyGlyph    glyph      = KeyGlyph::None;
    std::string artworkRef;                  // image path / URL, may be empty
    std::string title;                       // drawn when artwork is missing
    KeyOverlay  overlay    = KeyOverlay::None;
    std::string label;                       // e.g. track number "03"

    bool operator==(const KeyFace& o) const {
        return background == o.background && glyph == o.glyph &&
               artworkRef == o.artworkRef && title == o.title &&
               overlay == o.overlay && label == o.label;
    }
    bool operator!=(const KeyFace& o) const { return !(*this == o); }
};

// Output side of the control surface. Implementations need not be
// reentrant; callers serialize renderKey().
class KeySurface {
public:
    virtual ~KeySurface() = default;

    virtual uint8_t keyCount() const = 0;
    virtual bool isConnected() const = 0;

    virtual void renderKey(uint8_t key, const KeyFace& face) = 0;
    virtual void setBrightness(uint8_t percent) = 0;
};
