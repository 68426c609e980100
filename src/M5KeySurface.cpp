#include <SD.h>         // before M5Unified so M5GFX enables its fs:: image loaders
#include <M5Unified.h>

#include <string.h>
#include <strings.h>

#include "M5KeySurface.h"
#include "Log.h"

static constexpr int32_t KEY_MARGIN   = 4;
static constexpr int32_t OVERLAY_SIZE = 22;

static uint16_t toColor565(uint32_t rgb) {
    return M5.Display.color565((rgb >> 16) & 0xFF, (rgb >> 8) & 0xFF, rgb & 0xFF);
}

static bool endsWithNoCase(const std::string& s, const char* suffix) {
    const size_t n = strlen(suffix);
    if (s.size() < n) return false;
    return strcasecmp(s.c_str() + s.size() - n, suffix) == 0;
}

M5KeySurface::M5KeySurface() {
    for (uint8_t i = 0; i < keyCount(); ++i) {
        _pressed[i] = false;
    }
}

void M5KeySurface::begin() {
    _keyW = M5.Display.width() / KEY_COLUMNS;
    _keyH = M5.Display.height() / KEY_ROWS;
    M5.Display.fillScreen(TFT_BLACK);
    _begun = true;
    logf(LogLevel::Info, "[deck] Surface %ldx%ld, key %ldx%ld",
         static_cast<long>(M5.Display.width()), static_cast<long>(M5.Display.height()),
         static_cast<long>(_keyW), static_cast<long>(_keyH));
}

uint8_t M5KeySurface::keyAt(int32_t x, int32_t y) const {
    if (!_begun || x < 0 || y < 0) return NO_KEY;
    const int32_t col = x / _keyW;
    const int32_t row = y / _keyH;
    if (col >= KEY_COLUMNS || row >= KEY_ROWS) return NO_KEY;
    return static_cast<uint8_t>(row * KEY_COLUMNS + col);
}

// --------------------------------------------------------------
// Input
// --------------------------------------------------------------

void M5KeySurface::poll(const TransitionHandler& onTransition) {
    if (!_begun) return;

    bool now[KEY_COLUMNS * KEY_ROWS] = {};
    const uint8_t count = M5.Touch.getCount();
    for (uint8_t i = 0; i < count; ++i) {
        const auto& t = M5.Touch.getDetail(i);
        if (!t.isPressed()) continue;
        const uint8_t key = keyAt(t.x, t.y);
        if (key != NO_KEY) now[key] = true;
    }

    // Releases first, so sliding from one key to another reads as
    // release + press.
    for (uint8_t key = 0; key < keyCount(); ++key) {
        if (_pressed[key] && !now[key]) {
            _pressed[key] = false;
            onTransition(key, false);
        }
    }
    for (uint8_t key = 0; key < keyCount(); ++key) {
        if (!_pressed[key] && now[key]) {
            _pressed[key] = true;
            onTransition(key, true);
        }
    }
}

// --------------------------------------------------------------
// Output
// --------------------------------------------------------------

void M5KeySurface::renderKey(uint8_t key, const KeyFace& face) {
    if (!_begun || key >= keyCount()) return;

    const int32_t x = (key % KEY_COLUMNS) * _keyW;
    const int32_t y = (key / KEY_COLUMNS) * _keyH;

    M5.Display.startWrite();
    M5.Display.fillRect(x, y, _keyW, _keyH, TFT_BLACK);
    M5.Display.fillRoundRect(x + KEY_MARGIN, y + KEY_MARGIN,
                             _keyW - 2 * KEY_MARGIN, _keyH - 2 * KEY_MARGIN,
                             8, toColor565(face.background));

    if (face.glyph != KeyGlyph::None) {
        drawGlyph(x, y, face.glyph);
    } else if (!face.artworkRef.empty() || !face.title.empty()) {
        drawArtwork(x, y, face);
    }

    if (face.overlay != KeyOverlay::None) {
        drawOverlay(x, y, face.overlay);
    }

    if (!face.label.empty()) {
        M5.Display.setFont(&fonts::DejaVu12);
        M5.Display.setTextDatum(top_left);
        M5.Display.setTextColor(TFT_WHITE, TFT_BLACK);
        M5.Display.drawString(face.label.c_str(), x + KEY_MARGIN + 4, y + KEY_MARGIN + 4);
    }
    M5.Display.endWrite();
}

void M5KeySurface::drawArtwork(int32_t x, int32_t y, const KeyFace& face) {
    const int32_t ax = x + 2 * KEY_MARGIN;
    const int32_t ay = y + 2 * KEY_MARGIN;
    const int32_t aw = _keyW - 4 * KEY_MARGIN;
    const int32_t ah = _keyH - 4 * KEY_MARGIN;

    bool drawn = false;
    const std::string& ref = face.artworkRef;
    if (!ref.empty() && ref[0] == '/' && SD.exists(ref.c_str())) {
        if (endsWithNoCase(ref, ".png")) {
            drawn = M5.Display.drawPngFile(SD, ref.c_str(), ax, ay, aw, ah, 0, 0, 0.0f, 0.0f,
                                           middle_center);
        } else {
            drawn = M5.Display.drawJpgFile(SD, ref.c_str(), ax, ay, aw, ah, 0, 0, 0.0f, 0.0f,
                                           middle_center);
        }
        if (!drawn) {
            logf(LogLevel::Warn, "[deck] Could not draw artwork %s", ref.c_str());
        }
    }

    // Generated text artwork
    if (!drawn) {
        drawTitle(x, y, face);
    }
}

void M5KeySurface::drawTitle(int32_t x, int32_t y, const KeyFace& face) {
    M5.Display.setFont(&fonts::DejaVu12);
    M5.Display.setTextColor(TFT_WHITE);
    M5.Display.setTextDatum(middle_center);

    // Up to three lines, split on spaces.
    const int32_t maxW = _keyW - 4 * KEY_MARGIN;
    std::string lines[3];
    uint8_t line = 0;
    std::string word;
    const std::string text = face.title + " ";
    for (char c : text) {
        if (c != ' ') {
            word += c;
            continue;
        }
        if (word.empty()) continue;
        std::string candidate = lines[line].empty() ? word : lines[line] + " " + word;
        if (M5.Display.textWidth(candidate.c_str()) > maxW && !lines[line].empty() && line < 2) {
            ++line;
            candidate = word;
        }
        lines[line] = candidate;
        word.clear();
    }

    const int32_t lineH = M5.Display.fontHeight() + 2;
    const int32_t cx = x + _keyW / 2;
    int32_t cy = y + _keyH / 2 - (line * lineH) / 2;
    for (uint8_t i = 0; i <= line; ++i) {
        M5.Display.drawString(lines[i].c_str(), cx, cy);
        cy += lineH;
    }
}

void M5KeySurface::drawGlyph(int32_t x, int32_t y, KeyGlyph glyph) {
    const int32_t cx = x + _keyW / 2;
    const int32_t cy = y + _keyH / 2;
    const int32_t s  = (_keyH < _keyW ? _keyH : _keyW) / 4;

    switch (glyph) {
        case KeyGlyph::CarouselPrevious:
            M5.Display.fillTriangle(cx + s / 2, cy - s, cx + s / 2, cy + s, cx - s, cy, TFT_WHITE);
            break;
        case KeyGlyph::CarouselNext:
            M5.Display.fillTriangle(cx - s / 2, cy - s, cx - s / 2, cy + s, cx + s, cy, TFT_WHITE);
            break;
        case KeyGlyph::PreviousTrack:
            M5.Display.fillRect(cx - s, cy - s, s / 4, 2 * s, TFT_WHITE);
            M5.Display.fillTriangle(cx + s, cy - s, cx + s, cy + s, cx - s / 2, cy, TFT_WHITE);
            break;
        case KeyGlyph::NextTrack:
            M5.Display.fillRect(cx + s - s / 4, cy - s, s / 4, 2 * s, TFT_WHITE);
            M5.Display.fillTriangle(cx - s, cy - s, cx - s, cy + s, cx + s / 2, cy, TFT_WHITE);
            break;
        case KeyGlyph::NowPlayingEmpty:
            // Eighth note
            M5.Display.fillCircle(cx - s / 2, cy + s / 2, s / 3, TFT_WHITE);
            M5.Display.fillRect(cx - s / 2 + s / 3 - 2, cy - s, 3, s + s / 2, TFT_WHITE);
            M5.Display.fillTriangle(cx - s / 2 + s / 3, cy - s, cx + s / 2, cy - s / 2,
                                    cx - s / 2 + s / 3, cy - s / 3, TFT_WHITE);
            break;
        case KeyGlyph::None:
        default:
            break;
    }
}

void M5KeySurface::drawOverlay(int32_t x, int32_t y, KeyOverlay overlay) {
    const int32_t ox = x + _keyW - KEY_MARGIN - OVERLAY_SIZE - 4;
    const int32_t oy = y + _keyH - KEY_MARGIN - OVERLAY_SIZE - 4;

    M5.Display.fillCircle(ox + OVERLAY_SIZE / 2, oy + OVERLAY_SIZE / 2, OVERLAY_SIZE / 2 + 2, TFT_BLACK);

    switch (overlay) {
        case KeyOverlay::Play:
            M5.Display.fillTriangle(ox + 6, oy + 4, ox + 6, oy + OVERLAY_SIZE - 4,
                                    ox + OVERLAY_SIZE - 4, oy + OVERLAY_SIZE / 2, TFT_WHITE);
            break;
        case KeyOverlay::Pause:
            M5.Display.fillRect(ox + 5, oy + 4, 4, OVERLAY_SIZE - 8, TFT_WHITE);
            M5.Display.fillRect(ox + OVERLAY_SIZE - 9, oy + 4, 4, OVERLAY_SIZE - 8, TFT_WHITE);
            break;
        case KeyOverlay::Stop:
            M5.Display.fillRect(ox + 5, oy + 5, OVERLAY_SIZE - 10, OVERLAY_SIZE - 10, TFT_WHITE);
            break;
        case KeyOverlay::None:
        default:
            break;
    }
}

void M5KeySurface::setBrightness(uint8_t percent) {
    if (percent > 100) percent = 100;
    const uint8_t hw = static_cast<uint8_t>((static_cast<uint16_t>(percent) * 255) / 100);
    M5.Display.setBrightness(hw);
}
