#pragma once

#include <stdint.h>
#include <mutex>
#include <vector>

#include "MediaItem.h"

constexpr const size_t CAROUSEL_WINDOW = 3;

// Sliding window of CAROUSEL_WINDOW items over the (circular) library.
// startIndex stays in [0, itemCount) whenever itemCount > 0.
class Carousel {
public:
    explicit Carousel(const MediaLibrary& library);

    size_t startIndex() const;
    size_t itemCount() const { return _library.size(); }
    bool   isAtDefault() const { return startIndex() == 0; }

    // Wraps around; return the new start index.
    size_t next();
    size_t previous();

    // Returns true if the position actually changed.
    bool resetToDefault();

    // Items currently mapped onto the media keys. Fewer items than the
    // window repeat (circular); an empty library yields an empty window.
    std::vector<MediaItemPtr> window(size_t size = CAROUSEL_WINDOW) const;

private:
    const MediaLibrary& _library;
    mutable std::mutex  _mutex;
    size_t              _startIndex = 0;
};
