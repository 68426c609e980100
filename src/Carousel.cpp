#include "Carousel.h"

#include "Log.h"

Carousel::Carousel(const MediaLibrary& library)
: _library(library)
{
}

size_t Carousel::startIndex() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _startIndex;
}

size_t Carousel::next() {
    std::lock_guard<std::mutex> lock(_mutex);
    const size_t count = _library.size();
    if (count == 0) {
        _startIndex = 0;
        return _startIndex;
    }

    _startIndex = _startIndex + 1;
    if (_startIndex >= count) {
        _startIndex = 0;
    }
    logf(LogLevel::Info, "Current carousel start index: %u", static_cast<unsigned>(_startIndex));
    return _startIndex;
}

size_t Carousel::previous() {
    std::lock_guard<std::mutex> lock(_mutex);
    const size_t count = _library.size();
    if (count == 0) {
        _startIndex = 0;
        return _startIndex;
    }

    _startIndex = (_startIndex == 0) ? count - 1 : _startIndex - 1;
    logf(LogLevel::Info, "Current carousel start index: %u", static_cast<unsigned>(_startIndex));
    return _startIndex;
}

bool Carousel::resetToDefault() {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_startIndex == 0) {
        return false;
    }
    _startIndex = 0;
    return true;
}

std::vector<MediaItemPtr> Carousel::window(size_t size) const {
    std::vector<MediaItemPtr> out;
    if (_library.empty()) {
        return out;
    }

    const size_t start = startIndex();
    out.reserve(size);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(_library.wrapped(start + i));
    }
    return out;
}
