#pragma once

#include <string>
#include <vector>

#include "MediaItem.h"

// Media catalog sources. Parsing is storage-agnostic; the firmware reads the
// files from SD (SdCatalog.cpp) and hands the contents over.

// Parses a media.json document:
//   {"albums":[{"name","path","type","artwork","tracks":[ "path" | {"path","artwork"} ]}]}
// Malformed input is logged and yields an empty list.
std::vector<MediaItemPtr> parseCatalogJson(const std::string& json);

// Builds an album from one music sub-directory listing (file names or
// paths, any order). Returns null when the directory holds no audio.
MediaItemPtr albumFromDirectory(const std::string& dirPath,
                                const std::vector<std::string>& files);

// Case-insensitive extension checks.
bool isAudioFile(const std::string& path);
bool isImageFile(const std::string& path);
