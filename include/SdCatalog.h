#pragma once

#include "ConfigState.h"
#include "MediaItem.h"

// Mount the SD card. Returns false when no card is present.
bool sdCatalog_mount();

// Fill library from cfg.mediaFile, then from the sub-directories of
// cfg.musicFolder. Missing files or folders only produce warnings.
void sdCatalog_load(MediaLibrary& library, const EffectiveConfig& cfg);
