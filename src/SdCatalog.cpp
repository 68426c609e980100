#include <SD.h>
#include <SPI.h>
#include <M5Unified.h>

#include <algorithm>
#include <vector>

#include "CatalogLoader.h"
#include "SdCatalog.h"
#include "Log.h"

// M5Stack Core2 / CoreS3 microSD chip select
static constexpr int SD_CS_PIN = 4;
static constexpr uint32_t SD_SPI_HZ = 25000000;
static constexpr size_t MAX_ALBUM_FILES = 256;

bool sdCatalog_mount() {
    if (!SD.begin(SD_CS_PIN, SPI, SD_SPI_HZ)) {
        logf(LogLevel::Error, "[SD] Card mount failed");
        return false;
    }
    logf(LogLevel::Info, "[SD] Card mounted, %llu MB", static_cast<unsigned long long>(SD.cardSize() / (1024ULL * 1024ULL)));
    return true;
}

static bool readWholeFile(const char* path, std::string& out) {
    File f = SD.open(path, FILE_READ);
    if (!f) {
        return false;
    }
    out.clear();
    out.reserve(f.size());
    char buf[256];
    while (f.available()) {
        const size_t n = f.read(reinterpret_cast<uint8_t*>(buf), sizeof(buf));
        if (n == 0) break;
        out.append(buf, n);
    }
    f.close();
    return true;
}

static std::string childPath(const String& dir, const char* name) {
    String p(name);
    if (!p.startsWith("/")) p = dir + "/" + p;
    return std::string(p.c_str());
}

static void scanMusicFolder(MediaLibrary& library, const char* folder) {
    String dir(folder);
    File root = SD.open(folder);
    if (!root || !root.isDirectory()) {
        logf(LogLevel::Warn, "[SD] Path %s does not exist or is not a directory.", folder);
        return;
    }

    // Sorted for a stable carousel order between boots.
    std::vector<std::string> albumDirs;
    File entry = root.openNextFile();
    while (entry) {
        if (entry.isDirectory()) {
            albumDirs.push_back(childPath(dir, entry.name()));
        }
        entry.close();
        entry = root.openNextFile();
    }
    root.close();
    std::sort(albumDirs.begin(), albumDirs.end());

    size_t added = 0;
    for (const std::string& albumDir : albumDirs) {
        File d = SD.open(albumDir.c_str());
        if (!d) continue;

        std::vector<std::string> files;
        File f = d.openNextFile();
        while (f && files.size() < MAX_ALBUM_FILES) {
            if (!f.isDirectory()) {
                files.push_back(childPath(String(albumDir.c_str()), f.name()));
            }
            f.close();
            f = d.openNextFile();
        }
        d.close();

        MediaItemPtr album = albumFromDirectory(albumDir, files);
        if (album && library.addIfNew(album)) {
            ++added;
        }
    }
    logf(LogLevel::Info, "[SD] Loaded %u albums from music path.", static_cast<unsigned>(added));
}

void sdCatalog_load(MediaLibrary& library, const EffectiveConfig& cfg) {
    std::string json;
    if (readWholeFile(cfg.mediaFile.c_str(), json)) {
        library.addAll(parseCatalogJson(json));
    } else {
        logf(LogLevel::Warn, "[SD] %s not found", cfg.mediaFile.c_str());
    }

    scanMusicFolder(library, cfg.musicFolder.c_str());
    logf(LogLevel::Info, "[SD] Catalog: %u items", static_cast<unsigned>(library.size()));
}
