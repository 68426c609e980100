#include <gtest/gtest.h>

#include "CatalogLoader.h"
#include "TestSupport.h"

TEST(CatalogLoader, ParsesAlbumsWithDefaults) {
    const std::string json = R"({
        "albums": [
            {"name": "Radio One", "path": "http://radio.example/one"},
            {"path": "/media/show.mp3", "type": "playlist"},
            {"name": "Live", "path": "/music/live", "type": "album", "artwork": "/music/live/cover.png",
             "tracks": ["/music/live/01.mp3", {"path": "/music/live/02.mp3", "artwork": "/art/02.jpg"}]}
        ]
    })";

    std::vector<MediaItemPtr> items = parseCatalogJson(json);
    ASSERT_EQ(items.size(), 3u);

    EXPECT_EQ(items[0]->name(), "Radio One");
    EXPECT_EQ(items[0]->type(), MediaType::Stream);
    EXPECT_FALSE(items[0]->hasTracks());

    EXPECT_EQ(items[1]->name(), "Unknown Album");
    EXPECT_EQ(items[1]->type(), MediaType::Playlist);

    const MediaItemPtr& live = items[2];
    EXPECT_EQ(live->type(), MediaType::Album);
    EXPECT_EQ(live->artworkRef(), "/music/live/cover.png");
    ASSERT_EQ(live->tracks().size(), 2u);
    EXPECT_EQ(live->tracks()[0].name, "01");
    EXPECT_EQ(live->tracks()[1].artworkRef, "/art/02.jpg");
}

TEST(CatalogLoader, SkipsUnplayableEntries) {
    const std::string json = R"({"albums": [
        {"name": "empty"},
        42,
        {"name": "ok", "path": "/x.mp3"},
        {"name": "badtracks", "tracks": [{"artwork": "/a.png"}]}
    ]})";
    std::vector<MediaItemPtr> items = parseCatalogJson(json);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0]->name(), "ok");
}

TEST(CatalogLoader, MalformedJsonYieldsEmptyList) {
    LogCapture log;
    EXPECT_TRUE(parseCatalogJson("{not json").empty());
    EXPECT_TRUE(parseCatalogJson(R"({"items": []})").empty());
    EXPECT_TRUE(log.contains("media.json"));
}

TEST(CatalogLoader, DirectoryBecomesSortedAlbum) {
    MediaItemPtr album = albumFromDirectory("/music/Kind of Blue", {
        "03 Blue in Green.FLAC", "notes.txt", "01 So What.mp3", "cover.png", "front.jpg", "02 Freddie.m4a",
    });
    ASSERT_NE(album, nullptr);
    EXPECT_EQ(album->name(), "Kind of Blue");
    EXPECT_EQ(album->path(), "/music/Kind of Blue");
    EXPECT_EQ(album->type(), MediaType::Album);
    EXPECT_EQ(album->artworkRef(), "/music/Kind of Blue/front.jpg");

    ASSERT_EQ(album->tracks().size(), 3u);
    EXPECT_EQ(album->tracks()[0].path, "/music/Kind of Blue/01 So What.mp3");
    EXPECT_EQ(album->tracks()[2].name, "03 Blue in Green");
}

TEST(CatalogLoader, DirectoryWithoutAudioIsSkipped) {
    LogCapture log;
    EXPECT_EQ(albumFromDirectory("/music/art", {"cover.jpg", "readme.md"}), nullptr);
    EXPECT_TRUE(log.contains("No audio tracks found"));
}

TEST(CatalogLoader, ExtensionChecksIgnoreCase) {
    EXPECT_TRUE(isAudioFile("/a/B.MP3"));
    EXPECT_TRUE(isAudioFile("x.aiff"));
    EXPECT_FALSE(isAudioFile("/a.mp3/readme"));
    EXPECT_TRUE(isImageFile("c.JPEG"));
    EXPECT_FALSE(isImageFile("c.gif"));
}
