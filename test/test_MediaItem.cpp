#include <gtest/gtest.h>

#include "MediaItem.h"
#include "TestSupport.h"

TEST(MediaItem, CursorStaysWithinTracks) {
    MediaItemPtr album = makeAlbum("x", 3);
    EXPECT_EQ(album->currentTrackIndex(), 0);
    EXPECT_FALSE(album->previousTrack());
    EXPECT_TRUE(album->nextTrack());
    EXPECT_TRUE(album->nextTrack());
    EXPECT_TRUE(album->currentTrackIsLast());
    EXPECT_FALSE(album->nextTrack());
    EXPECT_EQ(album->currentTrackIndex(), 2);
    EXPECT_EQ(album->currentPath(), "/music/x/3.mp3");

    album->resetCurrentTrack();
    EXPECT_EQ(album->currentTrackIndex(), 0);
}

TEST(MediaItem, ItemWithoutTracksPlaysItsOwnPath) {
    MediaItemPtr stream = makeStream("jazz");
    EXPECT_EQ(stream->currentTrackIndex(), -1);
    EXPECT_EQ(stream->currentTrack(), nullptr);
    EXPECT_EQ(stream->currentPath(), "http://radio.example/jazz");
    EXPECT_FALSE(stream->isMultiTrack());
    EXPECT_FALSE(stream->nextTrack());
}

TEST(MediaItem, TrackArtworkFallsBackToItem) {
    std::vector<Track> tracks(2);
    tracks[0].path = "/p/1.mp3";
    tracks[1].path = "/p/2.mp3";
    tracks[1].artworkRef = "/p/2.png";
    MediaItem item("p", "/p", MediaType::Podcast, "/p/cover.jpg", tracks);

    EXPECT_TRUE(item.isMultiTrack());
    EXPECT_EQ(item.currentArtworkRef(), "/p/cover.jpg");
    item.nextTrack();
    EXPECT_EQ(item.currentArtworkRef(), "/p/2.png");
    EXPECT_EQ(item.currentTrack()->name, "2");
}

TEST(MediaItem, TypeNames) {
    EXPECT_EQ(parseMediaType("album"), MediaType::Album);
    EXPECT_EQ(parseMediaType("podcast"), MediaType::Podcast);
    EXPECT_EQ(parseMediaType("whatever"), MediaType::Stream);
    EXPECT_STREQ(mediaTypeName(MediaType::Playlist), "playlist");
    EXPECT_EQ(trackNameFromPath("/music/a/01 Intro.mp3"), "01 Intro");
    EXPECT_EQ(trackNameFromPath("noext"), "noext");
}

TEST(MediaLibrary, ScannedDuplicatePathsAreSkipped) {
    MediaLibrary lib;
    EXPECT_TRUE(lib.add(makeAlbum("a", 1)));
    EXPECT_FALSE(lib.addIfNew(makeAlbum("a", 2)));
    EXPECT_TRUE(lib.addIfNew(makeAlbum("b", 1)));
    EXPECT_EQ(lib.size(), 2u);
    EXPECT_EQ(lib.wrapped(3)->name(), "b");
    EXPECT_EQ(lib.at(5), nullptr);
    EXPECT_EQ(lib.indexOf(lib.at(1).get()), 1);
}

TEST(MediaLibrary, CatalogEntriesAreAllKept) {
    Track epA;
    epA.path = "/pod/a/ep1.mp3";
    Track epB;
    epB.path = "/pod/b/ep1.mp3";

    MediaLibrary lib;
    EXPECT_EQ(lib.addAll({std::make_shared<MediaItem>("PodA", "", MediaType::Podcast, "",
                                                      std::vector<Track>{epA}),
                          std::make_shared<MediaItem>("PodB", "", MediaType::Podcast, "",
                                                      std::vector<Track>{epB}),
                          makeStream("same"), makeStream("same")}),
              4u);
    EXPECT_EQ(lib.size(), 4u);
    EXPECT_EQ(lib.at(1)->name(), "PodB");
    EXPECT_FALSE(lib.containsPath(""));

    // A scanned album without a path is never a duplicate either.
    EXPECT_TRUE(lib.addIfNew(std::make_shared<MediaItem>("Loose", "", MediaType::Album, "",
                                                         std::vector<Track>{epA})));
    EXPECT_EQ(lib.size(), 5u);
}
