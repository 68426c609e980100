#include <gtest/gtest.h>

#include "ButtonRouter.h"
#include "TestSupport.h"

static SessionSnapshot sessionOf(SessionState state, const MediaItemPtr& item) {
    SessionSnapshot s;
    s.state      = state;
    s.item       = item;
    s.trackIndex = item ? item->currentTrackIndex() : -1;
    return s;
}

TEST(ButtonRouterFaces, MediaKeyShowsArtworkAndTitle) {
    MediaItemPtr a = makeAlbum("Blue Train", 4);
    KeyFace face = ButtonRouter::mediaFace(a);
    EXPECT_EQ(face.background, KEY_BG_TEAL);
    EXPECT_EQ(face.title, "Blue Train");
    EXPECT_EQ(face.artworkRef, "/music/Blue Train/cover.jpg");
    EXPECT_EQ(face.overlay, KeyOverlay::None);
}

TEST(ButtonRouterFaces, NowPlayingWithoutSessionIsGray) {
    KeyFace face = ButtonRouter::nowPlayingFace(SessionSnapshot());
    EXPECT_EQ(face.background, KEY_BG_GRAY);
    EXPECT_EQ(face.glyph, KeyGlyph::NowPlayingEmpty);
    EXPECT_TRUE(face.label.empty());
}

TEST(ButtonRouterFaces, NowPlayingOverlayFollowsState) {
    MediaItemPtr a = makeAlbum("a", 12);
    a->nextTrack();

    KeyFace playing = ButtonRouter::nowPlayingFace(sessionOf(SessionState::Playing, a));
    EXPECT_EQ(playing.overlay, KeyOverlay::Pause);
    EXPECT_EQ(playing.label, "02");

    KeyFace paused = ButtonRouter::nowPlayingFace(sessionOf(SessionState::Paused, a));
    EXPECT_EQ(paused.overlay, KeyOverlay::Play);

    KeyFace stream = ButtonRouter::nowPlayingFace(sessionOf(SessionState::Playing, makeStream("r")));
    EXPECT_EQ(stream.overlay, KeyOverlay::Stop);
    EXPECT_TRUE(stream.label.empty());
}

TEST(ButtonRouterFaces, TrackModeOnlyWhilePlayingMultiTrack) {
    MediaItemPtr a = makeAlbum("a", 3);
    EXPECT_TRUE(ButtonRouter::isTrackMode(sessionOf(SessionState::Playing, a)));
    EXPECT_FALSE(ButtonRouter::isTrackMode(sessionOf(SessionState::Paused, a)));
    EXPECT_FALSE(ButtonRouter::isTrackMode(sessionOf(SessionState::Playing, makeStream("r"))));
    EXPECT_FALSE(ButtonRouter::isTrackMode(SessionSnapshot()));
}

TEST(ButtonRouterFaces, SoftKeyGlyphs) {
    EXPECT_EQ(ButtonRouter::softKeyFace(KEY_SOFT_PREVIOUS, false).glyph, KeyGlyph::CarouselPrevious);
    EXPECT_EQ(ButtonRouter::softKeyFace(KEY_SOFT_NEXT, false).glyph, KeyGlyph::CarouselNext);
    EXPECT_EQ(ButtonRouter::softKeyFace(KEY_SOFT_PREVIOUS, true).glyph, KeyGlyph::PreviousTrack);
    EXPECT_EQ(ButtonRouter::softKeyFace(KEY_SOFT_NEXT, true).glyph, KeyGlyph::NextTrack);
}
