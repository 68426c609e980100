#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "DeckController.h"
#include "FakeKeySurface.h"
#include "FakeMediaEngine.h"
#include "TestSupport.h"

namespace {

constexpr uint32_t LONG_MS   = 60;
constexpr uint32_t REPEAT_MS = 30;
constexpr uint32_t IDLE_MS   = 120;

EffectiveConfig testConfig() {
    ConfigState state;
    EffectiveConfig eff = state.effective();
    eff.longPressMs      = LONG_MS;
    eff.repeatIntervalMs = REPEAT_MS;
    eff.carouselResetMs  = IDLE_MS;
    eff.settleDelayMs    = 0;
    return eff;
}

MediaLibrary testLibrary() {
    MediaLibrary lib;
    lib.add(makeAlbum("a0", 3));
    lib.add(makeAlbum("a1", 2));
    lib.add(makeStream("s2"));
    lib.add(makeAlbum("a3", 1));
    lib.add(makeAlbum("a4", 4));
    return lib;
}

class DeckControllerTest : public ::testing::Test {
protected:
    DeckControllerTest() : deck(testLibrary(), engine, surface, testConfig()) {
        deck.setChangeObserver([this]() { ++changes; });
        deck.begin();
    }
    ~DeckControllerTest() override { deck.shutdown(); }

    void tap(uint8_t key) {
        deck.onKeyTransition(key, true);
        deck.onKeyTransition(key, false);
    }

    FakeMediaEngine  engine;
    FakeKeySurface   surface;
    DeckController   deck;
    std::atomic<int> changes{0};
};

} // namespace

TEST_F(DeckControllerTest, BeginRendersEveryKey) {
    for (uint8_t k = 0; k < DECK_KEY_COUNT; ++k) {
        EXPECT_TRUE(surface.rendered(k)) << "key " << int(k);
    }
    EXPECT_EQ(surface.face(0).title, "a0");
    EXPECT_EQ(surface.face(2).title, "s2");
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).glyph, KeyGlyph::NowPlayingEmpty);
    EXPECT_EQ(surface.face(KEY_SOFT_PREVIOUS).glyph, KeyGlyph::CarouselPrevious);
    EXPECT_EQ(surface.face(KEY_SOFT_NEXT).glyph, KeyGlyph::CarouselNext);
}

TEST_F(DeckControllerTest, MediaKeyStartsPlaybackAndSwitchesToTrackMode) {
    tap(0);

    EXPECT_EQ(engine.lastPlayed(), "/music/a0/1.mp3");
    KeyFace now = surface.face(KEY_NOW_PLAYING);
    EXPECT_EQ(now.title, "a0");
    EXPECT_EQ(now.overlay, KeyOverlay::Pause);
    EXPECT_EQ(now.label, "01");
    EXPECT_EQ(surface.face(KEY_SOFT_NEXT).glyph, KeyGlyph::NextTrack);
    EXPECT_GT(changes.load(), 0);

    tap(KEY_SOFT_NEXT);
    EXPECT_EQ(engine.lastPlayed(), "/music/a0/2.mp3");
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).label, "02");
    EXPECT_EQ(deck.carousel().startIndex(), 0u);

    tap(KEY_SOFT_PREVIOUS);
    EXPECT_EQ(engine.lastPlayed(), "/music/a0/1.mp3");
}

TEST_F(DeckControllerTest, SoftKeysMoveCarouselWhenIdle) {
    tap(KEY_SOFT_NEXT);
    EXPECT_EQ(deck.carousel().startIndex(), 1u);
    EXPECT_EQ(surface.face(0).title, "a1");
    EXPECT_EQ(surface.face(2).title, "a3");

    tap(KEY_SOFT_PREVIOUS);
    tap(KEY_SOFT_PREVIOUS);
    EXPECT_EQ(deck.carousel().startIndex(), 4u);
    EXPECT_EQ(surface.face(1).title, "a0");
    EXPECT_TRUE(engine.played().empty());
}

TEST_F(DeckControllerTest, HoldingSoftKeyInTrackModeScrollsCarousel) {
    tap(0);
    deck.onKeyTransition(KEY_SOFT_NEXT, true);
    ASSERT_TRUE(waitUntil([&]() { return deck.carousel().startIndex() >= 2; }));
    deck.onKeyTransition(KEY_SOFT_NEXT, false);

    // The hold never changed the track.
    EXPECT_EQ(deck.playback().snapshot().trackIndex, 0);
    EXPECT_EQ(engine.played().size(), 1u);
}

TEST_F(DeckControllerTest, NowPlayingTogglesAndHoldStops) {
    tap(1);
    tap(KEY_NOW_PLAYING);
    EXPECT_EQ(deck.playback().snapshot().state, SessionState::Paused);
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).overlay, KeyOverlay::Play);
    // Paused albums fall back to carousel navigation.
    EXPECT_EQ(surface.face(KEY_SOFT_NEXT).glyph, KeyGlyph::CarouselNext);

    tap(KEY_NOW_PLAYING);
    EXPECT_EQ(deck.playback().snapshot().state, SessionState::Playing);

    deck.onKeyTransition(KEY_NOW_PLAYING, true);
    ASSERT_TRUE(waitUntil([&]() {
        return deck.playback().snapshot().state == SessionState::NoSession;
    }));
    deck.onKeyTransition(KEY_NOW_PLAYING, false);

    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).glyph, KeyGlyph::NowPlayingEmpty);
    EXPECT_EQ(deck.playback().snapshot().state, SessionState::NoSession);
}

TEST_F(DeckControllerTest, StreamKeepsCarouselModeAndStopsOnPress) {
    tap(2);
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).overlay, KeyOverlay::Stop);
    EXPECT_EQ(surface.face(KEY_SOFT_NEXT).glyph, KeyGlyph::CarouselNext);

    tap(KEY_NOW_PLAYING);
    EXPECT_EQ(deck.playback().snapshot().state, SessionState::NoSession);
    EXPECT_EQ(engine.state(), PlayerState::Stopped);
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).glyph, KeyGlyph::NowPlayingEmpty);
}

TEST_F(DeckControllerTest, PausedAlbumShowsPlayAndResumesOnPress) {
    tap(0);
    tap(KEY_NOW_PLAYING);
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).overlay, KeyOverlay::Play);
    tap(KEY_NOW_PLAYING);
    EXPECT_EQ(deck.playback().snapshot().state, SessionState::Playing);
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).overlay, KeyOverlay::Pause);
}

TEST_F(DeckControllerTest, ConcurrentNavigationLeavesKeysOnTheCurrentWindow) {
    deck.idleTimer().setTimeout(60000);
    auto forward = [this]() {
        for (int i = 0; i < 201; ++i) deck.carouselNext();
    };
    auto backward = [this]() {
        for (int i = 0; i < 150; ++i) deck.carouselPrevious();
    };
    std::thread a(forward);
    std::thread b(backward);
    a.join();
    b.join();
    deck.idleTimer().cancel();

    const size_t start = deck.carousel().startIndex();
    EXPECT_EQ(start, 51u % deck.library().size());
    for (uint8_t i = 0; i < CAROUSEL_WINDOW; ++i) {
        EXPECT_EQ(surface.face(KEY_MEDIA_FIRST + i).title,
                  deck.library().wrapped(start + i)->name()) << "key " << int(i);
    }

    // The binding follows the face.
    tap(KEY_MEDIA_FIRST);
    EXPECT_EQ(deck.playback().snapshot().item, deck.library().wrapped(start));
}

TEST_F(DeckControllerTest, CarouselReturnsHomeAfterIdleTimeout) {
    deck.carouselNext();
    deck.carouselNext();
    EXPECT_TRUE(deck.idleTimer().isScheduled());

    ASSERT_TRUE(waitUntil([&]() { return deck.carousel().startIndex() == 0; }));
    EXPECT_EQ(surface.face(0).title, "a0");
    EXPECT_FALSE(deck.idleTimer().isScheduled());
}

TEST_F(DeckControllerTest, NavigationBeforeTimeoutPostponesReset) {
    deck.carouselNext();
    sleepMs(IDLE_MS / 2);
    deck.carouselNext();
    sleepMs(IDLE_MS * 3 / 4);
    // The first deadline has passed without a reset.
    EXPECT_EQ(deck.carousel().startIndex(), 2u);
    ASSERT_TRUE(waitUntil([&]() { return deck.carousel().startIndex() == 0; }));
}

TEST_F(DeckControllerTest, EndOfStreamAdvancesTheNowPlayingKey) {
    tap(0);
    ASSERT_TRUE(engine.finish());
    deck.playback().waitForNotifications();
    EXPECT_EQ(surface.face(KEY_NOW_PLAYING).label, "02");
}

TEST_F(DeckControllerTest, PlayIndexValidatesRange) {
    std::string error;
    EXPECT_FALSE(deck.playIndex(9, &error));
    EXPECT_EQ(error, "Album index out of range");

    EXPECT_TRUE(deck.playIndex(4, &error));
    EXPECT_EQ(engine.lastPlayed(), "/music/a4/1.mp3");

    engine.failPlay(true);
    EXPECT_FALSE(deck.playIndex(1, &error));
    EXPECT_EQ(error, "Playback did not start successfully: error");
}

TEST_F(DeckControllerTest, ApplyConfigUpdatesTimingAndOutputs) {
    EffectiveConfig eff = testConfig();
    eff.longPressMs = 500;
    eff.brightness  = 40;
    eff.volume      = 0.25f;
    deck.applyConfig(eff);

    EXPECT_EQ(deck.buttons().longPressThreshold(), 500u);
    EXPECT_EQ(surface.brightness(), 40);
    EXPECT_FLOAT_EQ(engine.volume(), 0.25f);
}

TEST_F(DeckControllerTest, BrightnessChangesNeverOverlapRendering) {
    surface.setCallDelayMs(1);
    EffectiveConfig eff = testConfig();

    std::thread nav([this]() {
        for (int i = 0; i < 20; ++i) deck.carouselNext();
    });
    for (int i = 0; i < 20; ++i) {
        eff.brightness = static_cast<uint8_t>(10 + i);
        deck.applyConfig(eff);
    }
    nav.join();

    EXPECT_EQ(surface.overlappingCalls(), 0);
    EXPECT_EQ(surface.brightness(), 29);
}
