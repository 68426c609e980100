#include <M5Unified.h>
#include <millisDelay.h>
#include <string.h>

#include "ScreenModule.h"
#include "Log.h"

millisDelay md_screenRefresh;

ScreenId currentScreen = SCREEN_STARTUP;

// Boot log shown until the deck takes over the display.
LGFX_Sprite startupScreen(&M5.Display);

constexpr size_t LOG_MESSAGE_MAX_LEN = 64;
constexpr int    STARTUP_LOG_LINES   = 20;
struct startupLogData {
    char logMessage[LOG_MESSAGE_MAX_LEN + 1];
    int textSize;
};

startupLogData startupLogEntries[STARTUP_LOG_LINES];
int count_startupLog = 0;
static bool startupDirty = false;


static void refreshStartupScreen() {
    if (startupScreen.width() == 0) {
        startupScreen.createSprite(M5.Display.width() - 5, M5.Display.height() - 5);
    }
    startupScreen.fillSprite(TFT_BLACK);
    startupScreen.setTextColor(TFT_WHITE);
    startupScreen.setCursor(0,0);
    for (int i = 0; i < count_startupLog; i++) {
        startupScreen.setTextSize(startupLogEntries[i].textSize);
        startupScreen.println(startupLogEntries[i].logMessage);
    }
    startupScreen.pushSprite(5,5);
    startupDirty = false;
}


void changeScreen(ScreenId newScreen) {

    if (newScreen == currentScreen && newScreen != SCREEN_STARTUP) return;
    logf(LogLevel::Debug, "[screen] changeScreen(%d)", static_cast<int>(newScreen));
    currentScreen = newScreen;

    startupScreen.deleteSprite();

    // clearScreen
    M5.Display.fillScreen(TFT_BLACK);
    M5.Display.setTextSize(1);
    M5.Display.setCursor(0, 0);

    switch (currentScreen) {
        case SCREEN_STARTUP:
            startupScreen.createSprite(M5.Display.width() - 5, M5.Display.height() - 5);
            md_screenRefresh.start(1000 / 12);
            break;
        case SCREEN_DECK:
            // M5KeySurface owns the display from here on.
            md_screenRefresh.stop();
            break;
    }

}


void refreshScreen() {

    if (currentScreen != SCREEN_STARTUP) return;
    if (!md_screenRefresh.justFinished()) return;
    md_screenRefresh.repeat();

    if (startupDirty) refreshStartupScreen();

}


void startupLog(const char* in_logMessage, int in_textSize) {
    logf(LogLevel::Info, "[startup] %s", in_logMessage);
    if (currentScreen != SCREEN_STARTUP) return;

    // Scroll once the screen is full.
    if (count_startupLog == STARTUP_LOG_LINES) {
        memmove(&startupLogEntries[0], &startupLogEntries[1],
                sizeof(startupLogData) * (STARTUP_LOG_LINES - 1));
        count_startupLog--;
    }
    startupLogData& entry = startupLogEntries[count_startupLog++];
    strncpy(entry.logMessage, in_logMessage, LOG_MESSAGE_MAX_LEN);
    entry.logMessage[LOG_MESSAGE_MAX_LEN] = '\0';
    entry.textSize = in_textSize;
    startupDirty = true;
    refreshStartupScreen();
}
