#pragma once

enum ScreenId { SCREEN_STARTUP, SCREEN_DECK };
extern ScreenId currentScreen;

void refreshScreen();
void changeScreen(ScreenId newScreen);
void startupLog(const char* in_logMessage, int in_textSize);
