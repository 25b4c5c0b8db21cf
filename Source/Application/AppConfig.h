/*
  ==============================================================================

    AppConfig.h

    Application configuration constants.

  ==============================================================================
*/

#pragma once

namespace AppConfig
{
    // Application identity
    static constexpr const char* appName = "Floating Web Window";
    static constexpr const char* companyName = "FloatingWebWindow";
    static constexpr const char* versionString = "1.0.0";

    // Web window defaults
    static constexpr int defaultWebWindowWidth = 480;
    static constexpr int defaultWebWindowHeight = 640;
    static constexpr int defaultScreenMargin = 100;    // inset from the top-left of the primary display
    static constexpr const char* defaultAddress = "https://example.com";
    static constexpr const char* webStorageFolderName = "WebData";

    // Host window
    static constexpr int minHostWindowWidth = 360;
    static constexpr int minHostWindowHeight = 140;
    static constexpr int defaultHostWindowWidth = 640;
    static constexpr int defaultHostWindowHeight = 160;

    // Logging
    static constexpr const char* logFolderName = "FloatingWebWindow";
    static constexpr const char* logFileName = "FloatingWebWindow.log";

    // Timers
    static constexpr int visibilityPollIntervalMs = 250;
}
