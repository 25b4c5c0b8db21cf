/*
  ==============================================================================

    AppState.h

    Global application state management.
    Handles persistence of the user's web window settings.

  ==============================================================================
*/

#pragma once

#include <juce_data_structures/juce_data_structures.h>
#include <juce_graphics/juce_graphics.h>
#include "../WebView/FloatingWebWindow.h"

//==============================================================================
/**
    Application state manager.

    Manages:
    - Web window preferences (last address, size, hidden at exit)
    - Host window position
    - The folder backing the web view's persistent storage scope

    Settings are only written to disk by saveSettings() or on destruction.
*/
class AppState
{
public:
    //==============================================================================
    AppState();
    explicit AppState(const juce::File& settingsFileToUse);
    ~AppState();

    //==============================================================================
    // Settings persistence
    void loadSettings();
    void saveSettings();

    juce::File getSettingsFile() const { return settingsFile; }

    /** Default location: <user app data>/<company>/<app>/settings.xml */
    static juce::File getDefaultSettingsFile();

    //==============================================================================
    // Host window bounds
    juce::Rectangle<int> getWindowBounds() const;
    void setWindowBounds(const juce::Rectangle<int>& bounds);

    //==============================================================================
    // Web window
    juce::String getLastAddress() const;
    void setLastAddress(const juce::String& address);

    int getWebWindowWidth() const;
    int getWebWindowHeight() const;
    void setWebWindowSize(int width, int height);

    bool wasWebWindowHidden() const;
    void setWebWindowHidden(bool hidden);

    /** Stores the window's address and, for a native window, whether it was
        hidden. A minimised window is not hidden. */
    void rememberWebWindow(const fww::FloatingWebWindow& window);

    /** Folder shared by every web window instance for cookies, cache and site data.
        Created if it doesn't exist yet. */
    juce::File getWebStorageFolder() const;

private:
    //==============================================================================
    juce::File settingsFile;
    std::unique_ptr<juce::PropertiesFile> settings;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AppState)
};
