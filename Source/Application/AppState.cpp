/*
  ==============================================================================

    AppState.cpp

    Implementation of application state management.

  ==============================================================================
*/

#include "AppState.h"
#include "AppConfig.h"

//==============================================================================
AppState::AppState()
    : AppState(getDefaultSettingsFile())
{
}

AppState::AppState(const juce::File& settingsFileToUse)
    : settingsFile(settingsFileToUse)
{
    loadSettings();
}

AppState::~AppState()
{
    saveSettings();
}

//==============================================================================
juce::File AppState::getDefaultSettingsFile()
{
    auto appDataDir = juce::File::getSpecialLocation(
        juce::File::userApplicationDataDirectory
    ).getChildFile(AppConfig::companyName)
     .getChildFile(AppConfig::appName);

    appDataDir.createDirectory();

    return appDataDir.getChildFile("settings.xml");
}

void AppState::loadSettings()
{
    juce::PropertiesFile::Options options;
    options.applicationName = AppConfig::appName;
    options.filenameSuffix = ".xml";
    options.folderName = AppConfig::companyName;
    options.osxLibrarySubFolder = "Application Support";
    options.millisecondsBeforeSaving = -1;

    settings = std::make_unique<juce::PropertiesFile>(settingsFile, options);
}

void AppState::saveSettings()
{
    if (settings && !settings->saveIfNeeded())
        juce::Logger::writeToLog("AppState: could not write " + settingsFile.getFullPathName());
}

//==============================================================================
juce::Rectangle<int> AppState::getWindowBounds() const
{
    // Stored as "x y w h"; an unset value reads back as an empty rectangle.
    return settings ? juce::Rectangle<int>::fromString(settings->getValue("hostWindowBounds"))
                    : juce::Rectangle<int>();
}

void AppState::setWindowBounds(const juce::Rectangle<int>& bounds)
{
    if (settings)
        settings->setValue("hostWindowBounds", bounds.toString());
}

//==============================================================================
juce::String AppState::getLastAddress() const
{
    return settings ? settings->getValue("lastAddress", AppConfig::defaultAddress)
                    : juce::String(AppConfig::defaultAddress);
}

void AppState::setLastAddress(const juce::String& address)
{
    if (settings)
        settings->setValue("lastAddress", address);
}

int AppState::getWebWindowWidth() const
{
    return settings ? settings->getIntValue("webWindowWidth", AppConfig::defaultWebWindowWidth)
                    : AppConfig::defaultWebWindowWidth;
}

int AppState::getWebWindowHeight() const
{
    return settings ? settings->getIntValue("webWindowHeight", AppConfig::defaultWebWindowHeight)
                    : AppConfig::defaultWebWindowHeight;
}

void AppState::setWebWindowSize(int width, int height)
{
    if (!settings)
        return;

    settings->setValue("webWindowWidth", width);
    settings->setValue("webWindowHeight", height);
}

bool AppState::wasWebWindowHidden() const
{
    return settings ? settings->getBoolValue("webWindowHidden", false) : false;
}

void AppState::setWebWindowHidden(bool hidden)
{
    if (settings)
        settings->setValue("webWindowHidden", hidden);
}

void AppState::rememberWebWindow(const fww::FloatingWebWindow& window)
{
    setLastAddress(window.getCurrentAddress());

    if (window.isNative())
        setWebWindowHidden(!window.isVisible() && !window.isMinimised());
}

juce::File AppState::getWebStorageFolder() const
{
    auto folder = settingsFile.getParentDirectory().getChildFile(AppConfig::webStorageFolderName);

    auto created = folder.createDirectory();
    if (created.failed())
        DBG("AppState: " << created.getErrorMessage());

    return folder;
}
