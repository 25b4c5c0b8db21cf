/*
  ==============================================================================

    AppLogger.cpp

  ==============================================================================
*/

#include "AppLogger.h"
#include "AppConfig.h"

ScopedAppLogger::ScopedAppLogger()
{
    logger.reset(juce::FileLogger::createDefaultAppLogger(
        AppConfig::logFolderName,
        AppConfig::logFileName,
        juce::String(AppConfig::appName) + " " + AppConfig::versionString));

    juce::Logger::setCurrentLogger(logger.get());
}

ScopedAppLogger::~ScopedAppLogger()
{
    juce::Logger::setCurrentLogger(nullptr);
}

juce::File ScopedAppLogger::getLogFile() const
{
    return logger != nullptr ? logger->getLogFile() : juce::File();
}
