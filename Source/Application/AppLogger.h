/*
  ==============================================================================

    AppLogger.h

    Installs the application's file logger for the lifetime of the object.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

//==============================================================================
/**
    Creates a juce::FileLogger in the user's log directory and makes it the
    current juce::Logger. The logger is unregistered before it is deleted.
*/
class ScopedAppLogger
{
public:
    ScopedAppLogger();
    ~ScopedAppLogger();

    juce::File getLogFile() const;

private:
    std::unique_ptr<juce::FileLogger> logger;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ScopedAppLogger)
};
