/*
  ==============================================================================

    LaunchOptions.h

    Command line handling for the host application.

  ==============================================================================
*/

#pragma once

#include <juce_core/juce_core.h>

class AppState;

//==============================================================================
/**
    Settings the host application starts the web window with.

    Recognised arguments:
        --url=<address>     initial address
        --size=<w>x<h>      web window size
        --hidden            start with the web window hidden
        --stand-in          use the non-native stand-in window
*/
struct LaunchOptions
{
    juce::String address;
    int width = 0;
    int height = 0;
    bool startHidden = false;
    bool useStandIn = false;

    /** Values saved by the previous session. */
    static LaunchOptions fromSettings(const AppState& state);

    /** Overrides the given defaults with whatever the arguments specify.
        Malformed --size values leave the default size untouched. */
    static LaunchOptions fromArguments(const juce::ArgumentList& args,
                                       const LaunchOptions& defaults);
};
