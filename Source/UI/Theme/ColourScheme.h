/*
  ==============================================================================

    ColourScheme.h

    Application colour palette.

  ==============================================================================
*/

#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

//==============================================================================
/**
    Application colour scheme.

    Dark palette shared by the host window and the floating web window frame.
    Using inline to prevent static initialization order issues.
*/
namespace AppColours
{
    // Background colours
    inline const juce::Colour background      { 0xFF1E1E1E };  // Window background
    inline const juce::Colour surface         { 0xFF252526 };  // Panel backgrounds

    // Accent colours
    inline const juce::Colour primary         { 0xFF007ACC };

    // Text colours
    inline const juce::Colour textPrimary     { 0xFFCCCCCC };
    inline const juce::Colour textSecondary   { 0xFF858585 };

    // State colours
    inline const juce::Colour success         { 0xFF4CAF50 };
    inline const juce::Colour warning         { 0xFFFFC107 };
    inline const juce::Colour error           { 0xFFF44336 };

    // Interactive elements
    inline const juce::Colour buttonBg        { 0xFF3E3E42 };

    // Input fields
    inline const juce::Colour inputBg         { 0xFF3C3C3C };
    inline const juce::Colour inputBorder     { 0xFF5A5A5A };
}
