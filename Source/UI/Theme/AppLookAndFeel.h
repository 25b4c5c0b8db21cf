/*
  ==============================================================================

    AppLookAndFeel.h

    Custom look and feel for the application.

  ==============================================================================
*/

#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

//==============================================================================
/**
    Dark look and feel for the host window and the floating web window.

    With TitleBarStyle::transparent the document window title bar is filled
    with the window background and no title text is drawn, so only the window
    buttons remain visible.
*/
class AppLookAndFeel : public juce::LookAndFeel_V4
{
public:
    enum class TitleBarStyle
    {
        standard,
        transparent
    };

    //==============================================================================
    explicit AppLookAndFeel(TitleBarStyle style = TitleBarStyle::standard);
    ~AppLookAndFeel() override = default;

    //==============================================================================
    // Window title bar
    void drawDocumentWindowTitleBar(juce::DocumentWindow& window, juce::Graphics& g,
                                    int w, int h, int titleSpaceX, int titleSpaceW,
                                    const juce::Image* icon, bool drawTitleTextOnLeft) override;

    //==============================================================================
    // Buttons
    void drawButtonBackground(juce::Graphics& g, juce::Button& button,
                             const juce::Colour& backgroundColour,
                             bool shouldDrawButtonAsHighlighted,
                             bool shouldDrawButtonAsDown) override;

private:
    //==============================================================================
    TitleBarStyle titleBarStyle;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AppLookAndFeel)
};
