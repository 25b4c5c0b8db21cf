/*
  ==============================================================================

    AppLookAndFeel.cpp

    Implementation of custom look and feel.

  ==============================================================================
*/

#include "AppLookAndFeel.h"
#include "ColourScheme.h"

//==============================================================================
AppLookAndFeel::AppLookAndFeel(TitleBarStyle style)
    : titleBarStyle(style)
{
    setColour(juce::ResizableWindow::backgroundColourId, AppColours::background);
    setColour(juce::DocumentWindow::textColourId, AppColours::textPrimary);

    // Text button
    setColour(juce::TextButton::buttonColourId, AppColours::buttonBg);
    setColour(juce::TextButton::buttonOnColourId, AppColours::primary);
    setColour(juce::TextButton::textColourOffId, AppColours::textPrimary);
    setColour(juce::TextButton::textColourOnId, AppColours::textPrimary);

    // Text editor
    setColour(juce::TextEditor::backgroundColourId, AppColours::inputBg);
    setColour(juce::TextEditor::textColourId, AppColours::textPrimary);
    setColour(juce::TextEditor::highlightColourId, AppColours::primary.withAlpha(0.4f));
    setColour(juce::TextEditor::highlightedTextColourId, AppColours::textPrimary);
    setColour(juce::TextEditor::outlineColourId, AppColours::inputBorder);
    setColour(juce::TextEditor::focusedOutlineColourId, AppColours::primary);
    setColour(juce::CaretComponent::caretColourId, AppColours::primary);

    // Label
    setColour(juce::Label::textColourId, AppColours::textPrimary);
    setColour(juce::Label::backgroundColourId, juce::Colours::transparentBlack);
}

//==============================================================================
void AppLookAndFeel::drawDocumentWindowTitleBar(juce::DocumentWindow& window, juce::Graphics& g,
                                                int w, int h, int titleSpaceX, int titleSpaceW,
                                                const juce::Image* icon, bool drawTitleTextOnLeft)
{
    if (titleBarStyle == TitleBarStyle::standard)
    {
        juce::LookAndFeel_V4::drawDocumentWindowTitleBar(window, g, w, h, titleSpaceX, titleSpaceW,
                                                         icon, drawTitleTextOnLeft);
        return;
    }

    // Same fill as the window body and no text: the bar blends into the content.
    g.fillAll(window.getBackgroundColour());
}

//==============================================================================
void AppLookAndFeel::drawButtonBackground(juce::Graphics& g, juce::Button& button,
                                          const juce::Colour& backgroundColour,
                                          bool shouldDrawButtonAsHighlighted,
                                          bool shouldDrawButtonAsDown)
{
    auto colour = backgroundColour;

    if (shouldDrawButtonAsDown)
        colour = colour.darker(0.3f);
    else if (shouldDrawButtonAsHighlighted)
        colour = colour.brighter(0.15f);

    if (!button.isEnabled())
        colour = colour.withMultipliedAlpha(0.5f);

    g.setColour(colour);
    g.fillRoundedRectangle(button.getLocalBounds().toFloat().reduced(0.5f), 3.0f);
}
