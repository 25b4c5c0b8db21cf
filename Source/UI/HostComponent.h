/*
  ==============================================================================

    HostComponent.h

    Host window content: drives the floating web window.

  ==============================================================================
*/

#pragma once

#include <juce_gui_basics/juce_gui_basics.h>
#include "../Application/AppState.h"
#include "../WebView/FloatingWebWindow.h"

//==============================================================================
/**
    Address bar and show/hide control for the floating web window.

    Features:
    - Navigate the web window to the typed address
    - Toggle the web window's visibility
    - Show page load results and the window mode (native or stand-in)

    The Show/Hide button follows the window's live visibility, so closing or
    minimising the web window from the window manager is reflected here.
*/
class HostComponent : public juce::Component,
                      private juce::Timer,
                      private fww::FloatingWebWindow::Listener
{
public:
    //==============================================================================
    HostComponent(AppState& state, fww::FloatingWebWindow& webWindow);
    ~HostComponent() override;

    //==============================================================================
    void paint(juce::Graphics& g) override;
    void resized() override;

    /** Shows a message in the status line. */
    void setStatus(const juce::String& message, juce::Colour colour);

    /** Status line for a navigation request. Empty when the window already
        shows that address, since no load is started and no result will follow. */
    static juce::String describeNavigation(const juce::String& currentAddress,
                                           const juce::String& requestedAddress);

private:
    //==============================================================================
    void timerCallback() override;

    void pageFinishedLoading(const juce::String& address) override;
    void pageLoadFailed(const juce::String& errorInfo) override;
    void windowClosedByUser() override;

    void navigateToTypedAddress();
    void toggleWebWindow();
    void updateToggleButton();

    //==============================================================================
    AppState& appState;
    fww::FloatingWebWindow& webWindow;

    juce::TextEditor addressField;
    juce::TextButton goButton { "Go" };
    juce::TextButton toggleButton { "Hide" };
    juce::Label modeLabel;
    juce::Label statusLabel;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(HostComponent)
};
