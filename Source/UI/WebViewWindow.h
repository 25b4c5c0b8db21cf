/*
  ==============================================================================

    WebViewWindow.h

    Floating, always-on-top window that hides on close and hosts a web view.
    The owner decides when the window is actually destroyed.

  ==============================================================================
*/

#pragma once

#include <juce_gui_extra/juce_gui_extra.h>
#include "Theme/AppLookAndFeel.h"

#if JUCE_WEB_BROWSER

class WebViewWindow : public juce::DocumentWindow
{
public:
    //==============================================================================
    /** Web view that reports load events through callbacks. */
    class Browser : public juce::WebBrowserComponent
    {
    public:
        explicit Browser(const Options& options);

        void pageFinishedLoading(const juce::String& url) override;
        bool pageLoadHadNetworkError(const juce::String& errorInfo) override;

        std::function<void(const juce::String&)> onPageFinished;
        std::function<void(const juce::String&)> onNetworkError;
    };

    //==============================================================================
    WebViewWindow(const juce::String& title,
                  const juce::WebBrowserComponent::Options& browserOptions,
                  juce::Rectangle<int> initialBounds);
    ~WebViewWindow() override;

    void closeButtonPressed() override;

    Browser& getBrowser() const;

    std::function<void()> onCloseButton;

private:
    //==============================================================================
    AppLookAndFeel lookAndFeel { AppLookAndFeel::TitleBarStyle::transparent };

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WebViewWindow)
};

#endif
