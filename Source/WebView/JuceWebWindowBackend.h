/*
  ==============================================================================

    JuceWebWindowBackend.h

    WebWindowBackend built on juce::DocumentWindow and juce::WebBrowserComponent.

  ==============================================================================
*/

#pragma once

#include "WebWindowBackend.h"
#include "../UI/WebViewWindow.h"

#if JUCE_WEB_BROWSER

namespace fww
{

//==============================================================================
class JuceWebWindowBackend : public WebWindowBackend
{
public:
    JuceWebWindowBackend() = default;
    ~JuceWebWindowBackend() override;

    juce::Rectangle<int> getPrimaryDisplayArea() const override;
    juce::Result createWindow(const WindowSpec& spec) override;
    bool hasWindow() const override { return window != nullptr; }

    void loadAddress(const juce::String& address) override;
    void present() override;
    void orderOut() override;
    bool isOnScreen() const override;
    bool isMinimised() const override;
    void closeWindow() override;
    void releaseWindow() override;

    /** Browser options using the shared, persistent storage scope. */
    static juce::WebBrowserComponent::Options createBrowserOptions(const juce::File& storageFolder);

private:
    std::unique_ptr<WebViewWindow> window;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(JuceWebWindowBackend)
};

} // namespace fww

#endif
