/*
  ==============================================================================

    WebViewWindow.cpp

  ==============================================================================
*/

#include "WebViewWindow.h"
#include "Theme/ColourScheme.h"

#if JUCE_WEB_BROWSER

//==============================================================================
WebViewWindow::Browser::Browser(const Options& options)
    : juce::WebBrowserComponent(options)
{
}

void WebViewWindow::Browser::pageFinishedLoading(const juce::String& url)
{
    if (onPageFinished)
        onPageFinished(url);
}

bool WebViewWindow::Browser::pageLoadHadNetworkError(const juce::String& errorInfo)
{
    if (onNetworkError)
        onNetworkError(errorInfo);

    // let the view show its own error page
    return true;
}

//==============================================================================
WebViewWindow::WebViewWindow(const juce::String& title,
                             const juce::WebBrowserComponent::Options& browserOptions,
                             juce::Rectangle<int> initialBounds)
    : juce::DocumentWindow(title, AppColours::background, juce::DocumentWindow::allButtons)
{
    setLookAndFeel(&lookAndFeel);

    // Title bar is drawn by us so it can be blank; buttons stay usable.
    setUsingNativeTitleBar(false);
    setTitleBarHeight(24);
    setResizable(true, false);
    setAlwaysOnTop(true);
    setOpaque(true);
    setDropShadowEnabled(true);

    auto* browser = new Browser(browserOptions);
    browser->setSize(initialBounds.getWidth(), initialBounds.getHeight());

    // The content component is resized with the window from now on.
    setContentOwned(browser, true);
    setTopLeftPosition(initialBounds.getPosition());

    setVisible(false);
}

WebViewWindow::~WebViewWindow()
{
    clearContentComponent();
    setLookAndFeel(nullptr);
}

void WebViewWindow::closeButtonPressed()
{
    // Hide only; the window is reused until its owner releases it.
    setVisible(false);

    if (onCloseButton)
        onCloseButton();
}

WebViewWindow::Browser& WebViewWindow::getBrowser() const
{
    auto* browser = dynamic_cast<Browser*>(getContentComponent());
    jassert(browser != nullptr);
    return *browser;
}

#endif
