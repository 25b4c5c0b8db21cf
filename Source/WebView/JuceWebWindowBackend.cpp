/*
  ==============================================================================

    JuceWebWindowBackend.cpp

  ==============================================================================
*/

#include "JuceWebWindowBackend.h"

#if JUCE_WEB_BROWSER

namespace fww
{

JuceWebWindowBackend::~JuceWebWindowBackend()
{
    releaseWindow();
}

//==============================================================================
juce::WebBrowserComponent::Options JuceWebWindowBackend::createBrowserOptions(const juce::File& storageFolder)
{
    // Keep the page alive while the window is hidden so hide/show preserves it.
    auto options = juce::WebBrowserComponent::Options{}
                       .withKeepPageLoadedWhenBrowserIsHidden();

   #if JUCE_WINDOWS
    // WebView2 only persists cookies and cache in a fixed user data folder.
    auto webView2 = juce::WebBrowserComponent::Options::WinWebView2{};
    if (storageFolder != juce::File())
        webView2 = webView2.withUserDataFolder(storageFolder);

    options = options.withBackend(juce::WebBrowserComponent::Options::Backend::webview2)
                     .withWinWebView2Options(webView2);
   #else
    // WKWebView and WebKitGTK already use their default, persistent data store.
    juce::ignoreUnused(storageFolder);
   #endif

    return options;
}

juce::Rectangle<int> JuceWebWindowBackend::getPrimaryDisplayArea() const
{
    if (auto* display = juce::Desktop::getInstance().getDisplays().getPrimaryDisplay())
        return display->userArea;

    return {};
}

juce::Result JuceWebWindowBackend::createWindow(const WindowSpec& spec)
{
    if (window != nullptr)
        return juce::Result::fail("A web window already exists");

    auto browserOptions = createBrowserOptions(spec.storageFolder);
    if (!juce::WebBrowserComponent::areOptionsSupported(browserOptions))
        return juce::Result::fail("The web view backend is not available on this system");

    window = std::make_unique<WebViewWindow>(spec.title, browserOptions, spec.bounds);

    auto& browser = window->getBrowser();

    browser.onPageFinished = [this](const juce::String& url)
    {
        if (onPageLoaded)
            onPageLoaded(url);
    };

    browser.onNetworkError = [this](const juce::String& errorInfo)
    {
        if (onPageLoadFailed)
            onPageLoadFailed(errorInfo);
    };

    window->onCloseButton = [this]
    {
        if (onUserClosedWindow)
            onUserClosedWindow();
    };

    DBG("JuceWebWindowBackend: created window at " << window->getBounds().toString());
    return juce::Result::ok();
}

//==============================================================================
void JuceWebWindowBackend::loadAddress(const juce::String& address)
{
    if (window != nullptr)
        window->getBrowser().goToURL(address);
}

void JuceWebWindowBackend::present()
{
    if (window == nullptr)
        return;

    if (window->isMinimised())
        window->setMinimised(false);

    window->setVisible(true);
    window->toFront(true);
}

void JuceWebWindowBackend::orderOut()
{
    if (window != nullptr)
        window->setVisible(false);
}

bool JuceWebWindowBackend::isOnScreen() const
{
    // isShowing() also goes false when the peer is minimised.
    return window != nullptr && window->isShowing();
}

bool JuceWebWindowBackend::isMinimised() const
{
    return window != nullptr && window->isVisible() && window->isMinimised();
}

void JuceWebWindowBackend::closeWindow()
{
    if (window == nullptr)
        return;

    window->setVisible(false);
    window->removeFromDesktop();
}

void JuceWebWindowBackend::releaseWindow()
{
    window.reset();
}

} // namespace fww

#endif
