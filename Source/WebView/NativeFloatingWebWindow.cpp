/*
  ==============================================================================

    NativeFloatingWebWindow.cpp

  ==============================================================================
*/

#include "NativeFloatingWebWindow.h"
#include "WindowPlacement.h"

namespace fww
{

//==============================================================================
std::unique_ptr<NativeFloatingWebWindow> NativeFloatingWebWindow::create(std::unique_ptr<WebWindowBackend> backend,
                                                                         const Options& options,
                                                                         juce::Result& result)
{
    // The window floats on its own and is never parented to the host.
    juce::ignoreUnused(options.parentContext);

    if (backend == nullptr)
    {
        result = juce::Result::fail("No web window backend available");
        return nullptr;
    }

    auto screenArea = backend->getPrimaryDisplayArea();
    if (screenArea.isEmpty())
    {
        result = juce::Result::fail("Could not resolve the primary display area");
        return nullptr;
    }

    WebWindowBackend::WindowSpec spec;
    spec.bounds = computeWindowPlacement(screenArea, options.width, options.height, options.screenMargin);
    spec.title = options.title;
    spec.storageFolder = options.storageFolder;

    result = backend->createWindow(spec);
    if (result.failed())
    {
        // A backend may have got part of the way before failing.
        backend->releaseWindow();
        return nullptr;
    }

    std::unique_ptr<NativeFloatingWebWindow> window(
        new NativeFloatingWebWindow(std::move(backend), options.initialAddress));

    window->backend->loadAddress(options.initialAddress);
    window->backend->present();

    juce::Logger::writeToLog("Created floating web window ("
                             + juce::String(spec.bounds.getWidth()) + "x"
                             + juce::String(spec.bounds.getHeight()) + ")");
    return window;
}

NativeFloatingWebWindow::NativeFloatingWebWindow(std::unique_ptr<WebWindowBackend> b,
                                                 const juce::String& address)
    : backend(std::move(b)),
      currentAddress(address)
{
    backend->onPageLoaded = [this](const juce::String& url)
    {
        listeners.call(&Listener::pageFinishedLoading, url);
    };

    backend->onPageLoadFailed = [this](const juce::String& errorInfo)
    {
        juce::Logger::writeToLog("Web window failed to load " + currentAddress + ": " + errorInfo);
        listeners.call(&Listener::pageLoadFailed, errorInfo);
    };

    backend->onUserClosedWindow = [this]
    {
        DBG("Web window closed by user, keeping it for reuse");
        listeners.call(&Listener::windowClosedByUser);
    };
}

NativeFloatingWebWindow::~NativeFloatingWebWindow()
{
    dispose();
}

//==============================================================================
void NativeFloatingWebWindow::navigate(const juce::String& address)
{
    if (!isUsable() || address == currentAddress)
        return;

    currentAddress = address;
    backend->loadAddress(address);

    juce::Logger::writeToLog("Web window navigated to: " + address);
}

void NativeFloatingWebWindow::setHidden(bool shouldBeHidden)
{
    if (!isUsable())
        return;

    if (shouldBeHidden)
        backend->orderOut();
    else
        backend->present();
}

bool NativeFloatingWebWindow::isVisible() const
{
    return isUsable() && backend->isOnScreen();
}

bool NativeFloatingWebWindow::isMinimised() const
{
    return isUsable() && backend->isMinimised();
}

//==============================================================================
void NativeFloatingWebWindow::dispose()
{
    if (disposed)
        return;

    disposed = true;

    if (backend == nullptr)
        return;

    backend->onPageLoaded = nullptr;
    backend->onPageLoadFailed = nullptr;
    backend->onUserClosedWindow = nullptr;

    if (!backend->hasWindow())
        return;

    juce::Logger::writeToLog("Cleaning up floating web window");

    if (backend->isOnScreen())
        backend->closeWindow();

    backend->releaseWindow();
}

bool NativeFloatingWebWindow::isUsable() const
{
    return !disposed && backend != nullptr && backend->hasWindow();
}

} // namespace fww
