/*
  ==============================================================================

    WebWindowBackend.h

    Thin adapter over the toolkit's window and web view primitives.

  ==============================================================================
*/

#pragma once

#include <juce_gui_basics/juce_gui_basics.h>

namespace fww
{

//==============================================================================
/**
    The only place native window and web view objects are touched.

    A backend holds at most one window/view pair. NativeFloatingWebWindow drives
    it; tests substitute a fake that counts calls.
*/
class WebWindowBackend
{
public:
    //==========================================================================
    struct WindowSpec
    {
        juce::Rectangle<int> bounds;
        juce::String title;
        juce::File storageFolder;
    };

    //==========================================================================
    virtual ~WebWindowBackend() = default;

    /** Usable area of the primary display, or an empty rectangle if there is none. */
    virtual juce::Rectangle<int> getPrimaryDisplayArea() const = 0;

    /** Creates the floating window with a web view filling it. The window
        stays hidden until present() is called. */
    virtual juce::Result createWindow(const WindowSpec& spec) = 0;

    virtual bool hasWindow() const = 0;

    /** Starts loading an address in the view, superseding any load in progress. */
    virtual void loadAddress(const juce::String& address) = 0;

    /** Shows the window, brings it to the front and gives it focus. */
    virtual void present() = 0;

    /** Takes the window off screen, keeping it and its page alive. */
    virtual void orderOut() = 0;

    /** Live on-screen state (false when hidden, closed by the user or minimised). */
    virtual bool isOnScreen() const = 0;

    /** True while the window is iconified. It still counts as shown. */
    virtual bool isMinimised() const = 0;

    /** Closes a window that is on screen. */
    virtual void closeWindow() = 0;

    /** Destroys the window and view. Safe to call when there is no window. */
    virtual void releaseWindow() = 0;

    //==========================================================================
    std::function<void(const juce::String&)> onPageLoaded;
    std::function<void(const juce::String&)> onPageLoadFailed;
    std::function<void()> onUserClosedWindow;
};

} // namespace fww
