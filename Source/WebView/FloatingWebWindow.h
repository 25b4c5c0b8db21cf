/*
  ==============================================================================

    FloatingWebWindow.h

    A single floating, always-on-top window hosting a web view.

  ==============================================================================
*/

#pragma once

#include <juce_gui_extra/juce_gui_extra.h>
#include "../Application/AppConfig.h"

/** Set to 0 to build without the native web window (stand-in only). */
#ifndef FWW_NATIVE_WEB_WINDOW
 #define FWW_NATIVE_WEB_WINDOW JUCE_WEB_BROWSER
#endif

namespace fww // Floating Web Window
{

//==============================================================================
/**
    Owns one floating window and the web view embedded in it.

    Two implementations exist: NativeFloatingWebWindow, which drives a real
    window through a WebWindowBackend, and StandInFloatingWebWindow, which only
    remembers the address. Callers use this interface and never need to know
    which one they got.

    All methods must be called on the message thread. The window and view are
    released when the object is destroyed.
*/
class FloatingWebWindow
{
public:
    //==========================================================================
    struct Options
    {
        /** Host window handle. Accepted for API symmetry; the window is never parented. */
        void* parentContext = nullptr;

        int width = AppConfig::defaultWebWindowWidth;
        int height = AppConfig::defaultWebWindowHeight;
        juce::String initialAddress;

        juce::String title { AppConfig::appName };
        int screenMargin = AppConfig::defaultScreenMargin;

        /** Where the persistent storage scope lives on backends that need a
            folder for it. Left empty, the backend's default store is used. */
        juce::File storageFolder;
    };

    //==========================================================================
    /**
        Receives page load notifications.

        navigate() never reports failures itself; this is the only place a
        load result shows up. The stand-in never calls any of these.
    */
    class Listener
    {
    public:
        virtual ~Listener() = default;

        virtual void pageFinishedLoading(const juce::String& address) { juce::ignoreUnused(address); }
        virtual void pageLoadFailed(const juce::String& errorInfo) { juce::ignoreUnused(errorInfo); }

        /** The user closed the window. It has only been hidden. */
        virtual void windowClosedByUser() {}
    };

    //==========================================================================
    virtual ~FloatingWebWindow() = default;

    /** Loads a new address. Does nothing if it equals the current one.
        Returns immediately; the page loads in the background. */
    virtual void navigate(const juce::String& address) = 0;

    /** Hides or re-presents the window without destroying it. */
    virtual void setHidden(bool shouldBeHidden) = 0;

    /** True if the window is on screen right now. */
    virtual bool isVisible() const = 0;

    /** True if the user minimised the window. isVisible() is false meanwhile,
        but the window has not been hidden. */
    virtual bool isMinimised() const = 0;

    /** The last address requested by construction or navigate(). */
    virtual juce::String getCurrentAddress() const = 0;

    /** False for the stand-in. */
    virtual bool isNative() const = 0;

    //==========================================================================
    void addListener(Listener* listener)     { listeners.add(listener); }
    void removeListener(Listener* listener)  { listeners.remove(listener); }

    //==========================================================================
    /**
        Creates the window this build is configured for.

        With FWW_NATIVE_WEB_WINDOW a native window is created; if that fails,
        nullptr is returned and result describes why. Whether to fall back to
        createStandIn() is the caller's decision.
    */
    static std::unique_ptr<FloatingWebWindow> create(const Options& options, juce::Result& result);

    /** Creates the stand-in. Never fails. */
    static std::unique_ptr<FloatingWebWindow> createStandIn(const Options& options);

protected:
    FloatingWebWindow() = default;

    juce::ListenerList<Listener> listeners;

private:
    JUCE_DECLARE_NON_COPYABLE(FloatingWebWindow)
};

} // namespace fww
