/*
  ==============================================================================

    NativeFloatingWebWindow.h

    FloatingWebWindow backed by a real window and web view.

  ==============================================================================
*/

#pragma once

#include "FloatingWebWindow.h"
#include "WebWindowBackend.h"

namespace fww
{

//==============================================================================
/**
    Drives a WebWindowBackend to provide the floating web window.

    Construction places the window near the top-left of the primary display,
    loads the initial address and presents the window. Destruction closes the
    window if it's on screen and then releases it, exactly once.
*/
class NativeFloatingWebWindow : public FloatingWebWindow
{
public:
    //==========================================================================
    /**
        Creates the window and view through the given backend.

        @returns nullptr if the backend can't provide a window; result then
                 holds the reason. Nothing is retried.
    */
    static std::unique_ptr<NativeFloatingWebWindow> create(std::unique_ptr<WebWindowBackend> backend,
                                                           const Options& options,
                                                           juce::Result& result);

    ~NativeFloatingWebWindow() override;

    //==========================================================================
    void navigate(const juce::String& address) override;
    void setHidden(bool shouldBeHidden) override;
    bool isVisible() const override;
    bool isMinimised() const override;
    juce::String getCurrentAddress() const override { return currentAddress; }
    bool isNative() const override { return true; }

    /** Closes and releases the window. Called by the destructor; further calls
        do nothing, and so does every other method afterwards. */
    void dispose();

private:
    //==========================================================================
    NativeFloatingWebWindow(std::unique_ptr<WebWindowBackend> backend, const juce::String& address);

    bool isUsable() const;

    std::unique_ptr<WebWindowBackend> backend;
    juce::String currentAddress;
    bool disposed = false;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(NativeFloatingWebWindow)
};

} // namespace fww
