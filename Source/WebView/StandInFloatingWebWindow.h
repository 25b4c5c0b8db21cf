/*
  ==============================================================================

    StandInFloatingWebWindow.h

    FloatingWebWindow for builds and machines without a native web view.

  ==============================================================================
*/

#pragma once

#include "FloatingWebWindow.h"

namespace fww
{

//==============================================================================
/**
    Keeps the FloatingWebWindow contract without any UI: remembers the address,
    ignores hide/show and is never visible.
*/
class StandInFloatingWebWindow : public FloatingWebWindow
{
public:
    explicit StandInFloatingWebWindow(const Options& options);
    ~StandInFloatingWebWindow() override = default;

    void navigate(const juce::String& address) override;
    void setHidden(bool) override {}
    bool isVisible() const override { return false; }
    bool isMinimised() const override { return false; }
    juce::String getCurrentAddress() const override { return currentAddress; }
    bool isNative() const override { return false; }

private:
    juce::String currentAddress;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(StandInFloatingWebWindow)
};

} // namespace fww
