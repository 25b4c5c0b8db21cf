/*
  ==============================================================================

    StandInFloatingWebWindow.cpp

  ==============================================================================
*/

#include "StandInFloatingWebWindow.h"

namespace fww
{

StandInFloatingWebWindow::StandInFloatingWebWindow(const Options& options)
    : currentAddress(options.initialAddress)
{
    DBG("StandInFloatingWebWindow: no native web view, holding " << currentAddress);
}

void StandInFloatingWebWindow::navigate(const juce::String& address)
{
    currentAddress = address;
}

} // namespace fww
