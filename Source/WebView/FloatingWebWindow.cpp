/*
  ==============================================================================

    FloatingWebWindow.cpp

  ==============================================================================
*/

#include "FloatingWebWindow.h"
#include "NativeFloatingWebWindow.h"
#include "StandInFloatingWebWindow.h"

#if FWW_NATIVE_WEB_WINDOW
 #include "JuceWebWindowBackend.h"
#endif

namespace fww
{

std::unique_ptr<FloatingWebWindow> FloatingWebWindow::create(const Options& options, juce::Result& result)
{
   #if FWW_NATIVE_WEB_WINDOW
    return NativeFloatingWebWindow::create(std::make_unique<JuceWebWindowBackend>(), options, result);
   #else
    result = juce::Result::ok();
    return createStandIn(options);
   #endif
}

std::unique_ptr<FloatingWebWindow> FloatingWebWindow::createStandIn(const Options& options)
{
    return std::make_unique<StandInFloatingWebWindow>(options);
}

} // namespace fww
