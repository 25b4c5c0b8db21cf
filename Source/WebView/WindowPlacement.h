/*
  ==============================================================================

    WindowPlacement.h

  ==============================================================================
*/

#pragma once

#include <juce_graphics/juce_graphics.h>

namespace fww
{

/**
    Bounds for a new floating window: inset from the top-left corner of the
    screen area by margin, with the requested size.

    Non-positive dimensions are clamped to 1 and a negative margin to 0.
*/
juce::Rectangle<int> computeWindowPlacement(juce::Rectangle<int> screenArea,
                                            int width, int height, int margin);

} // namespace fww
