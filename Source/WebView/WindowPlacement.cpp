/*
  ==============================================================================

    WindowPlacement.cpp

  ==============================================================================
*/

#include "WindowPlacement.h"

namespace fww
{

juce::Rectangle<int> computeWindowPlacement(juce::Rectangle<int> screenArea,
                                            int width, int height, int margin)
{
    margin = juce::jmax(0, margin);

    return { screenArea.getX() + margin,
             screenArea.getY() + margin,
             juce::jmax(1, width),
             juce::jmax(1, height) };
}

} // namespace fww
