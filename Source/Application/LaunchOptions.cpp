/*
  ==============================================================================

    LaunchOptions.cpp

  ==============================================================================
*/

#include "LaunchOptions.h"
#include "AppState.h"

LaunchOptions LaunchOptions::fromSettings(const AppState& state)
{
    LaunchOptions options;
    options.address = state.getLastAddress();
    options.width = state.getWebWindowWidth();
    options.height = state.getWebWindowHeight();
    options.startHidden = state.wasWebWindowHidden();
    return options;
}

LaunchOptions LaunchOptions::fromArguments(const juce::ArgumentList& args,
                                           const LaunchOptions& defaults)
{
    auto options = defaults;

    auto url = args.getValueForOption("--url").trim().unquoted();
    if (url.isNotEmpty())
        options.address = url;

    auto size = args.getValueForOption("--size").trim();
    if (size.isNotEmpty())
    {
        auto widthText = size.upToFirstOccurrenceOf("x", false, true);
        auto heightText = size.fromFirstOccurrenceOf("x", false, true);

        auto isDimension = [](const juce::String& text)
        {
            return text.isNotEmpty() && text.containsOnly("0123456789") && text.getIntValue() > 0;
        };

        // Both dimensions must be positive whole numbers.
        if (isDimension(widthText) && isDimension(heightText))
        {
            options.width = widthText.getIntValue();
            options.height = heightText.getIntValue();
        }
        else
        {
            DBG("LaunchOptions: ignoring malformed --size " << size);
        }
    }

    if (args.containsOption("--hidden"))
        options.startHidden = true;

    if (args.containsOption("--stand-in"))
        options.useStandIn = true;

    return options;
}
