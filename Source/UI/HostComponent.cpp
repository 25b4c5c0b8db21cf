/*
  ==============================================================================

    HostComponent.cpp

  ==============================================================================
*/

#include "HostComponent.h"
#include "Theme/ColourScheme.h"

//==============================================================================
HostComponent::HostComponent(AppState& state, fww::FloatingWebWindow& window)
    : appState(state),
      webWindow(window)
{
    addressField.setText(webWindow.getCurrentAddress(), juce::dontSendNotification);
    addressField.setTextToShowWhenEmpty("https://", AppColours::textSecondary);
    addressField.onReturnKey = [this] { navigateToTypedAddress(); };
    addAndMakeVisible(addressField);

    goButton.onClick = [this] { navigateToTypedAddress(); };
    addAndMakeVisible(goButton);

    toggleButton.onClick = [this] { toggleWebWindow(); };
    toggleButton.setEnabled(webWindow.isNative());
    addAndMakeVisible(toggleButton);

    modeLabel.setText(webWindow.isNative() ? "Native web window" : "Stand-in (no web view available)",
                      juce::dontSendNotification);
    modeLabel.setColour(juce::Label::textColourId, AppColours::textSecondary);
    addAndMakeVisible(modeLabel);

    statusLabel.setColour(juce::Label::textColourId, AppColours::textSecondary);
    addAndMakeVisible(statusLabel);

    webWindow.addListener(this);
    updateToggleButton();

    startTimer(AppConfig::visibilityPollIntervalMs);
}

HostComponent::~HostComponent()
{
    stopTimer();
    webWindow.removeListener(this);
}

//==============================================================================
void HostComponent::paint(juce::Graphics& g)
{
    g.fillAll(AppColours::surface);
}

void HostComponent::resized()
{
    auto bounds = getLocalBounds().reduced(12);

    auto addressRow = bounds.removeFromTop(28);
    toggleButton.setBounds(addressRow.removeFromRight(72));
    addressRow.removeFromRight(6);
    goButton.setBounds(addressRow.removeFromRight(48));
    addressRow.removeFromRight(6);
    addressField.setBounds(addressRow);

    bounds.removeFromTop(8);
    modeLabel.setBounds(bounds.removeFromTop(22));
    statusLabel.setBounds(bounds.removeFromTop(22));
}

void HostComponent::setStatus(const juce::String& message, juce::Colour colour)
{
    statusLabel.setColour(juce::Label::textColourId, colour);
    statusLabel.setText(message, juce::dontSendNotification);
}

juce::String HostComponent::describeNavigation(const juce::String& currentAddress,
                                              const juce::String& requestedAddress)
{
    if (requestedAddress == currentAddress)
        return {};

    return "Loading " + requestedAddress + "...";
}

//==============================================================================
void HostComponent::timerCallback()
{
    updateToggleButton();
}

void HostComponent::pageFinishedLoading(const juce::String& address)
{
    setStatus("Loaded " + address, AppColours::success);
}

void HostComponent::pageLoadFailed(const juce::String& errorInfo)
{
    setStatus("Load failed: " + errorInfo, AppColours::error);
}

void HostComponent::windowClosedByUser()
{
    setStatus("Web window closed", AppColours::textSecondary);
    updateToggleButton();
}

//==============================================================================
void HostComponent::navigateToTypedAddress()
{
    auto address = addressField.getText().trim();
    if (address.isEmpty())
        return;

    auto status = describeNavigation(webWindow.getCurrentAddress(), address);

    webWindow.navigate(address);
    appState.setLastAddress(webWindow.getCurrentAddress());

    if (webWindow.isNative() && status.isNotEmpty())
        setStatus(status, AppColours::textSecondary);
}

void HostComponent::toggleWebWindow()
{
    webWindow.setHidden(webWindow.isVisible());
    updateToggleButton();
}

void HostComponent::updateToggleButton()
{
    toggleButton.setButtonText(webWindow.isVisible() ? "Hide" : "Show");
}
