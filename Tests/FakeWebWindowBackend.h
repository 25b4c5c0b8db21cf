#pragma once

#include <WebView/WebWindowBackend.h>

namespace fww_test {

// Calls recorded by FakeWebWindowBackend. Owned by the test so it outlives the backend.
struct BackendLog {
    int createCount{0};
    int loadCount{0};
    int presentCount{0};
    int orderOutCount{0};
    int closeCount{0};
    int releaseCount{0};
    juce::StringArray loadedAddresses{};
    juce::Rectangle<int> createdBounds{};
    juce::File storageFolder{};
    juce::StringArray events{};
};

// Stands in for a window system: keeps an "on screen" flag and records every call.
class FakeWebWindowBackend : public fww::WebWindowBackend {
public:
    explicit FakeWebWindowBackend(BackendLog& log) : log(log) {}

    juce::Rectangle<int> displayArea{0, 25, 1920, 1055};
    juce::Result createResult = juce::Result::ok();
    bool onScreen{false};
    bool minimised{false};
    bool window{false};

    juce::Rectangle<int> getPrimaryDisplayArea() const override { return displayArea; }

    juce::Result createWindow(const WindowSpec& spec) override {
        ++log.createCount;
        log.events.add("create");
        log.createdBounds = spec.bounds;
        log.storageFolder = spec.storageFolder;
        if (createResult.wasOk())
            window = true;
        return createResult;
    }

    bool hasWindow() const override { return window; }

    void loadAddress(const juce::String& address) override {
        ++log.loadCount;
        log.events.add("load");
        log.loadedAddresses.add(address);
    }

    void present() override {
        ++log.presentCount;
        log.events.add("present");
        onScreen = true;
        minimised = false;
    }

    void orderOut() override {
        ++log.orderOutCount;
        log.events.add("orderOut");
        onScreen = false;
    }

    bool isOnScreen() const override { return window && onScreen && !minimised; }
    bool isMinimised() const override { return window && onScreen && minimised; }

    void closeWindow() override {
        ++log.closeCount;
        log.events.add("close");
        onScreen = false;
    }

    void releaseWindow() override {
        ++log.releaseCount;
        log.events.add("release");
        window = false;
        onScreen = false;
    }

    void simulateMinimise() { minimised = true; }

    // What the window system would do when the user clicks the close button.
    void simulateUserClose() {
        onScreen = false;
        if (onUserClosedWindow)
            onUserClosedWindow();
    }

private:
    BackendLog& log;
};

} // namespace fww_test
