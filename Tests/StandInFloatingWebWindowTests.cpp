#include <gtest/gtest.h>

#include <WebView/FloatingWebWindow.h>

using fww::FloatingWebWindow;

namespace {

FloatingWebWindow::Options makeOptions(const juce::String& address) {
    FloatingWebWindow::Options options;
    options.initialAddress = address;
    return options;
}

TEST(StandInFloatingWebWindowTest, AlwaysConstructsAndIsNeverVisible) {
    auto window = FloatingWebWindow::createStandIn(makeOptions("https://example.com"));

    ASSERT_NE(window.get(), nullptr);
    EXPECT_FALSE(window->isNative());
    EXPECT_FALSE(window->isVisible());
    EXPECT_EQ(window->getCurrentAddress(), juce::String("https://example.com"));
}

TEST(StandInFloatingWebWindowTest, NavigateStoresEveryAddress) {
    auto window = FloatingWebWindow::createStandIn(makeOptions("https://example.com"));

    window->navigate("https://example.com/page2");
    EXPECT_EQ(window->getCurrentAddress(), juce::String("https://example.com/page2"));

    window->navigate("https://example.com/page2");
    EXPECT_EQ(window->getCurrentAddress(), juce::String("https://example.com/page2"));

    window->navigate({});
    EXPECT_TRUE(window->getCurrentAddress().isEmpty());
}

TEST(StandInFloatingWebWindowTest, HideAndShowDoNothing) {
    auto window = FloatingWebWindow::createStandIn(makeOptions("https://example.com"));

    window->setHidden(false);
    EXPECT_FALSE(window->isVisible());
    window->setHidden(true);
    window->setHidden(true);
    EXPECT_FALSE(window->isVisible());
}

TEST(StandInFloatingWebWindowTest, ZeroSizeIsAccepted) {
    auto options = makeOptions("about:blank");
    options.width = 0;
    options.height = 0;

    auto window = FloatingWebWindow::createStandIn(options);

    ASSERT_NE(window.get(), nullptr);
    EXPECT_EQ(window->getCurrentAddress(), juce::String("about:blank"));
}

#if !FWW_NATIVE_WEB_WINDOW
TEST(StandInFloatingWebWindowTest, DefaultFactoryFallsBackToStandIn) {
    auto result = juce::Result::fail("unset");
    auto window = FloatingWebWindow::create(makeOptions("https://example.com"), result);

    EXPECT_TRUE(result.wasOk());
    ASSERT_NE(window.get(), nullptr);
    EXPECT_FALSE(window->isNative());
}
#endif

} // namespace
