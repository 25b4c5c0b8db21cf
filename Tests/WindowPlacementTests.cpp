#include <gtest/gtest.h>

#include <WebView/WindowPlacement.h>

using fww::computeWindowPlacement;

namespace {

TEST(WindowPlacementTest, InsetsFromTopLeftOfScreenArea) {
    auto bounds = computeWindowPlacement({ 0, 25, 1920, 1055 }, 480, 640, 100);

    EXPECT_EQ(bounds, juce::Rectangle<int>(100, 125, 480, 640));
}

TEST(WindowPlacementTest, FollowsAnOffsetPrimaryDisplay) {
    auto bounds = computeWindowPlacement({ -1280, 0, 1280, 1024 }, 300, 200, 100);

    EXPECT_EQ(bounds.getPosition(), juce::Point<int>(-1180, 100));
}

TEST(WindowPlacementTest, ClampsNonPositiveSizes) {
    auto bounds = computeWindowPlacement({ 0, 0, 800, 600 }, 0, -5, 100);

    EXPECT_EQ(bounds.getWidth(), 1);
    EXPECT_EQ(bounds.getHeight(), 1);
}

TEST(WindowPlacementTest, NegativeMarginIsTreatedAsZero) {
    auto bounds = computeWindowPlacement({ 10, 20, 800, 600 }, 100, 100, -40);

    EXPECT_EQ(bounds.getPosition(), juce::Point<int>(10, 20));
}

} // namespace
