#include <gtest/gtest.h>

#include <Application/LaunchOptions.h>

namespace {

LaunchOptions makeDefaults() {
    LaunchOptions defaults;
    defaults.address = "https://example.com";
    defaults.width = 480;
    defaults.height = 640;
    return defaults;
}

LaunchOptions parse(std::initializer_list<const char*> arguments) {
    return LaunchOptions::fromArguments(juce::ArgumentList("FloatingWebWindowDemo", juce::StringArray(arguments)),
                                        makeDefaults());
}

TEST(LaunchOptionsTest, NoArgumentsKeepDefaults) {
    auto options = parse({});

    EXPECT_EQ(options.address, juce::String("https://example.com"));
    EXPECT_EQ(options.width, 480);
    EXPECT_EQ(options.height, 640);
    EXPECT_FALSE(options.startHidden);
    EXPECT_FALSE(options.useStandIn);
}

TEST(LaunchOptionsTest, ParsesEveryOption) {
    auto options = parse({ "--url=https://example.org/docs", "--size=1024x768", "--hidden", "--stand-in" });

    EXPECT_EQ(options.address, juce::String("https://example.org/docs"));
    EXPECT_EQ(options.width, 1024);
    EXPECT_EQ(options.height, 768);
    EXPECT_TRUE(options.startHidden);
    EXPECT_TRUE(options.useStandIn);
}

TEST(LaunchOptionsTest, MalformedSizeKeepsDefaultSize) {
    for (auto* size : { "--size=wide", "--size=800", "--size=x600", "--size=-5x10", "--size=0x0", "--size=800x0" }) {
        auto options = parse({ size });
        EXPECT_EQ(options.width, 480) << size;
        EXPECT_EQ(options.height, 640) << size;
    }
}

TEST(LaunchOptionsTest, BlankUrlKeepsDefaultAddress) {
    auto options = parse({ "--url=" });

    EXPECT_EQ(options.address, juce::String("https://example.com"));
}

} // namespace
