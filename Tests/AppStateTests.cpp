#include <gtest/gtest.h>

#include <Application/AppConfig.h>
#include <Application/AppState.h>
#include <WebView/NativeFloatingWebWindow.h>
#include <WebView/StandInFloatingWebWindow.h>
#include "FakeWebWindowBackend.h"

namespace {

class AppStateTest : public ::testing::Test {
protected:
    juce::File folder{};
    juce::File settingsFile{};

    void SetUp() override {
        const auto* testInfo = ::testing::UnitTest::GetInstance()->current_test_info();
        folder = juce::File::getSpecialLocation(juce::File::tempDirectory)
                     .getNonexistentChildFile(juce::String("fww-appstate-") + (testInfo ? testInfo->name() : "test"), {});
        ASSERT_TRUE(folder.createDirectory().wasOk());
        settingsFile = folder.getChildFile("settings.xml");
    }

    void TearDown() override {
        folder.deleteRecursively();
    }

    static std::unique_ptr<fww::NativeFloatingWebWindow> makeWindow(std::unique_ptr<fww_test::FakeWebWindowBackend> backend) {
        fww::FloatingWebWindow::Options options;
        options.initialAddress = "https://example.com/page2";

        auto result = juce::Result::ok();
        return fww::NativeFloatingWebWindow::create(std::move(backend), options, result);
    }
};

TEST_F(AppStateTest, DefaultsWithoutSettingsFile) {
    AppState state(settingsFile);

    EXPECT_EQ(state.getLastAddress(), juce::String(AppConfig::defaultAddress));
    EXPECT_EQ(state.getWebWindowWidth(), AppConfig::defaultWebWindowWidth);
    EXPECT_EQ(state.getWebWindowHeight(), AppConfig::defaultWebWindowHeight);
    EXPECT_FALSE(state.wasWebWindowHidden());
    EXPECT_TRUE(state.getWindowBounds().isEmpty());
}

TEST_F(AppStateTest, SettingsSurviveAReload) {
    {
        AppState state(settingsFile);
        state.setLastAddress("https://example.com/page2");
        state.setWebWindowSize(800, 600);
        state.setWebWindowHidden(true);
        state.setWindowBounds({ 10, 20, 640, 160 });
        state.saveSettings();
    }

    ASSERT_TRUE(settingsFile.existsAsFile());

    AppState reloaded(settingsFile);
    EXPECT_EQ(reloaded.getLastAddress(), juce::String("https://example.com/page2"));
    EXPECT_EQ(reloaded.getWebWindowWidth(), 800);
    EXPECT_EQ(reloaded.getWebWindowHeight(), 600);
    EXPECT_TRUE(reloaded.wasWebWindowHidden());
    EXPECT_EQ(reloaded.getWindowBounds(), juce::Rectangle<int>(10, 20, 640, 160));
}

TEST_F(AppStateTest, WebStorageFolderSitsNextToSettings) {
    AppState state(settingsFile);

    auto storage = state.getWebStorageFolder();

    EXPECT_TRUE(storage.isDirectory());
    EXPECT_EQ(storage.getParentDirectory(), folder);
    EXPECT_EQ(storage, state.getWebStorageFolder());
}

TEST_F(AppStateTest, RemembersHiddenWebWindow) {
    AppState state(settingsFile);
    fww_test::BackendLog log;
    auto window = makeWindow(std::make_unique<fww_test::FakeWebWindowBackend>(log));
    ASSERT_NE(window.get(), nullptr);

    window->setHidden(true);
    state.rememberWebWindow(*window);

    EXPECT_TRUE(state.wasWebWindowHidden());
    EXPECT_EQ(state.getLastAddress(), juce::String("https://example.com/page2"));
}

TEST_F(AppStateTest, MinimisedWebWindowIsNotRememberedAsHidden) {
    AppState state(settingsFile);
    state.setWebWindowHidden(true);

    fww_test::BackendLog log;
    auto backend = std::make_unique<fww_test::FakeWebWindowBackend>(log);
    auto* fake = backend.get();
    auto window = makeWindow(std::move(backend));
    ASSERT_NE(window.get(), nullptr);

    fake->simulateMinimise();
    state.rememberWebWindow(*window);

    EXPECT_FALSE(state.wasWebWindowHidden());
}

TEST_F(AppStateTest, StandInLeavesHiddenFlagAlone) {
    AppState state(settingsFile);
    state.setWebWindowHidden(true);

    fww::FloatingWebWindow::Options options;
    options.initialAddress = "https://example.org";
    fww::StandInFloatingWebWindow standIn(options);

    state.rememberWebWindow(standIn);

    EXPECT_TRUE(state.wasWebWindowHidden());
    EXPECT_EQ(state.getLastAddress(), juce::String("https://example.org"));
}

} // namespace
