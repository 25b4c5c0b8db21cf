/*
  ==============================================================================

    Floating Web Window
    Main Application Entry Point

    Starts a small host window and the floating web window it controls.

  ==============================================================================
*/

#include <juce_gui_basics/juce_gui_basics.h>
#include "Application/AppConfig.h"
#include "Application/AppLogger.h"
#include "Application/AppState.h"
#include "Application/LaunchOptions.h"
#include "UI/HostComponent.h"
#include "UI/Theme/AppLookAndFeel.h"
#include "UI/Theme/ColourScheme.h"
#include "WebView/FloatingWebWindow.h"

//==============================================================================
/**
    Host application for the floating web window.

    Handles application lifecycle:
    - Logging and settings
    - Creating the web window (native, or the stand-in as a fallback)
    - Saving state and tearing everything down in order
*/
class FloatingWebWindowApplication : public juce::JUCEApplication
{
public:
    //==============================================================================
    FloatingWebWindowApplication() {}

    //==============================================================================
    const juce::String getApplicationName() override
    {
        return AppConfig::appName;
    }

    const juce::String getApplicationVersion() override
    {
        return AppConfig::versionString;
    }

    bool moreThanOneInstanceAllowed() override
    {
        return false;
    }

    //==============================================================================
    void initialise(const juce::String& commandLine) override
    {
        juce::ignoreUnused(commandLine);

        logger = std::make_unique<ScopedAppLogger>();

        lookAndFeel = std::make_unique<AppLookAndFeel>();
        juce::LookAndFeel::setDefaultLookAndFeel(lookAndFeel.get());

        appState = std::make_unique<AppState>();

        auto launch = LaunchOptions::fromArguments(
            juce::ArgumentList(getApplicationName(), getCommandLineParameterArray()),
            LaunchOptions::fromSettings(*appState));

        // An explicit --size sticks for later sessions.
        appState->setWebWindowSize(launch.width, launch.height);

        fww::FloatingWebWindow::Options options;
        options.width = launch.width;
        options.height = launch.height;
        options.initialAddress = launch.address;
        options.storageFolder = appState->getWebStorageFolder();

        juce::String failure;

        if (launch.useStandIn)
        {
            webWindow = fww::FloatingWebWindow::createStandIn(options);
        }
        else
        {
            auto result = juce::Result::ok();
            webWindow = fww::FloatingWebWindow::create(options, result);

            if (result.failed())
            {
                failure = result.getErrorMessage();
                juce::Logger::writeToLog("Native web window unavailable (" + failure + "), using stand-in");
                webWindow = fww::FloatingWebWindow::createStandIn(options);
            }
        }

        if (launch.startHidden)
            webWindow->setHidden(true);

        mainWindow = std::make_unique<MainWindow>(getApplicationName(), *appState, *webWindow);

        if (failure.isNotEmpty())
            mainWindow->getHostComponent().setStatus(failure, AppColours::warning);

        DBG("=== Floating Web Window Started ===");
    }

    void shutdown() override
    {
        DBG("=== Floating Web Window Shutting Down ===");

        if (appState && webWindow)
            appState->rememberWebWindow(*webWindow);

        // Clean up (order matters!)
        mainWindow = nullptr;
        webWindow = nullptr;

        if (appState)
            appState->saveSettings();
        appState = nullptr;

        juce::LookAndFeel::setDefaultLookAndFeel(nullptr);
        lookAndFeel = nullptr;

        logger = nullptr;
    }

    //==============================================================================
    void systemRequestedQuit() override
    {
        quit();
    }

    void anotherInstanceStarted(const juce::String& commandLine) override
    {
        // Forward a --url from the second instance to this one.
        auto args = juce::ArgumentList(getApplicationName(),
                                       juce::StringArray::fromTokens(commandLine, true));
        auto launch = LaunchOptions::fromArguments(args, {});

        if (webWindow && launch.address.isNotEmpty())
        {
            webWindow->navigate(launch.address);
            webWindow->setHidden(false);
        }

        if (mainWindow)
            mainWindow->toFront(true);
    }

    //==============================================================================
    /**
        Host window.

        Manages the window frame and contains the HostComponent.
    */
    class MainWindow : public juce::DocumentWindow
    {
    public:
        MainWindow(juce::String name, AppState& state, fww::FloatingWebWindow& webWindow)
            : DocumentWindow(name,
                            juce::Desktop::getInstance().getDefaultLookAndFeel()
                                .findColour(juce::ResizableWindow::backgroundColourId),
                            DocumentWindow::allButtons),
              appState(state)
        {
            setUsingNativeTitleBar(true);
            setContentOwned(new HostComponent(appState, webWindow), false);
            setResizable(true, true);

            // Restore window bounds from saved state
            auto savedBounds = appState.getWindowBounds();
            if (savedBounds.isEmpty())
                centreWithSize(AppConfig::defaultHostWindowWidth, AppConfig::defaultHostWindowHeight);
            else
                setBounds(savedBounds);

            setResizeLimits(AppConfig::minHostWindowWidth, AppConfig::minHostWindowHeight, 4096, 4096);
            setVisible(true);
        }

        HostComponent& getHostComponent() const
        {
            return *dynamic_cast<HostComponent*>(getContentComponent());
        }

        void closeButtonPressed() override
        {
            appState.setWindowBounds(getBounds());

            JUCEApplication::getInstance()->systemRequestedQuit();
        }

        void moved() override
        {
            DocumentWindow::moved();
            if (isVisible())
                appState.setWindowBounds(getBounds());
        }

        void resized() override
        {
            DocumentWindow::resized();
            if (isVisible())
                appState.setWindowBounds(getBounds());
        }

    private:
        AppState& appState;

        JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(MainWindow)
    };

private:
    std::unique_ptr<ScopedAppLogger> logger;
    std::unique_ptr<AppLookAndFeel> lookAndFeel;
    std::unique_ptr<AppState> appState;
    std::unique_ptr<fww::FloatingWebWindow> webWindow;
    std::unique_ptr<MainWindow> mainWindow;
};

//==============================================================================
// Application instantiation
START_JUCE_APPLICATION(FloatingWebWindowApplication)
