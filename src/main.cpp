#include "core/CommandLine.h"
#include "core/Config.h"
#include "core/Controller.h"
#include "core/Logging.h"
#include "core/Version.h"
#include "process/PosixCommandRunner.h"
#include "rendering/NcursesSurface.h"
#include "ui/KeyMap.h"
#include <signal.h>
#include <cstdlib>
#include <iostream>
#include <spdlog/spdlog.h>

using namespace ViewPane;

namespace {

volatile sig_atomic_t g_stopRequested = 0;

extern "C" void HandleStopSignal(int) {
    g_stopRequested = 1;
}

void InstallSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = HandleStopSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

constexpr int kExitUsage = 2;

} // anonymous namespace

int main(int argc, char* argv[]) {
    const std::string programName = (argc > 0 && argv[0]) ? argv[0] : "viewpane";
    std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

    Core::CommandLineOptions cmdline;
    try {
        cmdline = Core::ParseCommandLine(args);
    } catch (const Core::CommandLineError& e) {
        std::cerr << programName << ": " << e.what() << "\n\n" << Core::UsageText(programName);
        return kExitUsage;
    }

    if (cmdline.help) {
        std::cout << Core::UsageText(programName);
        return EXIT_SUCCESS;
    }
    if (cmdline.version) {
        std::cout << "viewpane " << Core::kVersion << "\n";
        return EXIT_SUCCESS;
    }

    Core::Config config;
    bool configOk = cmdline.configPath ? config.Load(*cmdline.configPath) : config.LoadDefault();

    // Command line wins over the config file
    if (cmdline.intervalSeconds) {
        config.GetRefreshMut().intervalSeconds = *cmdline.intervalSeconds;
    }
    if (cmdline.showStatus) {
        config.GetDisplayMut().showStatus = true;
    }
    if (cmdline.logFile) {
        config.GetLoggingMut().file = *cmdline.logFile;
    }
    if (cmdline.logLevel) {
        config.GetLoggingMut().level = *cmdline.logLevel;
    }

    if (!Core::Logging::Initialize(config.GetLogging())) {
        std::cerr << programName << ": cannot open log file '" << config.GetLogging().file
                  << "', logging disabled\n";
    }

    spdlog::info("viewpane {} starting", Core::kVersion);
    if (!configOk) {
        spdlog::warn("Configuration could not be loaded, using defaults");
    }
    for (const auto& warning : config.GetWarnings()) {
        spdlog::warn("Config: {}", warning);
    }

    InstallSignalHandlers();

    Core::ControllerOptions options;
    options.command = cmdline.command;
    options.intervalSeconds = config.GetRefresh().intervalSeconds;
    options.showStatus = config.GetDisplay().showStatus;
    options.errexit = cmdline.errexit;
    options.colors = config.GetDisplay().colors;
    options.maxColorPairs = config.GetDisplay().maxColorPairs;

    Core::ControllerCallbacks callbacks;
    callbacks.stopRequested = []() { return g_stopRequested != 0; };

    int exitCode = EXIT_SUCCESS;
    try {
        // The surface must be gone before anything is printed to stderr
        Rendering::NcursesSurface surface(config.GetRefresh().inputPollMs);
        Process::PosixCommandRunner runner;
        Core::Controller controller(options, surface, runner,
                                    UI::KeyMap(config.GetKeybindings()), callbacks);
        exitCode = controller.Run();
    } catch (const Core::CommandFailedError& e) {
        spdlog::error("{}", e.what());
        std::cerr << e.GetOutput();
        if (!e.GetOutput().empty() && e.GetOutput().back() != '\n') {
            std::cerr << '\n';
        }
        std::cerr << programName << ": " << options.command.ToString() << ": " << e.what() << "\n";
        exitCode = EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal: {}", e.what());
        std::cerr << programName << ": " << e.what() << "\n";
        exitCode = EXIT_FAILURE;
    }

    spdlog::info("viewpane exiting with code {}", exitCode);
    Core::Logging::Shutdown();
    return exitCode;
}
