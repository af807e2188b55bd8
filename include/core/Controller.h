#pragma once

#include "process/ICommandRunner.h"
#include "terminal/AnsiParser.h"
#include "terminal/AttributeTranslator.h"
#include "terminal/ColorPairRegistry.h"
#include "terminal/ViewportBuffer.h"
#include "ui/InputHandler.h"
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ViewPane {

namespace Rendering {
    class IRenderSurface;
}

namespace Core {

/**
 * @brief Thrown in strict mode when the watched command exits non-zero
 */
class CommandFailedError : public std::runtime_error {
public:
    CommandFailedError(int exitStatus, std::string output);

    int GetExitStatus() const { return m_exitStatus; }
    const std::string& GetOutput() const { return m_output; }

private:
    int m_exitStatus;
    std::string m_output;
};

struct ControllerOptions {
    Process::CommandSpec command;
    double intervalSeconds = 2.0;
    bool showStatus = false;
    bool errexit = false;
    bool colors = true;
    int maxColorPairs = Terminal::ColorPairRegistry::kDefaultMaxPairs;
};

struct ControllerCallbacks {
    // Polled once per loop iteration; true ends the loop (e.g. on SIGINT)
    std::function<bool()> stopRequested;
};

/**
 * @brief Drives the watch cycle: run, parse, translate, write, render, poll keys
 *
 * Style state is reset at the start of every content refresh, while the
 * color pair registry lives as long as the controller so slot numbers stay
 * stable across refreshes.
 */
class Controller {
public:
    Controller(ControllerOptions options,
               Rendering::IRenderSurface& surface,
               Process::ICommandRunner& runner,
               UI::KeyMap keyMap,
               ControllerCallbacks callbacks = {});

    // Run until quit or stop request. Returns the process exit code.
    int Run();

    // Re-run the command and replace the viewport contents
    void RefreshContent();

    // Paint viewport + status line and push to the screen
    void Redraw();

    // Dispatch one key and redraw unless it quit; returns true if it mapped to an action
    bool HandleKey(int key);

    void RequestQuit() {
        m_quitRequested = true;
        m_running = false;
    }
    bool IsRunning() const { return m_running; }
    bool IsQuitRequested() const { return m_quitRequested; }

    const Terminal::ViewportBuffer& GetViewport() const { return m_viewport; }
    Terminal::ViewportBuffer& GetViewport() { return m_viewport; }
    const Terminal::AttributeTranslator& GetTranslator() const { return m_translator; }
    const Terminal::ColorPairRegistry& GetRegistry() const { return m_registry; }
    const Process::CommandResult& GetLastResult() const { return m_lastResult; }

    // Status line text for a screen of the given width
    std::string BuildStatusLine(int cols) const;

    // Split command output into lines: "\n" separated, trailing "\r" dropped,
    // no empty line after a final newline
    static std::vector<std::string> SplitLines(const std::string& output);

private:
    std::vector<Terminal::RenderedLine> TranslateLines(const std::vector<Terminal::InstructionList>& lines);
    void DrawStatusLine(int rows, int cols);
    int ViewRows() const;

    ControllerOptions m_options;
    Rendering::IRenderSurface& m_surface;
    Process::ICommandRunner& m_runner;
    ControllerCallbacks m_callbacks;

    Terminal::ColorPairRegistry m_registry;
    Terminal::AttributeTranslator m_translator;
    Terminal::AnsiParser m_parser;
    Terminal::ViewportBuffer m_viewport;
    UI::InputHandler m_inputHandler;

    Process::CommandResult m_lastResult;
    bool m_hasResult = false;
    bool m_running = false;
    bool m_quitRequested = false;
    bool m_refreshRequested = false;
};

} // namespace Core
} // namespace ViewPane
