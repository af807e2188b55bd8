#include "core/Controller.h"
#include "rendering/IRenderSurface.h"
#include "terminal/Utf8.h"
#include "ui/Keys.h"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

namespace ViewPane::Core {

using Terminal::ColorPairCapacityError;
using Terminal::InstructionList;
using Terminal::RenderedLine;

CommandFailedError::CommandFailedError(int exitStatus, std::string output)
    : std::runtime_error("command exited with status " + std::to_string(exitStatus))
    , m_exitStatus(exitStatus)
    , m_output(std::move(output))
{
}

Controller::Controller(ControllerOptions options,
                       Rendering::IRenderSurface& surface,
                       Process::ICommandRunner& runner,
                       UI::KeyMap keyMap,
                       ControllerCallbacks callbacks)
    : m_options(std::move(options))
    , m_surface(surface)
    , m_runner(runner)
    , m_callbacks(std::move(callbacks))
    , m_registry(m_options.colors ? std::min(m_options.maxColorPairs, surface.MaxColorPairs()) : 0)
    , m_translator(m_registry)
    , m_inputHandler(
          UI::InputHandlerCallbacks{
              [this]() { RequestQuit(); },
              [this]() { m_surface.UpdateSize(); },
              [this]() { m_refreshRequested = true; },
              [this]() { return ViewRows(); },
          },
          std::move(keyMap))
{
    m_translator.SetColorEnabled(m_options.colors);

    m_registry.SetAllocationCallback([this](int slot, const Terminal::ColorPair& pair) {
        m_surface.RegisterColorPair(slot, pair);
    });

    spdlog::info("Watching '{}' every {}s ({} color pairs available)",
                 m_options.command.ToString(), m_options.intervalSeconds, m_registry.GetMaxPairs());
}

int Controller::Run() {
    using Clock = std::chrono::steady_clock;
    const auto interval = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(m_options.intervalSeconds));

    m_running = true;
    m_quitRequested = false;
    spdlog::info("Controller::Run() - entering main loop");

    auto cycleStart = Clock::now();
    RefreshContent();
    Redraw();

    while (m_running) {
        if (m_callbacks.stopRequested && m_callbacks.stopRequested()) {
            spdlog::info("Stop requested, exiting loop");
            break;
        }

        // Bounded wait; doubles as the redraw tick
        int key = m_surface.ReadKey();
        if (key != UI::Keys::None) {
            HandleKey(key);
            if (m_quitRequested) {
                break;
            }
        }

        auto now = Clock::now();
        if (m_refreshRequested || now - cycleStart >= interval) {
            m_refreshRequested = false;
            cycleStart = now;
            RefreshContent();
            Redraw();
        }
    }

    m_running = false;
    spdlog::info("Controller::Run() - loop finished");
    return 0;
}

void Controller::RefreshContent() {
    Process::CommandResult result = m_runner.Run(m_options.command);

    if (result.exitStatus != 0) {
        spdlog::info("Command exited with status {}", result.exitStatus);
        if (m_options.errexit) {
            throw CommandFailedError(result.exitStatus, result.output);
        }
    }

    std::vector<InstructionList> parsed;
    for (const auto& line : SplitLines(result.output)) {
        parsed.push_back(m_parser.ParseLine(line));
    }

    m_viewport.Write(TranslateLines(parsed));

    m_lastResult = std::move(result);
    m_hasResult = true;
}

std::vector<RenderedLine> Controller::TranslateLines(const std::vector<InstructionList>& lines) {
    // Style carries from line to line but not from one refresh to the next
    m_translator.ResetState();

    std::vector<RenderedLine> rendered;
    rendered.reserve(lines.size());

    try {
        for (const auto& line : lines) {
            rendered.push_back(m_translator.Translate(line));
        }
    } catch (const ColorPairCapacityError& e) {
        // Previously allocated slots stay intact; further output is uncolored
        spdlog::warn("{}; disabling colors", e.what());
        m_translator.SetColorEnabled(false);
        m_translator.ResetState();

        rendered.clear();
        for (const auto& line : lines) {
            rendered.push_back(m_translator.Translate(line));
        }
    }

    return rendered;
}

void Controller::Redraw() {
    int rows = 0;
    int cols = 0;
    m_surface.GetSize(rows, cols);

    m_viewport.Render(m_surface, rows, cols);
    DrawStatusLine(rows, cols);

    if (rows > 0) {
        m_surface.MoveCursor(rows - 1, 0);
    }
    m_surface.Refresh();
}

bool Controller::HandleKey(int key) {
    bool handled = m_inputHandler.OnKey(key, m_viewport);
    if (handled && !m_quitRequested) {
        Redraw();
    }
    return handled;
}

std::string Controller::BuildStatusLine(int cols) const {
    if (!m_options.showStatus || cols <= 1) {
        return {};
    }

    // Leave the bottom-right cell alone; writing it scrolls some terminals
    size_t width = static_cast<size_t>(cols - 1);

    std::u32string left = Terminal::Utf8::Decode(
        fmt::format("Every {:.1f}s: {}", m_options.intervalSeconds, m_options.command.ToString()));
    std::u32string right = m_hasResult
        ? Terminal::Utf8::Decode(fmt::format("exit {}", m_lastResult.exitStatus))
        : std::u32string();

    if (right.size() >= width) {
        right.clear();
    }

    size_t leftRoom = right.empty() ? width : width - right.size() - 1;
    if (left.size() > leftRoom) {
        left.resize(leftRoom);
    }

    std::u32string line = left;
    if (!right.empty()) {
        line.append(width - left.size() - right.size(), U' ');
        line += right;
    }
    return Terminal::Utf8::Encode(line);
}

void Controller::DrawStatusLine(int rows, int cols) {
    if (rows <= 0) {
        return;
    }

    std::string status = BuildStatusLine(cols);
    if (!status.empty()) {
        m_surface.DrawText(rows - 1, 0, status,
                           Terminal::EncodeAttribute(Terminal::StyleFlags::REVERSE, 0));
    }
}

int Controller::ViewRows() const {
    int rows = 0;
    int cols = 0;
    m_surface.GetSize(rows, cols);
    return std::max(1, rows - 1);
}

std::vector<std::string> Controller::SplitLines(const std::string& output) {
    std::vector<std::string> lines;

    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }

        std::string line = output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        start = end + 1;
    }

    return lines;
}

} // namespace ViewPane::Core
