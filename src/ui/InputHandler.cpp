#include "ui/InputHandler.h"
#include "terminal/ViewportBuffer.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace ViewPane::UI {

using Terminal::ScrollTarget;

InputHandler::InputHandler(InputHandlerCallbacks callbacks, KeyMap keyMap)
    : m_callbacks(std::move(callbacks))
    , m_keyMap(std::move(keyMap))
{
}

bool InputHandler::OnKey(int key, Terminal::ViewportBuffer& viewport) {
    auto action = m_keyMap.Lookup(key);
    if (!action) {
        spdlog::debug("No action mapped to key {}", key);
        return false;
    }

    Apply(*action, viewport);
    return true;
}

void InputHandler::Apply(ScrollAction action, Terminal::ViewportBuffer& viewport) {
    switch (action) {
        case ScrollAction::ScrollUp:
            viewport.MoveBy(-1, 0);
            break;
        case ScrollAction::ScrollDown:
            viewport.MoveBy(1, 0);
            break;
        case ScrollAction::ScrollLeft:
            viewport.MoveBy(0, -1);
            break;
        case ScrollAction::ScrollRight:
            viewport.MoveBy(0, 1);
            break;
        case ScrollAction::HalfPageUp:
            viewport.MoveBy(-HalfPageRows(), 0);
            break;
        case ScrollAction::HalfPageDown:
            viewport.MoveBy(HalfPageRows(), 0);
            break;
        case ScrollAction::PageUp:
            viewport.MoveBy(-PageRows(), 0);
            break;
        case ScrollAction::PageDown:
            viewport.MoveBy(PageRows(), 0);
            break;
        case ScrollAction::Top:
            viewport.JumpTo(ScrollTarget::Min(), ScrollTarget::Unchanged());
            break;
        case ScrollAction::Bottom:
            viewport.JumpTo(ScrollTarget::Max(), ScrollTarget::Unchanged());
            break;
        case ScrollAction::LineStart:
            viewport.JumpTo(ScrollTarget::Unchanged(), ScrollTarget::Min());
            break;
        case ScrollAction::LineEnd:
            viewport.JumpTo(ScrollTarget::Unchanged(), ScrollTarget::Max());
            break;
        case ScrollAction::Refresh:
            if (m_callbacks.onRefresh) {
                m_callbacks.onRefresh();
            }
            break;
        case ScrollAction::Quit:
            if (m_callbacks.onQuit) {
                m_callbacks.onQuit();
            }
            break;
        case ScrollAction::Resize:
            if (m_callbacks.onResize) {
                m_callbacks.onResize();
            }
            break;
    }
}

int InputHandler::PageRows() const {
    int rows = m_callbacks.getViewRows ? m_callbacks.getViewRows() : 1;
    return std::max(1, rows);
}

int InputHandler::HalfPageRows() const {
    return std::max(1, PageRows() / 2);
}

} // namespace ViewPane::UI
