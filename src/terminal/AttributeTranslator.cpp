#include "terminal/AttributeTranslator.h"
#include <optional>
#include <spdlog/spdlog.h>

namespace ViewPane::Terminal {

namespace {
uint8_t FlagForAttribute(Attribute attribute) {
    switch (attribute) {
        case Attribute::Bold:      return StyleFlags::BOLD;
        case Attribute::Dim:       return StyleFlags::DIM;
        case Attribute::Italic:    return StyleFlags::ITALIC;
        case Attribute::Underline: return StyleFlags::UNDERLINE;
        case Attribute::Blink:     return StyleFlags::BLINK;
        case Attribute::Reverse:   return StyleFlags::REVERSE;
        case Attribute::Hidden:    return StyleFlags::HIDDEN;
        case Attribute::Normal:    break;
    }
    return 0;
}
} // anonymous namespace

// One overload per Instruction alternative; a new alternative without an
// overload here fails to compile.
struct AttributeTranslator::Visitor {
    AttributeTranslator& translator;
    const SpanCallback& emit;
    uint8_t flags;
    int colorSlot;

    // Pending fg/bg, decoded from colorSlot on first color instruction.
    // Consecutive color instructions accumulate here and the pair is only
    // registered once text is emitted with it (or the call ends).
    std::optional<ColorPair> pending;
    bool pendingDirty = false;

    void operator()(const TextRun& run) {
        Commit();
        emit(RenderedSpan{run.text, EncodeAttribute(flags, colorSlot)});
    }

    void operator()(const SetForeground& fg) {
        if (!fg.color) {
            spdlog::debug("Ignoring foreground instruction without a color");
            return;
        }
        if (!translator.m_colorEnabled) {
            return;
        }
        ColorPair& pair = PendingPair();
        pair.foreground = *fg.color;
        pendingDirty = true;
    }

    void operator()(const SetBackground& bg) {
        if (!bg.color) {
            spdlog::debug("Ignoring background instruction without a color");
            return;
        }
        if (!translator.m_colorEnabled) {
            return;
        }
        ColorPair& pair = PendingPair();
        pair.background = *bg.color;
        pendingDirty = true;
    }

    void operator()(const SetAttribute& attr) {
        if (attr.attribute == Attribute::Normal) {
            if (attr.enabled) {
                Reset();
            } else {
                spdlog::trace("Ignoring {} off", AttributeName(attr.attribute));
            }
            return;
        }

        uint8_t flag = FlagForAttribute(attr.attribute);
        if (attr.enabled) {
            flags |= flag;
        } else {
            flags &= static_cast<uint8_t>(~flag);
        }
    }

    void operator()(const ResetAttributes&) {
        Reset();
    }

    void Reset() {
        // Only the active selection resets; allocated slots stay registered
        flags = 0;
        colorSlot = 0;
        pending = ColorPair{};
        pendingDirty = false;
    }

    ColorPair& PendingPair() {
        if (!pending) {
            auto decoded = translator.m_registry.Lookup(colorSlot);
            pending = decoded ? *decoded : ColorPair{};
        }
        return *pending;
    }

    // Turn the pending pair into a slot. The default pair is slot 0.
    void Commit() {
        if (!pendingDirty) {
            return;
        }
        colorSlot = (*pending == ColorPair{}) ? 0 : translator.m_registry.Resolve(*pending);
        pendingDirty = false;
    }
};

AttributeTranslator::AttributeTranslator(ColorPairRegistry& registry, StyleState initialState)
    : m_registry(registry)
    , m_state(initialState)
{
}

void AttributeTranslator::Translate(const InstructionList& instructions, const SpanCallback& emit) {
    Visitor visitor{*this, emit, m_state.flags, m_state.colorSlot, std::nullopt, false};

    for (const Instruction& instruction : instructions) {
        std::visit(visitor, instruction);
    }
    visitor.Commit();

    // Carry the style into the next call
    m_state.flags = visitor.flags;
    m_state.colorSlot = visitor.colorSlot;
}

RenderedLine AttributeTranslator::Translate(const InstructionList& instructions) {
    RenderedLine spans;
    Translate(instructions, [&spans](const RenderedSpan& span) {
        spans.push_back(span);
    });
    return spans;
}

void AttributeTranslator::SetColorEnabled(bool enabled) {
    m_colorEnabled = enabled;
    if (!enabled) {
        m_state.colorSlot = 0;
    }
}

} // namespace ViewPane::Terminal
