#pragma once

#include "terminal/ColorPairRegistry.h"
#include "terminal/Instruction.h"
#include "terminal/TextAttribute.h"
#include <functional>
#include <string>
#include <vector>

namespace ViewPane::Terminal {

// Running style between Translate() calls
struct StyleState {
    uint8_t flags = 0;
    int colorSlot = 0;   // 0 or a slot handed out by the registry
};

struct RenderedSpan {
    std::string text;
    TextAttribute attribute = 0;

    bool operator==(const RenderedSpan& other) const {
        return text == other.text && attribute == other.attribute;
    }
};

using RenderedLine = std::vector<RenderedSpan>;

/**
 * @brief Turns an instruction stream into (text, attribute) spans
 *
 * Style is carried over from one call to the next: a style opened on one
 * line and never reset continues on the next line. Only an explicit reset
 * (or ResetState()) clears it. The color pair registry may be shared
 * between translators that must agree on slot numbering.
 */
class AttributeTranslator {
public:
    using SpanCallback = std::function<void(const RenderedSpan&)>;

    explicit AttributeTranslator(ColorPairRegistry& registry, StyleState initialState = {});

    /**
     * @brief Translate one instruction stream, emitting each span as soon as
     *        its text instruction is reached
     * @throws ColorPairCapacityError when a new color pair cannot be allocated.
     *         The stored style is not updated in that case.
     */
    void Translate(const InstructionList& instructions, const SpanCallback& emit);

    // Convenience form that collects the spans
    RenderedLine Translate(const InstructionList& instructions);

    const StyleState& GetState() const { return m_state; }
    void ResetState() { m_state = StyleState{}; }

    // When disabled, color instructions are ignored and text stays uncolored
    void SetColorEnabled(bool enabled);
    bool IsColorEnabled() const { return m_colorEnabled; }

    ColorPairRegistry& GetRegistry() { return m_registry; }

private:
    struct Visitor;

    ColorPairRegistry& m_registry;
    StyleState m_state;
    bool m_colorEnabled = true;
};

} // namespace ViewPane::Terminal
