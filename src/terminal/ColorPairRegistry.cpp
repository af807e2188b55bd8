#include "terminal/ColorPairRegistry.h"
#include <algorithm>
#include <string>
#include <spdlog/spdlog.h>

namespace ViewPane::Terminal {

ColorPairCapacityError::ColorPairCapacityError(const ColorPair& pair, int maxPairs)
    : std::runtime_error("color pair limit of " + std::to_string(maxPairs) +
                         " reached while registering (" + std::to_string(pair.foreground) +
                         ", " + std::to_string(pair.background) + ")")
    , m_pair(pair)
    , m_maxPairs(maxPairs)
{
}

ColorPairRegistry::ColorPairRegistry(int maxPairs)
    : m_maxPairs(std::clamp(maxPairs, 0, kMaxPairsLimit))
{
}

void ColorPairRegistry::SetMaxPairs(int maxPairs) {
    m_maxPairs = std::clamp(maxPairs, 0, kMaxPairsLimit);
    if (m_maxPairs < Size()) {
        // Existing slots stay valid, only new allocations are refused
        spdlog::warn("Color pair limit {} is below the {} pairs already allocated",
                     m_maxPairs, Size());
    }
}

int ColorPairRegistry::Resolve(const ColorPair& pair) {
    auto it = m_slots.find(pair);
    if (it != m_slots.end()) {
        return it->second;
    }

    int slot = Size() + 1;
    if (slot > m_maxPairs) {
        throw ColorPairCapacityError(pair, m_maxPairs);
    }

    m_slots.emplace(pair, slot);
    m_pairs.push_back(pair);

    spdlog::debug("Allocated color pair {} -> ({}, {})", slot, pair.foreground, pair.background);

    if (m_allocationCallback) {
        m_allocationCallback(slot, pair);
    }
    return slot;
}

std::optional<ColorPair> ColorPairRegistry::Lookup(int slot) const {
    if (slot == 0) {
        return ColorPair{};
    }
    if (slot < 0 || slot > Size()) {
        return std::nullopt;
    }
    return m_pairs[slot - 1];
}

std::optional<int> ColorPairRegistry::Find(const ColorPair& pair) const {
    auto it = m_slots.find(pair);
    if (it == m_slots.end()) {
        return std::nullopt;
    }
    return it->second;
}

} // namespace ViewPane::Terminal
