#pragma once

#include "terminal/Instruction.h"
#include <functional>
#include <map>
#include <optional>
#include <stdexcept>
#include <vector>

namespace ViewPane::Terminal {

struct ColorPair {
    ColorCode foreground = kDefaultColor;
    ColorCode background = kDefaultColor;

    bool operator==(const ColorPair& other) const {
        return foreground == other.foreground && background == other.background;
    }
    bool operator!=(const ColorPair& other) const { return !(*this == other); }
    bool operator<(const ColorPair& other) const {
        if (foreground != other.foreground) return foreground < other.foreground;
        return background < other.background;
    }
};

/**
 * @brief Thrown when a new color pair would exceed the surface's pair limit
 */
class ColorPairCapacityError : public std::runtime_error {
public:
    ColorPairCapacityError(const ColorPair& pair, int maxPairs);

    const ColorPair& GetPair() const { return m_pair; }
    int GetMaxPairs() const { return m_maxPairs; }

private:
    ColorPair m_pair;
    int m_maxPairs;
};

/**
 * @brief Allocates rendering-surface color pair slots for (fg, bg) pairs
 *
 * Slot 0 is reserved for "no color override" and is never allocated.
 * New pairs receive slots 1, 2, 3... in the order they are first seen,
 * and a mapping is never revoked for the registry's lifetime.
 */
class ColorPairRegistry {
public:
    static constexpr int kDefaultMaxPairs = 255;
    // Highest slot a curses attribute can carry; larger limits are clamped
    static constexpr int kMaxPairsLimit = 255;

    // Callback fired once per newly allocated slot (e.g. to call init_pair)
    using AllocationCallback = std::function<void(int slot, const ColorPair& pair)>;

    explicit ColorPairRegistry(int maxPairs = kDefaultMaxPairs);

    /**
     * @brief Get the slot for a pair, allocating the next one if unseen
     * @throws ColorPairCapacityError if allocation would exceed the limit.
     *         The registry is left unchanged in that case.
     */
    int Resolve(const ColorPair& pair);

    /**
     * @brief Reverse lookup. Slot 0 maps to the default pair.
     */
    std::optional<ColorPair> Lookup(int slot) const;

    // Slot for an already registered pair, without allocating
    std::optional<int> Find(const ColorPair& pair) const;

    int Size() const { return static_cast<int>(m_pairs.size()); }
    bool Empty() const { return m_pairs.empty(); }

    int GetMaxPairs() const { return m_maxPairs; }
    void SetMaxPairs(int maxPairs);

    void SetAllocationCallback(AllocationCallback callback) {
        m_allocationCallback = std::move(callback);
    }

private:
    std::map<ColorPair, int> m_slots;
    std::vector<ColorPair> m_pairs;   // m_pairs[slot - 1]
    int m_maxPairs;
    AllocationCallback m_allocationCallback;
};

} // namespace ViewPane::Terminal
