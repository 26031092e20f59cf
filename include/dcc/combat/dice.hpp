#pragma once

/// @file dice.hpp
/// @brief Dice sources and "NdM+K" damage notation.
///
/// Every roll the engine generates goes through a DiceSource owned by the
/// encounter, so a scripted source replays an encounter exactly.

#include <cstdint>
#include <deque>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include "dcc/foundation/engine_result.hpp"

namespace dcc::combat {

/// Abstract source of die rolls.
class DiceSource {
public:
    virtual ~DiceSource() = default;

    /// Roll one die with @p sides faces. Result is in [1, sides].
    virtual foundation::EngineResult<int32_t> Roll(int32_t sides) = 0;

    foundation::EngineResult<int32_t> D20() { return Roll(20); }
};

/// Pseudo-random dice. A seed of 0 draws from std::random_device.
class RandomDice final : public DiceSource {
public:
    explicit RandomDice(uint64_t seed = 0);

    foundation::EngineResult<int32_t> Roll(int32_t sides) override;

private:
    std::mt19937_64 engine_;
};

/// Dice that return a fixed sequence, for tests and scenario replay.
///
/// Fails with DiceSequenceExhausted when the sequence runs out and with
/// RollOutOfRange when the next value does not fit the requested die.
class ScriptedDice final : public DiceSource {
public:
    ScriptedDice() = default;
    explicit ScriptedDice(std::vector<int32_t> rolls);

    foundation::EngineResult<int32_t> Roll(int32_t sides) override;

    /// Append more rolls to the end of the sequence.
    void Push(int32_t roll) { rolls_.push_back(roll); }

    [[nodiscard]] std::size_t Remaining() const noexcept { return rolls_.size(); }

private:
    std::deque<int32_t> rolls_;
};

/// Parsed dice notation: "2d6+3", "d20", "1d8-1" or a flat "7".
/// Flat amounts are never negative.
///
/// On a critical hit only the dice are doubled, never the modifier:
/// "1d8+3" rolls as 2d8+3.
struct DiceExpression {
    int32_t count = 0;
    int32_t sides = 0;
    int32_t modifier = 0;

    static constexpr int32_t kMaxCount = 100;
    static constexpr int32_t kMaxSides = 1000;
    /// Bound on |modifier| and on a flat amount.
    static constexpr int32_t kMaxModifier = 10000;

    /// @return The parsed expression or InvalidDiceExpression.
    static foundation::EngineResult<DiceExpression> Parse(std::string_view text);

    /// Roll the expression. Totals below zero clamp to zero.
    foundation::EngineResult<int32_t> Roll(DiceSource& dice, bool critical) const;

    [[nodiscard]] std::string ToString() const;
};

}  // namespace dcc::combat
