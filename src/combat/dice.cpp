/// @file dice.cpp
/// @brief Dice sources and dice-notation parsing.

#include "dcc/combat/dice.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

using dcc::foundation::EngineError;
using dcc::foundation::EngineResult;
using dcc::foundation::ErrorCode;

namespace dcc::combat {

// ── RandomDice ──────────────────────────────────────────────────────────

RandomDice::RandomDice(uint64_t seed)
    : engine_(seed != 0 ? seed : std::random_device{}()) {}

EngineResult<int32_t> RandomDice::Roll(int32_t sides) {
    if (sides < 1) {
        return EngineResult<int32_t>::err(
            EngineError(ErrorCode::InvalidDiceExpression,
                        "die must have at least one side"));
    }
    std::uniform_int_distribution<int32_t> dist(1, sides);
    return EngineResult<int32_t>::ok(dist(engine_));
}

// ── ScriptedDice ────────────────────────────────────────────────────────

ScriptedDice::ScriptedDice(std::vector<int32_t> rolls)
    : rolls_(rolls.begin(), rolls.end()) {}

EngineResult<int32_t> ScriptedDice::Roll(int32_t sides) {
    if (rolls_.empty()) {
        return EngineResult<int32_t>::err(
            EngineError(ErrorCode::DiceSequenceExhausted,
                        "scripted dice sequence exhausted"));
    }
    auto value = rolls_.front();
    if (value < 1 || value > sides) {
        return EngineResult<int32_t>::err(
            EngineError(ErrorCode::RollOutOfRange,
                        "scripted roll " + std::to_string(value) +
                            " does not fit d" + std::to_string(sides)));
    }
    rolls_.pop_front();
    return EngineResult<int32_t>::ok(value);
}

// ── DiceExpression ──────────────────────────────────────────────────────

namespace {

EngineResult<DiceExpression> invalid(std::string_view text) {
    return EngineResult<DiceExpression>::err(
        EngineError(ErrorCode::InvalidDiceExpression,
                    "invalid dice notation: " + std::string(text)));
}

bool parseInt(std::string_view str, int32_t& out) {
    if (str.empty()) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), out);
    return ec == std::errc() && ptr == str.data() + str.size();
}

} // namespace

EngineResult<DiceExpression> DiceExpression::Parse(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            compact += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    std::string_view str = compact;
    if (str.empty()) {
        return invalid(text);
    }

    DiceExpression expr;

    auto dPos = str.find('d');
    if (dPos == std::string_view::npos) {
        // Flat amount, no dice.
        if (!parseInt(str, expr.modifier) || expr.modifier < 0 ||
            expr.modifier > kMaxModifier) {
            return invalid(text);
        }
        return EngineResult<DiceExpression>::ok(expr);
    }

    // Dice count ("d20" means one die).
    auto countStr = str.substr(0, dPos);
    if (countStr.empty()) {
        expr.count = 1;
    } else if (!parseInt(countStr, expr.count)) {
        return invalid(text);
    }

    // Sides, then an optional signed modifier.
    str.remove_prefix(dPos + 1);
    auto signPos = str.find_first_of("+-");
    if (!parseInt(str.substr(0, signPos), expr.sides)) {
        return invalid(text);
    }
    if (signPos != std::string_view::npos) {
        auto modStr = str.substr(signPos + 1);
        if (!parseInt(modStr, expr.modifier) || expr.modifier < 0 ||
            expr.modifier > kMaxModifier) {
            return invalid(text);
        }
        if (str[signPos] == '-') {
            expr.modifier = -expr.modifier;
        }
    }

    if (expr.count < 1 || expr.count > kMaxCount ||
        expr.sides < 2 || expr.sides > kMaxSides) {
        return invalid(text);
    }

    return EngineResult<DiceExpression>::ok(expr);
}

EngineResult<int32_t> DiceExpression::Roll(DiceSource& dice, bool critical) const {
    auto diceToRoll = critical ? count * 2 : count;
    int32_t total = 0;
    for (int32_t i = 0; i < diceToRoll; ++i) {
        auto roll = dice.Roll(sides);
        if (!roll) {
            return roll;
        }
        total += roll.value();
    }
    total += modifier;
    return EngineResult<int32_t>::ok(std::max(total, 0));
}

std::string DiceExpression::ToString() const {
    if (count == 0) {
        return std::to_string(modifier);
    }
    auto out = std::to_string(count) + "d" + std::to_string(sides);
    if (modifier > 0) {
        out += "+" + std::to_string(modifier);
    } else if (modifier < 0) {
        out += std::to_string(modifier);
    }
    return out;
}

}  // namespace dcc::combat
