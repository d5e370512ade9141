#ifndef FLIP7SIM_UTIL_HPP
#define FLIP7SIM_UTIL_HPP

#include <bit>
#include <cstdint>
#include <format>
#include <string>
#include "Types.hpp"

namespace flip7::core::util
{
    // Bitmask of the number values 0..12 seen so far.
    class ValueSet
    {
    public:
        ValueSet():
            values_(0), contains_dup_(false) {}
        auto Add(uint8_t v) -> void
        {
            uint16_t const bit = static_cast<uint16_t>(uint16_t{1} << v);
            contains_dup_ |= static_cast<bool>(values_ & bit);
            values_ |= bit;
        }
        [[nodiscard]]
        auto Contains(uint8_t v) const noexcept -> bool
        {
            return (values_ >> v) & 1u;
        }
        [[nodiscard]]
        auto Size() const noexcept -> int
        {
            return std::popcount(values_);
        }
        [[nodiscard]]
        auto Sum() const noexcept -> int
        {
            int sum{};
            for (uint8_t v{}; v <= constants::MaxNumberValue; ++v)
            {
                if (Contains(v)) sum += v;
            }
            return sum;
        }
        [[nodiscard]]
        auto ContainsDup() const noexcept -> bool
        {
            return contains_dup_;
        }
        auto Clear() noexcept -> void
        {
            values_ = 0;
            contains_dup_ = false;
        }
    private:
        uint16_t values_;
        bool contains_dup_;
    };

    inline auto Describe(Card const& c) -> std::string
    {
        switch (c.kind)
        {
        case CardKind::Number:
            return std::format("[{}]", c.value);
        case CardKind::Modifier:
            return c.modifier == ModifierKind::Multiply ? std::format("[x{}]", c.amount)
                                                        : std::format("[+{}]", c.amount);
        case CardKind::Action:
            switch (c.action)
            {
            case ActionKind::Freeze: return "[freeze]";
            case ActionKind::FlipThree: return "[flipThree]";
            case ActionKind::SecondChance: return "[secondChance]";
            }
        }
        return "[?]";
    }

    // splitmix64 finaliser; derives independent per-match seeds from a base seed
    inline constexpr auto MixSeed(uint64_t base, uint64_t stream) noexcept -> uint64_t
    {
        uint64_t z = base + (stream + 1) * 0x9E3779B97F4A7C15ULL;
        z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
        z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
        return z ^ (z >> 31);
    }
}

#endif //FLIP7SIM_UTIL_HPP
