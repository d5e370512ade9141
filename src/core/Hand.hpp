#ifndef FLIP7SIM_HAND_HPP
#define FLIP7SIM_HAND_HPP

#include <vector>
#include "Types.hpp"
#include "Util.hpp"

namespace flip7::core
{
    // Cards a player drew this round, in draw order, plus the scoring rules over them.
    class Hand
    {
    public:
        auto Add(CardSP card) -> void;
        // Drops every card. Round-end hands are not routed to the discard pile.
        auto Clear() noexcept -> void;

        auto Cards() const noexcept -> std::vector<CardSP> const& { return cards_; }
        auto Size() const noexcept -> size_t { return cards_.size(); }
        auto NumberValues() const -> std::vector<uint8_t>;
        auto NumberCount() const noexcept -> size_t { return numbers_; }
        auto DistinctCount() const noexcept -> int { return values_.Size(); }
        // Sum of distinct number values; drives the bust estimate.
        auto DistinctValueSum() const noexcept -> int { return values_.Sum(); }

        [[nodiscard]] auto WouldBust(Card const& card) const noexcept -> bool;
        [[nodiscard]] auto HasFlip7() const noexcept -> bool;

        // sum -> each multiplier in hand order -> each add in hand order -> bonus
        [[nodiscard]] auto Score(bool is_flip7 = false, int flip7_bonus = constants::Flip7Bonus) const -> int;

    private:
        std::vector<CardSP> cards_;
        util::ValueSet values_;
        size_t numbers_{0};
    };
}

#endif //FLIP7SIM_HAND_HPP
