#include "Hand.hpp"

#include <utility>

#include "Exception.hpp"

namespace flip7::core
{
    auto Hand::Add(CardSP card) -> void
    {
        F7_ASSERT(card != nullptr, "Adding a null card to a hand");
        if (card->IsNumber())
        {
            F7_ASSERT(card->value <= constants::MaxNumberValue, "Number card value above 12");
            values_.Add(card->value);
            ++numbers_;
        }
        cards_.push_back(std::move(card));
    }

    auto Hand::Clear() noexcept -> void
    {
        cards_.clear();
        values_.Clear();
        numbers_ = 0;
    }

    auto Hand::NumberValues() const -> std::vector<uint8_t>
    {
        std::vector<uint8_t> out;
        out.reserve(numbers_);
        for (CardSP const& c : cards_)
        {
            if (c->IsNumber()) out.push_back(c->value);
        }
        return out;
    }

    auto Hand::WouldBust(Card const& card) const noexcept -> bool
    {
        return card.IsNumber() && values_.Contains(card.value);
    }

    auto Hand::HasFlip7() const noexcept -> bool
    {
        return values_.Size() == constants::Flip7Distinct;
    }

    auto Hand::Score(bool const is_flip7, int const flip7_bonus) const -> int
    {
        int total{};
        for (CardSP const& c : cards_)
        {
            if (c->IsNumber()) total += c->value;
        }
        //multipliers apply before any flat bonus
        for (CardSP const& c : cards_)
        {
            if (c->Is(ModifierKind::Multiply)) total *= c->amount;
        }
        for (CardSP const& c : cards_)
        {
            if (c->Is(ModifierKind::Add)) total += c->amount;
        }
        if (is_flip7) total += flip7_bonus;
        return total;
    }
}
