#include "Deck.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include "Exception.hpp"

namespace flip7::core
{
    Deck::Deck(std::mt19937_64 rng) :
        rng_(std::move(rng))
    {
    }

    auto Deck::CopiesFor(size_t const n_players) noexcept -> size_t
    {
        // ceil((n + 2) / 3)
        return std::max(constants::MinDeckCopies, (n_players + 4) / 3);
    }

    auto Deck::AppendBaseCopy(std::vector<CardSP>& out) -> void
    {
        //one zero, then v copies of each v
        for (uint8_t v{}; v <= constants::MaxNumberValue; ++v)
        {
            uint8_t const copies = v > 0 ? v : 1;
            for (uint8_t i{}; i < copies; ++i)
                out.emplace_back(MakeCard(Card::Number(v)));
        }

        constexpr std::array<uint8_t, 5> add_amounts{2, 4, 6, 8, 10};
        for (uint8_t const amount : add_amounts)
        {
            for (int i{}; i < 3; ++i)
                out.emplace_back(MakeCard(Card::Modifier(ModifierKind::Add, amount)));
        }
        out.emplace_back(MakeCard(Card::Modifier(ModifierKind::Multiply, 2)));

        for (ActionKind const a : {ActionKind::Freeze, ActionKind::FlipThree, ActionKind::SecondChance})
        {
            for (int i{}; i < 3; ++i)
                out.emplace_back(MakeCard(Card::Action(a)));
        }
    }

    auto Deck::AppendEmergencyCopy(std::vector<CardSP>& out) -> void
    {
        for (uint8_t v{}; v <= constants::MaxNumberValue; ++v)
        {
            int const copies = std::max(1, v / 2);
            for (int i{}; i < copies; ++i)
                out.emplace_back(MakeCard(Card::Number(v)));
        }
    }

    auto Deck::Build(size_t const n_players) -> void
    {
        cards_.clear();
        discard_.clear();
        size_t const copies = CopiesFor(n_players);
        for (size_t i{}; i < copies; ++i)
        {
            AppendBaseCopy(cards_);
        }
        built_ = cards_.size();
        synthesized_ = 0;
        reshuffles_ = 0;
        emergency_refills_ = 0;
        std::ranges::shuffle(cards_, rng_);
    }

    auto Deck::Refill() -> void
    {
        if (!discard_.empty())
        {
            cards_ = std::exchange(discard_, {});
            std::ranges::shuffle(cards_, rng_);
            ++reshuffles_;
            return;
        }

        AppendEmergencyCopy(cards_);
        synthesized_ += cards_.size();
        ++emergency_refills_;
        std::ranges::shuffle(cards_, rng_);
    }

    auto Deck::Draw() -> CardSP
    {
        if (cards_.empty()) Refill();
        F7_ASSERT(!cards_.empty(), "Deck empty after refill");

        CardSP card = std::move(cards_.back());
        cards_.pop_back();
        return card;
    }

    auto Deck::Discard(CardSP card) -> void
    {
        F7_ASSERT(card != nullptr, "Discarding a null card");
        discard_.push_back(std::move(card));
    }
}
