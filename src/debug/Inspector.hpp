#ifndef FLIP7SIM_INSPECTOR_HPP
#define FLIP7SIM_INSPECTOR_HPP

#include <algorithm>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <utility>

#include "../core/Types.hpp"
#include "../core/Match.hpp"

namespace flip7::core::debug
{
    struct Inspector
    {
        struct SnapshotAll
        {
            std::vector<Card const*> deck;
            std::vector<Card const*> discard;
            std::vector<std::vector<Card const*>> hands;
            uint8_t n_players{};
            Phase phase{};

            SeatIdxT current_idx{}, dealer_idx{};
            size_t built{};
            size_t synthesized{};
        };

        static inline auto Gather(Match const& m) -> SnapshotAll
        {
            auto raw = [](CardSP const& c) -> Card const* { return c.get(); };

            SnapshotAll ret{};
            ret.n_players = static_cast<uint8_t>(m.players_.size());
            ret.phase = m.phase_;
            ret.current_idx = m.current_idx_;
            ret.dealer_idx = m.dealer_idx_;
            ret.built = m.deck_.built_;
            ret.synthesized = m.deck_.synthesized_;
            ret.hands.resize(m.players_.size());

            for (size_t i{}; i < m.players_.size(); ++i)
            {
                std::vector<CardSP> const& src = m.players_[i].GetHand().Cards();
                std::vector<Card const*>& dst = ret.hands[i];
                dst.reserve(src.size());
                std::ranges::transform(src, std::back_inserter(dst), raw);
            }

            ret.deck.reserve(m.deck_.cards_.size());
            std::ranges::transform(std::as_const(m.deck_.cards_), std::back_inserter(ret.deck), raw);

            ret.discard.reserve(m.deck_.discard_.size());
            std::ranges::transform(std::as_const(m.deck_.discard_), std::back_inserter(ret.discard), raw);

            return ret;
        }

#if F7_ENABLE_TEST_HOOKS == true
        // Replaces the draw pile; draw_order.front() is drawn first.
        static inline auto Stack(Deck& d, std::vector<CardSP> draw_order) -> void
        {
            std::ranges::reverse(draw_order);
            d.built_ += draw_order.size();
            d.cards_ = std::move(draw_order);
        }

        static inline auto StackDeck(Match& m, std::vector<CardSP> draw_order) -> void
        {
            Stack(m.deck_, std::move(draw_order));
        }

        static inline auto SetDiscard(Match& m, std::vector<CardSP> cards) -> void
        {
            m.deck_.built_ += cards.size();
            m.deck_.discard_ = std::move(cards);
        }

        // Hands a card to a seat as if it had been drawn safely.
        static inline auto Give(Match& m, SeatIdxT seat, CardSP card) -> void
        {
            m.deck_.built_ += 1;
            m.players_.at(seat).Receive(std::move(card));
        }

        static inline auto SetCurrent(Match& m, SeatIdxT seat) -> void
        {
            m.current_idx_ = seat;
        }
#endif
    };
}

#endif //FLIP7SIM_INSPECTOR_HPP
