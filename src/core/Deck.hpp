#ifndef FLIP7SIM_DECK_HPP
#define FLIP7SIM_DECK_HPP

#include <random>
#include <vector>
#include "Types.hpp"

namespace flip7::core::debug {struct Inspector;}
namespace flip7::core
{
    // Draw pile plus discard pile. Owns the match's random source.
    class Deck
    {
    public:
        Deck() = delete;
        explicit Deck(std::mt19937_64 rng);

        // Replaces the contents with copies of the base deck scaled to player count, shuffled.
        auto Build(size_t n_players) -> void;

        // Never fails: reshuffles the discard pile, then synthesizes an emergency deck if needed.
        auto Draw() -> CardSP;
        auto Discard(CardSP card) -> void;

        auto Size() const noexcept          -> size_t { return cards_.size(); }
        auto DiscardSize() const noexcept   -> size_t { return discard_.size(); }
        auto BuiltCount() const noexcept    -> size_t { return built_; }
        auto Synthesized() const noexcept   -> size_t { return synthesized_; }
        auto Reshuffles() const noexcept    -> size_t { return reshuffles_; }
        auto EmergencyRefills() const noexcept -> size_t { return emergency_refills_; }

        static auto CopiesFor(size_t n_players) noexcept -> size_t;
        static auto AppendBaseCopy(std::vector<CardSP>& out) -> void;
        static auto AppendEmergencyCopy(std::vector<CardSP>& out) -> void;

        friend struct debug::Inspector;
    private:
        auto Refill() -> void;
    private:
        std::mt19937_64 rng_;
        std::vector<CardSP> cards_;      // back() is the top of the pile
        std::vector<CardSP> discard_;

        size_t built_{0};
        size_t synthesized_{0};
        size_t reshuffles_{0};
        size_t emergency_refills_{0};
    };
}

#endif //FLIP7SIM_DECK_HPP
