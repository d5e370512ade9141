#ifndef FLIP7SIM_MATCH_HPP
#define FLIP7SIM_MATCH_HPP

#include <memory>
#include <optional>
#include <vector>
#include "Types.hpp"
#include "Actions.hpp"
#include "Deck.hpp"
#include "Player.hpp"
#include "Rules.hpp"
#include "State.hpp"
#include "Strategy.hpp"

namespace flip7::core::debug {struct Inspector;}
namespace flip7::core
{
    // One match: rounds until a seat reaches the target score. Strictly single-threaded.
    class Match
    {
    public:
        Match() = delete;
        Match(Config const& config,
              std::unique_ptr<Rules> rules,
              std::vector<Strategy> strategies);
        Match(Config const& config, std::vector<Strategy> strategies);

        // One turn for the current actor, dealing a new round first when needed.
        auto Step() -> MoveOutcome;
        // Steps until the current round (or the match) ends.
        auto PlayRound() -> MoveOutcome;
        // Plays to completion and returns the winning seat.
        auto Play() -> SeatIdxT;
        // Deals the next round if one is not already in progress. Step() calls this on demand.
        auto BeginRound() -> void;

        auto Snapshot() const -> MatchSnapshot;

        auto PlayerCount() const noexcept   -> size_t { return players_.size(); }
        auto PlayerAt(SeatIdxT seat) const -> Player const& { return players_.at(seat); }
        auto Players() const noexcept       -> std::vector<Player> const& { return players_; }
        auto Current() const noexcept       -> SeatIdxT { return current_idx_; }
        auto Dealer() const noexcept        -> SeatIdxT { return dealer_idx_; }
        auto RoundNumber() const noexcept   -> uint32_t { return round_number_; }
        auto PhaseNow() const noexcept      -> Phase { return phase_; }
        auto IsOver() const noexcept        -> bool { return phase_ == Phase::Over; }
        auto Winner() const noexcept        -> std::optional<SeatIdxT> { return winner_; }
        auto GetDeck() const noexcept       -> Deck const& { return deck_; }
        auto LastTurn() const noexcept      -> TurnRecord const& { return last_turn_; }
        auto GetConfig() const noexcept     -> Config const& { return cfg_; }

        //allows class to directly access private data on an instance
        friend class ClassicRules;
        friend struct debug::Inspector;

        auto ActiveCount() const noexcept -> size_t;
        // Next active seat after `from`; returns `from` when no other seat is active.
        auto NextActivePlayer(SeatIdxT from) const -> SeatIdxT;
        inline auto NextSeat(SeatIdxT const idx) const -> SeatIdxT { return static_cast<SeatIdxT>((idx + 1) % players_.size()); }
    private:
        Config cfg_;
        std::unique_ptr<Rules> rules_;
        std::vector<Strategy> strategies_;
        std::vector<Player> players_;
        Deck deck_;

        // Turn/round state
        SeatIdxT current_idx_{0}, dealer_idx_{0};
        uint32_t round_number_{1};
        uint32_t turns_this_round_{0};
        Phase    phase_{Phase::Dealing};
        std::optional<SeatIdxT> winner_{};
        TurnRecord last_turn_{};
    };
}
#endif //FLIP7SIM_MATCH_HPP
