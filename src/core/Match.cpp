#include "Match.hpp"

#include <algorithm>
#include <utility>

#include "ClassicRules.hpp"
#include "Exception.hpp"

namespace flip7::core
{
    static auto CheckSeats(std::vector<Strategy> const& strategies) -> error::ConfigResult
    {
        using CVC = ::flip7::core::error::ConfigViolationCode;
        if (strategies.empty())
            return std::unexpected(error::ConfigViolation{.code = CVC::NoStrategies});
        if (strategies.size() > constants::MaxSeats)
            return std::unexpected(error::ConfigViolation{.code = CVC::TooManySeats}.with_count(strategies.size()));
        for (Strategy const& s : strategies)
        {
            if (auto r = Check(s); !r.has_value()) return r;
        }
        return {};
    }

    Match::Match(Config const& config,
                 std::unique_ptr<Rules> rules,
                 std::vector<Strategy> strategies) :
        cfg_(config),
        rules_(std::move(rules)),
        strategies_(std::move(strategies)),
        deck_(std::mt19937_64{cfg_.seed})
    {
        error::require(CheckSeats(strategies_));
        F7_ASSERT(rules_ != nullptr, "Null rules while initialising match");

        players_.reserve(strategies_.size());
        for (size_t i{}; i < strategies_.size(); ++i)
        {
            players_.emplace_back(static_cast<SeatIdxT>(i), NameOf(strategies_[i]));
        }

        deck_.Build(players_.size());
        F7_ASSERT(deck_.Size() > 0, "Empty deck after building match deck");
        dealer_idx_ = 0;
        current_idx_ = NextSeat(dealer_idx_);
    }

    Match::Match(Config const& config, std::vector<Strategy> strategies) :
        Match(config, std::make_unique<ClassicRules>(), std::move(strategies))
    {
    }

    auto Match::ActiveCount() const noexcept -> size_t
    {
        return static_cast<size_t>(std::ranges::count_if(players_, [](Player const& p) { return p.IsActive(); }));
    }

    auto Match::NextActivePlayer(SeatIdxT const from) const -> SeatIdxT
    {
        SeatIdxT i{from};
        size_t const n = players_.size();
        for (size_t j{}; j < n; ++j)
        {
            i = NextSeat(i);
            if (players_[i].IsActive()) return i;
        }
        return from;
    }

    auto Match::Snapshot() const -> MatchSnapshot
    {
        MatchSnapshot snap{};
        snap.n_players = static_cast<uint8_t>(players_.size());
        snap.n_active = static_cast<uint8_t>(ActiveCount());
        snap.deck_size = deck_.Size();
        snap.discard_size = deck_.DiscardSize();
        snap.round_number = round_number_;
        snap.dealer_idx = dealer_idx_;
        snap.players = players_;
        return snap;
    }

    auto Match::BeginRound() -> void
    {
        if (phase_ == Phase::Over)
            F7_THROW(error::Code::State, "Cannot begin a round after the match ended");
        if (phase_ == Phase::Playing) return;

        rules_->StartRound(*this);
        turns_this_round_ = 0;
        phase_ = Phase::Playing;
    }

    auto Match::Step() -> MoveOutcome
    {
        BeginRound();

        last_turn_ = TurnRecord{};
        last_turn_.seat = current_idx_;
        last_turn_.round = round_number_;

        bool const flip7_ended = rules_->PlayTurn(*this, last_turn_);
        ++turns_this_round_;

        if (flip7_ended || ActiveCount() == 0 || turns_this_round_ >= cfg_.max_turns_per_round)
        {
            return rules_->Advance(*this);
        }

        current_idx_ = NextActivePlayer(current_idx_);
        return MoveOutcome::Applied;
    }

    auto Match::PlayRound() -> MoveOutcome
    {
        MoveOutcome out = Step();
        while (out == MoveOutcome::Applied)
        {
            out = Step();
        }
        return out;
    }

    auto Match::Play() -> SeatIdxT
    {
        while (PlayRound() != MoveOutcome::MatchEnded)
        {
        }
        F7_ASSERT(winner_.has_value(), "Match ended without a winner");
        return *winner_;
    }
}
