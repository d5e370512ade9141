#include "ClassicRules.hpp"

#include <print>
#include <utility>

#include "Match.hpp"
#include "Strategy.hpp"
#include "Util.hpp"

namespace flip7::core
{
    auto ClassicRules::StartRound(Match& match) -> void
    {
        if (match.cfg_.verbose)
        {
            std::print("\n=== ROUND {} ===\n", match.round_number_);
            std::print("Dealer: {}\n", match.players_[match.dealer_idx_].Name());
        }

        for (Player& p : match.players_)
        {
            p.ResetForRound();
        }
        //opening card in seat order, a single card can never bust
        for (Player& p : match.players_)
        {
            p.Receive(match.deck_.Draw());
        }
    }

    auto ClassicRules::PlayTurn(Match& match, TurnRecord& rec) -> bool
    {
        Config const& cfg = match.cfg_;
        Player& player = match.players_.at(match.current_idx_);
        Hand const& hand = player.GetHand();

        rec.numbers_before = hand.NumberCount();
        if (!player.IsActive())
        {
            rec.result = TurnResult::Skipped;
            return false;
        }

        if (hand.HasFlip7())
        {
            player.BankFlip7(cfg.flip7_bonus);
            rec.result = TurnResult::Flip7;
            rec.round_score = player.RoundScore();
            if (cfg.verbose) std::print("  {} achieved FLIP 7! Score: {}\n", player.Name(), player.RoundScore());
            return true;
        }

        // runaway guard for strategies that never stay
        if (hand.NumberCount() >= cfg.forced_stay_numbers)
        {
            player.Stay();
            rec.result = TurnResult::ForcedStay;
            rec.round_score = player.RoundScore();
            if (cfg.verbose)
                std::print("  {} forced to STAY ({}+ cards) with {} points\n", player.Name(),
                           cfg.forced_stay_numbers, player.RoundScore());
            return false;
        }

        bool const hit = ShouldHit(match.strategies_[match.current_idx_], player, match.Snapshot());
        if (!hit)
        {
            rec.decision = Decision::Stay;
            player.Stay();
            rec.result = TurnResult::Stayed;
            rec.round_score = player.RoundScore();
            if (cfg.verbose) std::print("  {} STAYS with {} points\n", player.Name(), player.RoundScore());
            return false;
        }

        rec.decision = Decision::Hit;
        rec.triple_draw = player.HasFlipThreePending();
        size_t const draws = rec.triple_draw ? constants::FlipThreeDraws : 1;
        if (cfg.verbose) std::print("  {} HITS (drawing {} card(s))", player.Name(), draws);

        for (size_t i{}; i < draws; ++i)
        {
            CardSP card = match.deck_.Draw();
            rec.drawn.push_back(util::Describe(*card));

            if (hand.WouldBust(*card))
            {
                if (player.HasSecondChance())
                {
                    player.ConsumeSecondChance();
                    rec.second_chance_used = true;
                    if (cfg.verbose) std::print(" drew {} (SECOND CHANCE USED!)", rec.drawn.back());
                    match.deck_.Discard(std::move(card));
                    continue;
                }
                //the busting card leaves play, it is not discarded
                player.Bust();
                rec.result = TurnResult::Busted;
                rec.round_score = 0;
                if (cfg.verbose) std::print(" drew {} - BUST!\n", rec.drawn.back());
                return false;
            }

            player.Receive(std::move(card));
            if (cfg.verbose) std::print(" {}", rec.drawn.back());
        }
        if (cfg.verbose) std::print(" (score: {})\n", hand.Score());

        if (hand.HasFlip7())
        {
            player.BankFlip7(cfg.flip7_bonus);
            rec.result = TurnResult::Flip7;
            rec.round_score = player.RoundScore();
            if (cfg.verbose) std::print("  {} achieved FLIP 7! Score: {}\n", player.Name(), player.RoundScore());
            return true;
        }

        if (rec.triple_draw) player.ClearFlipThree();
        rec.result = TurnResult::Drew;
        return false;
    }

    auto ClassicRules::Advance(Match& match) -> MoveOutcome
    {
        for (Player& p : match.players_)
        {
            p.AddRoundToTotal();
            if (match.cfg_.verbose)
                std::print("{}: +{} (Total: {})\n", p.Name(), p.RoundScore(), p.TotalScore());
        }

        for (Player const& p : match.players_)
        {
            if (p.TotalScore() >= match.cfg_.target_score)
            {
                match.winner_ = p.Seat();
                match.phase_ = Phase::Over;
                if (match.cfg_.verbose) std::print("\n{} WINS with {} points!\n", p.Name(), p.TotalScore());
                return MoveOutcome::MatchEnded;
            }
        }

        ++match.round_number_;
        match.dealer_idx_ = match.NextSeat(match.dealer_idx_);
        match.current_idx_ = match.NextSeat(match.dealer_idx_);
        match.phase_ = Phase::Dealing;
        return MoveOutcome::RoundEnded;
    }
}
