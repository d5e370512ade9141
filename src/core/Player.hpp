#ifndef FLIP7SIM_PLAYER_HPP
#define FLIP7SIM_PLAYER_HPP

#include <string>
#include "Hand.hpp"
#include "Types.hpp"

namespace flip7::core
{
    enum class RoundStatus : uint8_t
    {
        Active,
        Busted,
        Stayed,
        Flip7
    };

    class Player
    {
    public:
        Player(SeatIdxT seat, std::string name);

        auto Seat() const noexcept -> SeatIdxT { return seat_; }
        auto Name() const noexcept -> std::string const& { return name_; }
        auto GetHand() const noexcept -> Hand const& { return hand_; }
        auto TotalScore() const noexcept -> int { return total_score_; }
        auto RoundScore() const noexcept -> int { return round_score_; }
        auto Status() const noexcept -> RoundStatus { return status_; }
        auto IsActive() const noexcept -> bool { return status_ == RoundStatus::Active; }
        auto HasBusted() const noexcept -> bool { return status_ == RoundStatus::Busted; }
        auto HasSecondChance() const noexcept -> bool { return second_chance_; }
        auto HasFlipThreePending() const noexcept -> bool { return flip_three_pending_; }
        // Across every round of the match so far.
        auto Busts() const noexcept -> uint32_t { return busts_; }
        auto Flip7s() const noexcept -> uint32_t { return flip7s_; }

        // Clears hand, flags and round score. Total score is kept.
        auto ResetForRound() noexcept -> void;

        // Takes ownership of a card that did not bust; action cards raise their flag.
        auto Receive(CardSP card) -> void;
        auto ConsumeSecondChance() -> void;
        auto ClearFlipThree() noexcept -> void { flip_three_pending_ = false; }

        // Terminal transitions for the round.
        auto Stay() -> void;
        auto Bust() -> void;
        auto BankFlip7(int bonus) -> void;

        auto AddRoundToTotal() noexcept -> void { total_score_ += round_score_; }

    private:
        SeatIdxT seat_;
        std::string name_;
        Hand hand_;

        int total_score_{0};
        int round_score_{0};
        RoundStatus status_{RoundStatus::Active};
        bool second_chance_{false};
        bool flip_three_pending_{false};

        uint32_t busts_{0};
        uint32_t flip7s_{0};
    };
}
#endif //FLIP7SIM_PLAYER_HPP
