#include "Player.hpp"

#include <utility>

#include "Exception.hpp"

namespace flip7::core
{
    Player::Player(SeatIdxT const seat, std::string name) :
        seat_(seat),
        name_(std::move(name))
    {
    }

    auto Player::ResetForRound() noexcept -> void
    {
        hand_.Clear();
        round_score_ = 0;
        status_ = RoundStatus::Active;
        second_chance_ = false;
        flip_three_pending_ = false;
    }

    auto Player::Receive(CardSP card) -> void
    {
        F7_ASSERT(card != nullptr, "Received a null card");
        if (card->Is(ActionKind::SecondChance)) second_chance_ = true;
        else if (card->Is(ActionKind::FlipThree)) flip_three_pending_ = true;
        // Freeze is held but has no effect on opponents.
        hand_.Add(std::move(card));
    }

    auto Player::ConsumeSecondChance() -> void
    {
        F7_ASSERT(second_chance_, "Consuming a Second Chance that is not held");
        second_chance_ = false;
    }

    auto Player::Stay() -> void
    {
        F7_ASSERT(IsActive(), "Inactive player cannot stay");
        round_score_ = hand_.Score();
        status_ = RoundStatus::Stayed;
    }

    auto Player::Bust() -> void
    {
        F7_ASSERT(IsActive(), "Inactive player cannot bust");
        round_score_ = 0;
        status_ = RoundStatus::Busted;
        ++busts_;
    }

    auto Player::BankFlip7(int const bonus) -> void
    {
        F7_ASSERT(IsActive(), "Inactive player cannot bank a Flip 7");
        round_score_ = hand_.Score(true, bonus);
        status_ = RoundStatus::Flip7;
        ++flip7s_;
    }
}
