#ifndef FLIP7SIM_STATE_HPP
#define FLIP7SIM_STATE_HPP

#include <span>
#include "Player.hpp"
#include "Types.hpp"

namespace flip7::core
{
    // Immutable view of the table handed to strategies. Valid until the match next changes.
    struct MatchSnapshot
    {
        uint8_t n_players{};
        uint8_t n_active{};
        size_t deck_size{};
        size_t discard_size{};
        uint32_t round_number{};
        SeatIdxT dealer_idx{};

        std::span<Player const> players{};
    };

} // namespace flip7::core

#endif //FLIP7SIM_STATE_HPP
