#ifndef FLIP7SIM_TYPES_HPP
#define FLIP7SIM_TYPES_HPP

#define F7_ENABLE_TEST_HOOKS true

#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <cstddef>

namespace flip7::core
{
    using SeatIdxT = uint8_t;
}

namespace flip7::core::constants
{
    inline constexpr uint8_t MaxNumberValue = 12;
    // sum of 0..12, the number-card mass of a single deck copy
    inline constexpr int NumberMassPerCopy = 78;
    inline constexpr int Flip7Distinct = 7;
    inline constexpr int Flip7Bonus = 15;
    inline constexpr int TargetScore = 200;
    inline constexpr uint32_t MaxTurnsPerRound = 100;
    inline constexpr size_t ForcedStayNumberCards = 10;
    inline constexpr size_t FlipThreeDraws = 3;
    inline constexpr size_t MinDeckCopies = 2;
    // every seat must be addressable by SeatIdxT
    inline constexpr size_t MaxSeats = std::numeric_limits<SeatIdxT>::max();
}

namespace flip7::core
{
    enum class CardKind : uint8_t
    {
        Number = 0,
        Action,
        Modifier
    };

    enum class ActionKind : uint8_t
    {
        Freeze = 0,
        FlipThree,
        SecondChance
    };

    enum class ModifierKind : uint8_t
    {
        Add = 0,
        Multiply
    };

    // Built once by the deck and never mutated. Ownership moves deck -> hand -> discard,
    // so copies are disabled.
    struct Card
    {
        Card() = delete;

        static auto Number(uint8_t value) -> Card { return Card{CardKind::Number, value, {}, {}, 0}; }
        static auto Action(ActionKind action) -> Card { return Card{CardKind::Action, 0, action, {}, 0}; }
        static auto Modifier(ModifierKind modifier, uint8_t amount) -> Card
        {
            return Card{CardKind::Modifier, 0, {}, modifier, amount};
        }

        [[nodiscard]] auto IsNumber() const noexcept -> bool { return kind == CardKind::Number; }
        [[nodiscard]] auto IsAction() const noexcept -> bool { return kind == CardKind::Action; }
        [[nodiscard]] auto IsModifier() const noexcept -> bool { return kind == CardKind::Modifier; }
        [[nodiscard]] auto Is(ActionKind a) const noexcept -> bool { return IsAction() && action == a; }
        [[nodiscard]] auto Is(ModifierKind m) const noexcept -> bool { return IsModifier() && modifier == m; }

        CardKind const kind;
        uint8_t const value;          // Number only
        ActionKind const action;      // Action only
        ModifierKind const modifier;  // Modifier only
        uint8_t const amount;         // Modifier only
        ///////////////////////////////////
        Card(Card const&) = delete;
        auto operator=(Card const&) -> Card& = delete;
        Card(Card&&) = default;

    private:
        Card(CardKind k, uint8_t v, ActionKind a, ModifierKind m, uint8_t amt) :
            kind(k), value(v), action(a), modifier(m), amount(amt) {}
    };

    using CardSP = std::shared_ptr<Card const>;

    inline auto MakeCard(Card&& c) -> CardSP { return std::make_shared<Card const>(std::move(c)); }

    struct Config
    {
        uint64_t seed{std::random_device{}()};
        int      target_score{constants::TargetScore};
        int      flip7_bonus{constants::Flip7Bonus};
        uint32_t max_turns_per_round{constants::MaxTurnsPerRound};
        size_t   forced_stay_numbers{constants::ForcedStayNumberCards};
        // narrate every turn to stdout
        bool     verbose{false};
    };
}

#endif //FLIP7SIM_TYPES_HPP
