#include "AuditLogger.hpp"

#include <format>
#include <string_view>
#include <utility>

#include "../core/Util.hpp"

using namespace flip7::core;

namespace
{

auto s_decision(Decision const d) -> std::string_view
{
    switch (d)
    {
        case Decision::None: return "-";
        case Decision::Hit:  return "Hit";
        case Decision::Stay: return "Stay";
    }
    return "?";
}

auto s_result(TurnResult const r) -> std::string_view
{
    switch (r)
    {
        case TurnResult::Skipped:    return "Skipped";
        case TurnResult::Drew:       return "Drew";
        case TurnResult::Stayed:     return "Stayed";
        case TurnResult::ForcedStay: return "ForcedStay";
        case TurnResult::Busted:     return "Busted";
        case TurnResult::Flip7:      return "Flip7";
    }
    return "?";
}

auto serialize_draws(TurnRecord const& rec) -> std::string
{
    std::string body;
    for (size_t i{}; i < rec.drawn.size(); ++i)
    {
        body += (i ? "," : "");
        body += rec.drawn[i];
    }
    return body;
}

auto serialize_hand(Hand const& hand) -> std::string
{
    std::string body;
    bool first = true;
    for (CardSP const& c : hand.Cards())
    {
        body += (first ? "" : ",");
        first = false;
        body += util::Describe(*c);
    }
    return body;
}

} // anonymous namespace

namespace flip7::core::debug
{

AuditLogger::AuditLogger(std::string path)
    : out_(std::move(path), std::ios::out | std::ios::trunc)
{
}

AuditLogger::~AuditLogger() = default;

auto AuditLogger::start(Match const& match, uint64_t seed) -> void
{
    out_ << std::format("Seed={}\n", seed);
    out_ << std::format("Players={}\n", match.PlayerCount());
    for (Player const& p : match.Players())
    {
        out_ << std::format("Seat P{}={}\n", static_cast<int>(p.Seat()), p.Name());
    }
    out_ << std::format("Deck={}\n", match.GetDeck().Size());
    out_.flush();
}

auto AuditLogger::turn(TurnRecord const& rec, Match const& match) -> void
{
    Player const& p = match.PlayerAt(rec.seat);
    out_ << std::format(
        "Turn round={} actor=P{} numbers={} decision={} triple={} draws=[{}] sc_used={}\n",
        rec.round,
        static_cast<int>(rec.seat),
        rec.numbers_before,
        s_decision(rec.decision),
        rec.triple_draw ? "y" : "n",
        serialize_draws(rec),
        rec.second_chance_used ? "y" : "n"
    );
    out_ << std::format("Result: {} score={} hand=[{}]\n",
                        s_result(rec.result), rec.round_score, serialize_hand(p.GetHand()));
}

auto AuditLogger::outcome(MoveOutcome m) -> void
{
    char const* txt =
        (m == MoveOutcome::Applied    ? "Applied" :
        (m == MoveOutcome::RoundEnded ? "RoundEnded" : "MatchEnded"));
    out_ << std::format("Outcome: {}\n", txt);
}

auto AuditLogger::round(Match const& match) -> void
{
    std::string body;
    for (Player const& p : match.Players())
    {
        body += std::format(
            "{}{}:{}(+{})",
            (p.Seat() ? "," : ""),
            static_cast<int>(p.Seat()),
            p.TotalScore(),
            p.RoundScore()
        );
    }

    out_ << std::format("Totals: [{}] deck={} discard={} refills={}\n",
                        body,
                        match.GetDeck().Size(),
                        match.GetDeck().DiscardSize(),
                        match.GetDeck().EmergencyRefills());
}

auto AuditLogger::end(Match const& match) -> void
{
    int const winner = match.Winner() ? static_cast<int>(*match.Winner()) : -1;

    out_ << std::format("Winner={} rounds={}\n", winner, match.RoundNumber());
    out_.flush();
}

} // namespace flip7::core::debug
