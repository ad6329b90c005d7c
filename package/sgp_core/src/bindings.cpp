#include "sgp_core/errors.hpp"
#include "sgp_core/log.hpp"
#include "sgp_core/player.hpp"
#include "sgp_core/positions.hpp"
#include "sgp_core/recalc.hpp"
#include "sgp_core/session.hpp"
#include "sgp_core/settings.hpp"
#include "sgp_core/snake.hpp"
#include "sgp_core/surplus.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/chrono.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/set.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
using namespace sgp_core;

// The NB_MODULE macro defines the entry point for the Python module.
NB_MODULE(_sgp_core, m) {
  m.doc() = "Auction valuation engine for rotisserie drafts.";

  nb::exception<ConfigurationError>(m, "ConfigurationError", PyExc_ValueError);
  nb::exception<DraftError>(m, "DraftError", PyExc_ValueError);
  nb::exception<TransactionConflict>(m, "TransactionConflict",
                                     PyExc_RuntimeError);

  nb::enum_<LogLevel>(m, "LogLevel")
      .value("Debug", LogLevel::Debug)
      .value("Info", LogLevel::Info)
      .value("Warn", LogLevel::Warn)
      .value("Error", LogLevel::Error)
      .value("Off", LogLevel::Off);
  m.def("set_log_level", &set_log_level);

  nb::enum_<PlayerType>(m, "PlayerType")
      .value("Hitter", PlayerType::Hitter)
      .value("Pitcher", PlayerType::Pitcher);

  nb::enum_<CategoryKind>(m, "CategoryKind")
      .value("Counting", CategoryKind::Counting)
      .value("Rate", CategoryKind::Rate)
      .value("Ratio", CategoryKind::Ratio);

  nb::enum_<DraftType>(m, "DraftType")
      .value("Auction", DraftType::Auction)
      .value("Snake", DraftType::Snake);

  nb::enum_<ReplacementMode>(m, "ReplacementMode")
      .value("Global", ReplacementMode::Global)
      .value("Positional", ReplacementMode::Positional);

  nb::class_<CategorySpec>(m, "CategorySpec")
      .def(nb::init<>())
      .def(nb::init<std::string, CategoryKind>())
      .def_rw("name", &CategorySpec::name)
      .def_rw("kind", &CategorySpec::kind)
      .def("__repr__", [](const CategorySpec &c) {
        return fmt::format("CategorySpec(name={}, kind={})", c.name,
                           to_string(c.kind));
      });

  nb::class_<StatLine>(m, "StatLine")
      .def(nb::init<>())
      .def(nb::init<std::unordered_map<std::string, double>, double>(),
           nb::arg("values"), nb::arg("playing_time"))
      .def("get", &StatLine::get)
      .def("has", &StatLine::has)
      .def("playing_time", &StatLine::playing_time)
      .def("values", &StatLine::values);

  nb::class_<Valuation>(m, "Valuation")
      .def(nb::init<>())
      .def_ro("sgp", &Valuation::sgp)
      .def_ro("sgp_breakdown", &Valuation::sgp_breakdown)
      .def_ro("dollar_value", &Valuation::dollar_value)
      .def_ro("baseline_key", &Valuation::baseline_key)
      .def_ro("epoch", &Valuation::epoch)
      .def("__repr__", [](const Valuation &v) {
        return fmt::format("Valuation(sgp={:.3f}, dollar_value={:.2f}, "
                           "baseline={}, epoch={})",
                           v.sgp, v.dollar_value, v.baseline_key, v.epoch);
      });

  // Player
  nb::class_<Player>(m, "Player")
      .def(nb::init<>())
      .def(nb::init<std::int64_t, std::string, std::string,
                    std::vector<std::string>, PlayerType, StatLine>())
      .def_rw("id", &Player::id)
      .def_rw("name", &Player::name)
      .def_rw("team", &Player::team)
      .def_rw("positions", &Player::positions)
      .def_rw("type", &Player::type)
      .def_rw("stats", &Player::stats)
      .def_ro("is_drafted", &Player::is_drafted)
      .def_ro("valuation", &Player::valuation)
      .def("__repr__", [](const Player &p) {
        return fmt::format("Player(id={}, name={}, team={}, type={})", p.id,
                           p.name, p.team, to_string(p.type));
      });
  m.def("parse_positions", &parse_positions);

  // PlayerTable
  nb::class_<PlayerTable>(m, "PlayerTable")
      .def(nb::init<>())
      .def("add_player", &PlayerTable::add_player)
      .def("size", &PlayerTable::size)
      .def("has_id", &PlayerTable::has_id)
      .def("get", &PlayerTable::get, nb::rv_policy::copy)
      .def("players", &PlayerTable::players, nb::rv_policy::copy);

  nb::class_<LeagueSettings>(m, "LeagueSettings")
      .def(nb::init<>())
      .def_rw("name", &LeagueSettings::name)
      .def_rw("num_teams", &LeagueSettings::num_teams)
      .def_rw("budget_per_team", &LeagueSettings::budget_per_team)
      .def_rw("min_bid", &LeagueSettings::min_bid)
      .def_rw("roster_spots", &LeagueSettings::roster_spots)
      .def_rw("hitting_categories", &LeagueSettings::hitting_categories)
      .def_rw("pitching_categories", &LeagueSettings::pitching_categories)
      .def_rw("hitter_budget_fraction", &LeagueSettings::hitter_budget_fraction)
      .def_rw("use_positional_adjustments",
              &LeagueSettings::use_positional_adjustments)
      .def_rw("draft_type", &LeagueSettings::draft_type)
      .def("roster_size", &LeagueSettings::roster_size)
      .def("validate", &LeagueSettings::validate)
      .def("total_league_budget", &LeagueSettings::total_league_budget)
      .def("sub_budget", &LeagueSettings::sub_budget)
      .def("slots_per_team", &LeagueSettings::slots_per_team)
      .def("league_demand", &LeagueSettings::league_demand);
  m.def("positional_demand", &positional_demand);

  // Eligibility
  m.def("eligible_base_positions", &eligible_base_positions);
  m.def("can_fill", &can_fill);
  m.def("eligible_slots", &eligible_slots);

  nb::class_<SlotState>(m, "SlotState")
      .def_ro("slot", &SlotState::slot)
      .def_ro("required", &SlotState::required)
      .def_ro("filled", &SlotState::filled)
      .def_ro("remaining", &SlotState::remaining)
      .def_ro("player_ids", &SlotState::player_ids);

  nb::class_<DraftPick>(m, "DraftPick")
      .def_ro("pick_id", &DraftPick::pick_id)
      .def_ro("pick_number", &DraftPick::pick_number)
      .def_ro("player_id", &DraftPick::player_id)
      .def_ro("team_id", &DraftPick::team_id)
      .def_ro("price", &DraftPick::price)
      .def_ro("round_number", &DraftPick::round_number)
      .def_ro("pick_in_round", &DraftPick::pick_in_round)
      .def_ro("timestamp", &DraftPick::timestamp)
      .def("__repr__", [](const DraftPick &p) {
        if (p.price) {
          return fmt::format("DraftPick(#{}, player={}, team={}, price=${})",
                             p.pick_number, p.player_id, p.team_id, *p.price);
        }
        return fmt::format("DraftPick(#{}, player={}, team={}, round={}.{})",
                           p.pick_number, p.player_id, p.team_id,
                           p.round_number.value_or(0), p.pick_in_round.value_or(0));
      });

  // Snake drafts
  nb::class_<SnakeSlot>(m, "SnakeSlot")
      .def_ro("round", &SnakeSlot::round)
      .def_ro("pick_in_round", &SnakeSlot::pick_in_round)
      .def_ro("team_id", &SnakeSlot::team_id)
      .def("__repr__", [](const SnakeSlot &s) {
        return fmt::format("SnakeSlot(round={}, pick={}, team={})", s.round,
                           s.pick_in_round, s.team_id);
      });
  m.def("serpentine_order", &serpentine_order, nb::arg("draft_order"),
        nb::arg("num_rounds"));
  m.def("snake_slot", &snake_slot, nb::arg("draft_order"), nb::arg("picks_made"));
  m.def("picks_until_turn", &picks_until_turn, nb::arg("draft_order"),
        nb::arg("picks_made"), nb::arg("team_id"));
  m.def("overall_pick", &overall_pick);

  nb::class_<ReplacementLine>(m, "ReplacementLine")
      .def_ro("line", &ReplacementLine::line)
      .def_ro("player_id", &ReplacementLine::player_id)
      .def_ro("depth", &ReplacementLine::depth);

  nb::class_<ValuationEpoch>(m, "ValuationEpoch")
      .def_ro("pool_version", &ValuationEpoch::pool_version)
      .def_ro("values", &ValuationEpoch::values)
      .def_ro("baselines", &ValuationEpoch::baselines)
      .def_ro("remaining_slots", &ValuationEpoch::remaining_slots)
      .def_ro("hitter_budget", &ValuationEpoch::hitter_budget)
      .def_ro("pitcher_budget", &ValuationEpoch::pitcher_budget)
      .def_ro("hitter_dollars_per_sgp", &ValuationEpoch::hitter_dollars_per_sgp)
      .def_ro("pitcher_dollars_per_sgp",
              &ValuationEpoch::pitcher_dollars_per_sgp);

  nb::class_<DraftSession>(m, "DraftSession")
      .def(nb::init<LeagueSettings, PlayerTable, const std::string &>(),
           nb::arg("settings"), nb::arg("players"),
           nb::arg("user_team_name") = "My Team")
      .def("pick", &DraftSession::pick, nb::arg("player_id"),
           nb::arg("team_id"), nb::arg("price"))
      .def("snake_pick", &DraftSession::snake_pick, nb::arg("player_id"))
      .def("on_the_clock", &DraftSession::on_the_clock)
      .def("undo_last", &DraftSession::undo_last)
      .def("undo", &DraftSession::undo, nb::arg("pick_id"))
      .def("recalculate", &DraftSession::recalculate)
      .def("value", &DraftSession::value)
      .def("valuation", &DraftSession::valuation)
      .def("current_epoch", &DraftSession::current_epoch)
      .def("history", &DraftSession::history, nb::arg("limit") = 0)
      .def("roster_state", &DraftSession::roster_state)
      .def("remaining_budget", &DraftSession::remaining_budget);

  m.def("category_surplus", &category_surplus, nb::arg("valuation"),
        nb::arg("price_paid"));
}
