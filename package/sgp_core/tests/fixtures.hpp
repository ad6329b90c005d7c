#pragma once

#include <cstdint>
#include <string>

#include <fmt/format.h>

#include "sgp_core/player.hpp"
#include "sgp_core/settings.hpp"

namespace sgp_core_test {

using namespace sgp_core;

inline Player hitter(std::int64_t id, const std::string &positions, double r,
                     double hr, double rbi, double sb, double avg, double ab) {
  return Player(id, fmt::format("Hitter {}", id), "FA", parse_positions(positions),
                PlayerType::Hitter,
                StatLine({{"R", r}, {"HR", hr}, {"RBI", rbi}, {"SB", sb}, {"AVG", avg}},
                         ab));
}

inline Player pitcher(std::int64_t id, const std::string &positions, double w,
                      double sv, double k, double era, double whip, double ip) {
  return Player(id, fmt::format("Pitcher {}", id), "FA", parse_positions(positions),
                PlayerType::Pitcher,
                StatLine({{"W", w}, {"SV", sv}, {"K", k}, {"ERA", era}, {"WHIP", whip}},
                         ip));
}

// Hitter whose every category scales with f.
inline Player scaled_hitter(std::int64_t id, const std::string &positions, double f) {
  return hitter(id, positions, 90.0 * f, 25.0 * f, 85.0 * f, 12.0 * f,
                0.230 + 0.05 * f, 400.0 + 150.0 * f);
}

// A league-sized pool: strength falls with depth at every position and
// catchers are the weakest group. Ids are assigned in insertion order.
inline PlayerTable league_pool() {
  PlayerTable t;
  std::int64_t id = 1;
  struct Bucket {
    const char *positions;
    int count;
    double strength;
  };
  const Bucket hitters[] = {
      {"C", 30, 0.70},  {"1B", 25, 1.10}, {"2B", 25, 0.90},   {"3B", 25, 1.00},
      {"SS", 25, 0.95}, {"OF", 70, 1.00}, {"2B,SS", 8, 0.95}, {"1B,OF", 6, 1.05},
  };
  for (const auto &b : hitters) {
    for (int i = 0; i < b.count; ++i)
      t.add_player(scaled_hitter(id++, b.positions, b.strength * (1.0 - 0.012 * i)));
  }
  for (int i = 0; i < 60; ++i) {
    const double f = 1.0 - 0.01 * i;
    t.add_player(pitcher(id++, "SP", 14.0 * f, 0.0, 190.0 * f, 3.2 + 1.5 * (1.0 - f),
                         1.10 + 0.3 * (1.0 - f), 20.0 + 180.0 * f));
  }
  for (int i = 0; i < 45; ++i) {
    const double f = 1.0 - 0.015 * i;
    t.add_player(pitcher(id++, "RP", 4.0 * f, 30.0 * f, 70.0 * f, 3.0 + 1.5 * (1.0 - f),
                         1.05 + 0.3 * (1.0 - f), 65.0));
  }
  // Injured, no projected at-bats
  t.add_player(hitter(id++, "OF", 0.0, 0.0, 0.0, 0.0, 0.0, 0.0));
  return t;
}

} // namespace sgp_core_test
