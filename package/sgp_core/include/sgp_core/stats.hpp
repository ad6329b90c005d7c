#pragma once

#include <string>
#include <unordered_map>
#include <utility>

namespace sgp_core {

enum class PlayerType { Hitter, Pitcher };

// Counting categories accumulate over a season. Rate categories are ratios
// where higher is better, Ratio categories ratios where lower is better; both
// are weighted by playing time.
enum class CategoryKind { Counting, Rate, Ratio };

inline const char *to_string(PlayerType t) {
  return t == PlayerType::Hitter ? "hitter" : "pitcher";
}

inline const char *to_string(CategoryKind k) {
  switch (k) {
  case CategoryKind::Rate:
    return "rate";
  case CategoryKind::Ratio:
    return "ratio";
  default:
    return "counting";
  }
}

struct CategorySpec {
  std::string name;
  CategoryKind kind{CategoryKind::Counting};

  CategorySpec() = default;
  CategorySpec(std::string name_, CategoryKind kind_)
      : name(std::move(name_)), kind(kind_) {}
};

// Projected season line: category name -> value, plus the playing-time
// denominator (at-bats for hitters, innings for pitchers). Rate and ratio
// categories hold the ratio itself (e.g. .285, 3.40).
class StatLine {
public:
  StatLine() = default;
  StatLine(std::unordered_map<std::string, double> values, double playing_time)
      : values_(std::move(values)), playing_time_(playing_time) {}

  // Missing categories read as 0.
  double get(const std::string &category) const {
    auto it = values_.find(category);
    return it == values_.end() ? 0.0 : it->second;
  }

  bool has(const std::string &category) const {
    return values_.find(category) != values_.end();
  }

  double playing_time() const { return playing_time_; }

  // Volume behind a rate or ratio: hits for AVG, innings-weighted ERA.
  double weighted(const std::string &category) const {
    return get(category) * playing_time_;
  }

  const std::unordered_map<std::string, double> &values() const {
    return values_;
  }

private:
  std::unordered_map<std::string, double> values_;
  double playing_time_{0.0};
};

} // namespace sgp_core
