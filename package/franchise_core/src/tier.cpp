#include "franchise_core/tier.hpp"

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace franchise_core {

const char *tier_id(Tier t) {
  switch (t) {
  case Tier::LowA:
    return "LOW_A";
  case Tier::HighA:
    return "HIGH_A";
  case Tier::DoubleA:
    return "DOUBLE_A";
  case Tier::TripleA:
    return "TRIPLE_A";
  case Tier::MLB:
    return "MLB";
  }
  return "?";
}

std::optional<Tier> parse_tier(std::string_view id) {
  for (int i = 0; i < kTierCount; ++i) {
    const Tier t = static_cast<Tier>(i);
    if (id == tier_id(t))
      return t;
  }
  return std::nullopt;
}

int tier_index(Tier t) { return static_cast<int>(t); }

std::optional<Tier> next_tier(Tier t) {
  const int i = tier_index(t);
  if (i + 1 >= kTierCount)
    return std::nullopt;
  return static_cast<Tier>(i + 1);
}

TierTable::TierTable(std::vector<TierConfig> rows) {
  if (rows.size() != static_cast<std::size_t>(kTierCount)) {
    throw std::invalid_argument(
        fmt::format("TierTable: expected {} rows, got {}", kTierCount, rows.size()));
  }
  for (std::size_t i = 0; i < rows.size(); ++i) {
    if (tier_index(rows[i].tier) != static_cast<int>(i)) {
      throw std::invalid_argument("TierTable: rows must be in ladder order");
    }
    rows_[i] = std::move(rows[i]);
  }
  if (rows_.back().promotion) {
    throw std::invalid_argument("TierTable: top tier cannot have promotion requirements");
  }
}

const TierTable &TierTable::standard() {
  static const TierTable table = [] {
    std::vector<TierConfig> rows(kTierCount);

    rows[0].tier = Tier::LowA;
    rows[0].name = "Low-A";
    rows[0].budget = 500000;
    rows[0].stadium_capacity = 2500;
    rows[0].season_length = 132;
    rows[0].average_opponent_strength = 42;
    rows[0].min_age = 18;
    rows[0].max_age = 21;
    rows[0].min_rating = 30;
    rows[0].max_rating = 55;
    rows[0].scouting_budget = 50000;
    rows[0].min_ticket_price = 5;
    rows[0].max_ticket_price = 12;
    rows[0].min_salary = 10000;
    rows[0].max_salary = 60000;
    rows[0].population = 15000;
    rows[0].unemployment_rate = 18.0;
    rows[0].median_income = 32000;
    rows[0].promotion = PromotionRequirements{0.55, 2, 50000, 50, false, false};

    rows[1].tier = Tier::HighA;
    rows[1].name = "High-A";
    rows[1].budget = 2000000;
    rows[1].stadium_capacity = 5000;
    rows[1].season_length = 132;
    rows[1].average_opponent_strength = 48;
    rows[1].min_age = 20;
    rows[1].max_age = 23;
    rows[1].min_rating = 40;
    rows[1].max_rating = 65;
    rows[1].scouting_budget = 150000;
    rows[1].min_ticket_price = 8;
    rows[1].max_ticket_price = 20;
    rows[1].min_salary = 30000;
    rows[1].max_salary = 150000;
    rows[1].population = 25000;
    rows[1].unemployment_rate = 12.0;
    rows[1].median_income = 38000;
    rows[1].promotion = PromotionRequirements{0.575, 2, 200000, 60, true, false};

    rows[2].tier = Tier::DoubleA;
    rows[2].name = "Double-A";
    rows[2].budget = 8000000;
    rows[2].stadium_capacity = 10000;
    rows[2].season_length = 138;
    rows[2].average_opponent_strength = 55;
    rows[2].min_age = 22;
    rows[2].max_age = 25;
    rows[2].min_rating = 50;
    rows[2].max_rating = 72;
    rows[2].scouting_budget = 300000;
    rows[2].min_ticket_price = 12;
    rows[2].max_ticket_price = 35;
    rows[2].min_salary = 100000;
    rows[2].max_salary = 500000;
    rows[2].population = 45000;
    rows[2].unemployment_rate = 7.0;
    rows[2].median_income = 48000;
    rows[2].promotion = PromotionRequirements{0.6, 2, 500000, 70, true, false};

    rows[3].tier = Tier::TripleA;
    rows[3].name = "Triple-A";
    rows[3].budget = 25000000;
    rows[3].stadium_capacity = 18000;
    rows[3].season_length = 144;
    rows[3].average_opponent_strength = 62;
    rows[3].min_age = 23;
    rows[3].max_age = 27;
    rows[3].min_rating = 60;
    rows[3].max_rating = 80;
    rows[3].scouting_budget = 500000;
    rows[3].min_ticket_price = 18;
    rows[3].max_ticket_price = 55;
    rows[3].min_salary = 300000;
    rows[3].max_salary = 1500000;
    rows[3].population = 85000;
    rows[3].unemployment_rate = 4.0;
    rows[3].median_income = 58000;
    rows[3].promotion = PromotionRequirements{0.6, 2, 2000000, 80, false, true};

    rows[4].tier = Tier::MLB;
    rows[4].name = "MLB";
    rows[4].budget = 150000000;
    rows[4].stadium_capacity = 42000;
    rows[4].season_length = 162;
    rows[4].average_opponent_strength = 70;
    rows[4].min_age = 24;
    rows[4].max_age = 35;
    rows[4].min_rating = 70;
    rows[4].max_rating = 85;
    rows[4].scouting_budget = 2000000;
    rows[4].min_ticket_price = 25;
    rows[4].max_ticket_price = 150;
    rows[4].min_salary = 750000;
    rows[4].max_salary = 35000000;
    rows[4].population = 200000;
    rows[4].unemployment_rate = 3.0;
    rows[4].median_income = 72000;

    return TierTable(std::move(rows));
  }();
  return table;
}

} // namespace franchise_core
