#include "franchise_core/progression.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

double thousands(std::int64_t v) { return static_cast<double>(v) / 1000.0; }

void record(PromotionEligibility &out, RequirementCheck check, std::string met_text,
            std::string missing_text) {
  if (check.met)
    out.met_criteria.push_back(std::move(met_text));
  else
    out.missing_criteria.push_back(std::move(missing_text));
  out.requirements.push_back(std::move(check));
}

} // namespace

const char *game_status_name(GameStatus s) {
  switch (s) {
  case GameStatus::Active:
    return "active";
  case GameStatus::GameOver:
    return "game_over";
  case GameStatus::Promoted:
    return "promoted";
  case GameStatus::Champion:
    return "champion";
  }
  return "?";
}

const char *debt_warning_level_name(DebtWarningLevel l) {
  switch (l) {
  case DebtWarningLevel::None:
    return "none";
  case DebtWarningLevel::Low:
    return "low";
  case DebtWarningLevel::Medium:
    return "medium";
  case DebtWarningLevel::High:
    return "high";
  case DebtWarningLevel::Critical:
    return "critical";
  }
  return "?";
}

PromotionEligibility check_promotion_eligibility(const PromotionInput &in,
                                                 const TierTable &tiers) {
  PromotionEligibility out;
  const auto next = next_tier(in.tier);
  const auto &req = tiers.at(in.tier).promotion;
  if (!next || !req) {
    out.missing_criteria.push_back("Already at top tier (MLB)");
    return out;
  }
  out.next_tier = next;

  const double win = in.win_pct * 100.0;
  const double win_req = req->win_pct * 100.0;
  RequirementCheck c{"win_pct", req->win_pct, in.win_pct, in.win_pct >= req->win_pct};
  record(out, c, fmt::format("Win% {:.1f}% >= {:.1f}%", win, win_req),
         fmt::format("Win% {:.1f}% < {:.1f}% required", win, win_req));

  c = {"reserves", static_cast<double>(req->reserves), static_cast<double>(in.reserves),
       in.reserves >= req->reserves};
  record(out, c,
         fmt::format("Reserves ${:.0f}K >= ${:.0f}K", thousands(in.reserves),
                     thousands(req->reserves)),
         fmt::format("Reserves ${:.0f}K < ${:.0f}K required", thousands(in.reserves),
                     thousands(req->reserves)));

  c = {"city_pride", static_cast<double>(req->city_pride), static_cast<double>(in.city_pride),
       in.city_pride >= req->city_pride};
  record(out, c, fmt::format("City Pride {} >= {}", in.city_pride, req->city_pride),
         fmt::format("City Pride {} < {} required", in.city_pride, req->city_pride));

  c = {"consecutive_years", static_cast<double>(req->consecutive_years),
       static_cast<double>(in.consecutive_winning_seasons),
       in.consecutive_winning_seasons >= req->consecutive_years};
  record(out, c,
         fmt::format("{} consecutive winning seasons >= {}", in.consecutive_winning_seasons,
                     req->consecutive_years),
         fmt::format("{} consecutive winning seasons < {} required",
                     in.consecutive_winning_seasons, req->consecutive_years));

  if (req->division_title) {
    c = {"division_title", 1.0, in.won_division ? 1.0 : 0.0, in.won_division};
    record(out, c, "Won Division Title", "Division Title required");
  }
  if (req->league_championship) {
    c = {"league_championship", 1.0, in.won_championship ? 1.0 : 0.0, in.won_championship};
    record(out, c, "Won League Championship", "League Championship required");
  }

  out.is_eligible = std::all_of(out.requirements.begin(), out.requirements.end(),
                                [](const RequirementCheck &r) { return r.met; });
  return out;
}

GameStatusCheck check_game_status(std::int64_t reserves, std::int64_t annual_budget, Tier tier,
                                  bool won_mlb_championship, const ProgressionConfig &cfg) {
  GameStatusCheck s;
  s.is_in_debt = reserves < 0;
  s.total_debt = debt_amount(reserves);
  s.debt_threshold = static_cast<std::int64_t>(
      std::llround(static_cast<double>(annual_budget) * cfg.bankruptcy_budget_multiple));
  s.is_bankrupt = s.total_debt > s.debt_threshold;

  if (s.is_bankrupt) {
    s.status = GameStatus::GameOver;
    s.reason = fmt::format("Bankruptcy: Debt of ${:.0f}K exceeds threshold of ${:.0f}K",
                           thousands(s.total_debt), thousands(s.debt_threshold));
    log_warn("{}", *s.reason);
    return s;
  }
  if (tier == Tier::MLB && won_mlb_championship) {
    s.status = GameStatus::Champion;
    s.reason = "Won the MLB championship";
  }
  return s;
}

PromotionBonuses calculate_promotion_bonuses(Tier from, Tier to, const TierTable &tiers,
                                             const ProgressionConfig &cfg) {
  const TierConfig &a = tiers.at(from);
  const TierConfig &b = tiers.at(to);
  PromotionBonuses bonus;
  bonus.budget_increase = b.budget - a.budget;
  bonus.stadium_capacity_increase = b.stadium_capacity - a.stadium_capacity;
  bonus.pride_boost = cfg.promotion_pride_boost;
  return bonus;
}

DebtWarning debt_warning(std::int64_t reserves, std::int64_t annual_budget,
                         const ProgressionConfig &cfg) {
  DebtWarning w;
  if (reserves >= 0)
    return w;

  const double debt = static_cast<double>(debt_amount(reserves));
  const double threshold = static_cast<double>(annual_budget) * cfg.bankruptcy_budget_multiple;
  w.debt_percent = annual_budget > 0 ? debt / static_cast<double>(annual_budget) * 100.0 : 100.0;

  if (debt >= threshold) {
    w.level = DebtWarningLevel::Critical;
    w.message = "BANKRUPTCY IMMINENT! Debt exceeds maximum threshold.";
  } else if (debt >= threshold * cfg.warning_high) {
    w.level = DebtWarningLevel::High;
    w.message = "Severe debt crisis. Cut costs immediately or face bankruptcy.";
  } else if (debt >= threshold * cfg.warning_medium) {
    w.level = DebtWarningLevel::Medium;
    w.message = "Significant debt. Financial restructuring recommended.";
  } else if (debt >= threshold * cfg.warning_low) {
    w.level = DebtWarningLevel::Low;
    w.message = "Minor debt. Monitor spending carefully.";
  } else {
    w.level = DebtWarningLevel::Low;
    w.message = "Operating in debt. Work to return to positive reserves.";
  }
  return w;
}

int progress_to_next_tier(const PromotionInput &input, const TierTable &tiers) {
  const PromotionEligibility e = check_promotion_eligibility(input, tiers);
  if (!e.next_tier)
    return 100;
  const std::size_t total = e.met_criteria.size() + e.missing_criteria.size();
  if (total == 0)
    return 0;
  return static_cast<int>(
      std::lround(100.0 * static_cast<double>(e.met_criteria.size()) / static_cast<double>(total)));
}

PromotionResult apply_promotion(const Franchise &franchise, const CityState &city,
                                const TierTable &tiers, const ProgressionConfig &cfg) {
  PromotionResult r;
  r.previous_tier = franchise.tier;
  r.new_tier = franchise.tier;
  r.franchise = franchise;
  r.city = city;

  const auto next = next_tier(franchise.tier);
  if (!next) {
    r.reason = "Already at top tier (MLB)";
    return r;
  }

  const TierConfig &tc = tiers.at(*next);
  r.ok = true;
  r.new_tier = *next;
  r.bonuses = calculate_promotion_bonuses(franchise.tier, *next, tiers, cfg);
  r.franchise.tier = *next;
  r.franchise.budget = tc.budget;
  r.franchise.stadium_capacity = tc.stadium_capacity;
  r.franchise.ticket_price =
      std::clamp(r.franchise.ticket_price, tc.min_ticket_price, tc.max_ticket_price);
  r.franchise.consecutive_winning_seasons = 0;
  r.franchise.consecutive_division_titles = 0;
  r.city.team_pride = std::min(100, city.team_pride + r.bonuses.pride_boost);

  log_info("franchise {} promoted {} -> {}", franchise.id, tier_id(r.previous_tier),
           tier_id(r.new_tier));
  return r;
}

} // namespace franchise_core
