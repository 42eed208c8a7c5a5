#include "franchise_core/financial.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

std::int64_t round_money(double v) { return static_cast<std::int64_t>(std::llround(v)); }

double sponsorship_value(const SponsorshipTier &t, double multiplier) {
  return static_cast<double>(t.min) + static_cast<double>(t.max - t.min) * multiplier;
}

} // namespace

const char *bankruptcy_risk_name(BankruptcyRisk r) {
  switch (r) {
  case BankruptcyRisk::None:
    return "none";
  case BankruptcyRisk::Warning:
    return "warning";
  case BankruptcyRisk::Critical:
    return "critical";
  case BankruptcyRisk::Imminent:
    return "imminent";
  case BankruptcyRisk::Bankrupt:
    return "bankrupt";
  }
  return "?";
}

std::int64_t ticket_revenue(std::int64_t total_attendance, double ticket_price) {
  return round_money(static_cast<double>(total_attendance) * ticket_price);
}

std::int64_t concession_revenue(std::int64_t total_attendance, int stadium_quality,
                                const FinancialConfig &cfg) {
  const double quality = 1.0 + stadium_quality / 200.0;
  return round_money(static_cast<double>(total_attendance) * cfg.concession_per_fan * quality);
}

std::int64_t parking_revenue(std::int64_t total_attendance, const FinancialConfig &cfg) {
  const auto drivers = static_cast<std::int64_t>(
      std::floor(static_cast<double>(total_attendance) * cfg.parking_drive_pct));
  return drivers * cfg.parking_price;
}

std::int64_t merchandise_revenue(std::int64_t total_attendance, int city_pride,
                                 const FinancialConfig &cfg) {
  return round_money(static_cast<double>(total_attendance) * cfg.merchandise_per_fan *
                     (city_pride / 100.0));
}

std::int64_t sponsorship_revenue(Tier tier, int city_pride, int national_recognition,
                                 bool won_championship, const FinancialConfig &cfg) {
  const double pride = city_pride / 100.0;
  const double recognition = national_recognition / 100.0;
  const int idx = tier_index(tier);

  double total = 0.0;
  if (idx >= tier_index(cfg.local.min_tier))
    total += sponsorship_value(cfg.local, 0.3 + pride * 0.7);
  if (idx >= tier_index(cfg.regional.min_tier))
    total += sponsorship_value(cfg.regional, 0.2 + pride * 0.4 + recognition * 0.4);
  if (idx >= tier_index(cfg.national.min_tier))
    total += sponsorship_value(cfg.national,
                               0.1 + recognition * 0.6 + (won_championship ? 0.3 : 0.0));
  return round_money(total);
}

std::int64_t player_salaries(const std::vector<Player> &players) {
  std::int64_t sum = 0;
  for (const auto &p : players)
    if (p.is_on_roster)
      sum += p.salary;
  return sum;
}

std::int64_t coaching_salaries(const Franchise &franchise) {
  return franchise.hitting_coach_salary + franchise.pitching_coach_salary +
         franchise.development_coord_salary;
}

std::int64_t stadium_maintenance(Tier tier, const FinancialConfig &cfg) {
  const auto value = cfg.stadium_values[static_cast<std::size_t>(tier_index(tier))];
  return round_money(static_cast<double>(value) * cfg.maintenance_pct);
}

std::int64_t travel_costs(Tier tier, const FinancialConfig &cfg) {
  return cfg.travel_costs[static_cast<std::size_t>(tier_index(tier))];
}

std::int64_t debt_service(std::int64_t reserves, const FinancialConfig &cfg) {
  if (reserves >= 0)
    return 0;
  return round_money(static_cast<double>(debt_amount(reserves)) * cfg.debt_interest_rate);
}

double debt_ratio(std::int64_t reserves, std::int64_t annual_budget) {
  const std::int64_t debt = debt_amount(reserves);
  if (debt == 0)
    return 0.0;
  if (annual_budget <= 0)
    return std::numeric_limits<double>::infinity();
  return static_cast<double>(debt) / static_cast<double>(annual_budget);
}

BankruptcyRisk bankruptcy_risk_for(double ratio, const FinancialConfig &cfg) {
  if (ratio >= cfg.imminent_threshold)
    return BankruptcyRisk::Imminent;
  if (ratio >= cfg.critical_threshold)
    return BankruptcyRisk::Critical;
  if (ratio >= cfg.warning_threshold)
    return BankruptcyRisk::Warning;
  return BankruptcyRisk::None;
}

FinancialSimulationResult simulate_finances(const std::vector<Player> &players,
                                            const Franchise &franchise, const CityState &city,
                                            std::int64_t total_attendance, bool won_championship,
                                            std::int64_t marketing_spend,
                                            const FinancialConfig &cfg) {
  FinancialSimulationResult r;
  const std::int64_t fans = std::max<std::int64_t>(0, total_attendance);

  RevenueBreakdown &rev = r.revenue;
  rev.tickets = ticket_revenue(fans, franchise.ticket_price);
  rev.concessions = concession_revenue(fans, franchise.stadium_quality, cfg);
  rev.parking = parking_revenue(fans, cfg);
  rev.merchandise = merchandise_revenue(fans, city.team_pride, cfg);
  rev.sponsorships = sponsorship_revenue(franchise.tier, city.team_pride,
                                         city.national_recognition, won_championship, cfg);
  rev.total = rev.tickets + rev.concessions + rev.parking + rev.merchandise + rev.sponsorships;

  ExpenseBreakdown &exp = r.expenses;
  exp.player_salaries = player_salaries(players);
  exp.coaching_salaries = coaching_salaries(franchise);
  exp.stadium_maintenance = stadium_maintenance(franchise.tier, cfg);
  exp.travel = travel_costs(franchise.tier, cfg);
  exp.marketing = marketing_spend;
  exp.debt_service = debt_service(franchise.reserves, cfg);
  exp.total = exp.player_salaries + exp.coaching_salaries + exp.stadium_maintenance +
              exp.travel + exp.marketing + exp.debt_service;

  r.net_income = rev.total - exp.total;
  r.new_reserves = franchise.reserves + r.net_income;
  r.debt_level = debt_amount(r.new_reserves);
  r.debt_ratio = debt_ratio(r.new_reserves, franchise.budget);
  r.bankruptcy_risk = bankruptcy_risk_for(r.debt_ratio, cfg);

  log_debug("season finances for {}: revenue {} expenses {} net {} reserves {} ({})",
            franchise.id, rev.total, exp.total, r.net_income, r.new_reserves,
            bankruptcy_risk_name(r.bankruptcy_risk));
  if (r.bankruptcy_risk != BankruptcyRisk::None) {
    log_info("franchise {} debt ratio {:.2f} is {}", franchise.id, r.debt_ratio,
             bankruptcy_risk_name(r.bankruptcy_risk));
  }
  return r;
}

BankruptcyStatus check_bankruptcy_status(std::int64_t reserves, std::int64_t budget,
                                         const FinancialConfig &cfg) {
  BankruptcyStatus s;
  s.debt_ratio = debt_ratio(reserves, budget);

  if (s.debt_ratio > cfg.bankrupt_threshold) {
    s.is_bankrupt = true;
    s.risk_level = BankruptcyRisk::Bankrupt;
    s.message = "BANKRUPTCY - Your franchise has been seized by creditors. Game Over.";
    return s;
  }

  s.risk_level = bankruptcy_risk_for(s.debt_ratio, cfg);
  switch (s.risk_level) {
  case BankruptcyRisk::Imminent:
    s.message = "CRITICAL: City threatens seizure. One more losing season = bankruptcy.";
    s.recovery_options = {"Fire-sale veteran players for cash",
                          "Reduce ticket prices to boost attendance",
                          "Cut coaching staff to minimum",
                          "Skip stadium maintenance (risky)"};
    break;
  case BankruptcyRisk::Critical:
    s.message = "Bank demands repayment plan. Must trade players for cash.";
    s.recovery_options = {"Trade valuable players for cash or picks",
                          "Reduce expenses across the board",
                          "Focus on developing cheap young talent"};
    break;
  case BankruptcyRisk::Warning:
    s.message = "City council concerned about team finances.";
    s.recovery_options = {"Review expense allocation", "Consider lower-cost coaching options",
                          "Focus on revenue-generating wins"};
    break;
  case BankruptcyRisk::None:
  case BankruptcyRisk::Bankrupt:
    s.message = "Finances are healthy.";
    break;
  }
  return s;
}

std::int64_t calculate_player_salary(int current_rating, int potential, Tier tier, int age,
                                     const TierTable &tiers) {
  const TierConfig &tc = tiers.at(tier);
  const double effective = current_rating * 0.7 + potential * 0.3;
  const double normalized = std::clamp((effective - kMinRating) / 60.0, 0.0, 1.0);
  const double multiplier = std::pow(normalized, 1.8);

  double age_mod = 1.0;
  if (age >= 26 && age <= 30)
    age_mod = 1.15;
  else if (age > 32)
    age_mod = std::max(0.6, 0.85 - (age - 32) * 0.05);
  else if (age < 23)
    age_mod = 0.9;

  const double range = static_cast<double>(tc.max_salary - tc.min_salary);
  double salary = static_cast<double>(tc.min_salary) + range * multiplier * age_mod;
  salary = std::clamp(salary, static_cast<double>(tc.min_salary),
                      static_cast<double>(tc.max_salary));
  return round_money(salary / 1000.0) * 1000;
}

} // namespace franchise_core
