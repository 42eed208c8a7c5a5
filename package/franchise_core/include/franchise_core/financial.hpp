#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "franchise_core/city.hpp"
#include "franchise_core/franchise.hpp"
#include "franchise_core/player.hpp"
#include "franchise_core/tier.hpp"

namespace franchise_core {

enum class BankruptcyRisk { None, Warning, Critical, Imminent, Bankrupt };

const char *bankruptcy_risk_name(BankruptcyRisk r);

struct SponsorshipTier {
  std::int64_t min{0};
  std::int64_t max{0};
  Tier min_tier{Tier::LowA};
};

struct FinancialConfig {
  double concession_per_fan{12.0};
  double parking_drive_pct{0.25};
  std::int64_t parking_price{20};
  double merchandise_per_fan{8.0};

  SponsorshipTier local{25000, 500000, Tier::LowA};
  SponsorshipTier regional{150000, 2000000, Tier::HighA};
  SponsorshipTier national{2000000, 10000000, Tier::TripleA};

  // Indexed by tier.
  std::array<std::int64_t, kTierCount> stadium_values{
      {5000000, 15000000, 40000000, 80000000, 500000000}};
  double maintenance_pct{0.05};
  std::array<std::int64_t, kTierCount> travel_costs{{50000, 100000, 200000, 350000, 500000}};
  double debt_interest_rate{0.08};

  // Debt as a multiple of the annual budget.
  double warning_threshold{0.5};
  double critical_threshold{1.0};
  double imminent_threshold{1.5};
  double bankrupt_threshold{2.0};
};

struct RevenueBreakdown {
  std::int64_t tickets{0};
  std::int64_t concessions{0};
  std::int64_t parking{0};
  std::int64_t merchandise{0};
  std::int64_t sponsorships{0};
  std::int64_t total{0};
};

struct ExpenseBreakdown {
  std::int64_t player_salaries{0};
  std::int64_t coaching_salaries{0};
  std::int64_t stadium_maintenance{0};
  std::int64_t travel{0};
  std::int64_t marketing{0};
  std::int64_t debt_service{0};
  std::int64_t total{0};
};

struct FinancialSimulationResult {
  RevenueBreakdown revenue;
  ExpenseBreakdown expenses;
  std::int64_t net_income{0};
  std::int64_t new_reserves{0};
  std::int64_t debt_level{0}; // 0 unless new_reserves < 0
  double debt_ratio{0.0};
  BankruptcyRisk bankruptcy_risk{BankruptcyRisk::None};
};

struct BankruptcyStatus {
  bool is_bankrupt{false};
  double debt_ratio{0.0};
  BankruptcyRisk risk_level{BankruptcyRisk::None};
  std::string message;
  std::vector<std::string> recovery_options;
};

std::int64_t ticket_revenue(std::int64_t total_attendance, double ticket_price);
std::int64_t concession_revenue(std::int64_t total_attendance, int stadium_quality,
                                const FinancialConfig &cfg = FinancialConfig{});
std::int64_t parking_revenue(std::int64_t total_attendance,
                             const FinancialConfig &cfg = FinancialConfig{});
std::int64_t merchandise_revenue(std::int64_t total_attendance, int city_pride,
                                 const FinancialConfig &cfg = FinancialConfig{});
std::int64_t sponsorship_revenue(Tier tier, int city_pride, int national_recognition,
                                 bool won_championship,
                                 const FinancialConfig &cfg = FinancialConfig{});

// Salaries of players on the roster, reserves included.
std::int64_t player_salaries(const std::vector<Player> &players);
std::int64_t coaching_salaries(const Franchise &franchise);
std::int64_t stadium_maintenance(Tier tier, const FinancialConfig &cfg = FinancialConfig{});
std::int64_t travel_costs(Tier tier, const FinancialConfig &cfg = FinancialConfig{});
// Interest owed on negative reserves; zero otherwise.
std::int64_t debt_service(std::int64_t reserves, const FinancialConfig &cfg = FinancialConfig{});

// Debt over annual budget. A non-positive budget with any debt is treated as
// infinitely indebted.
double debt_ratio(std::int64_t reserves, std::int64_t annual_budget);

// Four-band risk used by the season simulation (never Bankrupt).
BankruptcyRisk bankruptcy_risk_for(double ratio, const FinancialConfig &cfg = FinancialConfig{});

FinancialSimulationResult simulate_finances(const std::vector<Player> &players,
                                            const Franchise &franchise, const CityState &city,
                                            std::int64_t total_attendance, bool won_championship,
                                            std::int64_t marketing_spend,
                                            const FinancialConfig &cfg = FinancialConfig{});

// Five-band status with the guidance shown to the owner. Bankrupt means debt
// strictly above bankrupt_threshold times the budget, the game-over line.
BankruptcyStatus check_bankruptcy_status(std::int64_t reserves, std::int64_t budget,
                                         const FinancialConfig &cfg = FinancialConfig{});

// Salary for a player at the tier: 70/30 blend of current and potential,
// scaled into the tier's salary band with an age premium or discount,
// rounded to the nearest thousand.
std::int64_t calculate_player_salary(int current_rating, int potential, Tier tier, int age,
                                     const TierTable &tiers = TierTable::standard());

} // namespace franchise_core
