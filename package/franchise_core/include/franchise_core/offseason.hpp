#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "franchise_core/draft_ai.hpp"
#include "franchise_core/player.hpp"
#include "franchise_core/random.hpp"
#include "franchise_core/tier.hpp"

namespace franchise_core {

struct OffseasonConfig {
  std::string player_team_id{"player"};

  // Simulated AI win% = base + strength/100 * weight + (U - 0.5) * variance * scale
  double ai_base_win_pct{0.35};
  double ai_strength_weight{0.35};
  double ai_variance_scale{0.15};
  double ai_min_win_pct{0.25};
  double ai_max_win_pct{0.75};

  int retirement_age{40};
  // Past this age a player whose rating has sunk to the floor retires.
  int floor_retirement_age{33};
};

// Raw counting stats for one player's season. Hitters and pitchers fill
// different fields; the rest stay zero.
struct SeasonStats {
  int games_played{0};
  int at_bats{0};
  int hits{0};
  int home_runs{0};
  int rbi{0};
  int runs{0};
  int stolen_bases{0};
  std::optional<double> obp;
  std::optional<double> slg;

  int wins{0};
  int losses{0};
  std::optional<double> era;
  double innings{0.0};
  int strikeouts{0};
  int walks{0};
  int saves{0};
};

struct SeasonStatsSummary {
  int year{0};
  Tier tier{Tier::LowA};
  PlayerType player_type{PlayerType::Hitter};
  int games_played{0};

  int at_bats{0};
  int hits{0};
  int home_runs{0};
  int rbi{0};
  int runs{0};
  int stolen_bases{0};
  double avg{0.0};
  double obp{0.0};
  double slg{0.0};

  int wins{0};
  int losses{0};
  double era{0.0};
  double innings{0.0};
  int strikeouts{0};
  int walks{0};
  int saves{0};
};

using CareerHistory = std::vector<SeasonStatsSummary>;

// Career history with this season appended. A missing stat line archives as
// an empty season.
CareerHistory archive_season_stats(const std::optional<SeasonStats> &season,
                                   const CareerHistory &career, int year, Tier tier,
                                   PlayerType type);

struct WinterChange {
  int rating_change{0};
  std::string reason;
};

// Age-curve change to a player's rating over the winter.
WinterChange calculate_winter_development(int age, int current_rating, int potential,
                                          WorkEthic work_ethic, UniformSource &rng);

// current + change, clamped onto the rating scale.
int apply_rating_change(int current_rating, int change);

struct ContractYearResult {
  int new_contract_years{0};
  bool became_free_agent{false};
};

ContractYearResult process_contract_year(int contract_years);

struct WinterDevelopmentResult {
  std::int64_t player_id{0};
  std::string player_name;
  int age{0}; // after aging
  int previous_rating{0};
  int new_rating{0};
  int rating_change{0};
  std::string reason;
};

struct ContractExpirationResult {
  std::int64_t player_id{0};
  std::string player_name;
  Position position{Position::SP};
  int previous_rating{0};
  bool became_free_agent{false};
};

enum class RemovalKind { Retired, Released };

const char *removal_kind_name(RemovalKind k);

struct RosterRemoval {
  std::int64_t player_id{0};
  std::string player_name;
  RemovalKind kind{RemovalKind::Released};
  std::string reason;
};

struct AgingResult {
  std::vector<Player> players;
  std::vector<WinterDevelopmentResult> winter_development;
  std::vector<ContractExpirationResult> contract_expirations;
};

// Every player one year older, rating moved along the age curve, progression
// rate recomputed, one contract year used up.
AgingResult age_roster(const std::vector<Player> &players, UniformSource &rng);

// Retirements and expired-contract releases among an aged roster. Nothing is
// removed here; the caller acts on the list.
std::vector<RosterRemoval> roster_removals(const std::vector<Player> &aged,
                                           const OffseasonConfig &cfg = OffseasonConfig{});

struct PlayerSeasonRecord {
  std::string team_name;
  int wins{0};
  int losses{0};
};

struct DraftOrderEntry {
  int pick_number{0};
  std::string team_id;
  std::string team_name;
  int previous_season_wins{0};
  int previous_season_losses{0};
  double win_pct{0.0};
};

// Reverse standings: the player's real record against simulated AI records
// over the same number of games. Worst team picks first; ties keep the
// player ahead of the AI teams, and AI teams in league order.
std::vector<DraftOrderEntry> generate_draft_order(const PlayerSeasonRecord &record,
                                                  const std::vector<AITeam> &ai_teams, int year,
                                                  UniformSource &rng,
                                                  const OffseasonConfig &cfg = OffseasonConfig{});

// Player's pick number, or the last pick when the player is missing.
int player_draft_position(const std::vector<DraftOrderEntry> &order,
                          const OffseasonConfig &cfg = OffseasonConfig{});

enum class PlayoffResult { Champion, Finals, Semifinals, Missed };

const char *playoff_result_name(PlayoffResult r);

// finals_winner_id names the team that beat the player in the finals, when
// the player got that far.
PlayoffResult determine_playoff_result(bool made_playoffs,
                                       const std::optional<std::string> &champion_team_id,
                                       const std::optional<std::string> &finals_winner_id,
                                       const std::string &player_team_id = "player");

struct MvpCandidate {
  std::int64_t player_id{0};
  std::string name;
  PlayerType player_type{PlayerType::Hitter};
  std::optional<SeasonStats> season;
  int current_rating{0};
};

double calculate_mvp_score(const MvpCandidate &c);

// Highest score wins; the first candidate keeps ties.
std::optional<MvpCandidate> determine_season_mvp(const std::vector<MvpCandidate> &candidates);

struct TeamHistoryEntry {
  int year{0};
  Tier tier{Tier::LowA};
  int wins{0};
  int losses{0};
  double win_pct{0.0};
  int league_rank{0};
  bool made_playoffs{false};
  PlayoffResult playoff_result{PlayoffResult::Missed};
  std::int64_t total_revenue{0};
  std::int64_t total_expenses{0};
  std::int64_t net_income{0};
  int avg_attendance{0};
  std::optional<std::int64_t> mvp_player_id;
  std::string mvp_player_name;
};

struct OffseasonInput {
  int year{0};
  Tier tier{Tier::LowA};
  PlayerSeasonRecord record;
  int league_rank{0};
  bool made_playoffs{false};
  PlayoffResult playoff_result{PlayoffResult::Missed};
  std::int64_t total_revenue{0};
  std::int64_t total_expenses{0};
  int avg_attendance{0};

  std::vector<Player> players;
  std::unordered_map<std::int64_t, SeasonStats> season_stats;
  std::unordered_map<std::int64_t, CareerHistory> career_stats;
  std::vector<AITeam> ai_teams;
};

struct OffseasonSummary {
  int previous_year{0};
  int new_year{0};
  TeamHistoryEntry team_history;
  std::vector<Player> players; // aged roster, removals still included
  std::unordered_map<std::int64_t, CareerHistory> career_stats;
  std::vector<WinterDevelopmentResult> winter_development;
  std::vector<ContractExpirationResult> contract_expirations;
  std::vector<RosterRemoval> removals;
  std::vector<DraftOrderEntry> draft_order;
  int player_draft_position{0};
};

// Season-to-season rollover: archive stats, crown the MVP, age the roster,
// list removals and set the next draft order.
OffseasonSummary run_offseason_rollover(const OffseasonInput &input, UniformSource &rng,
                                        const OffseasonConfig &cfg = OffseasonConfig{});

} // namespace franchise_core
