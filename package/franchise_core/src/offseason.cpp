#include "franchise_core/offseason.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "franchise_core/log.hpp"

namespace franchise_core {

namespace {

double ethic_modifier(WorkEthic w) {
  switch (w) {
  case WorkEthic::Excellent:
    return 1.3;
  case WorkEthic::Poor:
    return 0.7;
  case WorkEthic::Average:
    break;
  }
  return 1.0;
}

int scaled_growth(int base, double ethic) {
  return static_cast<int>(std::lround(base * ethic));
}

} // namespace

CareerHistory archive_season_stats(const std::optional<SeasonStats> &season,
                                   const CareerHistory &career, int year, Tier tier,
                                   PlayerType type) {
  const SeasonStats s = season.value_or(SeasonStats{});
  SeasonStatsSummary sum;
  sum.year = year;
  sum.tier = tier;
  sum.player_type = type;
  sum.games_played = s.games_played;

  if (type == PlayerType::Hitter) {
    sum.at_bats = s.at_bats;
    sum.hits = s.hits;
    sum.home_runs = s.home_runs;
    sum.rbi = s.rbi;
    sum.runs = s.runs;
    sum.stolen_bases = s.stolen_bases;
    const int ab = s.at_bats > 0 ? s.at_bats : 1;
    sum.avg = std::round(static_cast<double>(s.hits) / ab * 1000.0) / 1000.0;
    sum.obp = s.obp.value_or(sum.avg);
    sum.slg = s.slg.value_or(sum.avg);
  } else {
    sum.wins = s.wins;
    sum.losses = s.losses;
    sum.era = s.era.value_or(0.0);
    sum.innings = s.innings;
    sum.strikeouts = s.strikeouts;
    sum.walks = s.walks;
    sum.saves = s.saves;
  }

  CareerHistory out = career;
  out.push_back(sum);
  return out;
}

WinterChange calculate_winter_development(int age, int current_rating, int potential,
                                          WorkEthic work_ethic, UniformSource &rng) {
  WinterChange w;
  const double ethic = ethic_modifier(work_ethic);
  const int room = std::max(0, potential - current_rating);

  if (age <= 21) {
    w.rating_change = std::min(room, scaled_growth(uniform_int(rng, 1, 3), ethic));
    w.reason = "Young prospect development";
  } else if (age <= 24) {
    w.rating_change = std::min(room, scaled_growth(uniform_int(rng, 1, 2), ethic));
    w.reason = "Continued development";
  } else if (age <= 29) {
    if (current_rating < potential && rng.next() > 0.5) {
      w.rating_change = scaled_growth(1, ethic);
      w.reason = "Peak years refinement";
    } else {
      w.reason = "Maintained peak form";
    }
  } else if (age <= 33) {
    if (rng.next() > 0.6) {
      w.rating_change = -1;
      w.reason = "Early aging effects";
    } else {
      w.reason = "Maintained form";
    }
  } else if (age <= 36) {
    if (chance(rng, 0.4 + (age - 34) * 0.1)) {
      w.rating_change = -uniform_int(rng, 1, 2);
      w.reason = "Age-related decline";
    } else {
      w.reason = "Defying age";
    }
  } else {
    if (chance(rng, 0.6 + (age - 37) * 0.1)) {
      w.rating_change = -uniform_int(rng, 1, 3);
      w.reason = "Late career decline";
    } else {
      w.rating_change = -1;
      w.reason = "Aging gracefully";
    }
  }
  return w;
}

int apply_rating_change(int current_rating, int change) {
  return std::clamp(current_rating + change, kMinRating, kMaxRating);
}

ContractYearResult process_contract_year(int contract_years) {
  ContractYearResult r;
  r.new_contract_years = std::max(0, contract_years - 1);
  r.became_free_agent = r.new_contract_years == 0;
  return r;
}

const char *removal_kind_name(RemovalKind k) {
  return k == RemovalKind::Retired ? "retired" : "released";
}

AgingResult age_roster(const std::vector<Player> &players, UniformSource &rng) {
  AgingResult out;
  out.players.reserve(players.size());

  for (const auto &src : players) {
    Player p = src;
    const WinterChange w = calculate_winter_development(p.age, p.current_rating, p.potential,
                                                        p.traits.work_ethic, rng);
    const int before = p.current_rating;
    p.current_rating = apply_rating_change(before, w.rating_change);
    p.potential = std::max(p.potential, p.current_rating);
    p.age += 1;
    p.years_in_org += 1;
    p.progression_rate = calculate_progression_rate(p.age, p.potential, p.current_rating);

    out.winter_development.push_back({p.id, p.full_name(), p.age, before, p.current_rating,
                                      p.current_rating - before, w.reason});

    const ContractYearResult c = process_contract_year(p.contract_years);
    p.contract_years = c.new_contract_years;
    if (c.became_free_agent) {
      out.contract_expirations.push_back({p.id, p.full_name(), p.position, before, true});
    }
    out.players.push_back(std::move(p));
  }
  return out;
}

std::vector<RosterRemoval> roster_removals(const std::vector<Player> &aged,
                                           const OffseasonConfig &cfg) {
  std::vector<RosterRemoval> out;
  for (const auto &p : aged) {
    if (p.age >= cfg.retirement_age) {
      out.push_back({p.id, p.full_name(), RemovalKind::Retired,
                     fmt::format("Retired at age {}", p.age)});
    } else if (p.age > cfg.floor_retirement_age && p.current_rating <= kMinRating) {
      out.push_back({p.id, p.full_name(), RemovalKind::Retired,
                     fmt::format("Retired at age {} after skills eroded", p.age)});
    } else if (p.contract_years <= 0) {
      out.push_back({p.id, p.full_name(), RemovalKind::Released,
                     "Contract expired; left as a free agent"});
    }
  }
  return out;
}

std::vector<DraftOrderEntry> generate_draft_order(const PlayerSeasonRecord &record,
                                                  const std::vector<AITeam> &ai_teams, int year,
                                                  UniformSource &rng,
                                                  const OffseasonConfig &cfg) {
  std::vector<DraftOrderEntry> standings;
  standings.reserve(ai_teams.size() + 1);

  const int games = std::max(0, record.wins) + std::max(0, record.losses);
  DraftOrderEntry me;
  me.team_id = cfg.player_team_id;
  me.team_name = record.team_name;
  me.previous_season_wins = record.wins;
  me.previous_season_losses = record.losses;
  me.win_pct = games > 0 ? static_cast<double>(record.wins) / games : 0.0;
  standings.push_back(me);

  for (const auto &team : ai_teams) {
    const double base = cfg.ai_base_win_pct + team.base_strength / 100.0 * cfg.ai_strength_weight;
    const double swing = (rng.next() - 0.5) * team.variance * cfg.ai_variance_scale;
    DraftOrderEntry e;
    e.team_id = team.id;
    e.team_name = team.city + " " + team.name;
    e.win_pct = std::clamp(base + swing, cfg.ai_min_win_pct, cfg.ai_max_win_pct);
    e.previous_season_wins = static_cast<int>(std::lround(e.win_pct * games));
    e.previous_season_losses = games - e.previous_season_wins;
    standings.push_back(std::move(e));
  }

  std::stable_sort(standings.begin(), standings.end(),
                   [](const DraftOrderEntry &a, const DraftOrderEntry &b) {
                     return a.win_pct < b.win_pct;
                   });
  for (std::size_t i = 0; i < standings.size(); ++i)
    standings[i].pick_number = static_cast<int>(i) + 1;

  log_debug("draft order {}: {} teams, player picks {}", year, standings.size(),
            player_draft_position(standings, cfg));
  return standings;
}

int player_draft_position(const std::vector<DraftOrderEntry> &order,
                          const OffseasonConfig &cfg) {
  for (const auto &e : order)
    if (e.team_id == cfg.player_team_id)
      return e.pick_number;
  return static_cast<int>(order.size());
}

const char *playoff_result_name(PlayoffResult r) {
  switch (r) {
  case PlayoffResult::Champion:
    return "Champion";
  case PlayoffResult::Finals:
    return "Finals";
  case PlayoffResult::Semifinals:
    return "Semifinals";
  case PlayoffResult::Missed:
    return "Missed";
  }
  return "?";
}

PlayoffResult determine_playoff_result(bool made_playoffs,
                                       const std::optional<std::string> &champion_team_id,
                                       const std::optional<std::string> &finals_winner_id,
                                       const std::string &player_team_id) {
  if (!made_playoffs)
    return PlayoffResult::Missed;
  if (champion_team_id && *champion_team_id == player_team_id)
    return PlayoffResult::Champion;
  if (finals_winner_id && *finals_winner_id != player_team_id)
    return PlayoffResult::Finals;
  // a semifinal exit, or a bracket too incomplete to say
  return PlayoffResult::Semifinals;
}

double calculate_mvp_score(const MvpCandidate &c) {
  const SeasonStats s = c.season.value_or(SeasonStats{});
  double score = c.current_rating;
  if (c.player_type == PlayerType::Hitter) {
    score += s.home_runs * 2.0;
    score += s.rbi * 0.5;
    score += s.hits * 0.3;
    score += s.stolen_bases * 0.5;
    const double avg = static_cast<double>(s.hits) / (s.at_bats > 0 ? s.at_bats : 1);
    if (avg >= 0.300)
      score += 10;
    if (avg >= 0.350)
      score += 10;
  } else {
    score += s.wins * 5.0;
    score += s.strikeouts * 0.2;
    score += s.saves * 3.0;
    const double era = s.era.value_or(5.0);
    if (era <= 3.00)
      score += 15;
    if (era <= 2.50)
      score += 10;
  }
  return score;
}

std::optional<MvpCandidate> determine_season_mvp(const std::vector<MvpCandidate> &candidates) {
  if (candidates.empty())
    return std::nullopt;
  std::size_t best = 0;
  double best_score = calculate_mvp_score(candidates[0]);
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    const double s = calculate_mvp_score(candidates[i]);
    if (s > best_score) {
      best_score = s;
      best = i;
    }
  }
  return candidates[best];
}

OffseasonSummary run_offseason_rollover(const OffseasonInput &in, UniformSource &rng,
                                        const OffseasonConfig &cfg) {
  OffseasonSummary out;
  out.previous_year = in.year;
  out.new_year = in.year + 1;

  // Archive and MVP use end-of-season ratings, before the winter.
  std::vector<MvpCandidate> candidates;
  candidates.reserve(in.players.size());
  out.career_stats = in.career_stats;
  for (const auto &p : in.players) {
    std::optional<SeasonStats> season;
    auto it = in.season_stats.find(p.id);
    if (it != in.season_stats.end())
      season = it->second;

    auto cit = in.career_stats.find(p.id);
    const CareerHistory empty;
    out.career_stats[p.id] = archive_season_stats(
        season, cit != in.career_stats.end() ? cit->second : empty, in.year, in.tier,
        p.player_type);
    if (p.is_on_roster)
      candidates.push_back({p.id, p.full_name(), p.player_type, season, p.current_rating});
  }

  TeamHistoryEntry &h = out.team_history;
  h.year = in.year;
  h.tier = in.tier;
  h.wins = in.record.wins;
  h.losses = in.record.losses;
  const int games = in.record.wins + in.record.losses;
  h.win_pct = games > 0 ? static_cast<double>(in.record.wins) / games : 0.0;
  h.league_rank = in.league_rank;
  h.made_playoffs = in.made_playoffs;
  h.playoff_result = in.made_playoffs ? in.playoff_result : PlayoffResult::Missed;
  h.total_revenue = in.total_revenue;
  h.total_expenses = in.total_expenses;
  h.net_income = in.total_revenue - in.total_expenses;
  h.avg_attendance = in.avg_attendance;
  if (auto mvp = determine_season_mvp(candidates)) {
    h.mvp_player_id = mvp->player_id;
    h.mvp_player_name = mvp->name;
  }

  AgingResult aged = age_roster(in.players, rng);
  out.players = std::move(aged.players);
  out.winter_development = std::move(aged.winter_development);
  out.contract_expirations = std::move(aged.contract_expirations);
  out.removals = roster_removals(out.players, cfg);

  out.draft_order = generate_draft_order(in.record, in.ai_teams, out.new_year, rng, cfg);
  out.player_draft_position = player_draft_position(out.draft_order, cfg);

  log_info("offseason {} -> {}: {} players aged, {} removals, player picks {}",
           out.previous_year, out.new_year, out.players.size(), out.removals.size(),
           out.player_draft_position);
  return out;
}

} // namespace franchise_core
