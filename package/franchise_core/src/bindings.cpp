#include "franchise_core/city.hpp"
#include "franchise_core/draft_ai.hpp"
#include "franchise_core/financial.hpp"
#include "franchise_core/franchise.hpp"
#include "franchise_core/log.hpp"
#include "franchise_core/offseason.hpp"
#include "franchise_core/player.hpp"
#include "franchise_core/progression.hpp"
#include "franchise_core/prospect_generator.hpp"
#include "franchise_core/random.hpp"
#include "franchise_core/rating_sampler.hpp"
#include "franchise_core/scouting.hpp"
#include "franchise_core/tier.hpp"
#include "franchise_core/training.hpp"
#include <cstdint>
#include <fmt/format.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/nanobind.h>
#include <nanobind/stl/array.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/pair.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/string_view.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

namespace nb = nanobind;
namespace fc = franchise_core;

namespace {

void bind_random(nb::module_ &m) {
  nb::class_<fc::UniformSource>(m, "UniformSource")
      .def("next", &fc::UniformSource::next);

  nb::class_<fc::Mt19937Source, fc::UniformSource>(m, "Mt19937Source")
      .def(nb::init<>())
      .def(nb::init<std::uint64_t>(), nb::arg("seed"))
      .def("seed", &fc::Mt19937Source::seed)
      .def("__repr__", [](const fc::Mt19937Source &s) {
        return fmt::format("Mt19937Source(seed={})", s.seed());
      });

  nb::class_<fc::SequenceSource, fc::UniformSource>(m, "SequenceSource")
      .def(nb::init<std::vector<double>>(), nb::arg("values"))
      .def("position", &fc::SequenceSource::position);

  m.def("mix_seed", &fc::mix_seed, nb::arg("a"), nb::arg("b"));

  nb::class_<fc::SamplerBounds>(m, "SamplerBounds")
      .def(nb::init<>())
      .def_rw("min_rating", &fc::SamplerBounds::min_rating)
      .def_rw("max_rating", &fc::SamplerBounds::max_rating);

  nb::class_<fc::RatingSampler>(m, "RatingSampler")
      .def(nb::init<fc::UniformSource &, int, int>(), nb::arg("rng"),
           nb::arg("min_rating") = fc::kMinRating, nb::arg("max_rating") = fc::kMaxRating,
           nb::keep_alive<1, 2>())
      .def("sample", &fc::RatingSampler::sample, nb::arg("mean"), nb::arg("std_dev"))
      .def("sample_raw", &fc::RatingSampler::sample_raw, nb::arg("mean"), nb::arg("std_dev"));

  m.def("clamp_rating", &fc::clamp_rating);
}

void bind_player(nb::module_ &m) {
  nb::enum_<fc::Position>(m, "Position")
      .value("SP", fc::Position::SP)
      .value("RP", fc::Position::RP)
      .value("C", fc::Position::C)
      .value("FIRST_BASE", fc::Position::FirstBase)
      .value("SECOND_BASE", fc::Position::SecondBase)
      .value("THIRD_BASE", fc::Position::ThirdBase)
      .value("SS", fc::Position::SS)
      .value("LF", fc::Position::LF)
      .value("CF", fc::Position::CF)
      .value("RF", fc::Position::RF)
      .value("DH", fc::Position::DH);
  nb::enum_<fc::PlayerType>(m, "PlayerType")
      .value("HITTER", fc::PlayerType::Hitter)
      .value("PITCHER", fc::PlayerType::Pitcher);
  nb::enum_<fc::WorkEthic>(m, "WorkEthic")
      .value("POOR", fc::WorkEthic::Poor)
      .value("AVERAGE", fc::WorkEthic::Average)
      .value("EXCELLENT", fc::WorkEthic::Excellent);
  nb::enum_<fc::Personality>(m, "Personality")
      .value("TEAM_PLAYER", fc::Personality::TeamPlayer)
      .value("PRIMA_DONNA", fc::Personality::PrimaDonna)
      .value("LEADER", fc::Personality::Leader);
  nb::enum_<fc::Tool>(m, "Tool")
      .value("HIT", fc::Tool::Hit)
      .value("POWER", fc::Tool::Power)
      .value("SPEED", fc::Tool::Speed)
      .value("ARM", fc::Tool::Arm)
      .value("FIELD", fc::Tool::Field)
      .value("STUFF", fc::Tool::Stuff)
      .value("CONTROL", fc::Tool::Control)
      .value("MOVEMENT", fc::Tool::Movement);
  nb::enum_<fc::TrainingFocus>(m, "TrainingFocus")
      .value("OVERALL", fc::TrainingFocus::Overall)
      .value("HIT", fc::TrainingFocus::Hit)
      .value("POWER", fc::TrainingFocus::Power)
      .value("SPEED", fc::TrainingFocus::Speed)
      .value("ARM", fc::TrainingFocus::Arm)
      .value("FIELD", fc::TrainingFocus::Field)
      .value("STUFF", fc::TrainingFocus::Stuff)
      .value("CONTROL", fc::TrainingFocus::Control)
      .value("MOVEMENT", fc::TrainingFocus::Movement);
  nb::enum_<fc::Archetype>(m, "Archetype")
      .value("SLUGGER", fc::Archetype::Slugger)
      .value("SPEEDSTER", fc::Archetype::Speedster)
      .value("CONTACT_KING", fc::Archetype::ContactKing)
      .value("GLOVE_WIZARD", fc::Archetype::GloveWizard)
      .value("CANNON_ARM", fc::Archetype::CannonArm)
      .value("FLAMETHROWER", fc::Archetype::Flamethrower)
      .value("COMMAND_ACE", fc::Archetype::CommandAce)
      .value("MOVEMENT_MASTER", fc::Archetype::MovementMaster)
      .value("PLAYMAKER", fc::Archetype::Playmaker)
      .value("RAW_TALENT", fc::Archetype::RawTalent);
  nb::enum_<fc::RosterStatus>(m, "RosterStatus")
      .value("ACTIVE", fc::RosterStatus::Active)
      .value("RESERVE", fc::RosterStatus::Reserve);
  nb::enum_<fc::ScoutingTier>(m, "ScoutingTier")
      .value("LOW", fc::ScoutingTier::Low)
      .value("MEDIUM", fc::ScoutingTier::Medium)
      .value("HIGH", fc::ScoutingTier::High);

  m.def("position_name", &fc::position_name);
  m.def("parse_position", &fc::parse_position);
  m.def("archetype_name", &fc::archetype_name);
  m.def("training_focus_name", &fc::training_focus_name);
  m.def("parse_training_focus", &fc::parse_training_focus);
  m.def("calculate_progression_rate", &fc::calculate_progression_rate, nb::arg("age"),
        nb::arg("potential"), nb::arg("current_rating"));

  nb::class_<fc::HiddenTraits>(m, "HiddenTraits")
      .def(nb::init<>())
      .def_rw("work_ethic", &fc::HiddenTraits::work_ethic)
      .def_rw("injury_prone", &fc::HiddenTraits::injury_prone)
      .def_rw("personality", &fc::HiddenTraits::personality)
      .def_rw("coachability", &fc::HiddenTraits::coachability)
      .def_rw("clutch", &fc::HiddenTraits::clutch);

  nb::class_<fc::RevealedTraits>(m, "RevealedTraits")
      .def(nb::init<>())
      .def_rw("work_ethic", &fc::RevealedTraits::work_ethic)
      .def_rw("personality", &fc::RevealedTraits::personality)
      .def_rw("injury_prone", &fc::RevealedTraits::injury_prone)
      .def_rw("coachability", &fc::RevealedTraits::coachability)
      .def_rw("clutch", &fc::RevealedTraits::clutch);

  nb::class_<fc::Player>(m, "Player")
      .def(nb::init<>())
      .def_rw("id", &fc::Player::id)
      .def_rw("first_name", &fc::Player::first_name)
      .def_rw("last_name", &fc::Player::last_name)
      .def_rw("age", &fc::Player::age)
      .def_rw("position", &fc::Player::position)
      .def_rw("player_type", &fc::Player::player_type)
      .def_rw("current_rating", &fc::Player::current_rating)
      .def_rw("potential", &fc::Player::potential)
      .def_rw("tools", &fc::Player::tools)
      .def_rw("traits", &fc::Player::traits)
      .def_rw("traits_revealed", &fc::Player::traits_revealed)
      .def_rw("training_focus", &fc::Player::training_focus)
      .def_rw("current_xp", &fc::Player::current_xp)
      .def_rw("progression_rate", &fc::Player::progression_rate)
      .def_rw("morale", &fc::Player::morale)
      .def_rw("is_injured", &fc::Player::is_injured)
      .def_rw("injury_games_remaining", &fc::Player::injury_games_remaining)
      .def_rw("is_on_roster", &fc::Player::is_on_roster)
      .def_rw("roster_status", &fc::Player::roster_status)
      .def_rw("salary", &fc::Player::salary)
      .def_rw("contract_years", &fc::Player::contract_years)
      .def_rw("years_in_org", &fc::Player::years_in_org)
      .def_rw("draft_year", &fc::Player::draft_year)
      .def_rw("draft_round", &fc::Player::draft_round)
      .def_rw("draft_pick", &fc::Player::draft_pick)
      .def("full_name", &fc::Player::full_name)
      .def("tool", &fc::Player::tool)
      .def("__repr__", [](const fc::Player &p) {
        return fmt::format("Player(id={}, name={}, pos={}, age={}, rating={}/{})", p.id,
                           p.full_name(), fc::position_name(p.position), p.age,
                           p.current_rating, p.potential);
      });

  nb::class_<fc::DraftProspect, fc::Player>(m, "DraftProspect")
      .def(nb::init<>())
      .def_rw("scouted_rating", &fc::DraftProspect::scouted_rating)
      .def_rw("scouted_potential", &fc::DraftProspect::scouted_potential)
      .def_rw("scouting_accuracy", &fc::DraftProspect::scouting_accuracy)
      .def_rw("revealed_traits", &fc::DraftProspect::revealed_traits)
      .def_rw("media_rank", &fc::DraftProspect::media_rank)
      .def_rw("archetype", &fc::DraftProspect::archetype)
      .def_rw("is_drafted", &fc::DraftProspect::is_drafted)
      .def_rw("drafted_by_team", &fc::DraftProspect::drafted_by_team)
      .def("__repr__", [](const fc::DraftProspect &p) {
        return fmt::format("DraftProspect(id={}, name={}, pos={}, rank={}, archetype={})",
                           p.id, p.full_name(), fc::position_name(p.position), p.media_rank,
                           fc::archetype_name(p.archetype));
      });

  nb::class_<fc::PlayerTable>(m, "PlayerTable")
      .def(nb::init<>())
      .def("add_player", &fc::PlayerTable::add_player)
      .def("size", &fc::PlayerTable::size)
      .def("has_id", &fc::PlayerTable::has_id)
      .def("get", &fc::PlayerTable::get)
      .def("players", &fc::PlayerTable::players);
}

void bind_league(nb::module_ &m) {
  nb::enum_<fc::Tier>(m, "Tier")
      .value("LOW_A", fc::Tier::LowA)
      .value("HIGH_A", fc::Tier::HighA)
      .value("DOUBLE_A", fc::Tier::DoubleA)
      .value("TRIPLE_A", fc::Tier::TripleA)
      .value("MLB", fc::Tier::MLB);
  m.def("tier_id", &fc::tier_id);
  m.def("parse_tier", &fc::parse_tier);
  m.def("next_tier", &fc::next_tier);

  nb::class_<fc::PromotionRequirements>(m, "PromotionRequirements")
      .def(nb::init<>())
      .def_rw("win_pct", &fc::PromotionRequirements::win_pct)
      .def_rw("consecutive_years", &fc::PromotionRequirements::consecutive_years)
      .def_rw("reserves", &fc::PromotionRequirements::reserves)
      .def_rw("city_pride", &fc::PromotionRequirements::city_pride)
      .def_rw("division_title", &fc::PromotionRequirements::division_title)
      .def_rw("league_championship", &fc::PromotionRequirements::league_championship);

  nb::class_<fc::TierConfig>(m, "TierConfig")
      .def(nb::init<>())
      .def_rw("tier", &fc::TierConfig::tier)
      .def_rw("name", &fc::TierConfig::name)
      .def_rw("budget", &fc::TierConfig::budget)
      .def_rw("stadium_capacity", &fc::TierConfig::stadium_capacity)
      .def_rw("season_length", &fc::TierConfig::season_length)
      .def_rw("average_opponent_strength", &fc::TierConfig::average_opponent_strength)
      .def_rw("min_age", &fc::TierConfig::min_age)
      .def_rw("max_age", &fc::TierConfig::max_age)
      .def_rw("min_rating", &fc::TierConfig::min_rating)
      .def_rw("max_rating", &fc::TierConfig::max_rating)
      .def_rw("scouting_budget", &fc::TierConfig::scouting_budget)
      .def_rw("min_ticket_price", &fc::TierConfig::min_ticket_price)
      .def_rw("max_ticket_price", &fc::TierConfig::max_ticket_price)
      .def_rw("min_salary", &fc::TierConfig::min_salary)
      .def_rw("max_salary", &fc::TierConfig::max_salary)
      .def_rw("population", &fc::TierConfig::population)
      .def_rw("unemployment_rate", &fc::TierConfig::unemployment_rate)
      .def_rw("median_income", &fc::TierConfig::median_income)
      .def_rw("promotion", &fc::TierConfig::promotion);

  nb::class_<fc::TierTable>(m, "TierTable")
      .def(nb::init<std::vector<fc::TierConfig>>(), nb::arg("rows"))
      .def("at", &fc::TierTable::at, nb::rv_policy::reference_internal)
      .def_static("standard", &fc::TierTable::standard, nb::rv_policy::reference);

  nb::enum_<fc::BuildingType>(m, "BuildingType")
      .value("RESTAURANT", fc::BuildingType::Restaurant)
      .value("BAR", fc::BuildingType::Bar)
      .value("RETAIL", fc::BuildingType::Retail)
      .value("HOTEL", fc::BuildingType::Hotel)
      .value("CORPORATE", fc::BuildingType::Corporate);

  nb::class_<fc::Building>(m, "Building")
      .def(nb::init<>())
      .def_rw("id", &fc::Building::id)
      .def_rw("type", &fc::Building::type)
      .def_rw("state", &fc::Building::state)
      .def_rw("name", &fc::Building::name)
      .def_rw("year_opened", &fc::Building::year_opened)
      .def("is_active", &fc::Building::is_active);

  nb::class_<fc::CityState>(m, "CityState")
      .def(nb::init<>())
      .def_rw("population", &fc::CityState::population)
      .def_rw("median_income", &fc::CityState::median_income)
      .def_rw("unemployment_rate", &fc::CityState::unemployment_rate)
      .def_rw("team_pride", &fc::CityState::team_pride)
      .def_rw("national_recognition", &fc::CityState::national_recognition)
      .def_rw("buildings", &fc::CityState::buildings)
      .def("occupancy_rate", &fc::CityState::occupancy_rate);
  m.def("new_city_state", &fc::new_city_state, nb::arg("tier"), nb::arg("team_pride") = 50,
        nb::arg("national_recognition") = 0);

  nb::class_<fc::DistrictBonuses>(m, "DistrictBonuses")
      .def(nb::init<>())
      .def_rw("fan_mult", &fc::DistrictBonuses::fan_mult)
      .def_rw("income_mult", &fc::DistrictBonuses::income_mult)
      .def_rw("training_mult", &fc::DistrictBonuses::training_mult)
      .def_rw("entertainment_count", &fc::DistrictBonuses::entertainment_count)
      .def_rw("commercial_count", &fc::DistrictBonuses::commercial_count)
      .def_rw("performance_count", &fc::DistrictBonuses::performance_count)
      .def("__repr__", [](const fc::DistrictBonuses &b) {
        return fmt::format("DistrictBonuses(fan={:.3f}, income={:.3f}, training={:.3f})",
                           b.fan_mult, b.income_mult, b.training_mult);
      });
  m.def("compute_district_bonuses",
        [](const fc::CityState &city) { return fc::compute_district_bonuses(city); });

  nb::class_<fc::AttendanceResult>(m, "AttendanceResult")
      .def_ro("avg_attendance", &fc::AttendanceResult::avg_attendance)
      .def_ro("total_attendance", &fc::AttendanceResult::total_attendance);
  m.def("calculate_attendance", &fc::calculate_attendance, nb::arg("stadium_capacity"),
        nb::arg("win_pct"), nb::arg("city_pride"), nb::arg("unemployment_rate"),
        nb::arg("stadium_quality"), nb::arg("home_games"), nb::arg("fan_mult"), nb::arg("rng"));

  nb::class_<fc::RosterCapacities>(m, "RosterCapacities")
      .def_ro("active", &fc::RosterCapacities::active)
      .def_ro("reserve", &fc::RosterCapacities::reserve)
      .def_ro("total", &fc::RosterCapacities::total);
  m.def("roster_capacities",
        [](int level) { return fc::roster_capacities(level); }, nb::arg("facility_level"));

  nb::class_<fc::Franchise>(m, "Franchise")
      .def(nb::init<>())
      .def_rw("id", &fc::Franchise::id)
      .def_rw("name", &fc::Franchise::name)
      .def_rw("tier", &fc::Franchise::tier)
      .def_rw("budget", &fc::Franchise::budget)
      .def_rw("reserves", &fc::Franchise::reserves)
      .def_rw("stadium_name", &fc::Franchise::stadium_name)
      .def_rw("stadium_capacity", &fc::Franchise::stadium_capacity)
      .def_rw("stadium_quality", &fc::Franchise::stadium_quality)
      .def_rw("hitting_coach_skill", &fc::Franchise::hitting_coach_skill)
      .def_rw("hitting_coach_salary", &fc::Franchise::hitting_coach_salary)
      .def_rw("pitching_coach_skill", &fc::Franchise::pitching_coach_skill)
      .def_rw("pitching_coach_salary", &fc::Franchise::pitching_coach_salary)
      .def_rw("development_coord_skill", &fc::Franchise::development_coord_skill)
      .def_rw("development_coord_salary", &fc::Franchise::development_coord_salary)
      .def_rw("ticket_price", &fc::Franchise::ticket_price)
      .def_rw("facility_level", &fc::Franchise::facility_level)
      .def_rw("consecutive_winning_seasons", &fc::Franchise::consecutive_winning_seasons)
      .def_rw("consecutive_division_titles", &fc::Franchise::consecutive_division_titles)
      .def("__repr__", [](const fc::Franchise &f) {
        return fmt::format("Franchise(id={}, tier={}, budget={}, reserves={})", f.id,
                           fc::tier_id(f.tier), f.budget, f.reserves);
      });
  m.def("new_franchise",
        [](std::string id, std::string name, fc::Tier tier, std::int64_t reserves) {
          return fc::new_franchise(std::move(id), std::move(name), tier, reserves);
        },
        nb::arg("id"), nb::arg("name"), nb::arg("tier"), nb::arg("starting_reserves"));

  nb::class_<fc::FacilityUpgradeResult>(m, "FacilityUpgradeResult")
      .def_ro("ok", &fc::FacilityUpgradeResult::ok)
      .def_ro("reason", &fc::FacilityUpgradeResult::reason)
      .def_ro("new_level", &fc::FacilityUpgradeResult::new_level)
      .def_ro("cost", &fc::FacilityUpgradeResult::cost)
      .def_ro("new_reserves", &fc::FacilityUpgradeResult::new_reserves);
  m.def("upgrade_facility",
        [](const fc::Franchise &f) { return fc::upgrade_facility(f); }, nb::arg("franchise"));
  m.def("debt_amount", &fc::debt_amount, nb::arg("reserves"));
}

void bind_draft(nb::module_ &m) {
  nb::class_<fc::DraftClassConfig>(m, "DraftClassConfig")
      .def(nb::init<>())
      .def_rw("total_players", &fc::DraftClassConfig::total_players)
      .def_rw("potential_mean", &fc::DraftClassConfig::potential_mean)
      .def_rw("potential_sd", &fc::DraftClassConfig::potential_sd)
      .def_rw("gap_min", &fc::DraftClassConfig::gap_min)
      .def_rw("gap_max", &fc::DraftClassConfig::gap_max)
      .def_rw("tool_sd", &fc::DraftClassConfig::tool_sd)
      .def_rw("media_noise", &fc::DraftClassConfig::media_noise)
      .def_rw("media_age_noise", &fc::DraftClassConfig::media_age_noise);

  m.def("generate_draft_class", &fc::generate_draft_class, nb::arg("total_players"),
        nb::arg("year"), nb::arg("rng"), nb::arg("cfg") = fc::DraftClassConfig{});

  nb::class_<fc::ScoutingReport>(m, "ScoutingReport")
      .def_ro("accuracy", &fc::ScoutingReport::accuracy)
      .def_ro("scouted_rating", &fc::ScoutingReport::scouted_rating)
      .def_ro("scouted_potential", &fc::ScoutingReport::scouted_potential)
      .def_ro("rating_error", &fc::ScoutingReport::rating_error)
      .def_ro("potential_error", &fc::ScoutingReport::potential_error)
      .def_ro("traits_revealed", &fc::ScoutingReport::traits_revealed)
      .def_ro("revealed_traits", &fc::ScoutingReport::revealed_traits)
      .def_ro("cost", &fc::ScoutingReport::cost)
      .def("__repr__", [](const fc::ScoutingReport &r) {
        return fmt::format("ScoutingReport(rating={}, potential={}, accuracy={}, cost={})",
                           r.scouted_rating, r.scouted_potential,
                           fc::scouting_tier_name(r.accuracy), r.cost);
      });

  nb::class_<fc::ScoutingRequestResult>(m, "ScoutingRequestResult")
      .def_ro("ok", &fc::ScoutingRequestResult::ok)
      .def_ro("reason", &fc::ScoutingRequestResult::reason)
      .def_ro("report", &fc::ScoutingRequestResult::report)
      .def_ro("remaining_funds", &fc::ScoutingRequestResult::remaining_funds);

  m.def("scouting_cost", [](fc::ScoutingTier t) { return fc::scouting_cost(t); });
  m.def("scout_prospect",
        [](const fc::DraftProspect &p, fc::ScoutingTier t, fc::UniformSource &rng) {
          return fc::scout_prospect(p, t, rng);
        },
        nb::arg("prospect"), nb::arg("accuracy"), nb::arg("rng"));
  m.def("request_scouting",
        [](const fc::DraftProspect &p, std::string_view tier, std::int64_t funds,
           fc::UniformSource &rng) { return fc::request_scouting(p, tier, funds, rng); },
        nb::arg("prospect"), nb::arg("accuracy"), nb::arg("available_funds"), nb::arg("rng"));
  m.def("merge_scouting_report", &fc::merge_scouting_report);

  nb::enum_<fc::DraftPhilosophy>(m, "DraftPhilosophy")
      .value("BEST_AVAILABLE", fc::DraftPhilosophy::BestAvailable)
      .value("NEED_BASED", fc::DraftPhilosophy::NeedBased)
      .value("UPSIDE_SWING", fc::DraftPhilosophy::UpsideSwing)
      .value("SAFE_FLOOR", fc::DraftPhilosophy::SafeFloor);

  nb::class_<fc::PositionNeed>(m, "PositionNeed")
      .def(nb::init<>())
      .def_rw("position", &fc::PositionNeed::position)
      .def_rw("priority", &fc::PositionNeed::priority);

  nb::class_<fc::AITeam>(m, "AITeam")
      .def(nb::init<>())
      .def_rw("id", &fc::AITeam::id)
      .def_rw("city", &fc::AITeam::city)
      .def_rw("name", &fc::AITeam::name)
      .def_rw("philosophy", &fc::AITeam::philosophy)
      .def_rw("risk_tolerance", &fc::AITeam::risk_tolerance)
      .def_rw("needs", &fc::AITeam::needs)
      .def_rw("base_strength", &fc::AITeam::base_strength)
      .def_rw("variance", &fc::AITeam::variance)
      .def("__repr__", [](const fc::AITeam &t) {
        return fmt::format("AITeam(id={}, philosophy={})", t.id,
                           fc::draft_philosophy_name(t.philosophy));
      });
  m.def("default_ai_teams", &fc::default_ai_teams);

  nb::class_<fc::AIDraftPickResult>(m, "AIDraftPickResult")
      .def_ro("ok", &fc::AIDraftPickResult::ok)
      .def_ro("selected_index", &fc::AIDraftPickResult::selected_index)
      .def_ro("prospect_id", &fc::AIDraftPickResult::prospect_id)
      .def_ro("score", &fc::AIDraftPickResult::score)
      .def_ro("reason", &fc::AIDraftPickResult::reason);
  m.def("ai_draft_pick",
        [](const fc::AITeam &team, const std::vector<fc::DraftProspect> &pool, int round,
           fc::UniformSource &rng) { return fc::ai_draft_pick(team, pool, round, rng); },
        nb::arg("team"), nb::arg("remaining"), nb::arg("round"), nb::arg("rng"));

  nb::class_<fc::DraftPickRecord>(m, "DraftPickRecord")
      .def_ro("team_id", &fc::DraftPickRecord::team_id)
      .def_ro("prospect_id", &fc::DraftPickRecord::prospect_id)
      .def_ro("pick", &fc::DraftPickRecord::pick)
      .def_ro("round", &fc::DraftPickRecord::round)
      .def_ro("reason", &fc::DraftPickRecord::reason);
  nb::class_<fc::SimulatedDraftPicks>(m, "SimulatedDraftPicks")
      .def_ro("ok", &fc::SimulatedDraftPicks::ok)
      .def_ro("reason", &fc::SimulatedDraftPicks::reason)
      .def_ro("picks", &fc::SimulatedDraftPicks::picks)
      .def_ro("drafted", &fc::SimulatedDraftPicks::drafted)
      .def_ro("remaining", &fc::SimulatedDraftPicks::remaining)
      .def_ro("next_pick", &fc::SimulatedDraftPicks::next_pick);
  m.def("simulate_ai_draft_picks",
        [](const std::vector<fc::AITeam> &teams, const std::vector<fc::DraftProspect> &pool,
           int current_pick, int player_slot, int round, fc::UniformSource &rng, bool snake) {
          return fc::simulate_ai_draft_picks(teams, pool, current_pick, player_slot, round, rng,
                                             snake);
        },
        nb::arg("teams"), nb::arg("remaining"), nb::arg("current_pick"),
        nb::arg("player_slot"), nb::arg("round"), nb::arg("rng"), nb::arg("snake") = true);
}

void bind_training(nb::module_ &m) {
  nb::class_<fc::TrainingResult>(m, "TrainingResult")
      .def_ro("player_id", &fc::TrainingResult::player_id)
      .def_ro("previous_xp", &fc::TrainingResult::previous_xp)
      .def_ro("new_xp", &fc::TrainingResult::new_xp)
      .def_ro("xp_gained", &fc::TrainingResult::xp_gained)
      .def_ro("leveled_up", &fc::TrainingResult::leveled_up)
      .def_ro("attribute_improved", &fc::TrainingResult::attribute_improved)
      .def_ro("previous_value", &fc::TrainingResult::previous_value)
      .def_ro("new_value", &fc::TrainingResult::new_value);
  nb::class_<fc::BatchTrainingResult>(m, "BatchTrainingResult")
      .def_ro("results", &fc::BatchTrainingResult::results)
      .def_ro("total_xp_gained", &fc::BatchTrainingResult::total_xp_gained)
      .def_ro("players_leveled_up", &fc::BatchTrainingResult::players_leveled_up);
  nb::class_<fc::TrainingSummary>(m, "TrainingSummary")
      .def_ro("training_mult", &fc::TrainingSummary::training_mult)
      .def_ro("facility_bonus", &fc::TrainingSummary::facility_bonus)
      .def_ro("total_bonus", &fc::TrainingSummary::total_bonus)
      .def_ro("avg_progression_rate", &fc::TrainingSummary::avg_progression_rate)
      .def_ro("estimated_xp_per_game", &fc::TrainingSummary::estimated_xp_per_game)
      .def_ro("estimated_games_to_level_up", &fc::TrainingSummary::estimated_games_to_level_up);

  m.def("process_player_training",
        [](const fc::Player &p, const fc::DistrictBonuses &b, int facility, int games,
           fc::UniformSource &rng) {
          return fc::process_player_training(p, b, facility, games, rng);
        },
        nb::arg("player"), nb::arg("district_bonuses"), nb::arg("facility_level"),
        nb::arg("games_simulated"), nb::arg("rng"));
  m.def("process_batch_training",
        [](const std::vector<fc::Player> &ps, const fc::DistrictBonuses &b, int facility,
           int games, fc::UniformSource &rng) {
          return fc::process_batch_training(ps, b, facility, games, rng);
        },
        nb::arg("players"), nb::arg("district_bonuses"), nb::arg("facility_level"),
        nb::arg("games_simulated"), nb::arg("rng"));
  m.def("apply_training_result", &fc::apply_training_result);
  m.def("recommended_training_focus",
        [](const fc::Player &p) { return fc::recommended_training_focus(p); });
  m.def("training_summary",
        [](const std::vector<fc::Player> &ps, const fc::DistrictBonuses &b, int facility) {
          return fc::training_summary(ps, b, facility);
        });
}

void bind_finance(nb::module_ &m) {
  nb::enum_<fc::BankruptcyRisk>(m, "BankruptcyRisk")
      .value("NONE", fc::BankruptcyRisk::None)
      .value("WARNING", fc::BankruptcyRisk::Warning)
      .value("CRITICAL", fc::BankruptcyRisk::Critical)
      .value("IMMINENT", fc::BankruptcyRisk::Imminent)
      .value("BANKRUPT", fc::BankruptcyRisk::Bankrupt);

  nb::class_<fc::RevenueBreakdown>(m, "RevenueBreakdown")
      .def_ro("tickets", &fc::RevenueBreakdown::tickets)
      .def_ro("concessions", &fc::RevenueBreakdown::concessions)
      .def_ro("parking", &fc::RevenueBreakdown::parking)
      .def_ro("merchandise", &fc::RevenueBreakdown::merchandise)
      .def_ro("sponsorships", &fc::RevenueBreakdown::sponsorships)
      .def_ro("total", &fc::RevenueBreakdown::total);
  nb::class_<fc::ExpenseBreakdown>(m, "ExpenseBreakdown")
      .def_ro("player_salaries", &fc::ExpenseBreakdown::player_salaries)
      .def_ro("coaching_salaries", &fc::ExpenseBreakdown::coaching_salaries)
      .def_ro("stadium_maintenance", &fc::ExpenseBreakdown::stadium_maintenance)
      .def_ro("travel", &fc::ExpenseBreakdown::travel)
      .def_ro("marketing", &fc::ExpenseBreakdown::marketing)
      .def_ro("debt_service", &fc::ExpenseBreakdown::debt_service)
      .def_ro("total", &fc::ExpenseBreakdown::total);
  nb::class_<fc::FinancialSimulationResult>(m, "FinancialSimulationResult")
      .def_ro("revenue", &fc::FinancialSimulationResult::revenue)
      .def_ro("expenses", &fc::FinancialSimulationResult::expenses)
      .def_ro("net_income", &fc::FinancialSimulationResult::net_income)
      .def_ro("new_reserves", &fc::FinancialSimulationResult::new_reserves)
      .def_ro("debt_level", &fc::FinancialSimulationResult::debt_level)
      .def_ro("debt_ratio", &fc::FinancialSimulationResult::debt_ratio)
      .def_ro("bankruptcy_risk", &fc::FinancialSimulationResult::bankruptcy_risk)
      .def("__repr__", [](const fc::FinancialSimulationResult &r) {
        return fmt::format("FinancialSimulationResult(net_income={}, new_reserves={}, risk={})",
                           r.net_income, r.new_reserves,
                           fc::bankruptcy_risk_name(r.bankruptcy_risk));
      });
  nb::class_<fc::BankruptcyStatus>(m, "BankruptcyStatus")
      .def_ro("is_bankrupt", &fc::BankruptcyStatus::is_bankrupt)
      .def_ro("debt_ratio", &fc::BankruptcyStatus::debt_ratio)
      .def_ro("risk_level", &fc::BankruptcyStatus::risk_level)
      .def_ro("message", &fc::BankruptcyStatus::message)
      .def_ro("recovery_options", &fc::BankruptcyStatus::recovery_options);

  m.def("simulate_finances",
        [](const std::vector<fc::Player> &players, const fc::Franchise &f,
           const fc::CityState &city, std::int64_t attendance, bool won_championship,
           std::int64_t marketing) {
          return fc::simulate_finances(players, f, city, attendance, won_championship,
                                       marketing);
        },
        nb::arg("players"), nb::arg("franchise"), nb::arg("city_state"),
        nb::arg("total_attendance"), nb::arg("won_championship"), nb::arg("marketing_spend"));
  m.def("check_bankruptcy_status",
        [](std::int64_t reserves, std::int64_t budget) {
          return fc::check_bankruptcy_status(reserves, budget);
        },
        nb::arg("reserves"), nb::arg("budget"));
  m.def("calculate_player_salary",
        [](int current, int potential, fc::Tier tier, int age) {
          return fc::calculate_player_salary(current, potential, tier, age);
        },
        nb::arg("current_rating"), nb::arg("potential"), nb::arg("tier"), nb::arg("age"));
}

void bind_progression(nb::module_ &m) {
  nb::enum_<fc::GameStatus>(m, "GameStatus")
      .value("ACTIVE", fc::GameStatus::Active)
      .value("GAME_OVER", fc::GameStatus::GameOver)
      .value("PROMOTED", fc::GameStatus::Promoted)
      .value("CHAMPION", fc::GameStatus::Champion);
  nb::enum_<fc::DebtWarningLevel>(m, "DebtWarningLevel")
      .value("NONE", fc::DebtWarningLevel::None)
      .value("LOW", fc::DebtWarningLevel::Low)
      .value("MEDIUM", fc::DebtWarningLevel::Medium)
      .value("HIGH", fc::DebtWarningLevel::High)
      .value("CRITICAL", fc::DebtWarningLevel::Critical);

  nb::class_<fc::RequirementCheck>(m, "RequirementCheck")
      .def_ro("criterion", &fc::RequirementCheck::criterion)
      .def_ro("required", &fc::RequirementCheck::required)
      .def_ro("actual", &fc::RequirementCheck::actual)
      .def_ro("met", &fc::RequirementCheck::met);
  nb::class_<fc::PromotionInput>(m, "PromotionInput")
      .def(nb::init<>())
      .def_rw("tier", &fc::PromotionInput::tier)
      .def_rw("win_pct", &fc::PromotionInput::win_pct)
      .def_rw("reserves", &fc::PromotionInput::reserves)
      .def_rw("city_pride", &fc::PromotionInput::city_pride)
      .def_rw("consecutive_winning_seasons", &fc::PromotionInput::consecutive_winning_seasons)
      .def_rw("won_division", &fc::PromotionInput::won_division)
      .def_rw("won_championship", &fc::PromotionInput::won_championship);
  nb::class_<fc::PromotionEligibility>(m, "PromotionEligibility")
      .def_ro("is_eligible", &fc::PromotionEligibility::is_eligible)
      .def_ro("next_tier", &fc::PromotionEligibility::next_tier)
      .def_ro("met_criteria", &fc::PromotionEligibility::met_criteria)
      .def_ro("missing_criteria", &fc::PromotionEligibility::missing_criteria)
      .def_ro("requirements", &fc::PromotionEligibility::requirements);
  nb::class_<fc::GameStatusCheck>(m, "GameStatusCheck")
      .def_ro("status", &fc::GameStatusCheck::status)
      .def_ro("reason", &fc::GameStatusCheck::reason)
      .def_ro("total_debt", &fc::GameStatusCheck::total_debt)
      .def_ro("debt_threshold", &fc::GameStatusCheck::debt_threshold)
      .def_ro("is_in_debt", &fc::GameStatusCheck::is_in_debt)
      .def_ro("is_bankrupt", &fc::GameStatusCheck::is_bankrupt);
  nb::class_<fc::PromotionBonuses>(m, "PromotionBonuses")
      .def_ro("budget_increase", &fc::PromotionBonuses::budget_increase)
      .def_ro("stadium_capacity_increase", &fc::PromotionBonuses::stadium_capacity_increase)
      .def_ro("pride_boost", &fc::PromotionBonuses::pride_boost);
  nb::class_<fc::DebtWarning>(m, "DebtWarning")
      .def_ro("level", &fc::DebtWarning::level)
      .def_ro("message", &fc::DebtWarning::message)
      .def_ro("debt_percent", &fc::DebtWarning::debt_percent);
  nb::class_<fc::PromotionResult>(m, "PromotionResult")
      .def_ro("ok", &fc::PromotionResult::ok)
      .def_ro("reason", &fc::PromotionResult::reason)
      .def_ro("previous_tier", &fc::PromotionResult::previous_tier)
      .def_ro("new_tier", &fc::PromotionResult::new_tier)
      .def_ro("bonuses", &fc::PromotionResult::bonuses)
      .def_ro("franchise", &fc::PromotionResult::franchise)
      .def_ro("city", &fc::PromotionResult::city);

  m.def("check_promotion_eligibility",
        [](fc::Tier tier, double win_pct, std::int64_t reserves, int pride, int years,
           bool won_division, bool won_championship) {
          fc::PromotionInput in{tier, win_pct, reserves, pride, years, won_division,
                                won_championship};
          return fc::check_promotion_eligibility(in);
        },
        nb::arg("tier"), nb::arg("win_pct"), nb::arg("reserves"), nb::arg("city_pride"),
        nb::arg("consecutive_winning_seasons"), nb::arg("won_division") = false,
        nb::arg("won_championship") = false);
  m.def("check_game_status",
        [](std::int64_t reserves, std::int64_t budget, fc::Tier tier, bool champion) {
          return fc::check_game_status(reserves, budget, tier, champion);
        },
        nb::arg("reserves"), nb::arg("annual_budget"), nb::arg("tier"),
        nb::arg("won_mlb_championship") = false);
  m.def("calculate_promotion_bonuses",
        [](fc::Tier from, fc::Tier to) { return fc::calculate_promotion_bonuses(from, to); });
  m.def("debt_warning",
        [](std::int64_t reserves, std::int64_t budget) { return fc::debt_warning(reserves, budget); });
  m.def("progress_to_next_tier",
        [](const fc::PromotionInput &in) { return fc::progress_to_next_tier(in); });
  m.def("apply_promotion", [](const fc::Franchise &f, const fc::CityState &c) {
    return fc::apply_promotion(f, c);
  });
}

void bind_offseason(nb::module_ &m) {
  nb::class_<fc::SeasonStats>(m, "SeasonStats")
      .def(nb::init<>())
      .def_rw("games_played", &fc::SeasonStats::games_played)
      .def_rw("at_bats", &fc::SeasonStats::at_bats)
      .def_rw("hits", &fc::SeasonStats::hits)
      .def_rw("home_runs", &fc::SeasonStats::home_runs)
      .def_rw("rbi", &fc::SeasonStats::rbi)
      .def_rw("runs", &fc::SeasonStats::runs)
      .def_rw("stolen_bases", &fc::SeasonStats::stolen_bases)
      .def_rw("obp", &fc::SeasonStats::obp)
      .def_rw("slg", &fc::SeasonStats::slg)
      .def_rw("wins", &fc::SeasonStats::wins)
      .def_rw("losses", &fc::SeasonStats::losses)
      .def_rw("era", &fc::SeasonStats::era)
      .def_rw("innings", &fc::SeasonStats::innings)
      .def_rw("strikeouts", &fc::SeasonStats::strikeouts)
      .def_rw("walks", &fc::SeasonStats::walks)
      .def_rw("saves", &fc::SeasonStats::saves);
  nb::class_<fc::SeasonStatsSummary>(m, "SeasonStatsSummary")
      .def_ro("year", &fc::SeasonStatsSummary::year)
      .def_ro("tier", &fc::SeasonStatsSummary::tier)
      .def_ro("player_type", &fc::SeasonStatsSummary::player_type)
      .def_ro("games_played", &fc::SeasonStatsSummary::games_played)
      .def_ro("avg", &fc::SeasonStatsSummary::avg)
      .def_ro("obp", &fc::SeasonStatsSummary::obp)
      .def_ro("slg", &fc::SeasonStatsSummary::slg)
      .def_ro("home_runs", &fc::SeasonStatsSummary::home_runs)
      .def_ro("era", &fc::SeasonStatsSummary::era)
      .def_ro("wins", &fc::SeasonStatsSummary::wins)
      .def_ro("strikeouts", &fc::SeasonStatsSummary::strikeouts);
  m.def("archive_season_stats", &fc::archive_season_stats, nb::arg("season"),
        nb::arg("career"), nb::arg("year"), nb::arg("tier"), nb::arg("player_type"));

  nb::class_<fc::PlayerSeasonRecord>(m, "PlayerSeasonRecord")
      .def(nb::init<>())
      .def_rw("team_name", &fc::PlayerSeasonRecord::team_name)
      .def_rw("wins", &fc::PlayerSeasonRecord::wins)
      .def_rw("losses", &fc::PlayerSeasonRecord::losses);
  nb::class_<fc::DraftOrderEntry>(m, "DraftOrderEntry")
      .def_ro("pick_number", &fc::DraftOrderEntry::pick_number)
      .def_ro("team_id", &fc::DraftOrderEntry::team_id)
      .def_ro("team_name", &fc::DraftOrderEntry::team_name)
      .def_ro("previous_season_wins", &fc::DraftOrderEntry::previous_season_wins)
      .def_ro("previous_season_losses", &fc::DraftOrderEntry::previous_season_losses)
      .def_ro("win_pct", &fc::DraftOrderEntry::win_pct);
  m.def("generate_draft_order",
        [](const fc::PlayerSeasonRecord &rec, const std::vector<fc::AITeam> &teams, int year,
           fc::UniformSource &rng) { return fc::generate_draft_order(rec, teams, year, rng); },
        nb::arg("player_record"), nb::arg("ai_teams"), nb::arg("year"), nb::arg("rng"));
  m.def("player_draft_position",
        [](const std::vector<fc::DraftOrderEntry> &order) {
          return fc::player_draft_position(order);
        });

  nb::enum_<fc::PlayoffResult>(m, "PlayoffResult")
      .value("CHAMPION", fc::PlayoffResult::Champion)
      .value("FINALS", fc::PlayoffResult::Finals)
      .value("SEMIFINALS", fc::PlayoffResult::Semifinals)
      .value("MISSED", fc::PlayoffResult::Missed);
  nb::enum_<fc::RemovalKind>(m, "RemovalKind")
      .value("RETIRED", fc::RemovalKind::Retired)
      .value("RELEASED", fc::RemovalKind::Released);

  nb::class_<fc::WinterDevelopmentResult>(m, "WinterDevelopmentResult")
      .def_ro("player_id", &fc::WinterDevelopmentResult::player_id)
      .def_ro("player_name", &fc::WinterDevelopmentResult::player_name)
      .def_ro("age", &fc::WinterDevelopmentResult::age)
      .def_ro("previous_rating", &fc::WinterDevelopmentResult::previous_rating)
      .def_ro("new_rating", &fc::WinterDevelopmentResult::new_rating)
      .def_ro("rating_change", &fc::WinterDevelopmentResult::rating_change)
      .def_ro("reason", &fc::WinterDevelopmentResult::reason);
  nb::class_<fc::ContractExpirationResult>(m, "ContractExpirationResult")
      .def_ro("player_id", &fc::ContractExpirationResult::player_id)
      .def_ro("player_name", &fc::ContractExpirationResult::player_name)
      .def_ro("position", &fc::ContractExpirationResult::position)
      .def_ro("previous_rating", &fc::ContractExpirationResult::previous_rating)
      .def_ro("became_free_agent", &fc::ContractExpirationResult::became_free_agent);
  nb::class_<fc::RosterRemoval>(m, "RosterRemoval")
      .def_ro("player_id", &fc::RosterRemoval::player_id)
      .def_ro("player_name", &fc::RosterRemoval::player_name)
      .def_ro("kind", &fc::RosterRemoval::kind)
      .def_ro("reason", &fc::RosterRemoval::reason);
  nb::class_<fc::WinterChange>(m, "WinterChange")
      .def_ro("rating_change", &fc::WinterChange::rating_change)
      .def_ro("reason", &fc::WinterChange::reason);
  m.def("calculate_winter_development", &fc::calculate_winter_development, nb::arg("age"),
        nb::arg("current_rating"), nb::arg("potential"), nb::arg("work_ethic"), nb::arg("rng"));

  nb::class_<fc::AgingResult>(m, "AgingResult")
      .def_ro("players", &fc::AgingResult::players)
      .def_ro("winter_development", &fc::AgingResult::winter_development)
      .def_ro("contract_expirations", &fc::AgingResult::contract_expirations);
  m.def("age_roster", &fc::age_roster, nb::arg("players"), nb::arg("rng"));
  m.def("roster_removals",
        [](const std::vector<fc::Player> &aged) { return fc::roster_removals(aged); },
        nb::arg("players"));

  m.def("determine_playoff_result", &fc::determine_playoff_result, nb::arg("made_playoffs"),
        nb::arg("champion_team_id").none(), nb::arg("finals_winner_id").none(),
        nb::arg("player_team_id") = "player");

  nb::class_<fc::MvpCandidate>(m, "MvpCandidate")
      .def(nb::init<>())
      .def_rw("player_id", &fc::MvpCandidate::player_id)
      .def_rw("name", &fc::MvpCandidate::name)
      .def_rw("player_type", &fc::MvpCandidate::player_type)
      .def_rw("season", &fc::MvpCandidate::season)
      .def_rw("current_rating", &fc::MvpCandidate::current_rating);
  m.def("calculate_mvp_score", &fc::calculate_mvp_score);
  m.def("determine_season_mvp", &fc::determine_season_mvp);

  nb::class_<fc::TeamHistoryEntry>(m, "TeamHistoryEntry")
      .def_ro("year", &fc::TeamHistoryEntry::year)
      .def_ro("tier", &fc::TeamHistoryEntry::tier)
      .def_ro("wins", &fc::TeamHistoryEntry::wins)
      .def_ro("losses", &fc::TeamHistoryEntry::losses)
      .def_ro("win_pct", &fc::TeamHistoryEntry::win_pct)
      .def_ro("league_rank", &fc::TeamHistoryEntry::league_rank)
      .def_ro("made_playoffs", &fc::TeamHistoryEntry::made_playoffs)
      .def_ro("playoff_result", &fc::TeamHistoryEntry::playoff_result)
      .def_ro("total_revenue", &fc::TeamHistoryEntry::total_revenue)
      .def_ro("total_expenses", &fc::TeamHistoryEntry::total_expenses)
      .def_ro("net_income", &fc::TeamHistoryEntry::net_income)
      .def_ro("avg_attendance", &fc::TeamHistoryEntry::avg_attendance)
      .def_ro("mvp_player_id", &fc::TeamHistoryEntry::mvp_player_id)
      .def_ro("mvp_player_name", &fc::TeamHistoryEntry::mvp_player_name);

  nb::class_<fc::OffseasonInput>(m, "OffseasonInput")
      .def(nb::init<>())
      .def_rw("year", &fc::OffseasonInput::year)
      .def_rw("tier", &fc::OffseasonInput::tier)
      .def_rw("record", &fc::OffseasonInput::record)
      .def_rw("league_rank", &fc::OffseasonInput::league_rank)
      .def_rw("made_playoffs", &fc::OffseasonInput::made_playoffs)
      .def_rw("playoff_result", &fc::OffseasonInput::playoff_result)
      .def_rw("total_revenue", &fc::OffseasonInput::total_revenue)
      .def_rw("total_expenses", &fc::OffseasonInput::total_expenses)
      .def_rw("avg_attendance", &fc::OffseasonInput::avg_attendance)
      .def_rw("players", &fc::OffseasonInput::players)
      .def_rw("season_stats", &fc::OffseasonInput::season_stats)
      .def_rw("career_stats", &fc::OffseasonInput::career_stats)
      .def_rw("ai_teams", &fc::OffseasonInput::ai_teams);
  nb::class_<fc::OffseasonSummary>(m, "OffseasonSummary")
      .def_ro("previous_year", &fc::OffseasonSummary::previous_year)
      .def_ro("new_year", &fc::OffseasonSummary::new_year)
      .def_ro("team_history", &fc::OffseasonSummary::team_history)
      .def_ro("players", &fc::OffseasonSummary::players)
      .def_ro("career_stats", &fc::OffseasonSummary::career_stats)
      .def_ro("winter_development", &fc::OffseasonSummary::winter_development)
      .def_ro("contract_expirations", &fc::OffseasonSummary::contract_expirations)
      .def_ro("removals", &fc::OffseasonSummary::removals)
      .def_ro("draft_order", &fc::OffseasonSummary::draft_order)
      .def_ro("player_draft_position", &fc::OffseasonSummary::player_draft_position);
  m.def("run_offseason_rollover",
        [](const fc::OffseasonInput &in, fc::UniformSource &rng) {
          return fc::run_offseason_rollover(in, rng);
        },
        nb::arg("input"), nb::arg("rng"));
}

} // namespace

NB_MODULE(franchise_core, m) {
  m.doc() = "Franchise-management simulation engine.";

  nb::enum_<fc::LogLevel>(m, "LogLevel")
      .value("DEBUG", fc::LogLevel::Debug)
      .value("INFO", fc::LogLevel::Info)
      .value("WARN", fc::LogLevel::Warn)
      .value("OFF", fc::LogLevel::Off);
  m.def("set_log_level", &fc::set_log_level);
  m.def("log_level", &fc::log_level);

  bind_random(m);
  bind_player(m);
  bind_league(m);
  bind_draft(m);
  bind_training(m);
  bind_finance(m);
  bind_progression(m);
  bind_offseason(m);
}
