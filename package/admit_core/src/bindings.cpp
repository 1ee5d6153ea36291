#include "admit_core/client.hpp"
#include "admit_core/config.hpp"
#include "admit_core/diagnostics.hpp"
#include "admit_core/driver.hpp"
#include "admit_core/feasibility.hpp"
#include "admit_core/log.hpp"
#include "admit_core/simulator.hpp"
#include "admit_core/slack.hpp"
#include "admit_core/state.hpp"
#include "admit_core/strategy.hpp"
#include <fmt/format.h>
#include <nanobind/nanobind.h>
#include <nanobind/eigen/dense.h>
#include <nanobind/stl/map.h>
#include <nanobind/stl/optional.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/unique_ptr.h>
#include <nanobind/stl/unordered_map.h>
#include <nanobind/stl/vector.h>

NB_MODULE(admit_core, m) {
  m.doc() = "Online admission decisions under minimum-count quotas.";

  nanobind::exception<admit_core::UnknownConstraint>(m, "UnknownConstraint",
                                                     PyExc_KeyError);
  nanobind::exception<admit_core::GameFinished>(m, "GameFinished");
  nanobind::exception<admit_core::TransientClientError>(m,
                                                        "TransientClientError");

  // Logging
  nanobind::enum_<admit_core::LogLevel>(m, "LogLevel")
      .value("Debug", admit_core::LogLevel::Debug)
      .value("Info", admit_core::LogLevel::Info)
      .value("Warn", admit_core::LogLevel::Warn)
      .value("Error", admit_core::LogLevel::Error)
      .value("Off", admit_core::LogLevel::Off);
  m.def("set_log_level", &admit_core::set_log_level);
  m.def("log_level", &admit_core::log_level);

  // Data model
  nanobind::class_<admit_core::Constraint>(m, "Constraint")
      .def(nanobind::init<>())
      .def(nanobind::init<std::string, int>())
      .def_rw("attribute", &admit_core::Constraint::attribute)
      .def_rw("min_count", &admit_core::Constraint::min_count)
      .def("__repr__", [](const admit_core::Constraint &c) {
        return fmt::format("Constraint(attribute={}, min_count={})",
                           c.attribute, c.min_count);
      });

  nanobind::class_<admit_core::AttributeStatistics>(m, "AttributeStatistics")
      .def(nanobind::init<>())
      .def_rw("relative_frequencies",
              &admit_core::AttributeStatistics::relative_frequencies)
      .def_rw("correlations", &admit_core::AttributeStatistics::correlations)
      .def("probability", &admit_core::AttributeStatistics::probability)
      .def("correlation", &admit_core::AttributeStatistics::correlation);

  nanobind::class_<admit_core::Person>(m, "Person")
      .def(nanobind::init<>())
      .def(nanobind::init<std::int64_t, std::unordered_map<std::string, bool>>())
      .def_rw("index", &admit_core::Person::index)
      .def_rw("attributes", &admit_core::Person::attributes)
      .def("has", &admit_core::Person::has)
      .def("__repr__", [](const admit_core::Person &p) {
        return fmt::format("Person(index={}, attributes={})", p.index,
                           p.attributes.size());
      });

  nanobind::class_<admit_core::CurrentState>(m, "CurrentState")
      .def(nanobind::init<>())
      .def_rw("admitted_count", &admit_core::CurrentState::admitted_count)
      .def_rw("rejected_count", &admit_core::CurrentState::rejected_count)
      .def_rw("admitted_attributes",
              &admit_core::CurrentState::admitted_attributes)
      .def_rw("constraints", &admit_core::CurrentState::constraints)
      .def_rw("statistics", &admit_core::CurrentState::statistics)
      .def_rw("venue_capacity", &admit_core::CurrentState::venue_capacity)
      .def("processed", &admit_core::CurrentState::processed)
      .def("seats_left", &admit_core::CurrentState::seats_left)
      .def("__repr__", [](const admit_core::CurrentState &s) {
        return fmt::format("CurrentState(admitted={}, rejected={}, "
                           "constraints={})",
                           s.admitted_count, s.rejected_count,
                           s.constraints.size());
      });

  m.def("init_state", &admit_core::init_state, nanobind::arg("constraints"),
        nanobind::arg("statistics"),
        nanobind::arg("venue_capacity") = admit_core::kVenueCapacity);
  m.def("record_decision", &admit_core::record_decision);
  m.def("sync_counts", &admit_core::sync_counts);
  m.def("compute_deficits", &admit_core::compute_deficits);

  // Feasibility and slack
  nanobind::class_<admit_core::SafetySchedule>(m, "SafetySchedule")
      .def(nanobind::init<>())
      .def_rw("scheduled", &admit_core::SafetySchedule::scheduled)
      .def_rw("fixed_z", &admit_core::SafetySchedule::fixed_z)
      .def_rw("early_z", &admit_core::SafetySchedule::early_z)
      .def_rw("mid_z", &admit_core::SafetySchedule::mid_z)
      .def_rw("late_z", &admit_core::SafetySchedule::late_z)
      .def("z_for", &admit_core::SafetySchedule::z_for)
      .def_static("fixed", &admit_core::SafetySchedule::fixed);

  nanobind::class_<admit_core::FeasibilityPerAttr>(m, "FeasibilityPerAttr")
      .def_ro("attribute", &admit_core::FeasibilityPerAttr::attribute)
      .def_ro("need", &admit_core::FeasibilityPerAttr::need)
      .def_ro("probability", &admit_core::FeasibilityPerAttr::probability)
      .def_ro("expected", &admit_core::FeasibilityPerAttr::expected)
      .def_ro("sd", &admit_core::FeasibilityPerAttr::sd)
      .def_ro("slack", &admit_core::FeasibilityPerAttr::slack)
      .def_ro("feasible", &admit_core::FeasibilityPerAttr::feasible);

  nanobind::class_<admit_core::FeasibilityResult>(m, "FeasibilityResult")
      .def_ro("feasible", &admit_core::FeasibilityResult::feasible)
      .def_ro("seats_remaining", &admit_core::FeasibilityResult::seats_remaining)
      .def_ro("z", &admit_core::FeasibilityResult::z)
      .def_ro("per_attr", &admit_core::FeasibilityResult::per_attr)
      .def_ro("min_slack_attr", &admit_core::FeasibilityResult::min_slack_attr)
      .def_ro("min_slack", &admit_core::FeasibilityResult::min_slack);

  m.def(
      "evaluate_decision_feasibility",
      [](const admit_core::CurrentState &state,
         std::optional<admit_core::Person> person, bool accept_seat,
         const admit_core::SafetySchedule &safety) {
        return admit_core::evaluate_decision_feasibility(
            state, state.statistics, person ? &*person : nullptr, accept_seat,
            safety);
      },
      nanobind::arg("state"), nanobind::arg("person").none(),
      nanobind::arg("accept_seat"),
      nanobind::arg("safety") = admit_core::SafetySchedule{});

  m.def(
      "calculate_all_slacks",
      [](const admit_core::CurrentState &state,
         const admit_core::SafetySchedule &safety) {
        return admit_core::calculate_all_slacks(state, safety).slacks;
      },
      nanobind::arg("state"),
      nanobind::arg("safety") = admit_core::SafetySchedule{});

  // Decisions
  nanobind::class_<admit_core::DualScoring>(m, "DualScoring")
      .def_ro("total_value", &admit_core::DualScoring::total_value)
      .def_ro("shadow_price_sum", &admit_core::DualScoring::shadow_price_sum)
      .def_ro("seat_cost", &admit_core::DualScoring::seat_cost)
      .def_ro("threshold", &admit_core::DualScoring::threshold)
      .def_ro("helped_attributes", &admit_core::DualScoring::helped_attributes)
      .def_ro("shadow_prices", &admit_core::DualScoring::shadow_prices);

  nanobind::class_<admit_core::LPScoring>(m, "LPScoring")
      .def_ro("feasible", &admit_core::LPScoring::feasible)
      .def_ro("admission_probability",
              &admit_core::LPScoring::admission_probability)
      .def_ro("optimal_value", &admit_core::LPScoring::optimal_value)
      .def_ro("draw", &admit_core::LPScoring::draw)
      .def_ro("active_constraints", &admit_core::LPScoring::active_constraints)
      .def_ro("constraint_slacks", &admit_core::LPScoring::constraint_slacks);

  nanobind::class_<admit_core::FeasibilityScoring>(m, "FeasibilityScoring")
      .def_ro("reject_feasible", &admit_core::FeasibilityScoring::reject_feasible)
      .def_ro("accept_feasible", &admit_core::FeasibilityScoring::accept_feasible)
      .def_ro("reject_slack", &admit_core::FeasibilityScoring::reject_slack)
      .def_ro("accept_slack", &admit_core::FeasibilityScoring::accept_slack)
      .def_ro("reject_bottleneck",
              &admit_core::FeasibilityScoring::reject_bottleneck)
      .def_ro("accept_bottleneck",
              &admit_core::FeasibilityScoring::accept_bottleneck)
      .def_ro("unmet_constraints",
              &admit_core::FeasibilityScoring::unmet_constraints);

  nanobind::class_<admit_core::Scoring>(m, "Scoring")
      .def_ro("dual", &admit_core::Scoring::dual)
      .def_ro("lp", &admit_core::Scoring::lp)
      .def_ro("feasibility", &admit_core::Scoring::feasibility);

  nanobind::class_<admit_core::Decision>(m, "Decision")
      .def_ro("accept", &admit_core::Decision::accept)
      .def_ro("reason", &admit_core::Decision::reason)
      .def_ro("scoring", &admit_core::Decision::scoring)
      .def("__repr__", [](const admit_core::Decision &d) {
        return fmt::format("Decision(accept={}, reason={})", d.accept, d.reason);
      });

  // Strategies
  nanobind::enum_<admit_core::StrategyKind>(m, "StrategyKind")
      .value("DeficitGreedy", admit_core::StrategyKind::DeficitGreedy)
      .value("PacedFeasible", admit_core::StrategyKind::PacedFeasible)
      .value("PacedFeasibleDuals", admit_core::StrategyKind::PacedFeasibleDuals)
      .value("DualPricing", admit_core::StrategyKind::DualPricing)
      .value("PrimalLP", admit_core::StrategyKind::PrimalLP);

  nanobind::class_<admit_core::StrategyConfig>(m, "StrategyConfig")
      .def(nanobind::init<>())
      .def_rw("safety", &admit_core::StrategyConfig::safety)
      .def_rw("dual_update_every", &admit_core::StrategyConfig::dual_update_every)
      .def_rw("fill_when_satisfied",
              &admit_core::StrategyConfig::fill_when_satisfied)
      .def_static("defaults_for", &admit_core::StrategyConfig::defaults_for);

  nanobind::class_<admit_core::AdmissionStrategy>(m, "AdmissionStrategy")
      .def("decide", &admit_core::AdmissionStrategy::decide)
      .def("name", &admit_core::AdmissionStrategy::name);

  m.def("make_strategy",
        nanobind::overload_cast<admit_core::StrategyKind>(
            &admit_core::make_strategy));
  m.def("make_strategy",
        nanobind::overload_cast<admit_core::StrategyKind,
                                const admit_core::StrategyConfig &>(
            &admit_core::make_strategy));
  m.def("parse_strategy_kind", &admit_core::parse_strategy_kind);

  // Simulator and driver
  nanobind::enum_<admit_core::GameStatus>(m, "GameStatus")
      .value("Running", admit_core::GameStatus::Running)
      .value("Completed", admit_core::GameStatus::Completed)
      .value("Failed", admit_core::GameStatus::Failed);

  nanobind::class_<admit_core::NewGame>(m, "NewGame")
      .def_ro("game_id", &admit_core::NewGame::game_id)
      .def_ro("constraints", &admit_core::NewGame::constraints)
      .def_ro("statistics", &admit_core::NewGame::statistics)
      .def_ro("venue_capacity", &admit_core::NewGame::venue_capacity)
      .def_ro("max_rejections", &admit_core::NewGame::max_rejections);

  nanobind::class_<admit_core::DecideAndNextResponse>(m, "DecideAndNextResponse")
      .def_ro("status", &admit_core::DecideAndNextResponse::status)
      .def_ro("admitted_count", &admit_core::DecideAndNextResponse::admitted_count)
      .def_ro("rejected_count", &admit_core::DecideAndNextResponse::rejected_count)
      .def_ro("next_person", &admit_core::DecideAndNextResponse::next_person)
      .def_ro("reason", &admit_core::DecideAndNextResponse::reason);

  nanobind::class_<admit_core::SimulatedGameClient>(m, "SimulatedGameClient")
      .def(nanobind::init<std::uint64_t>(), nanobind::arg("seed") = 42)
      .def("start_new_game", &admit_core::SimulatedGameClient::start_new_game)
      .def("decide_and_next", &admit_core::SimulatedGameClient::decide_and_next,
           nanobind::arg("game_id"), nanobind::arg("person_index"),
           nanobind::arg("accept").none() = nanobind::none())
      .def("cleanup_finished_games", [](admit_core::SimulatedGameClient &c) {
        return c.simulator().cleanup_finished_games();
      });

  nanobind::enum_<admit_core::RunStatus>(m, "RunStatus")
      .value("Completed", admit_core::RunStatus::Completed)
      .value("Failed", admit_core::RunStatus::Failed)
      .value("Finished", admit_core::RunStatus::Finished)
      .value("LimitReached", admit_core::RunStatus::LimitReached);

  nanobind::class_<admit_core::RunConfig>(m, "RunConfig")
      .def(nanobind::init<>())
      .def_rw("scenario", &admit_core::RunConfig::scenario)
      .def_rw("log_summary", &admit_core::RunConfig::log_summary)
      .def_rw("safety", &admit_core::RunConfig::safety);

  nanobind::class_<admit_core::GameResult>(m, "GameResult")
      .def_ro("status", &admit_core::GameResult::status)
      .def_ro("game_id", &admit_core::GameResult::game_id)
      .def_ro("reason", &admit_core::GameResult::reason)
      .def_ro("admitted", &admit_core::GameResult::admitted)
      .def_ro("rejected", &admit_core::GameResult::rejected)
      .def_ro("all_minima_met", &admit_core::GameResult::all_minima_met)
      .def_ro("decisions", &admit_core::GameResult::decisions)
      .def_ro("final_state", &admit_core::GameResult::final_state)
      .def("success", &admit_core::GameResult::success)
      .def("__repr__", [](const admit_core::GameResult &r) {
        return fmt::format("GameResult(status={}, admitted={}, rejected={}, "
                           "all_minima_met={})",
                           admit_core::to_string(r.status), r.admitted,
                           r.rejected, r.all_minima_met);
      });

  m.def(
      "run_game",
      [](admit_core::SimulatedGameClient &client,
         admit_core::AdmissionStrategy &strategy,
         const admit_core::RunConfig &cfg) {
        return admit_core::run_game(client, strategy, cfg);
      },
      nanobind::arg("client"), nanobind::arg("strategy"),
      nanobind::arg("config") = admit_core::RunConfig{});
}
