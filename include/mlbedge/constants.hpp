#pragma once

#include <cstddef>

/// @file include/mlbedge/constants.hpp
/// @brief League priors, model hyperparameters and numeric bounds.
///
/// Every tunable number the projection-and-edge pipeline relies on lives
/// here.  Anything that varies by risk appetite belongs in RiskProfile, not
/// in this file.

namespace mlbedge::constants {

// ─── League Averages (priors) ─────────────────────────────────────────────────

static constexpr double LEAGUE_ERA             = 4.30;
static constexpr double LEAGUE_FIP             = 4.20;
static constexpr double LEAGUE_BULLPEN_ERA     = 4.20;
static constexpr double LEAGUE_RPG             = 4.60;
static constexpr double LEAGUE_OPS             = 0.715;
static constexpr double LEAGUE_ERRORS_PER_GAME = 0.55;
static constexpr double LEAGUE_FPCT            = 0.985;

// ─── Empirical Bayes prior weights ("virtual sample sizes") ───────────────────

/// Innings of league-average pitching the ERA prior is worth.
static constexpr double EB_INNINGS = 20.0;

/// Games of league-average team performance the offense/defense prior is worth.
static constexpr double EB_GAMES = 162.0;

// ─── Sample-size thresholds ───────────────────────────────────────────────────

static constexpr double MIN_IP_CONFIDENT         = 25.0;
static constexpr double MIN_GAMES_CONFIDENT      = 40.0;
static constexpr double MIN_BULLPEN_IP_CONFIDENT = 30.0;

/// A starter on fewer days of rest than this is flagged as fatigued.
static constexpr int MIN_DAYS_REST = 4;

// ─── Run projection model ─────────────────────────────────────────────────────

/// Floor on a team's projected runs.  Projections are never zero or negative.
static constexpr double MIN_RUNS = 0.1;

/// Weight of the handedness split index vs the team-wide OPS index.
static constexpr double WEIGHT_SPLIT = 0.60;

/// Damping of the last-30-days form ratio.
static constexpr double WEIGHT_RECENT_30 = 0.20;

/// Exponent applied to (pitcher ERA / league ERA).
static constexpr double PITCHER_SENSITIVITY = 1.00;

/// Slope of the opposing-defense factor per error/game above league average.
static constexpr double DEFENSE_SENSITIVITY = 0.25;

/// Scale of the head-to-head run adjustment.
static constexpr double H2H_SENSITIVITY = 0.05;

static constexpr double SPLIT_FACTOR_MIN   = 0.6;
static constexpr double SPLIT_FACTOR_MAX   = 1.4;
static constexpr double RECENT_FACTOR_MIN  = 0.7;
static constexpr double RECENT_FACTOR_MAX  = 1.3;
static constexpr double PITCHER_FACTOR_MIN = 0.6;
static constexpr double PITCHER_FACTOR_MAX = 1.7;
static constexpr double DEFENSE_FACTOR_MIN = 0.8;
static constexpr double DEFENSE_FACTOR_MAX = 1.2;

static constexpr double PROJECTION_CONFIDENCE_MIN = 0.2;
static constexpr double PROJECTION_CONFIDENCE_MAX = 1.0;

// ─── Context ──────────────────────────────────────────────────────────────────

static constexpr double DEFAULT_PARK_FACTOR      = 1.00;
static constexpr double PARK_FACTOR_MIN          = 0.8;
static constexpr double PARK_FACTOR_MAX          = 1.4;
static constexpr double WEATHER_TEMP_NEUTRAL_C   = 22.0;
static constexpr double WEATHER_WIND_NEUTRAL_KPH = 10.0;
static constexpr double WEATHER_RUNS_PER_DEGREE  = 0.005;
static constexpr double WEATHER_RUNS_PER_KPH     = 0.002;
static constexpr double BACK_TO_BACK_PENALTY     = 0.05;
static constexpr double CONTEXT_BASE_CONFIDENCE  = 0.70;

// ─── Head-to-head ─────────────────────────────────────────────────────────────

static constexpr double H2H_BASE_CONFIDENCE = 0.35;
static constexpr std::size_t H2H_LOW_SAMPLE_GAMES = 5;

// ─── Simulation ───────────────────────────────────────────────────────────────

static constexpr std::size_t DEFAULT_TRIALS = 50'000;
static constexpr int STARTER_INNINGS = 6;
static constexpr int BULLPEN_INNINGS = 3;
static constexpr double BULLPEN_FACTOR_MIN = 0.8;
static constexpr double BULLPEN_FACTOR_MAX = 1.2;

// ─── Market evaluation ────────────────────────────────────────────────────────

static constexpr double PENALTY_PER_FLAG   = 0.035;
static constexpr double MAX_FLAG_PENALTY   = 0.12;
static constexpr double MODEL_PROB_FLOOR   = 0.05;
static constexpr double MODEL_PROB_CEILING = 0.95;

/// Decimal odds at or above this are rejected as malformed.
static constexpr double MAX_DECIMAL_ODDS = 100.0;

// ─── Correlation ──────────────────────────────────────────────────────────────

static constexpr double CORRELATION_MAX_BOOST   = 0.07;
static constexpr double CORRELATION_MAX_PENALTY = -0.07;
static constexpr double CORRELATION_DEADBAND    = 0.6;

// ─── Backtest ─────────────────────────────────────────────────────────────────

static constexpr double DEFAULT_BANKROLL = 10'000.0;
static constexpr double BETS_PER_YEAR    = 250.0;

// ─── Numerical Tolerances ─────────────────────────────────────────────────────

static constexpr double FLOAT_EPSILON = 1e-12;

} // namespace mlbedge::constants
