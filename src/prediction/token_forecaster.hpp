// File: src/prediction/token_forecaster.hpp
//
// Token Forecaster
//
// Predicts context-window growth from per-turn features and turns the
// prediction into an extraction recommendation. Per-turn growth is a
// weighted linear combination:
//
//   g = 0.4*c1*tpm + 0.3*c2*(tpm*complexity_impact)
//     + 0.2*c3*tool + 0.1*c4*(tpm*time_of_day_factor)
//
// where the coefficients c start at their priors and are refit by
// ridge-regularised least squares from recorded outcomes.

#pragma once

#include "core/types.hpp"
#include "storage/state_database.hpp"
#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ctxmem {

/// Task complexity class of the current work
enum class TaskComplexity : uint8_t {
    SIMPLE = 0,
    MEDIUM = 1,
    COMPLEX = 2
};

/// Convert TaskComplexity to string
const char* ToString(TaskComplexity complexity);

/// Parse TaskComplexity from string
std::optional<TaskComplexity> ParseTaskComplexity(const std::string& str);

/// What the host should do about the context window
enum class ForecastRecommendation : uint8_t {
    CONTINUE = 0,
    EXTRACT_SOON = 1,
    EXTRACT_NOW = 2,
    EMERGENCY = 3
};

/// Convert ForecastRecommendation to string
const char* ToString(ForecastRecommendation recommendation);

/// Time-of-day multiplier: 1 + 0.2*cos(2*pi*(hour - 9)/24)
double TimeOfDayFactor(int hour);

/// Inputs to a forecast
struct ForecastMetrics {
    uint64_t current_tokens{0};
    double tokens_per_message{0.0};
    TaskComplexity complexity{TaskComplexity::MEDIUM};
    double avg_tool_result_tokens{0.0};

    /// Local hour [0, 23]; taken from the forecast time when unset
    std::optional<int> hour_of_day;

    /// Hard context limit; the forecaster default when unset
    std::optional<uint64_t> token_limit;
};

/// Forecast output
struct ForecastResult {
    uint64_t predicted_tokens_in_5{0};
    uint64_t predicted_tokens_in_10{0};

    /// Turns until 85% / 95% of the limit (0 if already there, nullopt if never)
    std::optional<uint64_t> messages_until_85;
    std::optional<uint64_t> messages_until_95;

    /// Minutes until the 85% threshold at the configured turn pace
    std::optional<double> estimated_minutes_until_threshold;

    double growth_per_message{0.0};
    double confidence{0.0};
    ForecastRecommendation recommendation{ForecastRecommendation::CONTINUE};
    std::string reasoning;
};

/// Observed outcome for a set of features
struct TrainingDataPoint {
    double tokens_per_message{0.0};
    TaskComplexity complexity{TaskComplexity::MEDIUM};
    double avg_tool_result_tokens{0.0};
    double time_of_day_factor{1.0};
    uint64_t current_tokens{0};
    uint64_t actual_tokens_after_5{0};
    uint64_t actual_tokens_after_10{0};
    Timestamp timestamp;

    /// Observed per-turn growth (mean of the 5- and 10-turn rates)
    double ObservedGrowth() const;
};

class TokenForecaster {
public:
    /// Configuration for TokenForecaster
    struct Config {
        /// Directory for training.db (empty: in-memory only)
        std::string storage_dir;

        /// Default hard context limit
        uint64_t token_limit{200000};

        /// Samples required before coefficients are refit
        size_t min_training_samples{10};

        /// Samples per complexity class before its impact is learned
        size_t min_complexity_samples{3};

        /// Ridge strength, relative to the mean feature energy
        double ridge_strength{0.1};

        /// Training data retention (days)
        double retention_days{90.0};

        /// Minutes per host turn, for time-to-threshold estimates
        double minutes_per_message{2.0};

        /// Thresholds as fractions of the limit
        double extract_soon_threshold{0.85};
        double extract_now_threshold{0.95};

        /// Prior coefficients c1..c4
        std::array<double, 4> prior_coefficients{{1.0, 1.0, 1.0, 1.0}};

        /// Prior complexity impacts (simple, medium, complex)
        std::array<double, 3> prior_complexity_impact{{0.8, 1.0, 1.4}};

        /// Emit informational log lines
        bool verbose{false};

        bool IsValid() const;
    };

    /// Construct with default configuration (in-memory)
    TokenForecaster();

    /// Construct with custom configuration
    /// @throws std::invalid_argument if config is invalid
    explicit TokenForecaster(const Config& config);

    TokenForecaster(const TokenForecaster&) = delete;
    TokenForecaster& operator=(const TokenForecaster&) = delete;

    /// Load persisted training data and refit
    void Initialize();

    /// Predict growth and recommend an action
    ///
    /// Never fails for lack of history; confidence reflects the sample count.
    ForecastResult Forecast(const ForecastMetrics& metrics, Timestamp now = Timestamp::Now()) const;

    /// Record what actually happened after a forecast, then refit
    ///
    /// @param metrics Features at the time of the forecast
    /// @param actual_after_5 Context size 5 turns later
    /// @param actual_after_10 Context size 10 turns later
    void RecordOutcome(const ForecastMetrics& metrics,
                       uint64_t actual_after_5,
                       uint64_t actual_after_10,
                       Timestamp now = Timestamp::Now());

    /// Drop training points older than the retention window, then refit
    /// @return Number of points removed
    size_t PruneTrainingData(Timestamp now = Timestamp::Now());

    /// Per-turn growth for metrics under the current model
    double PredictGrowth(const ForecastMetrics& metrics, Timestamp now = Timestamp::Now()) const;

    /// Confidence for the current sample count
    double GetConfidence() const;

    const std::array<double, 4>& GetCoefficients() const { return coefficients_; }
    double GetComplexityImpact(TaskComplexity complexity) const;
    size_t GetTrainingSampleCount() const { return training_data_.size(); }
    const std::vector<TrainingDataPoint>& GetTrainingData() const { return training_data_; }
    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::vector<TrainingDataPoint> training_data_;
    std::array<double, 4> coefficients_;
    std::array<double, 3> complexity_impact_;
    std::unique_ptr<StateDatabase> db_;

    void OpenDatabase();
    void PersistPoint(const TrainingDataPoint& point);
    void Refit();

    /// Weighted feature vector for one set of inputs
    std::array<double, 4> Features(double tpm, TaskComplexity complexity,
                                   double tool, double tod_factor) const;
};

} // namespace ctxmem
