// File: src/prediction/token_forecaster.cpp
#include "prediction/token_forecaster.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace ctxmem {

namespace {

constexpr double kPi = 3.14159265358979323846;
constexpr double kFeatureWeights[4] = {0.4, 0.3, 0.2, 0.1};

/// Solve A x = b for a 4x4 system (Gaussian elimination, partial pivoting)
/// @return false if A is singular
bool Solve4x4(std::array<std::array<double, 4>, 4> a, std::array<double, 4> b,
              std::array<double, 4>& x) {
    for (size_t col = 0; col < 4; ++col) {
        size_t pivot = col;
        for (size_t row = col + 1; row < 4; ++row) {
            if (std::abs(a[row][col]) > std::abs(a[pivot][col])) {
                pivot = row;
            }
        }
        if (std::abs(a[pivot][col]) < 1e-12) {
            return false;
        }
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);

        for (size_t row = col + 1; row < 4; ++row) {
            double factor = a[row][col] / a[col][col];
            for (size_t k = col; k < 4; ++k) {
                a[row][k] -= factor * a[col][k];
            }
            b[row] -= factor * b[col];
        }
    }

    for (size_t i = 4; i-- > 0;) {
        double sum = b[i];
        for (size_t k = i + 1; k < 4; ++k) {
            sum -= a[i][k] * x[k];
        }
        x[i] = sum / a[i][i];
    }
    return true;
}

std::optional<uint64_t> MessagesUntil(double threshold_tokens, double current, double growth) {
    if (current >= threshold_tokens) {
        return 0;
    }
    if (growth <= 0.0) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(std::ceil((threshold_tokens - current) / growth));
}

} // anonymous namespace

// ============================================================================
// Enums and helpers
// ============================================================================

const char* ToString(TaskComplexity complexity) {
    switch (complexity) {
        case TaskComplexity::SIMPLE:
            return "simple";
        case TaskComplexity::MEDIUM:
            return "medium";
        case TaskComplexity::COMPLEX:
            return "complex";
        default:
            return "unknown";
    }
}

std::optional<TaskComplexity> ParseTaskComplexity(const std::string& str) {
    if (str == "simple" || str == "SIMPLE") {
        return TaskComplexity::SIMPLE;
    } else if (str == "medium" || str == "MEDIUM") {
        return TaskComplexity::MEDIUM;
    } else if (str == "complex" || str == "COMPLEX") {
        return TaskComplexity::COMPLEX;
    }
    return std::nullopt;
}

const char* ToString(ForecastRecommendation recommendation) {
    switch (recommendation) {
        case ForecastRecommendation::CONTINUE:
            return "continue";
        case ForecastRecommendation::EXTRACT_SOON:
            return "extract_soon";
        case ForecastRecommendation::EXTRACT_NOW:
            return "extract_now";
        case ForecastRecommendation::EMERGENCY:
            return "emergency";
        default:
            return "unknown";
    }
}

double TimeOfDayFactor(int hour) {
    return 1.0 + 0.2 * std::cos(2.0 * kPi * (static_cast<double>(hour) - 9.0) / 24.0);
}

double TrainingDataPoint::ObservedGrowth() const {
    double current = static_cast<double>(current_tokens);
    double rate_5 = (static_cast<double>(actual_tokens_after_5) - current) / 5.0;
    double rate_10 = (static_cast<double>(actual_tokens_after_10) - current) / 10.0;
    return (rate_5 + rate_10) / 2.0;
}

bool TokenForecaster::Config::IsValid() const {
    if (token_limit == 0 || min_training_samples == 0 || min_complexity_samples == 0) {
        return false;
    }
    if (ridge_strength < 0.0 || retention_days <= 0.0 || minutes_per_message <= 0.0) {
        return false;
    }
    if (extract_soon_threshold <= 0.0 || extract_soon_threshold > extract_now_threshold ||
        extract_now_threshold > 1.0) {
        return false;
    }
    for (double c : prior_coefficients) {
        if (c < 0.0) {
            return false;
        }
    }
    for (double impact : prior_complexity_impact) {
        if (impact <= 0.0) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Construction
// ============================================================================

TokenForecaster::TokenForecaster()
    : TokenForecaster(Config{}) {
}

TokenForecaster::TokenForecaster(const Config& config)
    : config_(config),
      coefficients_(config.prior_coefficients),
      complexity_impact_(config.prior_complexity_impact) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid TokenForecaster configuration");
    }
    OpenDatabase();
}

void TokenForecaster::OpenDatabase() {
    if (config_.storage_dir.empty()) {
        return;
    }

    try {
        StateDatabase::Config db_config;
        db_config.db_path = (std::filesystem::path(config_.storage_dir) / "training.db").string();
        db_ = std::make_unique<StateDatabase>(db_config);
        db_->ExecuteOrThrow(R"(
            CREATE TABLE IF NOT EXISTS training_points (
                id INTEGER PRIMARY KEY AUTOINCREMENT,
                tokens_per_message REAL NOT NULL,
                complexity TEXT NOT NULL,
                avg_tool_result_tokens REAL NOT NULL,
                time_of_day_factor REAL NOT NULL,
                current_tokens INTEGER NOT NULL,
                actual_after_5 INTEGER NOT NULL,
                actual_after_10 INTEGER NOT NULL,
                timestamp INTEGER NOT NULL
            );
        )");
    } catch (const std::exception& e) {
        std::cerr << "[TokenForecaster] Training persistence disabled: " << e.what() << std::endl;
        db_.reset();
    }
}

void TokenForecaster::Initialize() {
    if (!db_) {
        return;
    }

    try {
        std::vector<TrainingDataPoint> loaded;
        auto stmt = db_->Prepare(
            "SELECT tokens_per_message, complexity, avg_tool_result_tokens, time_of_day_factor, "
            "current_tokens, actual_after_5, actual_after_10, timestamp "
            "FROM training_points ORDER BY id ASC;");
        while (stmt.Step()) {
            TrainingDataPoint point;
            point.tokens_per_message = stmt.ColumnDouble(0);
            point.complexity = ParseTaskComplexity(stmt.ColumnText(1)).value_or(TaskComplexity::MEDIUM);
            point.avg_tool_result_tokens = stmt.ColumnDouble(2);
            point.time_of_day_factor = stmt.ColumnDouble(3);
            point.current_tokens = static_cast<uint64_t>(stmt.ColumnInt64(4));
            point.actual_tokens_after_5 = static_cast<uint64_t>(stmt.ColumnInt64(5));
            point.actual_tokens_after_10 = static_cast<uint64_t>(stmt.ColumnInt64(6));
            point.timestamp = Timestamp::FromMicros(stmt.ColumnInt64(7));
            loaded.push_back(point);
        }
        training_data_ = std::move(loaded);
        Refit();

        if (config_.verbose) {
            std::cerr << "[TokenForecaster] Loaded " << training_data_.size()
                      << " training points" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[TokenForecaster] Failed to load training data: " << e.what() << std::endl;
    }
}

// ============================================================================
// Model
// ============================================================================

double TokenForecaster::GetComplexityImpact(TaskComplexity complexity) const {
    return complexity_impact_[static_cast<size_t>(complexity)];
}

std::array<double, 4> TokenForecaster::Features(double tpm, TaskComplexity complexity,
                                                double tool, double tod_factor) const {
    return {{
        kFeatureWeights[0] * tpm,
        kFeatureWeights[1] * tpm * GetComplexityImpact(complexity),
        kFeatureWeights[2] * tool,
        kFeatureWeights[3] * tpm * tod_factor
    }};
}

double TokenForecaster::PredictGrowth(const ForecastMetrics& metrics, Timestamp now) const {
    int hour = metrics.hour_of_day.value_or(now.HourOfDay());
    auto x = Features(metrics.tokens_per_message, metrics.complexity,
                      metrics.avg_tool_result_tokens, TimeOfDayFactor(hour));

    double growth = 0.0;
    for (size_t i = 0; i < 4; ++i) {
        growth += coefficients_[i] * x[i];
    }
    return std::max(0.0, growth);
}

double TokenForecaster::GetConfidence() const {
    return std::min(0.95, 0.3 + 0.025 * static_cast<double>(training_data_.size()));
}

void TokenForecaster::Refit() {
    // 1. Complexity impacts: mean observed growth/tpm per class
    std::array<double, 3> impact_sum{{0.0, 0.0, 0.0}};
    std::array<size_t, 3> impact_count{{0, 0, 0}};
    for (const auto& point : training_data_) {
        if (point.tokens_per_message <= 0.0) {
            continue;
        }
        size_t cls = static_cast<size_t>(point.complexity);
        impact_sum[cls] += point.ObservedGrowth() / point.tokens_per_message;
        impact_count[cls]++;
    }
    for (size_t cls = 0; cls < 3; ++cls) {
        if (impact_count[cls] >= config_.min_complexity_samples) {
            double mean = impact_sum[cls] / static_cast<double>(impact_count[cls]);
            complexity_impact_[cls] = mean > 0.0 ? mean : config_.prior_complexity_impact[cls];
        } else {
            complexity_impact_[cls] = config_.prior_complexity_impact[cls];
        }
    }

    // 2. Coefficients: ridge least squares shrinking toward the priors
    if (training_data_.size() < config_.min_training_samples) {
        coefficients_ = config_.prior_coefficients;
        return;
    }

    std::array<std::array<double, 4>, 4> xtx{};
    std::array<double, 4> xty{};
    for (const auto& point : training_data_) {
        auto x = Features(point.tokens_per_message, point.complexity,
                          point.avg_tool_result_tokens, point.time_of_day_factor);
        double y = point.ObservedGrowth();
        for (size_t i = 0; i < 4; ++i) {
            xty[i] += x[i] * y;
            for (size_t j = 0; j < 4; ++j) {
                xtx[i][j] += x[i] * x[j];
            }
        }
    }

    double trace = xtx[0][0] + xtx[1][1] + xtx[2][2] + xtx[3][3];
    double lambda = config_.ridge_strength * (trace / 4.0);
    if (lambda <= 0.0) {
        lambda = 1e-9;
    }

    // (XtX + lambda I) c = XtY + lambda c_prior
    for (size_t i = 0; i < 4; ++i) {
        xtx[i][i] += lambda;
        xty[i] += lambda * config_.prior_coefficients[i];
    }

    std::array<double, 4> solved{};
    if (!Solve4x4(xtx, xty, solved)) {
        std::cerr << "[TokenForecaster] Singular training system, keeping priors" << std::endl;
        coefficients_ = config_.prior_coefficients;
        return;
    }

    for (size_t i = 0; i < 4; ++i) {
        coefficients_[i] = std::isfinite(solved[i]) ? std::max(0.0, solved[i])
                                                    : config_.prior_coefficients[i];
    }

    if (config_.verbose) {
        std::cerr << "[TokenForecaster] Refit on " << training_data_.size() << " samples: c = ["
                  << coefficients_[0] << ", " << coefficients_[1] << ", "
                  << coefficients_[2] << ", " << coefficients_[3] << "]" << std::endl;
    }
}

// ============================================================================
// Forecast
// ============================================================================

ForecastResult TokenForecaster::Forecast(const ForecastMetrics& metrics, Timestamp now) const {
    ForecastResult result;

    double limit = static_cast<double>(metrics.token_limit.value_or(config_.token_limit));
    if (limit <= 0.0) {
        limit = static_cast<double>(config_.token_limit);
    }
    double current = static_cast<double>(metrics.current_tokens);
    double growth = PredictGrowth(metrics, now);

    double predicted_5 = current + 5.0 * growth;
    double predicted_10 = current + 10.0 * growth;

    result.growth_per_message = growth;
    result.predicted_tokens_in_5 = static_cast<uint64_t>(std::llround(predicted_5));
    result.predicted_tokens_in_10 = static_cast<uint64_t>(std::llround(predicted_10));
    result.messages_until_85 = MessagesUntil(config_.extract_soon_threshold * limit, current, growth);
    result.messages_until_95 = MessagesUntil(config_.extract_now_threshold * limit, current, growth);
    if (result.messages_until_85) {
        result.estimated_minutes_until_threshold =
            static_cast<double>(*result.messages_until_85) * config_.minutes_per_message;
    }
    result.confidence = GetConfidence();

    double current_ratio = current / limit;
    double ratio_5 = predicted_5 / limit;
    double ratio_10 = predicted_10 / limit;

    std::ostringstream reasoning;
    reasoning.precision(1);
    reasoning << std::fixed;

    if (current_ratio >= config_.extract_now_threshold) {
        result.recommendation = ForecastRecommendation::EMERGENCY;
        reasoning << "Context already at " << current_ratio * 100.0
                  << "% of the limit; clear immediately";
    } else if (ratio_5 >= config_.extract_now_threshold) {
        result.recommendation = ForecastRecommendation::EXTRACT_NOW;
        reasoning << "Projected to reach " << ratio_5 * 100.0
                  << "% within 5 messages; extract knowledge now";
    } else if (ratio_10 >= config_.extract_soon_threshold) {
        result.recommendation = ForecastRecommendation::EXTRACT_SOON;
        reasoning << "Projected to reach " << ratio_10 * 100.0
                  << "% within 10 messages; plan extraction";
    } else {
        result.recommendation = ForecastRecommendation::CONTINUE;
        reasoning << "Projected " << ratio_10 * 100.0 << "% after 10 messages";
    }

    reasoning << " (growth " << growth << " tokens/message, " << ToString(metrics.complexity)
              << " task, " << training_data_.size() << " training samples)";
    result.reasoning = reasoning.str();

    return result;
}

// ============================================================================
// Training
// ============================================================================

void TokenForecaster::RecordOutcome(const ForecastMetrics& metrics,
                                    uint64_t actual_after_5,
                                    uint64_t actual_after_10,
                                    Timestamp now) {
    TrainingDataPoint point;
    point.tokens_per_message = metrics.tokens_per_message;
    point.complexity = metrics.complexity;
    point.avg_tool_result_tokens = metrics.avg_tool_result_tokens;
    point.time_of_day_factor = TimeOfDayFactor(metrics.hour_of_day.value_or(now.HourOfDay()));
    point.current_tokens = metrics.current_tokens;
    point.actual_tokens_after_5 = actual_after_5;
    point.actual_tokens_after_10 = actual_after_10;
    point.timestamp = now;

    training_data_.push_back(point);
    PersistPoint(point);
    Refit();
}

void TokenForecaster::PersistPoint(const TrainingDataPoint& point) {
    if (!db_) {
        return;
    }

    try {
        auto stmt = db_->Prepare(
            "INSERT INTO training_points (tokens_per_message, complexity, avg_tool_result_tokens, "
            "time_of_day_factor, current_tokens, actual_after_5, actual_after_10, timestamp) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?);");
        stmt.BindDouble(1, point.tokens_per_message);
        stmt.BindText(2, ToString(point.complexity));
        stmt.BindDouble(3, point.avg_tool_result_tokens);
        stmt.BindDouble(4, point.time_of_day_factor);
        stmt.BindInt64(5, static_cast<int64_t>(point.current_tokens));
        stmt.BindInt64(6, static_cast<int64_t>(point.actual_tokens_after_5));
        stmt.BindInt64(7, static_cast<int64_t>(point.actual_tokens_after_10));
        stmt.BindInt64(8, point.timestamp.ToMicros());
        stmt.Step();
    } catch (const std::exception& e) {
        std::cerr << "[TokenForecaster] Failed to persist training point: " << e.what() << std::endl;
    }
}

size_t TokenForecaster::PruneTrainingData(Timestamp now) {
    auto cutoff = now - std::chrono::duration<double, std::ratio<86400>>(config_.retention_days);

    size_t before = training_data_.size();
    training_data_.erase(
        std::remove_if(training_data_.begin(), training_data_.end(),
                       [&](const TrainingDataPoint& p) { return p.timestamp < cutoff; }),
        training_data_.end());
    size_t removed = before - training_data_.size();

    if (removed > 0) {
        if (db_) {
            try {
                auto stmt = db_->Prepare("DELETE FROM training_points WHERE timestamp < ?;");
                stmt.BindInt64(1, cutoff.ToMicros());
                stmt.Step();
            } catch (const std::exception& e) {
                std::cerr << "[TokenForecaster] Failed to prune training data: "
                          << e.what() << std::endl;
            }
        }
        Refit();
    }
    return removed;
}

} // namespace ctxmem
