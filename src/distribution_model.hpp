#ifndef STARCAST_DISTRIBUTION_MODEL_HPP
#define STARCAST_DISTRIBUTION_MODEL_HPP

#include "measure_panel.hpp"
#include <Eigen/Dense>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace starcast {

// Likelihood could not be evaluated or optimized for a measure
class ModelFitError : public std::runtime_error {
public:
    ModelFitError(const std::string& measure, const std::string& reason)
        : std::runtime_error("Model fit failed for " + measure + ": " + reason),
          measure_(measure) {}

    const std::string& measure() const { return measure_; }

private:
    std::string measure_;
};

// Conditional distribution could not be built or sampled
class SamplingError : public std::runtime_error {
public:
    explicit SamplingError(const std::string& msg) : std::runtime_error(msg) {}
};

// Estimation settings shared by every measure in a fitting batch
struct FitConfig {
    size_t min_observations;    // Fewer non-missing targets means no model (default 10)
    double boundary_epsilon;    // Targets clamped into [eps, 1 - eps] (default 1e-4)
    int max_iterations;         // BFGS iteration cap (default 200)
    double tolerance;           // Gradient / objective convergence tolerance (default 1e-8)
    double ridge_penalty;       // L2 penalty on non-intercept coefficients (default 1e-4)

    FitConfig();

    bool operator==(const FitConfig& other) const;
    bool operator!=(const FitConfig& other) const { return !(*this == other); }
};

// Sampler for one row's conditional distribution. draw() returns a value in
// [0, 1]; it is const and keeps no state, so one generator can serve
// concurrent draws as long as each caller owns its RNG.
class DrawGenerator {
public:
    virtual ~DrawGenerator() = default;

    virtual double draw(std::mt19937_64& rng) const = 0;
    virtual double mean() const = 0;
};

// Fit once per measure from the full panel, immutable afterwards
class DistributionModel {
public:
    virtual ~DistributionModel() = default;

    virtual const std::string& target() const = 0;
    virtual const std::vector<std::string>& feature_names() const = 0;
    virtual size_t observation_count() const = 0;

    // Build a generator for the conditional distribution given a feature
    // vector ordered as feature_names(). Throws SamplingError on a
    // malformed vector or a degenerate parameterization.
    virtual std::unique_ptr<DrawGenerator> conditional(const std::vector<double>& features) const = 0;

    // Gather feature_names() from a row, then call conditional()
    std::unique_ptr<DrawGenerator> conditional(const ObservationRow& row) const;
};

// Beta draw via two gamma variates: X / (X + Y)
class BetaDrawGenerator : public DrawGenerator {
public:
    BetaDrawGenerator(double alpha, double beta);

    double draw(std::mt19937_64& rng) const override;
    double mean() const override { return alpha_ / (alpha_ + beta_); }

    double alpha() const { return alpha_; }
    double beta() const { return beta_; }

private:
    double alpha_;
    double beta_;
};

// Beta regression with a logit-linked mean and a log-linked precision over
// the same standardized features:
//   logit(mu)  = [1, z] . beta
//   log(phi)   = [1, z] . gamma
// y ~ Beta(mu * phi, (1 - mu) * phi)
class BetaRegressionModel : public DistributionModel {
public:
    // Fit the measure's percentage scores (0-100) against its trend features.
    // Rows must already carry derived features. Throws ModelFitError when
    // there are too few observations or the likelihood is not finite.
    static std::unique_ptr<BetaRegressionModel> fit(const MeasurePanel& panel,
                                                    const std::string& measure,
                                                    const FitConfig& config = FitConfig());

    // Fit on an explicit design. `y` is on the unit scale and is clamped by
    // config.boundary_epsilon; rows of `x` align with `y`.
    static std::unique_ptr<BetaRegressionModel> fit(const std::string& target,
                                                    const std::vector<std::string>& feature_names,
                                                    const Eigen::MatrixXd& x,
                                                    const Eigen::VectorXd& y,
                                                    const FitConfig& config = FitConfig());

    const std::string& target() const override { return target_; }
    const std::vector<std::string>& feature_names() const override { return feature_names_; }
    size_t observation_count() const override { return observation_count_; }

    using DistributionModel::conditional;
    std::unique_ptr<DrawGenerator> conditional(const std::vector<double>& features) const override;

    double predict_mean(const std::vector<double>& features) const;
    double predict_precision(const std::vector<double>& features) const;

    const Eigen::VectorXd& mean_coefficients() const { return beta_; }
    const Eigen::VectorXd& precision_coefficients() const { return gamma_; }
    double log_likelihood() const { return log_likelihood_; }
    int iterations() const { return iterations_; }
    bool converged() const { return converged_; }

private:
    BetaRegressionModel() = default;

    // Standardized design row [1, z] for a raw feature vector
    Eigen::VectorXd design_row(const std::vector<double>& features) const;

    std::string target_;
    std::vector<std::string> feature_names_;
    size_t observation_count_ = 0;

    Eigen::VectorXd center_;
    Eigen::VectorXd scale_;
    Eigen::VectorXd beta_;
    Eigen::VectorXd gamma_;

    double log_likelihood_ = 0.0;
    int iterations_ = 0;
    bool converged_ = false;
};

} // namespace starcast

#endif // STARCAST_DISTRIBUTION_MODEL_HPP
