#include "distribution_model.hpp"
#include <boost/math/special_functions/digamma.hpp>
#include <boost/math/special_functions/gamma.hpp>
#include <algorithm>
#include <cmath>
#include <limits>

namespace starcast {

namespace {

constexpr double MAX_ETA = 30.0;
constexpr double MU_FLOOR = 1e-10;
constexpr double MIN_LOG_PHI = -20.0;
constexpr double MAX_LOG_PHI = 20.0;
constexpr double MIN_START_PHI = 1.0;
constexpr double MAX_START_PHI = 1e4;

double logistic(double eta) {
    eta = std::clamp(eta, -MAX_ETA, MAX_ETA);
    return 1.0 / (1.0 + std::exp(-eta));
}

double mean_link(double eta) {
    return std::clamp(logistic(eta), MU_FLOOR, 1.0 - MU_FLOOR);
}

double precision_link(double eta) {
    return std::exp(std::clamp(eta, MIN_LOG_PHI, MAX_LOG_PHI));
}

// Penalized negative log-likelihood of a beta regression on a design with
// a leading intercept column. theta = [beta; gamma].
class BetaObjective {
public:
    BetaObjective(const Eigen::MatrixXd& design, const Eigen::VectorXd& y, double ridge)
        : design_(design), ridge_(ridge) {
        log_y_ = y.array().log();
        log_1my_ = (1.0 - y.array()).log();
        y_star_ = log_y_ - log_1my_;
    }

    // Objective value; +inf when the likelihood cannot be evaluated.
    // Fills `grad` when given; `loglik` receives the unpenalized value.
    double evaluate(const Eigen::VectorXd& theta, Eigen::VectorXd* grad, double* loglik = nullptr) const {
        const Eigen::Index n = design_.rows();
        const Eigen::Index k = design_.cols();
        const Eigen::VectorXd beta = theta.head(k);
        const Eigen::VectorXd gamma = theta.tail(k);

        const Eigen::VectorXd eta_mu = design_ * beta;
        const Eigen::VectorXd eta_phi = design_ * gamma;

        Eigen::VectorXd w_beta(n);
        Eigen::VectorXd w_gamma(n);
        double ll = 0.0;

        try {
            for (Eigen::Index i = 0; i < n; ++i) {
                double mu = mean_link(eta_mu[i]);
                double phi = precision_link(eta_phi[i]);
                double a = mu * phi;
                double b = (1.0 - mu) * phi;

                ll += boost::math::lgamma(phi) - boost::math::lgamma(a) - boost::math::lgamma(b) +
                      (a - 1.0) * log_y_[i] + (b - 1.0) * log_1my_[i];

                double psi_a = boost::math::digamma(a);
                double psi_b = boost::math::digamma(b);
                double mu_star = psi_a - psi_b;

                w_beta[i] = phi * (y_star_[i] - mu_star) * mu * (1.0 - mu);
                w_gamma[i] = phi * (mu * (y_star_[i] - mu_star) + log_1my_[i] - psi_b +
                                    boost::math::digamma(phi));
            }
        } catch (const std::domain_error&) {
            return std::numeric_limits<double>::infinity();
        } catch (const std::overflow_error&) {
            return std::numeric_limits<double>::infinity();
        }

        if (!std::isfinite(ll)) {
            return std::numeric_limits<double>::infinity();
        }
        if (loglik != nullptr) {
            *loglik = ll;
        }

        double penalty = 0.5 * ridge_ *
                         (beta.tail(k - 1).squaredNorm() + gamma.tail(k - 1).squaredNorm());

        if (grad != nullptr) {
            grad->resize(2 * k);
            grad->head(k) = -(design_.transpose() * w_beta);
            grad->tail(k) = -(design_.transpose() * w_gamma);
            grad->segment(1, k - 1) += ridge_ * beta.tail(k - 1);
            grad->segment(k + 1, k - 1) += ridge_ * gamma.tail(k - 1);
            if (!grad->allFinite()) {
                return std::numeric_limits<double>::infinity();
            }
        }

        return -ll + penalty;
    }

    const Eigen::VectorXd& y_star() const { return y_star_; }

private:
    const Eigen::MatrixXd& design_;
    double ridge_;
    Eigen::VectorXd log_y_;
    Eigen::VectorXd log_1my_;
    Eigen::VectorXd y_star_;
};

struct BfgsOutcome {
    Eigen::VectorXd theta;
    int iterations = 0;
    bool converged = false;
};

// Quasi-Newton minimization with an Armijo backtracking line search
BfgsOutcome minimize_bfgs(const BetaObjective& objective, Eigen::VectorXd theta,
                          int max_iterations, double tolerance) {
    const Eigen::Index dim = theta.size();
    BfgsOutcome outcome;

    Eigen::VectorXd grad;
    double f = objective.evaluate(theta, &grad);
    Eigen::MatrixXd h_inv = Eigen::MatrixXd::Identity(dim, dim);
    bool scaled = false;

    for (int iter = 0; iter < max_iterations; ++iter) {
        outcome.iterations = iter + 1;

        if (grad.lpNorm<Eigen::Infinity>() <= tolerance * std::max(1.0, std::abs(f))) {
            outcome.converged = true;
            break;
        }

        Eigen::VectorXd direction = -(h_inv * grad);
        double slope = grad.dot(direction);
        if (!(slope < 0.0)) {
            h_inv.setIdentity();
            scaled = false;
            direction = -grad;
            slope = grad.dot(direction);
        }
        if (!scaled) {
            // Unscaled steepest descent steps can be enormous on large panels
            double norm = direction.norm();
            if (norm > 1.0) {
                direction /= norm;
                slope /= norm;
            }
        }

        double step = 1.0;
        Eigen::VectorXd next_theta;
        Eigen::VectorXd next_grad;
        double next_f = std::numeric_limits<double>::infinity();
        bool accepted = false;
        for (int attempt = 0; attempt < 60; ++attempt) {
            next_theta = theta + step * direction;
            next_f = objective.evaluate(next_theta, &next_grad);
            if (std::isfinite(next_f) && next_f <= f + 1e-4 * step * slope) {
                accepted = true;
                break;
            }
            step *= 0.5;
        }
        if (!accepted) {
            break;
        }

        Eigen::VectorXd s = next_theta - theta;
        Eigen::VectorXd yk = next_grad - grad;
        double sy = s.dot(yk);

        double change = f - next_f;
        theta = next_theta;
        grad = next_grad;
        f = next_f;

        if (change <= tolerance * (1.0 + std::abs(f))) {
            outcome.converged = true;
            break;
        }

        if (sy > 1e-12) {
            if (!scaled) {
                h_inv = Eigen::MatrixXd::Identity(dim, dim) * (sy / yk.squaredNorm());
                scaled = true;
            }
            double rho = 1.0 / sy;
            Eigen::MatrixXd left = Eigen::MatrixXd::Identity(dim, dim) - rho * s * yk.transpose();
            h_inv = left * h_inv * left.transpose() + rho * s * s.transpose();
        }
    }

    outcome.theta = std::move(theta);
    return outcome;
}

} // anonymous namespace

// ============================================================================
// FitConfig
// ============================================================================

FitConfig::FitConfig()
    : min_observations(10), boundary_epsilon(1e-4), max_iterations(200),
      tolerance(1e-8), ridge_penalty(1e-4) {}

bool FitConfig::operator==(const FitConfig& other) const {
    return min_observations == other.min_observations &&
           boundary_epsilon == other.boundary_epsilon &&
           max_iterations == other.max_iterations &&
           tolerance == other.tolerance &&
           ridge_penalty == other.ridge_penalty;
}

// ============================================================================
// DistributionModel
// ============================================================================

std::unique_ptr<DrawGenerator> DistributionModel::conditional(const ObservationRow& row) const {
    std::vector<double> features;
    features.reserve(feature_names().size());
    for (const auto& name : feature_names()) {
        auto value = row.feature(name);
        if (!value) {
            throw SamplingError("Row " + row.organization_id + "/" + std::to_string(row.year) +
                                " has no feature " + name);
        }
        features.push_back(*value);
    }
    return conditional(features);
}

// ============================================================================
// BetaDrawGenerator
// ============================================================================

BetaDrawGenerator::BetaDrawGenerator(double alpha, double beta)
    : alpha_(alpha), beta_(beta) {
    if (!(alpha > 0.0) || !(beta > 0.0) || !std::isfinite(alpha) || !std::isfinite(beta)) {
        throw SamplingError("Invalid beta parameters: alpha=" + std::to_string(alpha) +
                            ", beta=" + std::to_string(beta));
    }
}

double BetaDrawGenerator::draw(std::mt19937_64& rng) const {
    std::gamma_distribution<double> gamma_x(alpha_, 1.0);
    std::gamma_distribution<double> gamma_y(beta_, 1.0);
    double x = gamma_x(rng);
    double y = gamma_y(rng);
    double sum = x + y;
    if (!(sum > 0.0) || !std::isfinite(sum)) {
        throw SamplingError("Degenerate beta draw: alpha=" + std::to_string(alpha_) +
                            ", beta=" + std::to_string(beta_));
    }
    return std::clamp(x / sum, 0.0, 1.0);
}

// ============================================================================
// BetaRegressionModel
// ============================================================================

std::unique_ptr<BetaRegressionModel> BetaRegressionModel::fit(const MeasurePanel& panel,
                                                              const std::string& measure,
                                                              const FitConfig& config) {
    const std::vector<std::string> names = trend_feature_names(measure);

    std::vector<const ObservationRow*> observed;
    for (const auto& row : panel.rows()) {
        auto value = row.value(measure);
        if (value && std::isfinite(*value)) {
            observed.push_back(&row);
        }
    }

    if (observed.size() < config.min_observations) {
        throw ModelFitError(measure, "insufficient history: " + std::to_string(observed.size()) +
                                     " observations, " + std::to_string(config.min_observations) +
                                     " required");
    }

    Eigen::MatrixXd x(static_cast<Eigen::Index>(observed.size()), static_cast<Eigen::Index>(names.size()));
    Eigen::VectorXd y(static_cast<Eigen::Index>(observed.size()));

    for (size_t i = 0; i < observed.size(); ++i) {
        const ObservationRow& row = *observed[i];
        for (size_t j = 0; j < names.size(); ++j) {
            auto feature = row.feature(names[j]);
            if (!feature) {
                throw ModelFitError(measure, "trend feature " + names[j] + " has not been derived");
            }
            x(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) = *feature;
        }
        y[static_cast<Eigen::Index>(i)] = *row.value(measure) / 100.0;
    }

    return fit(measure, names, x, y, config);
}

std::unique_ptr<BetaRegressionModel> BetaRegressionModel::fit(const std::string& target,
                                                              const std::vector<std::string>& feature_names,
                                                              const Eigen::MatrixXd& x,
                                                              const Eigen::VectorXd& y,
                                                              const FitConfig& config) {
    const Eigen::Index n = y.size();
    const Eigen::Index p = static_cast<Eigen::Index>(feature_names.size());

    if (x.rows() != n || x.cols() != p) {
        throw std::invalid_argument("Design matrix is " + std::to_string(x.rows()) + "x" +
                                    std::to_string(x.cols()) + ", expected " + std::to_string(n) +
                                    "x" + std::to_string(p));
    }
    if (static_cast<size_t>(n) < config.min_observations) {
        throw ModelFitError(target, "insufficient history: " + std::to_string(n) +
                                    " observations, " + std::to_string(config.min_observations) +
                                    " required");
    }
    if (!x.allFinite() || !y.allFinite()) {
        throw ModelFitError(target, "non-finite values in training data");
    }

    auto model = std::unique_ptr<BetaRegressionModel>(new BetaRegressionModel());
    model->target_ = target;
    model->feature_names_ = feature_names;
    model->observation_count_ = static_cast<size_t>(n);

    // Standardize features; constant columns are centered only
    model->center_ = x.colwise().mean().transpose();
    model->scale_ = Eigen::VectorXd::Ones(p);
    for (Eigen::Index j = 0; j < p; ++j) {
        double sd = std::sqrt((x.col(j).array() - model->center_[j]).square().sum() / static_cast<double>(n));
        if (sd > 1e-12) {
            model->scale_[j] = sd;
        }
    }

    Eigen::MatrixXd design(n, p + 1);
    design.col(0).setOnes();
    for (Eigen::Index j = 0; j < p; ++j) {
        design.col(j + 1) = (x.col(j).array() - model->center_[j]) / model->scale_[j];
    }

    const double eps = config.boundary_epsilon;
    Eigen::VectorXd y_clamped = y.unaryExpr([eps](double v) { return std::clamp(v, eps, 1.0 - eps); });

    BetaObjective objective(design, y_clamped, config.ridge_penalty);

    // OLS on logit(y) for the mean, method of moments for the precision intercept
    Eigen::VectorXd beta0 = design.completeOrthogonalDecomposition().solve(objective.y_star());
    Eigen::VectorXd mu_hat = (design * beta0).unaryExpr([](double eta) { return mean_link(eta); });
    double variance = (y_clamped - mu_hat).squaredNorm() / static_cast<double>(n);
    double m = y_clamped.mean();
    double phi0 = variance > 0.0 ? m * (1.0 - m) / variance - 1.0 : MAX_START_PHI;
    phi0 = std::clamp(phi0, MIN_START_PHI, MAX_START_PHI);

    Eigen::VectorXd theta = Eigen::VectorXd::Zero(2 * (p + 1));
    theta.head(p + 1) = beta0;
    theta[p + 1] = std::log(phi0);

    if (!std::isfinite(objective.evaluate(theta, nullptr))) {
        // Intercept-only start
        theta.setZero();
        theta[0] = std::log(m / (1.0 - m));
        theta[p + 1] = std::log(phi0);
        if (!std::isfinite(objective.evaluate(theta, nullptr))) {
            throw ModelFitError(target, "likelihood is not finite at the starting values");
        }
    }

    BfgsOutcome outcome = minimize_bfgs(objective, theta, config.max_iterations, config.tolerance);

    double loglik = 0.0;
    if (!std::isfinite(objective.evaluate(outcome.theta, nullptr, &loglik))) {
        throw ModelFitError(target, "likelihood is not finite at the estimate");
    }

    model->beta_ = outcome.theta.head(p + 1);
    model->gamma_ = outcome.theta.tail(p + 1);
    model->log_likelihood_ = loglik;
    model->iterations_ = outcome.iterations;
    model->converged_ = outcome.converged;

    return model;
}

Eigen::VectorXd BetaRegressionModel::design_row(const std::vector<double>& features) const {
    const Eigen::Index p = static_cast<Eigen::Index>(feature_names_.size());
    if (static_cast<Eigen::Index>(features.size()) != p) {
        throw SamplingError("Model for " + target_ + " expects " + std::to_string(p) +
                            " features, got " + std::to_string(features.size()));
    }

    Eigen::VectorXd row(p + 1);
    row[0] = 1.0;
    for (Eigen::Index j = 0; j < p; ++j) {
        double value = features[static_cast<size_t>(j)];
        if (!std::isfinite(value)) {
            throw SamplingError("Non-finite feature " + feature_names_[static_cast<size_t>(j)] +
                                " for " + target_);
        }
        row[j + 1] = (value - center_[j]) / scale_[j];
    }
    return row;
}

double BetaRegressionModel::predict_mean(const std::vector<double>& features) const {
    return mean_link(design_row(features).dot(beta_));
}

double BetaRegressionModel::predict_precision(const std::vector<double>& features) const {
    return precision_link(design_row(features).dot(gamma_));
}

std::unique_ptr<DrawGenerator> BetaRegressionModel::conditional(const std::vector<double>& features) const {
    Eigen::VectorXd row = design_row(features);
    double mu = mean_link(row.dot(beta_));
    double phi = precision_link(row.dot(gamma_));
    return std::make_unique<BetaDrawGenerator>(mu * phi, (1.0 - mu) * phi);
}

} // namespace starcast
