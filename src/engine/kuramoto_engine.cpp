#include "engine/kuramoto_engine.h"
#include "core/errors.h"
#include <cmath>
#include <cstdio>
#include <utility>

#ifdef SYNCFIELD_OPENMP
#include <omp.h>
#endif

namespace syncfield {

namespace {

void check_size(int n, const char* what) {
    if (n <= 0) {
        throw ConfigurationError(std::string(what) + " must be positive, got " +
                                 std::to_string(n));
    }
}

void check_dt(double dt) {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw ConfigurationError("dt must be a positive finite number, got " +
                                 std::to_string(dt));
    }
}

const Matrix& empty_matrix() {
    static const Matrix m;
    return m;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

KuramotoEngine::KuramotoEngine(const KuramotoConfig& config,
                               std::unique_ptr<RandomSource> rng)
    : config_(config)
    , rng_(std::move(rng))
    , history_(HistoryPolicy::CAPPED_GROWTH, config.history_cap)
{
    validate(config_);
    if (!rng_) rng_ = std::make_unique<MersenneSource>(config_.seed);

    theta_.assign(static_cast<size_t>(config_.n), 0.0);
    omega_.assign(static_cast<size_t>(config_.n), 0.0);
    initialize();
}

void KuramotoEngine::validate(const KuramotoConfig& config) {
    check_size(config.n, "N");
    check_dt(config.dt);
}

void KuramotoEngine::initialize() {
    for (size_t i = 0; i < theta_.size(); ++i) {
        // u ∈ [0, 1) → θ ∈ (−π, π]
        theta_[i] = PI - rng_->next_uniform() * TWO_PI;
        omega_[i] = rng_->next_normal(0.0, config_.omega_std);
    }
    time_ = 0.0;
    history_.clear();
    scratch_.resize(theta_.size());
}

// =============================================================================
// Dynamics
// =============================================================================

void KuramotoEngine::compute_derivatives(const PhaseVector& theta, PhaseVector& out) {
    const size_t n = theta.size();
    const double alpha = config_.phase_lag;
    const double scale = config_.K / static_cast<double>(n);

    // Noise is drawn serially so a seed gives the same run with or without OpenMP
    noise_.assign(n, 0.0);
    if (config_.noise_level > 0.0) {
        for (size_t i = 0; i < n; ++i) {
            noise_[i] = config_.noise_level * rng_->next_normal(0.0, 0.1);
        }
    }

    const int count = static_cast<int>(n);
#ifdef SYNCFIELD_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int ii = 0; ii < count; ++ii) {
        const size_t i = static_cast<size_t>(ii);
        double coupling = 0.0;
        if (coupling_) {
            for (const auto& nb : coupling_->neighbors(i)) {
                coupling += nb.weight * std::sin(theta[nb.index] - theta[i] - alpha);
            }
        } else {
            for (size_t j = 0; j < n; ++j) {
                if (j != i) coupling += std::sin(theta[j] - theta[i] - alpha);
            }
        }

        out[i] = omega_[i] + noise_[i] + scale * coupling;
    }
}

void KuramotoEngine::step() {
    rk4_step(theta_, config_.dt,
             [this](const PhaseVector& in, PhaseVector& out) { compute_derivatives(in, out); },
             scratch_);
    time_ += config_.dt;
    record_history();
}

void KuramotoEngine::run(int n_steps) {
    for (int i = 0; i < n_steps; ++i) {
        step();
    }
}

double KuramotoEngine::order_parameter() const {
    return syncfield::order_parameter(theta_);
}

void KuramotoEngine::record_history() {
    KuramotoFrame frame;
    frame.time = time_;
    frame.order_parameter = order_parameter();
    frame.phases = theta_;
    history_.push(std::move(frame));
}

// =============================================================================
// Parameters
// =============================================================================

void KuramotoEngine::update_parameters(const KuramotoUpdate& update) {
    // Validate everything before touching state
    if (update.n)  check_size(*update.n, "N");
    if (update.dt) check_dt(*update.dt);

    if (update.K)           config_.K = *update.K;
    if (update.noise_level) config_.noise_level = *update.noise_level;
    if (update.phase_lag)   config_.phase_lag = *update.phase_lag;
    if (update.dt)          config_.dt = *update.dt;

    if (update.n && *update.n != config_.n) {
        config_.n = *update.n;
        theta_.assign(static_cast<size_t>(config_.n), 0.0);
        omega_.assign(static_cast<size_t>(config_.n), 0.0);
        // Old adjacency no longer matches N
        clear_network();
        initialize();
    }
}

// =============================================================================
// Network
// =============================================================================

void KuramotoEngine::set_network(const Matrix& adjacency, TopologyType type,
                                 const TopologyParams& params) {
    if (adjacency.size() != theta_.size()) {
        throw TopologyMismatchError(
            "adjacency is " + std::to_string(adjacency.size()) + "x" +
            std::to_string(adjacency.size()) + " but N = " + std::to_string(theta_.size()));
    }
    coupling_ = std::make_unique<ExplicitAdjacency>(adjacency);
    topology_type_ = type;
    topology_params_ = params;
}

void KuramotoEngine::set_network(const Network& network) {
    set_network(network.adjacency, network.type, network.params);
}

void KuramotoEngine::clear_network() {
    coupling_.reset();
    topology_type_ = TopologyType::ALL_TO_ALL;
    topology_params_ = TopologyParams{};
}

const Matrix& KuramotoEngine::adjacency() const {
    return coupling_ ? coupling_->matrix() : empty_matrix();
}

// =============================================================================
// Observation
// =============================================================================

KuramotoState KuramotoEngine::state() const {
    KuramotoState s;
    s.theta = theta_;
    s.omega = omega_;
    s.time = time_;
    s.order_parameter = order_parameter();
    s.n = theta_.size();
    s.K = config_.K;
    return s;
}

std::vector<double> KuramotoEngine::time_series() const {
    return history_.column([](const KuramotoFrame& f) { return f.time; });
}

std::vector<double> KuramotoEngine::order_parameter_series() const {
    return history_.column([](const KuramotoFrame& f) { return f.order_parameter; });
}

std::string KuramotoEngine::summary() const {
    char buf[192];
    snprintf(buf, sizeof(buf),
             "Kuramoto N=%zu K=%.3f dt=%.3f noise=%.3f alpha=%.3f topo=%s t=%.2f r=%.4f",
             theta_.size(), config_.K, config_.dt, config_.noise_level,
             config_.phase_lag, topology_name(topology_type_), time_, order_parameter());
    return std::string(buf);
}

} // namespace syncfield
