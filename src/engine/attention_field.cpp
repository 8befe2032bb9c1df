#include "engine/attention_field.h"
#include "core/errors.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#ifdef SYNCFIELD_OPENMP
#include <omp.h>
#endif

namespace syncfield {

namespace {

void check_positive(int v, const char* what) {
    if (v <= 0) {
        throw ConfigurationError(std::string(what) + " must be positive, got " +
                                 std::to_string(v));
    }
}

void check_dt(double dt) {
    if (!(dt > 0.0) || !std::isfinite(dt)) {
        throw ConfigurationError("dt must be a positive finite number, got " +
                                 std::to_string(dt));
    }
}

const AttentionFieldConfig& checked(const AttentionFieldConfig& config) {
    check_positive(config.grid_size, "gridSize");
    check_positive(config.num_features, "numFeatures");
    check_dt(config.dt);
    return config;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

AttentionFieldEngine::AttentionFieldEngine(const AttentionFieldConfig& config,
                                           std::unique_ptr<RandomSource> rng)
    : config_(checked(config))
    , rng_(std::move(rng))
    , field_(static_cast<size_t>(config.grid_size), static_cast<size_t>(config.num_features))
    , history_(HistoryPolicy::FIXED_RING, config.history_cap)
{
    if (!rng_) rng_ = std::make_unique<MersenneSource>(config_.seed);
    allocate();
    initialize();
}

void AttentionFieldEngine::allocate() {
    const size_t g = grid_size();
    const size_t n = g * g;
    theta_.assign(n, 0.0);
    omega_.assign(n, 0.0);
    field_ = StimulusField(g, num_features());
    spatial_ = std::make_unique<SpatialWeights>(g, config_.spatial_range, config_.spatial_decay);
    step_coupling_.assign(n, {});
    scratch_.resize(n);
}

void AttentionFieldEngine::initialize() {
    for (size_t i = 0; i < theta_.size(); ++i) {
        theta_[i] = PI - rng_->next_uniform() * TWO_PI;
        omega_[i] = rng_->next_normal(0.0, config_.omega_std);
    }
    field_.clear();
    field_.update_norms();

    time_ = 0.0;
    history_.clear();
}

// =============================================================================
// Stimulus projection
// =============================================================================

void AttentionFieldEngine::update_stimulus_field() {
    field_.clear();
    for (auto& obj : objects_) {
        advance_object(obj, config_.dt, grid_size());
        field_.project(obj);
    }
    field_.update_norms();
}

std::string AttentionFieldEngine::add_stimulus_object(const StimulusObjectConfig& config) {
    const double center = static_cast<double>(grid_size()) / 2.0;

    StimulusObject obj;
    obj.id        = config.id ? *config.id : ("obj-" + std::to_string(next_object_id_));
    obj.x         = config.x.value_or(center);
    obj.y         = config.y.value_or(center);
    obj.vx        = config.vx.value_or(0.0);
    obj.vy        = config.vy.value_or(0.0);
    obj.radius    = config.radius.value_or(DEFAULT_OBJECT_RADIUS);
    obj.intensity = config.intensity.value_or(1.0);
    obj.features  = config.features ? *config.features : std::vector<double>{};
    obj.features.resize(num_features(), NEUTRAL_FEATURE);

    next_object_id_++;
    objects_.push_back(obj);
    return obj.id;
}

bool AttentionFieldEngine::remove_stimulus_object(const std::string& id) {
    auto it = std::find_if(objects_.begin(), objects_.end(),
                           [&](const StimulusObject& o) { return o.id == id; });
    if (it == objects_.end()) return false;
    objects_.erase(it);
    return true;
}

// =============================================================================
// Dynamics
// =============================================================================

void AttentionFieldEngine::build_step_coupling() {
    const CouplingWeights& weights = active_coupling();

    const int count = static_cast<int>(theta_.size());
#ifdef SYNCFIELD_OPENMP
    #pragma omp parallel for schedule(dynamic, 64)
#endif
    for (int ai = 0; ai < count; ++ai) {
        const size_t a = static_cast<size_t>(ai);
        auto& row = step_coupling_[a];
        row.clear();
        const double s_a = field_.stimulus(a);

        for (const auto& nb : weights.neighbors(a)) {
            if (!(nb.weight > 0.0)) continue;
            const size_t b = nb.index;

            double c = config_.K_stim * nb.weight * 0.5 * (s_a + field_.stimulus(b));

            double sim = field_.cosine_similarity(a, b);
            if (sim > FEATURE_SIMILARITY_GATE) {
                c += config_.K_feat * nb.weight * sim;
            }

            if (c != 0.0) row.push_back({nb.index, c});
        }
    }
}

void AttentionFieldEngine::compute_derivatives(const PhaseVector& theta, PhaseVector& out) {
    const size_t n = theta.size();
    const double alpha = config_.phase_lag;
    const double scale = config_.K / static_cast<double>(n);

    noise_.assign(n, 0.0);
    if (config_.noise_level > 0.0) {
        for (size_t a = 0; a < n; ++a) {
            noise_[a] = config_.noise_level * rng_->next_normal(0.0, 0.1);
        }
    }

    const int count = static_cast<int>(n);
#ifdef SYNCFIELD_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int ai = 0; ai < count; ++ai) {
        const size_t a = static_cast<size_t>(ai);
        double coupling = 0.0;
        for (const auto& nb : step_coupling_[a]) {
            coupling += nb.weight * std::sin(theta[nb.index] - theta[a] - alpha);
        }
        out[a] = omega_[a] + noise_[a] + scale * coupling;
    }
}

void AttentionFieldEngine::step() {
    // Field snapshot is frozen for all four RK4 stages
    update_stimulus_field();
    build_step_coupling();

    rk4_step(theta_, config_.dt,
             [this](const PhaseVector& in, PhaseVector& out) { compute_derivatives(in, out); },
             scratch_);

    time_ += config_.dt;
    record_history();
}

void AttentionFieldEngine::run(int n_steps) {
    for (int i = 0; i < n_steps; ++i) {
        step();
    }
}

// =============================================================================
// Attention map + tracking
// =============================================================================

std::vector<double> AttentionFieldEngine::attention_map() const {
    const size_t n = theta_.size();
    std::vector<double> cos_t(n), sin_t(n);
    for (size_t i = 0; i < n; ++i) {
        cos_t[i] = std::cos(theta_[i]);
        sin_t[i] = std::sin(theta_[i]);
    }

    std::vector<double> map(n, 0.0);
    const int count = static_cast<int>(n);
#ifdef SYNCFIELD_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (int ai = 0; ai < count; ++ai) {
        const size_t a = static_cast<size_t>(ai);
        const auto& nbs = spatial_->neighbors(a);
        if (nbs.empty()) continue;

        double re = 0.0, im = 0.0;
        for (const auto& nb : nbs) {
            re += cos_t[nb.index];
            im += sin_t[nb.index];
        }
        double n_nb = static_cast<double>(nbs.size());
        re /= n_nb;
        im /= n_nb;
        map[a] = std::sqrt(re * re + im * im);
    }
    return map;
}

std::vector<TrackedObject> AttentionFieldEngine::detect_tracked_objects() const {
    return detect_tracked_objects(attention_map());
}

std::vector<TrackedObject> AttentionFieldEngine::detect_tracked_objects(
    const std::vector<double>& attention_map
) const {
    std::vector<TrackedObject> tracked;
    const long g = static_cast<long>(grid_size());
    if (attention_map.size() != theta_.size()) return tracked;

    for (const auto& obj : objects_) {
        if (!std::isfinite(obj.x) || !std::isfinite(obj.y)) continue;
        const double cx = std::floor(obj.x);
        const double cy = std::floor(obj.y);
        const double gd = static_cast<double>(g);

        double total = 0.0;
        int count = 0;
        for (int dx = -1; dx <= 1; ++dx) {
            for (int dy = -1; dy <= 1; ++dy) {
                // Modular wraparound, also for positions outside the grid
                long i = static_cast<long>(std::fmod(std::fmod(cx + dx, gd) + gd, gd));
                long j = static_cast<long>(std::fmod(std::fmod(cy + dy, gd) + gd, gd));
                total += attention_map[static_cast<size_t>(i * g + j)];
                count++;
            }
        }

        double avg = total / static_cast<double>(count);
        if (avg > TRACKING_THRESHOLD) {
            tracked.push_back({obj.id, avg, obj.x, obj.y});
        }
    }
    return tracked;
}

void AttentionFieldEngine::record_history() {
    AttentionFrame frame;
    frame.time = time_;
    frame.attention_map = attention_map();
    frame.tracked = detect_tracked_objects(frame.attention_map);
    history_.push(std::move(frame));
}

// =============================================================================
// Parameters
// =============================================================================

void AttentionFieldEngine::update_parameters(const AttentionUpdate& update) {
    if (update.grid_size) check_positive(*update.grid_size, "gridSize");
    if (update.dt)        check_dt(*update.dt);

    if (update.K)           config_.K = *update.K;
    if (update.noise_level) config_.noise_level = *update.noise_level;
    if (update.phase_lag)   config_.phase_lag = *update.phase_lag;
    if (update.dt)          config_.dt = *update.dt;
    if (update.K_stim)      config_.K_stim = *update.K_stim;
    if (update.K_feat)      config_.K_feat = *update.K_feat;

    bool rebuild_weights = false;
    if (update.spatial_range && *update.spatial_range != config_.spatial_range) {
        config_.spatial_range = *update.spatial_range;
        rebuild_weights = true;
    }
    if (update.spatial_decay && *update.spatial_decay != config_.spatial_decay) {
        config_.spatial_decay = *update.spatial_decay;
        rebuild_weights = true;
    }

    if (update.grid_size && *update.grid_size != config_.grid_size) {
        config_.grid_size = *update.grid_size;
        // Override no longer matches the new N
        clear_network();
        allocate();
        initialize();
        return;
    }

    if (rebuild_weights) {
        spatial_ = std::make_unique<SpatialWeights>(grid_size(), config_.spatial_range,
                                                    config_.spatial_decay);
    }
}

// =============================================================================
// Network override
// =============================================================================

void AttentionFieldEngine::set_network(const Matrix& adjacency, TopologyType type,
                                       const TopologyParams& params) {
    if (adjacency.size() != theta_.size()) {
        throw TopologyMismatchError(
            "adjacency is " + std::to_string(adjacency.size()) + "x" +
            std::to_string(adjacency.size()) + " but gridSize^2 = " +
            std::to_string(theta_.size()));
    }
    override_ = std::make_unique<ExplicitAdjacency>(adjacency);
    topology_type_ = type;
    topology_params_ = params;
}

void AttentionFieldEngine::set_network(const Network& network) {
    set_network(network.adjacency, network.type, network.params);
}

void AttentionFieldEngine::clear_network() {
    override_.reset();
    topology_type_ = TopologyType::CUSTOM;
    topology_params_ = TopologyParams{};
}

std::string AttentionFieldEngine::network_label() const {
    return override_ ? std::string(topology_name(topology_type_)) : std::string("spatial");
}

// =============================================================================
// Observation
// =============================================================================

AttentionState AttentionFieldEngine::state() const {
    AttentionState s;
    s.theta = theta_;
    s.stimulus = field_.stimulus();
    s.features = field_.features();
    s.attention_map = attention_map();
    s.objects = objects_;
    s.tracked = detect_tracked_objects(s.attention_map);
    s.time = time_;
    s.grid_size = grid_size();
    return s;
}

std::vector<double> AttentionFieldEngine::time_series() const {
    return history_.column([](const AttentionFrame& f) { return f.time; });
}

std::vector<double> AttentionFieldEngine::mean_attention_series() const {
    return history_.column([](const AttentionFrame& f) {
        if (f.attention_map.empty()) return 0.0;
        double sum = 0.0;
        for (double v : f.attention_map) sum += v;
        return sum / static_cast<double>(f.attention_map.size());
    });
}

std::string AttentionFieldEngine::summary() const {
    auto map = attention_map();
    double mean = 0.0;
    for (double v : map) mean += v;
    if (!map.empty()) mean /= static_cast<double>(map.size());
    size_t n_tracked = detect_tracked_objects(map).size();

    char buf[224];
    snprintf(buf, sizeof(buf),
             "AttentionField %dx%d K=%.3f K_stim=%.3f K_feat=%.3f net=%s "
             "objects=%zu tracked=%zu t=%.2f mean_attention=%.4f",
             config_.grid_size, config_.grid_size, config_.K, config_.K_stim,
             config_.K_feat, network_label().c_str(), objects_.size(), n_tracked,
             time_, mean);
    return std::string(buf);
}

std::string AttentionFieldEngine::render_ascii(const std::vector<double>& attention_map) const {
    static const char RAMP[] = " .:-=+*#%@";
    constexpr size_t LEVELS = sizeof(RAMP) - 1;

    const size_t g = grid_size();
    std::string out;
    out.reserve(g * (g + 1));
    for (size_t i = 0; i < g; ++i) {
        for (size_t j = 0; j < g; ++j) {
            size_t idx = i * g + j;
            double v = idx < attention_map.size() ? attention_map[idx] : 0.0;
            if (!(v > 0.0)) v = 0.0;
            size_t level = std::min(LEVELS - 1, static_cast<size_t>(v * static_cast<double>(LEVELS)));
            out += RAMP[level];
        }
        out += '\n';
    }
    return out;
}

} // namespace syncfield
