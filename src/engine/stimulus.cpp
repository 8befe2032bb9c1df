#include "engine/stimulus.h"
#include <algorithm>
#include <cmath>

namespace syncfield {

void advance_object(StimulusObject& obj, double dt, size_t grid_size) {
    obj.x += obj.vx * dt;
    obj.y += obj.vy * dt;

    const double lo = BOUNDARY_PADDING;
    const double hi = static_cast<double>(grid_size) - BOUNDARY_PADDING;

    if (obj.x < lo || obj.x >= hi) {
        obj.vx *= BOUNCE_DAMPING;
        obj.x = std::max(lo, std::min(hi, obj.x));
    }
    if (obj.y < lo || obj.y >= hi) {
        obj.vy *= BOUNCE_DAMPING;
        obj.y = std::max(lo, std::min(hi, obj.y));
    }
}

// =============================================================================
// StimulusField
// =============================================================================

StimulusField::StimulusField(size_t grid_size, size_t num_features)
    : grid_size_(grid_size)
    , num_features_(num_features)
    , stimulus_(grid_size * grid_size, 0.0)
    , features_(grid_size * grid_size * num_features, NEUTRAL_FEATURE)
    , norms_(grid_size * grid_size, 0.0)
{
    update_norms();
}

void StimulusField::clear() {
    std::fill(stimulus_.begin(), stimulus_.end(), 0.0);
    std::fill(features_.begin(), features_.end(), NEUTRAL_FEATURE);
}

void StimulusField::project(const StimulusObject& obj) {
    if (!(obj.radius > 0.0) || grid_size_ == 0) return;
    if (!std::isfinite(obj.x) || !std::isfinite(obj.y) || !std::isfinite(obj.radius)) return;

    const double reach = obj.radius * 2.0;
    const long g = static_cast<long>(grid_size_);

    // Only cells inside the 2·radius disc can be touched
    const double last = static_cast<double>(g - 1);
    long i0 = static_cast<long>(std::max(0.0, std::floor(obj.x - reach)));
    long i1 = static_cast<long>(std::min(last, std::ceil(obj.x + reach)));
    long j0 = static_cast<long>(std::max(0.0, std::floor(obj.y - reach)));
    long j1 = static_cast<long>(std::min(last, std::ceil(obj.y + reach)));

    for (long i = i0; i <= i1; ++i) {
        for (long j = j0; j <= j1; ++j) {
            double dx = static_cast<double>(i) - obj.x;
            double dy = static_cast<double>(j) - obj.y;
            double dist = std::sqrt(dx * dx + dy * dy);
            if (dist > reach) continue;

            const size_t idx = static_cast<size_t>(i * g + j);
            double u = dist / obj.radius;
            double activation = obj.intensity * std::exp(-0.5 * u * u);

            stimulus_[idx] = std::max(stimulus_[idx], activation);

            if (activation > FEATURE_BLEND_MIN) {
                double* f = &features_[idx * num_features_];
                for (size_t k = 0; k < num_features_; ++k) {
                    double target = k < obj.features.size() ? obj.features[k] : NEUTRAL_FEATURE;
                    f[k] = f[k] * (1.0 - activation) + target * activation;
                }
            }
        }
    }
}

void StimulusField::update_norms() {
    for (size_t idx = 0; idx < stimulus_.size(); ++idx) {
        const double* f = &features_[idx * num_features_];
        double sq = 0.0;
        for (size_t k = 0; k < num_features_; ++k) sq += f[k] * f[k];
        norms_[idx] = std::sqrt(sq);
    }
}

double StimulusField::cosine_similarity(size_t a, size_t b) const {
    if (norms_[a] == 0.0 || norms_[b] == 0.0) return 0.0;
    const double* fa = &features_[a * num_features_];
    const double* fb = &features_[b * num_features_];
    double dot = 0.0;
    for (size_t k = 0; k < num_features_; ++k) dot += fa[k] * fb[k];
    return dot / (norms_[a] * norms_[b]);
}

std::vector<std::vector<double>> StimulusField::features() const {
    std::vector<std::vector<double>> out(stimulus_.size());
    for (size_t idx = 0; idx < out.size(); ++idx) {
        auto first = features_.begin() + static_cast<std::ptrdiff_t>(idx * num_features_);
        out[idx].assign(first, first + static_cast<std::ptrdiff_t>(num_features_));
    }
    return out;
}

} // namespace syncfield
