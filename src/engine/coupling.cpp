#include "engine/coupling.h"
#include <cmath>
#include <utility>

namespace syncfield {

size_t CouplingWeights::n_links() const {
    size_t n = 0;
    for (const auto& r : rows_) n += r.size();
    return n;
}

// =============================================================================
// SpatialWeights
// =============================================================================

SpatialWeights::SpatialWeights(size_t grid_size, double spatial_range, double spatial_decay)
    : grid_size_(grid_size)
    , n_(grid_size * grid_size)
    , range_(spatial_range)
    , decay_(spatial_decay)
    , dense_(n_ * n_, 0.0f)
{
    rows_.resize(n_);

    for (size_t i = 0; i < grid_size_; ++i) {
        for (size_t j = 0; j < grid_size_; ++j) {
            const size_t idx1 = i * grid_size_ + j;

            for (size_t k = 0; k < grid_size_; ++k) {
                for (size_t l = 0; l < grid_size_; ++l) {
                    const size_t idx2 = k * grid_size_ + l;
                    if (idx1 == idx2) continue;

                    double dx = static_cast<double>(i) - static_cast<double>(k);
                    double dy = static_cast<double>(j) - static_cast<double>(l);
                    double dist = std::sqrt(dx * dx + dy * dy);
                    if (dist > range_) continue;

                    float w = static_cast<float>(std::exp(-decay_ * dist));
                    dense_[idx1 * n_ + idx2] = w;
                    if (w > 0.0f) {
                        rows_[idx1].push_back({static_cast<uint32_t>(idx2),
                                               static_cast<double>(w)});
                    }
                }
            }
        }
    }
}

// =============================================================================
// ExplicitAdjacency
// =============================================================================

ExplicitAdjacency::ExplicitAdjacency(Matrix adjacency)
    : adjacency_(std::move(adjacency))
{
    const size_t n = adjacency_.size();
    rows_.resize(n);
    for (size_t i = 0; i < n; ++i) {
        const double* row = adjacency_.row(i);
        for (size_t j = 0; j < n; ++j) {
            if (j != i && row[j] != 0.0) {
                rows_[i].push_back({static_cast<uint32_t>(j), row[j]});
            }
        }
    }
}

} // namespace syncfield
