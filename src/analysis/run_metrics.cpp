#include "analysis/run_metrics.h"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace syncfield {

namespace {

void mean_std(const double* first, const double* last, double& mean, double& stddev) {
    const double n = static_cast<double>(last - first);
    double sum = 0.0;
    for (const double* p = first; p != last; ++p) sum += *p;
    mean = sum / n;
    double var = 0.0;
    for (const double* p = first; p != last; ++p) var += (*p - mean) * (*p - mean);
    stddev = std::sqrt(var / n);
}

std::optional<double> settling_time(const std::vector<double>& time,
                                    const std::vector<double>& r,
                                    size_t n, double final_r) {
    const double threshold = SETTLING_THRESHOLD_RATIO * final_r;
    const double band      = SETTLING_BAND_RATIO * final_r;
    const size_t window    = std::min(SETTLING_MAX_WINDOW, n / 10);

    for (size_t i = 0; i + window < n; ++i) {
        if (r[i] < threshold) continue;
        bool settled = true;
        for (size_t j = i; j < i + window; ++j) {
            if (std::fabs(r[j] - final_r) > band) {
                settled = false;
                break;
            }
        }
        if (settled) return time[i];
    }
    return std::nullopt;
}

bool check_converged(const std::vector<double>& r, size_t n) {
    if (n < METRICS_MIN_SAMPLES) return false;
    const size_t start = static_cast<size_t>(std::floor(static_cast<double>(n) * 0.8));
    double mean = 0.0, stddev = 0.0;
    mean_std(r.data() + start, r.data() + n, mean, stddev);
    return stddev < CONVERGED_MAX_STD;
}

bool check_oscillating(const std::vector<double>& r, size_t n) {
    if (n < METRICS_MIN_SAMPLES) return false;
    const size_t start = n / 2;
    const size_t len = n - start;

    // Local extrema = sign change of the first difference
    size_t extrema = 0;
    for (size_t i = start + 1; i + 1 < n; ++i) {
        double prev = r[i] - r[i - 1];
        double next = r[i + 1] - r[i];
        if (prev * next < 0.0) extrema++;
    }
    return static_cast<double>(extrema) / static_cast<double>(len) > OSCILLATION_MIN_RATE;
}

} // namespace

RunMetrics compute_run_metrics(const std::vector<double>& time,
                               const std::vector<double>& r) {
    RunMetrics m;
    const size_t n = std::min(time.size(), r.size());
    if (n == 0) return m;

    m.final_r = r[n - 1];
    mean_std(r.data(), r.data() + n, m.mean_r, m.std_r);
    auto mm = std::minmax_element(r.begin(), r.begin() + static_cast<std::ptrdiff_t>(n));
    m.min_r = *mm.first;
    m.max_r = *mm.second;

    m.settling_time = settling_time(time, r, n, m.final_r);
    m.converged     = check_converged(r, n);
    m.oscillating   = check_oscillating(r, n);
    return m;
}

std::string RunMetrics::summary() const {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4);
    ss << "r_final=" << final_r << " mean=" << mean_r << " std=" << std_r
       << " range=[" << min_r << "," << max_r << "]";
    ss << std::setprecision(2) << " settle=";
    if (settling_time) ss << *settling_time;
    else               ss << "none";
    ss << " converged=" << (converged ? "yes" : "no")
       << " oscillating=" << (oscillating ? "yes" : "no");
    return ss.str();
}

// =============================================================================
// Classification
// =============================================================================

double estimate_critical_coupling(TopologyType type) {
    switch (type) {
        case TopologyType::ALL_TO_ALL:  return 0.64;
        case TopologyType::RING:        return 2.0;   // local coupling only
        case TopologyType::SMALL_WORLD: return 1.0;
        case TopologyType::SCALE_FREE:  return 0.8;
        case TopologyType::RANDOM:      return 1.2;   // depends on density
        case TopologyType::CUSTOM:      break;
    }
    return 0.64;
}

const char* classify_sync_state(double final_r) {
    if (final_r < 0.2)  return "incoherent";
    if (final_r < 0.5)  return "weakly synchronized";
    if (final_r < 0.8)  return "partially synchronized";
    if (final_r < 0.95) return "strongly synchronized";
    return "fully synchronized";
}

const char* classify_regime(double K, TopologyType type) {
    double ratio = K / estimate_critical_coupling(type);
    if (ratio < 0.85) return "subcritical";
    if (ratio < 1.15) return "critical";
    return "supercritical";
}

} // namespace syncfield
