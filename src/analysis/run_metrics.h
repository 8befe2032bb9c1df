#pragma once
/**
 * RunMetrics — 序参量时间序列的运行摘要
 *
 * 输入: 等长的 time / r 序列 (长度不等时按较短者截断)
 *
 *   final/mean/std/min/max  基础统计 (std 为总体标准差)
 *   settling_time           首个 r ≥ 0.9·final 且随后 window 个样本都在
 *                           |r − final| ≤ 0.05·final 内的时刻;
 *                           window = min(50, floor(0.1·n)); 找不到为空
 *   converged               n ≥ 100 且末尾 20% 的标准差 < 0.05
 *   oscillating             n ≥ 100 且后 50% 中局部极值占比 > 0.05
 *
 * 另附临界耦合估计与同步状态/区间分类 (经验常数)。
 */

#include "network/topology.h"
#include <optional>
#include <string>
#include <vector>

namespace syncfield {

struct RunMetrics {
    double final_r = 0.0;
    double mean_r  = 0.0;
    double std_r   = 0.0;
    double min_r   = 0.0;
    double max_r   = 0.0;
    std::optional<double> settling_time;
    bool converged   = false;
    bool oscillating = false;

    std::string summary() const;
};

constexpr size_t METRICS_MIN_SAMPLES      = 100;   // converged / oscillating 的最少样本
constexpr size_t SETTLING_MAX_WINDOW      = 50;
constexpr double SETTLING_THRESHOLD_RATIO = 0.9;
constexpr double SETTLING_BAND_RATIO      = 0.05;
constexpr double CONVERGED_MAX_STD        = 0.05;
constexpr double OSCILLATION_MIN_RATE     = 0.05;

/** 空序列返回全零摘要 */
RunMetrics compute_run_metrics(const std::vector<double>& time,
                               const std::vector<double>& r);

/**
 * 各拓扑的经验临界耦合 K_c
 * (全连接 + 标准正态频率: K_c = 2/(π·g(0)) ≈ 0.64)
 */
double estimate_critical_coupling(TopologyType type);

/** "incoherent" / "weakly synchronized" / ... / "fully synchronized" */
const char* classify_sync_state(double final_r);

/** K/K_c < 0.85 → "subcritical", < 1.15 → "critical", 否则 "supercritical" */
const char* classify_regime(double K, TopologyType type);

} // namespace syncfield
