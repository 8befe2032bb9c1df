#pragma once
/**
 * KuramotoEngine — 耦合相位振子群 (Kuramoto 模型)
 *
 * 相位方程 (RK4 积分, 每步后折回 (−π, π]):
 *
 *   dθ_i/dt = ω_i + η_i + (K/N) · Σ_{j≠i} S_ij · sin(θ_j − θ_i − α)
 *
 *   ω_i ~ N(0, omega_std)         自然频率, initialize() 时抽取一次
 *   η_i = noise_level · N(0, 0.1) 每次导数求值重新抽取
 *   S_ij                           邻接权重; 未设置网络时为全连接 (S = 1)
 *   α                              相位滞后
 *
 * 状态机:
 *   构造 (校验 + initialize) → step()* ;
 *   update_parameters() 只改标量则原地生效, N 改变则重新分配并 initialize()
 *   (自然频率重抽、历史清空、网络覆盖被丢弃, 属于破坏性操作);
 *   set_network() 只替换耦合数据, 不动相位。
 *
 * 同一实例的 step() 不可并发调用。定义 SYNCFIELD_OPENMP 时逐振子求导并行,
 * 噪声项仍按振子顺序串行抽取。state() 返回副本。
 */

#include "core/types.h"
#include "core/random_source.h"
#include "core/history_buffer.h"
#include "engine/coupling.h"
#include "engine/rk4.h"
#include "network/topology.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncfield {

struct KuramotoConfig {
    int      n           = 50;     // 振子数 (> 0)
    double   K           = 2.0;    // 耦合强度
    double   dt          = 0.05;   // 积分步长 (> 0)
    double   noise_level = 0.0;    // 噪声幅度
    double   phase_lag   = 0.0;    // α
    double   omega_std   = 1.0;    // 自然频率标准差
    size_t   history_cap = KURAMOTO_HISTORY_CAP;  // 0 = 不设上限
    uint32_t seed        = 42;     // 默认随机源种子
};

/** 部分参数更新, 未设置的字段保持不变 */
struct KuramotoUpdate {
    std::optional<int>    n;
    std::optional<double> K;
    std::optional<double> dt;
    std::optional<double> noise_level;
    std::optional<double> phase_lag;
};

/** 单步历史帧 */
struct KuramotoFrame {
    double      time            = 0.0;
    double      order_parameter = 0.0;
    PhaseVector phases;
};

/** 状态快照 (副本, 与引擎后续步进无关) */
struct KuramotoState {
    PhaseVector theta;
    PhaseVector omega;
    double      time            = 0.0;
    double      order_parameter = 0.0;
    size_t      n               = 0;
    double      K               = 0.0;
};

class KuramotoEngine {
public:
    /**
     * @param config 配置 (n ≤ 0 或 dt ≤ 0 抛 ConfigurationError)
     * @param rng    随机源; 为空时使用 MersenneSource(config.seed)
     */
    explicit KuramotoEngine(const KuramotoConfig& config = {},
                            std::unique_ptr<RandomSource> rng = nullptr);

    KuramotoEngine(const KuramotoEngine&) = delete;
    KuramotoEngine& operator=(const KuramotoEngine&) = delete;
    KuramotoEngine(KuramotoEngine&&) = default;
    KuramotoEngine& operator=(KuramotoEngine&&) = default;

    // --- 仿真控制 ---

    /** 随机相位 (−π, π] + 随机频率, 时间归零, 清空历史 */
    void initialize();

    /** RK4 推进一个 dt, 追加一帧历史 */
    void step();

    /** 运行 n 步 */
    void run(int n_steps);

    /** 合并部分参数 (先校验后修改); N 改变会触发 initialize() */
    void update_parameters(const KuramotoUpdate& update);

    // --- 网络 ---

    /** 替换耦合矩阵 (维度 ≠ N 抛 TopologyMismatchError) */
    void set_network(const Matrix& adjacency,
                     TopologyType type = TopologyType::CUSTOM,
                     const TopologyParams& params = {});
    void set_network(const Network& network);

    /** 回到全连接 */
    void clear_network();

    bool has_network() const { return coupling_ != nullptr; }
    TopologyType          topology_type()   const { return topology_type_; }
    const TopologyParams& topology_params() const { return topology_params_; }
    /** 当前邻接矩阵; 全连接模式下为空矩阵 */
    const Matrix& adjacency() const;

    // --- 观测 ---

    /** 序参量 r ∈ [0, 1], 每次调用重新计算 */
    double order_parameter() const;

    KuramotoState state() const;

    const HistoryBuffer<KuramotoFrame>& history() const { return history_; }
    std::vector<double> time_series() const;
    std::vector<double> order_parameter_series() const;

    // --- 访问器 ---
    size_t size()        const { return theta_.size(); }
    double K()           const { return config_.K; }
    double dt()          const { return config_.dt; }
    double noise_level() const { return config_.noise_level; }
    double phase_lag()   const { return config_.phase_lag; }
    double time()        const { return time_; }
    const KuramotoConfig& config() const { return config_; }

    const PhaseVector& theta() const { return theta_; }
    const PhaseVector& omega() const { return omega_; }

    /** 单行摘要 */
    std::string summary() const;

private:
    void compute_derivatives(const PhaseVector& theta, PhaseVector& out);
    void record_history();

    static void validate(const KuramotoConfig& config);

    KuramotoConfig config_;
    std::unique_ptr<RandomSource> rng_;

    PhaseVector theta_;
    PhaseVector omega_;
    double time_ = 0.0;

    std::unique_ptr<ExplicitAdjacency> coupling_;   // nullptr = 全连接
    TopologyType   topology_type_ = TopologyType::ALL_TO_ALL;
    TopologyParams topology_params_;

    HistoryBuffer<KuramotoFrame> history_;
    Rk4Scratch scratch_;
    PhaseVector noise_;   // 每次求导的噪声项 η
};

} // namespace syncfield
