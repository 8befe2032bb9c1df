#pragma once
/**
 * AttentionFieldEngine — 二维注意力场 (网格上的 Kuramoto 振子)
 *
 * gridSize × gridSize 个振子, 耦合同时受刺激强度和特征相似度门控:
 *
 *   dθ_a/dt = ω_a + η_a + (K/N) · ( K_stim · Σ_b w_ab · (s_a + s_b)/2 · sin(θ_b − θ_a − α)
 *                                 + K_feat · Σ_{b: c_ab > 0.5} w_ab · c_ab · sin(θ_b − θ_a − α) )
 *
 *   w_ab : 空间衰减权重 exp(−decay·dist) (dist ≤ range), 或外部邻接覆盖
 *   s    : 刺激强度场 (每步由运动刺激物重新投影)
 *   c_ab : 特征余弦相似度 (硬门限 0.5)
 *
 * 每步流程:
 *   1. 刺激物位置积分 + 反弹, 重建刺激/特征场
 *   2. 冻结场快照, RK4 四阶段求导 (刺激物每步只移动一次, 不随 RK4 阶段移动)
 *   3. 注意力图: 每格在其空间邻居 (始终用空间权重, 不用邻接覆盖) 上的局部序参量
 *   4. 跟踪检测: 刺激物中心 3×3 邻域 (取模环绕) 的平均注意力 > 0.6 即视为被跟踪
 *   5. 历史: 固定 500 帧环形缓冲
 */

#include "core/types.h"
#include "core/random_source.h"
#include "core/history_buffer.h"
#include "engine/coupling.h"
#include "engine/rk4.h"
#include "engine/stimulus.h"
#include "network/topology.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace syncfield {

constexpr double TRACKING_THRESHOLD       = 0.6;
constexpr double FEATURE_SIMILARITY_GATE  = 0.5;

struct AttentionFieldConfig {
    int      grid_size     = 32;     // 边长 (> 0), N = grid_size²
    double   K             = 2.0;    // 基础耦合强度
    double   dt            = 0.05;   // 积分步长 (> 0)
    double   noise_level   = 0.0;
    double   phase_lag     = 0.0;
    double   K_stim        = 1.5;    // 刺激驱动耦合倍率
    double   K_feat        = 2.0;    // 特征绑定耦合倍率
    double   spatial_range = 4.0;    // 空间耦合半径 (格)
    double   spatial_decay = 0.3;    // 指数衰减常数
    int      num_features  = 3;      // 特征维数 F (> 0)
    double   omega_std     = 0.5;    // 自然频率标准差
    size_t   history_cap   = ATTENTION_HISTORY_CAP;
    uint32_t seed          = 42;
};

/** 部分参数更新; grid_size 改变会重建整个场并 initialize() */
struct AttentionUpdate {
    std::optional<int>    grid_size;
    std::optional<double> K;
    std::optional<double> dt;
    std::optional<double> noise_level;
    std::optional<double> phase_lag;
    std::optional<double> K_stim;
    std::optional<double> K_feat;
    std::optional<double> spatial_range;
    std::optional<double> spatial_decay;
};

/** 被跟踪的刺激物 */
struct TrackedObject {
    std::string id;
    double attention = 0.0;   // 3×3 邻域平均注意力
    double x         = 0.0;
    double y         = 0.0;
};

struct AttentionFrame {
    double time = 0.0;
    std::vector<double>        attention_map;
    std::vector<TrackedObject> tracked;
};

/** 状态快照 (全部为副本) */
struct AttentionState {
    PhaseVector                      theta;
    std::vector<double>              stimulus;
    std::vector<std::vector<double>> features;
    std::vector<double>              attention_map;
    std::vector<StimulusObject>      objects;
    std::vector<TrackedObject>       tracked;
    double time      = 0.0;
    size_t grid_size = 0;
};

class AttentionFieldEngine {
public:
    /**
     * @param config 配置 (grid_size ≤ 0, dt ≤ 0 或 num_features ≤ 0 抛 ConfigurationError)
     * @param rng    随机源; 为空时使用 MersenneSource(config.seed)
     */
    explicit AttentionFieldEngine(const AttentionFieldConfig& config = {},
                                  std::unique_ptr<RandomSource> rng = nullptr);

    AttentionFieldEngine(const AttentionFieldEngine&) = delete;
    AttentionFieldEngine& operator=(const AttentionFieldEngine&) = delete;
    AttentionFieldEngine(AttentionFieldEngine&&) = default;
    AttentionFieldEngine& operator=(AttentionFieldEngine&&) = default;

    // --- 仿真控制 ---

    /** 随机相位/频率, 刺激与特征归基线, 时间归零, 清空历史 (刺激物保留) */
    void initialize();

    void step();
    void run(int n_steps);

    void update_parameters(const AttentionUpdate& update);

    // --- 网络覆盖 ---

    /** 用 N×N 邻接矩阵覆盖空间权重 (N = grid_size²; 否则抛 TopologyMismatchError) */
    void set_network(const Matrix& adjacency,
                     TopologyType type = TopologyType::CUSTOM,
                     const TopologyParams& params = {});
    void set_network(const Network& network);

    /** 回到空间权重耦合 */
    void clear_network();

    bool has_network() const { return override_ != nullptr; }
    /** "spatial" 或覆盖网络的拓扑名 */
    std::string network_label() const;
    TopologyType          topology_type()   const { return topology_type_; }
    const TopologyParams& topology_params() const { return topology_params_; }

    // --- 刺激物 ---

    /** 添加刺激物 (缺省字段补默认值), 返回其 id */
    std::string add_stimulus_object(const StimulusObjectConfig& config = {});

    /** 按 id 移除, 不存在时返回 false */
    bool remove_stimulus_object(const std::string& id);

    void clear_stimulus_objects() { objects_.clear(); }

    const std::vector<StimulusObject>& stimulus_objects() const { return objects_; }

    // --- 观测 ---

    /** 每格局部序参量 (空间邻居上), 无邻居的格为 0 */
    std::vector<double> attention_map() const;

    /** 根据注意力图判断哪些刺激物被跟踪 */
    std::vector<TrackedObject> detect_tracked_objects() const;
    std::vector<TrackedObject> detect_tracked_objects(const std::vector<double>& attention_map) const;

    AttentionState state() const;

    const HistoryBuffer<AttentionFrame>& history() const { return history_; }
    std::vector<double> time_series() const;
    /** 每帧注意力图的全场均值 (可直接送入 compute_run_metrics) */
    std::vector<double> mean_attention_series() const;

    // --- 访问器 ---
    size_t grid_size()    const { return static_cast<size_t>(config_.grid_size); }
    size_t size()         const { return theta_.size(); }
    size_t num_features() const { return static_cast<size_t>(config_.num_features); }
    double time()         const { return time_; }
    const AttentionFieldConfig& config() const { return config_; }

    const PhaseVector&    theta()           const { return theta_; }
    const PhaseVector&    omega()           const { return omega_; }
    const StimulusField&  field()           const { return field_; }
    const SpatialWeights& spatial_weights() const { return *spatial_; }
    /** 当前生效的耦合权重 (覆盖网络或空间权重) */
    const CouplingWeights& active_coupling() const {
        return override_ ? static_cast<const CouplingWeights&>(*override_) : *spatial_;
    }

    std::string summary() const;

    /** 文本热力图 (每格一个字符, 按注意力分级) */
    std::string render_ascii(const std::vector<double>& attention_map) const;

private:
    void update_stimulus_field();
    void build_step_coupling();
    void compute_derivatives(const PhaseVector& theta, PhaseVector& out);
    void record_history();
    void allocate();

    AttentionFieldConfig config_;
    std::unique_ptr<RandomSource> rng_;

    PhaseVector theta_;
    PhaseVector omega_;
    double time_ = 0.0;

    StimulusField field_;
    std::unique_ptr<SpatialWeights>    spatial_;
    std::unique_ptr<ExplicitAdjacency> override_;   // nullptr = 空间权重
    TopologyType   topology_type_ = TopologyType::CUSTOM;
    TopologyParams topology_params_;

    std::vector<StimulusObject> objects_;
    size_t next_object_id_ = 1;

    // 本步冻结的耦合系数: K_stim·w·(s_a+s_b)/2 + K_feat·w·c_ab (门控后)
    std::vector<std::vector<Neighbor>> step_coupling_;

    HistoryBuffer<AttentionFrame> history_;
    Rk4Scratch scratch_;
    PhaseVector noise_;
};

} // namespace syncfield
