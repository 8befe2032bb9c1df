#pragma once
/**
 * 运动刺激物 + 刺激/特征场投影
 *
 * 刺激物: 网格坐标系中的点源 (x = 行, y = 列), 带速度、半径、强度和特征向量。
 * 每步:
 *   1. advance_object(): 位置积分 (vx, vy)·dt; 进入 2 格边界带时
 *      速度乘 −0.95 反弹并钳位到 [2, gridSize − 2] (非弹性反射墙)
 *   2. StimulusField::clear(): 刺激归 0, 特征归中性值 0.5
 *   3. StimulusField::project(): 按刺激物顺序逐个叠加
 *        a = intensity · exp(−0.5·(dist/radius)²),  dist ≤ 2·radius
 *        stimulus = max(stimulus, a)
 *        a > 0.1 时 features = features·(1 − a) + obj.features·a
 *      混合依赖刺激物顺序 (后加入的覆盖先加入的), 不满足结合律。
 */

#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace syncfield {

constexpr double BOUNDARY_PADDING     = 2.0;
constexpr double BOUNCE_DAMPING       = -0.95;
constexpr double NEUTRAL_FEATURE      = 0.5;
constexpr double FEATURE_BLEND_MIN    = 0.1;    // 特征混合的最小激活
constexpr double DEFAULT_OBJECT_RADIUS = 3.0;

struct StimulusObject {
    std::string id;
    double x         = 0.0;   // 行坐标
    double y         = 0.0;   // 列坐标
    double vx        = 0.0;
    double vy        = 0.0;
    double radius    = DEFAULT_OBJECT_RADIUS;
    double intensity = 1.0;
    std::vector<double> features;
};

/**
 * 部分配置: 缺省字段由引擎补全:
 *   位置 = 网格中心, 速度 = 0, 半径 = 3, 强度 = 1, 特征 = 中性 0.5
 */
struct StimulusObjectConfig {
    std::optional<std::string>         id;
    std::optional<double>              x;
    std::optional<double>              y;
    std::optional<double>              vx;
    std::optional<double>              vy;
    std::optional<double>              radius;
    std::optional<double>              intensity;
    std::optional<std::vector<double>> features;
};

/** 位置积分 + 边界反弹 */
void advance_object(StimulusObject& obj, double dt, size_t grid_size);

/**
 * 刺激强度场 + 特征场 (gridSize² 个格点, 每格 F 维特征)
 */
class StimulusField {
public:
    StimulusField(size_t grid_size, size_t num_features);

    /** 刺激归零, 特征归中性值 */
    void clear();

    /** 叠加一个刺激物的高斯投影 */
    void project(const StimulusObject& obj);

    /** 投影完成后刷新每格特征模长 (余弦相似度用) */
    void update_norms();

    /**
     * 两格特征的余弦相似度; 任一模长为 0 时返回 0
     * 需要先调用 update_norms()
     */
    double cosine_similarity(size_t a, size_t b) const;

    size_t grid_size()    const { return grid_size_; }
    size_t num_features() const { return num_features_; }
    size_t size()         const { return stimulus_.size(); }

    const std::vector<double>& stimulus() const { return stimulus_; }
    double stimulus(size_t idx) const { return stimulus_[idx]; }

    /** idx 格的第 f 维特征 */
    double feature(size_t idx, size_t f) const { return features_[idx * num_features_ + f]; }

    /** 嵌套副本 [N][F] */
    std::vector<std::vector<double>> features() const;

private:
    size_t grid_size_;
    size_t num_features_;
    std::vector<double> stimulus_;   // N
    std::vector<double> features_;   // N×F, row-major
    std::vector<double> norms_;      // N
};

} // namespace syncfield
