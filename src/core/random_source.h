#pragma once
/**
 * RandomSource — 可注入的随机数源
 *
 * 所有随机过程 (初始相位、自然频率、噪声项、网络生成) 都通过
 * 该接口取数, 测试可以固定种子或替换为确定性序列。
 *
 *   next_uniform() : [0, 1) 均匀分布
 *   next_normal()  : Box-Muller 变换, z = sqrt(−2 ln u1)·cos(2π u2),
 *                    u1, u2 ∈ (0, 1)
 */

#include <cstdint>
#include <cstddef>
#include <random>

namespace syncfield {

class RandomSource {
public:
    virtual ~RandomSource() = default;

    /** [0, 1) 均匀分布 */
    virtual double next_uniform() = 0;

    /** N(mean, std_dev), 默认实现为 Box-Muller */
    virtual double next_normal(double mean = 0.0, double std_dev = 1.0);

    /** [0, n) 均匀整数, n == 0 时返回 0 */
    size_t next_index(size_t n);
};

/**
 * 默认随机源: std::mt19937 + Box-Muller
 */
class MersenneSource : public RandomSource {
public:
    explicit MersenneSource(uint32_t seed = 42) : rng_(seed) {}

    double next_uniform() override;

    void reseed(uint32_t seed) { rng_.seed(seed); }

private:
    std::mt19937 rng_;
    std::uniform_real_distribution<double> unit_{0.0, 1.0};
};

} // namespace syncfield
