#pragma once
/**
 * Layer 0: 基础类型定义
 *
 * SyncField 最底层的"原子"定义，不依赖任何其他模块。
 *
 *   Phase      : 振子相位 θ, 每步积分后保持在 (−π, π]
 *   PhaseVector: N 个振子的相位/频率向量 (SoA)
 *   Matrix     : 行主序稠密 N×N 矩阵 (邻接 / 空间权重)
 */

#include <cstdint>
#include <cstddef>
#include <cmath>
#include <vector>

namespace syncfield {

using Phase       = double;
using PhaseVector = std::vector<double>;

constexpr double PI     = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;

// =============================================================================
// 相位工具
// =============================================================================

/**
 * 将相位折回 (−π, π]
 *
 * 任意大的偏移都能处理: 先 fmod 缩到 (−2π, 2π), 再做 ±2π 调整。
 * 非有限值 (NaN/Inf) 原样返回。
 */
inline Phase wrap_phase(Phase theta) {
    if (!std::isfinite(theta)) return theta;
    theta = std::fmod(theta, TWO_PI);
    while (theta > PI)   theta -= TWO_PI;
    while (theta <= -PI) theta += TWO_PI;
    return theta;
}

/** 两个相位的最短有向差 a − b, 结果在 (−π, π] */
inline Phase phase_difference(Phase a, Phase b) {
    return wrap_phase(a - b);
}

/**
 * Kuramoto 序参量 r = |⟨e^{iθ}⟩|
 *
 * 0 = 完全无序, 1 = 完全同步。空向量返回 0。
 */
inline double order_parameter(const PhaseVector& theta) {
    if (theta.empty()) return 0.0;
    double sum_re = 0.0;
    double sum_im = 0.0;
    for (double t : theta) {
        sum_re += std::cos(t);
        sum_im += std::sin(t);
    }
    double n = static_cast<double>(theta.size());
    sum_re /= n;
    sum_im /= n;
    return std::sqrt(sum_re * sum_re + sum_im * sum_im);
}

// =============================================================================
// 稠密方阵
// =============================================================================

/**
 * 行主序 N×N 矩阵: 邻接矩阵与空间权重张量共用
 *
 * 非负权重; 0 表示无连接。
 */
class Matrix {
public:
    Matrix() = default;
    explicit Matrix(size_t n, double fill = 0.0)
        : n_(n), data_(n * n, fill) {}

    /** 从嵌套向量构造 (Python/工具层使用). 非方阵抛 TopologyMismatchError */
    static Matrix from_rows(const std::vector<std::vector<double>>& rows);

    size_t size() const { return n_; }
    bool   empty() const { return n_ == 0; }

    double  at(size_t i, size_t j) const { return data_[i * n_ + j]; }
    double& at(size_t i, size_t j)       { return data_[i * n_ + j]; }

    void set_symmetric(size_t i, size_t j, double w) {
        data_[i * n_ + j] = w;
        data_[j * n_ + i] = w;
    }

    const double* row(size_t i) const { return data_.data() + i * n_; }

    /** 非零非对角元素个数 (有向计数) */
    size_t count_nonzero() const;

    bool is_symmetric() const;

    std::vector<std::vector<double>> to_rows() const;

    const std::vector<double>& data() const { return data_; }

private:
    size_t n_ = 0;
    std::vector<double> data_;
};

} // namespace syncfield
