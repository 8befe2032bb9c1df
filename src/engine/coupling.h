#pragma once
/**
 * CouplingWeights — 耦合权重提供者
 *
 * 两种实现, 在 set_network() 时选定:
 *   SpatialWeights    : 网格距离衰减 w = exp(−decay·dist) (dist ≤ range), 自身为 0
 *   ExplicitAdjacency : 外部提供的 N×N 邻接矩阵 (拓扑生成器输出或自定义)
 *
 * 除稠密查询 weight(i, j) 外, 每行还预存非零项 (j ≠ i) 的稀疏列表,
 * 导数求和只遍历非零邻居: 空间模式下每个格点只有 O(range²) 个邻居。
 *
 * 网格格点用扁平下标 idx = row·gridSize + col; 邻接矩阵也按该下标索引。
 */

#include "core/types.h"
#include <vector>
#include <cstdint>
#include <cstddef>

namespace syncfield {

struct Neighbor {
    uint32_t index;
    double   weight;
};

class CouplingWeights {
public:
    virtual ~CouplingWeights() = default;

    /** 节点数 N */
    virtual size_t size() const = 0;

    /** 稠密查询 w(i, j) */
    virtual double weight(size_t i, size_t j) const = 0;

    /** 第 i 行的非零权重 (不含自身) */
    const std::vector<Neighbor>& neighbors(size_t i) const { return rows_[i]; }

    /** 所有行非零项之和 (有向计数) */
    size_t n_links() const;

protected:
    std::vector<std::vector<Neighbor>> rows_;
};

/**
 * 空间衰减权重张量: 构造时 O(gridSize⁴) 预计算, 只在 range/decay 改变时重建
 */
class SpatialWeights : public CouplingWeights {
public:
    SpatialWeights(size_t grid_size, double spatial_range, double spatial_decay);

    size_t size() const override { return n_; }
    double weight(size_t i, size_t j) const override {
        return static_cast<double>(dense_[i * n_ + j]);
    }

    size_t grid_size()     const { return grid_size_; }
    double spatial_range() const { return range_; }
    double spatial_decay() const { return decay_; }

private:
    size_t grid_size_;
    size_t n_;
    double range_;
    double decay_;
    std::vector<float> dense_;   // N×N, row-major
};

/**
 * 显式邻接矩阵: 覆盖空间权重 (注意力场) 或替代全连接 (振子群)
 */
class ExplicitAdjacency : public CouplingWeights {
public:
    explicit ExplicitAdjacency(Matrix adjacency);

    size_t size() const override { return adjacency_.size(); }
    double weight(size_t i, size_t j) const override { return adjacency_.at(i, j); }

    const Matrix& matrix() const { return adjacency_; }

private:
    Matrix adjacency_;
};

} // namespace syncfield
