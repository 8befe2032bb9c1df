#pragma once
/**
 * 网络拓扑生成器 — 振子耦合结构
 *
 * 给定节点数 N 与拓扑参数, 生成对称 0/1 邻接矩阵 (无自环) + 冗余边表:
 *
 *   ALL_TO_ALL  : 全连接, N(N−1)/2 条边
 *   RANDOM      : Erdős-Rényi, 每对节点以概率 p 独立连边
 *   SMALL_WORLD : Watts-Strogatz, 环格 (偏移 1..k/2) + 以 β 概率重连
 *   SCALE_FREE  : Barabási-Albert, 完全图种子 + 度优先连接 (每新节点 m 条边)
 *   RING        : 每个节点连接顺时针 k 个邻居 (度 2k)
 *
 * 除随机源外是纯函数; 参数越界 (p ∉ [0,1] 等) 不校验, 产生退化图。
 */

#include "core/types.h"
#include "core/random_source.h"
#include <vector>
#include <string>
#include <cstdint>

namespace syncfield {

enum class TopologyType : uint8_t {
    ALL_TO_ALL  = 0,
    RANDOM      = 1,
    SMALL_WORLD = 2,
    SCALE_FREE  = 3,
    RING        = 4,
    CUSTOM      = 5,   // 外部提供的邻接矩阵
};

/** 拓扑参数包 (只有对应拓扑会读取相关字段) */
struct TopologyParams {
    double p    = 0.1;   // RANDOM: 连边概率
    int    k    = 4;     // SMALL_WORLD: 环格邻居数 (两侧合计); RING: 单侧邻居数
    double beta = 0.1;   // SMALL_WORLD: 重连概率
    int    m    = 2;     // SCALE_FREE: 每个新节点的连边数
};

struct Edge {
    uint32_t source;
    uint32_t target;   // source < target
};

struct Network {
    Matrix            adjacency;
    std::vector<Edge> edges;
    TopologyType      type = TopologyType::CUSTOM;
    TopologyParams    params;

    size_t n_nodes() const { return adjacency.size(); }
    size_t n_edges() const { return edges.size(); }
};

/** 度统计 (逐行统计非零非对角元素) */
struct NetworkStats {
    double avg_degree = 0.0;
    size_t max_degree = 0;
    size_t min_degree = 0;
    std::vector<size_t> degrees;
};

// --- 生成器 ---

Network create_all_to_all(size_t n);
Network create_random(size_t n, double p, RandomSource& rng);
Network create_small_world(size_t n, int k, double beta, RandomSource& rng);
Network create_scale_free(size_t n, int m, RandomSource& rng);
Network create_ring(size_t n, int k = 2);

/** 按类型分派; CUSTOM 返回 N 个孤立节点 */
Network create_network(TopologyType type, size_t n,
                       const TopologyParams& params, RandomSource& rng);

// --- 辅助 ---

/** 从邻接矩阵提取 i<j 的边表 */
std::vector<Edge> extract_edges(const Matrix& adjacency);

NetworkStats network_stats(const Matrix& adjacency);

/** "all-to-all" / "random" / "small-world" / "scale-free" / "ring" / "custom" */
const char* topology_name(TopologyType type);

/** topology_name 的逆; 未知名称返回 false 且不修改 out */
bool parse_topology(const std::string& name, TopologyType& out);

/** 单行摘要, 例如 "small-world N=50 E=100 deg=4.00 [3,6]" */
std::string network_summary(const Network& net);

} // namespace syncfield
