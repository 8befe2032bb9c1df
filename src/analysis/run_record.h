#pragma once
/**
 * RunRecord — 一次运行的可持久化记录 (只负责构造与 JSON 序列化, 不负责存储)
 *
 *   id          "run_<毫秒时间戳>_<9 位 base36 随机串>"
 *   timestamp   ISO-8601 UTC, 例如 "2026-10-18T09:30:00.123Z"
 *   mode        "kuramoto" | "attention"
 *   parameters  有序 名称→数值 列表
 *   network     拓扑描述 + 度统计
 *   metrics     compute_run_metrics() 的结果
 */

#include "analysis/run_metrics.h"
#include "network/topology.h"
#include <string>
#include <utility>
#include <vector>

namespace syncfield {

class KuramotoEngine;
class AttentionFieldEngine;

struct NetworkDescriptor {
    std::string    type = "all-to-all";   // topology_name() 或 "spatial"
    TopologyParams params;
    bool           has_params = false;    // 生成器拓扑才输出 params
    double         avg_degree = 0.0;
    size_t         max_degree = 0;
    size_t         min_degree = 0;
};

struct RunRecord {
    std::string id;
    std::string timestamp;
    std::string name;
    std::string mode;
    std::vector<std::pair<std::string, double>> parameters;
    NetworkDescriptor network;
    RunMetrics  metrics;
    std::string notes;

    std::string to_json() const;
};

/** "run_<ms>_<rand>" */
std::string generate_run_id();

/** 当前 UTC 时间的 ISO-8601 字符串 (毫秒精度) */
std::string iso_timestamp_now();

/** 由振子群当前参数、网络与 r(t) 历史生成记录 */
RunRecord make_run_record(const KuramotoEngine& engine,
                          const std::string& name = "",
                          const std::string& notes = "");

/** 由注意力场当前参数与平均注意力历史生成记录 */
RunRecord make_run_record(const AttentionFieldEngine& engine,
                          const std::string& name = "",
                          const std::string& notes = "");

} // namespace syncfield
