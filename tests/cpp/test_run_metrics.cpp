/**
 * SyncField 运行指标 + 运行记录测试
 *
 * 测试项:
 *   1. 空序列 / 常数序列 / 长度不等
 *   2. 稳定时间: 指数上升序列, 从不稳定的序列, 稳定时间 ≤ 末时刻
 *   3. 收敛与振荡判定
 *   4. 临界耦合估计与状态/区间分类
 *   5. 运行记录: 参数、网络描述、指标与 JSON 输出
 */

#include "analysis/run_metrics.h"
#include "analysis/run_record.h"
#include "engine/kuramoto_engine.h"
#include "engine/attention_field.h"
#include "network/topology.h"
#include "test_utils.h"
#include <cstdio>
#include <cmath>
#include <cstring>
#include <string>
#include <vector>

using namespace syncfield;

static int g_pass = 0, g_fail = 0;

#define CHECK(cond, msg) do { \
    if (!(cond)) { printf("  [FAIL] %s\n", msg); g_fail++; return; } \
} while(0)

#define PASS(msg) do { printf("  [PASS] %s\n", msg); g_pass++; } while(0)

static std::vector<double> time_axis(size_t n, double dt) {
    std::vector<double> t(n);
    for (size_t i = 0; i < n; ++i) t[i] = static_cast<double>(i) * dt;
    return t;
}

static bool contains(const std::string& s, const char* needle) {
    return s.find(needle) != std::string::npos;
}

// =============================================================================
// 测试1: 基础统计
// =============================================================================
void test_basic_stats() {
    printf("\n--- 测试1: 基础统计 ---\n");

    RunMetrics empty = compute_run_metrics({}, {});
    CHECK(empty.final_r == 0.0 && empty.mean_r == 0.0 && empty.std_r == 0.0, "空序列统计为 0");
    CHECK(empty.min_r == 0.0 && empty.max_r == 0.0, "空序列极值为 0");
    CHECK(!empty.settling_time, "空序列无稳定时间");
    CHECK(!empty.converged && !empty.oscillating, "空序列不收敛不振荡");

    auto t = time_axis(200, 0.05);
    std::vector<double> flat(200, 0.9);
    RunMetrics m = compute_run_metrics(t, flat);
    printf("    常数 0.9: %s\n", m.summary().c_str());
    CHECK(std::fabs(m.final_r - 0.9) < 1e-12 && std::fabs(m.mean_r - 0.9) < 1e-12, "常数序列均值");
    CHECK(m.std_r < 1e-12, "常数序列标准差为 0");
    CHECK(m.min_r == 0.9 && m.max_r == 0.9, "常数序列极值");
    CHECK(m.settling_time && *m.settling_time == 0.0, "常数序列从 t=0 起即稳定");
    CHECK(m.converged, "常数序列收敛");
    CHECK(!m.oscillating, "常数序列不振荡");

    std::vector<double> r = {0.1, 0.4, 0.2, 0.8};
    RunMetrics small = compute_run_metrics(time_axis(4, 1.0), r);
    CHECK(small.final_r == 0.8, "final = 最后一个样本");
    CHECK(std::fabs(small.mean_r - 0.375) < 1e-12, "均值");
    CHECK(std::fabs(small.std_r - std::sqrt(0.071875)) < 1e-12, "总体标准差");
    CHECK(small.min_r == 0.1 && small.max_r == 0.8, "极值");
    CHECK(!small.converged && !small.oscillating, "样本不足 100 不判定收敛/振荡");

    // 长度不等: 按较短者截断
    std::vector<double> longer(20);
    for (size_t i = 0; i < longer.size(); ++i) longer[i] = 0.05 * static_cast<double>(i);
    RunMetrics cut = compute_run_metrics(time_axis(10, 1.0), longer);
    CHECK(std::fabs(cut.final_r - 0.45) < 1e-12, "按较短序列截断");
    CHECK(std::fabs(cut.max_r - 0.45) < 1e-12, "截断后的极值");

    PASS("基础统计");
}

// =============================================================================
// 测试2: 稳定时间
// =============================================================================
void test_settling() {
    printf("\n--- 测试2: 稳定时间 ---\n");

    // r = 1 − e^{−i/20}: 首个进入 ±5% 带且保持 30 个样本的点为 i = 60
    const size_t n = 300;
    auto t = time_axis(n, 0.1);
    std::vector<double> rise(n);
    for (size_t i = 0; i < n; ++i) rise[i] = 1.0 - std::exp(-static_cast<double>(i) / 20.0);
    RunMetrics m = compute_run_metrics(t, rise);
    printf("    指数上升: settling=%.2f\n", m.settling_time ? *m.settling_time : -1.0);
    CHECK(m.settling_time.has_value(), "上升序列应有稳定时间");
    CHECK(std::fabs(*m.settling_time - 6.0) < 1e-9, "稳定时间 = t[60]");
    CHECK(*m.settling_time <= t.back(), "稳定时间不超过末时刻");
    CHECK(m.converged, "上升后平台应判定收敛");

    // 0/1 交替, final = 0: 永远无法连续停留在带内
    std::vector<double> flip(100);
    for (size_t i = 0; i < flip.size(); ++i) flip[i] = (i % 2 == 0) ? 1.0 : 0.0;
    RunMetrics never = compute_run_metrics(time_axis(100, 1.0), flip);
    CHECK(!never.settling_time, "交替序列无稳定时间");
    CHECK(never.oscillating, "交替序列判定为振荡");
    CHECK(!never.converged, "交替序列不收敛");

    // 真实运行的 r(t): 稳定时间 (如有) 不晚于末时刻
    for (double K : {0.5, 2.0, 5.0}) {
        KuramotoConfig cfg;
        cfg.n = 20;
        cfg.K = K;
        KuramotoEngine engine(cfg);
        engine.run(400);
        auto ts = engine.time_series();
        RunMetrics rm = compute_run_metrics(ts, engine.order_parameter_series());
        printf("    K=%.1f: %s\n", K, rm.summary().c_str());
        if (rm.settling_time) {
            CHECK(*rm.settling_time <= ts.back(), "稳定时间不晚于末时刻");
            CHECK(*rm.settling_time >= ts.front(), "稳定时间不早于首时刻");
        }
    }

    PASS("稳定时间");
}

// =============================================================================
// 测试3: 收敛与振荡
// =============================================================================
void test_convergence_oscillation() {
    printf("\n--- 测试3: 收敛与振荡 ---\n");

    const size_t n = 200;
    auto t = time_axis(n, 0.05);

    std::vector<double> wave(n);
    for (size_t i = 0; i < n; ++i) wave[i] = 0.5 + 0.3 * std::sin(0.5 * static_cast<double>(i));
    RunMetrics osc = compute_run_metrics(t, wave);
    printf("    正弦: %s\n", osc.summary().c_str());
    CHECK(osc.oscillating, "正弦序列判定为振荡");
    CHECK(!osc.converged, "大幅正弦不收敛");

    // 小幅慢速漂移: 收敛, 极值稀少
    std::vector<double> drift(n);
    for (size_t i = 0; i < n; ++i) drift[i] = 0.8 + 0.01 * std::sin(0.02 * static_cast<double>(i));
    RunMetrics calm = compute_run_metrics(t, drift);
    CHECK(calm.converged, "小幅漂移判定收敛");
    CHECK(!calm.oscillating, "慢漂移不算振荡");

    // 样本数不足 100: 即使平坦也不判定收敛
    std::vector<double> short_flat(99, 0.7);
    RunMetrics few = compute_run_metrics(time_axis(99, 0.05), short_flat);
    CHECK(!few.converged, "不足 100 个样本不判定收敛");
    CHECK(few.settling_time && *few.settling_time == 0.0, "短序列仍可计算稳定时间");

    PASS("收敛与振荡");
}

// =============================================================================
// 测试4: 分类
// =============================================================================
void test_classification() {
    printf("\n--- 测试4: 临界耦合与分类 ---\n");

    CHECK(estimate_critical_coupling(TopologyType::ALL_TO_ALL) == 0.64, "全连接 K_c");
    CHECK(estimate_critical_coupling(TopologyType::RING) == 2.0, "环格 K_c");
    CHECK(estimate_critical_coupling(TopologyType::SMALL_WORLD) == 1.0, "小世界 K_c");
    CHECK(estimate_critical_coupling(TopologyType::SCALE_FREE) == 0.8, "无标度 K_c");
    CHECK(estimate_critical_coupling(TopologyType::RANDOM) == 1.2, "随机图 K_c");
    CHECK(estimate_critical_coupling(TopologyType::CUSTOM) == 0.64, "自定义回落到全连接 K_c");

    CHECK(std::strcmp(classify_sync_state(0.1), "incoherent") == 0, "r<0.2 无序");
    CHECK(std::strcmp(classify_sync_state(0.2), "weakly synchronized") == 0, "r=0.2 弱同步");
    CHECK(std::strcmp(classify_sync_state(0.5), "partially synchronized") == 0, "r=0.5 部分同步");
    CHECK(std::strcmp(classify_sync_state(0.8), "strongly synchronized") == 0, "r=0.8 强同步");
    CHECK(std::strcmp(classify_sync_state(0.95), "fully synchronized") == 0, "r=0.95 完全同步");

    CHECK(std::strcmp(classify_regime(0.5, TopologyType::ALL_TO_ALL), "subcritical") == 0,
          "K/K_c=0.78 亚临界");
    CHECK(std::strcmp(classify_regime(0.64, TopologyType::ALL_TO_ALL), "critical") == 0,
          "K/K_c=1 临界");
    CHECK(std::strcmp(classify_regime(2.0, TopologyType::ALL_TO_ALL), "supercritical") == 0,
          "K/K_c=3.1 超临界");
    CHECK(std::strcmp(classify_regime(2.0, TopologyType::RING), "critical") == 0,
          "同一 K 在环格上为临界");

    PASS("临界耦合与分类");
}

// =============================================================================
// 测试5: 运行记录
// =============================================================================
void test_run_record() {
    printf("\n--- 测试5: 运行记录 ---\n");

    KuramotoConfig cfg;
    cfg.n = 30;
    cfg.K = 1.5;
    KuramotoEngine engine(cfg);
    MersenneSource rng(4);
    engine.set_network(create_small_world(30, 4, 0.2, rng));
    engine.run(150);

    RunRecord rec = make_run_record(engine, "sw \"test\"", "line1\nline2");
    std::string json = rec.to_json();
    printf("%s\n", json.c_str());

    CHECK(rec.mode == "kuramoto", "mode");
    CHECK(rec.id.rfind("run_", 0) == 0, "id 以 run_ 开头");
    CHECK(rec.id.size() > 14 && rec.id[rec.id.size() - 10] == '_', "id 以 9 位随机串结尾");
    CHECK(rec.timestamp.size() == 24 && rec.timestamp.back() == 'Z', "ISO-8601 UTC 时间戳");
    CHECK(rec.timestamp[10] == 'T', "时间戳日期/时间分隔");
    CHECK(!rec.parameters.empty() && rec.parameters[0].first == "N", "参数按顺序, 首项为 N");
    CHECK(rec.parameters[0].second == 30.0 && rec.parameters[1].second == 1.5, "参数值");
    CHECK(rec.network.type == "small-world" && rec.network.has_params, "网络描述");
    CHECK(rec.network.params.k == 4, "网络参数");
    CHECK(std::fabs(rec.network.avg_degree - 4.0) < 1e-12, "小世界平均度保持 k");

    RunMetrics direct = compute_run_metrics(engine.time_series(), engine.order_parameter_series());
    CHECK(rec.metrics.final_r == direct.final_r && rec.metrics.mean_r == direct.mean_r,
          "记录中的指标来自 r(t) 历史");

    CHECK(contains(json, "\"parameters\""), "JSON 包含 parameters");
    CHECK(contains(json, "\"network\""), "JSON 包含 network");
    CHECK(contains(json, "\"metrics\""), "JSON 包含 metrics");
    CHECK(contains(json, "\"type\": \"small-world\""), "JSON 网络类型");
    CHECK(contains(json, "\"params\""), "生成器拓扑输出 params");
    CHECK(contains(json, "\"settling_time\""), "JSON 包含 settling_time");
    CHECK(contains(json, "sw \\\"test\\\""), "名称中的引号被转义");
    CHECK(contains(json, "line1\\nline2"), "备注中的换行被转义");

    // 隐式全连接: 度 = N − 1, 默认名称
    KuramotoEngine plain(cfg);
    plain.run(10);
    RunRecord rec2 = make_run_record(plain);
    CHECK(rec2.network.type == "all-to-all" && !rec2.network.has_params, "隐式全连接描述");
    CHECK(rec2.network.min_degree == 29 && rec2.network.max_degree == 29, "全连接度 N-1");
    CHECK(!rec2.name.empty(), "默认名称非空");
    CHECK(!contains(rec2.to_json(), "\"params\""), "无生成器参数时不输出 params");

    // 注意力场记录
    AttentionFieldConfig acfg;
    acfg.grid_size = 10;
    AttentionFieldEngine field(acfg);
    field.add_stimulus_object();
    field.run(20);
    RunRecord rec3 = make_run_record(field, "attention demo");
    CHECK(rec3.mode == "attention", "注意力场 mode");
    CHECK(rec3.network.type == "spatial", "空间权重描述");
    CHECK(rec3.network.max_degree == 48, "range=4 时内部格点 48 个邻居");
    CHECK(rec3.network.min_degree > 0 && rec3.network.min_degree < 48, "角落格点邻居更少");
    CHECK(rec3.parameters[0].first == "grid_size" && rec3.parameters[0].second == 10.0,
          "注意力场参数");
    CHECK(std::fabs(rec3.metrics.final_r - field.mean_attention_series().back()) < 1e-15,
          "注意力场指标来自平均注意力序列");
    CHECK(contains(rec3.to_json(), "\"mode\": \"attention\""), "JSON mode");

    CHECK(rec.id != rec2.id || rec.timestamp != rec2.timestamp, "两次记录的 id 不同");

    PASS("运行记录");
}

// =============================================================================
// Main
// =============================================================================
int main() {
    init_test_console();
    printf("============================================\n");
    printf("  SyncField 运行指标 + 运行记录测试\n");
    printf("============================================\n");

    test_basic_stats();
    test_settling();
    test_convergence_oscillation();
    test_classification();
    test_run_record();

    printf("\n============================================\n");
    printf("  结果: %d 通过, %d 失败, 共 %d 测试\n",
           g_pass, g_fail, g_pass + g_fail);
    printf("============================================\n");

    return g_fail > 0 ? 1 : 0;
}
