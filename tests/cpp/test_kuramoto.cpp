/**
 * SyncField 振子群 (KuramotoEngine) 测试
 *
 * 测试项:
 *   1. 相位折回 wrap_phase / 每步后 θ ∈ (−π, π]
 *   2. 序参量边界: 0 ≤ r ≤ 1, 相同相位 r = 1
 *   3. RK4 对无耦合解析解 θ(t) = θ(0) + ω·t 的精度
 *   4. 超临界: N=20, K=5 → r > 0.95
 *   5. 亚临界: N=50, K=0.1 → r < 0.3
 *   6. 参数校验 (先校验后修改)
 *   7. 网络替换: 显式全连接 ≡ 隐式全连接, 孤立节点 ≡ 无耦合
 *   8. N 改变的重建语义
 *   9. 快照独立性 + 历史 FIFO 淘汰
 *  10. 耦合项: 相位滞后 α + 加权邻接, 与手算 RK4 逐项比对
 *  11. 噪声项幅度: η = noise_level · N(0, 0.1)
 */

#include "core/types.h"
#include "core/errors.h"
#include "engine/kuramoto_engine.h"
#include "network/topology.h"
#include "test_utils.h"
#include <algorithm>
#include <cstdio>
#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using namespace syncfield;

static int g_pass = 0, g_fail = 0;

#define CHECK(cond, msg) do { \
    if (!(cond)) { printf("  [FAIL] %s\n", msg); g_fail++; return; } \
} while(0)

#define PASS(msg) do { printf("  [PASS] %s\n", msg); g_pass++; } while(0)

static bool in_range(const PhaseVector& theta) {
    for (double t : theta) {
        if (!(t > -PI && t <= PI)) return false;
    }
    return true;
}

// =============================================================================
// 测试1: 相位折回
// =============================================================================
void test_phase_wrap() {
    printf("\n--- 测试1: 相位折回 (−π, π] ---\n");

    CHECK(wrap_phase(0.0) == 0.0, "0 不变");
    CHECK(wrap_phase(PI) == PI, "π 保持为 π");
    CHECK(std::fabs(wrap_phase(-PI) - PI) < 1e-12, "−π 折回为 π");
    CHECK(std::fabs(wrap_phase(3.0 * PI) - PI) < 1e-9, "3π → π");
    CHECK(std::fabs(wrap_phase(TWO_PI + 0.5) - 0.5) < 1e-12, "2π+0.5 → 0.5");
    CHECK(std::fabs(wrap_phase(-TWO_PI - 0.5) + 0.5) < 1e-12, "−2π−0.5 → −0.5");

    double big = wrap_phase(1.0e6);
    CHECK(big > -PI && big <= PI, "大偏移也能折回");
    CHECK(std::isnan(wrap_phase(std::numeric_limits<double>::quiet_NaN())), "NaN 原样返回");

    CHECK(std::fabs(phase_difference(PI - 0.1, -PI + 0.1) + 0.2) < 1e-12, "最短有向差跨越 ±π");

    // 噪声 + 相位滞后下的每步不变量
    KuramotoConfig cfg;
    cfg.n = 30;
    cfg.K = 3.0;
    cfg.noise_level = 2.0;
    cfg.phase_lag = 0.3;
    cfg.seed = 11;
    KuramotoEngine engine(cfg);
    CHECK(in_range(engine.theta()), "初始相位在 (−π, π]");
    for (int s = 0; s < 500; ++s) {
        engine.step();
        CHECK(in_range(engine.theta()), "每步后相位在 (−π, π]");
    }

    PASS("相位折回");
}

// =============================================================================
// 测试2: 序参量
// =============================================================================
void test_order_parameter() {
    printf("\n--- 测试2: 序参量边界 ---\n");

    CHECK(order_parameter(PhaseVector{}) == 0.0, "空向量 r = 0");
    CHECK(std::fabs(order_parameter(PhaseVector(10, 1.3)) - 1.0) < 1e-12, "相同相位 r = 1");
    CHECK(order_parameter(PhaseVector{0.0, PI}) < 1e-12, "反相 r = 0");

    // 恒定随机源: 所有振子相位和频率完全一致, 永远同步
    KuramotoConfig cfg;
    cfg.n = 16;
    KuramotoEngine same(cfg, std::make_unique<ConstantSource>(0.5));
    CHECK(std::fabs(same.order_parameter() - 1.0) < 1e-12, "恒定源初始 r = 1");
    same.run(100);
    CHECK(std::fabs(same.order_parameter() - 1.0) < 1e-12, "同相同频保持 r = 1");

    KuramotoEngine engine(KuramotoConfig{});
    for (int s = 0; s < 200; ++s) {
        engine.step();
        double r = engine.order_parameter();
        CHECK(r >= 0.0 && r <= 1.0 + 1e-12, "r ∈ [0, 1]");
    }
    printf("    N=50 K=2 t=%.1f: r=%.4f\n", engine.time(), engine.order_parameter());

    PASS("序参量边界");
}

// =============================================================================
// 测试3: RK4 无耦合解析解
// =============================================================================
void test_rk4_uncoupled() {
    printf("\n--- 测试3: RK4 无耦合解析解 ---\n");

    KuramotoConfig cfg;
    cfg.n = 25;
    cfg.K = 0.0;
    cfg.dt = 0.01;
    cfg.seed = 3;
    KuramotoEngine engine(cfg);

    const PhaseVector theta0 = engine.theta();
    const PhaseVector omega = engine.omega();
    engine.run(100);

    double max_err = 0.0;
    for (size_t i = 0; i < theta0.size(); ++i) {
        double expected = wrap_phase(theta0[i] + omega[i] * engine.time());
        double err = std::fabs(phase_difference(engine.theta()[i], expected));
        if (err > max_err) max_err = err;
    }
    printf("    t=%.2f max |Δθ| = %.3e\n", engine.time(), max_err);
    CHECK(std::fabs(engine.time() - 1.0) < 1e-9, "100 步 × 0.01 = 1.0");
    CHECK(max_err < 1e-9, "无耦合轨迹应与 θ0 + ω·t 一致");

    PASS("RK4 无耦合解析解");
}

// =============================================================================
// 测试4/5: 同步相变两侧
// =============================================================================
void test_full_sync() {
    printf("\n--- 测试4: 超临界同步 (N=20, K=5) ---\n");

    KuramotoConfig cfg;
    cfg.n = 20;
    cfg.K = 5.0;
    cfg.dt = 0.05;
    KuramotoEngine engine(cfg);
    engine.run(2000);

    double r = engine.order_parameter();
    printf("    t=%.1f r=%.4f\n", engine.time(), r);
    CHECK(r > 0.95, "K=5 时应接近完全同步");

    PASS("超临界同步");
}

void test_subcritical() {
    printf("\n--- 测试5: 亚临界 (N=50, K=0.1) ---\n");

    KuramotoConfig cfg;
    cfg.n = 50;
    cfg.K = 0.1;
    cfg.dt = 0.05;
    KuramotoEngine engine(cfg);
    engine.run(2000);

    auto series = engine.order_parameter_series();
    double mean = 0.0;
    for (size_t i = series.size() / 2; i < series.size(); ++i) mean += series[i];
    mean /= static_cast<double>(series.size() - series.size() / 2);

    printf("    final r=%.4f  mean r (后半段)=%.4f\n", engine.order_parameter(), mean);
    CHECK(engine.order_parameter() < 0.3, "K=0.1 时应保持无序");
    CHECK(mean < 0.3, "后半段平均 r 应保持低位");

    PASS("亚临界");
}

// =============================================================================
// 测试6: 参数校验
// =============================================================================
void test_validation() {
    printf("\n--- 测试6: 参数校验 ---\n");

    auto rejects = [](const KuramotoConfig& cfg) {
        try {
            KuramotoEngine e(cfg);
            return false;
        } catch (const ConfigurationError&) {
            return true;
        }
    };

    KuramotoConfig bad;
    bad.n = 0;
    CHECK(rejects(bad), "N=0 应抛 ConfigurationError");
    bad.n = -5;
    CHECK(rejects(bad), "N<0 应抛 ConfigurationError");
    bad = KuramotoConfig{};
    bad.dt = 0.0;
    CHECK(rejects(bad), "dt=0 应抛 ConfigurationError");
    bad.dt = -0.1;
    CHECK(rejects(bad), "dt<0 应抛 ConfigurationError");
    bad.dt = std::numeric_limits<double>::quiet_NaN();
    CHECK(rejects(bad), "dt=NaN 应抛 ConfigurationError");

    // update_parameters: 任一字段非法则整体不生效
    KuramotoEngine engine(KuramotoConfig{});
    engine.run(10);
    const PhaseVector before = engine.theta();

    KuramotoUpdate upd;
    upd.K = 9.0;
    upd.n = 0;
    bool thrown = false;
    try {
        engine.update_parameters(upd);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    CHECK(thrown, "update_parameters(N=0) 应抛异常");
    CHECK(engine.K() == 2.0, "失败的更新不应修改 K");
    CHECK(engine.size() == 50, "失败的更新不应修改 N");
    CHECK(engine.theta() == before, "失败的更新不应修改相位");
    CHECK(engine.history().size() == 10, "失败的更新不应清空历史");

    KuramotoUpdate bad_dt;
    bad_dt.dt = -1.0;
    thrown = false;
    try {
        engine.update_parameters(bad_dt);
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    CHECK(thrown && engine.dt() == 0.05, "dt<0 的更新应被拒绝");

    // 基类也能捕获
    thrown = false;
    try {
        KuramotoConfig c;
        c.n = -1;
        KuramotoEngine e(c);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    CHECK(thrown, "ConfigurationError 派生自 std::invalid_argument");

    PASS("参数校验");
}

// =============================================================================
// 测试7: 网络替换
// =============================================================================
void test_network() {
    printf("\n--- 测试7: 网络替换 ---\n");

    KuramotoConfig cfg;
    cfg.n = 24;
    cfg.K = 1.5;
    cfg.seed = 7;

    // 显式全连接矩阵与隐式全连接逐位一致
    KuramotoEngine implicit(cfg);
    KuramotoEngine explicit_net(cfg);
    explicit_net.set_network(create_all_to_all(24));
    CHECK(explicit_net.has_network(), "has_network");
    CHECK(explicit_net.topology_type() == TopologyType::ALL_TO_ALL, "记录拓扑类型");
    implicit.run(200);
    explicit_net.run(200);
    double max_diff = 0.0;
    for (size_t i = 0; i < 24; ++i) {
        max_diff = std::max(max_diff, std::fabs(implicit.theta()[i] - explicit_net.theta()[i]));
    }
    printf("    显式/隐式全连接 max |Δθ| = %.3e\n", max_diff);
    CHECK(max_diff < 1e-12, "显式全连接应与隐式全连接一致");

    // 孤立节点: 等价于无耦合
    KuramotoEngine isolated(cfg);
    isolated.set_network(Matrix(24));
    const PhaseVector theta0 = isolated.theta();
    isolated.run(50);
    double err = 0.0;
    for (size_t i = 0; i < 24; ++i) {
        double expected = wrap_phase(theta0[i] + isolated.omega()[i] * isolated.time());
        err = std::max(err, std::fabs(phase_difference(isolated.theta()[i], expected)));
    }
    CHECK(err < 1e-9, "零邻接矩阵应退化为无耦合");
    CHECK(isolated.topology_type() == TopologyType::CUSTOM, "矩阵直接设置为 CUSTOM");

    // 维度不符
    bool thrown = false;
    try {
        isolated.set_network(create_ring(10, 2));
    } catch (const TopologyMismatchError&) {
        thrown = true;
    }
    CHECK(thrown, "维度不符应抛 TopologyMismatchError");
    CHECK(isolated.topology_type() == TopologyType::CUSTOM, "失败的替换不改变网络");

    // set_network 不改变相位
    const PhaseVector before = isolated.theta();
    MersenneSource rng(1);
    isolated.set_network(create_small_world(24, 4, 0.2, rng));
    CHECK(isolated.theta() == before, "set_network 不应修改相位");
    CHECK(isolated.adjacency().size() == 24, "adjacency() 返回当前矩阵");

    isolated.clear_network();
    CHECK(!isolated.has_network(), "clear_network 回到全连接");
    CHECK(isolated.adjacency().empty(), "全连接模式 adjacency() 为空");
    CHECK(isolated.topology_type() == TopologyType::ALL_TO_ALL, "clear 后类型为全连接");

    PASS("网络替换");
}

// =============================================================================
// 测试8: N 改变
// =============================================================================
void test_resize() {
    printf("\n--- 测试8: 参数更新与 N 改变 ---\n");

    KuramotoConfig cfg;
    cfg.n = 12;
    KuramotoEngine engine(cfg);
    engine.set_network(create_ring(12, 2));
    engine.run(20);

    // 标量参数原地生效, 不动相位
    const PhaseVector before = engine.theta();
    KuramotoUpdate scalar;
    scalar.K = 4.0;
    scalar.noise_level = 0.2;
    scalar.phase_lag = 0.1;
    scalar.n = 12;  // 同值不触发重建
    engine.update_parameters(scalar);
    CHECK(engine.K() == 4.0 && engine.noise_level() == 0.2 && engine.phase_lag() == 0.1,
          "标量参数应生效");
    CHECK(engine.theta() == before, "标量更新不应修改相位");
    CHECK(engine.has_network(), "同 N 更新保留网络");
    CHECK(engine.history().size() == 20, "同 N 更新保留历史");

    KuramotoUpdate resize;
    resize.n = 30;
    engine.update_parameters(resize);
    CHECK(engine.size() == 30, "N 应更新为 30");
    CHECK(engine.theta().size() == 30 && engine.omega().size() == 30, "相位/频率重新分配");
    CHECK(engine.time() == 0.0, "时间归零");
    CHECK(engine.history().empty(), "历史清空");
    CHECK(!engine.has_network(), "旧网络被丢弃");
    CHECK(in_range(engine.theta()), "新相位在 (−π, π]");

    engine.run(5);
    CHECK(engine.history().size() == 5, "重建后可继续步进");

    PASS("参数更新与 N 改变");
}

// =============================================================================
// 测试9: 快照 + 历史
// =============================================================================
void test_snapshot_history() {
    printf("\n--- 测试9: 快照独立性 + 历史淘汰 ---\n");

    KuramotoConfig cfg;
    cfg.n = 10;
    cfg.history_cap = 50;
    KuramotoEngine engine(cfg);
    engine.run(5);

    KuramotoState snap = engine.state();
    const PhaseVector copy = snap.theta;
    const double t_snap = snap.time;
    engine.run(5);
    CHECK(snap.theta == copy && snap.time == t_snap, "快照不随后续步进改变");
    CHECK(snap.n == 10 && snap.K == 2.0, "快照记录 N 与 K");
    CHECK(std::fabs(snap.order_parameter - order_parameter(copy)) < 1e-15, "快照 r 与相位一致");

    engine.run(110);  // 共 120 步
    const auto& hist = engine.history();
    printf("    120 步 cap=50: size=%zu evicted=%zu front.t=%.2f\n",
           hist.size(), hist.evicted(), hist.front().time);
    CHECK(hist.size() == 50, "历史长度不超过上限");
    CHECK(hist.evicted() == 70, "淘汰 70 帧");
    CHECK(std::fabs(hist.front().time - 71 * 0.05) < 1e-9, "FIFO: 保留最新 50 帧");
    CHECK(std::fabs(hist.back().time - engine.time()) < 1e-12, "最后一帧为当前时刻");
    CHECK(hist.back().phases == engine.theta(), "帧内相位为副本");

    auto ts = engine.time_series();
    auto rs = engine.order_parameter_series();
    CHECK(ts.size() == 50 && rs.size() == 50, "时间序列与历史等长");
    CHECK(rs.back() == engine.order_parameter(), "r 序列末项为当前 r");
    for (size_t i = 1; i < ts.size(); ++i) {
        CHECK(ts[i] > ts[i - 1], "时间序列严格递增");
    }

    engine.initialize();
    CHECK(engine.history().empty() && engine.time() == 0.0, "initialize 清空历史和时间");

    std::string s = engine.summary();
    printf("    %s\n", s.c_str());
    CHECK(s.find("N=10") != std::string::npos, "摘要包含 N");

    PASS("快照独立性 + 历史淘汰");
}

// =============================================================================
// 测试10: 耦合项与手算 RK4 比对
// =============================================================================

/** 手算一步经典 RK4 (不折回) */
template <typename Deriv>
static PhaseVector rk4_by_hand(const PhaseVector& y, double dt, Deriv f) {
    const size_t n = y.size();
    PhaseVector k1 = f(y), s(n);
    for (size_t i = 0; i < n; ++i) s[i] = y[i] + 0.5 * dt * k1[i];
    PhaseVector k2 = f(s);
    for (size_t i = 0; i < n; ++i) s[i] = y[i] + 0.5 * dt * k2[i];
    PhaseVector k3 = f(s);
    for (size_t i = 0; i < n; ++i) s[i] = y[i] + dt * k3[i];
    PhaseVector k4 = f(s);
    PhaseVector out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = y[i] + dt / 6.0 * (k1[i] + 2.0 * k2[i] + 2.0 * k3[i] + k4[i]);
    }
    return out;
}

/** dθ_i/dt = ω_i + (K/N)·Σ_j S_ij·sin(θ_j − θ_i − α) */
static PhaseVector kuramoto_rhs(const PhaseVector& th, const PhaseVector& omega,
                                double K, double alpha, const Matrix& S) {
    const size_t n = th.size();
    PhaseVector d(n);
    for (size_t i = 0; i < n; ++i) {
        double sum = 0.0;
        for (size_t j = 0; j < n; ++j) {
            if (j != i) sum += S.at(i, j) * std::sin(th[j] - th[i] - alpha);
        }
        d[i] = omega[i] + K / static_cast<double>(n) * sum;
    }
    return d;
}

static double max_phase_gap(const PhaseVector& a, const PhaseVector& b) {
    double m = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        m = std::max(m, std::fabs(phase_difference(a[i], b[i])));
    }
    return m;
}

void test_coupling_terms() {
    printf("\n--- 测试10: 耦合项 (相位滞后 + 加权邻接) ---\n");

    // 振子0: θ = π − 0.5·2π = 0; 振子1: θ = π − 0.25·2π = π/2
    KuramotoConfig cfg;
    cfg.n = 2;
    cfg.K = 2.0;
    cfg.dt = 0.05;
    cfg.phase_lag = 0.4;
    KuramotoEngine engine(cfg, std::make_unique<SequenceSource>(
        std::vector<double>{0.5, std::exp(-0.5), 0.0, 0.25, 0.3, 0.6}));
    CHECK(std::fabs(engine.theta()[0]) < 1e-12, "振子0 初相为 0");
    CHECK(std::fabs(engine.theta()[1] - PI / 2.0) < 1e-12, "振子1 初相为 π/2");

    // 非对称加权: S_01 = 0.7, S_10 = 1.3
    const Matrix S = Matrix::from_rows({{0.0, 0.7}, {1.3, 0.0}});
    engine.set_network(S);

    const PhaseVector theta0 = engine.theta();
    const PhaseVector omega = engine.omega();
    engine.step();

    PhaseVector expected = rk4_by_hand(theta0, cfg.dt, [&](const PhaseVector& th) {
        return kuramoto_rhs(th, omega, cfg.K, cfg.phase_lag, S);
    });
    double err = max_phase_gap(engine.theta(), expected);
    printf("    N=2 K=2 α=0.4 加权: θ=(%.6f, %.6f) err=%.2e\n",
           engine.theta()[0], engine.theta()[1], err);
    CHECK(err < 1e-12, "加权邻接 + 相位滞后应与手算 RK4 一致");

    // 比对本身对 α 与权重敏感
    PhaseVector no_lag = rk4_by_hand(theta0, cfg.dt, [&](const PhaseVector& th) {
        return kuramoto_rhs(th, omega, cfg.K, 0.0, S);
    });
    const Matrix ones = Matrix::from_rows({{0.0, 1.0}, {1.0, 0.0}});
    PhaseVector unweighted = rk4_by_hand(theta0, cfg.dt, [&](const PhaseVector& th) {
        return kuramoto_rhs(th, omega, cfg.K, cfg.phase_lag, ones);
    });
    CHECK(max_phase_gap(expected, no_lag) > 1e-3, "α 对单步结果有可见影响");
    CHECK(max_phase_gap(expected, unweighted) > 1e-3, "权重对单步结果有可见影响");

    // 隐式全连接 (稠密路径) + 相位滞后
    KuramotoConfig dense_cfg;
    dense_cfg.n = 5;
    dense_cfg.K = 1.5;
    dense_cfg.phase_lag = 0.7;
    dense_cfg.seed = 5;
    KuramotoEngine dense(dense_cfg);
    const PhaseVector d_theta0 = dense.theta();
    const PhaseVector d_omega = dense.omega();
    dense.run(1);

    Matrix all(5, 1.0);
    for (size_t i = 0; i < 5; ++i) all.at(i, i) = 0.0;
    PhaseVector d_expected = rk4_by_hand(d_theta0, dense_cfg.dt, [&](const PhaseVector& th) {
        return kuramoto_rhs(th, d_omega, dense_cfg.K, dense_cfg.phase_lag, all);
    });
    CHECK(max_phase_gap(dense.theta(), d_expected) < 1e-12,
          "全连接 + 相位滞后应与手算 RK4 一致");

    PASS("耦合项");
}

// =============================================================================
// 测试11: 噪声项幅度
// =============================================================================
void test_noise_scale() {
    printf("\n--- 测试11: 噪声项幅度 ---\n");

    // K = 0 时单步增量 = ω·dt + dt·(η1 + 2η2 + 2η3 + η4)/6,
    // η ~ noise_level·N(0, 0.1) 每阶段独立 → 残差标准差 = dt·noise·0.1·sqrt(10)/6
    KuramotoConfig cfg;
    cfg.n = 2000;
    cfg.K = 0.0;
    cfg.dt = 0.05;
    cfg.noise_level = 2.0;
    cfg.seed = 9;
    KuramotoEngine engine(cfg);

    const PhaseVector theta0 = engine.theta();
    const PhaseVector omega = engine.omega();
    engine.step();

    std::vector<double> residual(theta0.size());
    double mean = 0.0;
    for (size_t i = 0; i < theta0.size(); ++i) {
        residual[i] = phase_difference(engine.theta()[i], theta0[i]) - omega[i] * cfg.dt;
        mean += residual[i];
    }
    mean /= static_cast<double>(residual.size());
    double var = 0.0;
    for (double r : residual) var += (r - mean) * (r - mean);
    double stddev = std::sqrt(var / static_cast<double>(residual.size()));

    const double expected = cfg.dt * cfg.noise_level * 0.1 * std::sqrt(10.0) / 6.0;
    printf("    残差 mean=%.2e std=%.5f (理论 %.5f)\n", mean, stddev, expected);
    CHECK(std::fabs(stddev / expected - 1.0) < 0.1, "残差标准差 = dt·noise·0.1·sqrt(10)/6");
    CHECK(std::fabs(mean) < 4.0 * expected / std::sqrt(2000.0), "噪声均值为 0");

    // 无噪声时残差为 0
    cfg.noise_level = 0.0;
    KuramotoEngine quiet(cfg);
    const PhaseVector q_theta0 = quiet.theta();
    const PhaseVector q_omega = quiet.omega();
    quiet.step();
    double max_res = 0.0;
    for (size_t i = 0; i < q_theta0.size(); ++i) {
        double r = phase_difference(quiet.theta()[i], q_theta0[i]) - q_omega[i] * cfg.dt;
        max_res = std::max(max_res, std::fabs(r));
    }
    CHECK(max_res < 1e-12, "noise_level = 0 时无噪声残差");

    PASS("噪声项幅度");
}

// =============================================================================
// Main
// =============================================================================
int main() {
    init_test_console();
    printf("============================================\n");
    printf("  SyncField 振子群 (Kuramoto) 测试\n");
    printf("============================================\n");

    test_phase_wrap();
    test_order_parameter();
    test_rk4_uncoupled();
    test_full_sync();
    test_subcritical();
    test_validation();
    test_network();
    test_resize();
    test_snapshot_history();
    test_coupling_terms();
    test_noise_scale();

    printf("\n============================================\n");
    printf("  结果: %d 通过, %d 失败, 共 %d 测试\n",
           g_pass, g_fail, g_pass + g_fail);
    printf("============================================\n");

    return g_fail > 0 ? 1 : 0;
}
