#pragma once
/**
 * 经典四阶 Runge-Kutta 步进 — 两个引擎共用
 *
 *   k1 = f(θ)
 *   k2 = f(θ + dt/2·k1)
 *   k3 = f(θ + dt/2·k2)
 *   k4 = f(θ + dt·k3)
 *   θ' = wrap(θ + dt/6·(k1 + 2k2 + 2k3 + k4))
 *
 * 每个阶段在独立的 stage 缓冲上求导, θ 本身直到最后一步才被改写,
 * 因此任何一次导数调用看到的都是完整一致的相位向量。
 * 缓冲区在 Rk4Scratch 中复用, 步内不分配内存。
 */

#include "core/types.h"
#include <cstddef>

namespace syncfield {

struct Rk4Scratch {
    PhaseVector k1, k2, k3, k4;
    PhaseVector stage;

    void resize(size_t n) {
        k1.assign(n, 0.0);
        k2.assign(n, 0.0);
        k3.assign(n, 0.0);
        k4.assign(n, 0.0);
        stage.assign(n, 0.0);
    }
};

/**
 * @param theta  相位向量, 原地更新并折回 (−π, π]
 * @param deriv  void(const PhaseVector& in, PhaseVector& out)
 */
template <typename Derivative>
void rk4_step(PhaseVector& theta, double dt, Derivative&& deriv, Rk4Scratch& s) {
    const size_t n = theta.size();
    if (s.stage.size() != n) s.resize(n);

    deriv(theta, s.k1);

    for (size_t i = 0; i < n; ++i) s.stage[i] = theta[i] + 0.5 * dt * s.k1[i];
    deriv(s.stage, s.k2);

    for (size_t i = 0; i < n; ++i) s.stage[i] = theta[i] + 0.5 * dt * s.k2[i];
    deriv(s.stage, s.k3);

    for (size_t i = 0; i < n; ++i) s.stage[i] = theta[i] + dt * s.k3[i];
    deriv(s.stage, s.k4);

    for (size_t i = 0; i < n; ++i) {
        theta[i] = wrap_phase(theta[i] + (dt / 6.0) *
                              (s.k1[i] + 2.0 * s.k2[i] + 2.0 * s.k3[i] + s.k4[i]));
    }
}

} // namespace syncfield
