#pragma once
/**
 * 错误分类 — API 边界的显式异常
 *
 *   ConfigurationError    : N / gridSize ≤ 0, dt ≤ 0, numFeatures ≤ 0
 *   TopologyMismatchError : 邻接矩阵维度与当前 N / gridSize 不符, 或非方阵
 *
 * 其余参数域错误 (概率越界、负半径等) 静默退化, 不抛异常。
 * 所有校验都在修改状态之前完成, 抛出后引擎状态保持不变。
 */

#include <stdexcept>
#include <string>

namespace syncfield {

class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& what)
        : std::invalid_argument(what) {}
};

class TopologyMismatchError : public std::invalid_argument {
public:
    explicit TopologyMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

} // namespace syncfield
