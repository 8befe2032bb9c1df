#pragma once
/**
 * HistoryBuffer — 逐步记录的历史帧缓冲区
 *
 * 两种淘汰策略 (均为 FIFO, 无优先级保留):
 *   CAPPED_GROWTH : 逐步增长, 超过 capacity 才丢弃最旧帧
 *                   (振子群默认 10000; capacity = 0 表示不设上限)
 *   FIXED_RING    : 固定容量环形缓冲 (注意力场默认 500)
 *
 * 两者对外行为相同; FIXED_RING 只是在 capacity 很小时语义上更明确,
 * 且 capacity = 0 时退化为容量 1。
 */

#include <deque>
#include <vector>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <type_traits>

namespace syncfield {

enum class HistoryPolicy : uint8_t {
    CAPPED_GROWTH = 0,
    FIXED_RING    = 1,
};

constexpr size_t KURAMOTO_HISTORY_CAP  = 10000;
constexpr size_t ATTENTION_HISTORY_CAP = 500;

template <typename Frame>
class HistoryBuffer {
public:
    explicit HistoryBuffer(HistoryPolicy policy = HistoryPolicy::CAPPED_GROWTH,
                           size_t capacity = KURAMOTO_HISTORY_CAP)
        : policy_(policy)
        , capacity_(policy == HistoryPolicy::FIXED_RING && capacity == 0 ? 1 : capacity)
    {}

    void push(Frame frame) {
        frames_.push_back(std::move(frame));
        if (capacity_ > 0) {
            while (frames_.size() > capacity_) {
                frames_.pop_front();
                evicted_++;
            }
        }
    }

    void clear() {
        frames_.clear();
        evicted_ = 0;
    }

    size_t size()  const { return frames_.size(); }
    bool   empty() const { return frames_.empty(); }

    const Frame& operator[](size_t i) const { return frames_[i]; }
    const Frame& front() const { return frames_.front(); }
    const Frame& back()  const { return frames_.back(); }

    typename std::deque<Frame>::const_iterator begin() const { return frames_.begin(); }
    typename std::deque<Frame>::const_iterator end()   const { return frames_.end(); }

    /** 按字段抽取一列 (例如 time / order_parameter), 返回副本 */
    template <typename Getter>
    auto column(Getter get) const
        -> std::vector<std::decay_t<decltype(get(std::declval<const Frame&>()))>> {
        std::vector<std::decay_t<decltype(get(std::declval<const Frame&>()))>> out;
        out.reserve(frames_.size());
        for (const auto& f : frames_) out.push_back(get(f));
        return out;
    }

    HistoryPolicy policy()   const { return policy_; }
    size_t        capacity() const { return capacity_; }
    /** 自上次 clear() 以来被淘汰的帧数 */
    size_t        evicted()  const { return evicted_; }

private:
    HistoryPolicy policy_;
    size_t capacity_;
    size_t evicted_ = 0;
    std::deque<Frame> frames_;
};

} // namespace syncfield
