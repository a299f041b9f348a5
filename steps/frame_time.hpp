#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <string>

namespace steps {

// Per-frame delta and running total, in seconds.
struct FrameClock {
    float delta = 0.0f;
    float total = 0.0f;

    FrameClock() : lastFrame_(std::chrono::steady_clock::now()) {}

    void Update() {
        auto now = std::chrono::steady_clock::now();
        Advance(std::chrono::duration<float>(now - lastFrame_).count());
        lastFrame_ = now;
    }

    void Advance(float seconds) {
        delta = seconds;
        total += seconds;
    }

private:
    std::chrono::steady_clock::time_point lastFrame_;
};

// Sliding window over the most recent frame deltas.
class FrameTimeHistory {
public:
    static constexpr std::size_t kCapacity = 500;

    void Push(float delta);

    float Average() const;
    // p in [0, 1]. Returns 0 when empty.
    float Percentile(float p) const;

    std::size_t Size() const { return samples_.size(); }

private:
    std::deque<float> samples_;
};

// "Frame time: 16.67ms (95th: 17.00ms, 99th: 18.00ms)"
std::string FormatFrameTitle(const FrameTimeHistory& history);

} // namespace steps
