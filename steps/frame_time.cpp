#include "steps/frame_time.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <vector>

namespace steps {

void FrameTimeHistory::Push(float delta) {
    samples_.push_back(delta);
    if (samples_.size() > kCapacity) samples_.pop_front();
}

float FrameTimeHistory::Average() const {
    if (samples_.empty()) return 0.0f;
    float sum = std::accumulate(samples_.begin(), samples_.end(), 0.0f);
    return sum / static_cast<float>(samples_.size());
}

float FrameTimeHistory::Percentile(float p) const {
    if (samples_.empty()) return 0.0f;
    std::vector<float> sorted(samples_.begin(), samples_.end());
    std::sort(sorted.begin(), sorted.end());

    p = std::isnan(p) ? 0.0f : std::clamp(p, 0.0f, 1.0f);
    auto idx = static_cast<std::size_t>(std::floor(static_cast<float>(sorted.size()) * p));
    return sorted[std::min(idx, sorted.size() - 1)];
}

std::string FormatFrameTitle(const FrameTimeHistory& history) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2)
        << "Frame time: " << history.Average() * 1000.0f << "ms"
        << " (95th: " << history.Percentile(0.95f) * 1000.0f << "ms"
        << ", 99th: " << history.Percentile(0.99f) * 1000.0f << "ms)";
    return out.str();
}

} // namespace steps
