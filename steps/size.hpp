#pragma once

#include <cstdint>
#include <ostream>

namespace steps {

// Framebuffer size in physical pixels.
struct FramebufferSize {
    uint32_t width = 0;
    uint32_t height = 0;

    bool IsEmpty() const { return width == 0 || height == 0; }
};

inline bool operator==(const FramebufferSize& a, const FramebufferSize& b) {
    return a.width == b.width && a.height == b.height;
}
inline bool operator!=(const FramebufferSize& a, const FramebufferSize& b) { return !(a == b); }

// Size in logical points, for UI layout.
struct LogicalSize {
    float width = 0.0f;
    float height = 0.0f;
};

// `target` at `scale` pixels per point. Non-positive scales count as 1.
inline LogicalSize ToLogical(FramebufferSize target, float scale) {
    if (!(scale > 0.0f)) scale = 1.0f;
    return {static_cast<float>(target.width) / scale, static_cast<float>(target.height) / scale};
}

inline std::ostream& operator<<(std::ostream& o, const FramebufferSize& s) {
    return o << s.width << "x" << s.height;
}

} // namespace steps
