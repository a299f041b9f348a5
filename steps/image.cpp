#include "steps/image.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <random>
#include <stdexcept>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#include <stb_image.h>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

namespace steps {

DecodedImage DecodeImage(const uint8_t* data, std::size_t size) {
    if (data == nullptr || size == 0) throw std::runtime_error("Failed to decode image: no data");
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("Failed to decode image: input too large");
    }

    int w = 0, h = 0, n = 0;
    stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w, &h, &n, 4); // force RGBA
    if (!pixels) {
        throw std::runtime_error(std::string("Failed to decode image: ") + stbi_failure_reason());
    }

    DecodedImage out;
    out.width = static_cast<uint32_t>(w);
    out.height = static_cast<uint32_t>(h);
    out.rgba.assign(pixels, pixels + static_cast<std::size_t>(w) * h * 4);
    stbi_image_free(pixels);
    return out;
}

DecodedImage LoadImageFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) throw std::runtime_error("Failed to open image: " + path);

    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    try {
        return DecodeImage(bytes);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(std::string(e.what()) + " (" + path + ")");
    }
}

std::vector<uint8_t> MakeStonePng(uint32_t width, uint32_t height, uint32_t seed) {
    if (width == 0 || height == 0) throw std::invalid_argument("MakeStonePng: empty size");

    // Jittered cell centers, one per 32x32 tile.
    constexpr int kCell = 32;
    const int cols = static_cast<int>((width + kCell - 1) / kCell);
    const int rows = static_cast<int>((height + kCell - 1) / kCell);

    std::mt19937 rng(seed);
    struct Site { float x, y; uint8_t shade; };
    std::vector<Site> sites(static_cast<std::size_t>(cols) * rows);
    for (int cy = 0; cy < rows; ++cy) for (int cx = 0; cx < cols; ++cx) {
        Site& s = sites[cy * cols + cx];
        s.x = (cx + 0.2f + 0.6f * (rng() % 1000) / 1000.0f) * kCell;
        s.y = (cy + 0.2f + 0.6f * (rng() % 1000) / 1000.0f) * kCell;
        s.shade = static_cast<uint8_t>(110 + rng() % 70);
    }

    std::vector<uint8_t> rgba(static_cast<std::size_t>(width) * height * 4);
    for (uint32_t y = 0; y < height; ++y) for (uint32_t x = 0; x < width; ++x) {
        const int cx = static_cast<int>(x) / kCell, cy = static_cast<int>(y) / kCell;
        float d1 = std::numeric_limits<float>::max(), d2 = d1;
        uint8_t shade = 0;
        for (int ny = std::max(0, cy - 1); ny <= std::min(rows - 1, cy + 1); ++ny)
            for (int nx = std::max(0, cx - 1); nx <= std::min(cols - 1, cx + 1); ++nx) {
                const Site& s = sites[ny * cols + nx];
                float dx = s.x - x, dy = s.y - y;
                float d = std::sqrt(dx * dx + dy * dy);
                if (d < d1) { d2 = d1; d1 = d; shade = s.shade; }
                else if (d < d2) { d2 = d; }
            }

        // mortar between stones, grain inside them
        int v = (d2 - d1 < 2.5f) ? 45 : shade - static_cast<int>(d1 * 0.6f);
        v += static_cast<int>(rng() % 17) - 8;
        v = std::clamp(v, 0, 255);

        std::size_t i = (static_cast<std::size_t>(y) * width + x) * 4;
        rgba[i] = static_cast<uint8_t>(v);
        rgba[i + 1] = static_cast<uint8_t>(v);
        rgba[i + 2] = static_cast<uint8_t>(std::min(255, v + 6));
        rgba[i + 3] = 255;
    }

    std::vector<uint8_t> png;
    auto append = [](void* context, void* data, int size) {
        auto* out = static_cast<std::vector<uint8_t>*>(context);
        auto* bytes = static_cast<uint8_t*>(data);
        out->insert(out->end(), bytes, bytes + size);
    };
    if (!stbi_write_png_to_func(append, &png, static_cast<int>(width), static_cast<int>(height), 4,
                                rgba.data(), static_cast<int>(width) * 4)) {
        throw std::runtime_error("Failed to encode stone PNG");
    }
    return png;
}

} // namespace steps
