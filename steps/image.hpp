#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace steps {

// Tightly packed RGBA8, rows top to bottom.
struct DecodedImage {
    uint32_t width = 0;
    uint32_t height = 0;
    std::vector<uint8_t> rgba;
};

DecodedImage DecodeImage(const uint8_t* data, std::size_t size);
inline DecodedImage DecodeImage(const std::vector<uint8_t>& bytes) {
    return DecodeImage(bytes.data(), bytes.size());
}

DecodedImage LoadImageFile(const std::string& path);

// Deterministic gray cobblestone pattern encoded as PNG.
std::vector<uint8_t> MakeStonePng(uint32_t width, uint32_t height, uint32_t seed = 7);

} // namespace steps
