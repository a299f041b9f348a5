#pragma once

namespace steps {

// Position + color + uv vertices, textured with group 0 (texture, sampler) and
// tinted by the vertex color. Entry points vs_main / fs_main.
extern const char kDiffuseWGSL[];

} // namespace steps
