#pragma once
#include <cstdint>

namespace stratum::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 1280;
inline constexpr std::uint32_t kDefaultViewportHeight = 720;

// Thickness of the scroll bars created for overflow: scroll.
inline constexpr float kScrollBarThickness = 15.0f;

// CSS initial value of transform-origin (50% 50%).
inline constexpr float kDefaultTransformOriginX = 0.5f;
inline constexpr float kDefaultTransformOriginY = 0.5f;

// Module name attached to layer tree diagnostics.
inline constexpr const char kLayerModule[] = "layer";

} // namespace stratum::core::config
