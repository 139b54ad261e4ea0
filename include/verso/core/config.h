#ifndef VERSO_CORE_CONFIG_H
#define VERSO_CORE_CONFIG_H

#include <cstdint>

namespace verso::core::config {

inline constexpr std::uint32_t kDefaultViewportWidth = 1280;
inline constexpr std::uint32_t kDefaultViewportHeight = 720;
inline constexpr float kDefaultScaleFactor = 1.0f;

inline constexpr float kDefaultFontSize = 16.0f;
inline constexpr float kRootFontSize = 16.0f;
inline constexpr const char kDefaultFontFamily[] = "sans-serif";

// Fallback metrics used when the measurement provider has no answer,
// expressed as multiples of the font size.
inline constexpr float kFallbackAdvanceRatio = 0.6f;
inline constexpr float kFallbackSpaceRatio = 0.3f;
inline constexpr float kFallbackAscentRatio = 0.8f;
inline constexpr float kFallbackDescentRatio = 0.2f;
inline constexpr float kFallbackLineHeightRatio = 1.2f;

inline constexpr float kListIndent = 40.0f;
inline constexpr float kListMarkerGapRatio = 0.5f;

inline constexpr float kReplacedPlaceholderWidth = 100.0f;
inline constexpr float kReplacedPlaceholderHeight = 80.0f;

inline constexpr int kMaxTreeDepth = 256;

inline constexpr const char kVersionString[] = "verso 0.1.0";

} // namespace verso::core::config

#endif  // VERSO_CORE_CONFIG_H
