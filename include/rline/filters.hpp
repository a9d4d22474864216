#pragma once
#include <vector>
#include <rline/geometry.hpp>

namespace rline {

// How samples beyond either end of a sequence are synthesized.
enum class EdgeMode {
  Reflect, // d c b a | a b c d | d c b a
  Wrap,    // periodic sequence
};

// Discrete Gaussian low-pass (kernel truncated at 4 sigma).
// sigma <= 0 returns the input unchanged.
std::vector<double> gaussian_filter(const std::vector<double>& v, double sigma,
                                    EdgeMode mode = EdgeMode::Reflect);

// Closed sequences repeat their first sample at the end. These helpers filter
// the unique part periodically and restore last == first.
std::vector<double> smooth_closed(const std::vector<double>& closed, double sigma);
std::vector<double> smooth_closed(const std::vector<double>& closed,
                                  const std::vector<double>& sigmas);

// Three-point moving average over a closed polyline.
std::vector<Vec2> moving_average_closed(const std::vector<Vec2>& closed);

// Replace NaN/Inf entries with `fallback`.
void sanitize(std::vector<double>& v, double fallback);

} // namespace rline
