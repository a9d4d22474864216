#include <rline/filters.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace rline {

static std::vector<double> gaussian_kernel_(double sigma) {
  const int radius = std::max(1, static_cast<int>(4.0 * sigma + 0.5));
  std::vector<double> k(2 * radius + 1);
  double sum = 0.0;
  for (int i = -radius; i <= radius; ++i) {
    const double w = std::exp(-0.5 * (i * i) / (sigma * sigma));
    k[i + radius] = w;
    sum += w;
  }
  for (auto& w : k) w /= sum;
  return k;
}

// Map an out-of-range index back into [0, n).
static std::ptrdiff_t edge_index_(std::ptrdiff_t i, std::ptrdiff_t n, EdgeMode mode) {
  if (mode == EdgeMode::Wrap) {
    return ((i % n) + n) % n;
  }
  // Half-sample symmetric reflection, period 2n.
  const std::ptrdiff_t period = 2 * n;
  std::ptrdiff_t k = ((i % period) + period) % period;
  return (k < n) ? k : (period - 1 - k);
}

std::vector<double> gaussian_filter(const std::vector<double>& v, double sigma, EdgeMode mode) {
  if (v.size() < 2 || !(sigma > 0.0) || !std::isfinite(sigma)) return v;

  const auto kernel = gaussian_kernel_(sigma);
  const auto radius = static_cast<std::ptrdiff_t>(kernel.size() / 2);
  const auto n = static_cast<std::ptrdiff_t>(v.size());

  std::vector<double> out(v.size(), 0.0);
  for (std::ptrdiff_t i = 0; i < n; ++i) {
    double acc = 0.0;
    for (std::ptrdiff_t j = -radius; j <= radius; ++j) {
      acc += kernel[static_cast<std::size_t>(j + radius)] * v[static_cast<std::size_t>(edge_index_(i + j, n, mode))];
    }
    out[static_cast<std::size_t>(i)] = acc;
  }
  return out;
}

std::vector<double> smooth_closed(const std::vector<double>& closed, double sigma) {
  if (closed.size() < 3) return closed;
  std::vector<double> unique(closed.begin(), closed.end() - 1);
  auto out = gaussian_filter(unique, sigma, EdgeMode::Wrap);
  out.push_back(out.front());
  return out;
}

std::vector<double> smooth_closed(const std::vector<double>& closed,
                                  const std::vector<double>& sigmas) {
  auto out = closed;
  for (double s : sigmas) out = smooth_closed(out, s);
  return out;
}

std::vector<Vec2> moving_average_closed(const std::vector<Vec2>& closed) {
  if (closed.size() < 4) return closed;
  const std::size_t n = closed.size() - 1; // unique points
  std::vector<Vec2> out(closed.size());
  for (std::size_t i = 0; i < n; ++i) {
    const Vec2& a = closed[(i + n - 1) % n];
    const Vec2& b = closed[i];
    const Vec2& c = closed[(i + 1) % n];
    out[i] = (a + b + c) * (1.0 / 3.0);
  }
  out[n] = out[0];
  return out;
}

void sanitize(std::vector<double>& v, double fallback) {
  for (auto& x : v) {
    if (!std::isfinite(x)) x = fallback;
  }
}

} // namespace rline
