#include <rline/offsets.hpp>
#include <rline/filters.hpp>
#include <rline/spline.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace rline {

const char* corner_phase_name(CornerPhase p) {
  switch (p) {
    case CornerPhase::Straight:  return "straight";
    case CornerPhase::Entry:     return "entry";
    case CornerPhase::Apex:      return "apex";
    case CornerPhase::Exit:      return "exit";
    case CornerPhase::Sustained: return "sustained";
  }
  return "?";
}

void OffsetSettings::validate() const {
  if (!(usage_fraction > 0.0) || usage_fraction > 0.5) {
    throw std::invalid_argument("offsets.usage_fraction must be in (0, 0.5]");
  }
  if (!(corner_threshold > 0.0)) throw std::invalid_argument("offsets.corner_threshold must be positive");
  if (curvature_sigma < 0.0) throw std::invalid_argument("offsets.curvature_sigma cannot be negative");
  if (phase_window < 1) throw std::invalid_argument("offsets.phase_window must be at least 1");
  if (look_ahead < 1) throw std::invalid_argument("offsets.look_ahead must be at least 1");
  if (sustained_tolerance < 0.0) throw std::invalid_argument("offsets.sustained_tolerance cannot be negative");
  if (severity_gain < 0.0) throw std::invalid_argument("offsets.severity_gain cannot be negative");
  if (refit_stride < 0) throw std::invalid_argument("offsets.refit_stride cannot be negative");
  for (double s : smoothing_sigmas) {
    if (s < 0.0) throw std::invalid_argument("offsets.smoothing_sigmas cannot be negative");
  }
  for (std::size_t i = 1; i < speed_tiers.size(); ++i) {
    if (!(speed_tiers[i].below > speed_tiers[i - 1].below)) {
      throw std::invalid_argument("offsets.speed_tiers must be sorted by speed");
    }
  }
}

void RefinementSettings::validate() const {
  if (max_iterations < 1) throw std::invalid_argument("refinement.max_iterations must be at least 1");
  if (!(convergence > 0.0)) throw std::invalid_argument("refinement.convergence must be positive");
  if (percentile < 0.0 || percentile > 1.0) throw std::invalid_argument("refinement.percentile must be in [0, 1]");
  if (!(reference_speed > 0.0)) throw std::invalid_argument("refinement.reference_speed must be positive");
  if (max_speed_factor < 0.0) throw std::invalid_argument("refinement.max_speed_factor cannot be negative");
}

OffsetSolver::OffsetSolver(OffsetSettings settings) : settings_(std::move(settings)) {
  settings_.validate();
}

static double sign_(double x) { return (x > 0.0) ? 1.0 : ((x < 0.0) ? -1.0 : 0.0); }

// Mean of |k| over `count` samples starting at `first`, wrapping over n.
static double wrapped_mean_(const std::vector<double>& k, std::ptrdiff_t first, int count, std::size_t n) {
  const auto nn = static_cast<std::ptrdiff_t>(n);
  double acc = 0.0;
  for (int j = 0; j < count; ++j) {
    const std::ptrdiff_t idx = ((first + j) % nn + nn) % nn;
    acc += std::fabs(k[static_cast<std::size_t>(idx)]);
  }
  return acc / double(count);
}

std::vector<double> OffsetSolver::classification_curvature(const TrackGeometry& geom) const {
  auto k = smooth_closed(geom.curvature, settings_.curvature_sigma);
  sanitize(k, 0.0);
  return k;
}

std::vector<CornerPhase> OffsetSolver::classify(const std::vector<double>& closed_curvature) const {
  std::vector<CornerPhase> phases(closed_curvature.size(), CornerPhase::Straight);
  if (closed_curvature.size() < 4) return phases;

  const std::size_t n = closed_curvature.size() - 1;
  const int w = std::min<int>(settings_.phase_window, static_cast<int>(n));
  for (std::size_t i = 0; i < n; ++i) {
    const double cur = std::fabs(closed_curvature[i]);
    if (cur <= settings_.corner_threshold) continue;

    const auto ii = static_cast<std::ptrdiff_t>(i);
    const double ahead = wrapped_mean_(closed_curvature, ii, w, n);
    const double behind = wrapped_mean_(closed_curvature, ii - w, w, n);
    const double tol = settings_.sustained_tolerance * cur;

    if (std::fabs(ahead - cur) <= tol && std::fabs(behind - cur) <= tol) {
      phases[i] = CornerPhase::Sustained;
    } else if (cur > ahead && cur > behind) {
      phases[i] = CornerPhase::Apex;
    } else if (cur > behind) {
      phases[i] = CornerPhase::Entry;
    } else {
      phases[i] = CornerPhase::Exit;
    }
  }
  phases[n] = phases[0];
  return phases;
}

double OffsetSolver::speed_factor(double speed) const {
  for (const auto& tier : settings_.speed_tiers) {
    if (speed < tier.below) return tier.factor;
  }
  return settings_.default_speed_factor;
}

double OffsetSolver::phase_weight_(CornerPhase p) const {
  switch (p) {
    case CornerPhase::Apex:      return settings_.apex_weight;
    case CornerPhase::Entry:     return settings_.entry_weight;
    case CornerPhase::Exit:      return settings_.exit_weight;
    case CornerPhase::Sustained: return settings_.sustained_weight;
    case CornerPhase::Straight:  return 0.0;
  }
  return 0.0;
}

std::vector<double> OffsetSolver::refit_(const TrackGeometry& geom, const std::vector<double>& n) const {
  const std::size_t stride = static_cast<std::size_t>(settings_.refit_stride);
  const std::size_t unique = geom.size() - 1;
  if (stride == 0 || unique / stride < 3) return n;

  std::vector<double> xs, ys;
  for (std::size_t i = 0; i < unique; i += stride) {
    xs.push_back(geom.s[i]);
    ys.push_back(n[i]);
  }
  xs.push_back(geom.length());
  ys.push_back(n.front());

  auto spline = CubicSpline::periodic(std::move(xs), std::move(ys));
  if (!spline) return n;

  std::vector<double> out(n.size());
  for (std::size_t i = 0; i < n.size(); ++i) out[i] = (*spline)(geom.s[i]);
  return out;
}

std::vector<double> OffsetSolver::offsets(const TrackGeometry& geom, const std::vector<double>& speeds,
                                          double track_width) const {
  std::vector<double> n(geom.size(), 0.0);
  if (geom.size() < 4 || speeds.size() != geom.size()) return n;

  const double max_off = max_offset(track_width);
  const auto kappa = classification_curvature(geom);
  const auto phases = classify(kappa);
  const std::size_t unique = geom.size() - 1;

  for (std::size_t i = 0; i < unique; ++i) {
    if (phases[i] != CornerPhase::Straight) {
      double magnitude = max_off * phase_weight_(phases[i]) * speed_factor(speeds[i]);
      if (settings_.severity_gain > 0.0) {
        magnitude *= std::min(std::fabs(kappa[i]) * settings_.severity_gain, 1.0);
      }
      n[i] = sign_(kappa[i]) * magnitude;
      continue;
    }

    // Set up wide for the next corner, stronger as it gets closer.
    for (int d = 1; d <= settings_.look_ahead; ++d) {
      const std::size_t j = (i + static_cast<std::size_t>(d)) % unique;
      if (std::fabs(kappa[j]) <= settings_.corner_threshold) continue;
      const double transition = 1.0 - double(d) / double(settings_.look_ahead);
      n[i] = -sign_(kappa[j]) * max_off * settings_.setup_weight * transition;
      break;
    }
  }
  n[unique] = n[0];

  auto clip = [max_off](std::vector<double>& v) {
    for (auto& x : v) x = std::isfinite(x) ? std::clamp(x, -max_off, max_off) : 0.0;
  };

  clip(n);
  n = smooth_closed(n, settings_.smoothing_sigmas);
  n = refit_(geom, n);
  clip(n);
  n.back() = n.front();
  return n;
}

std::vector<Vec2> OffsetSolver::apply(const CurvilinearFrame& frame, const std::vector<double>& offsets) {
  const auto& g = frame.geometry();
  const std::size_t count = std::min(g.size(), offsets.size());
  std::vector<Vec2> line;
  line.reserve(count);
  for (std::size_t i = 0; i < count; ++i) line.push_back(frame.position_at(g.s[i], offsets[i]));
  close_loop(line);
  return line;
}

void apply_boundary(std::vector<Vec2>& line, const std::vector<Vec2>& centerline, double max_offset) {
  const std::size_t count = std::min(line.size(), centerline.size());
  for (std::size_t i = 0; i < count; ++i) {
    const Vec2 off = line[i] - centerline[i];
    const double d = norm(off);
    if (!std::isfinite(d)) { line[i] = centerline[i]; continue; }
    if (d > max_offset) line[i] = centerline[i] + off * (max_offset / d);
  }
}

// Linear-interpolated quantile, q in [0, 1].
static double quantile_(std::vector<double> v, double q) {
  if (v.empty()) return 0.0;
  std::sort(v.begin(), v.end());
  const double pos = q * double(v.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const std::size_t hi = std::min(lo + 1, v.size() - 1);
  return v[lo] + (v[hi] - v[lo]) * (pos - double(lo));
}

std::vector<Vec2> reduce_curvature(const std::vector<Vec2>& line, const std::vector<Vec2>& centerline,
                                   const std::vector<double>& speeds, double max_offset,
                                   const RefinementSettings& settings) {
  if (line.size() < 4 || centerline.size() != line.size()) return line;

  const std::size_t n = line.size() - 1;
  const auto kappa = signed_curvature(line);
  std::vector<double> mags(n);
  for (std::size_t i = 0; i < n; ++i) mags[i] = std::fabs(kappa[i]);
  const double threshold = quantile_(mags, settings.percentile);

  std::vector<Vec2> out = line;
  for (std::size_t i = 0; i < n; ++i) {
    if (!(mags[i] > threshold)) continue;

    const Vec2 prev = line[(i + n - 1) % n];
    const Vec2 cur = line[i];
    const Vec2 next = line[(i + 1) % n];
    const Vec2 v1 = cur - prev;
    const Vec2 v2 = next - cur;
    if (norm(v1) < 1e-6 || norm(v2) < 1e-6) continue;

    const Vec2 a = normalized(v1);
    const Vec2 b = normalized(v2);
    const double turn = std::acos(std::clamp(dot(a, b), -1.0, 1.0));
    Vec2 inside = perp(a);
    if (cross(a, b) < 0.0) inside = inside * -1.0;

    const double speed = (i < speeds.size() && std::isfinite(speeds[i])) ? speeds[i] : 0.0;
    const double speed_factor = std::min(speed / settings.reference_speed, settings.max_speed_factor);
    out[i] = cur + inside * (max_offset * (turn / kPI) * speed_factor);
  }
  out.back() = out.front();

  apply_boundary(out, centerline, max_offset);
  out = moving_average_closed(out);
  apply_boundary(out, centerline, max_offset);
  out.back() = out.front();
  return out;
}

RefinedLine refine_line(const std::vector<Vec2>& initial, const std::vector<Vec2>& centerline,
                        double half_width, double max_offset, const SpeedSolver& solver,
                        const VehicleParams& vehicle, double friction,
                        const RefinementSettings& settings, Logger& log) {
  settings.validate();

  RefinedLine best;
  best.lap_time = std::numeric_limits<double>::infinity();

  std::vector<Vec2> current = initial;
  double prev_lap = 0.0;
  for (int it = 0; it < settings.max_iterations; ++it) {
    const auto geom = geometry_from_closed(current, half_width);
    const auto speeds = solver.forward_backward(geom, vehicle, friction);
    const double lap = lap_time(current, speeds);
    log.debug("refinement iteration ", it + 1, ": lap ", lap, " s");

    best.iterations = it + 1;
    if (best.line.empty() || lap < best.lap_time) {
      best.lap_time = lap;
      best.line = current;
      best.speeds = speeds;
    }
    if (it > 0 && std::fabs(prev_lap - lap) < settings.convergence) break;
    if (it + 1 < settings.max_iterations) {
      current = reduce_curvature(current, centerline, speeds, max_offset, settings);
    }
    prev_lap = lap;
  }
  return best;
}

} // namespace rline
