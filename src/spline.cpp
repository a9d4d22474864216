#include <rline/spline.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace rline {

namespace {

constexpr double kPivotTol = 1e-14;

// Thomas algorithm. a: sub-diagonal (a[0] unused), b: diagonal,
// c: super-diagonal (c[n-1] unused).
bool solve_tridiagonal(const std::vector<double>& a, const std::vector<double>& b,
                       const std::vector<double>& c, const std::vector<double>& r,
                       std::vector<double>& x) {
  const std::size_t n = b.size();
  if (n == 0) return false;
  std::vector<double> gam(n, 0.0);
  x.assign(n, 0.0);

  double bet = b[0];
  if (std::fabs(bet) < kPivotTol) return false;
  x[0] = r[0] / bet;
  for (std::size_t j = 1; j < n; ++j) {
    gam[j] = c[j - 1] / bet;
    bet = b[j] - a[j] * gam[j];
    if (std::fabs(bet) < kPivotTol) return false;
    x[j] = (r[j] - a[j] * x[j - 1]) / bet;
  }
  for (std::size_t j = n - 1; j-- > 0;) {
    x[j] -= gam[j + 1] * x[j + 1];
  }
  return true;
}

// Cyclic tridiagonal system (Sherman-Morrison): alpha sits at (n-1, 0),
// beta at (0, n-1).
bool solve_cyclic(const std::vector<double>& a, const std::vector<double>& b,
                  const std::vector<double>& c, double alpha, double beta,
                  const std::vector<double>& r, std::vector<double>& x) {
  const std::size_t n = b.size();
  if (n < 3) return false;

  const double gamma = -b[0];
  std::vector<double> bb = b;
  bb[0] = b[0] - gamma;
  bb[n - 1] = b[n - 1] - alpha * beta / gamma;
  if (!solve_tridiagonal(a, bb, c, r, x)) return false;

  std::vector<double> u(n, 0.0);
  u[0] = gamma;
  u[n - 1] = alpha;
  std::vector<double> z;
  if (!solve_tridiagonal(a, bb, c, u, z)) return false;

  const double denom = 1.0 + z[0] + beta * z[n - 1] / gamma;
  if (std::fabs(denom) < kPivotTol) return false;
  const double fact = (x[0] + beta * x[n - 1] / gamma) / denom;
  for (std::size_t i = 0; i < n; ++i) x[i] -= fact * z[i];
  return true;
}

bool strictly_increasing(const std::vector<double>& x) {
  for (std::size_t i = 1; i < x.size(); ++i) {
    if (!(x[i] > x[i - 1])) return false;
  }
  return true;
}

bool all_finite(const std::vector<double>& v) {
  return std::all_of(v.begin(), v.end(), [](double d){ return std::isfinite(d); });
}

// Cumulative chord length of a polyline, starting at 0.
std::vector<double> chord_parameters(const std::vector<Vec2>& pts) {
  std::vector<double> t(pts.size(), 0.0);
  for (std::size_t i = 1; i < pts.size(); ++i) {
    t[i] = t[i - 1] + distance(pts[i - 1], pts[i]);
  }
  return t;
}

} // namespace

std::optional<CubicSpline> CubicSpline::natural(std::vector<double> x, std::vector<double> y) {
  const std::size_t n = x.size();
  if (n < 2 || y.size() != n || !strictly_increasing(x)) return std::nullopt;

  CubicSpline s;
  s.m_.assign(n, 0.0);
  if (n > 2) {
    const std::size_t k = n - 2; // interior unknowns
    std::vector<double> a(k, 0.0), b(k, 0.0), c(k, 0.0), r(k, 0.0), m;
    for (std::size_t i = 1; i + 1 < n; ++i) {
      const double h0 = x[i] - x[i - 1];
      const double h1 = x[i + 1] - x[i];
      a[i - 1] = h0;
      b[i - 1] = 2.0 * (h0 + h1);
      c[i - 1] = h1;
      r[i - 1] = 6.0 * ((y[i + 1] - y[i]) / h1 - (y[i] - y[i - 1]) / h0);
    }
    if (!solve_tridiagonal(a, b, c, r, m) || !all_finite(m)) return std::nullopt;
    std::copy(m.begin(), m.end(), s.m_.begin() + 1);
  }
  s.x_ = std::move(x);
  s.y_ = std::move(y);
  s.periodic_ = false;
  return s;
}

std::optional<CubicSpline> CubicSpline::periodic(std::vector<double> x, std::vector<double> y) {
  if (x.size() < 4 || y.size() != x.size() || !strictly_increasing(x)) return std::nullopt;
  const std::size_t m = x.size() - 1; // unique knots
  y[m] = y[0];

  std::vector<double> h(m);
  for (std::size_t i = 0; i < m; ++i) h[i] = x[i + 1] - x[i];

  std::vector<double> a(m), b(m), c(m), r(m), sol;
  for (std::size_t i = 0; i < m; ++i) {
    const std::size_t ip = (i + m - 1) % m;
    const double hp = h[ip];
    const double hi = h[i];
    const double yp = y[ip];
    const double yn = y[i + 1];
    a[i] = hp;
    b[i] = 2.0 * (hp + hi);
    c[i] = hi;
    r[i] = 6.0 * ((yn - y[i]) / hi - (y[i] - yp) / hp);
  }
  const double corner = h[m - 1];
  if (!solve_cyclic(a, b, c, corner, corner, r, sol) || !all_finite(sol)) return std::nullopt;

  CubicSpline s;
  s.m_ = std::move(sol);
  s.m_.push_back(s.m_.front());
  s.x_ = std::move(x);
  s.y_ = std::move(y);
  s.periodic_ = true;
  return s;
}

std::size_t CubicSpline::interval_(double t) const {
  auto it = std::upper_bound(x_.begin(), x_.end(), t);
  const auto i = static_cast<std::ptrdiff_t>(std::distance(x_.begin(), it)) - 1;
  return static_cast<std::size_t>(std::clamp<std::ptrdiff_t>(i, 0, static_cast<std::ptrdiff_t>(x_.size()) - 2));
}

double CubicSpline::operator()(double t) const {
  if (periodic_) {
    const double period = x_.back() - x_.front();
    double tw = std::fmod(t - x_.front(), period);
    if (tw < 0.0) tw += period;
    t = x_.front() + tw;
  }
  const std::size_t i = interval_(t);
  const double h  = x_[i + 1] - x_[i];
  const double a  = x_[i + 1] - t;
  const double b  = t - x_[i];
  return m_[i] * a * a * a / (6.0 * h)
       + m_[i + 1] * b * b * b / (6.0 * h)
       + (y_[i] / h - m_[i] * h / 6.0) * a
       + (y_[i + 1] / h - m_[i + 1] * h / 6.0) * b;
}

std::optional<std::vector<Vec2>> fit_periodic_polyline(const std::vector<Vec2>& closed,
                                                       std::size_t samples) {
  if (closed.size() < 4 || samples == 0 || !is_closed(closed)) return std::nullopt;

  const auto t = chord_parameters(closed);
  std::vector<double> xs(closed.size()), ys(closed.size());
  for (std::size_t i = 0; i < closed.size(); ++i) { xs[i] = closed[i].x; ys[i] = closed[i].y; }

  auto sx = CubicSpline::periodic(t, std::move(xs));
  auto sy = CubicSpline::periodic(t, std::move(ys));
  if (!sx || !sy) return std::nullopt;

  const double period = t.back();
  std::vector<Vec2> out;
  out.reserve(samples);
  for (std::size_t k = 0; k < samples; ++k) {
    const double u = period * double(k) / double(samples);
    const Vec2 p{(*sx)(u), (*sy)(u)};
    if (!is_finite(p)) return std::nullopt;
    out.push_back(p);
  }
  return out;
}

std::optional<std::vector<Vec2>> fit_open_polyline(const std::vector<Vec2>& pts,
                                                   std::size_t samples) {
  if (pts.size() < 2 || samples < 2) return std::nullopt;

  const auto t = chord_parameters(pts);
  std::vector<double> xs(pts.size()), ys(pts.size());
  for (std::size_t i = 0; i < pts.size(); ++i) { xs[i] = pts[i].x; ys[i] = pts[i].y; }

  auto sx = CubicSpline::natural(t, std::move(xs));
  auto sy = CubicSpline::natural(t, std::move(ys));
  if (!sx || !sy) return std::nullopt;

  const double total = t.back();
  std::vector<Vec2> out;
  out.reserve(samples);
  for (std::size_t k = 0; k < samples; ++k) {
    const double u = total * double(k) / double(samples - 1);
    const Vec2 p{(*sx)(u), (*sy)(u)};
    if (!is_finite(p)) return std::nullopt;
    out.push_back(p);
  }
  return out;
}

} // namespace rline
