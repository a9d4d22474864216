#include <rline/track.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

namespace rline {

static std::string trim(std::string s) {
  auto not_space = [](unsigned char c){ return !std::isspace(c); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
  return s;
}

static std::vector<std::string> split_csv_line(const std::string& line) {
  // Simple CSV: no quoted fields.
  std::vector<std::string> cols;
  std::string cur;
  for (char c : line) {
    if (c == ',') { cols.push_back(trim(cur)); cur.clear(); }
    else { cur.push_back(c); }
  }
  cols.push_back(trim(cur));
  return cols;
}

static bool is_header_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return false;
  return (cols[0] == "x" || cols[0] == "X");
}

static std::optional<double> to_double(const std::string& s) {
  if (s.empty()) return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end != s.c_str() + s.size() || errno == ERANGE || !std::isfinite(v)) return std::nullopt;
  return v;
}

static std::optional<Vec2> parse_point_row(const std::vector<std::string>& cols) {
  if (cols.size() < 2) return std::nullopt;
  const auto x = to_double(cols[0]);
  const auto y = to_double(cols[1]);
  if (!x || !y) return std::nullopt;
  return Vec2{*x, *y};
}

std::vector<Vec2> circle_centerline(double radius, std::size_t points) {
  std::vector<Vec2> pts;
  pts.reserve(points);
  for (std::size_t i = 0; i < points; ++i) {
    const double a = kTAU * double(i) / double(points);
    pts.push_back({radius * std::cos(a), radius * std::sin(a)});
  }
  return pts;
}

std::vector<Vec2> stadium_centerline(double straight_len, double radius, int arc_pts_per_quadrant) {
  std::vector<Vec2> pts;
  const double R = radius;
  const double L = straight_len * 0.5;

  auto arc = [&](double cx, double cy, double a0, double a1, int steps){
    for (int i = 0; i <= steps; ++i) {
      double a = a0 + (a1 - a0) * (double(i)/double(steps));
      pts.push_back({ cx + R*std::cos(a), cy + R*std::sin(a) });
    }
  };

  // Right arc bottom to top, top straight, left arc, bottom straight.
  arc( L, 0.0, -kPI/2.0, +kPI/2.0, arc_pts_per_quadrant*2 );
  pts.push_back({ -L, +R });
  arc( -L, 0.0, +kPI/2.0, 3.0*kPI/2.0, arc_pts_per_quadrant*2 );
  pts.push_back({ +L, -R });
  return pts;
}

// Uniform Catmull-Rom (C1 continuous).
static Vec2 catmull_rom(const Vec2& P0, const Vec2& P1, const Vec2& P2, const Vec2& P3, double u) {
  const double u2 = u*u;
  const double u3 = u2*u;
  const Vec2 a0 = P0 * -1.0 + P1 * 3.0 - P2 * 3.0 + P3;
  const Vec2 a1 = P0 * 2.0 - P1 * 5.0 + P2 * 4.0 - P3;
  const Vec2 a2 = P2 - P0;
  const Vec2 a3 = P1 * 2.0;
  return (a0 * u3 + a1 * u2 + a2 * u + a3) * 0.5;
}

std::vector<Vec2> catmull_rom_centerline(const std::vector<Vec2>& ctrl, int samples_per_seg) {
  std::vector<Vec2> pts;
  const std::size_t n = ctrl.size();
  if (n < 3 || samples_per_seg < 1) return pts;

  auto at = [&](std::ptrdiff_t i)->const Vec2& {
    std::ptrdiff_t k = (i % (std::ptrdiff_t)n + (std::ptrdiff_t)n) % (std::ptrdiff_t)n;
    return ctrl[(std::size_t)k];
  };

  for (std::size_t i = 0; i < n; ++i) {
    const auto ii = (std::ptrdiff_t)i;
    for (int s = 0; s < samples_per_seg; ++s) {
      const double u = double(s) / double(samples_per_seg); // [0,1)
      pts.push_back(catmull_rom(at(ii - 1), at(ii), at(ii + 1), at(ii + 2), u));
    }
  }
  return pts;
}

static std::vector<Vec2> chicane_hairpin_() {
  // Right vertical -> chicane -> long top -> hairpin -> bottom return
  const std::vector<Vec2> ctrl{
    { 150, -60}, { 150,  60},
    {  40,  80}, { -10,  60},
    { -40,  30}, {-120,  30},
    {-160,   0}, {-150, -60},
    {-120,-100}, { -60,-110},
    {  40, -90}, { 120, -80},
  };
  return catmull_rom_centerline(ctrl, 10);
}

static std::vector<Vec2> albert_park_() {
  // Canvas-scale layout, start/finish first.
  return {
    { 600, 500}, { 650, 520}, { 720, 540}, { 800, 550},
    { 900, 520}, { 980, 480}, {1020, 440}, {1040, 380},
    {1020, 320}, { 980, 280}, { 920, 260}, { 840, 250},
    { 760, 270}, { 680, 320}, { 620, 380}, { 580, 440},
    { 600, 500},
  };
}

static std::vector<TrackPreset> make_catalog_builtin() {
  return {
    {"circle",          "Circle R100",       circle_centerline(100.0, 100),        15.0, 0.85},
    {"stadium",         "Stadium",           stadium_centerline(250.0, 80.0, 14),  14.0, 0.90},
    {"chicane_hairpin", "Chicane + Hairpin", chicane_hairpin_(),                   12.0, 0.80},
    {"albert_park",     "Albert Park",       albert_park_(),                       14.0, 0.82},
  };
}

const std::vector<TrackPreset>& track_catalog() {
  static const std::vector<TrackPreset> cat = make_catalog_builtin();
  return cat;
}

std::optional<TrackPreset> track_by_key(const std::string& key) {
  return track_by_key_in(track_catalog(), key);
}

std::optional<TrackPreset> track_by_key_in(const std::vector<TrackPreset>& cat, const std::string& key) {
  auto it = std::find_if(cat.begin(), cat.end(), [&](const TrackPreset& t){ return t.key == key; });
  if (it == cat.end()) return std::nullopt;
  return *it;
}

std::vector<Vec2> centerline_from_csv_stream(std::istream& in) {
  std::vector<Vec2> out;
  std::string line;
  bool header_consumed = false;

  while (std::getline(in, line)) {
    std::string raw = trim(line);
    if (raw.empty()) continue;
    if (raw[0] == '#') continue;

    auto cols = split_csv_line(raw);

    if (!header_consumed && out.empty() && is_header_row(cols)) {
      header_consumed = true;
      continue;
    }

    if (auto p = parse_point_row(cols); p.has_value()) {
      out.push_back(*p);
    }
  }
  return out;
}

std::optional<std::vector<Vec2>> load_centerline_csv(const std::string& path) {
  std::ifstream f(path);
  if (!f) return std::nullopt;
  return centerline_from_csv_stream(f);
}

} // namespace rline
