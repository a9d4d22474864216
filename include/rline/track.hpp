#pragma once
#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include <rline/geometry.hpp>

namespace rline {

// Catalog entry: a named centerline with its surface parameters.
struct TrackPreset {
  std::string key;          // e.g., "albert_park"
  std::string name;
  std::vector<Vec2> points; // open; the engine closes the loop
  double width{};           // m
  double friction{};        // tyre/surface coefficient
};

// Built-in catalog.
const std::vector<TrackPreset>& track_catalog();

// Lookup helpers
std::optional<TrackPreset> track_by_key(const std::string& key);
std::optional<TrackPreset> track_by_key_in(const std::vector<TrackPreset>& cat, const std::string& key);

// Centerline shapes
std::vector<Vec2> circle_centerline(double radius, std::size_t points);

// Rounded-rectangle "stadium" centered at (0,0).
// straight_len: length of each straight; radius: corner radius.
std::vector<Vec2> stadium_centerline(double straight_len, double radius, int arc_pts_per_quadrant = 12);

// Uniform Catmull-Rom through a closed control polygon.
std::vector<Vec2> catmull_rom_centerline(const std::vector<Vec2>& ctrl, int samples_per_seg = 24);

// Stream-based centerline CSV loader (x,y per row).
// Accepts an optional header row; ignores lines starting with '#' and blank lines.
// Whitespace around fields is trimmed. Invalid rows are skipped.
std::vector<Vec2> centerline_from_csv_stream(std::istream& in);

// Filesystem wrapper; returns nullopt if file cannot be opened.
std::optional<std::vector<Vec2>> load_centerline_csv(const std::string& path);

} // namespace rline
