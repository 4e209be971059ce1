// STL includes
#include <cstdlib>
#include <exception>
#include <span>
#include <string>
#include <vector>

// Spectral includes
#include <spectral/core/geometry.hpp>
#include <spectral/core/io.hpp>
#include <spectral/core/json.hpp>
#include <spectral/core/spectral_geometry.hpp>
#include <spectral/core/spectral_range.hpp>

// Misc includes
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace spc;

namespace inspect {
  constexpr static double nm = 1e-9;

  void print_usage() {
    fmt::print(stderr, "usage: spectral_inspect <request.json> [wavelength_nm...]\n");
  }
} // namespace inspect

void print_polygon(const SpectralPolygon &polygon) {
  const auto &raster = polygon.raster();
  const auto &pres   = polygon.presentation();
  const auto  env    = polygon.envelope();

  fmt::print("Spectral polygon\n");
  fmt::print("  {:<14} : {}\n", "bands",        raster.band_count());
  fmt::print("  {:<14} : {} x {}\n", "dimensions", raster.rows(), raster.cols());
  fmt::print("  {:<14} : {}\n", "format",       raster.format());
  fmt::print("  {:<14} : {}\n", "resolutions",  raster.radiometric_resolutions());
  fmt::print("  {:<14} : {} ({})\n", "presentation", pres.model(), pres.color_space());
  fmt::print("  {:<14} : {}\n", "holes",        polygon.holes().size());
  fmt::print("  {:<14} : {} - {}\n", "envelope", 
    Coordinate(env.min()), Coordinate(env.max()));
  if (const auto &imaging = polygon.imaging())
    fmt::print("  {:<14} : {}\n", "device", imaging->device().name());
  if (!polygon.metadata().empty())
    fmt::print("  {:<14} : {}\n", "metadata", polygon.metadata().dump());
}

void print_classification(const SpectralPolygon &polygon, double wavelength_nm) {
  double wavelength = wavelength_nm * inspect::nm;
  auto   names      = spectral_ranges::classify(wavelength);

  fmt::print("{} nm\n", wavelength_nm);
  fmt::print("  {:<14} : {}\n", "ranges", names);
  if (const auto &imaging = polygon.imaging()) {
    if (auto i = imaging->band_index_of(wavelength))
      fmt::print("  {:<14} : {}\n", "band", *i);
    else
      fmt::print("  {:<14} : none\n", "band");
  }
}

int run(std::span<char *> args) {
  if (args.size() < 2) {
    inspect::print_usage();
    return EXIT_FAILURE;
  }

  // Load request and build through the default factory
  GeometryFactory factory;
  auto request = io::load_json(args[1]).get<SpectralGeometryRequest>();
  auto polygon = create_spectral_polygon(factory, request);

  print_polygon(polygon);
  for (const char *arg : args.subspan(2))
    print_classification(polygon, std::stod(arg));
  
  return EXIT_SUCCESS;
}

int main(int argc, char **argv) {
  try {
    return run(std::span<char *>(argv, static_cast<size_t>(argc)));
  } catch (const std::exception &e) {
    fmt::print(stderr, "{}\n", e.what());
    return EXIT_FAILURE;
  }
}
