#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <spectral/core/exception.hpp>
#include <spectral/core/io.hpp>
#include <spectral/core/json.hpp>
#include <spectral/core/spectral_geometry.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <vector>

using namespace spc;

constexpr static double nm  = 1e-9;
constexpr static double eps = 1e-6;

auto has_code(ErrorCode code) {
  return Catch::Matchers::Predicate<ConfigError>(
    [code](const ConfigError &e) { return e.code() == code; }, 
    fmt::format("has error code {}", code));
}

TEST_CASE("Json configuration") {
  SECTION("Enums by name") {
    CHECK(json(PresentationModel::eDensitySlicing) == "density_slicing");
    CHECK(json("false_color").get<PresentationModel>() == PresentationModel::eFalseColor);
    CHECK(json("value_is_coordinate").get<RasterMapMode>() == RasterMapMode::eValueIsCoordinate);
    CHECK(json("near_infrared").get<SpectralRangeName>() == SpectralRangeName::eNearInfrared);
    CHECK_THROWS(json("magenta_ish").get<ColorSpace>());
  } // SECTION

  SECTION("Raster specification") {
    auto spec = json::parse(R"({ "band_count": 3, "rows": 10, "cols": 20, "radiometric_resolution": [8, 8, 16] })")
              .get<RasterSpecification>();
    CHECK(spec.band_count() == 3);
    CHECK(spec.radiometric_resolution(2) == 16);
    CHECK(json(spec).get<RasterSpecification>() == spec);

    REQUIRE_THROWS_MATCHES(json::parse(R"({ "band_count": 0, "rows": 1, "cols": 1 })").get<RasterSpecification>(),
      ConfigError, has_code(ErrorCode::eInvalidBandCount));
  } // SECTION

  SECTION("Raster mapper") {
    auto mapper = json::parse(R"({ "translation": [10, 20], "scale": [2, 4, 1] })").get<RasterMapper>();
    CHECK(mapper.map_coordinate(1.0, 1.0).isApprox(Coordinate(12.0, 24.0, 0.0)));
    CHECK(json(mapper).get<RasterMapper>() == mapper);
  } // SECTION

  SECTION("Presentation") {
    auto p = json::parse(R"({ "model": "false_color", "band_indices": [3, 2, 1] })").get<Presentation>();
    CHECK(p == Presentation::false_color(3, 2, 1));
    CHECK(json(p).get<Presentation>() == p);

    auto t = json::parse(R"({ "model": "true_color", "color_space": "hsv" })").get<Presentation>();
    CHECK(t == Presentation::true_color(ColorSpace::eHSV));

    auto c = json::parse(R"({ "model": "pseudo_color", "color_map": [{ "value": 1, "color": [255, 0, 0] }] })")
           .get<Presentation>();
    REQUIRE(c.color_map() != nullptr);
    CHECK(c.color_map()->at(1) == std::vector<uint> { 255, 0, 0 });
    CHECK(json(c).get<Presentation>() == c);

    REQUIRE_THROWS_MATCHES(json::parse(R"({ "model": "density_slicing" })").get<Presentation>(),
      ConfigError, has_code(ErrorCode::eNullColorMap));
  } // SECTION

  SECTION("Imaging") {
    auto imaging = json::parse(R"({
      "device": { "mission": "Landsat", "mission_number": 8, "instrument": "OLI" },
      "time": 1600000000,
      "bands": [{ "number": 4, "spectral_range": { "min": 6.3e-7, "max": 6.8e-7 } }],
      "parameters": { "cloud_cover": 0.5 }
    })").get<RasterImaging>();
    CHECK(imaging.device().name() == "Landsat8 OLI");
    CHECK(imaging.bands().size() == 1);
    CHECK(imaging.parameter("cloud_cover") == 0.5);
    CHECK(json(imaging).get<RasterImaging>() == imaging);

    auto band = json::parse(R"({
      "spectral_range": { "min": 8.5e-7, "max": 8.8e-7 },
      "spectral_domain": "near_infrared", "spatial_resolution": 30.0, "swath": 185000.0
    })").get<ImagingBand>();
    CHECK(band.spectral_domain == SpectralDomain::eNearInfrared);
    CHECK(band.range_resolution == 30.0);
    CHECK(band.azimuth_resolution == 30.0);
    CHECK(json(band).at("spectral_domain") == "near_infrared");

    REQUIRE_THROWS_MATCHES(json::parse(R"({
      "spectral_range": { "min": 8.5e-7, "max": 8.8e-7 }, "range_resolution": 30.0, "swath": 10.0
    })").get<ImagingBand>(), ConfigError, has_code(ErrorCode::eInvalidDimension));

    auto catalog_device = json(imaging_devices::spot4_hrvir()).get<ImagingDevice>();
    CHECK(catalog_device == imaging_devices::spot4_hrvir());
  } // SECTION

  SECTION("Build request") {
    auto request = json::parse(R"({
      "raster": { "band_count": 4, "rows": 8, "cols": 8, "radiometric_resolution": 12 },
      "format": "float",
      "mapper": { "translation": [0, 0], "scale": [0.5, 0.5, 1] },
      "presentation": { "model": "true_color", "band_indices": [2, 1, 0] },
      "metadata": { "name": "tile" }
    })").get<SpectralGeometryRequest>();

    SpectralGeometryBuilder builder;
    auto polygon = builder.build(request);
    CHECK(polygon.band_count() == 4);
    CHECK(polygon.raster().format() == RasterFormat::eFloat);
    CHECK(polygon.shell().size() == 4);
    CHECK(polygon.metadata().at("name") == "tile");

    json summary = polygon;
    CHECK(summary.at("band_count") == 4);
    CHECK(summary.at("presentation").at("model") == "true_color");
    CHECK_THAT(summary.at("envelope").at("max")[0].get<double>(), Catch::Matchers::WithinAbs(4.0, eps));

    // Requests survive a round trip through json
    auto copy = json(request).get<SpectralGeometryRequest>();
    CHECK(builder.build(copy) == polygon);
  } // SECTION
}

TEST_CASE("Band range files") {
  auto path = fs::temp_directory_path() / "spectral_band_ranges_test.txt";
  io::save_string(path, "# landsat 8 oli\n450 515\n525\t600\n\n630 680\n");

  SECTION("Load") {
    auto ranges = io::load_band_ranges(path);
    REQUIRE(ranges.size() == 3);
    CHECK_THAT(ranges[1].wavelength_min(), Catch::Matchers::WithinRel(525.0 * nm, 1e-9));
    CHECK_THAT(ranges[2].wavelength_max(), Catch::Matchers::WithinRel(680.0 * nm, 1e-9));
  } // SECTION

  SECTION("Save") {
    auto ranges = io::load_band_ranges(path);
    io::save_band_ranges(path, ranges);
    auto reloaded = io::load_band_ranges(path);
    REQUIRE(reloaded.size() == ranges.size());
    for (size_t i = 0; i < ranges.size(); ++i)
      CHECK_THAT(reloaded[i].center(), Catch::Matchers::WithinRel(ranges[i].center(), 1e-9));
  } // SECTION

  SECTION("Missing file") {
    CHECK_THROWS(io::load_band_ranges(fs::temp_directory_path() / "spectral_no_such_file.txt"));
  } // SECTION

  fs::remove(path);
}
