#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <spectral/core/exception.hpp>
#include <spectral/core/raster.hpp>
#include <array>
#include <cstdint>
#include <limits>
#include <vector>

using namespace spc;

constexpr static double eps = 1e-9;

auto has_code(ErrorCode code) {
  return Catch::Matchers::Predicate<ConfigError>(
    [code](const ConfigError &e) { return e.code() == code; }, 
    fmt::format("has error code {}", code));
}

TEST_CASE("Raster mapper") {
  auto mapper = RasterMapper::from_transformation(RasterMapMode::eValueIsArea, 
    Coordinate(100.0, 200.0, 0.0), eig::Vector3d(10.0, 20.0, 1.0));

  SECTION("Forward mapping") {
    // Columns map along x, rows along y
    Coordinate c = mapper.map_coordinate(2.0, 3.0);
    CHECK_THAT(c.x(), Catch::Matchers::WithinAbs(130.0, eps));
    CHECK_THAT(c.y(), Catch::Matchers::WithinAbs(240.0, eps));
    CHECK_THAT(c.z(), Catch::Matchers::WithinAbs(0.0, eps));
  } // SECTION

  SECTION("Inverse mapping") {
    eig::Vector2d rc = mapper.map_raster(Coordinate(130.0, 240.0, 0.0));
    CHECK_THAT(rc[0], Catch::Matchers::WithinAbs(2.0, eps));
    CHECK_THAT(rc[1], Catch::Matchers::WithinAbs(3.0, eps));

    RasterCoordinate cell = mapper.map_raster_cell(Coordinate(131.0, 242.0, 0.0));
    CHECK(cell.row_index == 2);
    CHECK(cell.column_index == 3);
  } // SECTION

  SECTION("Mode shift") {
    Coordinate c = mapper.map_coordinate(0.0, 0.0, RasterMapMode::eValueIsCoordinate);
    CHECK_THAT(c.x(), Catch::Matchers::WithinAbs(105.0, eps));
    CHECK_THAT(c.y(), Catch::Matchers::WithinAbs(210.0, eps));
  } // SECTION

  SECTION("Mode shifted inverse mapping") {
    Coordinate c = mapper.map_coordinate(2.0, 3.0, RasterMapMode::eValueIsCoordinate);
    eig::Vector2d rc = mapper.map_raster(c, RasterMapMode::eValueIsCoordinate);
    CHECK_THAT(rc[0], Catch::Matchers::WithinAbs(2.0, eps));
    CHECK_THAT(rc[1], Catch::Matchers::WithinAbs(3.0, eps));

    eig::Vector2d same = mapper.map_raster(Coordinate(130.0, 240.0, 0.0), RasterMapMode::eValueIsArea);
    CHECK_THAT(same[0], Catch::Matchers::WithinAbs(2.0, eps));
    CHECK_THAT(same[1], Catch::Matchers::WithinAbs(3.0, eps));

    auto point_mapper = RasterMapper::from_transformation(RasterMapMode::eValueIsCoordinate,
      Coordinate(100.0, 200.0, 0.0), eig::Vector3d(10.0, 20.0, 1.0));
    eig::Vector2d shifted = point_mapper.map_raster(Coordinate(130.0, 240.0, 0.0), RasterMapMode::eValueIsArea);
    CHECK_THAT(shifted[0], Catch::Matchers::WithinAbs(2.5, eps));
    CHECK_THAT(shifted[1], Catch::Matchers::WithinAbs(3.5, eps));
  } // SECTION

  SECTION("Derived queries") {
    CHECK_THAT(mapper.column_size(), Catch::Matchers::WithinAbs(10.0, eps));
    CHECK_THAT(mapper.row_size(), Catch::Matchers::WithinAbs(20.0, eps));
    CHECK(mapper.translation().isApprox(Coordinate(100.0, 200.0, 0.0)));
  } // SECTION

  SECTION("Fit to coordinates") {
    std::vector<RasterCoordinate> coordinates = {
      RasterCoordinate(0, 0, Coordinate(100.0, 200.0, 0.0)),
      RasterCoordinate(0, 4, Coordinate(140.0, 200.0, 0.0)),
      RasterCoordinate(5, 0, Coordinate(100.0, 300.0, 0.0)),
      RasterCoordinate(5, 4, Coordinate(140.0, 300.0, 0.0))
    };
    auto fitted = RasterMapper::from_coordinates(RasterMapMode::eValueIsArea, coordinates);
    CHECK(fitted.map_coordinate(2.0, 3.0).isApprox(mapper.map_coordinate(2.0, 3.0)));
  } // SECTION

  SECTION("Fit requires distinct rows and columns") {
    std::vector<RasterCoordinate> coordinates = {
      RasterCoordinate(0, 0, Coordinate(100.0, 200.0, 0.0)),
      RasterCoordinate(0, 4, Coordinate(140.0, 200.0, 0.0))
    };
    REQUIRE_THROWS_MATCHES(RasterMapper::from_coordinates(RasterMapMode::eValueIsArea, coordinates),
      ConfigError, has_code(ErrorCode::eInvalidDimension));
  } // SECTION

  SECTION("Degenerate transformation") {
    eig::Matrix4d trf = eig::Matrix4d::Identity();
    trf(0, 0) = 0.0;
    REQUIRE_THROWS_MATCHES(RasterMapper(RasterMapMode::eValueIsArea, trf),
      ConfigError, has_code(ErrorCode::eInvalidDimension));

    trf = eig::Matrix4d::Identity();
    trf(3, 0) = 1.0;
    REQUIRE_THROWS_MATCHES(RasterMapper(RasterMapMode::eValueIsArea, trf),
      ConfigError, has_code(ErrorCode::eInvalidDimension));
  } // SECTION
}

TEST_CASE("Raster coordinate") {
  CHECK_NOTHROW(RasterCoordinate(0, 0, Coordinate::Zero()));
  REQUIRE_THROWS_MATCHES(RasterCoordinate(-1, 0, Coordinate::Zero()),
    ConfigError, has_code(ErrorCode::eInvalidDimension));
  REQUIRE_THROWS_MATCHES(RasterCoordinate(0, -1, Coordinate::Zero()),
    ConfigError, has_code(ErrorCode::eInvalidDimension));
}

TEST_CASE("Raster") {
  std::vector<int> resolutions = { 8, 12, 1 };
  auto spec = RasterSpecification::validate(3, 4, 5, resolutions);

  SECTION("Zero initialization") {
    Raster r(spec, RasterFormat::eInteger);
    CHECK(r.band_count() == 3);
    CHECK(r.rows() == 4);
    CHECK(r.cols() == 5);
    CHECK(r.radiometric_resolutions() == std::vector<uint> { 8, 12, 1 });
    CHECK(r.value(3, 4, 2) == 0);
    CHECK(r.specification() == spec);
  } // SECTION

  SECTION("Pixel access") {
    Raster r(spec, RasterFormat::eInteger);
    r.set_value(1, 2, 1, 4095);
    CHECK(r.value(1, 2, 1) == 4095);
    CHECK(r.max_value(0) == 255);
    CHECK(r.max_value(2) == 1);

    // Integer storage clamps floating point input
    r.set_float_value(0, 0, 0, 300.0);
    CHECK(r.value(0, 0, 0) == 255);

    CHECK_THROWS(r.set_value(0, 0, 2, 2));
    CHECK_THROWS(r.value(4, 0, 0));
    CHECK_THROWS(r.value(0, 0, 3));
  } // SECTION

  SECTION("Float storage") {
    Raster r(spec, RasterFormat::eFloat);
    r.set_float_value(2, 2, 0, 0.25);
    CHECK(r.float_value(2, 2, 0) == 0.25);
    CHECK(r.format() == RasterFormat::eFloat);
  } // SECTION

  SECTION("Wide integer bands") {
    auto wide = RasterSpecification::validate(2, 1, 1, std::vector<int> { 64, 63 });
    Raster r(wide, RasterFormat::eInteger);
    CHECK(r.max_value(0) == std::numeric_limits<std::uint64_t>::max());

    r.set_float_value(0, 0, 0, 1e19);
    CHECK(r.value(0, 0, 0) == 10000000000000000000ull);
    r.set_float_value(0, 0, 0, 1e30);
    CHECK(r.value(0, 0, 0) == std::numeric_limits<std::uint64_t>::max());
    r.set_float_value(0, 0, 0, -5.0);
    CHECK(r.value(0, 0, 0) == 0);

    r.set_float_value(0, 0, 1, 1e19);
    CHECK(r.value(0, 0, 1) == r.max_value(1));

    Raster f(wide, RasterFormat::eFloat);
    f.set_float_value(0, 0, 0, 1e19);
    CHECK(f.value(0, 0, 0) == 10000000000000000000ull);
  } // SECTION

  SECTION("Copies are deep") {
    Raster a(spec, RasterFormat::eInteger);
    Raster b = a;
    b.set_value(0, 0, 0, 7);
    CHECK(a.value(0, 0, 0) == 0);
    CHECK(a != b);
  } // SECTION

  SECTION("Corner coordinates") {
    Raster unmapped(spec, RasterFormat::eInteger);
    CHECK(unmapped.coordinates().empty());

    auto mapper = RasterMapper::from_transformation(RasterMapMode::eValueIsArea, 
      Coordinate(10.0, 20.0, 0.0), eig::Vector3d(2.0, 3.0, 1.0));
    Raster mapped(spec, RasterFormat::eInteger, mapper);
    Ring corners = mapped.coordinates();
    REQUIRE(corners.size() == 4);
    CHECK(corners[0].isApprox(Coordinate(10.0, 20.0, 0.0)));
    CHECK(corners[1].isApprox(Coordinate(20.0, 20.0, 0.0)));
    CHECK(corners[2].isApprox(Coordinate(20.0, 32.0, 0.0)));
    CHECK(corners[3].isApprox(Coordinate(10.0, 32.0, 0.0)));
  } // SECTION
}

TEST_CASE("Memory raster factory") {
  MemoryRasterFactory factory;
  auto spec_a = RasterSpecification::validate(2, 3, 3, 8);
  auto spec_b = RasterSpecification::validate(1, 3, 3, 16);

  SECTION("Band concatenation") {
    Raster a = factory.create(spec_a, RasterFormat::eInteger, { });
    Raster b = factory.create(spec_b, RasterFormat::eInteger, { });
    a.set_value(0, 0, 1, 5);
    b.set_value(2, 2, 0, 60000);

    std::array<Raster, 2> rasters = { a, b };
    Raster merged = factory.create(rasters);
    CHECK(merged.band_count() == 3);
    CHECK(merged.radiometric_resolutions() == std::vector<uint> { 8, 8, 16 });
    CHECK(merged.value(0, 0, 1) == 5);
    CHECK(merged.value(2, 2, 2) == 60000);
  } // SECTION

  SECTION("Mixed formats are promoted") {
    Raster a = factory.create(spec_a, RasterFormat::eInteger, { });
    Raster b = factory.create(spec_b, RasterFormat::eFloat, { });
    a.set_value(1, 1, 0, 42);

    std::array<Raster, 2> rasters = { a, b };
    Raster merged = factory.create(rasters);
    CHECK(merged.format() == RasterFormat::eFloat);
    CHECK(merged.float_value(1, 1, 0) == 42.0);
  } // SECTION

  SECTION("Dimension mismatch") {
    Raster a = factory.create(spec_a, RasterFormat::eInteger, { });
    Raster b = factory.create(RasterSpecification::validate(1, 4, 3), RasterFormat::eInteger, { });
    std::array<Raster, 2> rasters = { a, b };
    REQUIRE_THROWS_MATCHES(factory.create(rasters), 
      ConfigError, has_code(ErrorCode::eInvalidDimension));
  } // SECTION

  SECTION("Empty input") {
    REQUIRE_THROWS_MATCHES(factory.create(std::span<const Raster>()), 
      ConfigError, has_code(ErrorCode::eEmptyOthersCollection));
  } // SECTION
}
