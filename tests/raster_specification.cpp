#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <spectral/core/exception.hpp>
#include <spectral/core/raster.hpp>
#include <array>
#include <vector>

using namespace spc;

auto has_code(ErrorCode code) {
  return Catch::Matchers::Predicate<ConfigError>(
    [code](const ConfigError &e) { return e.code() == code; }, 
    fmt::format("has error code {}", code));
}

TEST_CASE("Raster specification") {
  SECTION("Uniform resolution") {
    auto spec = RasterSpecification::validate(3, 100, 200, 8);
    CHECK(spec.band_count() == 3);
    CHECK(spec.rows() == 100);
    CHECK(spec.cols() == 200);
    CHECK(spec.radiometric_resolutions().size() == 3);
    CHECK(spec.uniform_radiometric_resolution() == 8u);
  } // SECTION

  SECTION("Per-band resolutions") {
    std::vector<int> resolutions = { 8, 12, 16 };
    auto spec = RasterSpecification::validate(3, 10, 10, resolutions);
    CHECK(spec.radiometric_resolution(0) == 8);
    CHECK(spec.radiometric_resolution(1) == 12);
    CHECK(spec.radiometric_resolution(2) == 16);
    CHECK(!spec.uniform_radiometric_resolution());
  } // SECTION

  SECTION("Resolution bounds") {
    CHECK_NOTHROW(RasterSpecification::validate(1, 1, 1, 1));
    CHECK_NOTHROW(RasterSpecification::validate(1, 1, 1, 64));
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(1, 1, 1, 0), 
      ConfigError, has_code(ErrorCode::eInvalidRadiometricResolution));
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(1, 1, 1, 65), 
      ConfigError, has_code(ErrorCode::eInvalidRadiometricResolution));
  } // SECTION

  SECTION("Empty dimensions are valid") {
    auto spec = RasterSpecification::validate(1, 0, 0);
    CHECK(spec.rows() == 0);
    CHECK(spec.cols() == 0);
  } // SECTION

  SECTION("Band count") {
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(0, 10, 10, 8), 
      ConfigError, has_code(ErrorCode::eInvalidBandCount));
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(-3, 10, 10, 8), 
      ConfigError, has_code(ErrorCode::eInvalidBandCount));
  } // SECTION

  SECTION("Negative dimensions") {
    try {
      RasterSpecification::validate(1, -1, 10, 8);
      FAIL("expected ConfigError");
    } catch (const ConfigError &e) {
      CHECK(e.code() == ErrorCode::eInvalidDimension);
      CHECK(e.field() == "rows");
    }
    try {
      RasterSpecification::validate(1, 10, -1, 8);
      FAIL("expected ConfigError");
    } catch (const ConfigError &e) {
      CHECK(e.code() == ErrorCode::eInvalidDimension);
      CHECK(e.field() == "cols");
    }
  } // SECTION

  SECTION("Band count is checked before dimensions") {
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(0, -1, -1, 8), 
      ConfigError, has_code(ErrorCode::eInvalidBandCount));
  } // SECTION

  SECTION("Resolution list length") {
    std::vector<int> resolutions = { 8, 8 };
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(3, 10, 10, resolutions), 
      ConfigError, has_code(ErrorCode::eBandResolutionMismatch));
  } // SECTION

  SECTION("Resolution list bounds") {
    std::array<int, 3> resolutions = { 8, 70, 8 };
    REQUIRE_THROWS_MATCHES(RasterSpecification::validate(3, 10, 10, resolutions), 
      ConfigError, has_code(ErrorCode::eInvalidRadiometricResolution));
  } // SECTION

  SECTION("Error payload") {
    std::vector<int> resolutions = { 8 };
    try {
      RasterSpecification::validate(2, 10, 10, resolutions);
      FAIL("expected ConfigError");
    } catch (const ConfigError &e) {
      CHECK(e.get("expected") == "2");
      CHECK(e.get("actual") == "1");
    }
  } // SECTION
}
