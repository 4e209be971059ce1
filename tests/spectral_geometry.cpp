#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_predicate.hpp>
#include <spectral/core/exception.hpp>
#include <spectral/core/geometry.hpp>
#include <spectral/core/spectral_geometry.hpp>
#include <array>
#include <thread>
#include <vector>

using namespace spc;

auto has_code(ErrorCode code) {
  return Catch::Matchers::Predicate<ConfigError>(
    [code](const ConfigError &e) { return e.code() == code; }, 
    fmt::format("has error code {}", code));
}

Ring square_ring(double size) {
  return { Coordinate(0.0, 0.0, 0.0), Coordinate(size, 0.0, 0.0), 
           Coordinate(size, size, 0.0), Coordinate(0.0, size, 0.0) };
}

RasterMapper unit_mapper() {
  return RasterMapper::from_transformation(RasterMapMode::eValueIsArea, 
    Coordinate(100.0, 50.0, 0.0), eig::Vector3d(2.0, 2.0, 1.0));
}

TEST_CASE("Spectral geometry builder") {
  SpectralGeometryBuilder builder;

  SECTION("Build from specification") {
    SpectralGeometryRequest request = {
      .shell  = square_ring(10.0),
      .raster = RasterSpecification::validate(4, 8, 6, 12)
    };
    auto polygon = builder.build(request);
    CHECK(polygon.band_count() == 4);
    CHECK(polygon.raster().rows() == 8);
    CHECK(polygon.raster().cols() == 6);
    CHECK(polygon.raster().radiometric_resolution(3) == 12);
    CHECK(polygon.shell() == square_ring(10.0));
    CHECK(polygon.holes().empty());
    CHECK(polygon.presentation() == Presentation::grayscale());
    CHECK(!polygon.imaging());
    CHECK(polygon.metadata() == json::object());
  } // SECTION

  SECTION("Reuse supplied raster") {
    Raster raster(RasterSpecification::validate(2, 3, 3), RasterFormat::eInteger);
    raster.set_value(1, 1, 1, 99);

    SpectralGeometryRequest request = { .shell = square_ring(1.0), .raster = raster };
    auto polygon = builder.build(request);
    CHECK(polygon.raster() == raster);
    CHECK(polygon.raster().value(1, 1, 1) == 99);
  } // SECTION

  SECTION("Shell defaults to the raster corners") {
    SpectralGeometryRequest request = {
      .raster = RasterSpecification::validate(1, 5, 10),
      .mapper = unit_mapper()
    };
    auto polygon = builder.build(request);
    REQUIRE(polygon.shell().size() == 4);
    CHECK(polygon.shell() == polygon.raster().coordinates());
    CHECK(polygon.envelope().min().isApprox(Coordinate(100.0, 50.0, 0.0)));
    CHECK(polygon.envelope().max().isApprox(Coordinate(120.0, 60.0, 0.0)));
  } // SECTION

  SECTION("Boundary from geometry") {
    GeometryFactory factory;
    auto geometry = factory.create_polygon(square_ring(4.0), { square_ring(1.0) }, {{ "name", "field" }});

    SpectralGeometryRequest request = {
      .geometry = geometry,
      .raster   = RasterSpecification::validate(1, 2, 2)
    };
    auto polygon = builder.build(request);
    CHECK(polygon.shell() == geometry.shell);
    CHECK(polygon.holes() == geometry.holes);
    CHECK(polygon.metadata() == geometry.metadata);
    CHECK(polygon.polygon() == geometry);
  } // SECTION

  SECTION("Explicit shell takes precedence over geometry") {
    SpectralGeometryRequest request = {
      .geometry = Polygon { square_ring(4.0) },
      .shell    = square_ring(2.0),
      .raster   = RasterSpecification::validate(1, 2, 2)
    };
    CHECK(builder.build(request).shell() == square_ring(2.0));
  } // SECTION

  SECTION("Attached fields") {
    json metadata = {{ "source", "test" }, { "id", 7 }};
    SpectralGeometryRequest request = {
      .shell        = square_ring(1.0),
      .raster       = RasterSpecification::validate(3, 2, 2),
      .presentation = Presentation::true_color(2, 1, 0),
      .metadata     = metadata
    };
    auto polygon = builder.build(request);
    CHECK(polygon.presentation() == Presentation::true_color(2, 1, 0));
    CHECK(polygon.metadata() == metadata);
  } // SECTION

  SECTION("Missing raster") {
    SpectralGeometryRequest request = { .shell = square_ring(1.0) };
    try {
      builder.build(request);
      FAIL("expected ConfigError");
    } catch (const ConfigError &e) {
      CHECK(e.code() == ErrorCode::eNullArgument);
      CHECK(e.field() == "raster");
    }
  } // SECTION

  SECTION("Missing boundary") {
    SpectralGeometryRequest request = { .raster = RasterSpecification::validate(1, 2, 2) };
    REQUIRE_THROWS_MATCHES(builder.build(request),
      ConfigError, has_code(ErrorCode::eNullArgument));
  } // SECTION

  SECTION("Empty shell") {
    SpectralGeometryRequest request = {
      .shell  = Ring(),
      .raster = RasterSpecification::validate(1, 2, 2)
    };
    REQUIRE_THROWS_MATCHES(builder.build(request),
      ConfigError, has_code(ErrorCode::eEmptyShell));
  } // SECTION

  SECTION("Empty hole") {
    SpectralGeometryRequest request = {
      .shell  = square_ring(1.0),
      .holes  = { Ring() },
      .raster = RasterSpecification::validate(1, 2, 2)
    };
    REQUIRE_THROWS_MATCHES(builder.build(request),
      ConfigError, has_code(ErrorCode::eEmptyShell));
  } // SECTION

  SECTION("Raster without bands") {
    SpectralGeometryRequest request = { .shell = square_ring(1.0), .raster = Raster() };
    REQUIRE_THROWS_MATCHES(builder.build(request),
      ConfigError, has_code(ErrorCode::eInvalidBandCount));
  } // SECTION

  SECTION("Presentation refers to missing bands") {
    SpectralGeometryRequest request = {
      .shell        = square_ring(1.0),
      .raster       = RasterSpecification::validate(2, 2, 2),
      .presentation = Presentation::true_color()
    };
    REQUIRE_THROWS_MATCHES(builder.build(request),
      ConfigError, has_code(ErrorCode::eIncompatiblePresentationConfig));
  } // SECTION

  SECTION("Concurrent builds") {
    SpectralGeometryRequest request = {
      .shell  = square_ring(1.0),
      .raster = RasterSpecification::validate(2, 16, 16)
    };
    
    constexpr uint n_threads = 4;
    std::vector<std::optional<SpectralPolygon>> results(n_threads);
    std::vector<std::thread> threads;
    for (uint i = 0; i < n_threads; ++i)
      threads.emplace_back([&, i] { results[i] = builder.build(request); });
    for (auto &t : threads)
      t.join();
    for (const auto &r : results)
      CHECK(*r == *results[0]);
  } // SECTION
}

TEST_CASE("Spectral geometry clone") {
  SpectralGeometryBuilder builder;
  SpectralGeometryRequest request = {
    .shell    = square_ring(1.0),
    .raster   = RasterSpecification::validate(2, 2, 2),
    .metadata = {{ "key", "value" }}
  };
  auto source = builder.build(request);

  SECTION("Deep copy") {
    auto clone = builder.build(source);
    CHECK(clone == source);
    CHECK(&clone.raster() != &source.raster());
  } // SECTION

  SECTION("Overrides") {
    auto clone = builder.build(source, { .shell = square_ring(3.0), .metadata = json::object() });
    CHECK(clone.shell() == square_ring(3.0));
    CHECK(clone.metadata().empty());
    CHECK(clone.raster() == source.raster());
  } // SECTION
}

TEST_CASE("Spectral geometry merge") {
  SpectralGeometryBuilder builder;

  Raster a(RasterSpecification::validate(2, 3, 3, 8), RasterFormat::eInteger);
  Raster b(RasterSpecification::validate(1, 3, 3, 16), RasterFormat::eInteger);
  a.set_value(0, 0, 0, 1);
  b.set_value(0, 0, 0, 2);

  auto first  = builder.build({ .shell    = square_ring(1.0), 
                                .raster   = a, 
                                .presentation = Presentation::inverted_grayscale(),
                                .metadata = {{ "first", true }} });
  auto second = builder.build({ .shell = square_ring(2.0), .raster = b });

  SECTION("Bands concatenate in order") {
    std::array<SpectralPolygon, 2> others = { first, second };
    auto merged = builder.merge(others);
    CHECK(merged.band_count() == 3);
    CHECK(merged.raster().radiometric_resolutions() == std::vector<uint> { 8, 8, 16 });
    CHECK(merged.raster().value(0, 0, 0) == 1);
    CHECK(merged.raster().value(0, 0, 2) == 2);
  } // SECTION

  SECTION("First polygon's fields are adopted") {
    std::array<SpectralPolygon, 2> others = { first, second };
    auto merged = builder.merge(others);
    CHECK(merged.shell() == square_ring(1.0));
    CHECK(merged.presentation() == Presentation::inverted_grayscale());
    CHECK(merged.metadata() == json {{ "first", true }});
  } // SECTION

  SECTION("Imaging override") {
    ImagingDevice device({ .mission = "Sentinel", .mission_number = 2, .instrument = "MSI" });
    RasterImaging imaging({ .device = device });

    std::array<SpectralPolygon, 2> others = { first, second };
    auto merged = builder.merge(others, { .imaging = imaging });
    REQUIRE(merged.imaging());
    CHECK(merged.imaging()->device().name() == "Sentinel2 MSI");
  } // SECTION

  SECTION("Empty collection") {
    REQUIRE_THROWS_MATCHES(builder.merge(std::span<const SpectralPolygon>()),
      ConfigError, has_code(ErrorCode::eEmptyOthersCollection));
  } // SECTION
}

TEST_CASE("Geometry factory adapter") {
  GeometryFactory factory;

  SECTION("Default builder is registered on first use") {
    CHECK(!factory.has_extension<SpectralGeometryBuilder>());
    auto builder = spectral_factory(factory);
    CHECK(factory.has_extension<SpectralGeometryBuilder>());
    CHECK(builder == default_spectral_builder());
    CHECK(spectral_factory(factory) == builder);
  } // SECTION

  SECTION("Registered builder is used") {
    auto custom = std::make_shared<SpectralGeometryBuilder>(std::make_shared<MemoryRasterFactory>());
    factory.set_extension(custom);
    CHECK(spectral_factory(factory) == custom);
    CHECK(factory.extension<SpectralGeometryBuilder>() == custom);
  } // SECTION

  SECTION("Failed registration leaves no entry") {
    auto make_invalid = [] { return std::make_shared<SpectralGeometryBuilder>(nullptr); };
    REQUIRE_THROWS_MATCHES(factory.ensure_extension<SpectralGeometryBuilder>(make_invalid),
      ConfigError, has_code(ErrorCode::eNullArgument));
    CHECK(!factory.has_extension<SpectralGeometryBuilder>());
    CHECK(factory.extension<SpectralGeometryBuilder>() == nullptr);

    auto builder = spectral_factory(factory);
    CHECK(builder == default_spectral_builder());
  } // SECTION

  SECTION("Create through factory") {
    auto polygon = create_spectral_polygon(factory, {
      .shell  = square_ring(5.0),
      .raster = RasterSpecification::validate(3, 4, 4)
    });
    CHECK(polygon.band_count() == 3);
  } // SECTION

  SECTION("Plain polygons") {
    REQUIRE_THROWS_MATCHES(factory.create_polygon(Ring()),
      ConfigError, has_code(ErrorCode::eEmptyShell));
    auto p = factory.create_polygon(square_ring(1.0), { }, json());
    CHECK(p.metadata == json::object());
  } // SECTION
}
