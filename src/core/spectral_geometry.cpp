// Copyright (C) 2024 Mark van de Ruit, Delft University of Technology.
// 
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
// 
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
// 
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

#include <spectral/core/spectral_geometry.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>
#include <iterator>

namespace spc {
  namespace detail {
    void check_boundary(const Ring &shell, std::span<const Ring> holes) {
      if (shell.empty())
        throw error::empty_shell("shell");
      if (std::ranges::any_of(holes, [](const Ring &r) { return r.empty(); }))
        throw error::empty_shell("hole");
    }
  } // namespace detail

  SpectralGeometryBuilder::SpectralGeometryBuilder()
  : m_raster_factory(std::make_shared<MemoryRasterFactory>()) { }

  SpectralGeometryBuilder::SpectralGeometryBuilder(std::shared_ptr<const RasterFactory> raster_factory)
  : m_raster_factory(std::move(raster_factory)) {
    if (!m_raster_factory)
      throw error::null_argument("raster_factory");
  }

  SpectralPolygon SpectralGeometryBuilder::assemble(Ring                         shell,
                                                    std::vector<Ring>            holes,
                                                    Raster                       raster,
                                                    Presentation                 presentation,
                                                    std::optional<RasterImaging> imaging,
                                                    json                         metadata) const {
    spc_trace();

    detail::check_boundary(shell, holes);
    if (raster.band_count() < 1)
      throw error::invalid_band_count(raster.band_count());
    if (presentation.referenced_band_count() > raster.band_count())
      throw error::incompatible_presentation_config(fmt::format("{}", presentation.model()),
        fmt::format("presentation refers to {} bands, raster holds {}", 
          presentation.referenced_band_count(), raster.band_count()));

    SpectralPolygon polygon;
    polygon.m_shell        = std::move(shell);
    polygon.m_holes        = std::move(holes);
    polygon.m_raster       = std::move(raster);
    polygon.m_presentation = std::move(presentation);
    polygon.m_imaging      = std::move(imaging);
    polygon.m_metadata     = metadata_or_empty(metadata);
    return polygon;
  }

  SpectralPolygon SpectralGeometryBuilder::build(const SpectralGeometryRequest &request) const {
    spc_trace();

    // 1. Resolve raster; reuse a supplied raster, or realize one from a specification
    Raster raster = request.raster | visit {
      [](const std::monostate &) -> Raster { throw error::null_argument("raster"); },
      [](const Raster &r)        -> Raster { return r; },
      [&](const RasterSpecification &spec) -> Raster {
        return m_raster_factory->create(spec, request.format, request.mapper);
      }
    };

    // 2. Resolve boundary; explicit shell, then geometry, then the raster's corners
    Ring              shell;
    std::vector<Ring> holes = request.holes;
    if (request.shell) {
      shell = *request.shell;
    } else if (request.geometry) {
      shell = request.geometry->shell;
      if (holes.empty())
        holes = request.geometry->holes;
    } else {
      if (!raster.mapper())
        throw error::null_argument("shell");
      shell = raster.coordinates();
    }

    // 3. Metadata; supplied, else geometry's, else empty
    json metadata = request.metadata;
    if (metadata.is_null() && request.geometry)
      metadata = request.geometry->metadata;

    return assemble(std::move(shell),
                    std::move(holes),
                    std::move(raster),
                    request.presentation.value_or(Presentation::grayscale()),
                    request.imaging,
                    std::move(metadata));
  }

  SpectralPolygon SpectralGeometryBuilder::build(const SpectralPolygon &other, const SpectralGeometryOverrides &overrides) const {
    spc_trace();
    return assemble(overrides.shell.value_or(other.shell()),
                    overrides.holes.value_or(other.holes()),
                    Raster(other.raster()),
                    overrides.presentation.value_or(other.presentation()),
                    overrides.imaging ? overrides.imaging : other.imaging(),
                    overrides.metadata.value_or(other.metadata()));
  }

  SpectralPolygon SpectralGeometryBuilder::merge(std::span<const SpectralPolygon> others, const SpectralGeometryOverrides &overrides) const {
    spc_trace();
    if (others.empty())
      throw error::empty_others_collection();

    std::vector<Raster> rasters;
    rasters.reserve(others.size());
    std::ranges::transform(others, std::back_inserter(rasters), &SpectralPolygon::raster);

    const auto &first = others.front();
    return assemble(overrides.shell.value_or(first.shell()),
                    overrides.holes.value_or(first.holes()),
                    m_raster_factory->create(rasters),
                    overrides.presentation.value_or(first.presentation()),
                    overrides.imaging,
                    overrides.metadata.value_or(first.metadata()));
  }

  std::shared_ptr<const SpectralGeometryBuilder> default_spectral_builder() {
    static auto builder = std::make_shared<const SpectralGeometryBuilder>();
    return builder;
  }

  std::shared_ptr<const SpectralGeometryBuilder> spectral_factory(GeometryFactory &factory) {
    return factory.ensure_extension<SpectralGeometryBuilder>(default_spectral_builder);
  }

  SpectralPolygon create_spectral_polygon(GeometryFactory &factory, const SpectralGeometryRequest &request) {
    return spectral_factory(factory)->build(request);
  }
} // namespace spc
