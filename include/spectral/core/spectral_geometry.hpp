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

#pragma once

#include <spectral/core/geometry.hpp>
#include <spectral/core/imaging.hpp>
#include <spectral/core/json.hpp>
#include <spectral/core/presentation.hpp>
#include <spectral/core/raster.hpp>
#include <memory>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace spc {
  /* SpectralPolygon.
     Polygon boundary bound to a co-registered multi-band raster, together
     with the presentation of its bands, optional imaging metadata, and an
     opaque metadata map. Immutable; created by SpectralGeometryBuilder only,
     and owning its raster exclusively. Copies are deep. */
  class SpectralPolygon {
    Ring                         m_shell;
    std::vector<Ring>            m_holes;
    Raster                       m_raster;
    Presentation                 m_presentation;
    std::optional<RasterImaging> m_imaging;
    json                         m_metadata = json::object();

    SpectralPolygon() = default;

    friend class SpectralGeometryBuilder;

  public: // Queries
    const Ring                         &shell()        const { return m_shell;        }
    const std::vector<Ring>            &holes()        const { return m_holes;        }
    const Raster                       &raster()       const { return m_raster;       }
    const Presentation                 &presentation() const { return m_presentation; }
    const std::optional<RasterImaging> &imaging()      const { return m_imaging;      }
    const json                         &metadata()     const { return m_metadata;     }

    uint     band_count() const { return m_raster.band_count(); }
    Envelope envelope()   const { return envelope_of(m_shell);  }

    // Boundary and metadata as a plain polygon
    Polygon polygon() const { return { m_shell, m_holes, m_metadata }; }

    bool operator==(const SpectralPolygon &o) const = default;
  };

  /* SpectralGeometryRequest.
     Complete description of a spectral polygon to build. Every field is
     optional but the raster; the builder resolves omitted fields. */
  struct SpectralGeometryRequest {
    using RasterSource = std::variant<std::monostate, Raster, RasterSpecification>;

    // Boundary; an explicit shell takes precedence over a geometry, and
    // absent both the shell defaults to the raster's four corners
    std::optional<Polygon> geometry;
    std::optional<Ring>    shell;
    std::vector<Ring>      holes;

    // Raster to reuse, or specification of a raster to realize; format and
    // mapper only apply to realized rasters
    RasterSource                raster;
    RasterFormat                format = RasterFormat::eInteger;
    std::optional<RasterMapper> mapper;

    std::optional<Presentation>  presentation; // grayscale if omitted
    std::optional<RasterImaging> imaging;
    json                         metadata;     // geometry's metadata if null
  };

  /* SpectralGeometryOverrides.
     Fields replacing those adopted from source polygons when cloning or merging. */
  struct SpectralGeometryOverrides {
    std::optional<Ring>              shell;
    std::optional<std::vector<Ring>> holes;
    std::optional<Presentation>      presentation;
    std::optional<RasterImaging>     imaging;
    std::optional<json>              metadata;
  };

  /* SpectralGeometryBuilder.
     Single construction path for spectral polygons; resolves the raster and
     boundary of a request, attaches presentation, imaging and metadata, and
     performs all cross-field validation. A failing build throws ConfigError
     and produces nothing. Builders are stateless, and may be shared across
     threads. */
  class SpectralGeometryBuilder {
    std::shared_ptr<const RasterFactory> m_raster_factory;

  public:
    // Builder over the in-memory raster factory
    SpectralGeometryBuilder();

    // Builder over a specific raster factory
    explicit SpectralGeometryBuilder(std::shared_ptr<const RasterFactory> raster_factory);

  public: // Construction
    // Build a new polygon from a request
    SpectralPolygon build(const SpectralGeometryRequest &request) const;

    // Build a deep copy of an existing polygon, with optional overrides
    SpectralPolygon build(const SpectralPolygon &other, const SpectralGeometryOverrides &overrides = { }) const;

    // Build one polygon whose raster concatenates the bands of all others in
    // order; boundary, presentation and metadata are adopted from the first
    // polygon unless overridden, and imaging is only attached if overridden
    SpectralPolygon merge(std::span<const SpectralPolygon> others, const SpectralGeometryOverrides &overrides = { }) const;

  private:
    // Validate and assemble; all inputs are resolved by the caller
    SpectralPolygon assemble(Ring                         shell,
                             std::vector<Ring>            holes,
                             Raster                       raster,
                             Presentation                 presentation,
                             std::optional<RasterImaging> imaging,
                             json                         metadata) const;
  };

  // Process-wide default builder over the in-memory raster factory
  std::shared_ptr<const SpectralGeometryBuilder> default_spectral_builder();

  // Builder registered as extension of a geometry factory; the process-wide
  // default builder is registered on first use
  std::shared_ptr<const SpectralGeometryBuilder> spectral_factory(GeometryFactory &factory);

  // Build a spectral polygon through the builder registered on a geometry factory
  SpectralPolygon create_spectral_polygon(GeometryFactory &factory, const SpectralGeometryRequest &request);

  /* json (de)serialization for build requests; polygons serialize to a summary only */
  void from_json(const json &js, SpectralGeometryRequest &r);
  void to_json(json &js, const SpectralGeometryRequest &r);
  void to_json(json &js, const SpectralPolygon &p);
} // namespace spc
