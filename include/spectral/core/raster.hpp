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

#include <spectral/core/json.hpp>
#include <spectral/core/math.hpp>
#include <spectral/core/utility.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <variant>
#include <vector>

namespace spc {
  // Whether a raster value describes the area of a cell, or the coordinate at its corner
  enum class RasterMapMode { eValueIsArea, eValueIsCoordinate };

  // Sample storage kind of a raster
  enum class RasterFormat  { eInteger, eFloat };

  /* RasterCoordinate.
     Pairs a raster cell address with its model-space coordinate. */
  struct RasterCoordinate {
    int        row_index    = 0;
    int        column_index = 0;
    Coordinate coordinate   = Coordinate::Zero();

  public:
    RasterCoordinate() = default;
    RasterCoordinate(int row_index, int column_index, const Coordinate &coordinate);

    bool operator==(const RasterCoordinate &o) const {
      return row_index == o.row_index && column_index == o.column_index && coordinate == o.coordinate;
    }
  };

  /* RasterMapper.
     Affine transformation between raster grid indices and model-space coordinates.
     Columns map along the first axis and rows along the second; a mapper
     never mixes the z axis into x/y. */
  class RasterMapper {
    RasterMapMode m_mode    = RasterMapMode::eValueIsArea;
    eig::Matrix4d m_trf     = eig::Matrix4d::Identity(); // raster -> model
    eig::Matrix4d m_trf_inv = eig::Matrix4d::Identity(); // model  -> raster

  public:
    // Identity mapper; raster indices are model coordinates
    RasterMapper();
    RasterMapper(RasterMapMode mode, const eig::Matrix4d &transformation);

    // Shorthand for an axis-aligned mapper; scale is the cell size along x/y/z
    static RasterMapper from_transformation(RasterMapMode     mode,
                                            const Coordinate &translation,
                                            const eig::Vector3d &scale);

    // Least-squares fit of an affine mapper to known raster/model coordinate pairs;
    // requires at least two distinct row and two distinct column indices
    static RasterMapper from_coordinates(RasterMapMode mode, std::span<const RasterCoordinate> coordinates);

  public: // Mapping
    Coordinate map_coordinate(double row_index, double column_index) const;
    Coordinate map_coordinate(double row_index, double column_index, RasterMapMode mode) const;

    // Return the fractional (row, column) of a model coordinate
    eig::Vector2d    map_raster(const Coordinate &c) const;
    eig::Vector2d    map_raster(const Coordinate &c, RasterMapMode mode) const;
    RasterCoordinate map_raster_cell(const Coordinate &c) const;

  public: // Queries
    RasterMapMode        mode()                    const { return m_mode;    }
    const eig::Matrix4d &geometry_transformation() const { return m_trf;     }
    const eig::Matrix4d &raster_transformation()   const { return m_trf_inv; }

    Coordinate    translation()   const { return m_trf.block<3, 1>(0, 3); }
    eig::Vector3d column_vector() const { return map_coordinate(0, 1) - map_coordinate(0, 0); }
    eig::Vector3d row_vector()    const { return map_coordinate(1, 0) - map_coordinate(0, 0); }
    double        column_size()   const { return column_vector().norm(); }
    double        row_size()      const { return row_vector().norm();    }

    bool operator==(const RasterMapper &o) const {
      return m_mode == o.m_mode && m_trf == o.m_trf;
    }
  };

  /* RasterSpecification.
     Validated shape of a raster prior to its realization; construct
     through RasterSpecification::validate(...). */
  class RasterSpecification {
    uint              m_band_count = 1;
    uint              m_rows       = 0;
    uint              m_cols       = 0;
    std::vector<uint> m_resolutions = { 8 };

  public:
    // Default specification; a single empty band of 8 bits
    RasterSpecification() = default;

    // Uniform radiometric resolution over all bands
    static RasterSpecification validate(int band_count, int rows, int cols, int radiometric_resolution = 8);

    // Per-band radiometric resolutions; the list length must equal the band count
    static RasterSpecification validate(int band_count, int rows, int cols, std::span<const int> radiometric_resolutions);

    uint band_count() const { return m_band_count; }
    uint rows()       const { return m_rows;       }
    uint cols()       const { return m_cols;       }

    std::span<const uint> radiometric_resolutions() const { return m_resolutions; }
    uint radiometric_resolution(uint band) const;

    // Uniform resolution if all bands share one
    std::optional<uint> uniform_radiometric_resolution() const;

    bool operator==(const RasterSpecification &o) const = default;
  };

  /* Raster.
     In-memory multi-band raster; rows x columns x bands, with an independent
     radiometric resolution per band. Copies are deep. */
  class Raster {
  public:
    using IntBand   = eig::ArrayXXu64;
    using FloatBand = eig::ArrayXXd_r;
    using BandData  = std::variant<IntBand, FloatBand>;

    struct Band {
      uint     radiometric_resolution;
      BandData data;

      bool operator==(const Band &o) const;
    };

  private:
    RasterFormat                m_format = RasterFormat::eInteger;
    uint                        m_rows   = 0;
    uint                        m_cols   = 0;
    std::vector<Band>           m_bands;
    std::optional<RasterMapper> m_mapper;

  public: // Boilerplate
    Raster() = default;
    Raster(const RasterSpecification &spec, RasterFormat format, std::optional<RasterMapper> mapper = { });
    Raster(RasterFormat format, uint rows, uint cols, std::vector<Band> bands, std::optional<RasterMapper> mapper = { });

    bool operator==(const Raster &o) const;

  public: // Pixel access
    std::uint64_t value(uint row, uint col, uint band) const;
    void          set_value(uint row, uint col, uint band, std::uint64_t v);
    double        float_value(uint row, uint col, uint band) const;
    void          set_float_value(uint row, uint col, uint band, double v);

    // Largest representable integer sample of a band
    std::uint64_t max_value(uint band) const;

  public: // Queries
    RasterFormat format()     const { return m_format;        }
    uint         band_count() const { return static_cast<uint>(m_bands.size()); }
    uint         rows()       const { return m_rows;          }
    uint         cols()       const { return m_cols;          }

    const std::optional<RasterMapper> &mapper() const { return m_mapper; }
    const std::vector<Band>           &bands()  const { return m_bands;  }
    const Band                        &band(uint i) const;

    uint              radiometric_resolution(uint band) const;
    std::vector<uint> radiometric_resolutions() const;

    // Shape of the raster as a validated specification; a raster without
    // bands reports the default specification
    RasterSpecification specification() const;

    // Four model-space corners of the raster, in ring order starting at the
    // origin cell; empty if the raster has no mapper
    Ring coordinates() const;

  private:
    void check_address(uint row, uint col, uint band) const;
  };

  /* RasterFactory.
     Raster collaborator; realizes rasters from validated specifications,
     and combines existing rasters. */
  class RasterFactory {
  public:
    virtual ~RasterFactory() = default;

    virtual Raster create(const RasterSpecification  &spec,
                          RasterFormat                format,
                          std::optional<RasterMapper> mapper) const = 0;

    // Concatenate the bands of all rasters in order; rasters must share dimensions
    virtual Raster create(std::span<const Raster> rasters) const = 0;
  };

  // Default collaborator producing zero-initialized in-memory rasters
  class MemoryRasterFactory : public RasterFactory {
  public:
    Raster create(const RasterSpecification  &spec,
                  RasterFormat                format,
                  std::optional<RasterMapper> mapper) const override;
    Raster create(std::span<const Raster> rasters) const override;
  };

  /* json (de)serialization for raster configuration types */
  void from_json(const json &js, RasterMapMode &m);
  void to_json(json &js, const RasterMapMode &m);
  void from_json(const json &js, RasterFormat &f);
  void to_json(json &js, const RasterFormat &f);
  void from_json(const json &js, RasterSpecification &spec);
  void to_json(json &js, const RasterSpecification &spec);
  void from_json(const json &js, RasterMapper &mapper);
  void to_json(json &js, const RasterMapper &mapper);
} // namespace spc

template<>
struct fmt::formatter<spc::RasterMapMode> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::RasterMapMode& ty, fmt_context_ty& ctx) const {
    std::string s;
    switch (ty) {
      case spc::RasterMapMode::eValueIsArea       : s = "value_is_area";       break;
      case spc::RasterMapMode::eValueIsCoordinate : s = "value_is_coordinate"; break;
      default                                     : s = "undefined";           break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};

template<>
struct fmt::formatter<spc::RasterFormat> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::RasterFormat& ty, fmt_context_ty& ctx) const {
    std::string s;
    switch (ty) {
      case spc::RasterFormat::eInteger : s = "integer";   break;
      case spc::RasterFormat::eFloat   : s = "float";     break;
      default                          : s = "undefined"; break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};
