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

#include <spectral/core/raster.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>

namespace spc {
  namespace detail {
    constexpr static uint min_radiometric_resolution = 1;
    constexpr static uint max_radiometric_resolution = 64;

    constexpr bool is_valid_resolution(long long r) {
      return r >= min_radiometric_resolution && r <= max_radiometric_resolution;
    }

    constexpr std::uint64_t max_value_of(uint resolution) {
      return resolution >= 64
        ? std::numeric_limits<std::uint64_t>::max()
        : (std::uint64_t(1) << resolution) - 1;
    }

    // Round a float sample into [0, max_value] without passing through a signed type
    inline std::uint64_t saturate(double v, std::uint64_t max_value) {
      guard(!std::isnan(v) && v > 0.0, 0);
      guard(v < static_cast<double>(max_value), max_value);
      return std::min(static_cast<std::uint64_t>(std::round(v)), max_value);
    }

    // Row-major linear index of a matrix entry; reported as payload on invalid transformations
    constexpr long long entry_index(uint row, uint col) {
      return static_cast<long long>(row * 4 + col);
    }

    // Validate the shape of a raster-to-model transformation; only transformations
    // that keep the z axis separate from x/y are supported
    void check_transformation(const eig::Matrix4d &trf) {
      for (uint i = 0; i < 4; ++i)
        for (uint j = 0; j < 4; ++j)
          if (!std::isfinite(trf(i, j)))
            throw error::invalid_dimension("transformation", entry_index(i, j));

      if (trf(3, 0) != 0.0 || trf(3, 1) != 0.0 || trf(3, 2) != 0.0 || trf(3, 3) != 1.0)
        throw error::invalid_dimension("transformation", entry_index(3, 3));
      if (trf(0, 0) == 0.0)
        throw error::invalid_dimension("transformation", entry_index(0, 0));
      if (trf(1, 1) == 0.0)
        throw error::invalid_dimension("transformation", entry_index(1, 1));
      if (trf(2, 0) != 0.0 || trf(2, 1) != 0.0)
        throw error::invalid_dimension("transformation", entry_index(2, 0));
      if (trf(0, 2) != 0.0 || trf(1, 2) != 0.0)
        throw error::invalid_dimension("transformation", entry_index(0, 2));
      if (trf.block<2, 2>(0, 0).determinant() == 0.0)
        throw error::invalid_dimension("transformation", entry_index(0, 1));
    }

    // Invert the x/y part of a transformation; z maps through unchanged, as
    // the z scale of a mapper may legitimately be zero
    eig::Matrix4d invert_transformation(const eig::Matrix4d &trf) {
      eig::Matrix2d a_inv = trf.block<2, 2>(0, 0).inverse();

      eig::Matrix4d inv = eig::Matrix4d::Identity();
      inv.block<2, 2>(0, 0) = a_inv;
      inv.block<2, 1>(0, 3) = -a_inv * trf.block<2, 1>(0, 3);
      inv(2, 2) = 1.0;
      inv(2, 3) = 0.0;
      return inv;
    }
  } // namespace detail

  RasterCoordinate::RasterCoordinate(int row_index, int column_index, const Coordinate &coordinate)
  : row_index(row_index), column_index(column_index), coordinate(coordinate) {
    if (row_index < 0)
      throw error::invalid_dimension("row_index", row_index);
    if (column_index < 0)
      throw error::invalid_dimension("column_index", column_index);
  }

  /* RasterMapper */

  RasterMapper::RasterMapper() = default;

  RasterMapper::RasterMapper(RasterMapMode mode, const eig::Matrix4d &transformation)
  : m_mode(mode), m_trf(transformation) {
    spc_trace();
    detail::check_transformation(m_trf);
    m_trf_inv = detail::invert_transformation(m_trf);
  }

  RasterMapper RasterMapper::from_transformation(RasterMapMode        mode,
                                                 const Coordinate    &translation,
                                                 const eig::Vector3d &scale) {
    spc_trace();
    if (!is_valid(translation))
      throw error::invalid_dimension("translation", 0);
    if (!scale.allFinite() || scale.x() == 0.0)
      throw error::invalid_dimension("scale_x", 0);
    if (scale.y() == 0.0)
      throw error::invalid_dimension("scale_y", 0);

    eig::Matrix4d trf = eig::Matrix4d::Identity();
    trf(0, 0) = scale.x();
    trf(1, 1) = scale.y();
    trf(2, 2) = scale.z();
    trf.block<3, 1>(0, 3) = translation;
    return RasterMapper(mode, trf);
  }

  RasterMapper RasterMapper::from_coordinates(RasterMapMode mode, std::span<const RasterCoordinate> coordinates) {
    spc_trace();

    std::set<int> rows, cols;
    for (const auto &c : coordinates) {
      rows.insert(c.row_index);
      cols.insert(c.column_index);
    }
    if (cols.size() < 2)
      throw error::invalid_dimension("coordinates", static_cast<long long>(cols.size()));
    if (rows.size() < 2)
      throw error::invalid_dimension("coordinates", static_cast<long long>(rows.size()));

    // Set up the linear system x = a * col + b * row + c, and similarly for y
    eig::MatrixXd a(coordinates.size(), 3);
    eig::VectorXd bx(coordinates.size()), by(coordinates.size());
    for (size_t i = 0; i < coordinates.size(); ++i) {
      const auto &c = coordinates[i];
      a.row(i) << static_cast<double>(c.column_index), static_cast<double>(c.row_index), 1.0;
      bx[i] = c.coordinate.x();
      by[i] = c.coordinate.y();
    }

    // Least-squares solution in both dimensions
    auto qr = a.colPivHouseholderQr();
    eig::Vector3d rx = qr.solve(bx);
    eig::Vector3d ry = qr.solve(by);

    eig::Matrix4d trf = eig::Matrix4d::Zero();
    trf(0, 0) = rx[0];
    trf(0, 1) = rx[1];
    trf(0, 3) = rx[2];
    trf(1, 0) = ry[0];
    trf(1, 1) = ry[1];
    trf(1, 3) = ry[2];
    trf(3, 3) = 1.0;
    return RasterMapper(mode, trf);
  }

  Coordinate RasterMapper::map_coordinate(double row_index, double column_index) const {
    eig::Vector4d v = m_trf * eig::Vector4d(column_index, row_index, 0.0, 1.0);
    return v.head<3>();
  }

  Coordinate RasterMapper::map_coordinate(double row_index, double column_index, RasterMapMode mode) const {
    guard(mode != m_mode, map_coordinate(row_index, column_index));
    return mode == RasterMapMode::eValueIsArea
      ? map_coordinate(row_index - 0.5, column_index - 0.5)
      : map_coordinate(row_index + 0.5, column_index + 0.5);
  }

  eig::Vector2d RasterMapper::map_raster(const Coordinate &c) const {
    eig::Vector4d v = m_trf_inv * eig::Vector4d(c.x(), c.y(), c.z(), 1.0);
    return { v[1], v[0] };
  }

  eig::Vector2d RasterMapper::map_raster(const Coordinate &c, RasterMapMode mode) const {
    guard(mode != m_mode, map_raster(c));
    eig::Vector2d rc = map_raster(c);
    if (mode == RasterMapMode::eValueIsArea)
      return (rc.array() + 0.5).matrix();
    return (rc.array() - 0.5).matrix();
  }

  RasterCoordinate RasterMapper::map_raster_cell(const Coordinate &c) const {
    eig::Vector2d rc = map_raster(c);
    return RasterCoordinate(static_cast<int>(std::lround(rc[0])),
                            static_cast<int>(std::lround(rc[1])),
                            c);
  }

  /* RasterSpecification */

  RasterSpecification RasterSpecification::validate(int band_count, int rows, int cols, int radiometric_resolution) {
    spc_trace();
    if (band_count < 1)
      throw error::invalid_band_count(band_count);
    if (rows < 0)
      throw error::invalid_dimension("rows", rows);
    if (cols < 0)
      throw error::invalid_dimension("cols", cols);
    if (!detail::is_valid_resolution(radiometric_resolution))
      throw error::invalid_radiometric_resolution(radiometric_resolution);

    RasterSpecification spec;
    spec.m_band_count  = static_cast<uint>(band_count);
    spec.m_rows        = static_cast<uint>(rows);
    spec.m_cols        = static_cast<uint>(cols);
    spec.m_resolutions = std::vector<uint>(band_count, static_cast<uint>(radiometric_resolution));
    return spec;
  }

  RasterSpecification RasterSpecification::validate(int band_count, int rows, int cols, std::span<const int> radiometric_resolutions) {
    spc_trace();
    if (band_count < 1)
      throw error::invalid_band_count(band_count);
    if (rows < 0)
      throw error::invalid_dimension("rows", rows);
    if (cols < 0)
      throw error::invalid_dimension("cols", cols);
    if (radiometric_resolutions.size() != static_cast<size_t>(band_count))
      throw error::band_resolution_mismatch(band_count, radiometric_resolutions.size());
    for (int r : radiometric_resolutions)
      if (!detail::is_valid_resolution(r))
        throw error::invalid_radiometric_resolution(r);

    RasterSpecification spec;
    spec.m_band_count  = static_cast<uint>(band_count);
    spec.m_rows        = static_cast<uint>(rows);
    spec.m_cols        = static_cast<uint>(cols);
    spec.m_resolutions = std::vector<uint>(range_iter(radiometric_resolutions));
    return spec;
  }

  uint RasterSpecification::radiometric_resolution(uint band) const {
    debug::check_expr(band < m_band_count, fmt::format("band index {} out of range", band));
    return m_resolutions[band];
  }

  std::optional<uint> RasterSpecification::uniform_radiometric_resolution() const {
    guard(std::ranges::all_of(m_resolutions, [&](uint r) { return r == m_resolutions.front(); }), { });
    return m_resolutions.front();
  }

  /* Raster */

  bool Raster::Band::operator==(const Band &o) const {
    guard(radiometric_resolution == o.radiometric_resolution, false);
    guard(data.index() == o.data.index(), false);
    return data | visit { [&o](const auto &a) {
      using Ty = std::decay_t<decltype(a)>;
      const auto &b = std::get<Ty>(o.data);
      return a.rows() == b.rows() && a.cols() == b.cols() && (a == b).all();
    }};
  }

  Raster::Raster(const RasterSpecification &spec, RasterFormat format, std::optional<RasterMapper> mapper)
  : m_format(format),
    m_rows(spec.rows()),
    m_cols(spec.cols()),
    m_mapper(std::move(mapper)) {
    spc_trace();
    m_bands.reserve(spec.band_count());
    for (uint r : spec.radiometric_resolutions()) {
      if (format == RasterFormat::eInteger)
        m_bands.push_back({ r, IntBand(IntBand::Zero(m_rows, m_cols)) });
      else
        m_bands.push_back({ r, FloatBand(FloatBand::Zero(m_rows, m_cols)) });
    }
  }

  Raster::Raster(RasterFormat format, uint rows, uint cols, std::vector<Band> bands, std::optional<RasterMapper> mapper)
  : m_format(format),
    m_rows(rows),
    m_cols(cols),
    m_bands(std::move(bands)),
    m_mapper(std::move(mapper)) {
    spc_trace();
    if (m_bands.empty())
      throw error::invalid_band_count(0);
    for (const auto &band : m_bands) {
      if (!detail::is_valid_resolution(band.radiometric_resolution))
        throw error::invalid_radiometric_resolution(band.radiometric_resolution);
      bool is_float = std::holds_alternative<FloatBand>(band.data);
      debug::check_expr(is_float == (format == RasterFormat::eFloat),
        "band storage does not match raster format");
      band.data | visit { [&](const auto &a) {
        debug::check_expr(a.rows() == rows && a.cols() == cols,
          fmt::format("band of {}x{} samples does not match raster of {}x{}", a.rows(), a.cols(), rows, cols));
      }};
    }
  }

  bool Raster::operator==(const Raster &o) const {
    return m_format == o.m_format
        && m_rows   == o.m_rows
        && m_cols   == o.m_cols
        && m_bands  == o.m_bands
        && m_mapper == o.m_mapper;
  }

  void Raster::check_address(uint row, uint col, uint band) const {
    debug::check_expr(band < m_bands.size(),
      fmt::format("band index {} out of range [0, {})", band, m_bands.size()));
    debug::check_expr(row < m_rows && col < m_cols,
      fmt::format("cell ({}, {}) out of range [0, {}) x [0, {})", row, col, m_rows, m_cols));
  }

  std::uint64_t Raster::value(uint row, uint col, uint band) const {
    check_address(row, col, band);
    return m_bands[band].data | visit {
      [&](const IntBand &a)   { return a(row, col); },
      [&](const FloatBand &a) { return detail::saturate(a(row, col), max_value(band)); }
    };
  }

  void Raster::set_value(uint row, uint col, uint band, std::uint64_t v) {
    check_address(row, col, band);
    debug::check_expr(v <= max_value(band),
      fmt::format("value {} exceeds radiometric resolution of band {}", v, band));
    m_bands[band].data | visit {
      [&](IntBand &a)   { a(row, col) = v; },
      [&](FloatBand &a) { a(row, col) = static_cast<double>(v); }
    };
  }

  double Raster::float_value(uint row, uint col, uint band) const {
    check_address(row, col, band);
    return m_bands[band].data | visit {
      [&](const IntBand &a)   { return static_cast<double>(a(row, col)); },
      [&](const FloatBand &a) { return a(row, col); }
    };
  }

  void Raster::set_float_value(uint row, uint col, uint band, double v) {
    check_address(row, col, band);
    m_bands[band].data | visit {
      [&](IntBand &a)   { a(row, col) = detail::saturate(v, max_value(band)); },
      [&](FloatBand &a) { a(row, col) = v; }
    };
  }

  std::uint64_t Raster::max_value(uint band) const {
    return detail::max_value_of(radiometric_resolution(band));
  }

  const Raster::Band & Raster::band(uint i) const {
    debug::check_expr(i < m_bands.size(),
      fmt::format("band index {} out of range [0, {})", i, m_bands.size()));
    return m_bands[i];
  }

  uint Raster::radiometric_resolution(uint band) const {
    return this->band(band).radiometric_resolution;
  }

  std::vector<uint> Raster::radiometric_resolutions() const {
    std::vector<uint> resolutions(m_bands.size());
    std::ranges::transform(m_bands, resolutions.begin(), &Band::radiometric_resolution);
    return resolutions;
  }

  RasterSpecification Raster::specification() const {
    guard(!m_bands.empty(), RasterSpecification());
    std::vector<int> resolutions(m_bands.size());
    std::ranges::transform(m_bands, resolutions.begin(), 
      [](const Band &b) { return static_cast<int>(b.radiometric_resolution); });
    return RasterSpecification::validate(static_cast<int>(m_bands.size()), 
                                         static_cast<int>(m_rows), 
                                         static_cast<int>(m_cols), 
                                         resolutions);
  }

  Ring Raster::coordinates() const {
    guard(m_mapper, { });
    const auto rows = static_cast<double>(m_rows),
               cols = static_cast<double>(m_cols);
    return { m_mapper->map_coordinate(0.0,  0.0),
             m_mapper->map_coordinate(0.0,  cols),
             m_mapper->map_coordinate(rows, cols),
             m_mapper->map_coordinate(rows, 0.0) };
  }

  /* MemoryRasterFactory */

  Raster MemoryRasterFactory::create(const RasterSpecification  &spec,
                                     RasterFormat                format,
                                     std::optional<RasterMapper> mapper) const {
    spc_trace();
    return Raster(spec, format, std::move(mapper));
  }

  Raster MemoryRasterFactory::create(std::span<const Raster> rasters) const {
    spc_trace();
    if (rasters.empty())
      throw error::empty_others_collection();

    const auto &first = rasters.front();
    for (const auto &r : rasters) {
      if (r.rows() != first.rows())
        throw error::invalid_dimension("rows", r.rows());
      if (r.cols() != first.cols())
        throw error::invalid_dimension("cols", r.cols());
    }

    // Mixed inputs are promoted to floating point storage
    bool is_float = std::ranges::any_of(rasters, [](const Raster &r) { return r.format() == RasterFormat::eFloat; });
    RasterFormat format = is_float ? RasterFormat::eFloat : RasterFormat::eInteger;

    std::vector<Raster::Band> bands;
    for (const auto &r : rasters) {
      for (const auto &band : r.bands()) {
        if (!is_float) {
          bands.push_back(band);
          continue;
        }
        band.data | visit {
          [&](const Raster::IntBand &a)   { bands.push_back({ band.radiometric_resolution, Raster::FloatBand(a.cast<double>()) }); },
          [&](const Raster::FloatBand &a) { bands.push_back({ band.radiometric_resolution, Raster::FloatBand(a) }); }
        };
      }
    }

    return Raster(format, first.rows(), first.cols(), std::move(bands), first.mapper());
  }
} // namespace spc
