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

#include <spectral/core/json.hpp>
#include <spectral/core/exception.hpp>
#include <spectral/core/geometry.hpp>
#include <spectral/core/imaging.hpp>
#include <spectral/core/io.hpp>
#include <spectral/core/presentation.hpp>
#include <spectral/core/raster.hpp>
#include <spectral/core/spectral_geometry.hpp>
#include <spectral/core/spectral_range.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>

namespace spc {
  namespace detail {
    // Parse an enum from the name printed by its formatter; enum values
    // must be contiguous in [0, n_values)
    template <typename Enum, uint n_values>
    Enum enum_from_json(const json &js) {
      const auto &s = js.get_ref<const std::string &>();
      for (uint i = 0; i < n_values; ++i)
        guard(fmt::format("{}", static_cast<Enum>(i)) != s, static_cast<Enum>(i));
      debug::check_expr(false, fmt::format("unknown enum value \"{}\"", s));
      return Enum { };
    }

    template <typename Enum>
    void enum_to_json(json &js, Enum e) {
      js = fmt::format("{}", e);
    }
  } // namespace detail

  json metadata_or_empty(const json &js) {
    return js.is_null() ? json::object() : js;
  }

  /* Enums; serialized by formatter name */

  void from_json(const json &js, RasterMapMode &m)     { m = detail::enum_from_json<RasterMapMode, 2>(js);      }
  void to_json(json &js, const RasterMapMode &m)       { detail::enum_to_json(js, m);                           }
  void from_json(const json &js, RasterFormat &f)      { f = detail::enum_from_json<RasterFormat, 2>(js);       }
  void to_json(json &js, const RasterFormat &f)        { detail::enum_to_json(js, f);                           }
  void from_json(const json &js, PresentationModel &m) { m = detail::enum_from_json<PresentationModel, 7>(js);  }
  void to_json(json &js, const PresentationModel &m)   { detail::enum_to_json(js, m);                           }
  void from_json(const json &js, ColorSpace &c)        { c = detail::enum_from_json<ColorSpace, 7>(js);         }
  void to_json(json &js, const ColorSpace &c)          { detail::enum_to_json(js, c);                           }
  void from_json(const json &js, ColorSpaceBand &b)    { b = detail::enum_from_json<ColorSpaceBand, 17>(js);    }
  void to_json(json &js, const ColorSpaceBand &b)      { detail::enum_to_json(js, b);                           }
  void from_json(const json &js, SpectralRangeName &n) { 
    n = detail::enum_from_json<SpectralRangeName, spectral_ranges::n_ranges>(js); 
  }
  void to_json(json &js, const SpectralRangeName &n)   { detail::enum_to_json(js, n);                           }
  void from_json(const json &js, SpectralDomain &d)    { d = detail::enum_from_json<SpectralDomain, 11>(js);    }
  void to_json(json &js, const SpectralDomain &d)      { detail::enum_to_json(js, d);                           }

  /* Spectral ranges */

  void from_json(const json &js, SpectralRange &r) {
    r = SpectralRange(js.at("min").get<double>(), js.at("max").get<double>());
  }

  void to_json(json &js, const SpectralRange &r) {
    js["min"] = r.wavelength_min();
    js["max"] = r.wavelength_max();
  }

  /* Raster configuration */

  void from_json(const json &js, RasterSpecification &spec) {
    int band_count = js.at("band_count").get<int>();
    int rows       = js.at("rows").get<int>();
    int cols       = js.at("cols").get<int>();

    // Resolution is either uniform, or given per band
    if (js.contains("radiometric_resolution") && js.at("radiometric_resolution").is_array()) {
      auto resolutions = js.at("radiometric_resolution").get<std::vector<int>>();
      spec = RasterSpecification::validate(band_count, rows, cols, resolutions);
    } else {
      spec = RasterSpecification::validate(band_count, rows, cols, js.value("radiometric_resolution", 8));
    }
  }

  void to_json(json &js, const RasterSpecification &spec) {
    js["band_count"] = spec.band_count();
    js["rows"]       = spec.rows();
    js["cols"]       = spec.cols();
    if (auto r = spec.uniform_radiometric_resolution())
      js["radiometric_resolution"] = *r;
    else
      js["radiometric_resolution"] = std::vector<uint>(range_iter(spec.radiometric_resolutions()));
  }

  void from_json(const json &js, RasterMapper &mapper) {
    auto mode = js.value("mode", RasterMapMode::eValueIsArea);
    if (js.contains("transformation")) {
      mapper = RasterMapper(mode, js.at("transformation").get<eig::Matrix4d>());
    } else {
      auto translation = js.value("translation", Coordinate(Coordinate::Zero()));
      auto scale       = js.value("scale",       eig::Vector3d(eig::Vector3d::Ones()));
      mapper = RasterMapper::from_transformation(mode, translation, scale);
    }
  }

  void to_json(json &js, const RasterMapper &mapper) {
    js["mode"]           = mapper.mode();
    js["transformation"] = mapper.geometry_transformation();
  }

  /* Presentation */

  void from_json(const json &js, Presentation &p) {
    auto model = js.at("model").get<PresentationModel>();

    // Color-mapped layout
    if (js.contains("color_map")) {
      ColorMap color_map;
      for (const auto &entry : js.at("color_map"))
        color_map[entry.at("value").get<int>()] = entry.at("color").get<std::vector<uint>>();
      p = Presentation(model, std::move(color_map));
      return;
    }
    if (is_color_mapped(model))
      throw error::null_color_map();

    // Band-list layout; color models default to rgb
    bool is_color = model == PresentationModel::eTrueColor || model == PresentationModel::eFalseColor;
    auto color_space = js.value("color_space", is_color ? ColorSpace::eRGB : ColorSpace::eNone);
    if (js.contains("band_indices")) {
      auto indices = js.at("band_indices").get<std::vector<int>>();
      p = Presentation::from_band_indices(model, color_space, indices);
    } else if (js.contains("bands")) {
      p = Presentation(model, color_space, js.at("bands").get<std::vector<ColorSpaceBand>>());
    } else {
      p = Presentation(model, color_space, canonical_bands(color_space));
    }
  }

  void to_json(json &js, const Presentation &p) {
    js["model"] = p.model();
    p.layout() | visit {
      [&](const Presentation::BandLayout &l) {
        js["color_space"] = l.color_space;
        js["bands"]       = l.bands;
      },
      [&](const Presentation::ColorMapLayout &l) {
        js["color_map"] = json::array();
        for (const auto &[value, color] : l.color_map)
          js["color_map"].push_back({{ "value", value }, { "color", color }});
      }
    };
  }

  /* Imaging metadata */

  void from_json(const json &js, ImagingBand &b) {
    b.number                 = js.value("number", 0u);
    b.description            = js.value("description", std::string());
    b.spectral_range         = js.at("spectral_range").get<SpectralRange>();
    b.radiometric_resolution = js.value("radiometric_resolution", 8u);
    b.spectral_domain        = js.value("spectral_domain", SpectralDomain::eUndefined);
    b.range_resolution       = js.value("range_resolution", js.value("spatial_resolution", 0.0));
    b.azimuth_resolution     = js.value("azimuth_resolution", js.value("spatial_resolution", 0.0));
    b.swath                  = js.value("swath", 0.0);
    validate(b);
  }

  void to_json(json &js, const ImagingBand &b) {
    js["number"]                 = b.number;
    js["description"]            = b.description;
    js["spectral_range"]         = b.spectral_range;
    js["radiometric_resolution"] = b.radiometric_resolution;
    js["spectral_domain"]        = b.spectral_domain;
    js["range_resolution"]       = b.range_resolution;
    js["azimuth_resolution"]     = b.azimuth_resolution;
    js["swath"]                  = b.swath;
  }

  void from_json(const json &js, ImagingDevice &d) {
    d = ImagingDevice({
      .identifier          = js.value("identifier", std::string()),
      .mission             = js.value("mission", std::string()),
      .mission_number      = js.value("mission_number", 0u),
      .instrument          = js.value("instrument", std::string()),
      .orbit               = js.value("orbit", std::string()),
      .altitude            = js.value("altitude", 0.0),
      .temporal_resolution = js.value("temporal_resolution", 0.0),
      .bands               = js.value("bands", std::vector<ImagingBand>())
    });
  }

  void to_json(json &js, const ImagingDevice &d) {
    js["identifier"]          = d.identifier();
    js["mission"]             = d.mission();
    js["mission_number"]      = d.mission_number();
    js["instrument"]          = d.instrument();
    js["orbit"]               = d.orbit();
    js["altitude"]            = d.altitude();
    js["temporal_resolution"] = d.temporal_resolution();
    js["bands"]               = std::vector<ImagingBand>(range_iter(d.bands()));
  }

  void from_json(const json &js, RasterImaging &i) {
    using namespace std::chrono;
    i = RasterImaging({
      .device          = js.at("device").get<ImagingDevice>(),
      .time            = RasterImaging::TimePoint(seconds(js.value("time", 0ll))),
      .device_location = js.value("device_location", Coordinate(Coordinate::Zero())),
      .image_location  = js.value("image_location", Ring()),
      .incidence_angle = js.value("incidence_angle", 0.0),
      .viewing_angle   = js.value("viewing_angle", 0.0),
      .sun_azimuth     = js.value("sun_azimuth", 0.0),
      .sun_elevation   = js.value("sun_elevation", 0.0),
      .bands           = js.value("bands", std::vector<ImagingBand>()),
      .parameters      = js.value("parameters", json::object())
    });
  }

  void to_json(json &js, const RasterImaging &i) {
    using namespace std::chrono;
    js["device"]          = i.device();
    js["time"]            = duration_cast<seconds>(i.time().time_since_epoch()).count();
    js["device_location"] = i.device_location();
    js["image_location"]  = i.image_location();
    js["incidence_angle"] = i.incidence_angle();
    js["viewing_angle"]   = i.viewing_angle();
    js["sun_azimuth"]     = i.sun_azimuth();
    js["sun_elevation"]   = i.sun_elevation();
    js["bands"]           = std::vector<ImagingBand>(range_iter(i.bands()));
    js["parameters"]      = i.parameters();
  }

  /* Geometry */

  void from_json(const json &js, Polygon &p) {
    p.shell    = js.at("shell").get<Ring>();
    p.holes    = js.value("holes", std::vector<Ring>());
    p.metadata = metadata_or_empty(js.value("metadata", json()));
  }

  void to_json(json &js, const Polygon &p) {
    js["shell"]    = p.shell;
    js["holes"]    = p.holes;
    js["metadata"] = p.metadata;
  }

  void from_json(const json &js, SpectralGeometryRequest &r) {
    if (js.contains("geometry"))
      r.geometry = js.at("geometry").get<Polygon>();
    if (js.contains("shell"))
      r.shell = js.at("shell").get<Ring>();
    r.holes = js.value("holes", std::vector<Ring>());
    if (js.contains("raster"))
      r.raster = js.at("raster").get<RasterSpecification>();
    r.format = js.value("format", RasterFormat::eInteger);
    if (js.contains("mapper"))
      r.mapper = js.at("mapper").get<RasterMapper>();
    if (js.contains("presentation"))
      r.presentation = js.at("presentation").get<Presentation>();
    if (js.contains("imaging"))
      r.imaging = js.at("imaging").get<RasterImaging>();
    r.metadata = js.value("metadata", json());
  }

  void to_json(json &js, const SpectralGeometryRequest &r) {
    js = json::object();
    if (r.geometry)
      js["geometry"] = *r.geometry;
    if (r.shell)
      js["shell"] = *r.shell;
    if (!r.holes.empty())
      js["holes"] = r.holes;
    
    // Supplied rasters reduce to their specification; samples are not serialized
    r.raster | visit {
      [&](const std::monostate &)          { },
      [&](const Raster &raster)            { js["raster"] = raster.specification(); },
      [&](const RasterSpecification &spec) { js["raster"] = spec; }
    };
    js["format"] = r.format;
    if (r.mapper)
      js["mapper"] = *r.mapper;
    if (r.presentation)
      js["presentation"] = *r.presentation;
    if (r.imaging)
      js["imaging"] = *r.imaging;
    if (!r.metadata.is_null())
      js["metadata"] = r.metadata;
  }

  void to_json(json &js, const SpectralPolygon &p) {
    const auto &raster = p.raster();
    js["band_count"]              = raster.band_count();
    js["rows"]                    = raster.rows();
    js["cols"]                    = raster.cols();
    js["format"]                  = raster.format();
    js["radiometric_resolutions"] = raster.radiometric_resolutions();
    js["presentation"]            = p.presentation();
    js["shell"]                   = p.shell();
    js["holes"]                   = p.holes();
    js["envelope"]                = {{ "min", Coordinate(p.envelope().min()) }, 
                                     { "max", Coordinate(p.envelope().max()) }};
    if (raster.mapper())
      js["mapper"] = *raster.mapper();
    if (p.imaging())
      js["imaging"] = *p.imaging();
    js["metadata"] = p.metadata();
  }

  namespace io {
    json load_json(const fs::path &path) {
      return json::parse(load_string(path));
    }

    void save_json(const fs::path &path, const json &js, uint indent) {
      save_string(path, js.dump(indent));
    }
  } // namespace io
} // namespace spc

namespace Eigen {
  void from_json(const spc::json &js, Vector3d &v) {
    // Two-dimensional coordinates carry z = 0
    v = Vector3d::Zero();
    spc::debug::check_expr(js.is_array() && (js.size() == 2 || js.size() == 3),
      "expected a coordinate of two or three components");
    for (size_t i = 0; i < js.size(); ++i)
      v[i] = js[i].get<double>();
  }

  void to_json(spc::json &js, const Vector3d &v) {
    js = std::vector<double> { v.x(), v.y(), v.z() };
  }

  // Matrices are stored as nested rows
  void from_json(const spc::json &js, Matrix4d &m) {
    spc::debug::check_expr(js.is_array() && js.size() == 4, "expected a 4x4 matrix");
    for (uint i = 0; i < 4; ++i) {
      spc::debug::check_expr(js[i].is_array() && js[i].size() == 4, "expected a 4x4 matrix");
      for (uint j = 0; j < 4; ++j)
        m(i, j) = js[i][j].get<double>();
    }
  }

  void to_json(spc::json &js, const Matrix4d &m) {
    js = spc::json::array();
    for (uint i = 0; i < 4; ++i) {
      std::vector<double> row(4);
      for (uint j = 0; j < 4; ++j)
        row[j] = m(i, j);
      js.push_back(row);
    }
  }
} // namespace Eigen
