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

#include <spectral/core/imaging.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <iterator>

namespace spc {
  namespace detail {
    constexpr static size_t image_location_size = 4;

    // Error payloads report spatial sizes in whole meters
    void check_spatial_size(std::string_view field, double v) {
      if (!std::isfinite(v) || v < 0.0)
        throw error::invalid_dimension(field, std::isfinite(v) ? std::llround(v) : -1ll);
    }

    std::vector<SpectralDomain> spectral_domains_of(std::span<const ImagingBand> bands) {
      std::vector<SpectralDomain> domains(bands.size());
      std::ranges::transform(bands, domains.begin(), &ImagingBand::spectral_domain);
      return domains;
    }
  } // namespace detail

  void validate(const ImagingBand &b) {
    if (b.radiometric_resolution < 1 || b.radiometric_resolution > 64)
      throw error::invalid_radiometric_resolution(b.radiometric_resolution);
    detail::check_spatial_size("range_resolution",   b.range_resolution);
    detail::check_spatial_size("azimuth_resolution", b.azimuth_resolution);
    detail::check_spatial_size("swath",              b.swath);
    if (b.swath > 0.0 && b.swath < b.range_resolution)
      throw error::invalid_dimension("swath", std::llround(b.swath));
  }

  /* ImagingDevice */

  ImagingDevice::ImagingDevice(CreateInfo info)
  : m_identifier(std::move(info.identifier)),
    m_mission(std::move(info.mission)),
    m_mission_number(info.mission_number),
    m_instrument(std::move(info.instrument)),
    m_orbit(std::move(info.orbit)),
    m_altitude(info.altitude),
    m_temporal_resolution(info.temporal_resolution),
    m_bands(std::move(info.bands)) {
    if (m_mission.empty())
      throw error::null_argument("mission");
    if (m_instrument.empty())
      throw error::null_argument("instrument");
    std::ranges::for_each(m_bands, [](const ImagingBand &b) { validate(b); });
  }

  std::string ImagingDevice::name() const {
    return m_mission_number > 0
      ? fmt::format("{}{} {}", m_mission, m_mission_number, m_instrument)
      : fmt::format("{} {}", m_mission, m_instrument);
  }

  std::vector<uint> ImagingDevice::radiometric_resolutions() const {
    std::vector<uint> resolutions(m_bands.size());
    std::ranges::transform(m_bands, resolutions.begin(), &ImagingBand::radiometric_resolution);
    return resolutions;
  }

  std::vector<SpectralRange> ImagingDevice::spectral_ranges() const {
    std::vector<SpectralRange> ranges(m_bands.size());
    std::ranges::transform(m_bands, ranges.begin(), &ImagingBand::spectral_range);
    return ranges;
  }

  std::vector<SpectralDomain> ImagingDevice::spectral_domains() const {
    return detail::spectral_domains_of(m_bands);
  }

  namespace imaging_devices {
    namespace detail {
      constexpr static double um  = 1e-6;
      constexpr static double km  = 1e3;
      constexpr static double day = 86400.0;

      ImagingBand band(uint number, std::string description, double spatial_resolution, double swath,
                       uint radiometric_resolution, SpectralDomain domain, double min_um, double max_um) {
        return { .number                 = number,
                 .description            = std::move(description),
                 .spectral_range         = SpectralRange(min_um * um, max_um * um),
                 .radiometric_resolution = radiometric_resolution,
                 .spectral_domain        = domain,
                 .range_resolution       = spatial_resolution,
                 .azimuth_resolution     = spatial_resolution,
                 .swath                  = swath };
      }

      // Function-local static; initialization is thread-safe and happens once
      const std::array<ImagingDevice, 4> & catalog() {
        using enum SpectralDomain;
        static const std::array<ImagingDevice, 4> devices = {
          ImagingDevice({
            .identifier = "AEGIS::135058", .mission = "SPOT", .mission_number = 4, .instrument = "HRVIR",
            .altitude = 822.0 * km, .temporal_resolution = 26.0 * day,
            .bands = {
              band(0, "Panchromatic band (M)",         10.0, 60.0 * km, 8, eVisible,                 0.61, 0.68),
              band(1, "Multispectral green band (XS1)", 20.0, 60.0 * km, 8, eGreen,                   0.50, 0.59),
              band(2, "Multispectral red band (XS2)",   20.0, 60.0 * km, 8, eRed,                     0.61, 0.68),
              band(3, "Multispectral NIR band (XS3)",   20.0, 60.0 * km, 8, eNearInfrared,            0.79, 0.89),
              band(4, "Multispectral MIR band (SWIR)",  20.0, 60.0 * km, 8, eShortWavelengthInfrared, 1.58, 1.75)
            }
          }),
          ImagingDevice({
            .identifier = "AEGIS::135060", .mission = "SPOT", .mission_number = 5, .instrument = "HRG",
            .altitude = 832.0 * km, .temporal_resolution = 26.0 * day,
            .bands = {
              band(0, "Panchromatic band (M)",          5.0, 60.0 * km, 8, eVisible,                 0.49, 0.69),
              band(1, "Multispectral green band (XS1)", 10.0, 60.0 * km, 8, eGreen,                   0.50, 0.59),
              band(2, "Multispectral red band (XS2)",   10.0, 60.0 * km, 8, eRed,                     0.61, 0.68),
              band(3, "Multispectral NIR band (XS3)",   10.0, 60.0 * km, 8, eNearInfrared,            0.79, 0.89),
              band(4, "Multispectral MIR band (SWIR)",  20.0, 60.0 * km, 8, eShortWavelengthInfrared, 1.58, 1.75)
            }
          }),
          ImagingDevice({
            .identifier = "", .mission = "Landsat", .mission_number = 7, .instrument = "ETM+",
            .altitude = 705.0 * km, .temporal_resolution = 16.0 * day,
            .bands = {
              band(0, "Multispectral blue band (BAND 1)",  30.0, 185.0 * km, 8, eBlue,                    0.45,  0.515),
              band(1, "Multispectral green band (BAND 2)", 30.0, 185.0 * km, 8, eGreen,                   0.525, 0.605),
              band(2, "Multispectral red band (BAND 3)",   30.0, 185.0 * km, 8, eRed,                     0.63,  0.69),
              band(3, "Multispectral NIR band (BAND 4)",   30.0, 185.0 * km, 8, eNearInfrared,            0.75,  0.90),
              band(4, "Multispectral SWIR band (BAND 5)",  30.0, 185.0 * km, 8, eShortWavelengthInfrared, 1.55,  1.75),
              band(5, "Thermal IR band (BAND 6)",          60.0, 185.0 * km, 8, eLongWavelengthInfrared,  10.4,  12.5),
              band(6, "Multispectral SWIR band (BAND 7)",  30.0, 185.0 * km, 8, eShortWavelengthInfrared, 2.09,  2.35),
              band(7, "Panchromatic band (BAND 8)",        15.0, 185.0 * km, 8, eVisible,                 0.52,  0.90)
            }
          }),
          ImagingDevice({
            .identifier = "", .mission = "Landsat", .mission_number = 8, .instrument = "OLI/TIRS",
            .altitude = 705.0 * km, .temporal_resolution = 16.0 * day,
            .bands = {
              band(0,  "Coastal aerosol band (BAND 1)",              30.0, 185.0 * km, 16, eBlue,                    0.43,  0.45),
              band(1,  "Multispectral blue band (BAND 2)",           30.0, 185.0 * km, 16, eBlue,                    0.45,  0.51),
              band(2,  "Multispectral green band (BAND 3)",          30.0, 185.0 * km, 16, eGreen,                   0.53,  0.59),
              band(3,  "Multispectral red band (BAND 4)",            30.0, 185.0 * km, 16, eRed,                     0.64,  0.67),
              band(4,  "Multispectral NIR band (BAND 5)",            30.0, 185.0 * km, 16, eNearInfrared,            0.85,  0.88),
              band(5,  "Multispectral SWIR band (BAND 6)",           30.0, 185.0 * km, 16, eShortWavelengthInfrared, 1.57,  1.65),
              band(6,  "Multispectral SWIR band (BAND 7)",           30.0, 185.0 * km, 16, eShortWavelengthInfrared, 2.11,  2.29),
              band(7,  "Panchromatic band (BAND 8)",                 15.0, 185.0 * km, 16, eVisible,                 0.50,  0.68),
              band(8,  "Cirrus band (BAND 9)",                       30.0, 185.0 * km, 16, eNearInfrared,            1.36,  1.38),
              band(9,  "Thermal IR band (BAND 10)",                  30.0, 185.0 * km, 16, eLongWavelengthInfrared,  10.60, 11.19),
              band(10, "Thermal IR band (BAND 11)",                  30.0, 185.0 * km, 16, eLongWavelengthInfrared,  11.50, 12.51)
            }
          })
        };
        return devices;
      }

      std::string to_lower(std::string_view s) {
        std::string lower(s);
        std::ranges::transform(lower, lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower;
      }

      // Case-insensitive substring match; an empty query matches everything
      bool contains(std::string_view text, std::string_view query) {
        return to_lower(text).find(to_lower(query)) != std::string::npos;
      }
    } // namespace detail

    const ImagingDevice & spot4_hrvir()       { return detail::catalog()[0]; }
    const ImagingDevice & spot5_hrg()         { return detail::catalog()[1]; }
    const ImagingDevice & landsat7_etm_plus() { return detail::catalog()[2]; }
    const ImagingDevice & landsat8_oli_tirs() { return detail::catalog()[3]; }

    std::span<const ImagingDevice> all() {
      return detail::catalog();
    }

    std::vector<ImagingDevice> from_identifier(std::string_view identifier) {
      std::vector<ImagingDevice> devices;
      std::ranges::copy_if(all(), std::back_inserter(devices),
        [identifier](const ImagingDevice &d) { return detail::contains(d.identifier(), identifier); });
      return devices;
    }

    std::vector<ImagingDevice> from_name(std::string_view name) {
      std::vector<ImagingDevice> devices;
      std::ranges::copy_if(all(), std::back_inserter(devices),
        [name](const ImagingDevice &d) { return detail::contains(d.name(), name); });
      return devices;
    }
  } // namespace imaging_devices

  /* RasterImaging */

  RasterImaging::RasterImaging(CreateInfo info)
  : m_info(std::move(info)) {
    spc_trace();
    if (!m_info.image_location.empty() && m_info.image_location.size() != detail::image_location_size)
      throw error::invalid_dimension("image_location", static_cast<long long>(m_info.image_location.size()));
    if (!is_valid(m_info.device_location))
      throw error::invalid_dimension("device_location", 0);
    std::ranges::for_each(m_info.bands, [](const ImagingBand &b) { validate(b); });
    m_info.parameters = metadata_or_empty(m_info.parameters);
  }

  RasterImaging RasterImaging::filter(std::span<const int> band_indices) const {
    spc_trace();
    if (band_indices.empty())
      throw error::invalid_dimension("band_indices", 0);

    CreateInfo info = m_info;
    info.bands.clear();
    info.bands.reserve(band_indices.size());
    for (int i : band_indices) {
      if (i < 0 || static_cast<size_t>(i) >= m_info.bands.size())
        throw error::invalid_dimension("band_indices", i);
      info.bands.push_back(m_info.bands[i]);
    }

    return RasterImaging(std::move(info));
  }

  std::optional<uint> RasterImaging::band_index_of(double wavelength) const {
    auto it = std::ranges::find_if(m_info.bands, 
      [wavelength](const ImagingBand &b) { return b.spectral_range.contains(wavelength); });
    guard(it != m_info.bands.end(), { });
    return static_cast<uint>(std::distance(m_info.bands.begin(), it));
  }

  std::optional<uint> RasterImaging::band_index_of(SpectralDomain domain) const {
    auto it = std::ranges::find(m_info.bands, domain, &ImagingBand::spectral_domain);
    guard(it != m_info.bands.end(), { });
    return static_cast<uint>(std::distance(m_info.bands.begin(), it));
  }

  std::vector<SpectralDomain> RasterImaging::spectral_domains() const {
    return detail::spectral_domains_of(m_info.bands);
  }

  std::vector<SpectralRange> RasterImaging::spectral_ranges() const {
    std::vector<SpectralRange> ranges(m_info.bands.size());
    std::ranges::transform(m_info.bands, ranges.begin(), &ImagingBand::spectral_range);
    return ranges;
  }

  json RasterImaging::parameter(const std::string &key) const {
    guard(m_info.parameters.contains(key), json());
    return m_info.parameters.at(key);
  }

  bool RasterImaging::operator==(const RasterImaging &o) const {
    return m_info.device          == o.m_info.device
        && m_info.time            == o.m_info.time
        && m_info.device_location == o.m_info.device_location
        && m_info.image_location  == o.m_info.image_location
        && m_info.incidence_angle == o.m_info.incidence_angle
        && m_info.viewing_angle   == o.m_info.viewing_angle
        && m_info.sun_azimuth     == o.m_info.sun_azimuth
        && m_info.sun_elevation   == o.m_info.sun_elevation
        && m_info.bands           == o.m_info.bands
        && m_info.parameters      == o.m_info.parameters;
  }
} // namespace spc
