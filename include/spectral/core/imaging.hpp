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
#include <spectral/core/spectral_range.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spc {
  /* Spectral domain a sensor band is designed to record */
  enum class SpectralDomain {
    eUndefined,
    eUltraviolet,
    eVisible,
    eBlue,
    eGreen,
    eRed,
    eNearInfrared,
    eShortWavelengthInfrared,
    eMiddleWavelengthInfrared,
    eLongWavelengthInfrared,
    eFarInfrared
  };

  /* ImagingBand.
     Descriptive data of a single sensor band; spatial sizes in meters. */
  struct ImagingBand {
    uint           number                 = 0;
    std::string    description;
    SpectralRange  spectral_range;
    uint           radiometric_resolution = 8;
    SpectralDomain spectral_domain        = SpectralDomain::eUndefined;
    double         range_resolution       = 0.0; // 0 if unknown
    double         azimuth_resolution     = 0.0; // 0 if unknown
    double         swath                  = 0.0; // 0 if unknown

  public: // Boilerplate
    bool operator==(const ImagingBand &o) const = default;
  };

  // Throw a ConfigError if a band's resolutions or swath are out of range
  void validate(const ImagingBand &b);

  /* ImagingDevice.
     Sensor/platform that acquired a raster. */
  class ImagingDevice {
    std::string              m_identifier;
    std::string              m_mission;
    uint                     m_mission_number = 0;
    std::string              m_instrument;
    std::string              m_orbit;
    double                   m_altitude            = 0.0; // meters
    double                   m_temporal_resolution = 0.0; // seconds
    std::vector<ImagingBand> m_bands;

  public:
    struct CreateInfo {
      std::string              identifier;
      std::string              mission;
      uint                     mission_number      = 0;
      std::string              instrument;
      std::string              orbit;
      double                   altitude            = 0.0;
      double                   temporal_resolution = 0.0;
      std::vector<ImagingBand> bands;
    };

  public:
    ImagingDevice() = default;
    explicit ImagingDevice(CreateInfo info);

    // Mission, mission number (if any) and instrument, e.g. "Landsat8 OLI"
    std::string name() const;

    const std::string &identifier()          const { return m_identifier;          }
    const std::string &mission()             const { return m_mission;             }
    uint               mission_number()      const { return m_mission_number;      }
    const std::string &instrument()          const { return m_instrument;          }
    const std::string &orbit()               const { return m_orbit;               }
    double             altitude()            const { return m_altitude;            }
    double             temporal_resolution() const { return m_temporal_resolution; }

    std::span<const ImagingBand> bands() const { return m_bands; }
    std::vector<uint>            radiometric_resolutions() const;
    std::vector<SpectralRange>   spectral_ranges() const;
    std::vector<SpectralDomain>  spectral_domains() const;

    bool operator==(const ImagingDevice &o) const = default;
  };

  /* Catalog of known sensors; entries are created once and never change */
  namespace imaging_devices {
    const ImagingDevice & spot4_hrvir();
    const ImagingDevice & spot5_hrg();
    const ImagingDevice & landsat7_etm_plus();
    const ImagingDevice & landsat8_oli_tirs();

    // All catalog entries, in the order above
    std::span<const ImagingDevice> all();

    // Catalog entries whose identifier, or name, contains the query; case is ignored
    std::vector<ImagingDevice> from_identifier(std::string_view identifier);
    std::vector<ImagingDevice> from_name(std::string_view name);
  } // namespace imaging_devices

  /* RasterImaging.
     Acquisition metadata attached to a raster; immutable once attached,
     derived values are produced through filter(...). */
  class RasterImaging {
  public:
    using TimePoint = std::chrono::system_clock::time_point;

    struct CreateInfo {
      ImagingDevice            device;
      TimePoint                time;
      Coordinate               device_location = Coordinate::Zero();
      Ring                     image_location;  // empty, or exactly four corners
      double                   incidence_angle = 0.0;
      double                   viewing_angle   = 0.0;
      double                   sun_azimuth     = 0.0;
      double                   sun_elevation   = 0.0;
      std::vector<ImagingBand> bands;
      json                     parameters      = json::object();
    };

  private:
    CreateInfo m_info;

  public:
    RasterImaging() = default;
    explicit RasterImaging(CreateInfo info);

    // Return a new imaging restricted to the given bands, in the given order
    RasterImaging filter(std::span<const int> band_indices) const;

    // Index of the first band whose spectral range contains the wavelength (m)
    std::optional<uint> band_index_of(double wavelength) const;

    // Index of the first band recording the given spectral domain
    std::optional<uint> band_index_of(SpectralDomain domain) const;

  public: // Queries
    const ImagingDevice &device()          const { return m_info.device;          }
    TimePoint            time()            const { return m_info.time;            }
    const Coordinate    &device_location() const { return m_info.device_location; }
    const Ring          &image_location()  const { return m_info.image_location;  }
    double               incidence_angle() const { return m_info.incidence_angle; }
    double               viewing_angle()   const { return m_info.viewing_angle;   }
    double               sun_azimuth()     const { return m_info.sun_azimuth;     }
    double               sun_elevation()   const { return m_info.sun_elevation;   }
    const json          &parameters()      const { return m_info.parameters;      }
    const CreateInfo    &info()            const { return m_info;                 }

    std::span<const ImagingBand> bands() const { return m_info.bands; }
    std::vector<SpectralRange>   spectral_ranges() const;
    std::vector<SpectralDomain>  spectral_domains() const;

    // Additional parameter by key; null if absent
    json parameter(const std::string &key) const;

    bool operator==(const RasterImaging &o) const;
  };

  /* json (de)serialization for imaging metadata; time is given in
     seconds since the Unix epoch */
  void from_json(const json &js, SpectralDomain &d);
  void to_json(json &js, const SpectralDomain &d);
  void from_json(const json &js, ImagingBand &b);
  void to_json(json &js, const ImagingBand &b);
  void from_json(const json &js, ImagingDevice &d);
  void to_json(json &js, const ImagingDevice &d);
  void from_json(const json &js, RasterImaging &i);
  void to_json(json &js, const RasterImaging &i);
} // namespace spc

template<>
struct fmt::formatter<spc::SpectralDomain> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::SpectralDomain& ty, fmt_context_ty& ctx) const {
    using enum spc::SpectralDomain;
    std::string s;
    switch (ty) {
      case eUltraviolet              : s = "ultraviolet";                break;
      case eVisible                  : s = "visible";                    break;
      case eBlue                     : s = "blue";                       break;
      case eGreen                    : s = "green";                      break;
      case eRed                      : s = "red";                        break;
      case eNearInfrared             : s = "near_infrared";              break;
      case eShortWavelengthInfrared  : s = "short_wavelength_infrared";  break;
      case eMiddleWavelengthInfrared : s = "middle_wavelength_infrared"; break;
      case eLongWavelengthInfrared   : s = "long_wavelength_infrared";   break;
      case eFarInfrared              : s = "far_infrared";               break;
      default                        : s = "undefined";                  break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};
