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
#include <array>
#include <span>
#include <vector>

namespace spc {
  /* SpectralRange.
     Immutable closed wavelength interval [min, max], in meters. */
  class SpectralRange {
    double m_min = 0.0;
    double m_max = 0.0;

  public:
    SpectralRange() = default;
    SpectralRange(double wavelength_min, double wavelength_max);

    double wavelength_min() const { return m_min; }
    double wavelength_max() const { return m_max; }
    double center()         const { return 0.5 * (m_min + m_max); }
    double width()          const { return m_max - m_min; }

    bool contains(double wavelength) const {
      return wavelength >= m_min && wavelength <= m_max;
    }

    bool contains(const SpectralRange &o) const {
      return o.m_min >= m_min && o.m_max <= m_max;
    }

    bool overlaps(const SpectralRange &o) const {
      return o.m_min <= m_max && o.m_max >= m_min;
    }

    bool operator==(const SpectralRange &o) const = default;
  };

  // Named wavelength intervals; intervals overlap, e.g. eVisible contains eRed
  enum class SpectralRangeName : uint {
    eUltraviolet,
    eViolet,
    eBlue,
    eGreen,
    eYellow,
    eOrange,
    eRed,
    eVisible,
    eNearInfrared,
    eShortWavelengthInfrared,
    eMiddleWavelengthInfrared,
    eLongWavelengthInfrared,
    eFarInfrared,
    eInfrared
  };

  namespace spectral_ranges {
    constexpr static uint n_ranges = 14u;

    // Process-wide immutable catalog entry for a name; the returned
    // reference is stable for the lifetime of the program
    const SpectralRange & range_of(SpectralRangeName name);

    // All catalog names, ordered as the enum
    std::span<const SpectralRangeName> range_names();

    // All catalog names whose interval contains the wavelength (in meters),
    // ordered as the enum; empty if the wavelength lies outside every interval
    std::vector<SpectralRangeName> classify(double wavelength);

    // Shorthands for frequently queried entries
    inline const SpectralRange & visible()  { return range_of(SpectralRangeName::eVisible);  }
    inline const SpectralRange & infrared() { return range_of(SpectralRangeName::eInfrared); }
  } // namespace spectral_ranges

  /* json (de)serialization for spectral ranges; wavelengths in meters */
  void from_json(const json &js, SpectralRange &r);
  void to_json(json &js, const SpectralRange &r);
  void from_json(const json &js, SpectralRangeName &n);
  void to_json(json &js, const SpectralRangeName &n);
} // namespace spc

template<>
struct fmt::formatter<spc::SpectralRangeName> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::SpectralRangeName& ty, fmt_context_ty& ctx) const {
    using enum spc::SpectralRangeName;
    std::string s;
    switch (ty) {
      case eUltraviolet              : s = "ultraviolet";                break;
      case eViolet                   : s = "violet";                     break;
      case eBlue                     : s = "blue";                       break;
      case eGreen                    : s = "green";                      break;
      case eYellow                   : s = "yellow";                     break;
      case eOrange                   : s = "orange";                     break;
      case eRed                      : s = "red";                        break;
      case eVisible                  : s = "visible";                    break;
      case eNearInfrared             : s = "near_infrared";              break;
      case eShortWavelengthInfrared  : s = "short_wavelength_infrared";  break;
      case eMiddleWavelengthInfrared : s = "middle_wavelength_infrared"; break;
      case eLongWavelengthInfrared   : s = "long_wavelength_infrared";   break;
      case eFarInfrared              : s = "far_infrared";               break;
      case eInfrared                 : s = "infrared";                   break;
      default                        : s = "undefined";                  break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};

template<>
struct fmt::formatter<spc::SpectralRange> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  // Ranges print in nanometers, which is how they are usually read
  template <typename fmt_context_ty>
  constexpr auto format(const spc::SpectralRange& r, fmt_context_ty& ctx) const {
    return fmt::format_to(ctx.out(), "[{} nm, {} nm]", r.wavelength_min() * 1e9, r.wavelength_max() * 1e9);
  }
};
