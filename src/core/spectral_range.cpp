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

#include <spectral/core/spectral_range.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>
#include <cmath>

namespace spc {
  namespace detail {
    // Error payloads report wavelengths in whole nanometers
    long long to_nm(double wavelength) {
      return std::isfinite(wavelength) ? std::llround(wavelength * 1e9) : -1ll;
    }
  } // namespace detail

  SpectralRange::SpectralRange(double wavelength_min, double wavelength_max)
  : m_min(wavelength_min), m_max(wavelength_max) {
    if (!std::isfinite(wavelength_min) || wavelength_min < 0.0)
      throw error::invalid_dimension("wavelength_min", detail::to_nm(wavelength_min));
    if (!std::isfinite(wavelength_max) || wavelength_max < wavelength_min)
      throw error::invalid_dimension("wavelength_max", detail::to_nm(wavelength_max));
  }

  namespace spectral_ranges {
    namespace detail {
      constexpr static double nm = 1e-9;
      constexpr static double um = 1e-6;
      constexpr static double mm = 1e-3;

      constexpr static std::array<SpectralRangeName, n_ranges> names = {
        SpectralRangeName::eUltraviolet,
        SpectralRangeName::eViolet,
        SpectralRangeName::eBlue,
        SpectralRangeName::eGreen,
        SpectralRangeName::eYellow,
        SpectralRangeName::eOrange,
        SpectralRangeName::eRed,
        SpectralRangeName::eVisible,
        SpectralRangeName::eNearInfrared,
        SpectralRangeName::eShortWavelengthInfrared,
        SpectralRangeName::eMiddleWavelengthInfrared,
        SpectralRangeName::eLongWavelengthInfrared,
        SpectralRangeName::eFarInfrared,
        SpectralRangeName::eInfrared
      };

      // Function-local static; initialization is thread-safe and happens once
      const std::array<SpectralRange, n_ranges> & catalog() {
        static const std::array<SpectralRange, n_ranges> ranges = {
          SpectralRange(10.0 * nm,  380.0 * nm), // ultraviolet
          SpectralRange(380.0 * nm, 450.0 * nm), // violet
          SpectralRange(450.0 * nm, 495.0 * nm), // blue
          SpectralRange(495.0 * nm, 570.0 * nm), // green
          SpectralRange(570.0 * nm, 590.0 * nm), // yellow
          SpectralRange(590.0 * nm, 620.0 * nm), // orange
          SpectralRange(620.0 * nm, 750.0 * nm), // red
          SpectralRange(380.0 * nm, 750.0 * nm), // visible
          SpectralRange(750.0 * nm, 1.4 * um),   // near infrared
          SpectralRange(1.4 * um,   3.0 * um),   // short wavelength infrared
          SpectralRange(3.0 * um,   8.0 * um),   // middle wavelength infrared
          SpectralRange(8.0 * um,   15.0 * um),  // long wavelength infrared
          SpectralRange(15.0 * um,  1.0 * mm),   // far infrared
          SpectralRange(750.0 * nm, 1.0 * mm)    // infrared
        };
        return ranges;
      }
    } // namespace detail

    const SpectralRange & range_of(SpectralRangeName name) {
      auto i = static_cast<uint>(name);
      debug::check_expr(i < n_ranges, fmt::format("unknown spectral range name {}", i));
      return detail::catalog()[i];
    }

    std::span<const SpectralRangeName> range_names() {
      return detail::names;
    }

    std::vector<SpectralRangeName> classify(double wavelength) {
      spc_trace();
      std::vector<SpectralRangeName> names;
      std::ranges::copy_if(detail::names, std::back_inserter(names),
        [wavelength](SpectralRangeName name) { return range_of(name).contains(wavelength); });
      return names;
    }
  } // namespace spectral_ranges
} // namespace spc
