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

#include <spectral/core/utility.hpp>
#include <fmt/ranges.h>
#include <span>
#include <string>
#include <string_view>

namespace spc {
  /* Error codes for caller/configuration errors raised during
     raster specification, presentation and spectral geometry construction */
  enum class ErrorCode {
    eNullArgument,
    eInvalidDimension,
    eInvalidBandCount,
    eInvalidRadiometricResolution,
    eBandResolutionMismatch,
    eEmptyShell,
    eDuplicateBandIndex,
    eIncompatiblePresentationConfig,
    eNullColorMap,
    eEmptyOthersCollection
  };

  /* ConfigError.
     Exception thrown on invalid arguments; it carries an error code and
     the offending fields as keyed messages. These errors are never transient;
     nothing is constructed when one is thrown. */
  class ConfigError : public detail::Exception {
    ErrorCode           m_code;
    mutable std::string m_what;

  public:
    explicit ConfigError(ErrorCode code);

    ErrorCode   code()  const { return m_code;         }
    std::string field() const { return Message::get("field"); }

    const char * what() const noexcept override;
  };

  namespace error {
    // Shorthands constructing each error with its payload attached
    ConfigError null_argument(std::string_view field);
    ConfigError invalid_dimension(std::string_view field, long long value);
    ConfigError invalid_band_count(long long value);
    ConfigError invalid_radiometric_resolution(long long value);
    ConfigError band_resolution_mismatch(size_t expected, size_t actual);
    ConfigError empty_shell(std::string_view field = "shell");
    ConfigError duplicate_band_index(std::span<const int> indices);
    ConfigError incompatible_presentation_config(std::string_view model, std::string_view reason);
    ConfigError null_color_map();
    ConfigError empty_others_collection();
  } // namespace error
} // namespace spc

template<>
struct fmt::formatter<spc::ErrorCode> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::ErrorCode& ty, fmt_context_ty& ctx) const {
    std::string s;
    switch (ty) {
      case spc::ErrorCode::eNullArgument                   : s = "null_argument";                    break;
      case spc::ErrorCode::eInvalidDimension               : s = "invalid_dimension";                break;
      case spc::ErrorCode::eInvalidBandCount               : s = "invalid_band_count";               break;
      case spc::ErrorCode::eInvalidRadiometricResolution   : s = "invalid_radiometric_resolution";   break;
      case spc::ErrorCode::eBandResolutionMismatch         : s = "band_resolution_mismatch";         break;
      case spc::ErrorCode::eEmptyShell                     : s = "empty_shell";                      break;
      case spc::ErrorCode::eDuplicateBandIndex             : s = "duplicate_band_index";             break;
      case spc::ErrorCode::eIncompatiblePresentationConfig : s = "incompatible_presentation_config"; break;
      case spc::ErrorCode::eNullColorMap                   : s = "null_color_map";                   break;
      case spc::ErrorCode::eEmptyOthersCollection          : s = "empty_others_collection";          break;
      default                                              : s = "undefined";                        break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};
