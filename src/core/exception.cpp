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

#include <spectral/core/exception.hpp>

namespace spc {
  ConfigError::ConfigError(ErrorCode code)
  : m_code(code) {
    put("code", fmt::format("{}", code));
  }

  const char * ConfigError::what() const noexcept {
    m_what = fmt::format("spc::ConfigError thrown\n{}", get());
    return m_what.c_str();
  }

  namespace error {
    ConfigError null_argument(std::string_view field) {
      ConfigError e(ErrorCode::eNullArgument);
      e.put("field",   field);
      e.put("message", fmt::format("\"{}\" is null or empty", field));
      return e;
    }

    ConfigError invalid_dimension(std::string_view field, long long value) {
      ConfigError e(ErrorCode::eInvalidDimension);
      e.put("field",   field);
      e.put("value",   fmt::format("{}", value));
      e.put("message", fmt::format("\"{}\" is out of range", field));
      return e;
    }

    ConfigError invalid_band_count(long long value) {
      ConfigError e(ErrorCode::eInvalidBandCount);
      e.put("field",   "band_count");
      e.put("value",   fmt::format("{}", value));
      e.put("message", "number of bands is less than 1");
      return e;
    }

    ConfigError invalid_radiometric_resolution(long long value) {
      ConfigError e(ErrorCode::eInvalidRadiometricResolution);
      e.put("field",   "radiometric_resolution");
      e.put("value",   fmt::format("{}", value));
      e.put("message", "radiometric resolution is not in [1, 64]");
      return e;
    }

    ConfigError band_resolution_mismatch(size_t expected, size_t actual) {
      ConfigError e(ErrorCode::eBandResolutionMismatch);
      e.put("field",    "radiometric_resolutions");
      e.put("expected", fmt::format("{}", expected));
      e.put("actual",   fmt::format("{}", actual));
      e.put("message",  "number of radiometric resolutions differs from number of bands");
      return e;
    }

    ConfigError empty_shell(std::string_view field) {
      ConfigError e(ErrorCode::eEmptyShell);
      e.put("field",   field);
      e.put("message", fmt::format("\"{}\" contains no coordinates", field));
      return e;
    }

    ConfigError duplicate_band_index(std::span<const int> indices) {
      ConfigError e(ErrorCode::eDuplicateBandIndex);
      e.put("field",   "band_indices");
      e.put("indices", fmt::format("[{}]", fmt::join(indices, ", ")));
      e.put("message", "multiple channels are specified for the same band index");
      return e;
    }

    ConfigError incompatible_presentation_config(std::string_view model, std::string_view reason) {
      ConfigError e(ErrorCode::eIncompatiblePresentationConfig);
      e.put("field",   "model");
      e.put("model",   model);
      e.put("message", reason);
      return e;
    }

    ConfigError null_color_map() {
      ConfigError e(ErrorCode::eNullColorMap);
      e.put("field",   "color_map");
      e.put("message", "the color map is null or empty");
      return e;
    }

    ConfigError empty_others_collection() {
      ConfigError e(ErrorCode::eEmptyOthersCollection);
      e.put("field",   "others");
      e.put("message", "no spectral polygons are specified");
      return e;
    }
  } // namespace error
} // namespace spc
