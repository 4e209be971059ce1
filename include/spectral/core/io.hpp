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
#include <spectral/core/spectral_range.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace spc {
  namespace io {
    // Simple string load/save to/from file
    std::string load_string(const fs::path &path);
    void        save_string(const fs::path &path, const std::string &string);

    // Simple band table load/save to/from file
    // Input should be a text file, containing a minimum and maximum wavelength in
    // nanometers per line, and optional comments marked with '#'. Each line describes
    // the spectral range of one sensor band.
    std::vector<SpectralRange> load_band_ranges(const fs::path &path);
    void                       save_band_ranges(const fs::path &path, std::span<const SpectralRange> ranges);
  } // namespace io
} // namespace spc
