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

#include <spectral/core/math.hpp>
#include <nlohmann/json_fwd.hpp>
#include <filesystem>

namespace spc {
  namespace fs = std::filesystem;

  // namespace/typename shorthand inside spc namespace; json objects double
  // as the opaque metadata maps attached to spectral geometries
  using json = nlohmann::json;

  namespace io {
    /* json load/save to/from file */
    json load_json(const fs::path &path);
    void save_json(const fs::path &path, const json &js, uint indent = 2);
  } // namespace io

  // Normalize an absent/null metadata value to an empty object
  json metadata_or_empty(const json &js);
} // namespace spc

/* json (de)serializations for specific Eigen types must be declared in Eigen scope */
namespace Eigen {
  void from_json(const spc::json &js, Vector3d &v);
  void to_json(spc::json &js, const Vector3d &v);

  void from_json(const spc::json &js, Matrix4d &m);
  void to_json(spc::json &js, const Matrix4d &m);
} // namespace Eigen
