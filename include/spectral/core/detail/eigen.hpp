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

#include <Eigen/Dense>
#include <Eigen/Geometry>
#include <cstdint>

// Introduce 'eig' namespace shorthand in the spectral namespace
namespace spc {
  namespace eig = Eigen;
} // namespace spc

namespace Eigen {
  /* Define raster sample storage types; rows x columns, row-major to match
     the (row, column) addressing used by rasters and their mappers */

  using ArrayXXu64 = Array<std::uint64_t, Dynamic, Dynamic, RowMajor>;
  using ArrayXXd_r = Array<double,        Dynamic, Dynamic, RowMajor>;
} // namespace Eigen
