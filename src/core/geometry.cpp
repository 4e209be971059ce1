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

#include <spectral/core/geometry.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>

namespace spc {
  Polygon GeometryFactory::create_polygon(Ring shell, std::vector<Ring> holes, json metadata) const {
    spc_trace();
    if (shell.empty())
      throw error::empty_shell("shell");
    if (std::ranges::any_of(holes, [](const Ring &r) { return r.empty(); }))
      throw error::empty_shell("hole");
    return Polygon { std::move(shell), std::move(holes), metadata_or_empty(metadata) };
  }
} // namespace spc
