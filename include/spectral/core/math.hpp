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

#include <spectral/core/detail/eigen.hpp>
#include <fmt/core.h>
#include <cstdint>
#include <vector>

namespace spc {
  // Shorthand unsigned type
  using uint = unsigned int;

  // Model-space coordinate; two-dimensional coordinates carry z = 0
  using Coordinate = eig::Vector3d;

  // Axis-aligned model-space bounding box
  using Envelope = eig::AlignedBox3d;

  // Ordered list of coordinates forming a ring; closure is implicit
  using Ring = std::vector<Coordinate>;

  inline
  bool is_valid(const Coordinate &c) {
    return c.allFinite();
  }

  // Smallest envelope containing all coordinates in a ring; empty for an empty ring
  inline
  Envelope envelope_of(const Ring &ring) {
    Envelope box;
    for (const auto &c : ring)
      box.extend(c);
    return box;
  }
} // namespace spc

template<>
struct fmt::formatter<spc::Coordinate> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::Coordinate& c, fmt_context_ty& ctx) const {
    return fmt::format_to(ctx.out(), "({}, {}, {})", c.x(), c.y(), c.z());
  }
};
