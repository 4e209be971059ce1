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
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace spc {
  /* Polygon.
     Plain vector boundary; a shell ring with optional hole rings. */
  struct Polygon {
    Ring              shell;
    std::vector<Ring> holes;
    json              metadata = json::object();

  public:
    Envelope envelope() const { return envelope_of(shell); }

    bool operator==(const Polygon &o) const = default;
  };

  /* GeometryFactory.
     Generic geometry factory; creates plain geometries, and keeps a registry
     of extension factories keyed by their type, so that specialized builders
     can be attached to, and looked up from, a shared factory instance.
     Registered extensions are immutable. */
  class GeometryFactory {
    mutable std::mutex                                               m_mutex;
    std::unordered_map<std::type_index, std::shared_ptr<const void>> m_extensions;

  public:
    GeometryFactory() = default;

    // Non-copyable, as extensions are shared by reference
    GeometryFactory(const GeometryFactory &) = delete;
    GeometryFactory &operator=(const GeometryFactory &) = delete;

    // Create a polygon; the shell and every hole must be non-empty
    Polygon create_polygon(Ring shell, std::vector<Ring> holes = { }, json metadata = json::object()) const;

  public: // Extension registry
    template <typename Ty>
    void set_extension(std::shared_ptr<Ty> extension) {
      debug::check_expr(extension != nullptr, "extension must not be null");
      std::lock_guard lock(m_mutex);
      m_extensions[std::type_index(typeid(Ty))] = std::move(extension);
    }

    template <typename Ty>
    bool has_extension() const {
      std::lock_guard lock(m_mutex);
      return m_extensions.contains(std::type_index(typeid(Ty)));
    }

    // Registered extension of a type; nullptr if none is registered
    template <typename Ty>
    std::shared_ptr<const Ty> extension() const {
      std::lock_guard lock(m_mutex);
      auto it = m_extensions.find(std::type_index(typeid(Ty)));
      guard(it != m_extensions.end(), nullptr);
      return std::static_pointer_cast<const Ty>(it->second);
    }

    // Registered extension of a type; registers the result of make() first if
    // none is registered. Registration and lookup happen under one lock
    template <typename Ty, typename MakeTy>
    std::shared_ptr<const Ty> ensure_extension(MakeTy &&make) {
      std::lock_guard lock(m_mutex);
      auto key = std::type_index(typeid(Ty));
      if (auto it = m_extensions.find(key); it != m_extensions.end())
        return std::static_pointer_cast<const Ty>(it->second);

      // Nothing is registered if make() throws
      std::shared_ptr<const Ty> ptr = make();
      debug::check_expr(ptr != nullptr, "extension must not be null");
      m_extensions.emplace(key, ptr);
      return ptr;
    }
  };

  /* json (de)serialization for plain polygons */
  void from_json(const json &js, Polygon &p);
  void to_json(json &js, const Polygon &p);
} // namespace spc
