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

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/compile.h>
#include <exception>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace spc::detail {
  /**
   * Message class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Message {
    std::vector<std::pair<std::string, std::string>> m_messages;
    std::string                                      m_buffer;

  public:
    void put(std::string_view key, std::string_view message) {
      m_messages.emplace_back(std::string(key), std::string(message));
      fmt::format_to(std::back_inserter(m_buffer),
                     FMT_COMPILE("  {:<8} : {}\n"),
                     key,
                     message);
    }

    std::string get() const {
      return m_buffer;
    }

    // Return the first message stored under a key, or an empty string
    std::string get(std::string_view key) const {
      for (const auto &[k, msg] : m_messages)
        if (k == key)
          return msg;
      return { };
    }

    bool contains(std::string_view key) const {
      for (const auto &[k, _] : m_messages)
        if (k == key)
          return true;
      return false;
    }
  };

  /**
   * Exception class which stores a keyed list of strings, which
   * are output line-by-line in a formatted manner, in the order
   * in which they were provided.
   */
  class Exception : public std::exception, public Message {
    mutable std::string m_what;

  public:
    const char * what() const noexcept override {
      m_what = fmt::format("spc::detail::Exception thrown\n{}", get());
      return m_what.c_str();
    }
  };
} // namespace spc::detail
