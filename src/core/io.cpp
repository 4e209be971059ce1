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

#include <spectral/core/io.hpp>
#include <spectral/core/utility.hpp>
#include <algorithm>
#include <fstream>
#include <ranges>
#include <sstream>

namespace spc::io {
  namespace detail {
    constexpr static double nm = 1e-9;
  } // namespace detail

  std::string load_string(const fs::path &path) {
    spc_trace();

    // Check that file path exists
    debug::check_expr(fs::exists(path),
      fmt::format("failed to resolve path \"{}\"", path.string()));

    // Attempt to open file stream
    std::ifstream ifs(path, std::ios::ate);
    debug::check_expr(ifs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Read file size and construct string to hold data
    size_t file_size = static_cast<size_t>(ifs.tellg());
    std::string str(file_size, ' ');

    // Set input position to start, then read full file into buffer
    ifs.seekg(0);
    ifs.read(str.data(), file_size);
    ifs.close();

    return str;
  }

  void save_string(const fs::path &path, const std::string &str) {
    spc_trace();

    // Attempt to open output file stream in text mode
    std::ofstream ofs(path, std::ios::out);
    debug::check_expr(ofs.is_open(),
      fmt::format("failed to open file \"{}\"", path.string()));

    // Write string directly to file in text mode
    ofs.write(str.data(), str.size());
    ofs.close();
  }

  std::vector<SpectralRange> load_band_ranges(const fs::path &path) {
    spc_trace();

    std::vector<SpectralRange> ranges;

    // Read band file as string, and parse line by line
    std::stringstream ss(load_string(path));
    std::string line;
    uint        line_nr = 0;
    while (std::getline(ss, line)) {
      line_nr++;
      std::ranges::replace(line, '\t', ' ');
      auto split = line
                 | std::views::split(' ')
                 | std::views::transform([](auto &&r) { return std::string(r.begin(), r.end()); })
                 | std::views::filter([](const std::string &s) { return !s.empty(); });
      std::vector<std::string> split_vect;
      std::ranges::copy(split, std::back_inserter(split_vect));

      // Skip empty and commented lines
      guard_continue(!split_vect.empty() && split_vect[0][0] != '#');
      debug::check_expr(split_vect.size() >= 2,
        fmt::format("expected two wavelengths on line {} of \"{}\"", line_nr, path.string()));

      ranges.emplace_back(std::stod(split_vect[0]) * detail::nm,
                          std::stod(split_vect[1]) * detail::nm);
    }

    return ranges;
  }

  void save_band_ranges(const fs::path &path, std::span<const SpectralRange> ranges) {
    spc_trace();

    // Parse ranges into string format
    std::stringstream ss;
    for (uint i = 0; i < ranges.size(); ++i) {
      ss << fmt::format("{:.3f} {:.3f}", ranges[i].wavelength_min() / detail::nm,
                                         ranges[i].wavelength_max() / detail::nm);
      if (i < ranges.size() - 1)
        ss << '\n';
    }

    save_string(path, ss.str());
  }
} // namespace spc::io
