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

#include <spectral/core/presentation.hpp>
#include <spectral/core/exception.hpp>
#include <algorithm>
#include <array>

namespace spc {
  namespace detail {
    // Static value channel exposed by color-mapped layouts
    constexpr static std::array<ColorSpaceBand, 1> value_band = { ColorSpaceBand::eValue };

    // Field names reported for negative channel indices, per canonical channel
    constexpr static std::array<std::string_view, 4> rgb_index_fields = {
      "index_of_red_band", "index_of_green_band", "index_of_blue_band", "index_of_fourth_band"
    };
  } // namespace detail

  std::vector<ColorSpaceBand> canonical_bands(ColorSpace color_space) {
    using enum ColorSpaceBand;
    switch (color_space) {
      case ColorSpace::eRGB:    return { eRed, eGreen, eBlue };
      case ColorSpace::eHSV:    return { eHue, eSaturation, eValue };
      case ColorSpace::eHSL:    return { eHue, eSaturation, eLightness };
      case ColorSpace::eCMYK:   return { eCyan, eMagenta, eYellow, eBlack };
      case ColorSpace::eYCbCr:  return { eLuma, eBlueDifferenceChroma, eRedDifferenceChroma };
      case ColorSpace::eCIELab: return { eLightness, eA, eB };
      default:                  return { };
    }
  }

  Presentation::Presentation(PresentationModel model, ColorSpace color_space, std::vector<ColorSpaceBand> bands)
  : m_model(model) {
    spc_trace();
    if (spc::is_color_mapped(model))
      throw error::incompatible_presentation_config(fmt::format("{}", model),
        "pseudo-color and density slicing models must define a color map");
    m_layout = BandLayout { color_space, std::move(bands) };
  }

  Presentation::Presentation(PresentationModel model, ColorMap color_map)
  : m_model(model) {
    spc_trace();
    if (!spc::is_color_mapped(model))
      throw error::incompatible_presentation_config(fmt::format("{}", model),
        "only pseudo-color and density slicing models can define a color map");
    if (color_map.empty())
      throw error::null_color_map();
    m_layout = ColorMapLayout { std::move(color_map) };
  }

  Presentation Presentation::from_band_indices(PresentationModel    model,
                                               ColorSpace           color_space,
                                               std::span<const int> indices) {
    spc_trace();

    auto channels = canonical_bands(color_space);
    if (channels.empty())
      throw error::incompatible_presentation_config(fmt::format("{}", model),
        fmt::format("color space {} has no channels to place", color_space));
    if (indices.size() != channels.size())
      throw error::invalid_dimension("band_indices", static_cast<long long>(indices.size()));

    // Negative or unrealizable indices are reported per channel, duplicates over the full list
    for (size_t i = 0; i < indices.size(); ++i) {
      guard_continue(indices[i] < 0 || static_cast<uint>(indices[i]) >= max_band_count);
      auto field = color_space == ColorSpace::eRGB
                 ? detail::rgb_index_fields[i]
                 : std::string_view("band_indices");
      throw error::invalid_dimension(field, indices[i]);
    }
    for (size_t i = 0; i < indices.size(); ++i)
      for (size_t j = i + 1; j < indices.size(); ++j)
        if (indices[i] == indices[j])
          throw error::duplicate_band_index(indices);

    size_t band_count = static_cast<size_t>(*std::ranges::max_element(indices)) + 1;
    std::vector<ColorSpaceBand> bands(band_count, ColorSpaceBand::eUnused);
    for (size_t i = 0; i < indices.size(); ++i)
      bands[indices[i]] = channels[i];

    return Presentation(model, color_space, std::move(bands));
  }

  Presentation Presentation::true_color() {
    return true_color(ColorSpace::eRGB);
  }

  Presentation Presentation::true_color(ColorSpace color_space) {
    auto bands = canonical_bands(color_space);
    if (bands.empty())
      throw error::incompatible_presentation_config("true_color",
        fmt::format("color space {} is not supported for true color", color_space));
    return Presentation(PresentationModel::eTrueColor, color_space, std::move(bands));
  }

  Presentation Presentation::true_color(int index_of_red_band, int index_of_green_band, int index_of_blue_band) {
    std::array<int, 3> indices = { index_of_red_band, index_of_green_band, index_of_blue_band };
    return from_band_indices(PresentationModel::eTrueColor, ColorSpace::eRGB, indices);
  }

  Presentation Presentation::false_color(int index_of_red_band, int index_of_green_band, int index_of_blue_band) {
    std::array<int, 3> indices = { index_of_red_band, index_of_green_band, index_of_blue_band };
    return from_band_indices(PresentationModel::eFalseColor, ColorSpace::eRGB, indices);
  }

  Presentation Presentation::grayscale() {
    return Presentation(PresentationModel::eGrayscale, ColorSpace::eNone, { });
  }

  Presentation Presentation::inverted_grayscale() {
    return Presentation(PresentationModel::eInvertedGrayscale, ColorSpace::eNone, { });
  }

  Presentation Presentation::transparency() {
    return Presentation(PresentationModel::eTransparency, ColorSpace::eNone, { });
  }

  Presentation Presentation::pseudo_color(ColorMap color_map) {
    return Presentation(PresentationModel::ePseudoColor, std::move(color_map));
  }

  Presentation Presentation::density_slicing(ColorMap color_map) {
    return Presentation(PresentationModel::eDensitySlicing, std::move(color_map));
  }

  ColorSpace Presentation::color_space() const {
    return m_layout | visit {
      [](const BandLayout &l)     { return l.color_space;    },
      [](const ColorMapLayout &)  { return ColorSpace::eNone; }
    };
  }

  std::span<const ColorSpaceBand> Presentation::bands() const {
    return m_layout | visit {
      [](const BandLayout &l)    { return std::span<const ColorSpaceBand>(l.bands); },
      [](const ColorMapLayout &) { return std::span<const ColorSpaceBand>(detail::value_band); }
    };
  }

  const ColorMap * Presentation::color_map() const {
    auto *l = std::get_if<ColorMapLayout>(&m_layout);
    guard(l, nullptr);
    return &l->color_map;
  }

  uint Presentation::referenced_band_count() const {
    return static_cast<uint>(bands().size());
  }
} // namespace spc
