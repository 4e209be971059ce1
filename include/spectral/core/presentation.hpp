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
#include <map>
#include <span>
#include <variant>
#include <vector>

namespace spc {
  // Rule mapping raster band values to displayable color
  enum class PresentationModel : uint {
    eTrueColor,
    eFalseColor,
    eGrayscale,
    eInvertedGrayscale,
    eTransparency,
    ePseudoColor,
    eDensitySlicing
  };

  // Color space in which band-list presentations are interpreted
  enum class ColorSpace : uint {
    eRGB,
    eHSV,
    eHSL,
    eCMYK,
    eYCbCr,
    eCIELab,
    eNone
  };

  // Channel of a color space that a raster band is displayed as
  enum class ColorSpaceBand : uint {
    eUnused, // raster band takes no part in the presentation
    eRed,
    eGreen,
    eBlue,
    eHue,
    eSaturation,
    eValue,
    eLightness,
    eCyan,
    eMagenta,
    eYellow,
    eBlack,
    eLuma,
    eBlueDifferenceChroma,
    eRedDifferenceChroma,
    eA,
    eB
  };

  // Palette lookup; raster value -> color components of its palette entry
  using ColorMap = std::map<int, std::vector<uint>>;

  // Whether a model is displayed through a color map rather than a band list
  constexpr bool is_color_mapped(PresentationModel model) {
    return model == PresentationModel::ePseudoColor || model == PresentationModel::eDensitySlicing;
  }

  // Channels of a color space in canonical order, e.g. RGB -> red, green, blue;
  // empty for ColorSpace::eNone
  std::vector<ColorSpaceBand> canonical_bands(ColorSpace color_space);

  /* Presentation.
     Describes how raster bands map to displayable color. A presentation either
     carries an ordered band list (one entry per raster band index) in a color space,
     or a color map over a single value channel; never both. */
  class Presentation {
  public:
    struct BandLayout {
      ColorSpace                  color_space = ColorSpace::eNone;
      std::vector<ColorSpaceBand> bands;

      bool operator==(const BandLayout &o) const = default;
    };

    struct ColorMapLayout {
      ColorMap color_map;

      bool operator==(const ColorMapLayout &o) const = default;
    };

    using Layout = std::variant<BandLayout, ColorMapLayout>;

    // Upper bound on the band list length produced by explicit band indices
    constexpr static uint max_band_count = 1u << 16;

  private:
    PresentationModel m_model  = PresentationModel::eGrayscale;
    Layout            m_layout = BandLayout { };

  public: // Constructors
    // Default presentation; grayscale over no particular color space
    Presentation() = default;

    // Band-list presentation; fails for color-mapped models
    Presentation(PresentationModel model, ColorSpace color_space, std::vector<ColorSpaceBand> bands);

    // Color-map presentation; fails for band-list models or an empty map
    Presentation(PresentationModel model, ColorMap color_map);

  public: // Factory methods
    static Presentation true_color();
    static Presentation true_color(ColorSpace color_space);
    static Presentation true_color(int index_of_red_band, int index_of_green_band, int index_of_blue_band);
    static Presentation false_color(int index_of_red_band, int index_of_green_band, int index_of_blue_band);
    static Presentation grayscale();
    static Presentation inverted_grayscale();
    static Presentation transparency();
    static Presentation pseudo_color(ColorMap color_map);
    static Presentation density_slicing(ColorMap color_map);

    // Place the canonical channels of a color space at explicit raster band indices;
    // indices[i] is the raster band of the i-th canonical channel. The band list
    // is sized to max(indices) + 1, with unfilled slots marked unused; indices
    // must lie in [0, max_band_count)
    static Presentation from_band_indices(PresentationModel    model,
                                          ColorSpace           color_space,
                                          std::span<const int> indices);

  public: // Queries
    PresentationModel model()           const { return m_model;  }
    const Layout     &layout()          const { return m_layout; }
    bool              is_color_mapped() const { return std::holds_alternative<ColorMapLayout>(m_layout); }

    // Color space of band-list layouts; eNone for color-mapped layouts
    ColorSpace color_space() const;

    // Band list; a color-mapped layout exposes its single value channel
    std::span<const ColorSpaceBand> bands() const;

    // Color map; nullptr for band-list layouts
    const ColorMap *color_map() const;

    // Number of raster bands the presentation refers to
    uint referenced_band_count() const;

    bool operator==(const Presentation &o) const = default;
  };

  /* json (de)serialization for presentation types */
  void from_json(const json &js, PresentationModel &m);
  void to_json(json &js, const PresentationModel &m);
  void from_json(const json &js, ColorSpace &c);
  void to_json(json &js, const ColorSpace &c);
  void from_json(const json &js, ColorSpaceBand &b);
  void to_json(json &js, const ColorSpaceBand &b);
  void from_json(const json &js, Presentation &p);
  void to_json(json &js, const Presentation &p);
} // namespace spc

template<>
struct fmt::formatter<spc::PresentationModel> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::PresentationModel& ty, fmt_context_ty& ctx) const {
    using enum spc::PresentationModel;
    std::string s;
    switch (ty) {
      case eTrueColor         : s = "true_color";         break;
      case eFalseColor        : s = "false_color";        break;
      case eGrayscale         : s = "grayscale";          break;
      case eInvertedGrayscale : s = "inverted_grayscale"; break;
      case eTransparency      : s = "transparency";       break;
      case ePseudoColor       : s = "pseudo_color";       break;
      case eDensitySlicing    : s = "density_slicing";    break;
      default                 : s = "undefined";          break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};

template<>
struct fmt::formatter<spc::ColorSpace> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::ColorSpace& ty, fmt_context_ty& ctx) const {
    using enum spc::ColorSpace;
    std::string s;
    switch (ty) {
      case eRGB    : s = "rgb";       break;
      case eHSV    : s = "hsv";       break;
      case eHSL    : s = "hsl";       break;
      case eCMYK   : s = "cmyk";      break;
      case eYCbCr  : s = "ycbcr";     break;
      case eCIELab : s = "cielab";    break;
      case eNone   : s = "none";      break;
      default      : s = "undefined"; break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};

template<>
struct fmt::formatter<spc::ColorSpaceBand> {
  template <typename context_ty>
  constexpr auto parse(context_ty& ctx) {
    return ctx.begin();
  }

  template <typename fmt_context_ty>
  constexpr auto format(const spc::ColorSpaceBand& ty, fmt_context_ty& ctx) const {
    using enum spc::ColorSpaceBand;
    std::string s;
    switch (ty) {
      case eUnused               : s = "unused";                 break;
      case eRed                  : s = "red";                    break;
      case eGreen                : s = "green";                  break;
      case eBlue                 : s = "blue";                   break;
      case eHue                  : s = "hue";                    break;
      case eSaturation           : s = "saturation";             break;
      case eValue                : s = "value";                  break;
      case eLightness            : s = "lightness";              break;
      case eCyan                 : s = "cyan";                   break;
      case eMagenta              : s = "magenta";                break;
      case eYellow               : s = "yellow";                 break;
      case eBlack                : s = "black";                  break;
      case eLuma                 : s = "luma";                   break;
      case eBlueDifferenceChroma : s = "blue_difference_chroma"; break;
      case eRedDifferenceChroma  : s = "red_difference_chroma";  break;
      case eA                    : s = "a";                      break;
      case eB                    : s = "b";                      break;
      default                    : s = "undefined";              break;
    }
    return fmt::format_to(ctx.out(), "{}", s);
  }
};
