// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <array>
#include <string>
#include <string_view>
#include <unordered_map>

namespace cpca::geocoder::names
{
// administrative suffixes
inline constexpr std::string_view province_suffix = "省";
inline constexpr std::string_view city_suffix = "市";

/**
 * Suffixes of county-level units. A district registered under one
 * of those is also indexed under its name with the suffix removed.
 */
inline constexpr std::array<std::string_view, 4> district_suffixes {
  "区", "县", "市", "旗"
};

/**
 * A district whose canonical name ends with one of those is a fully
 * qualified county-level name and never a shortened city name.
 */
inline constexpr std::array<std::string_view, 3> qualified_district_suffixes {
  "区", "县", "旗"
};

/**
 * Suffixes tried in this order when completing an abbreviated
 * district name during normalization.
 */
inline constexpr std::array<std::string_view, 3> completion_suffixes {
  "区", "县", "市"
};

/**
 * Province-level units that are their own city-level unit.
 */
inline constexpr std::array<std::string_view, 4> municipalities {
  "北京市", "上海市", "天津市", "重庆市"
};

/**
 * Prefecture-level cities without county-level subdivision.
 */
inline constexpr std::array<std::string_view, 4> no_district_cities {
  "东莞市", "中山市", "儋州市", "嘉峪关市"
};

/**
 * Colloquial short names of all province-level units mapped to their
 * canonical names: provinces, autonomous regions, municipalities and
 * special administrative regions.
 */
std::unordered_map<std::string, std::string> const& province_aliases();

}  // namespace cpca::geocoder::names
