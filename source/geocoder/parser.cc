// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <algorithm>
#include <execution>

#include <boost/algorithm/string/predicate.hpp>

#include "utils/log.h"
#include "utils/utf8.h"

#include "names.h"
#include "parser.h"

namespace cpca::geocoder
{

using match_t = std::optional<prefix_tree::match>;

/**
 * Strips trailing county-level suffix characters for as long as there
 * are any, 凌源市 -> 凌源.
 */
static std::string_view strip_district_suffixes(std::string_view name)
{
  bool stripped = true;
  while (stripped && !name.empty()) {
    stripped = false;
    for (auto const& suffix : names::district_suffixes) {
      auto shorter = utils::strip_suffix(name, suffix);
      if (shorter.size() != name.size()) {
        name = shorter;
        stripped = true;
        break;
      }
    }
  }
  return name;
}

static bool is_qualified_district(std::string const& district)
{
  return std::any_of(
    names::qualified_district_suffixes.begin(),
    names::qualified_district_suffixes.end(),
    [&district](auto const& suffix) {
      return boost::algorithm::ends_with(district, suffix);
    });
}

/**
 * Decides whether the text at the current position reads better as a
 * district than as a city. Only applies without province context, with
 * a known province the city is always resolved first. 
 * 
 * 朝阳区 must not be split into the city 朝阳(市) followed by 区.
 */
static bool prefer_district(
  bool has_province, 
  match_t const& city, 
  match_t const& district)
{
  if (has_province || !district.has_value()) {
    return false;
  }
  if (!city.has_value()) {
    return true;
  }
  return district->length > city->length 
      || is_qualified_district(district->value);
}

parser::parser(std::vector<model::administrative_record> const& records)
  : index_(records)
{
  auto const& aliases = names::province_aliases();
  for (auto const& province : index_.provinces()) {
    provinces_.insert(province, province);
  }
  for (auto const& [alias, province] : aliases) {
    if (index_.provinces().count(province) != 0) {
      provinces_.insert(alias, province);
    }
  }

  for (auto const& city : index_.cities()) {
    cities_.insert(city, city);
    auto short_city = utils::strip_suffix(city, names::city_suffix);
    if (!short_city.empty() && short_city.size() != city.size()) {
      cities_.insert(short_city, city);
    }
  }

  for (auto const& district : index_.districts()) {
    districts_.insert(district, district);
    for (auto const& suffix : names::district_suffixes) {
      auto short_district = utils::strip_suffix(district, suffix);
      if (short_district.size() == district.size()) {
        continue;  // no such suffix
      }
      // single character short names collide with too many 
      // unrelated words in the detail part of addresses.
      if (utils::char_count(short_district) >= 2) {
        districts_.insert(short_district, district);
      }
    }
  }

  infolog << "address parser ready with " 
          << provinces_.size() << " province names, "
          << cities_.size() << " city names and "
          << districts_.size() << " district names.";
}

model::parsed_address parser::parse(std::string_view text) const
{
  model::parsed_address result;
  std::string const address = utils::trim(text);
  if (address.empty()) {
    return result;
  }

  std::string_view remaining(address);
  auto consume = [&remaining](prefix_tree::match const& m) {
    remaining.remove_prefix(m.length);
  };

  // 1. province, municipalities short-circuit the rest of the algorithm
  if (auto province = provinces_.longest_prefix(remaining); province.has_value()) {
    result.province = province->value;
    consume(*province);

    if (index_.is_municipality(province->value)) {
      result.city = province->value;
      if (auto district = districts_.longest_prefix(remaining); 
          district.has_value() && 
          index_.validate_district(province->value, district->value)) {
        result.district = district->value;
        consume(*district);
      }
      result.detail = utils::trim(remaining);
      return result;
    }
  }

  // 2. city, unless the text is better read as a district
  auto city_match = cities_.longest_prefix(remaining);
  auto district_match = districts_.longest_prefix(remaining);

  if (prefer_district(result.has_province(), city_match, district_match)) {
    result.district = district_match->value;
    consume(*district_match);

    // infer upwards only if the district name is unique in the country
    auto const& owners = index_.owners_of(district_match->value);
    if (owners.size() == 1) {
      result.province = owners.front().first;
      result.city = owners.front().second;
    }
  } else if (city_match.has_value()) {
    auto city_province = index_.province_of(city_match->value);
    if (!result.has_province() || city_province == result.province) {
      result.city = city_match->value;
      consume(*city_match);
      if (!result.has_province()) {
        result.province = std::move(city_province);
      }
    }
  }

  // 3. district, if not already taken in the previous step
  if (!result.has_district()) {
    auto district = districts_.longest_prefix(remaining);
    bool valid = district.has_value();
    if (valid && result.has_city()) {
      auto const& city = result.city.value();
      valid = !index_.is_no_district_city(city) && 
        (index_.validate_district(city, district->value) ||
         validate_district_flexible(city, district->value));
    }

    if (valid) {
      result.district = district->value;
      consume(*district);

      if (!result.has_city()) {
        auto const& owners = index_.owners_of(district->value);
        if (owners.size() == 1) {
          result.province = owners.front().first;
          result.city = owners.front().second;
        } else if (result.has_province()) {
          auto owner = std::find_if(owners.begin(), owners.end(), 
            [&result](auto const& o) { return o.first == result.province; });
          if (owner != owners.end()) {
            result.city = owner->second;
          }
        }
      }

      if (!result.has_province() && result.has_city()) {
        result.province = index_.province_of(result.city.value());
      }
    }
  }

  // 4. municipality reached through inference
  if (result.has_province() && !result.has_city() &&
      index_.is_municipality(result.province.value())) {
    result.city = result.province;
  }

  tracelog << "parsed '" << address << "' as [" 
           << result.province.value_or("-") << ", "
           << result.city.value_or("-") << ", "
           << result.district.value_or("-") << "]";

  result.detail = utils::trim(remaining);
  return result;
}

std::vector<model::parsed_address> parser::parse_batch(
  std::vector<std::string> const& texts) const
{
  std::vector<model::parsed_address> results(texts.size());
  std::transform(std::execution::par, 
    texts.begin(), texts.end(), results.begin(),
    [this](std::string const& text) { return parse(text); });
  return results;
}

bool parser::validate_district_flexible(
  std::string const& city, 
  std::string const& district) const
{
  for (auto const& registered : index_.districts_of(city)) {
    if (boost::algorithm::starts_with(registered, district) ||
        boost::algorithm::starts_with(district, 
          strip_district_suffixes(registered))) {
      return true;
    }
  }
  return false;
}

std::string parser::resolve_province(std::string const& province) const
{
  auto const& aliases = names::province_aliases();
  if (auto alias = aliases.find(province); alias != aliases.end()) {
    return alias->second;
  }
  if (index_.provinces().count(province) != 0) {
    return province;
  }
  auto with_suffix = province + std::string(names::province_suffix);
  if (index_.provinces().count(with_suffix) != 0) {
    return with_suffix;
  }
  return province;
}

std::string parser::resolve_city(std::string const& city) const
{
  if (index_.cities().count(city) != 0) {
    return city;
  }
  auto with_suffix = city + std::string(names::city_suffix);
  if (index_.cities().count(with_suffix) != 0) {
    return with_suffix;
  }
  return city;
}

std::string parser::resolve_district(std::string const& district) const
{
  if (index_.districts().count(district) != 0) {
    return district;
  }
  for (auto const& suffix : names::completion_suffixes) {
    auto with_suffix = district + std::string(suffix);
    if (index_.districts().count(with_suffix) != 0) {
      return with_suffix;
    }
  }
  return district;
}

std::string parser::normalize(
  std::string const& province,
  std::string const& city,
  std::optional<std::string> const& district) const
{
  std::string output = resolve_province(province);
  output += resolve_city(city);
  if (district.has_value()) {
    output += resolve_district(district.value());
  }
  return output;
}

bool parser::is_valid_address(std::string_view text) const
{
  auto result = parse(text);
  return result.has_province() || result.has_city();
}

std::set<std::string> parser::provinces() const
{ return index_.provinces(); }

std::set<std::string> parser::cities_of_province(
  std::string const& province) const
{ return index_.cities_of(resolve_province(province)); }

std::set<std::string> parser::districts_of_city(
  std::string const& city) const
{ return index_.districts_of(resolve_city(city)); }

region_index const& parser::index() const
{ return index_; }

}  // namespace cpca::geocoder
