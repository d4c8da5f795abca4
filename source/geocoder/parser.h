// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <set>
#include <string>
#include <vector>
#include <optional>
#include <string_view>

#include "model/address.h"
#include "region_index.h"
#include "prefix_tree/prefix_tree.h"

namespace cpca::geocoder
{

/**
 * Extracts province, city and district from free-form Chinese addresses.
 *
 * The parser owns the region index and three prefix trees (provinces,
 * cities and districts, each with their abbreviations). All of them are
 * built in the constructor and never mutated afterwards, construction is
 * expensive, parsing is cheap and safe to call from many threads on the
 * same instance.
 */
class parser final
{
public:
  parser(std::vector<model::administrative_record> const& records);

public: // move only semantics
  parser(parser&&) = default;
  parser& operator=(parser&&) = default;

private: // disable copying
  parser(parser const&) = delete;
  parser& operator=(parser const&) = delete;

public:
  /**
   * Splits an address into its administrative levels and the remaining
   * detail text. Never throws, unrecognized input ends up entirely in the
   * detail field.
   *
   * Matching is sequential on a shrinking remainder of the input:
   *  1. province (with the municipality shortcut: city := province and
   *     only districts of that municipality are considered),
   *  2. city or district, whichever is the better interpretation when no
   *     province was given, with the missing levels inferred upwards,
   *  3. district, validated against the known city,
   *  4. municipality backfill of the city level.
   *
   * A district name owned by more than one city is never resolved to any
   * of them without context.
   */
  model::parsed_address parse(std::string_view text) const;

  /**
   * Parses every address independently, results are in input order.
   */
  std::vector<model::parsed_address> parse_batch(
    std::vector<std::string> const& texts) const;

  /**
   * Expands possibly abbreviated names into their canonical forms and
   * concatenates them. Unknown names are kept verbatim. Municipalities 
   * are not deduplicated: ("北京", "北京", "朝阳") -> "北京市北京市朝阳区".
   */
  std::string normalize(
    std::string const& province,
    std::string const& city,
    std::optional<std::string> const& district) const;

  /**
   * True when at least the province or the city was recognized.
   */
  bool is_valid_address(std::string_view text) const;

public:  // gazetteer listings
  std::set<std::string> provinces() const;
  std::set<std::string> cities_of_province(std::string const& province) const;
  std::set<std::string> districts_of_city(std::string const& city) const;

public:
  region_index const& index() const;

private:
  std::string resolve_province(std::string const& province) const;
  std::string resolve_city(std::string const& city) const;
  std::string resolve_district(std::string const& district) const;

  /**
   * Best-effort fallback for abbreviated districts whose short form was
   * registered for a different canonical name elsewhere in the country.
   * Accepts the district when one of the city's districts starts with it,
   * or when it starts with a city's district stripped of its suffix.
   */
  bool validate_district_flexible(
    std::string const& city, 
    std::string const& district) const;

private:
  region_index index_;
  prefix_tree provinces_;
  prefix_tree cities_;
  prefix_tree districts_;
};

}  // namespace cpca::geocoder
