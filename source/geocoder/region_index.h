// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <set>
#include <string>
#include <vector>
#include <utility>
#include <optional>
#include <unordered_map>

#include "model/address.h"

namespace cpca::geocoder
{

/**
 * Multi-directional lookup tables over the administrative gazetteer.
 *
 * Built once from the full record list and read-only afterwards, so
 * a single instance can be shared by any number of reader threads.
 * Besides canonical names, the reverse maps are also keyed by the
 * abbreviated forms (suffix removed) of cities and districts.
 */
class region_index final
{
public:  // domain types
  using name_set = std::set<std::string>;
  
  /**
   * A (province, city) pair that owns a district.
   */
  using owner = std::pair<std::string, std::string>;
  using owner_list = std::vector<owner>;

public:
  /**
   * Indexes all records in a single pass. 
   * 
   * The record list must not be empty, loading and deduplicating the
   * gazetteer is the responsibility of the caller.
   */
  region_index(std::vector<model::administrative_record> const& records);

public:  // canonical name sets
  name_set const& provinces() const;
  name_set const& cities() const;
  name_set const& districts() const;

  /**
   * Canonical cities of a canonical province, empty if unknown.
   */
  name_set const& cities_of(std::string const& province) const;

  /**
   * Canonical districts of a canonical city, empty if unknown
   * or if the city has no county-level subdivision.
   */
  name_set const& districts_of(std::string const& city) const;

public:  // reverse lookups
  /**
   * Province of a city given by its canonical or abbreviated name.
   */
  std::optional<std::string> province_of(std::string const& city) const;

  /**
   * All (province, city) pairs owning a district with this canonical
   * or abbreviated name, in gazetteer order. More than one entry means
   * the name is ambiguous without further context.
   */
  owner_list const& owners_of(std::string const& district) const;

public:  // predicates
  bool is_municipality(std::string const& province) const;
  bool is_no_district_city(std::string const& city) const;

  /**
   * Strict membership test, true only if district is the canonical
   * name of one of the districts registered under city.
   */
  bool validate_district(
    std::string const& city, 
    std::string const& district) const;

public:
  /**
   * Number of records this index was built from.
   */
  size_t size() const;

private:
  void insert(model::administrative_record const& record);

private:
  size_t count_;
  name_set provinces_;
  name_set cities_;
  name_set districts_;
  std::unordered_map<std::string, name_set> province_cities_;
  std::unordered_map<std::string, std::string> city_to_province_;
  std::unordered_map<std::string, name_set> city_districts_;
  std::unordered_map<std::string, owner_list> district_to_city_;
};

}  // namespace cpca::geocoder
