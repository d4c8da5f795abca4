// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <algorithm>

#include "utils/log.h"
#include "utils/meta.h"
#include "utils/utf8.h"

#include "names.h"
#include "region_index.h"

namespace cpca::geocoder
{

static region_index::name_set const g_empty_names;
static region_index::owner_list const g_empty_owners;

region_index::region_index(
  std::vector<model::administrative_record> const& records)
  : count_(0)
{
  verify_argument(!records.empty());

  for (auto const& record : records) {
    insert(record);
  }

  dbglog << "region index built from " << count_ << " records: " 
         << provinces_.size() << " provinces, "
         << cities_.size() << " cities, "
         << districts_.size() << " districts, "
         << district_to_city_.size() << " district keys.";
}

void region_index::insert(model::administrative_record const& record)
{
  verify_argument(!record.province.empty());
  verify_argument(!record.city.empty());

  provinces_.insert(record.province);
  cities_.insert(record.city);
  province_cities_[record.province].insert(record.city);

  // cities are reachable by their canonical name and without the
  // trailing 市, (深圳市 and 深圳). Other city-level suffixes such
  // as autonomous prefectures are only indexed by the full name.
  city_to_province_[record.city] = record.province;
  auto short_city = utils::strip_suffix(record.city, names::city_suffix);
  if (!short_city.empty() && short_city.size() != record.city.size()) {
    city_to_province_[std::string(short_city)] = record.province;
  }

  if (record.district.has_value()) {
    auto const& district = record.district.value();
    owner const owner { record.province, record.city };

    districts_.insert(district);
    city_districts_[record.city].insert(district);
    district_to_city_[district].push_back(owner);

    for (auto const& suffix : names::district_suffixes) {
      auto short_district = utils::strip_suffix(district, suffix);
      if (!short_district.empty() && short_district.size() != district.size()) {
        district_to_city_[std::string(short_district)].push_back(owner);
      }
    }
  }
  ++count_;
}

region_index::name_set const& region_index::provinces() const
{ return provinces_; }

region_index::name_set const& region_index::cities() const
{ return cities_; }

region_index::name_set const& region_index::districts() const
{ return districts_; }

region_index::name_set const& region_index::cities_of(
  std::string const& province) const
{
  if (auto it = province_cities_.find(province); it != province_cities_.end()) {
    return it->second;
  }
  return g_empty_names;
}

region_index::name_set const& region_index::districts_of(
  std::string const& city) const
{
  if (auto it = city_districts_.find(city); it != city_districts_.end()) {
    return it->second;
  }
  return g_empty_names;
}

std::optional<std::string> region_index::province_of(
  std::string const& city) const
{
  if (auto it = city_to_province_.find(city); it != city_to_province_.end()) {
    return it->second;
  }
  return std::nullopt;
}

region_index::owner_list const& region_index::owners_of(
  std::string const& district) const
{
  if (auto it = district_to_city_.find(district); it != district_to_city_.end()) {
    return it->second;
  }
  return g_empty_owners;
}

bool region_index::is_municipality(std::string const& province) const
{
  return std::find(
    names::municipalities.begin(), 
    names::municipalities.end(), 
    province) != names::municipalities.end();
}

bool region_index::is_no_district_city(std::string const& city) const
{
  return std::find(
    names::no_district_cities.begin(), 
    names::no_district_cities.end(), 
    city) != names::no_district_cities.end();
}

bool region_index::validate_district(
  std::string const& city, 
  std::string const& district) const
{
  auto const& districts = districts_of(city);
  return districts.find(district) != districts.end();
}

size_t region_index::size() const
{ return count_; }

}  // namespace cpca::geocoder
