// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include "address.h"

namespace cpca::model 
{

std::string administrative_record::full_name() const
{
  std::string output = province + city;
  if (district.has_value()) {
    output += district.value();
  }
  return output;
}

bool administrative_record::operator==(administrative_record const& other) const
{
  return province == other.province 
      && city == other.city 
      && district == other.district;
}

bool administrative_record::operator!=(administrative_record const& other) const
{ return !(*this == other); }

bool parsed_address::has_province() const
{ return province.has_value(); }

bool parsed_address::has_city() const
{ return city.has_value(); }

bool parsed_address::has_district() const
{ return district.has_value(); }

bool parsed_address::is_complete() const
{ return has_province() && has_city() && has_district(); }

std::string parsed_address::full_address() const
{
  std::string output;
  if (province.has_value()) {
    output += province.value();
  }
  if (city.has_value() && city != province) {
    output += city.value();
  }
  if (district.has_value()) {
    output += district.value();
  }
  output += detail;
  return output;
}

json_t parsed_address::to_json() const
{
  json_t output;
  if (province.has_value()) {
    output.put("province", province.value());
  }
  if (city.has_value()) {
    output.put("city", city.value());
  }
  if (district.has_value()) {
    output.put("district", district.value());
  }
  output.put("detail", detail);
  output.put("complete", is_complete());
  output.put("full", full_address());
  return output;
}

bool parsed_address::operator==(parsed_address const& other) const
{
  return province == other.province 
      && city == other.city 
      && district == other.district 
      && detail == other.detail;
}

bool parsed_address::operator!=(parsed_address const& other) const
{ return !(*this == other); }

}  // namespace cpca::model
