// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <set>
#include <vector>
#include <unordered_map>

#include "utils/log.h"
#include "utils/error.h"

#include "address.h"

namespace cpca::services
{

inline static void throw_if_missing(json_t const& json, const char* path)
{
  if (!json.get_child_optional(path).has_value()) {
    std::string message = "missing request param ";
    throw bad_request((message + path).c_str());
  }
}

static json_t to_json_array(std::set<std::string> const& names)
{
  json_t output;
  for (auto const& name : names) {
    json_t item;
    item.put_value(name);
    output.push_back(std::make_pair("", std::move(item)));
  }
  return output;
}

address_service::address_service(geocoder::parser const& engine)
  : engine_(engine)
{
}

json_t address_service::invoke(json_t const& params) const
{
  using method_t = json_t (address_service::*)(json_t const&) const;
  static const std::unordered_map<std::string, method_t> methods {
    { "parse", &address_service::parse },
    { "batch", &address_service::batch },
    { "normalize", &address_service::normalize },
    { "validate", &address_service::validate },
    { "provinces", &address_service::provinces },
    { "cities", &address_service::cities },
    { "districts", &address_service::districts }
  };

  throw_if_missing(params, "method");
  auto name = params.get<std::string>("method");
  auto method = methods.find(name);
  if (method == methods.end()) {
    std::string message = "unknown method ";
    throw bad_method((message + name).c_str());
  }

  dbglog << "invoking " << name;
  return (this->*(method->second))(params);
}

json_t address_service::parse(json_t const& params) const
{
  throw_if_missing(params, "text");
  return engine_.parse(params.get<std::string>("text")).to_json();
}

json_t address_service::batch(json_t const& params) const
{
  throw_if_missing(params, "texts");

  std::vector<std::string> texts;
  for (auto const& item : params.get_child("texts")) {
    texts.push_back(item.second.get_value<std::string>());
  }

  json_t results;
  for (auto const& result : engine_.parse_batch(texts)) {
    results.push_back(std::make_pair("", result.to_json()));
  }

  json_t output;
  output.add_child("results", std::move(results));
  return output;
}

json_t address_service::normalize(json_t const& params) const
{
  throw_if_missing(params, "province");
  throw_if_missing(params, "city");

  std::optional<std::string> district;
  if (auto d = params.get_optional<std::string>("district"); d.has_value()) {
    district = d.value();
  }

  json_t output;
  output.put("address", engine_.normalize(
    params.get<std::string>("province"),
    params.get<std::string>("city"),
    district));
  return output;
}

json_t address_service::validate(json_t const& params) const
{
  throw_if_missing(params, "text");
  json_t output;
  output.put("valid", engine_.is_valid_address(
    params.get<std::string>("text")));
  return output;
}

json_t address_service::provinces(json_t const&) const
{
  json_t output;
  output.add_child("provinces", to_json_array(engine_.provinces()));
  return output;
}

json_t address_service::cities(json_t const& params) const
{
  throw_if_missing(params, "province");
  json_t output;
  output.add_child("cities", to_json_array(
    engine_.cities_of_province(params.get<std::string>("province"))));
  return output;
}

json_t address_service::districts(json_t const& params) const
{
  throw_if_missing(params, "city");
  json_t output;
  output.add_child("districts", to_json_array(
    engine_.districts_of_city(params.get<std::string>("city"))));
  return output;
}

}  // namespace cpca::services
