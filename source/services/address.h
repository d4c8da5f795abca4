// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <string>

#include "utils/json.h"
#include "geocoder/parser.h"

namespace cpca::services
{

/**
 * Front-facing JSON interface of the address parser, used by the
 * command line tool to serve one request per input line.
 *
 * Every request is an object with a "method" field and the method
 * parameters next to it:
 *
 *   {"method": "parse", "text": "广东省深圳市南山区科技园"}
 *   {"method": "batch", "texts": ["北京朝阳区", "深圳南山"]}
 *   {"method": "normalize", "province": "广东", "city": "深圳", "district": "南山"}
 *   {"method": "validate", "text": "深圳市"}
 *   {"method": "provinces"}
 *   {"method": "cities", "province": "广东"}
 *   {"method": "districts", "city": "深圳"}
 */
class address_service final
{
public:
  address_service(geocoder::parser const& engine);

public:
  /**
   * Gets called for every request, possibly from multiple threads.
   * 
   * Throws bad_request if a required parameter is missing and
   * bad_method if the method is not known.
   */
  json_t invoke(json_t const& params) const;

private:
  json_t parse(json_t const& params) const;
  json_t batch(json_t const& params) const;
  json_t normalize(json_t const& params) const;
  json_t validate(json_t const& params) const;
  json_t provinces(json_t const& params) const;
  json_t cities(json_t const& params) const;
  json_t districts(json_t const& params) const;

private:
  geocoder::parser const& engine_;
};

}  // namespace cpca::services
