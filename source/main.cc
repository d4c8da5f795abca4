// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <string>
#include <sstream>
#include <iostream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>

#include "import/region_reader.h"
#include "geocoder/parser.h"
#include "services/address.h"

#include "utils/log.h"
#include "utils/utf8.h"

/**
 * Lines that look like a JSON object are service requests, anything
 * else is taken as a bare address and parsed.
 */
static json_t read_request(std::string const& line)
{
  json_t request;
  if (!line.empty() && line.front() == '{') {
    std::stringstream ss(line);
    boost::property_tree::read_json(ss, request);
  } else {
    request.put("method", "parse");
    request.put("text", line);
  }
  return request;
}

static void write_response(json_t const& response)
{
  boost::property_tree::write_json(std::cout, response, false);
  std::cout.flush();
}

int main(int argc, const char** argv)
{
  using namespace cpca;

  if (argc != 2) {
    std::cerr << "usage: " << argv[0] 
              << " <config-file>"
              << std::endl;
    return 1;
  }

  try {
    // this holds logging config and gazetteer location
    boost::property_tree::ptree systemconfig;
    boost::property_tree::read_json(argv[1], systemconfig);

    logging::init(systemconfig.get_child("logging", json_t()));

    // construction is the expensive part, it happens exactly once
    // and the parser is shared read-only for all requests.
    auto source = import::gazetteer_source::from_config(systemconfig);
    geocoder::parser engine(source.load());
    services::address_service service(engine);

    infolog << "reading requests from stdin.";

    std::string line;
    size_t served = 0;
    while (std::getline(std::cin, line)) {
      line = utils::trim(line);
      if (line.empty()) {
        continue;
      }

      try {
        write_response(service.invoke(read_request(line)));
      } catch (std::exception const& e) {
        warnlog << "request failed: " << e.what();
        json_t error;
        error.put("error", e.what());
        write_response(error);
      }
      ++served;
    }

    infolog << "served " << served << " requests.";
    
  } catch (std::exception const& e) {
    errlog << "fatal: " << e.what();
    return 1;
  }
  return 0;
}
