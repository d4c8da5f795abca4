// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <boost/property_tree/ptree.hpp>

/**
 * Boost PropertyTree is the JSON representation used for the
 * configuration file, service requests and parsed address output.
 */
using json_t = boost::property_tree::ptree;
