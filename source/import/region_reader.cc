// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <cassert>
#include <fstream>
#include <sstream>
#include <filesystem>
#include <unordered_set>

#include "utils/log.h"
#include "utils/meta.h"
#include "utils/utf8.h"
#include "utils/error.h"

#include "region_reader.h"

namespace cpca::import
{
record_iterator::record_iterator() noexcept
    : line_(0)
{
}

record_iterator::record_iterator(std::string const& filename)
    : record_iterator(std::make_shared<std::ifstream>(filename))
{
}

record_iterator::record_iterator(std::shared_ptr<std::istream> stream)
    : line_(0)
    , stream_(std::move(stream))
{
  verify_argument(stream_ != nullptr);
  skip_header();
  this->operator++();  // ingest first value
}

const model::administrative_record& record_iterator::operator*() const
{
  assert(value_.has_value());
  return *value_;
}

const model::administrative_record* record_iterator::operator->() const
{
  assert(value_.has_value());
  return &(*value_);
}

record_iterator::operator bool() const 
{ return value_.has_value(); }

void record_iterator::skip_header()
{
  std::string header;
  if (std::getline(*stream_, header)) {
    ++line_;
  }
}

std::optional<model::administrative_record> 
record_iterator::parse_line(std::string const& line) const
{
  std::string cell;
  std::vector<std::string> chunks;
  std::stringstream ss(line);
  while (std::getline(ss, cell, ',')) {
    chunks.push_back(utils::trim(cell));
  }

  if (chunks.size() < 3) {
    return std::nullopt;
  }

  model::administrative_record record {
    chunks[1],  // province
    chunks[2],  // city
    std::nullopt
  };

  if (chunks.size() > 3 && !chunks[3].empty()) {
    record.district = chunks[3];
  }

  if (record.province.empty() || record.city.empty()) {
    return std::nullopt;
  }
  return record;
}

record_iterator& record_iterator::operator++()
{
  std::string line;
  while (stream_ && std::getline(*stream_, line)) {
    ++line_;
    if (auto record = parse_line(line); record.has_value()) {
      // got a valid row, stop iterating until the user requests 
      // the next row using another call to operator++.
      value_ = std::move(record);
      return (*this);
    }
    if (!utils::trim(line).empty()) {
      tracelog << "skipping invalid gazetteer row " << line_ << ": " << line;
    }
  }

  // put this iterator in a state that will make it equal to the 
  // past-the-end iterator, so any loops over it would stop.
  value_.reset();
  stream_.reset();
  return (*this);
}

bool record_iterator::operator==(record_iterator const& other) const
{
  if (!value_.has_value() || !other.value_.has_value()) {
    return value_.has_value() == other.value_.has_value();
  }
  return stream_ == other.stream_ && line_ == other.line_;
}

bool record_iterator::operator!=(record_iterator const& other) const
{
  return !((*this) == other);
}

gazetteer_source::gazetteer_source(std::string csvpath)
    : csvpath_(std::move(csvpath))
{
  verify_argument(!csvpath_.empty());
}

gazetteer_source gazetteer_source::from_config(json_t const& systemconfig)
{
  return gazetteer_source(
    systemconfig.get<std::string>("gazetteer.path"));
}

gazetteer_source::iterator gazetteer_source::begin() const
{
  if (!std::filesystem::exists(csvpath_)) {
    std::string message = "gazetteer file does not exist: ";
    throw data_load_error((message + csvpath_).c_str());
  }
  return record_iterator(csvpath_);
}

gazetteer_source::iterator gazetteer_source::end() const
{
  return record_iterator();
}

std::string const& gazetteer_source::path() const
{ return csvpath_; }

std::vector<model::administrative_record> gazetteer_source::load() const
{
  std::vector<model::administrative_record> records;
  std::unordered_set<std::string> seen;

  for (auto const& record : *this) {
    auto key = record.province + '\n' + record.city + '\n' + 
      (record.district.has_value() ? "+" + record.district.value() : "-");
    if (seen.insert(std::move(key)).second) {
      records.push_back(record);
    } else {
      tracelog << "duplicate gazetteer record " << record.full_name();
    }
  }

  if (records.empty()) {
    std::string message = "gazetteer has no valid records: ";
    throw data_load_error((message + csvpath_).c_str());
  }

  infolog << "loaded " << records.size() 
          << " gazetteer records from " << csvpath_;
  return records;
}

}  // namespace cpca::import
