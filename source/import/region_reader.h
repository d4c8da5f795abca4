// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <memory>
#include <string>
#include <vector>
#include <istream>
#include <iterator>
#include <optional>

#include "utils/json.h"
#include "model/address.h"

namespace cpca::import
{
/**
 * An input iterator over the gazetteer CSV file that lists every
 * known county-level unit with the city and province it belongs to.
 * It is modeled after std::istream_iterator and yields values of
 * "administrative_record" type.
 *
 * notes:
 *  - the first line is a header and is always skipped
 *  - silently skips over invalid rows
 *  - copies share the underlying stream, like any input iterator
 */
class record_iterator
    : public std::iterator<std::input_iterator_tag, model::administrative_record>
{
public:  // construction
  /**
   * This constructor implements the end-of-stream iterator
   * that marks exhausting the underlying gazetteer file.
   */
  record_iterator() noexcept;

  /**
   * Opens the gazetteer file and ingests the first record.
   */
  record_iterator(std::string const& filename);

  /**
   * Reads records from an already open stream.
   */
  record_iterator(std::shared_ptr<std::istream> stream);

public:  // record access
  /**
   * Returns the latest parsed row of the gazetteer. Will crash if 
   * called on an invalidated iterator (such as after eof is reached).
   */
  const model::administrative_record& operator*() const;
  const model::administrative_record* operator->() const;

  /**
   * Tests whether this operator is not invalidated.
   */
  operator bool() const;

public:  // cursor
  /**
   * Advances the stream past the next valid row and stores it so
   * it can be dereferenced later on using the * operator.
   *
   * The format of a valid row is as follows:
   *  440305,广东省,深圳市,南山区
   *
   * The leading administrative code is ignored. The district cell may
   * be empty or missing for cities without districts (440,广东省,东莞市).
   * Rows with fewer than three cells, or with an empty province or city
   * are skipped.
   */
  record_iterator& operator++();

  /**
   * Two iterators are equal if both are exhausted, or if both read
   * the same stream and stand on the same line.
   */
  bool operator==(record_iterator const& other) const;
  bool operator!=(record_iterator const& other) const;

private:
  void skip_header();
  std::optional<model::administrative_record> parse_line(std::string const& line) const;

private:
  size_t line_;
  std::optional<model::administrative_record> value_;
  std::shared_ptr<std::istream> stream_;
};

/**
 * The tabular gazetteer the parser is built from.
 */
class gazetteer_source
{
public:
  using iterator = record_iterator;

public:
  gazetteer_source(std::string path);

  /**
   * Reads the "path" key of the "gazetteer" config section.
   */
  static gazetteer_source from_config(json_t const& systemconfig);

public:
  iterator begin() const;
  iterator end() const;

public:
  std::string const& path() const;

  /**
   * Reads all records in file order with exact duplicates removed.
   * 
   * Throws data_load_error if the file does not exist or if it
   * does not contain any valid record.
   */
  std::vector<model::administrative_record> load() const;

private:
  std::string csvpath_;
};

}  // namespace cpca::import
