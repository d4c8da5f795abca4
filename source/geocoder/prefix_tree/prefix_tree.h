// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#pragma once

#include <memory>
#include <string>
#include <optional>
#include <string_view>

namespace cpca::geocoder
{

/**
 * Maps administrative names (full or abbreviated) to their canonical
 * form and finds the longest registered name at the start of a text.
 *
 * The tree is keyed by unicode code points decoded from UTF-8, so
 * matches always end on a character boundary and their byte length
 * can be used to slice the original text.
 */
class prefix_tree final
{
public:
  /**
   * Result of a longest prefix search.
   * 
   * text is a view into the searched string and is only valid as
   * long as that string is alive. length is in bytes.
   */
  struct match
  {
    std::string_view text;
    std::string value;
    size_t length;
  };

public:
  prefix_tree();
  ~prefix_tree();

public: // move only semantics
  prefix_tree(prefix_tree&&);
  prefix_tree& operator=(prefix_tree&&);

private: // disable copying
  prefix_tree(prefix_tree const&) = delete;
  prefix_tree& operator=(prefix_tree const&) = delete;

public:
  /**
   * Registers name and stores value on its terminal node. Inserting
   * the same name twice overwrites the previously stored value.
   * Empty names are ignored.
   */
  void insert(std::string_view name, std::string value);

  /**
   * Number of distinct names registered in the tree.
   */
  size_t size() const;

public:  // lookups
  std::optional<std::string> find(std::string_view name) const;
  bool contains(std::string_view name) const;

  /**
   * Walks the tree along text for as long as there is a child for the
   * next character and returns the deepest terminal node visited.
   *
   * With both "广东" and "广东省" registered, searching "广东省深圳市"
   * yields "广东省". Returns nothing if no prefix of text is registered.
   */
  std::optional<match> longest_prefix(std::string_view text) const;

private:
  class impl;
  std::unique_ptr<impl> impl_;
};

}  // namespace cpca::geocoder
