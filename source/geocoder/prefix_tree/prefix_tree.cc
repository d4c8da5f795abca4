// Copyright (C) Karim Agha - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential. Authored by Karim Agha <karim@sentio.cloud>

#include <iterator>
#include <unordered_map>
#include <boost/locale/utf.hpp>

#include "prefix_tree.h"

namespace cpca::geocoder
{
namespace utf = boost::locale::utf;

/**
 * Plain pointer based trie, one node per code point. The gazetteer
 * has a few thousand names, most sharing short CJK prefixes, so the
 * per-node hash maps stay small.
 */
class prefix_tree::impl
{
private:
  struct node
  {
    std::unordered_map<utf::code_point, std::unique_ptr<node>> children;
    std::optional<std::string> value;
  };

public:
  impl()
    : count_(0)
    , root_(std::make_unique<node>())
  {
  }

public:
  size_t size() const
  { return count_; }

  void insert(std::string_view name, std::string value)
  {
    if (name.empty()) {
      return;
    }

    node* current = root_.get();
    auto it = name.begin();
    while (it != name.end()) {
      auto c = next_char(it, name.end());
      auto& child = current->children[c];
      if (!child) {
        child = std::make_unique<node>();
      }
      current = child.get();
    }

    if (!current->value.has_value()) {
      ++count_;
    }
    current->value = std::move(value);
  }

  std::optional<std::string> find(std::string_view name) const
  {
    node const* current = root_.get();
    auto it = name.begin();
    while (it != name.end()) {
      auto child = current->children.find(next_char(it, name.end()));
      if (child == current->children.end()) {
        return std::nullopt;
      }
      current = child->second.get();
    }
    return current->value;
  }

  std::optional<prefix_tree::match> longest_prefix(std::string_view text) const
  {
    std::optional<prefix_tree::match> best;
    node const* current = root_.get();
    
    auto it = text.begin();
    while (it != text.end()) {
      auto child = current->children.find(next_char(it, text.end()));
      if (child == current->children.end()) {
        break;
      }
      current = child->second.get();

      // keep walking past terminal nodes, a longer name may follow
      if (current->value.has_value()) {
        size_t length = std::distance(text.begin(), it);
        best = prefix_tree::match { 
          text.substr(0, length), 
          current->value.value(), 
          length 
        };
      }
    }
    return best;
  }

private:
  /**
   * Decodes one code point and advances the iterator past it. A broken
   * sequence consumes a single byte and yields a value outside of the
   * unicode range, so it never matches a valid character.
   */
  static utf::code_point next_char(
    std::string_view::const_iterator& it, 
    std::string_view::const_iterator end)
  {
    auto start = it;
    auto c = utf::utf_traits<char>::decode(it, end);
    if (c == utf::illegal || c == utf::incomplete) {
      it = std::next(start);
      return utf::illegal;
    }
    return c;
  }

private:
  size_t count_;
  std::unique_ptr<node> root_;
};

//
// public interface
//

// compiler-generated members
// this is to support clean pimpl idiom with unique_ptr without
// exposing the implementation details of the underlying impl type.

prefix_tree::~prefix_tree() = default;
prefix_tree::prefix_tree(prefix_tree&&) = default;
prefix_tree& prefix_tree::operator=(prefix_tree&&) = default;

prefix_tree::prefix_tree()
  : impl_(std::make_unique<impl>())
{
}

size_t prefix_tree::size() const
{ return impl_->size(); }

void prefix_tree::insert(std::string_view name, std::string value)
{ impl_->insert(name, std::move(value)); }

std::optional<std::string> prefix_tree::find(std::string_view name) const
{ return impl_->find(name); }

bool prefix_tree::contains(std::string_view name) const
{ return impl_->find(name).has_value(); }

std::optional<prefix_tree::match> 
prefix_tree::longest_prefix(std::string_view text) const
{ return impl_->longest_prefix(text); }

}  // namespace cpca::geocoder
