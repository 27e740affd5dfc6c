#pragma once

// permagate/filters.hpp — Data item predicates for unbundling.
//
// Filters are built once from a JSON expression and shared read-only across
// unbundler workers; match() must be const and thread-safe.
//
// GRAMMAR (one key per object):
//   {"always": true}            {"never": true}
//   {"tags": [ {"name": N, "value": V}
//            | {"name": N, "valueStartsWith": P}
//            | {"name": N} ]}                      all entries must match
//   {"attributes": {"owner_address": "...", "signature_type": 1, ...}}
//   {"and": [F, ...]}   {"or": [F, ...]}   {"not": F}
//
// The empty string builds the never-match filter, so an unset index filter
// emits nothing.

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "permagate/jsonlite.hpp"
#include "permagate/types.hpp"

namespace permagate {

class IItemFilter {
 public:
  virtual ~IItemFilter() = default;
  virtual bool match(const DataItem& item) const = 0;
};

using ItemFilterPtr = std::shared_ptr<const IItemFilter>;

class AlwaysMatch : public IItemFilter {
 public:
  bool match(const DataItem&) const override { return true; }
};

class NeverMatch : public IItemFilter {
 public:
  bool match(const DataItem&) const override { return false; }
};

struct TagMatch {
  std::string name;
  std::string value;
  enum class Mode { exists, equals, starts_with } mode{Mode::exists};
};

class MatchTags : public IItemFilter {
 public:
  explicit MatchTags(std::vector<TagMatch> tags) : tags_(std::move(tags)) {}
  bool match(const DataItem& item) const override;

 private:
  std::vector<TagMatch> tags_;
};

class MatchAttributes : public IItemFilter {
 public:
  // Keys: id, parent_id, root_tx_id, owner_address, target, anchor,
  // signature_type. Values compare as strings.
  explicit MatchAttributes(std::vector<std::pair<std::string, std::string>> attributes)
      : attributes_(std::move(attributes)) {}
  bool match(const DataItem& item) const override;

 private:
  std::vector<std::pair<std::string, std::string>> attributes_;
};

class MatchAll : public IItemFilter {
 public:
  explicit MatchAll(std::vector<ItemFilterPtr> filters) : filters_(std::move(filters)) {}
  bool match(const DataItem& item) const override;

 private:
  std::vector<ItemFilterPtr> filters_;
};

class MatchAny : public IItemFilter {
 public:
  explicit MatchAny(std::vector<ItemFilterPtr> filters) : filters_(std::move(filters)) {}
  bool match(const DataItem& item) const override;

 private:
  std::vector<ItemFilterPtr> filters_;
};

class NegateMatch : public IItemFilter {
 public:
  explicit NegateMatch(ItemFilterPtr filter) : filter_(std::move(filter)) {}
  bool match(const DataItem& item) const override { return !filter_->match(item); }

 private:
  ItemFilterPtr filter_;
};

// Throws GatewayError(filter_invalid) on malformed JSON or an unknown shape.
ItemFilterPtr create_filter(const std::string& json);
ItemFilterPtr create_filter(const jsonlite::Value& expression);

}  // namespace permagate
