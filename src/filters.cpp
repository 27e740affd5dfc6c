#include "permagate/filters.hpp"

#include <algorithm>

namespace permagate {

namespace {

[[noreturn]] void invalid(const std::string& why) {
  throw GatewayError(ErrorCode::filter_invalid, "invalid filter: " + why);
}

bool tag_matches(const Tag& tag, const TagMatch& m) {
  if (tag.first != m.name) return false;
  switch (m.mode) {
    case TagMatch::Mode::exists: return true;
    case TagMatch::Mode::equals: return tag.second == m.value;
    case TagMatch::Mode::starts_with: return tag.second.rfind(m.value, 0) == 0;
  }
  return false;
}

std::string attribute_of(const DataItem& item, const std::string& key) {
  if (key == "id") return item.id;
  if (key == "parent_id") return item.parent_id;
  if (key == "root_tx_id") return item.root_tx_id;
  if (key == "owner_address") return item.owner_address;
  if (key == "target") return item.target;
  if (key == "anchor") return item.anchor;
  if (key == "signature_type") return std::to_string(item.signature_type);
  invalid("unknown attribute '" + key + "'");
}

bool is_known_attribute(const std::string& key) {
  static const char* kKnown[] = {"id", "parent_id", "root_tx_id", "owner_address",
                                 "target", "anchor", "signature_type"};
  return std::any_of(std::begin(kKnown), std::end(kKnown),
                     [&](const char* k) { return key == k; });
}

std::vector<ItemFilterPtr> build_list(const jsonlite::Value& v, const char* op) {
  if (!v.is_array()) invalid(std::string("'") + op + "' expects an array");
  std::vector<ItemFilterPtr> out;
  for (const auto& child : std::get<jsonlite::Array>(v.v)) {
    out.push_back(create_filter(child));
  }
  return out;
}

ItemFilterPtr build_tags(const jsonlite::Value& v) {
  if (!v.is_array()) invalid("'tags' expects an array");
  std::vector<TagMatch> tags;
  for (const auto& entry : std::get<jsonlite::Array>(v.v)) {
    if (!entry.is_object()) invalid("tag entries must be objects");
    const auto& obj = std::get<jsonlite::Object>(entry.v);
    const auto* name = jsonlite::find(obj, "name");
    if (!name || !name->is_string()) invalid("tag entry needs a string 'name'");

    TagMatch m;
    m.name = std::get<std::string>(name->v);
    if (const auto* value = jsonlite::find(obj, "value")) {
      if (!value->is_string()) invalid("tag 'value' must be a string");
      m.value = std::get<std::string>(value->v);
      m.mode = TagMatch::Mode::equals;
    } else if (const auto* prefix = jsonlite::find(obj, "valueStartsWith")) {
      if (!prefix->is_string()) invalid("tag 'valueStartsWith' must be a string");
      m.value = std::get<std::string>(prefix->v);
      m.mode = TagMatch::Mode::starts_with;
    }
    tags.push_back(std::move(m));
  }
  return std::make_shared<MatchTags>(std::move(tags));
}

ItemFilterPtr build_attributes(const jsonlite::Value& v) {
  if (!v.is_object()) invalid("'attributes' expects an object");
  std::vector<std::pair<std::string, std::string>> attrs;
  for (const auto& [key, value] : std::get<jsonlite::Object>(v.v)) {
    if (!is_known_attribute(key)) invalid("unknown attribute '" + key + "'");
    if (const auto* s = std::get_if<std::string>(&value.v)) {
      attrs.emplace_back(key, *s);
    } else if (const auto* n = std::get_if<std::uint64_t>(&value.v)) {
      attrs.emplace_back(key, std::to_string(*n));
    } else {
      invalid("attribute '" + key + "' must be a string or integer");
    }
  }
  return std::make_shared<MatchAttributes>(std::move(attrs));
}

}  // namespace

bool MatchTags::match(const DataItem& item) const {
  for (const auto& want : tags_) {
    const bool found = std::any_of(item.tags.begin(), item.tags.end(),
                                   [&](const Tag& t) { return tag_matches(t, want); });
    if (!found) return false;
  }
  return true;
}

bool MatchAttributes::match(const DataItem& item) const {
  for (const auto& [key, value] : attributes_) {
    if (attribute_of(item, key) != value) return false;
  }
  return true;
}

bool MatchAll::match(const DataItem& item) const {
  for (const auto& f : filters_) {
    if (!f->match(item)) return false;
  }
  return true;
}

bool MatchAny::match(const DataItem& item) const {
  for (const auto& f : filters_) {
    if (f->match(item)) return true;
  }
  return false;
}

ItemFilterPtr create_filter(const jsonlite::Value& expression) {
  if (!expression.is_object()) invalid("expression must be an object");
  const auto& obj = std::get<jsonlite::Object>(expression.v);
  if (obj.size() != 1) invalid("expression must have exactly one key");

  const auto& [op, arg] = *obj.begin();
  if (op == "always" || op == "never") {
    const auto* b = std::get_if<bool>(&arg.v);
    if (!b) invalid("'" + op + "' expects a boolean");
    const bool matches = (op == "always") == *b;
    if (matches) return std::make_shared<AlwaysMatch>();
    return std::make_shared<NeverMatch>();
  }
  if (op == "tags") return build_tags(arg);
  if (op == "attributes") return build_attributes(arg);
  if (op == "and") return std::make_shared<MatchAll>(build_list(arg, "and"));
  if (op == "or") return std::make_shared<MatchAny>(build_list(arg, "or"));
  if (op == "not") return std::make_shared<NegateMatch>(create_filter(arg));
  invalid("unknown operator '" + op + "'");
}

ItemFilterPtr create_filter(const std::string& json) {
  if (json.empty()) return std::make_shared<NeverMatch>();
  std::optional<jsonlite::JsonError> err;
  auto value = jsonlite::parse_value(json, &err);
  if (!value) invalid(err ? err->message : std::string("unparsable JSON"));
  return create_filter(*value);
}

}  // namespace permagate
