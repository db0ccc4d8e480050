#include "distill/content/codec.hpp"

#include "distill/common/fs.hpp"
#include "distill/common/json_util.hpp"

#include <cstdint>
#include <unordered_set>

namespace distill::content {

namespace {

// Accepted spellings for each field; the first is canonical.
const std::vector<std::string> kIdKeys = {"id", "item_id", "content_id"};
const std::vector<std::string> kBodyKeys = {"body", "content", "text"};
const std::vector<std::string> kUrlKeys = {"source_url", "url"};
const std::vector<std::string> kPublishedKeys = {"published_at", "published_date"};

std::optional<std::string> first_of(const common::JsonFlatMap &map,
                                    const std::vector<std::string> &keys) {
  for (const auto &key : keys) {
    if (const auto it = map.find(key); it != map.end() && it->second != "null") {
      return it->second;
    }
  }
  return std::nullopt;
}

void read_metadata(const std::string &raw, ItemMetadata &metadata) {
  for (auto &[key, value] : common::json_parse_flat(raw)) {
    if (key == "batch_id") {
      metadata.batch_id = value;
    } else if (key == "tags") {
      metadata.tags = common::json_array_strings(value);
    } else {
      metadata.extra.emplace(key, value);
    }
  }
}

} // namespace

common::Result<ContentItem> parse_item_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<ContentItem>::failure(common::DistillError{
        .kind = common::ErrorKind::MalformedItem, .message = "item is not a JSON object"});
  }

  const auto fields = common::json_parse_flat(trimmed);
  ContentItem item;
  item.id = first_of(fields, kIdKeys).value_or("");
  item.title = common::json_field_string(fields, "title");
  item.body = first_of(fields, kBodyKeys).value_or("");
  item.summary = common::json_field_string(fields, "summary");
  item.source_url = first_of(fields, kUrlKeys).value_or("");
  item.domain = common::json_field_string(fields, "domain");
  item.published_at = first_of(fields, kPublishedKeys);
  if (item.published_at.has_value() && common::trim(*item.published_at).empty()) {
    item.published_at.reset();
  }

  item.word_count = common::json_field_count(fields, "word_count");
  // Out-of-range values survive decoding so validation can report them.
  item.extraction_confidence = common::json_field_double(fields, "extraction_confidence", -1.0);

  if (const auto it = fields.find("metadata"); it != fields.end()) {
    read_metadata(it->second, item.metadata);
  }
  if (const auto it = fields.find("batch_id"); it != fields.end() && item.metadata.batch_id.empty()) {
    item.metadata.batch_id = it->second;
  }
  if (const auto it = fields.find("tags"); it != fields.end() && item.metadata.tags.empty()) {
    item.metadata.tags = common::json_array_strings(it->second);
  }

  if (const auto it = fields.find("embedding"); it != fields.end()) {
    if (const auto values = common::json_array_numbers(it->second);
        values.has_value() && !values->empty()) {
      item.embedding = std::vector<float>(values->begin(), values->end());
    }
  }

  static const std::unordered_set<std::string> kKnown = {
      "id",       "item_id",     "content_id",   "title",     "body",        "content",
      "text",     "summary",     "source_url",   "url",       "domain",      "published_at",
      "published_date", "word_count", "extraction_confidence", "metadata", "batch_id", "tags",
      "embedding"};
  for (const auto &[key, value] : fields) {
    if (!kKnown.contains(key)) {
      item.metadata.extra.emplace(key, value);
    }
  }

  return common::Result<ContentItem>::success(std::move(item));
}

common::Result<std::vector<ContentItem>> parse_items_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.size() < 2 || trimmed.front() != '[' || trimmed.back() != ']') {
    return common::Result<std::vector<ContentItem>>::failure(
        common::DistillError{.kind = common::ErrorKind::MalformedItem,
                             .message = "batch input must be a JSON array of items"});
  }

  std::vector<ContentItem> items;
  for (const auto &object : common::json_split_top_level_objects(trimmed)) {
    auto parsed = parse_item_json(object);
    if (!parsed.ok()) {
      return common::Result<std::vector<ContentItem>>::failure(parsed.error());
    }
    items.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<ContentItem>>::success(std::move(items));
}

} // namespace distill::content
