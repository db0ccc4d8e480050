#pragma once

#include "distill/common/result.hpp"
#include "distill/content/item.hpp"

#include <string>
#include <vector>

namespace distill::content {

/// Decode one item object. Field-level problems are left for validate_item;
/// only a document that is not a JSON object fails here.
[[nodiscard]] common::Result<ContentItem> parse_item_json(const std::string &json);

/// Decode a JSON array of item objects.
[[nodiscard]] common::Result<std::vector<ContentItem>> parse_items_json(const std::string &json);

} // namespace distill::content
