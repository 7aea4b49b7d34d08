#pragma once

#include <string>
#include <string_view>
#include <unordered_set>

#include "engine/model.hpp"

namespace context_mcp::engine {

using TokenSet = std::unordered_set<std::string>;

// Lower-cased alphanumeric runs of at least two characters.
TokenSet tokenize(std::string_view text);

// Set cosine similarity in [0, 1]; zero when either side is empty.
double similarity(const TokenSet& query, const TokenSet& document);

TokenSet activity_tokens(const Activity& activity);

bool path_is_under(std::string_view path, std::string_view directory);

}  // namespace context_mcp::engine
