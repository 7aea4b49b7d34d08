#include "engine/text_match.hpp"

#include <cctype>
#include <cmath>
#include <string>

namespace context_mcp::engine {

TokenSet tokenize(const std::string_view text) {
  TokenSet tokens;
  std::string current;

  const auto flush = [&]() {
    if (current.size() >= 2) {
      tokens.insert(current);
    }
    current.clear();
  };

  for (const char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) != 0) {
      current.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      flush();
    }
  }
  flush();

  return tokens;
}

double similarity(const TokenSet& query, const TokenSet& document) {
  if (query.empty() || document.empty()) {
    return 0.0;
  }

  std::size_t shared = 0;
  for (const auto& token : query) {
    if (document.count(token) != 0) {
      ++shared;
    }
  }

  return static_cast<double>(shared) /
         std::sqrt(static_cast<double>(query.size()) * static_cast<double>(document.size()));
}

TokenSet activity_tokens(const Activity& activity) {
  TokenSet tokens = tokenize(activity.window_title);
  tokens.merge(tokenize(activity.app_name));
  tokens.merge(tokenize(activity.file_path));
  return tokens;
}

bool path_is_under(const std::string_view path, std::string_view directory) {
  while (directory.size() > 1 && directory.back() == '/') {
    directory.remove_suffix(1);
  }
  if (directory.empty() || path.size() < directory.size()) {
    return false;
  }
  if (path.compare(0, directory.size(), directory) != 0) {
    return false;
  }
  return path.size() == directory.size() || directory.back() == '/' || path[directory.size()] == '/';
}

}  // namespace context_mcp::engine
