#include "hotword/matcher/phrase_matcher.hpp"

#include "hotword/common/fs.hpp"

#include <algorithm>
#include <cctype>

namespace hotword::matcher {

namespace {

bool is_token_char(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return (uch >= 'a' && uch <= 'z') || std::isdigit(uch) != 0;
}

std::string join_tail(const std::vector<std::string> &tokens, const std::size_t count) {
  const auto first = tokens.end() - static_cast<std::ptrdiff_t>(count);
  std::string out;
  for (auto it = first; it != tokens.end(); ++it) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += *it;
  }
  return out;
}

} // namespace

std::size_t edit_distance(std::string_view a, std::string_view b) {
  if (a == b) {
    return 0;
  }
  if (a.size() < b.size()) {
    std::swap(a, b);
  }
  if (b.empty()) {
    return a.size();
  }

  std::vector<std::size_t> previous(b.size() + 1);
  std::vector<std::size_t> current(b.size() + 1);
  for (std::size_t j = 0; j < previous.size(); ++j) {
    previous[j] = j;
  }

  for (std::size_t i = 0; i < a.size(); ++i) {
    current[0] = i + 1;
    for (std::size_t j = 0; j < b.size(); ++j) {
      const std::size_t cost = a[i] == b[j] ? 0 : 1;
      current[j + 1] = std::min({current[j] + 1, previous[j + 1] + 1, previous[j] + cost});
    }
    std::swap(previous, current);
  }
  return previous[b.size()];
}

std::vector<std::string> window_tokens(const std::string_view fragment) {
  const std::string lower = common::to_lower(common::trim(std::string(fragment)));
  const std::string tail =
      lower.size() > TAIL_CHARS ? lower.substr(lower.size() - TAIL_CHARS) : lower;

  std::vector<std::string> tokens;
  std::string current;
  for (const char ch : tail) {
    if (is_token_char(ch)) {
      current.push_back(ch);
      continue;
    }
    if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }

  if (tokens.size() > WINDOW_TOKENS) {
    tokens.erase(tokens.begin(), tokens.end() - static_cast<std::ptrdiff_t>(WINDOW_TOKENS));
  }
  return tokens;
}

MatchResult match_fragment(const std::string_view fragment,
                           const std::vector<std::string> &phrases,
                           const std::size_t max_distance) {
  MatchResult result;
  const auto tokens = window_tokens(fragment);
  if (tokens.empty()) {
    return result;
  }

  std::vector<std::string> candidates;
  candidates.push_back(join_tail(tokens, tokens.size()));
  if (tokens.size() >= 2) {
    candidates.push_back(join_tail(tokens, 2));
  }
  if (tokens.size() >= 3) {
    candidates.push_back(join_tail(tokens, 3));
  }

  for (const auto &phrase : phrases) {
    for (const auto &candidate : candidates) {
      const std::size_t distance = edit_distance(candidate, phrase);
      if (distance <= max_distance) {
        result.matched = true;
        result.phrase = phrase;
        result.distance = distance;
        result.candidate = candidate;
        return result;
      }
    }
  }
  return result;
}

bool evaluate(const std::string_view fragment, const std::vector<std::string> &phrases,
              const std::size_t max_distance) {
  return match_fragment(fragment, phrases, max_distance).matched;
}

} // namespace hotword::matcher
