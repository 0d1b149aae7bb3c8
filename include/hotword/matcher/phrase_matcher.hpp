#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hotword::matcher {

// Only the most recent speech is scored; wake phrases are short.
inline constexpr std::size_t TAIL_CHARS = 40;
inline constexpr std::size_t WINDOW_TOKENS = 5;

struct MatchResult {
  bool matched = false;
  std::optional<std::string> phrase;
  std::optional<std::size_t> distance;
  // The window or suffix that produced the hit.
  std::string candidate;
};

[[nodiscard]] std::size_t edit_distance(std::string_view a, std::string_view b);

[[nodiscard]] std::vector<std::string> window_tokens(std::string_view fragment);

// Per phrase: full window, last two tokens, last three tokens. First hit wins.
[[nodiscard]] MatchResult match_fragment(std::string_view fragment,
                                         const std::vector<std::string> &phrases,
                                         std::size_t max_distance);

[[nodiscard]] bool evaluate(std::string_view fragment, const std::vector<std::string> &phrases,
                            std::size_t max_distance);

} // namespace hotword::matcher
