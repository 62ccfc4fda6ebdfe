#include "text.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace refiner::util {

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string ToUpper(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string Trim(std::string_view text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) return {};
  const auto end = text.find_last_not_of(" \t\r\n");
  return std::string(text.substr(begin, end - begin + 1));
}

std::string NormalizeText(std::string_view text) {
  std::string out;
  out.reserve(text.size());

  bool pending_space = false;
  for (unsigned char c : text) {
    // bytes >= 0x80 belong to multi-byte sequences and are kept verbatim
    if (std::isalnum(c) || c >= 0x80) {
      if (pending_space && !out.empty()) out.push_back(' ');
      pending_space = false;
      out.push_back(static_cast<char>(std::tolower(c)));
    } else {
      pending_space = true;
    }
  }
  return out;
}

std::vector<std::string> Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  const auto               normalized = NormalizeText(text);

  std::size_t start = 0;
  while (start < normalized.size()) {
    auto end = normalized.find(' ', start);
    if (end == std::string::npos) end = normalized.size();
    tokens.emplace_back(normalized.substr(start, end - start));
    start = end + 1;
  }
  return tokens;
}

double TokenSetSimilarity(std::string_view a, std::string_view b) {
  const auto ta = Tokenize(a);
  const auto tb = Tokenize(b);

  std::set<std::string> sa(ta.begin(), ta.end());
  std::set<std::string> sb(tb.begin(), tb.end());
  if (sa.empty() && sb.empty()) return 1.0;

  std::size_t intersection = 0;
  for (const auto& token : sa) {
    if (sb.count(token)) ++intersection;
  }
  const auto unions = sa.size() + sb.size() - intersection;
  return static_cast<double>(intersection) / static_cast<double>(unions);
}

double EditSimilarity(std::string_view a, std::string_view b) {
  if (a.empty() && b.empty()) return 1.0;

  // two-row Levenshtein
  std::vector<std::size_t> prev(b.size() + 1);
  std::vector<std::size_t> curr(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j) prev[j] = j;

  for (std::size_t i = 1; i <= a.size(); ++i) {
    curr[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      const std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      curr[j]                = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }

  const auto distance = prev[b.size()];
  const auto longest  = std::max(a.size(), b.size());
  return 1.0 - static_cast<double>(distance) / static_cast<double>(longest);
}

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to) {
  if (from.empty()) return text;

  std::size_t pos = 0;
  while ((pos = text.find(from, pos)) != std::string::npos) {
    text.replace(pos, from.size(), to);
    pos += to.size();
  }
  return text;
}

std::string Interpolate(std::string_view tmpl, const std::map<std::string, std::string>& values) {
  std::string out;
  out.reserve(tmpl.size());

  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    const auto open = tmpl.find('{', pos);
    if (open == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }
    const auto close = tmpl.find('}', open);
    if (close == std::string_view::npos) {
      out.append(tmpl.substr(pos));
      break;
    }

    out.append(tmpl.substr(pos, open - pos));
    const std::string key(tmpl.substr(open + 1, close - open - 1));
    auto              it = values.find(key);
    if (it != values.end()) {
      out.append(it->second);
    } else {
      out.append(tmpl.substr(open, close - open + 1));
    }
    pos = close + 1;
  }
  return out;
}

} // namespace refiner::util
