#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace refiner::util {

/*
  Text helpers shared by matching, embedding and templating.
*/

std::string ToLower(std::string_view text);
std::string ToUpper(std::string_view text);
std::string Trim(std::string_view text);

// Lowercase, punctuation replaced by spaces, whitespace collapsed and trimmed.
std::string NormalizeText(std::string_view text);

// Tokens of NormalizeText(text).
std::vector<std::string> Tokenize(std::string_view text);

// Jaccard similarity of the token sets; 1.0 when both are empty.
double TokenSetSimilarity(std::string_view a, std::string_view b);

// 1 - levenshtein(a, b) / max(|a|, |b|); 1.0 when both are empty.
double EditSimilarity(std::string_view a, std::string_view b);

std::string ReplaceAll(std::string text, std::string_view from, std::string_view to);

// Replaces every "{key}" with values.at(key). Unknown placeholders are left as-is.
std::string Interpolate(std::string_view tmpl, const std::map<std::string, std::string>& values);

} // namespace refiner::util
