#include "hashing_embedder.hpp"

#include <cmath>
#include <cstdint>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace refiner::refine {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ull;
constexpr std::uint64_t kFnvPrime  = 1099511628211ull;

std::uint64_t Fnv1a(std::string_view text) {
  std::uint64_t hash = kFnvOffset;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

} // namespace

double CosineSimilarity(const Embedding& a, const Embedding& b) {
  if (a.size() != b.size()) {
    throw util::InvariantViolation("cosine similarity: embeddings have different dimensions");
  }

  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }

  if (norm_a == 0.0 || norm_b == 0.0) return 0.0;
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

HashingEmbedder::HashingEmbedder(std::size_t dimensions) : dimensions_(dimensions) {
  if (dimensions_ == 0) {
    throw util::InvalidConfig("embedding dimensions must be positive");
  }
}

Embedding HashingEmbedder::Embed(std::string_view text) const {
  Embedding vec(dimensions_, 0.0f);

  const auto tokens = util::Tokenize(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    vec[Fnv1a(tokens[i]) % dimensions_] += 1.0f;
    if (i + 1 < tokens.size()) {
      vec[Fnv1a(tokens[i] + ' ' + tokens[i + 1]) % dimensions_] += 1.0f;
    }
  }

  double norm = 0.0;
  for (float v : vec) norm += static_cast<double>(v) * v;
  if (norm > 0.0) {
    const auto scale = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& v : vec) v *= scale;
  }
  return vec;
}

} // namespace refiner::refine
