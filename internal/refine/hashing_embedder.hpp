#pragma once

#include "internal/refine/embedder.hpp"

namespace refiner::refine {

/*
  Feature-hashing bag of unigrams and bigrams over normalized tokens.
  Each feature is hashed with FNV-1a into one of `dimensions` buckets;
  the result is L2-normalized.
*/
class HashingEmbedder final : public Embedder {
 public:
  explicit HashingEmbedder(std::size_t dimensions = 512);

  Embedding Embed(std::string_view text) const override;

 private:
  std::size_t dimensions_;
};

} // namespace refiner::refine
