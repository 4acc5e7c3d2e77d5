#pragma once

#include <string>
#include <vector>

#include "internal/embedding/embedding_provider.hpp"

namespace siros::embedding {

/*
  Deterministic hashing-trick embedder.

  Every key path and scalar value of content and metadata becomes a
  token; string values additionally contribute their lower-case words,
  so free-text queries land near resources that mention the same terms.
  Tokens are hashed with 64-bit FNV-1a into a bucket and a sign, and the
  result is L2-normalized. Tokens are accumulated in sorted order, which
  makes the output bit-identical regardless of map iteration order.
*/
class FeatureHashEmbedder final : public EmbeddingProvider {
 public:
  explicit FeatureHashEmbedder(std::uint32_t dimension);

  model::FloatVector GenerateVector(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata) override;

  std::uint32_t Dimension() const override {
    return dimension_;
  }

  // Exposed for tests.
  static std::vector<std::string> Tokenize(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata);

 private:
  std::uint32_t dimension_;
};

} // namespace siros::embedding
