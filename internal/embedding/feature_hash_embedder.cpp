#include "feature_hash_embedder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace siros::embedding {

namespace {

constexpr std::uint64_t kFnvOffset = 14695981039346656037ULL;
constexpr std::uint64_t kFnvPrime  = 1099511628211ULL;

std::uint64_t Fnv1a(const std::string& token) {
  std::uint64_t hash = kFnvOffset;
  for (unsigned char c : token) {
    hash ^= c;
    hash *= kFnvPrime;
  }
  return hash;
}

std::string FormatNumber(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.9g", v);
  return buf;
}

void AddWords(const std::string& text, std::vector<std::string>* out) {
  std::string word;
  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      word.push_back(static_cast<char>(std::tolower(c)));
    } else if (!word.empty()) {
      out->push_back("w:" + word);
      word.clear();
    }
  }
  if (!word.empty()) {
    out->push_back("w:" + word);
  }
}

void AddValue(const std::string& path, const google::protobuf::Value& value, std::vector<std::string>* out);

void AddStruct(const std::string& prefix, const google::protobuf::Struct& s, std::vector<std::string>* out) {
  for (const auto& entry : s.fields()) {
    const auto path = prefix.empty() ? entry.first : prefix + "." + entry.first;
    out->push_back("k:" + path);
    AddValue(path, entry.second, out);
  }
}

void AddValue(const std::string& path, const google::protobuf::Value& value, std::vector<std::string>* out) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kStringValue:
      out->push_back("v:" + path + "=" + value.string_value());
      AddWords(value.string_value(), out);
      break;
    case google::protobuf::Value::kNumberValue:
      out->push_back("v:" + path + "=" + FormatNumber(value.number_value()));
      break;
    case google::protobuf::Value::kBoolValue:
      out->push_back("v:" + path + "=" + (value.bool_value() ? "true" : "false"));
      break;
    case google::protobuf::Value::kStructValue:
      AddStruct(path, value.struct_value(), out);
      break;
    case google::protobuf::Value::kListValue:
      for (const auto& item : value.list_value().values()) {
        AddValue(path, item, out);
      }
      break;
    default:
      break;
  }
}

} // namespace

FeatureHashEmbedder::FeatureHashEmbedder(std::uint32_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw std::invalid_argument("FeatureHashEmbedder: dimension must be positive");
  }
}

std::vector<std::string> FeatureHashEmbedder::Tokenize(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata) {
  std::vector<std::string> tokens;
  AddStruct("", content, &tokens);
  AddStruct("meta", metadata, &tokens);
  std::sort(tokens.begin(), tokens.end());
  return tokens;
}

model::FloatVector FeatureHashEmbedder::GenerateVector(const google::protobuf::Struct& content, const google::protobuf::Struct& metadata) {
  const auto tokens = Tokenize(content, metadata);
  if (tokens.empty()) {
    throw util::EmbeddingFailed("nothing to embed: content and metadata are empty");
  }

  std::vector<double> acc(dimension_, 0.0);
  for (const auto& token : tokens) {
    const auto hash   = Fnv1a(token);
    const auto bucket = hash % dimension_;
    acc[bucket] += (hash >> 63) ? -1.0 : 1.0;
  }

  double norm = 0.0;
  for (double v : acc) norm += v * v;
  norm = std::sqrt(norm);
  if (norm == 0.0) {
    // Every token cancelled out; fall back to the first token's bucket.
    acc[Fnv1a(tokens.front()) % dimension_] = 1.0;
    norm                                     = 1.0;
  }

  model::FloatVector out(dimension_);
  for (std::uint32_t i = 0; i < dimension_; ++i) {
    out[i] = static_cast<float>(acc[i] / norm);
  }
  return out;
}

} // namespace siros::embedding
