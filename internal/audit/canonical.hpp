#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/model/change_record.hpp"

namespace siros::audit {

/*
  Canonical encoding of a change record, the input to its block hash.

  Deterministic for equal records: object keys sorted bytewise, no
  whitespace, integral doubles printed without a fraction and all other
  numbers with 17 significant digits. Scalar fields are length-prefixed
  so no two records share an encoding.

  block_hash = sha256_hex(previous_hash || "\n" || CanonicalEncoding(record))
*/

inline constexpr std::string_view kGenesisHash = "0000000000000000000000000000000000000000000000000000000000000000";

std::string CanonicalJson(const google::protobuf::Value& value);
std::string CanonicalJson(const google::protobuf::Struct& value);

std::string CanonicalEncoding(const model::ChangeRecord& record);

std::string ComputeBlockHash(std::string_view previous_hash, const model::ChangeRecord& record);

} // namespace siros::audit
