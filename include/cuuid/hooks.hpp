#pragma once

#include <cuuid/result.hpp>
#include <cuuid/uuid.hpp>
#include <tomlplusplus/toml.hpp>
#include <string_view>

namespace cuuid {

// Adapters between Uuid and toml++ documents. Every failure is reported
// as a Validation error; codec detail (character, position, length) is
// carried over from the underlying error.

// Only string nodes are handed to the codec.
Result<Uuid> decode_hook(const toml::node& node);

toml::value<std::string> encode_hook(const Uuid& u);

// Missing keys are Validation errors naming the key.
Result<Uuid> read_uuid(const toml::table& tbl, std::string_view key);
void write_uuid(toml::table& tbl, std::string_view key, const Uuid& u);

const char* node_type_name(toml::node_type type);

} // namespace cuuid
