#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace recall_core::util {

/*
  UUID helpers

  Record ids are RFC4122 version 4 UUIDs rendered in canonical text form.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID generate_uuid();

std::string to_string(const UUID &id);

// Shorthand for to_string(generate_uuid())
std::string new_record_id();

}  // namespace recall_core::util
