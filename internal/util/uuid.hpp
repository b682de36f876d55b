#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace outbox::util {

/*
  UUID helpers

  Process manager and message ids are raw 16 byte RFC4122 UUIDs.
  Stores keep them in canonical lowercase text form.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

// The all-zero UUID.
bool IsNil(const UUID& id);

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace outbox::util
