#pragma once

#include <adjuster/schema/claim_event.hpp>
#include <adjuster/schema/registry_error_code.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: operation result.
// Envelope returned by every registry call: numeric code (0 on success), a
// readable reason, the failing operation's codespace, the value on success
// and the notifications the call emitted.
namespace adjuster::schema {

template <typename T>
struct operation_result final {
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<T> value;
  std::vector<claim_event_t> events;

  bool ok() const { return code == 0; }

  std::optional<registry_error_code> error() const {
    if (code == 0) {
      return std::nullopt;
    }
    return static_cast<registry_error_code>(code);
  }
};

}  // namespace adjuster::schema
