#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace kiosk {

// Length of an instance id in characters (128-bit digest as lowercase hex)
constexpr std::size_t kInstanceIdLength = 32;

// Derives the id that scopes the lock/comm records of a (key, user) pair.
// Deterministic, fixed-length, and safe as a single path segment no matter
// what characters the key contains.
[[nodiscard]] std::string compute_instance_id(std::string_view key, std::string_view user);

// Name of the user running this process (effective uid).
// Falls back to $USER, $LOGNAME and finally the numeric uid.
[[nodiscard]] std::string current_user_name();

} // namespace kiosk
