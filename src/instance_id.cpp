#include "instance_id.hpp"

#include <array>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <pwd.h>
#include <unistd.h>

namespace kiosk {

namespace {

constexpr uint64_t kFnvPrime = 0x100000001b3ULL;

// Two lanes with distinct offset bases give a 128-bit fingerprint
constexpr std::array<uint64_t, 2> kLaneSeeds = {
    0xcbf29ce484222325ULL,  // standard FNV-1a 64 offset basis
    0x84222325cbf29ce4ULL,
};

uint64_t fnv1a64(std::string_view data, uint64_t seed) {
    uint64_t h = seed;
    for (const unsigned char c : data) {
        h ^= c;
        h *= kFnvPrime;
    }
    return h;
}

// 64-bit avalanche finalizer (Murmur3 fmix64)
uint64_t mix64(uint64_t x) {
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdULL;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ULL;
    return x ^ (x >> 33);
}

} // namespace

std::string compute_instance_id(std::string_view key, std::string_view user) {
    std::string material;
    material.reserve(key.size() + 1 + user.size());
    material.append(key);
    material.push_back('.');
    material.append(user);

    std::string id;
    id.reserve(kInstanceIdLength);
    for (const uint64_t seed : kLaneSeeds) {
        id += std::format("{:016x}", mix64(fnv1a64(material, seed)));
    }
    return id;
}

std::string current_user_name() {
    const uid_t uid = geteuid();
    if (const passwd* pw = getpwuid(uid); pw && pw->pw_name && pw->pw_name[0] != '\0') {
        return pw->pw_name;
    }
    for (const char* var : {"USER", "LOGNAME"}) {
        if (const char* value = std::getenv(var); value && value[0] != '\0') {
            return value;
        }
    }
    return std::to_string(uid);
}

} // namespace kiosk
