/**
 * @file IdGenerator.hpp
 * @brief Random identifiers for manifests, plans and actions.
 */

#pragma once
#include <random>
#include <string>

namespace sortwell::application {

/** @brief Returns 32 random lower-case hex characters. */
inline std::string GenerateId() {
    static const char kHex[] = "0123456789abcdef";
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 15);
    std::string id;
    id.reserve(32);
    for (int i = 0; i < 32; ++i) {
        id += kHex[dist(engine)];
    }
    return id;
}

} // namespace sortwell::application
