#pragma once
#include <array>
#include <optional>
#include <string>

namespace engram {

// String tables for enums whose enumerators run contiguously from zero.

template <typename E, size_t N>
std::string name_of(const std::array<const char*, N>& names, E value) {
    auto idx = static_cast<size_t>(value);
    return idx < N ? names[idx] : names[0];
}

template <typename E, size_t N>
std::optional<E> value_of(const std::array<const char*, N>& names, const std::string& s) {
    for (size_t i = 0; i < N; ++i) {
        if (s == names[i]) return static_cast<E>(i);
    }
    return std::nullopt;
}

} // namespace engram
