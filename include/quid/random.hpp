#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace quid {

// Fill buf with len bytes from /dev/urandom, or from std::random_device
// seeding mt19937_64 when the device cannot be read.
void fill_random_bytes(uint8_t* buf, size_t len);

template<size_t N>
std::array<uint8_t, N> random_bytes() {
    std::array<uint8_t, N> out;
    fill_random_bytes(out.data(), N);
    return out;
}

} // namespace quid
