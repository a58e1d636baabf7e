#pragma once

#include <array>
#include <cstdint>
#include <cstddef>
#include <string>

namespace quid {

// MD5 (RFC 1321). Used only as the entropy source for version 3 names.
class MD5 {
public:
    static constexpr size_t digest_size = 16;
    using Digest = std::array<uint8_t, digest_size>;

    MD5();

    void update(const uint8_t* data, size_t len);
    void update(const std::string& s);

    // Pads and returns the digest. The object must not be reused afterwards.
    Digest finalize();

    static Digest hash(const std::string& input);
    static std::string hash_hex(const std::string& input);
    static std::string bytes_to_hex(const Digest& bytes);

private:
    void process_block(const uint8_t block[64]);

    std::array<uint32_t, 4> state_;
    uint64_t total_bytes_;
    uint8_t  buffer_[64];
    size_t   buffer_len_;
};

} // namespace quid
