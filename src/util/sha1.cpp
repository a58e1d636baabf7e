#include <quid/sha1.hpp>
#include <cstring>

namespace quid {

static inline uint32_t rotl(uint32_t x, unsigned n) {
    return (x << n) | (x >> (32 - n));
}

static inline uint32_t read_be32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24)
         | (uint32_t(p[1]) << 16)
         | (uint32_t(p[2]) <<  8)
         | (uint32_t(p[3]));
}

static inline void write_be32(uint8_t* p, uint32_t v) {
    p[0] = uint8_t(v >> 24);
    p[1] = uint8_t(v >> 16);
    p[2] = uint8_t(v >>  8);
    p[3] = uint8_t(v);
}

static inline void write_be64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = uint8_t(v >> (56 - 8 * i));
    }
}

SHA1::SHA1() {
    // FIPS 180-4 section 5.3.1
    state_ = { 0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476, 0xc3d2e1f0 };
    total_bytes_ = 0;
    buffer_len_ = 0;
}

void SHA1::process_block(const uint8_t block[64]) {
    uint32_t W[80];
    for (int t = 0; t < 16; ++t) {
        W[t] = read_be32(block + t * 4);
    }
    for (int t = 16; t < 80; ++t) {
        W[t] = rotl(W[t-3] ^ W[t-8] ^ W[t-14] ^ W[t-16], 1);
    }

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];
    uint32_t e = state_[4];

    for (int t = 0; t < 80; ++t) {
        uint32_t f, k;
        if (t < 20) {
            f = (b & c) | (~b & d);
            k = 0x5a827999;
        } else if (t < 40) {
            f = b ^ c ^ d;
            k = 0x6ed9eba1;
        } else if (t < 60) {
            f = (b & c) | (b & d) | (c & d);
            k = 0x8f1bbcdc;
        } else {
            f = b ^ c ^ d;
            k = 0xca62c1d6;
        }
        uint32_t temp = rotl(a, 5) + f + e + k + W[t];
        e = d;
        d = c;
        c = rotl(b, 30);
        b = a;
        a = temp;
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
    state_[4] += e;
}

void SHA1::update(const uint8_t* data, size_t len) {
    total_bytes_ += len;

    if (buffer_len_ > 0) {
        size_t space = 64 - buffer_len_;
        size_t copy = (len < space) ? len : space;
        std::memcpy(buffer_ + buffer_len_, data, copy);
        buffer_len_ += copy;
        data += copy;
        len -= copy;

        if (buffer_len_ == 64) {
            process_block(buffer_);
            buffer_len_ = 0;
        }
    }

    while (len >= 64) {
        process_block(data);
        data += 64;
        len -= 64;
    }

    if (len > 0) {
        std::memcpy(buffer_, data, len);
        buffer_len_ = len;
    }
}

void SHA1::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

SHA1::Digest SHA1::finalize() {
    uint64_t total_bits = total_bytes_ * 8;

    buffer_[buffer_len_++] = 0x80;
    if (buffer_len_ > 56) {
        std::memset(buffer_ + buffer_len_, 0, 64 - buffer_len_);
        process_block(buffer_);
        buffer_len_ = 0;
    }
    std::memset(buffer_ + buffer_len_, 0, 56 - buffer_len_);
    write_be64(buffer_ + 56, total_bits);
    process_block(buffer_);

    Digest digest;
    for (int i = 0; i < 5; ++i) {
        write_be32(digest.data() + i * 4, state_[i]);
    }
    return digest;
}

SHA1::Digest SHA1::hash(const std::string& input) {
    SHA1 ctx;
    ctx.update(input);
    return ctx.finalize();
}

std::string SHA1::bytes_to_hex(const Digest& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_size * 2);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

std::string SHA1::hash_hex(const std::string& input) {
    return bytes_to_hex(hash(input));
}

} // namespace quid
