#include <quid/md5.hpp>
#include <cstring>

namespace quid {

// ---- Constants (RFC 1321 section 3.4: floor(abs(sin(i + 1)) * 2^32)) ----

static constexpr uint32_t K[64] = {
    0xd76aa478, 0xe8c7b756, 0x242070db, 0xc1bdceee,
    0xf57c0faf, 0x4787c62a, 0xa8304613, 0xfd469501,
    0x698098d8, 0x8b44f7af, 0xffff5bb1, 0x895cd7be,
    0x6b901122, 0xfd987193, 0xa679438e, 0x49b40821,
    0xf61e2562, 0xc040b340, 0x265e5a51, 0xe9b6c7aa,
    0xd62f105d, 0x02441453, 0xd8a1e681, 0xe7d3fbc8,
    0x21e1cde6, 0xc33707d6, 0xf4d50d87, 0x455a14ed,
    0xa9e3e905, 0xfcefa3f8, 0x676f02d9, 0x8d2a4c8a,
    0xfffa3942, 0x8771f681, 0x6d9d6122, 0xfde5380c,
    0xa4beea44, 0x4bdecfa9, 0xf6bb4b60, 0xbebfbc70,
    0x289b7ec6, 0xeaa127fa, 0xd4ef3085, 0x04881d05,
    0xd9d4d039, 0xe6db99e5, 0x1fa27cf8, 0xc4ac5665,
    0xf4292244, 0x432aff97, 0xab9423a7, 0xfc93a039,
    0x655b59c3, 0x8f0ccc92, 0xffeff47d, 0x85845dd1,
    0x6fa87e4f, 0xfe2ce6e0, 0xa3014314, 0x4e0811a1,
    0xf7537e82, 0xbd3af235, 0x2ad7d2bb, 0xeb86d391
};

// Per-round left rotation amounts.
static constexpr unsigned S[64] = {
    7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22, 7, 12, 17, 22,
    5,  9, 14, 20, 5,  9, 14, 20, 5,  9, 14, 20, 5,  9, 14, 20,
    4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23, 4, 11, 16, 23,
    6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21, 6, 10, 15, 21
};

static inline uint32_t rotl(uint32_t x, unsigned n) {
    return (x << n) | (x >> (32 - n));
}

// MD5 is little-endian throughout, unlike the SHA family.
static inline uint32_t read_le32(const uint8_t* p) {
    return (uint32_t(p[0]))
         | (uint32_t(p[1]) <<  8)
         | (uint32_t(p[2]) << 16)
         | (uint32_t(p[3]) << 24);
}

static inline void write_le32(uint8_t* p, uint32_t v) {
    p[0] = uint8_t(v);
    p[1] = uint8_t(v >>  8);
    p[2] = uint8_t(v >> 16);
    p[3] = uint8_t(v >> 24);
}

static inline void write_le64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = uint8_t(v >> (8 * i));
    }
}

MD5::MD5() {
    state_ = { 0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476 };
    total_bytes_ = 0;
    buffer_len_ = 0;
}

void MD5::process_block(const uint8_t block[64]) {
    uint32_t M[16];
    for (int i = 0; i < 16; ++i) {
        M[i] = read_le32(block + i * 4);
    }

    uint32_t a = state_[0];
    uint32_t b = state_[1];
    uint32_t c = state_[2];
    uint32_t d = state_[3];

    for (int i = 0; i < 64; ++i) {
        uint32_t f;
        int g;
        if (i < 16) {
            f = (b & c) | (~b & d);
            g = i;
        } else if (i < 32) {
            f = (d & b) | (~d & c);
            g = (5 * i + 1) % 16;
        } else if (i < 48) {
            f = b ^ c ^ d;
            g = (3 * i + 5) % 16;
        } else {
            f = c ^ (b | ~d);
            g = (7 * i) % 16;
        }
        f = f + a + K[i] + M[g];
        a = d;
        d = c;
        c = b;
        b = b + rotl(f, S[i]);
    }

    state_[0] += a;
    state_[1] += b;
    state_[2] += c;
    state_[3] += d;
}

void MD5::update(const uint8_t* data, size_t len) {
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

void MD5::update(const std::string& s) {
    update(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

MD5::Digest MD5::finalize() {
    uint64_t total_bits = total_bytes_ * 8;

    buffer_[buffer_len_++] = 0x80;
    if (buffer_len_ > 56) {
        std::memset(buffer_ + buffer_len_, 0, 64 - buffer_len_);
        process_block(buffer_);
        buffer_len_ = 0;
    }
    std::memset(buffer_ + buffer_len_, 0, 56 - buffer_len_);
    write_le64(buffer_ + 56, total_bits);
    process_block(buffer_);

    Digest digest;
    for (int i = 0; i < 4; ++i) {
        write_le32(digest.data() + i * 4, state_[i]);
    }
    return digest;
}

MD5::Digest MD5::hash(const std::string& input) {
    MD5 ctx;
    ctx.update(input);
    return ctx.finalize();
}

std::string MD5::bytes_to_hex(const Digest& bytes) {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest_size * 2);
    for (uint8_t b : bytes) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0f];
    }
    return out;
}

std::string MD5::hash_hex(const std::string& input) {
    return bytes_to_hex(hash(input));
}

} // namespace quid
