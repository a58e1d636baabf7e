#include <quid/uuid.hpp>
#include <quid/layout.hpp>
#include <quid/md5.hpp>
#include <quid/random.hpp>
#include <quid/sha1.hpp>
#include <algorithm>

namespace quid {

static const char kLowerHex[] = "0123456789abcdef";
static const char kUpperHex[] = "0123456789ABCDEF";
static const char kUrnPrefix[] = "urn:uuid:";
static constexpr size_t kUrnPrefixLen = sizeof(kUrnPrefix) - 1;
static constexpr size_t kTextLen = 36;

static bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static bool is_dash_pos(size_t i) {
    return i == 8 || i == 13 || i == 18 || i == 23;
}

template<size_t N>
static Uuid::Bytes first_16(const std::array<uint8_t, N>& digest) {
    static_assert(N >= 16, "digest shorter than an identifier");
    Uuid::Bytes out;
    std::copy(digest.begin(), digest.begin() + 16, out.begin());
    return out;
}

// ---- Name-based and random versions ----

Uuid Uuid::v3(const std::string& name, const Uuid& ns) {
    MD5 ctx;
    ctx.update(ns.to_string());
    ctx.update(name);
    return stamp(first_16(ctx.finalize()), Version::Md5);
}

Uuid Uuid::v5(const std::string& name, const Uuid& ns) {
    SHA1 ctx;
    ctx.update(ns.to_string());
    ctx.update(name);
    return stamp(first_16(ctx.finalize()), Version::Sha1);
}

Uuid Uuid::v4() {
    return stamp(random_bytes<16>(), Version::Random);
}

// ---- Field access ----

std::optional<Version> Uuid::version() const {
    return decode_version(bytes);
}

Variant Uuid::variant() const {
    return decode_variant(bytes);
}

Timestamp Uuid::time() const {
    return Timestamp{decode_time(bytes)};
}

// ---- Text ----

std::string Uuid::to_string(Case c) const {
    const char* digits = (c == Case::Upper) ? kUpperHex : kLowerHex;
    std::string out;
    out.reserve(kTextLen);
    for (int i = 0; i < 16; ++i) {
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

std::string Uuid::to_urn(Case c) const {
    return kUrnPrefix + to_string(c);
}

bool Uuid::is_valid(const std::string& s) {
    size_t start = 0;
    if (s.size() == kUrnPrefixLen + kTextLen) {
        for (size_t i = 0; i < kUrnPrefixLen; ++i) {
            char c = s[i];
            if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
            if (c != kUrnPrefix[i]) return false;
        }
        start = kUrnPrefixLen;
    } else if (s.size() != kTextLen) {
        return false;
    }

    for (size_t i = 0; i < kTextLen; ++i) {
        char c = s[start + i];
        if (is_dash_pos(i)) {
            if (c != '-') return false;
        } else if (!is_hex(c)) {
            return false;
        }
    }
    char version = s[start + 14];
    return version >= '0' && version <= '5';
}

} // namespace quid
