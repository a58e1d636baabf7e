#pragma once

#include <quid/tags.hpp>
#include <quid/timestamp.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace quid {

struct Uuid {
    using Bytes = std::array<uint8_t, 16>;

    Bytes bytes;

    // Name-based: hash of the lowercase text of ns followed by name.
    static Uuid v3(const std::string& name, const Uuid& ns);
    static Uuid v5(const std::string& name, const Uuid& ns);
    static Uuid v4();

    std::optional<Version> version() const;
    Variant variant() const;
    // Only meaningful for time-based versions.
    Timestamp time() const;

    // xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx
    std::string to_string(Case c = Case::Lower) const;
    // urn:uuid:xxxxxxxx-xxxx-Mxxx-Nxxx-xxxxxxxxxxxx
    std::string to_urn(Case c = Case::Lower) const;

    // Case-insensitive 8-4-4-4-12 grammar with an optional "urn:uuid:"
    // prefix and a version digit in 0..5. The variant bits are not checked.
    static bool is_valid(const std::string& s);

    bool operator==(const Uuid& other) const { return bytes == other.bytes; }
    bool operator!=(const Uuid& other) const { return bytes != other.bytes; }
    bool operator<(const Uuid& other) const { return bytes < other.bytes; }
};

// RFC4122 Appendix C name space identifiers.
namespace ns {

inline constexpr Uuid DNS{{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid URL{{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid OID{{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                           0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};
inline constexpr Uuid X500{{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                            0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

} // namespace ns

} // namespace quid
