#include <quid/layout.hpp>

namespace quid {

static constexpr uint16_t kTimeHighMask = 0x0FFF;
static constexpr uint8_t  kClockSeqHighMask = 0x3F;

static Variant variant_of(uint8_t b) {
    if ((b & 0x80) == 0x00) return Variant::Ncs;
    if ((b & 0xC0) == 0x80) return Variant::Rfc;
    if ((b & 0xE0) == 0xC0) return Variant::Microsoft;
    return Variant::Future;
}

static std::optional<Version> version_of(uint8_t b) {
    switch (b >> 4) {
    case 1: return Version::Time;
    case 2: return Version::Dce;
    case 3: return Version::Md5;
    case 4: return Version::Random;
    case 5: return Version::Sha1;
    }
    return std::nullopt;
}

Layout Layout::from_time(uint64_t ticks, Version v, uint16_t clock_seq, const Node& node) {
    Layout l;
    l.time_low = static_cast<uint32_t>(ticks & 0xFFFFFFFF);
    l.time_mid = static_cast<uint16_t>((ticks >> 32) & 0xFFFF);
    l.time_high_and_version = static_cast<uint16_t>((ticks >> 48) & kTimeHighMask);
    l.clock_seq_high_and_reserved = static_cast<uint8_t>((clock_seq >> 8) & kClockSeqHighMask);
    l.clock_seq_low = static_cast<uint8_t>(clock_seq & 0xFF);
    l.node = node;
    l.set_version(v);
    l.set_variant(Variant::Rfc);
    return l;
}

Layout Layout::decode(const Uuid::Bytes& b) {
    Layout l;
    l.time_low = (uint32_t(b[0]) << 24) | (uint32_t(b[1]) << 16)
               | (uint32_t(b[2]) << 8)  | uint32_t(b[3]);
    l.time_mid = static_cast<uint16_t>((b[4] << 8) | b[5]);
    l.time_high_and_version = static_cast<uint16_t>((b[6] << 8) | b[7]);
    l.clock_seq_high_and_reserved = b[8];
    l.clock_seq_low = b[9];
    for (size_t i = 0; i < 6; ++i) {
        l.node.bytes[i] = b[10 + i];
    }
    return l;
}

void Layout::set_version(Version v) {
    time_high_and_version = static_cast<uint16_t>(
        (time_high_and_version & kTimeHighMask) | (static_cast<uint16_t>(v) << 12));
}

void Layout::set_variant(Variant v) {
    uint8_t& b = clock_seq_high_and_reserved;
    switch (v) {
    case Variant::Ncs:       b = b & 0x7F; break;
    case Variant::Rfc:       b = (b & 0x3F) | 0x80; break;
    case Variant::Microsoft: b = (b & 0x1F) | 0xC0; break;
    case Variant::Future:    b = (b & 0x1F) | 0xE0; break;
    }
}

Uuid Layout::encode() const {
    Uuid u;
    u.bytes[0] = uint8_t(time_low >> 24);
    u.bytes[1] = uint8_t(time_low >> 16);
    u.bytes[2] = uint8_t(time_low >> 8);
    u.bytes[3] = uint8_t(time_low);
    u.bytes[4] = uint8_t(time_mid >> 8);
    u.bytes[5] = uint8_t(time_mid);
    u.bytes[6] = uint8_t(time_high_and_version >> 8);
    u.bytes[7] = uint8_t(time_high_and_version);
    u.bytes[8] = clock_seq_high_and_reserved;
    u.bytes[9] = clock_seq_low;
    for (size_t i = 0; i < 6; ++i) {
        u.bytes[10 + i] = node.bytes[i];
    }
    return u;
}

Fields Layout::as_fields() const {
    return Fields{
        time_low,
        time_mid,
        time_high_and_version,
        static_cast<uint16_t>((clock_seq_high_and_reserved << 8) | clock_seq_low),
        node.to_u48()
    };
}

std::optional<Version> Layout::version() const {
    return version_of(static_cast<uint8_t>(time_high_and_version >> 8));
}

Variant Layout::variant() const {
    return variant_of(clock_seq_high_and_reserved);
}

uint64_t Layout::time() const {
    return (uint64_t(time_high_and_version & kTimeHighMask) << 48)
         | (uint64_t(time_mid) << 32)
         | uint64_t(time_low);
}

std::optional<Version> decode_version(const Uuid::Bytes& bytes) {
    return version_of(bytes[6]);
}

Variant decode_variant(const Uuid::Bytes& bytes) {
    return variant_of(bytes[8]);
}

uint64_t decode_time(const Uuid::Bytes& bytes) {
    return Layout::decode(bytes).time();
}

Uuid stamp(const Uuid::Bytes& bytes, Version v) {
    Layout l = Layout::decode(bytes);
    l.set_version(v);
    l.set_variant(Variant::Rfc);
    return l.encode();
}

} // namespace quid
