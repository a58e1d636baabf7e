#pragma once

#include <quid/node.hpp>
#include <quid/tags.hpp>
#include <quid/uuid.hpp>
#include <array>
#include <cstdint>
#include <optional>

namespace quid {

// The four RFC4122 logical fields plus the node as a 48-bit integer.
struct Fields {
    uint32_t time_low;
    uint16_t time_mid;
    uint16_t time_high_and_version;
    uint16_t clock_seq;
    uint64_t node;
};

// Staging structure for the 128-bit identifier, fields in wire order.
//
//   0                   1                   2                   3
//   0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1 2 3 4 5 6 7 8 9 0 1
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                          time_low                             |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |       time_mid                |     time_high_and_version     |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |clk_seq_hi_res |  clk_seq_low  |         node (0-1)            |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
//  |                         node (2-5)                            |
//  +-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+-+
struct Layout {
    uint32_t time_low = 0;
    uint16_t time_mid = 0;
    uint16_t time_high_and_version = 0;
    uint8_t  clock_seq_high_and_reserved = 0;
    uint8_t  clock_seq_low = 0;
    Node     node{};

    // Split a 60-bit timestamp across the time fields and tag it with the
    // version. The 14-bit clock sequence is tagged with the RFC variant.
    static Layout from_time(uint64_t ticks, Version v, uint16_t clock_seq, const Node& node);

    // Unpack 16 bytes without interpreting them.
    static Layout decode(const Uuid::Bytes& bytes);

    void set_version(Version v);
    void set_variant(Variant v);

    // Big-endian serialization in field order.
    Uuid encode() const;

    Fields as_fields() const;
    std::optional<Version> version() const;
    Variant variant() const;
    uint64_t time() const;
};

std::optional<Version> decode_version(const Uuid::Bytes& bytes);
Variant decode_variant(const Uuid::Bytes& bytes);
uint64_t decode_time(const Uuid::Bytes& bytes);

// Overwrite the version and set the RFC variant on arbitrary bytes, as done
// for the hash- and random-based versions.
Uuid stamp(const Uuid::Bytes& bytes, Version v);

} // namespace quid
