#pragma once

#include <quid/result.hpp>
#include <quid/tags.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace quid {

// IEEE 802 address, the trailing six bytes of a time-based identifier.
struct Node {
    std::array<uint8_t, 6> bytes;

    static Node from_bytes(const std::array<uint8_t, 6>& b) { return Node{b}; }

    // Accepts six hex octets separated by ':' or '-'.
    static Result<Node> parse(const std::string& s);

    // "00-2a-35-0d-13-80"
    std::string to_string(Case c = Case::Lower) const;
    uint64_t to_u48() const;

    // Bit 0 of the first octet; set on addresses that cannot belong to a card.
    bool is_multicast() const { return (bytes[0] & 0x01) != 0; }

    bool operator==(const Node& other) const { return bytes == other.bytes; }
    bool operator!=(const Node& other) const { return bytes != other.bytes; }
};

// Source of the node field. Implementations are immutable after
// construction and safe to share between threads.
class NodeProvider {
public:
    virtual ~NodeProvider() = default;

    virtual Result<Node> resolve() const = 0;
    virtual const char* name() const = 0;
};

// A caller-supplied address; never fails.
class FixedNodeProvider : public NodeProvider {
public:
    explicit FixedNodeProvider(Node node) : node_(node) {}

    Result<Node> resolve() const override { return Result<Node>::ok(node_); }
    const char* name() const override { return "fixed"; }

private:
    Node node_;
};

// Random bytes with the multicast bit set (RFC4122 section 4.5). The bytes
// are drawn once so a provider always reports the same node.
class RandomNodeProvider : public NodeProvider {
public:
    RandomNodeProvider();
    explicit RandomNodeProvider(const std::array<uint8_t, 6>& entropy);

    Result<Node> resolve() const override { return Result<Node>::ok(node_); }
    const char* name() const override { return "random"; }

private:
    Node node_;
};

enum class NodeFallback {
    None,
    Random
};

// First non-loopback, non-zero Ethernet address of the host.
class InterfaceNodeProvider : public NodeProvider {
public:
    explicit InterfaceNodeProvider(NodeFallback fallback = NodeFallback::None);

    Result<Node> resolve() const override;
    const char* name() const override { return "interface"; }

    NodeFallback fallback() const { return fallback_; }

private:
    NodeFallback fallback_;
    RandomNodeProvider random_;
};

// Queries the network interfaces directly. NodeUnavailable when none has a
// usable hardware address.
Result<Node> hardware_address();

} // namespace quid
