#include <quid/node.hpp>
#include <quid/log.hpp>
#include <quid/random.hpp>
#include <cerrno>
#include <cstring>

#ifndef _WIN32
#include <ifaddrs.h>
#include <net/if.h>
#include <sys/socket.h>
#if defined(__APPLE__) || defined(__FreeBSD__)
#include <net/if_dl.h>
#else
#include <net/if_arp.h>
#include <netpacket/packet.h>
#endif
#endif

namespace quid {

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- Node ----

Result<Node> Node::parse(const std::string& s) {
    if (s.size() != 17) {
        return QuidError(QuidError::Parse,
            "node address must be 17 characters: '" + s + "'",
            "expected format: aa:bb:cc:dd:ee:ff");
    }
    char sep = s[2];
    if (sep != ':' && sep != '-') {
        return QuidError(QuidError::Parse,
            "node address has an invalid separator: '" + s + "'",
            "separate octets with ':' or '-'");
    }

    Node n;
    for (size_t i = 0; i < 6; ++i) {
        size_t pos = i * 3;
        if (i > 0 && s[pos - 1] != sep) {
            return QuidError(QuidError::Parse,
                "node address mixes separators: '" + s + "'");
        }
        int hi = hex_val(s[pos]);
        int lo = hex_val(s[pos + 1]);
        if (hi < 0 || lo < 0) {
            return QuidError(QuidError::Parse,
                "node address contains invalid hex character",
                "invalid octet at position " + std::to_string(pos));
        }
        n.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<Node>::ok(n);
}

std::string Node::to_string(Case c) const {
    const char* digits = (c == Case::Upper) ? "0123456789ABCDEF" : "0123456789abcdef";
    std::string out;
    out.reserve(17);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i > 0) out += '-';
        out += digits[bytes[i] >> 4];
        out += digits[bytes[i] & 0x0F];
    }
    return out;
}

uint64_t Node::to_u48() const {
    uint64_t v = 0;
    for (uint8_t b : bytes) {
        v = (v << 8) | b;
    }
    return v;
}

// ---- Providers ----

RandomNodeProvider::RandomNodeProvider()
    : RandomNodeProvider(random_bytes<6>()) {}

RandomNodeProvider::RandomNodeProvider(const std::array<uint8_t, 6>& entropy)
    : node_{entropy} {
    node_.bytes[0] |= 0x01;
}

InterfaceNodeProvider::InterfaceNodeProvider(NodeFallback fallback)
    : fallback_(fallback) {}

Result<Node> InterfaceNodeProvider::resolve() const {
    auto hw = hardware_address();
    if (hw.is_ok() || fallback_ == NodeFallback::None) {
        return hw;
    }
    log::warn("%s; using random multicast node", hw.error().message.c_str());
    return random_.resolve();
}

static bool all_zero(const uint8_t* p, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        if (p[i] != 0) return false;
    }
    return true;
}

Result<Node> hardware_address() {
#ifdef _WIN32
    return QuidError(QuidError::NodeUnavailable,
        "hardware address lookup is not supported on this platform",
        "configure a fixed node or the random fallback");
#else
    struct ifaddrs* ifap = nullptr;
    if (getifaddrs(&ifap) != 0) {
        return QuidError(QuidError::NodeUnavailable,
            std::string("cannot list network interfaces: ") + std::strerror(errno));
    }

    Node found{};
    bool ok = false;
    for (struct ifaddrs* ifa = ifap; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr) continue;
        if (ifa->ifa_flags & IFF_LOOPBACK) continue;

#if defined(__APPLE__) || defined(__FreeBSD__)
        if (ifa->ifa_addr->sa_family != AF_LINK) continue;
        auto* sdl = reinterpret_cast<struct sockaddr_dl*>(ifa->ifa_addr);
        if (sdl->sdl_alen != 6) continue;
        auto* mac = reinterpret_cast<const uint8_t*>(LLADDR(sdl));
#else
        if (ifa->ifa_addr->sa_family != AF_PACKET) continue;
        auto* sll = reinterpret_cast<struct sockaddr_ll*>(ifa->ifa_addr);
        if (sll->sll_hatype != ARPHRD_ETHER || sll->sll_halen != 6) continue;
        const uint8_t* mac = sll->sll_addr;
#endif
        if (all_zero(mac, 6)) continue;

        std::memcpy(found.bytes.data(), mac, 6);
        log::debug("node %s from interface %s",
                   found.to_string().c_str(), ifa->ifa_name);
        ok = true;
        break;
    }
    freeifaddrs(ifap);

    if (!ok) {
        return QuidError(QuidError::NodeUnavailable,
            "no network interface with a hardware address",
            "configure a fixed node or the random fallback");
    }
    return Result<Node>::ok(found);
#endif
}

} // namespace quid
