#pragma once

#include <quid/clock_seq.hpp>
#include <quid/node.hpp>
#include <quid/result.hpp>
#include <quid/uuid.hpp>
#include <cstdint>
#include <memory>

namespace quid {

// Builds the time-based versions (1 and 2), which depend on the clock, the
// clock sequence and a node. The name- and random-based versions need no
// state and live on Uuid.
class Generator {
public:
    // Host interface address with the random multicast fallback, and the
    // process clock sequence.
    Generator();
    explicit Generator(std::shared_ptr<const NodeProvider> node,
                       ClockSeq& clock_seq = ClockSeq::process());

    Result<Uuid> v1() const;

    // time_low carries the local id: the POSIX UID for Person, the GID for
    // Group and 0 for Org.
    Result<Uuid> v2(Domain domain) const;
    Result<Uuid> v2(Domain domain, uint32_t local_id) const;

    // Custom timestamp (in 100-ns ticks since 1582-10-15) or custom node.
    // Only Version::Time and Version::Dce are accepted.
    Result<Uuid> from_utc(Version v, uint64_t ticks) const;
    Result<Uuid> from_mac(Version v, const Node& node) const;

    const NodeProvider& node_provider() const { return *node_; }

private:
    std::shared_ptr<const NodeProvider> node_;
    ClockSeq& clock_seq_;
};

// UID, GID or 0 depending on the domain.
uint32_t local_id(Domain domain);

} // namespace quid
