#include <quid/generator.hpp>
#include <quid/layout.hpp>
#include <quid/timestamp.hpp>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace quid {

static Status check_time_version(Version v) {
    switch (v) {
    case Version::Time:
    case Version::Dce:
        return ok_status();
    case Version::Md5:
    case Version::Random:
    case Version::Sha1:
        break;
    }
    return QuidError(QuidError::UnsupportedVersion,
        std::string("version '") + version_name(v) + "' is not time-based",
        "use Uuid::v3, Uuid::v4 or Uuid::v5 for the other versions");
}

uint32_t local_id(Domain domain) {
#ifdef _WIN32
    (void)domain;
    return 0;
#else
    switch (domain) {
    case Domain::Person: return static_cast<uint32_t>(getuid());
    case Domain::Group:  return static_cast<uint32_t>(getgid());
    case Domain::Org:    return 0;
    }
    return 0;
#endif
}

Generator::Generator()
    : Generator(std::make_shared<InterfaceNodeProvider>(NodeFallback::Random)) {}

Generator::Generator(std::shared_ptr<const NodeProvider> node, ClockSeq& clock_seq)
    : node_(std::move(node)), clock_seq_(clock_seq) {}

Result<Uuid> Generator::v1() const {
    auto ts = Timestamp::now();
    QUID_TRY(ts);
    auto node = node_->resolve();
    QUID_TRY(node);
    return Result<Uuid>::ok(
        Layout::from_time(ts.value().ticks, Version::Time, clock_seq_.next(), node.value()).encode());
}

Result<Uuid> Generator::v2(Domain domain) const {
    return v2(domain, local_id(domain));
}

Result<Uuid> Generator::v2(Domain domain, uint32_t id) const {
    auto ts = Timestamp::now();
    QUID_TRY(ts);
    auto node = node_->resolve();
    QUID_TRY(node);

    Layout l = Layout::from_time(ts.value().ticks, Version::Dce, clock_seq_.next(), node.value());
    l.time_low = id;
    l.clock_seq_low = static_cast<uint8_t>(domain);
    return Result<Uuid>::ok(l.encode());
}

Result<Uuid> Generator::from_utc(Version v, uint64_t ticks) const {
    QUID_TRY(check_time_version(v));
    auto node = node_->resolve();
    QUID_TRY(node);
    return Result<Uuid>::ok(
        Layout::from_time(ticks, v, clock_seq_.next(), node.value()).encode());
}

Result<Uuid> Generator::from_mac(Version v, const Node& node) const {
    QUID_TRY(check_time_version(v));
    auto ts = Timestamp::now();
    QUID_TRY(ts);
    return Result<Uuid>::ok(
        Layout::from_time(ts.value().ticks, v, clock_seq_.next(), node).encode());
}

} // namespace quid
