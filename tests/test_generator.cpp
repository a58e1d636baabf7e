#include <catch2/catch.hpp>
#include <quid/generator.hpp>
#include <quid/layout.hpp>
#include <memory>
#include <set>

using namespace quid;

static const Node kNode = Node::from_bytes({0x03, 0x2a, 0x35, 0x0d, 0x13, 0x80});

// Provider that always fails, standing in for a host without interfaces.
class MissingNodeProvider : public NodeProvider {
public:
    Result<Node> resolve() const override {
        return QuidError(QuidError::NodeUnavailable, "no interfaces");
    }
    const char* name() const override { return "missing"; }
};

static Generator fixed_generator(ClockSeq& seq) {
    return Generator(std::make_shared<FixedNodeProvider>(kNode), seq);
}

// ===== v1 =====

TEST_CASE("v1 tags version Time and variant RFC", "[generator][v1]") {
    ClockSeq seq(0);
    auto u = fixed_generator(seq).v1();
    REQUIRE(u.is_ok());
    REQUIRE(u.value().version() == Version::Time);
    REQUIRE(u.value().variant() == Variant::Rfc);
    REQUIRE(Uuid::is_valid(u.value().to_string()));
}

TEST_CASE("v1 embeds node, clock sequence and current time", "[generator][v1]") {
    ClockSeq seq(0x2345);
    auto before = Timestamp::now().value();
    auto u = fixed_generator(seq).v1();
    auto after = Timestamp::now().value();
    REQUIRE(u.is_ok());

    Layout l = Layout::decode(u.value().bytes);
    REQUIRE(l.node == kNode);
    REQUIRE(l.as_fields().clock_seq == (0x8000 | (0x2345 & 0x3FFF)));
    REQUIRE(u.value().time().ticks >= before.ticks);
    REQUIRE(u.value().time().ticks <= after.ticks);
    REQUIRE(seq.peek() == 0x2346);
}

TEST_CASE("v1 values differ within the same clock tick", "[generator][v1]") {
    ClockSeq seq(0);
    auto gen = fixed_generator(seq);
    std::set<Uuid> seen;
    for (int i = 0; i < 1000; ++i) {
        auto u = gen.v1();
        REQUIRE(u.is_ok());
        REQUIRE(seen.insert(u.value()).second);
    }
}

TEST_CASE("v1 surfaces NodeUnavailable from the provider", "[generator][v1]") {
    ClockSeq seq(0);
    Generator gen(std::make_shared<MissingNodeProvider>(), seq);
    auto u = gen.v1();
    REQUIRE(u.is_err());
    REQUIRE(u.error().code == QuidError::NodeUnavailable);
}

TEST_CASE("Default generator uses the host with random fallback", "[generator][v1]") {
    Generator gen;
    REQUIRE(std::string(gen.node_provider().name()) == "interface");
    auto u = gen.v1();
    REQUIRE(u.is_ok());
    REQUIRE(u.value().version() == Version::Time);
}

// ===== v2 =====

TEST_CASE("v2 tags version DCE for every domain", "[generator][v2]") {
    ClockSeq seq(0);
    auto gen = fixed_generator(seq);
    for (Domain d : {Domain::Person, Domain::Group, Domain::Org}) {
        auto u = gen.v2(d);
        REQUIRE(u.is_ok());
        REQUIRE(u.value().version() == Version::Dce);
        REQUIRE(u.value().variant() == Variant::Rfc);
        REQUIRE(u.value().bytes[9] == static_cast<uint8_t>(d));
    }
}

TEST_CASE("v2 stores the local id in time_low", "[generator][v2]") {
    ClockSeq seq(0);
    auto gen = fixed_generator(seq);

    auto custom = gen.v2(Domain::Person, 0xdeadbeef);
    REQUIRE(custom.is_ok());
    REQUIRE(Layout::decode(custom.value().bytes).time_low == 0xdeadbeef);

    auto person = gen.v2(Domain::Person);
    REQUIRE(Layout::decode(person.value().bytes).time_low == local_id(Domain::Person));

    auto org = gen.v2(Domain::Org);
    REQUIRE(Layout::decode(org.value().bytes).time_low == 0);
    REQUIRE(local_id(Domain::Org) == 0);
}

// ===== from_utc / from_mac =====

TEST_CASE("from_utc keeps the given timestamp", "[generator][from_utc]") {
    ClockSeq seq(0);
    auto gen = fixed_generator(seq);
    auto u = gen.from_utc(Version::Time, 0x1234);
    REQUIRE(u.is_ok());
    REQUIRE(u.value().version() == Version::Time);
    REQUIRE(u.value().time().ticks == 0x1234);

    auto dce = gen.from_utc(Version::Dce, 0x0abcdef012345678ULL);
    REQUIRE(dce.is_ok());
    REQUIRE(dce.value().version() == Version::Dce);
    REQUIRE(dce.value().time().ticks == 0x0abcdef012345678ULL);
}

TEST_CASE("from_mac keeps the given node", "[generator][from_mac]") {
    ClockSeq seq(0);
    Generator gen(std::make_shared<MissingNodeProvider>(), seq);
    auto node = Node::from_bytes({0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f});
    auto u = gen.from_mac(Version::Time, node);
    REQUIRE(u.is_ok());
    REQUIRE(u.value().version() == Version::Time);
    REQUIRE(Layout::decode(u.value().bytes).node == node);
}

TEST_CASE("from_utc and from_mac reject non-time versions", "[generator]") {
    ClockSeq seq(0);
    auto gen = fixed_generator(seq);
    for (Version v : {Version::Md5, Version::Random, Version::Sha1}) {
        auto a = gen.from_utc(v, 0x1234);
        REQUIRE(a.is_err());
        REQUIRE(a.error().code == QuidError::UnsupportedVersion);

        auto b = gen.from_mac(v, kNode);
        REQUIRE(b.is_err());
        REQUIRE(b.error().code == QuidError::UnsupportedVersion);
    }
    // Rejected calls do not consume clock sequence values.
    REQUIRE(seq.peek() == 0);
}
