#include <catch2/catch.hpp>
#include <quid/node.hpp>

using namespace quid;

TEST_CASE("Node to_string in both cases", "[node]") {
    auto node = Node::from_bytes({0x00, 0x2a, 0x35, 0x0d, 0x13, 0x80});
    REQUIRE(node.to_string() == "00-2a-35-0d-13-80");
    REQUIRE(node.to_string(Case::Upper) == "00-2A-35-0D-13-80");
}

TEST_CASE("Node to_u48 is big-endian", "[node]") {
    auto node = Node::from_bytes({0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
    REQUIRE(node.to_u48() == 0x010203040506ULL);
}

TEST_CASE("Node parse accepts ':' and '-'", "[node]") {
    auto colon = Node::parse("02:00:5e:10:00:01");
    REQUIRE(colon.is_ok());
    REQUIRE(colon.value() == Node::from_bytes({0x02, 0x00, 0x5e, 0x10, 0x00, 0x01}));

    auto dash = Node::parse("02-00-5E-10-00-01");
    REQUIRE(dash.is_ok());
    REQUIRE(dash.value() == colon.value());
}

TEST_CASE("Node parse rejects malformed addresses", "[node]") {
    for (const char* bad : {"", "02:00:5e:10:00", "02:00:5e:10:00:0g",
                            "02:00-5e:10:00:01", "02.00.5e.10.00.01",
                            "02:00:5e:10:00:01:"}) {
        auto r = Node::parse(bad);
        INFO(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == QuidError::Parse);
    }
}

TEST_CASE("FixedNodeProvider returns the configured bytes", "[node]") {
    auto node = Node::from_bytes({0x03, 0x2a, 0x35, 0x0d, 0x13, 0x80});
    FixedNodeProvider p(node);
    REQUIRE(p.resolve().value() == node);
    REQUIRE(std::string(p.name()) == "fixed");
}

TEST_CASE("RandomNodeProvider sets the multicast bit", "[node]") {
    RandomNodeProvider from_entropy({0x00, 0x11, 0x22, 0x33, 0x44, 0x55});
    REQUIRE(from_entropy.resolve().value() ==
            Node::from_bytes({0x01, 0x11, 0x22, 0x33, 0x44, 0x55}));

    for (int i = 0; i < 20; ++i) {
        RandomNodeProvider p;
        REQUIRE(p.resolve().value().is_multicast());
    }
}

TEST_CASE("RandomNodeProvider is stable per instance", "[node]") {
    RandomNodeProvider p;
    REQUIRE(p.resolve().value() == p.resolve().value());
}

TEST_CASE("InterfaceNodeProvider without fallback reports NodeUnavailable", "[node]") {
    InterfaceNodeProvider p(NodeFallback::None);
    auto r = p.resolve();
    auto hw = hardware_address();
    if (hw.is_ok()) {
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == hw.value());
        REQUIRE_FALSE(r.value().to_u48() == 0);
    } else {
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == QuidError::NodeUnavailable);
    }
}

TEST_CASE("InterfaceNodeProvider with random fallback always resolves", "[node]") {
    InterfaceNodeProvider p(NodeFallback::Random);
    auto r = p.resolve();
    REQUIRE(r.is_ok());
    if (hardware_address().is_err()) {
        REQUIRE(r.value().is_multicast());
    }
}
