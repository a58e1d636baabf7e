#include <catch2/catch.hpp>
#include <quid/md5.hpp>
#include <string>

using namespace quid;

// RFC 1321 appendix A.5 test suite

TEST_CASE("MD5 empty string", "[md5]") {
    REQUIRE(MD5::hash_hex("") == "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_CASE("MD5 'abc'", "[md5]") {
    REQUIRE(MD5::hash_hex("abc") == "900150983cd24fb0d6963f7d28e17f72");
}

TEST_CASE("MD5 'message digest'", "[md5]") {
    REQUIRE(MD5::hash_hex("message digest") == "f96b697d7cb7938d525a2f31aaf161d0");
}

TEST_CASE("MD5 alphabet", "[md5]") {
    REQUIRE(MD5::hash_hex("abcdefghijklmnopqrstuvwxyz") == "c3fcd3d76192e4007dfb496cca67e13b");
}

TEST_CASE("MD5 80-digit message spans two blocks", "[md5]") {
    std::string digits;
    for (int i = 0; i < 8; ++i) digits += "1234567890";
    REQUIRE(MD5::hash_hex(digits) == "57edf4a22be3c955ac49da2e2107b67a");
}

TEST_CASE("MD5 incremental update matches one-shot", "[md5]") {
    MD5 ctx;
    ctx.update("The quick brown ");
    ctx.update(reinterpret_cast<const uint8_t*>("fox jumps"), 9);
    ctx.update(" over the lazy dog");
    REQUIRE(MD5::bytes_to_hex(ctx.finalize()) == "9e107d9d372bb6826bd81d3542a419d6");
}
