#pragma once

#include <cstdint>

namespace quid {

// Generation algorithm, stored in the top nibble of byte 6.
enum class Version : uint8_t {
    Time   = 1,
    Dce    = 2,
    Md5    = 3,
    Random = 4,
    Sha1   = 5
};

// Identifier family, stored in the top bits of byte 8 using the RFC4122
// variable-width encoding: 0xx NCS, 10x RFC4122, 110 Microsoft, 111 Future.
enum class Variant : uint8_t {
    Ncs,
    Rfc,
    Microsoft,
    Future
};

// DCE security domain for version 2, stored in clock_seq_low.
enum class Domain : uint8_t {
    Person = 0,
    Group  = 1,
    Org    = 2
};

enum class Case {
    Lower,
    Upper
};

const char* version_name(Version v);
const char* variant_name(Variant v);
const char* domain_name(Domain d);

} // namespace quid
