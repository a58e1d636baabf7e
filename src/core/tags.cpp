#include <quid/tags.hpp>

namespace quid {

const char* version_name(Version v) {
    switch (v) {
    case Version::Time:   return "time";
    case Version::Dce:    return "dce";
    case Version::Md5:    return "md5";
    case Version::Random: return "random";
    case Version::Sha1:   return "sha1";
    }
    return "?";
}

const char* variant_name(Variant v) {
    switch (v) {
    case Variant::Ncs:       return "ncs";
    case Variant::Rfc:       return "rfc4122";
    case Variant::Microsoft: return "microsoft";
    case Variant::Future:    return "future";
    }
    return "?";
}

const char* domain_name(Domain d) {
    switch (d) {
    case Domain::Person: return "person";
    case Domain::Group:  return "group";
    case Domain::Org:    return "org";
    }
    return "?";
}

} // namespace quid
