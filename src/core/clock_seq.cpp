#include <quid/clock_seq.hpp>
#include <quid/log.hpp>
#include <quid/random.hpp>

namespace quid {

static uint16_t random_seed() {
    auto b = random_bytes<2>();
    uint16_t seed = static_cast<uint16_t>((b[0] << 8) | b[1]);
    log::trace("clock sequence seeded with 0x%04x", seed);
    return seed;
}

ClockSeq& ClockSeq::process() {
    static ClockSeq instance(random_seed());
    return instance;
}

} // namespace quid
