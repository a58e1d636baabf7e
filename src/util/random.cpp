#include <quid/random.hpp>
#include <fstream>
#include <random>

namespace quid {

void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }

    std::random_device rd;
    std::mt19937_64 gen(rd());
    size_t i = 0;
    while (i < len) {
        uint64_t word = gen();
        for (int b = 0; b < 8 && i < len; ++b, ++i) {
            buf[i] = static_cast<uint8_t>(word >> (b * 8));
        }
    }
}

} // namespace quid
