#include "id_generator.hpp"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace ouroboros {

std::string IdGenerator::generateUuid() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<unsigned int> dis(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(dis(gen));
    }

    // version 4, variant 10xx
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << '-';
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

bool IdGenerator::isValidUuid(const std::string& id) {
    if (id.size() != 36) {
        return false;
    }

    for (std::size_t i = 0; i < id.size(); ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) {
            if (id[i] != '-') {
                return false;
            }
        } else if (!std::isxdigit(static_cast<unsigned char>(id[i]))) {
            return false;
        }
    }
    return true;
}

} // namespace ouroboros
