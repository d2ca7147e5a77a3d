#include "utils/id_generator.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace meetscribe {
namespace utils {

std::string IdGenerator::uuid() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 255);

    unsigned char bytes[16];
    for (auto& b : bytes) {
        b = static_cast<unsigned char>(dis(gen));
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);  // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);  // RFC 4122 variant

    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            ss << "-";
        }
        ss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return ss.str();
}

std::string IdGenerator::generate(const std::string& prefix) {
    if (prefix.empty()) {
        return uuid();
    }
    return prefix + "_" + uuid();
}

} // namespace utils
} // namespace meetscribe
