#include <fcl/util/crc32.hpp>

#include <array>

namespace fcl {

namespace {

std::array<uint32_t, 256> build_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < table.size(); ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ 0xEDB88320u : (crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

const std::array<uint32_t, 256>& table() {
    static const std::array<uint32_t, 256> instance = build_table();
    return instance;
}

}  // namespace

uint32_t CRC32::update(uint32_t crc, const char* data, size_t len) {
    const auto& lookup = table();
    const auto* bytes = reinterpret_cast<const unsigned char*>(data);

    crc = ~crc;
    for (size_t i = 0; i < len; ++i) {
        crc = lookup[(crc ^ bytes[i]) & 0xFFu] ^ (crc >> 8);
    }
    return ~crc;
}

uint32_t CRC32::compute(const char* data, size_t len) {
    return update(0, data, len);
}

uint32_t CRC32::compute(const std::string& data) {
    return update(0, data.data(), data.size());
}

}  // namespace fcl
