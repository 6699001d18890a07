#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace fcl {

/**
 * CRC32 (IEEE polynomial) used to validate record-log frames.
 */
class CRC32 {
public:
    static uint32_t compute(const char* data, size_t len);
    static uint32_t compute(const std::string& data);

    /**
     * Continue a running checksum over another chunk.
     */
    static uint32_t update(uint32_t crc, const char* data, size_t len);
};

}  // namespace fcl
