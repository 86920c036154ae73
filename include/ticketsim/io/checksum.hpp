#pragma once

/** \file checksum.hpp
 *  \brief CRC-32C (Castagnoli) over byte ranges, used as the trailer of persisted blobs.
 */

#include <cstdint>
#include <span>

namespace ticketsim::io {

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

} // namespace ticketsim::io
