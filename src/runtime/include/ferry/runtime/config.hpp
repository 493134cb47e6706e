#pragma once

#include <cstddef>
#include <cstdint>

namespace ferry::runtime
{

struct TransportConfig {
    std::uint32_t max_frame_length = 64U * 1024U * 1024U;  ///< binary frames above this are rejected
    std::size_t read_chunk_size = 4096;                   ///< bytes requested per read by the JSON codec
};

}  // namespace ferry::runtime
