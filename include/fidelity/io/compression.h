#pragma once
#include <fidelity/core/config.h>
#include <cstddef>
#include <string>
#include <string_view>

namespace fidelity::io {

// gzip member header: ID1 ID2
bool is_gzip(std::string_view data);

// Inflates every gzip (or zlib-wrapped) member in compressed and returns the
// concatenated output. IoError on corrupt or truncated data, on trailing
// bytes that do not form another member, and once the output would exceed
// max_size bytes.
std::string decompress_gzip(std::string_view compressed,
                            std::size_t max_size = config::kMaxInflatedSize);

std::string compress_gzip(std::string_view data);

} // namespace fidelity::io
