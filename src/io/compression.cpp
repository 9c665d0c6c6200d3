#include <fidelity/io/compression.h>
#include <fidelity/core/error.h>
#include <zlib.h>
#include <algorithm>
#include <limits>

namespace fidelity::io {

namespace {

constexpr int kGzipWindowBits = 15 + 16;
// 15 + 32 enables automatic gzip / zlib header detection
constexpr int kAutoDetectWindowBits = 15 + 32;

constexpr std::size_t kMaxChunk = std::numeric_limits<uInt>::max();

const char* zlib_message(const z_stream& strm, int ret) {
    if (strm.msg) return strm.msg;
    return ret == Z_MEM_ERROR ? "out of memory" : "unexpected end of data";
}

// Hands zlib the next slice of input once the previous one is consumed.
// avail_in is a uInt, so inputs beyond 4 GiB go in several slices.
void refill(z_stream& strm, std::string_view data, std::size_t& offset) {
    if (strm.avail_in != 0 || offset >= data.size()) return;
    std::size_t slice = std::min(data.size() - offset, kMaxChunk);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data() + offset));
    strm.avail_in = static_cast<uInt>(slice);
    offset += slice;
}

} // namespace

bool is_gzip(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1F &&
           static_cast<unsigned char>(data[1]) == 0x8B;
}

std::string decompress_gzip(std::string_view compressed, std::size_t max_size) {
    z_stream strm{};
    if (inflateInit2(&strm, kAutoDetectWindowBits) != Z_OK) {
        throw IoError("Cannot initialize gzip decoder");
    }

    auto fail = [&strm](const std::string& message) {
        inflateEnd(&strm);
        throw IoError("Cannot decompress gzip input: " + message);
    };

    std::size_t offset = 0;
    std::string output;
    output.reserve(std::min(compressed.size() * 4, max_size));

    char buffer[32768];
    while (true) {
        refill(strm, compressed, offset);
        strm.avail_out = sizeof(buffer);
        strm.next_out = reinterpret_cast<Bytef*>(buffer);

        int ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_STREAM_ERROR || ret == Z_DATA_ERROR ||
            ret == Z_MEM_ERROR || ret == Z_NEED_DICT || ret == Z_BUF_ERROR) {
            fail(zlib_message(strm, ret));
        }

        std::size_t have = sizeof(buffer) - strm.avail_out;
        if (have > max_size - output.size()) {
            fail("output exceeds the limit of " + std::to_string(max_size) + " bytes");
        }
        output.append(buffer, have);

        if (ret != Z_STREAM_END) continue;

        // Concatenated members decode as one stream (RFC 1952 section 2.2)
        refill(strm, compressed, offset);
        if (strm.avail_in == 0) break;
        if (inflateReset(&strm) != Z_OK) {
            fail("cannot start the next gzip member");
        }
    }

    inflateEnd(&strm);
    return output;
}

std::string compress_gzip(std::string_view data) {
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, kGzipWindowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw IoError("Cannot initialize gzip encoder");
    }

    std::size_t offset = 0;
    std::string output;
    char buffer[32768];
    int ret;
    do {
        refill(strm, data, offset);
        int flush = (offset >= data.size()) ? Z_FINISH : Z_NO_FLUSH;
        strm.avail_out = sizeof(buffer);
        strm.next_out = reinterpret_cast<Bytef*>(buffer);
        ret = deflate(&strm, flush);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&strm);
            throw IoError("Cannot compress output");
        }
        output.append(buffer, sizeof(buffer) - strm.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&strm);
    return output;
}

} // namespace fidelity::io
