#include "chunkvault/compression.hpp"

#include "chunkvault/errors.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include <zlib.h>

#if CHUNKVAULT_HAS_LZMA
#include <lzma.h>
#endif

namespace chunkvault::compression {

namespace {

constexpr std::size_t kBufferSize = 1 << 16;

// zlib counts avail_in/avail_out in uInt, so large inputs are fed in slices.
constexpr std::size_t kMaxZlibSlice = 1u << 30;

void AppendBounded(Bytes& out, const std::uint8_t* data, std::size_t len, std::size_t max_output) {
    if (len > max_output - out.size()) {
        throw std::runtime_error("Decompressed data exceeds the expected size");
    }
    out.insert(out.end(), data, data + len);
}

Bytes ZlibCompress(const std::uint8_t* data, std::size_t size, int level) {
    z_stream zs{};
    if (deflateInit(&zs, level) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib compressor");
    }
    Bytes out;
    out.reserve(static_cast<std::size_t>(deflateBound(&zs, static_cast<uLong>(std::min(size, kMaxZlibSlice)))));
    std::array<std::uint8_t, kBufferSize> buffer{};
    std::size_t offset = 0;
    int rc = Z_OK;
    do {
        std::size_t slice = std::min(size - offset, kMaxZlibSlice);
        zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data + offset));
        zs.avail_in = static_cast<uInt>(slice);
        offset += slice;
        int flush = offset == size ? Z_FINISH : Z_NO_FLUSH;
        do {
            zs.next_out = buffer.data();
            zs.avail_out = static_cast<uInt>(buffer.size());
            rc = deflate(&zs, flush);
            if (rc == Z_STREAM_ERROR) {
                deflateEnd(&zs);
                throw std::runtime_error("zlib compression failed");
            }
            out.insert(out.end(), buffer.data(), buffer.data() + (buffer.size() - zs.avail_out));
        } while (zs.avail_out == 0);
    } while (rc != Z_STREAM_END);
    deflateEnd(&zs);
    return out;
}

Bytes ZlibDecompress(const Bytes& input, std::size_t max_output) {
    z_stream zs{};
    if (inflateInit(&zs) != Z_OK) {
        throw std::runtime_error("Failed to initialize zlib decompressor");
    }
    Bytes out;
    std::array<std::uint8_t, kBufferSize> buffer{};
    std::size_t offset = 0;
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        if (zs.avail_in == 0 && offset < input.size()) {
            std::size_t slice = std::min(input.size() - offset, kMaxZlibSlice);
            zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(input.data() + offset));
            zs.avail_in = static_cast<uInt>(slice);
            offset += slice;
        }
        zs.next_out = buffer.data();
        zs.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&zs, Z_NO_FLUSH);
        if (rc == Z_BUF_ERROR && zs.avail_in == 0 && offset == input.size()) {
            inflateEnd(&zs);
            throw std::runtime_error("zlib stream truncated");
        }
        if (rc != Z_OK && rc != Z_STREAM_END) {
            inflateEnd(&zs);
            throw std::runtime_error("zlib stream is malformed");
        }
        try {
            AppendBounded(out, buffer.data(), buffer.size() - zs.avail_out, max_output);
        } catch (...) {
            inflateEnd(&zs);
            throw;
        }
    }
    bool trailing = zs.avail_in != 0 || offset != input.size();
    inflateEnd(&zs);
    if (trailing) {
        throw std::runtime_error("Trailing bytes after zlib stream");
    }
    return out;
}

#if CHUNKVAULT_HAS_LZMA
Bytes XzCompress(const std::uint8_t* data, std::size_t size, int level) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_easy_encoder(&strm, static_cast<std::uint32_t>(level), LZMA_CHECK_CRC64) != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz encoder");
    }
    Bytes out;
    std::array<std::uint8_t, kBufferSize> buffer{};
    strm.next_in = data;
    strm.avail_in = size;
    lzma_ret ret = LZMA_OK;
    while (ret != LZMA_STREAM_END) {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            throw std::runtime_error("xz compression failed");
        }
        out.insert(out.end(), buffer.data(), buffer.data() + (buffer.size() - strm.avail_out));
    }
    lzma_end(&strm);
    return out;
}

Bytes XzDecompress(const Bytes& input, std::size_t max_output) {
    lzma_stream strm = LZMA_STREAM_INIT;
    if (lzma_stream_decoder(&strm, UINT64_MAX, 0) != LZMA_OK) {
        throw std::runtime_error("Failed to initialize xz decoder");
    }
    Bytes out;
    std::array<std::uint8_t, kBufferSize> buffer{};
    strm.next_in = input.data();
    strm.avail_in = input.size();
    lzma_ret ret = LZMA_OK;
    while (ret != LZMA_STREAM_END) {
        strm.next_out = buffer.data();
        strm.avail_out = buffer.size();
        ret = lzma_code(&strm, LZMA_FINISH);
        if (ret != LZMA_OK && ret != LZMA_STREAM_END) {
            lzma_end(&strm);
            throw std::runtime_error("xz stream is malformed");
        }
        try {
            AppendBounded(out, buffer.data(), buffer.size() - strm.avail_out, max_output);
        } catch (...) {
            lzma_end(&strm);
            throw;
        }
    }
    bool trailing = strm.avail_in != 0;
    lzma_end(&strm);
    if (trailing) {
        throw std::runtime_error("Trailing bytes after xz stream");
    }
    return out;
}
#endif

}  // namespace

bool IsAvailable(Compression algo) {
    switch (algo) {
        case Compression::Zlib:
            return true;
        case Compression::Xz:
#if CHUNKVAULT_HAS_LZMA
            return true;
#else
            return false;
#endif
    }
    return false;
}

std::string Name(Compression algo) {
    switch (algo) {
        case Compression::Zlib:
            return "zlib";
        case Compression::Xz:
            return "xz";
    }
    return "unknown";
}

Compression FromName(const std::string& name) {
    Compression algo;
    if (name == "zlib") {
        algo = Compression::Zlib;
    } else if (name == "xz") {
        algo = Compression::Xz;
    } else {
        throw ConfigurationError("Unknown compression '" + name + "'");
    }
    if (!IsAvailable(algo)) {
        throw ConfigurationError("Compression '" + name + "' is not available in this build");
    }
    return algo;
}

Compression FromId(std::uint8_t id) {
    switch (id) {
        case static_cast<std::uint8_t>(Compression::Zlib):
            return Compression::Zlib;
        case static_cast<std::uint8_t>(Compression::Xz):
            return Compression::Xz;
        default:
            throw std::runtime_error("Unknown compression id " + std::to_string(id));
    }
}

int MaxLevel(Compression algo) {
    return algo == Compression::Zlib ? Z_BEST_COMPRESSION : 9;
}

std::uint64_t WorstCaseSize(Compression algo, std::uint64_t size) {
    if (algo == Compression::Xz) {
#if CHUNKVAULT_HAS_LZMA
        return static_cast<std::uint64_t>(lzma_stream_buffer_bound(static_cast<std::size_t>(size)));
#endif
    }
    // Same bound as zlib's compressBound, without the uLong range limit.
    return size + (size >> 12) + (size >> 14) + (size >> 25) + 13;
}

Bytes Compress(const std::uint8_t* data, std::size_t size, Compression algo, int level) {
    if (level < 0 || level > MaxLevel(algo)) {
        throw std::runtime_error("Compression level " + std::to_string(level) + " out of range for "
                                 + Name(algo));
    }
    switch (algo) {
        case Compression::Zlib:
            return ZlibCompress(data, size, level);
        case Compression::Xz:
#if CHUNKVAULT_HAS_LZMA
            return XzCompress(data, size, level);
#else
            break;
#endif
    }
    throw std::runtime_error("Compression " + Name(algo) + " is not available in this build");
}

Bytes Decompress(const Bytes& data, Compression algo, std::size_t max_output) {
    switch (algo) {
        case Compression::Zlib:
            return ZlibDecompress(data, max_output);
        case Compression::Xz:
#if CHUNKVAULT_HAS_LZMA
            return XzDecompress(data, max_output);
#else
            break;
#endif
    }
    throw std::runtime_error("Compression " + Name(algo) + " is not available in this build");
}

}  // namespace chunkvault::compression
