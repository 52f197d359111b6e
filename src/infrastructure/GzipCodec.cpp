#include "infrastructure/GzipCodec.hpp"
#include <zlib.h>
#include <stdexcept>
#include <cstring>

namespace crawlscope::infrastructure {

namespace {
constexpr size_t kChunkSize = 64 * 1024;
}

bool GzipCodec::IsGzipped(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

std::optional<std::string> GzipCodec::Decompress(std::string_view data) {
    if (!IsGzipped(data)) {
        return std::nullopt;
    }
    GzipInflater inflater;
    std::string out;
    if (!inflater.feed(data, out) || !inflater.atMemberBoundary()) {
        return std::nullopt;
    }
    return out;
}

std::string GzipCodec::Compress(std::string_view data) {
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    // 16 + MAX_WBITS selects the gzip wrapper
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char buffer[kChunkSize];
    int ret;
    do {
        zs.next_out = reinterpret_cast<Bytef*>(buffer);
        zs.avail_out = sizeof(buffer);
        ret = deflate(&zs, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&zs);
            throw std::runtime_error("deflate failed");
        }
        out.append(buffer, sizeof(buffer) - zs.avail_out);
    } while (ret != Z_STREAM_END);

    deflateEnd(&zs);
    return out;
}

GzipInflater::GzipInflater() : m_stream(std::make_unique<z_stream_s>()) {
    std::memset(m_stream.get(), 0, sizeof(z_stream_s));
    if (inflateInit2(m_stream.get(), 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("inflateInit2 failed");
    }
}

GzipInflater::~GzipInflater() {
    inflateEnd(m_stream.get());
}

bool GzipInflater::feed(std::string_view chunk, std::string& out) {
    if (m_failed) return false;
    if (m_trailingIgnored || chunk.empty()) return true;

    z_stream_s* zs = m_stream.get();
    zs->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(chunk.data()));
    zs->avail_in = static_cast<uInt>(chunk.size());

    char buffer[kChunkSize];
    bool outputFull = false;
    while (zs->avail_in > 0 || outputFull) {
        if (m_memberEnded) {
            if (zs->avail_in == 0) break;
            // Only a gzip magic byte may start the next member
            if (zs->next_in[0] != 0x1f) {
                m_trailingIgnored = true;
                return true;
            }
            inflateReset(zs);
            m_memberEnded = false;
        }

        zs->next_out = reinterpret_cast<Bytef*>(buffer);
        zs->avail_out = sizeof(buffer);
        int ret = inflate(zs, Z_NO_FLUSH);
        out.append(buffer, sizeof(buffer) - zs->avail_out);
        outputFull = (zs->avail_out == 0);

        if (ret == Z_STREAM_END) {
            m_memberEnded = true;
            outputFull = false;
        } else if (ret == Z_BUF_ERROR) {
            // No progress possible until more input arrives
            break;
        } else if (ret != Z_OK) {
            m_failed = true;
            return false;
        }
    }
    return true;
}

} // namespace crawlscope::infrastructure
