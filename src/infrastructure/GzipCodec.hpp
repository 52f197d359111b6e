/**
 * @file GzipCodec.hpp
 * @brief gzip detection and (multi-member) decompression over zlib.
 */

#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <memory>

struct z_stream_s;

namespace crawlscope::infrastructure {

class GzipCodec {
public:
    /** @brief True when @p data starts with the gzip magic bytes. */
    static bool IsGzipped(std::string_view data);

    /**
     * @brief Inflates a complete gzip buffer, concatenated members included.
     * @return nullopt when the input is not valid gzip.
     */
    static std::optional<std::string> Decompress(std::string_view data);

    /** @brief Compresses @p data as a single gzip member. */
    static std::string Compress(std::string_view data);
};

/**
 * @class GzipInflater
 * @brief Incremental inflater for chunked input.
 *
 * Segment files are a concatenation of independently gzipped records, so the
 * stream is reset at every member boundary. Anything after the last member
 * that does not start a new member is ignored.
 */
class GzipInflater {
public:
    GzipInflater();
    ~GzipInflater();

    GzipInflater(const GzipInflater&) = delete;
    GzipInflater& operator=(const GzipInflater&) = delete;

    /**
     * @brief Inflates one chunk, appending output to @p out.
     * @return false on corrupt input; the inflater is unusable afterwards.
     */
    bool feed(std::string_view chunk, std::string& out);

    /** @brief True once a member has ended and no further member began. */
    bool atMemberBoundary() const { return m_memberEnded; }

private:
    std::unique_ptr<z_stream_s> m_stream;
    bool m_memberEnded = false;
    bool m_trailingIgnored = false;
    bool m_failed = false;
};

} // namespace crawlscope::infrastructure
