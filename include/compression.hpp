#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace volley {

enum class CompressionType {
    None,
    Gzip,
    Deflate,
    Brotli
};

// Incremental Content-Encoding decoder. Errors throw ContentDecodingError.
class Decoder {
public:
    virtual ~Decoder() = default;

    // Decodes `len` more input bytes, appending the output to `out`.
    virtual void feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out) = 0;

    // Called after the last input byte. Throws if the stream was cut short.
    virtual void finish(std::vector<uint8_t>& out) = 0;
};

class Compression {
public:
    // nullptr for CompressionType::None
    static std::unique_ptr<Decoder> make_decoder(CompressionType type);

    // Detect compression type from header
    static CompressionType detect_from_header(const std::string& content_encoding);

    // Get Accept-Encoding header value
    static std::string get_accept_encoding_header();
};

} // namespace volley
