#include "compression.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <zlib.h>
#include <brotli/decode.h>

namespace volley {

namespace {

constexpr size_t kChunkSize = 32768;

// gzip and deflate. Deflate bodies come both zlib-wrapped and raw; the first
// byte tells which.
class ZlibDecoder : public Decoder {
public:
    explicit ZlibDecoder(CompressionType type) : type_(type) {}

    ~ZlibDecoder() override {
        if (initialized_) {
            inflateEnd(&stream_);
        }
    }

    void feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out) override {
        if (len == 0 || done_) {
            return;
        }
        if (!initialized_) {
            init(data[0]);
        }

        stream_.next_in = const_cast<Bytef*>(data);
        stream_.avail_in = static_cast<uInt>(len);

        uint8_t chunk[kChunkSize];
        bool more = true;
        while (more && !done_) {
            stream_.next_out = chunk;
            stream_.avail_out = sizeof(chunk);

            int ret = inflate(&stream_, Z_NO_FLUSH);
            if (ret == Z_STREAM_END) {
                done_ = true;
            } else if (ret != Z_OK && ret != Z_BUF_ERROR) {
                throw ContentDecodingError(std::string("Failed to decode response body: ") +
                                           (stream_.msg ? stream_.msg : "zlib error " + std::to_string(ret)));
            }

            size_t have = sizeof(chunk) - stream_.avail_out;
            out.insert(out.end(), chunk, chunk + have);

            more = stream_.avail_out == 0 || (stream_.avail_in > 0 && ret != Z_BUF_ERROR);
        }
    }

    void finish(std::vector<uint8_t>& /*out*/) override {
        if (initialized_ && !done_) {
            throw ContentDecodingError("Compressed response body is truncated");
        }
    }

private:
    void init(uint8_t first_byte) {
        int window_bits;
        if (type_ == CompressionType::Gzip) {
            window_bits = 15 + 16;
        } else {
            // A zlib header starts with CM=8 in the low nibble
            window_bits = (first_byte & 0x0F) == 8 ? 15 : -15;
        }
        if (inflateInit2(&stream_, window_bits) != Z_OK) {
            throw ContentDecodingError("Failed to initialize zlib");
        }
        initialized_ = true;
    }

    CompressionType type_;
    z_stream stream_{};
    bool initialized_ = false;
    bool done_ = false;
};

class BrotliDecoder : public Decoder {
public:
    BrotliDecoder() : state_(BrotliDecoderCreateInstance(nullptr, nullptr, nullptr)) {
        if (!state_) {
            throw ContentDecodingError("Failed to initialize brotli");
        }
    }

    ~BrotliDecoder() override {
        BrotliDecoderDestroyInstance(state_);
    }

    void feed(const uint8_t* data, size_t len, std::vector<uint8_t>& out) override {
        size_t avail_in = len;
        const uint8_t* next_in = data;

        uint8_t chunk[kChunkSize];
        while (true) {
            size_t avail_out = sizeof(chunk);
            uint8_t* next_out = chunk;

            BrotliDecoderResult result = BrotliDecoderDecompressStream(
                state_, &avail_in, &next_in, &avail_out, &next_out, nullptr);

            out.insert(out.end(), chunk, next_out);

            if (result == BROTLI_DECODER_RESULT_ERROR) {
                throw ContentDecodingError(std::string("Failed to decode response body: ") +
                                           BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state_)));
            }
            if (result != BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT) {
                break;
            }
        }
    }

    void finish(std::vector<uint8_t>& /*out*/) override {
        if (!BrotliDecoderIsFinished(state_)) {
            throw ContentDecodingError("Compressed response body is truncated");
        }
    }

private:
    BrotliDecoderState* state_;
};

} // namespace

std::unique_ptr<Decoder> Compression::make_decoder(CompressionType type) {
    switch (type) {
        case CompressionType::Gzip:
        case CompressionType::Deflate:
            return std::make_unique<ZlibDecoder>(type);
        case CompressionType::Brotli:
            return std::make_unique<BrotliDecoder>();
        case CompressionType::None:
        default:
            return nullptr;
    }
}

CompressionType Compression::detect_from_header(const std::string& content_encoding) {
    std::string lower = content_encoding;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    // Only the outermost (last listed) coding is undone
    size_t comma = lower.rfind(',');
    if (comma != std::string::npos) {
        lower = lower.substr(comma + 1);
    }
    lower.erase(lower.find_last_not_of(" \t") + 1);
    lower.erase(0, std::min(lower.size(), lower.find_first_not_of(" \t")));

    if (lower == "br") {
        return CompressionType::Brotli;
    } else if (lower == "gzip" || lower == "x-gzip") {
        return CompressionType::Gzip;
    } else if (lower == "deflate") {
        return CompressionType::Deflate;
    }

    return CompressionType::None;
}

std::string Compression::get_accept_encoding_header() {
    return "br, gzip, deflate";
}

} // namespace volley
