#include "compression.hpp"
#include "errors.hpp"
#include <brotli/encode.h>
#include <gtest/gtest.h>
#include <zlib.h>
#include <algorithm>
#include <string>
#include <vector>

using namespace volley;

namespace {

std::vector<uint8_t> bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// windowBits 31 = gzip wrapper, 15 = zlib wrapper, -15 = raw deflate
std::vector<uint8_t> zlib_compress(const std::string& input, int window_bits) {
    z_stream zs{};
    EXPECT_EQ(deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, window_bits, 8,
                           Z_DEFAULT_STRATEGY), Z_OK);
    std::vector<uint8_t> out(deflateBound(&zs, static_cast<uLong>(input.size())) + 32);
    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    zs.avail_in = static_cast<uInt>(input.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    EXPECT_EQ(deflate(&zs, Z_FINISH), Z_STREAM_END);
    out.resize(zs.total_out);
    deflateEnd(&zs);
    return out;
}

std::vector<uint8_t> brotli_compress(const std::string& input) {
    size_t size = BrotliEncoderMaxCompressedSize(input.size());
    std::vector<uint8_t> out(size);
    EXPECT_TRUE(BrotliEncoderCompress(BROTLI_DEFAULT_QUALITY, BROTLI_DEFAULT_WINDOW,
                                      BROTLI_MODE_TEXT, input.size(),
                                      reinterpret_cast<const uint8_t*>(input.data()),
                                      &size, out.data()));
    out.resize(size);
    return out;
}

std::string sample_text() {
    std::string text;
    for (int i = 0; i < 2000; ++i) {
        text += "line " + std::to_string(i) + " of a fairly repetitive body\n";
    }
    return text;
}

std::vector<uint8_t> decode_all(CompressionType type, const std::vector<uint8_t>& input) {
    auto decoder = Compression::make_decoder(type);
    std::vector<uint8_t> out;
    decoder->feed(input.data(), input.size(), out);
    decoder->finish(out);
    return out;
}

// Feeds the input a few bytes at a time
std::string decode_in_pieces(CompressionType type, const std::vector<uint8_t>& input,
                             size_t piece) {
    auto decoder = Compression::make_decoder(type);
    std::vector<uint8_t> out;
    for (size_t pos = 0; pos < input.size(); pos += piece) {
        decoder->feed(input.data() + pos, std::min(piece, input.size() - pos), out);
    }
    decoder->finish(out);
    return std::string(out.begin(), out.end());
}

} // namespace

TEST(CompressionTest, DetectsContentEncoding) {
    EXPECT_EQ(Compression::detect_from_header("gzip"), CompressionType::Gzip);
    EXPECT_EQ(Compression::detect_from_header("x-gzip"), CompressionType::Gzip);
    EXPECT_EQ(Compression::detect_from_header(" Deflate "), CompressionType::Deflate);
    EXPECT_EQ(Compression::detect_from_header("br"), CompressionType::Brotli);
    EXPECT_EQ(Compression::detect_from_header("identity"), CompressionType::None);
    EXPECT_EQ(Compression::detect_from_header(""), CompressionType::None);
    EXPECT_TRUE(Compression::make_decoder(CompressionType::None) == nullptr);
}

TEST(CompressionTest, NonAsciiContentEncoding) {
    EXPECT_EQ(Compression::detect_from_header("\xE9\xFF, GZIP"), CompressionType::Gzip);
    EXPECT_EQ(Compression::detect_from_header("br\xE9"), CompressionType::None);
}

TEST(CompressionTest, AcceptEncodingListsDecoders) {
    std::string accept = Compression::get_accept_encoding_header();
    EXPECT_NE(accept.find("gzip"), std::string::npos);
    EXPECT_NE(accept.find("deflate"), std::string::npos);
    EXPECT_NE(accept.find("br"), std::string::npos);
}

TEST(CompressionTest, GzipStreamsInSmallPieces) {
    std::string text = sample_text();
    auto packed = zlib_compress(text, 31);
    EXPECT_EQ(decode_in_pieces(CompressionType::Gzip, packed, 7), text);
}

TEST(CompressionTest, DeflateAcceptsZlibAndRawForms) {
    std::string text = sample_text();
    EXPECT_EQ(decode_in_pieces(CompressionType::Deflate, zlib_compress(text, 15), 100), text);
    EXPECT_EQ(decode_in_pieces(CompressionType::Deflate, zlib_compress(text, -15), 100), text);
}

TEST(CompressionTest, BrotliStreamsInSmallPieces) {
    std::string text = sample_text();
    auto packed = brotli_compress(text);
    EXPECT_EQ(decode_in_pieces(CompressionType::Brotli, packed, 5), text);
}

TEST(CompressionTest, WholeBufferDecode) {
    auto packed = zlib_compress("hello", 31);
    EXPECT_EQ(decode_all(CompressionType::Gzip, packed), bytes("hello"));
}

TEST(CompressionTest, TruncatedGzipFailsOnFinish) {
    auto packed = zlib_compress(sample_text(), 31);
    packed.resize(packed.size() / 2);

    auto decoder = Compression::make_decoder(CompressionType::Gzip);
    std::vector<uint8_t> out;
    decoder->feed(packed.data(), packed.size(), out);
    EXPECT_THROW(decoder->finish(out), ContentDecodingError);
}

TEST(CompressionTest, GarbageGzipThrows) {
    auto garbage = bytes("this is certainly not a gzip member");
    EXPECT_THROW(decode_all(CompressionType::Gzip, garbage), ContentDecodingError);
}
