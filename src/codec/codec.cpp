/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/codec/codec.hpp>

#include <array>
#include <cstdint>

#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <zlib.h>

namespace meshgossip::codec {
  namespace {
    constexpr std::string_view kBase64Alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

    constexpr std::string_view kBase36Digits =
        "0123456789abcdefghijklmnopqrstuvwxyz";

    // Inflate output grows in steps of this size.
    constexpr size_t kInflateStep = 1024;

    bool isContinuation(uint8_t byte) {
      return (byte & 0xC0) == 0x80;
    }
  }  // namespace

  bool isValidUtf8(std::string_view text) {
    size_t i = 0;
    while (i < text.size()) {
      auto lead = static_cast<uint8_t>(text[i]);
      size_t length = 0;
      uint32_t code_point = 0;
      if (lead < 0x80) {
        ++i;
        continue;
      }
      if ((lead & 0xE0) == 0xC0) {
        length = 2;
        code_point = lead & 0x1F;
      } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        code_point = lead & 0x0F;
      } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        code_point = lead & 0x07;
      } else {
        return false;
      }
      if (i + length > text.size()) {
        return false;
      }
      for (size_t j = 1; j < length; ++j) {
        auto byte = static_cast<uint8_t>(text[i + j]);
        if (not isContinuation(byte)) {
          return false;
        }
        code_point = (code_point << 6) | (byte & 0x3F);
      }
      static constexpr std::array<uint32_t, 5> kMinForLength{
          0, 0, 0x80, 0x800, 0x10000};
      if (code_point < kMinForLength[length] or code_point > 0x10FFFF
          or (code_point >= 0xD800 and code_point <= 0xDFFF)) {
        return false;
      }
      i += length;
    }
    return true;
  }

  size_t utf8Boundary(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
      return text.size();
    }
    // A code point is at most 4 bytes, so at most 3 continuation bytes.
    size_t back = 0;
    while (pos > 0 and back < 3
           and isContinuation(static_cast<uint8_t>(text[pos]))) {
      --pos;
      ++back;
    }
    return pos;
  }

  std::string base64Encode(std::string_view bytes) {
    using namespace boost::archive::iterators;
    using Encoder = base64_from_binary<
        transform_width<std::string_view::const_iterator, 6, 8>>;
    std::string encoded{Encoder{bytes.begin()}, Encoder{bytes.end()}};
    encoded.append((3 - bytes.size() % 3) % 3, '=');
    return encoded;
  }

  outcome::result<std::string> base64Decode(std::string_view text) {
    using namespace boost::archive::iterators;
    if (text.size() % 4 != 0) {
      return CodecError::CORRUPT_PAYLOAD;
    }
    size_t padding = 0;
    while (padding < 2 and padding < text.size()
           and text[text.size() - 1 - padding] == '=') {
      ++padding;
    }
    auto body = text.substr(0, text.size() - padding);
    if (body.find_first_not_of(kBase64Alphabet) != std::string_view::npos) {
      return CodecError::CORRUPT_PAYLOAD;
    }
    // '=' would decode to zero bits; 'A' does the same and is in the alphabet.
    std::string normalized{body};
    normalized.append(padding, 'A');
    using Decoder =
        transform_width<binary_from_base64<std::string::const_iterator>, 8, 6>;
    std::string decoded{Decoder{normalized.cbegin()},
                        Decoder{normalized.cend()}};
    decoded.resize(decoded.size() - padding);
    return decoded;
  }

  outcome::result<std::string> compress(std::string_view text) {
    auto bound = compressBound(static_cast<uLong>(text.size()));
    std::string deflated(bound, '\0');
    auto deflated_size = bound;
    auto rc = compress2(reinterpret_cast<Bytef *>(deflated.data()),
                        &deflated_size,
                        reinterpret_cast<const Bytef *>(text.data()),
                        static_cast<uLong>(text.size()),
                        Z_BEST_COMPRESSION);
    if (rc != Z_OK) {
      return CodecError::COMPRESS_FAILED;
    }
    deflated.resize(deflated_size);
    return base64Encode(deflated);
  }

  outcome::result<std::string> decompress(std::string_view blob,
                                          size_t max_bytes) {
    auto deflated_result = base64Decode(blob);
    if (not deflated_result.has_value()) {
      return deflated_result.error();
    }
    auto &deflated = deflated_result.value();

    z_stream stream{};
    if (inflateInit(&stream) != Z_OK) {
      return CodecError::CORRUPT_PAYLOAD;
    }
    stream.next_in =
        reinterpret_cast<Bytef *>(const_cast<char *>(deflated.data()));
    stream.avail_in = static_cast<uInt>(deflated.size());

    std::string inflated;
    int rc = Z_OK;
    while (rc == Z_OK) {
      auto offset = inflated.size();
      inflated.resize(offset + kInflateStep);
      stream.next_out = reinterpret_cast<Bytef *>(inflated.data() + offset);
      stream.avail_out = static_cast<uInt>(kInflateStep);
      rc = inflate(&stream, Z_NO_FLUSH);
      inflated.resize(offset + kInflateStep - stream.avail_out);
      if (inflated.size() > max_bytes) {
        inflateEnd(&stream);
        return CodecError::TOO_LARGE;
      }
      // No input left and no progress: the stream is truncated.
      if (rc == Z_OK and stream.avail_in == 0 and stream.avail_out != 0) {
        rc = Z_BUF_ERROR;
      }
    }
    auto trailing = stream.avail_in;
    inflateEnd(&stream);
    if (rc != Z_STREAM_END or trailing != 0) {
      return CodecError::CORRUPT_PAYLOAD;
    }
    return inflated;
  }

  std::string checksum(std::string_view text) {
    uint32_t hash = 0;
    for (auto c : text) {
      hash = hash * 31 + static_cast<uint8_t>(c);
    }
    if (hash == 0) {
      return "0";
    }
    std::string digits;
    while (hash != 0) {
      digits.insert(digits.begin(), kBase36Digits[hash % 36]);
      hash /= 36;
    }
    return digits;
  }
}  // namespace meshgossip::codec
