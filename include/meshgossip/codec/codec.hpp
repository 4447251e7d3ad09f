/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace meshgossip::codec {

  /**
   * Errors of the payload codec.
   */
  enum class CodecError {
    COMPRESS_FAILED,
    CORRUPT_PAYLOAD,
    TOO_LARGE,
  };

  Q_ENUM_ERROR_CODE(CodecError) {
    using E = decltype(e);
    switch (e) {
      case E::COMPRESS_FAILED:
        return "Deflate failed";
      case E::CORRUPT_PAYLOAD:
        return "Payload is not valid base64 deflate data";
      case E::TOO_LARGE:
        return "Inflated payload exceeds the size limit";
    }
    abort();
  }

  /**
   * Size of `text` on the wire, in UTF-8 bytes.
   * Strings hold UTF-8, so this is the byte length, not the code point count.
   */
  inline size_t byteSize(std::string_view text) {
    return text.size();
  }

  /// True if `text` is well-formed UTF-8 (no overlongs, no surrogates).
  bool isValidUtf8(std::string_view text);

  /**
   * Largest offset `<= pos` that does not fall inside a multi-byte sequence.
   * Slicing at the returned offset never splits a code point.
   */
  size_t utf8Boundary(std::string_view text, size_t pos);

  /**
   * Deflate `text` (zlib format) and encode the result as base64.
   * Deterministic; `decompress(compress(x)) == x` for every `x`, including
   * the empty string.
   */
  outcome::result<std::string> compress(std::string_view text);

  /// Default bound of `decompress` output.
  constexpr size_t kMaxInflatedBytes = 256 * 1024;

  /**
   * Inverse of `compress`.
   * Returns `CORRUPT_PAYLOAD` if `blob` is not canonical base64 or the
   * deflate stream inside is truncated, corrupted or followed by garbage,
   * and `TOO_LARGE` as soon as the output grows past `max_bytes`.
   */
  outcome::result<std::string> decompress(
      std::string_view blob, size_t max_bytes = kMaxInflatedBytes);

  /**
   * Fast non-cryptographic checksum (32-bit polynomial rolling hash,
   * rendered in base36). Used only for reassembly integrity.
   */
  std::string checksum(std::string_view text);

  /// Standard base64 with '=' padding.
  std::string base64Encode(std::string_view bytes);

  /// Strict base64 decoding, `CORRUPT_PAYLOAD` on any non-canonical input.
  outcome::result<std::string> base64Decode(std::string_view text);
}  // namespace meshgossip::codec
