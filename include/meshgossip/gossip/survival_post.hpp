/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

namespace meshgossip::gossip {
  enum class PostKind : uint8_t {
    Have,
    Want,
    Sos,
  };

  enum class SosCategory : uint8_t {
    Medical,
    Safety,
    Fire,
    Other,
  };

  /**
   * Post validation errors.
   */
  enum class PostError {
    MALFORMED,
    UNKNOWN_KIND,
    EMPTY_DESCRIPTION,
    DESCRIPTION_TOO_LONG,
    BAD_ID_LENGTH,
    BAD_HOUSE_NUMBER,
    BAD_TIMESTAMP,
    UNKNOWN_CATEGORY,
    NOT_UTF8,
    TOO_LARGE,
  };

  Q_ENUM_ERROR_CODE(PostError) {
    using E = decltype(e);
    switch (e) {
      case E::MALFORMED:
        return "Post field missing or mistyped";
      case E::UNKNOWN_KIND:
        return "Post kind is not have/want/sos";
      case E::EMPTY_DESCRIPTION:
        return "Post description is empty";
      case E::DESCRIPTION_TOO_LONG:
        return "Post description is too long";
      case E::BAD_ID_LENGTH:
        return "Post identifier length out of range";
      case E::BAD_HOUSE_NUMBER:
        return "Post house number must be positive";
      case E::BAD_TIMESTAMP:
        return "Post timestamp must be positive";
      case E::UNKNOWN_CATEGORY:
        return "Post category is not m/s/f/o";
      case E::NOT_UTF8:
        return "Post text is not valid UTF-8";
      case E::TOO_LARGE:
        return "Serialized post exceeds the size limit";
    }
    abort();
  }

  /**
   * Bounds that keep a serialized post small.
   * Lengths are in bytes of UTF-8.
   */
  struct PostLimits {
    size_t max_description_bytes = 100;
    size_t min_id_length = 7;
    size_t max_id_length = 8;
    /// Whole post, compact JSON.
    size_t max_post_bytes = 512;
  };

  /**
   * Resource offer (have), request (want) or distress signal (sos).
   * Wire form is compact JSON: t, i, h, ts, id, r, c, resolved.
   */
  struct SurvivalPost {
    PostKind kind = PostKind::Have;
    /// Item description.
    std::string item;
    /// Locality tag, the poster's house number.
    uint32_t house = 0;
    /// Creation time, Unix seconds.
    int64_t timestamp = 0;
    std::string id;
    /// House numbers of responders.
    std::optional<std::vector<std::string>> responders;
    std::optional<SosCategory> category;
    std::optional<bool> resolved;

    bool operator==(const SurvivalPost &) const = default;
  };

  std::string_view kindCode(PostKind kind);

  /**
   * Check structural invariants; out-of-range fields are an error, never
   * truncated.
   */
  outcome::result<void> validatePost(const SurvivalPost &post,
                                     const PostLimits &limits);

  void to_json(nlohmann::json &j, const SurvivalPost &post);

  /// Size of the compact JSON form in bytes. `post` must be valid UTF-8.
  size_t postSize(const SurvivalPost &post);

  /**
   * Fresh 8-character base36 identifier: last 4 digits of the millisecond
   * clock, 2 random digits, 2 digits of a process-wide counter.
   */
  std::string generatePostId();

  /**
   * Build a new post stamped with the current time and a generated id.
   * `item` is trimmed of surrounding whitespace; `category` is kept for sos
   * posts only.
   */
  outcome::result<SurvivalPost> makePost(
      PostKind kind,
      std::string_view item,
      uint32_t house,
      const PostLimits &limits,
      std::optional<SosCategory> category = std::nullopt);

  /**
   * Decode one payload entry and validate it.
   * Returns `MALFORMED` for missing/mistyped fields, otherwise the
   * `validatePost` error.
   */
  outcome::result<SurvivalPost> postFromJson(const nlohmann::json &j,
                                             const PostLimits &limits);
}  // namespace meshgossip::gossip
