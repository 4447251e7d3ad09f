/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <meshgossip/gossip/survival_post.hpp>

#include <atomic>
#include <chrono>
#include <limits>
#include <random>

#include <meshgossip/codec/codec.hpp>
#include <nlohmann/json.hpp>

namespace meshgossip::gossip {
  namespace {
    std::optional<PostKind> kindFromCode(std::string_view code) {
      if (code == "h") {
        return PostKind::Have;
      }
      if (code == "w") {
        return PostKind::Want;
      }
      if (code == "s") {
        return PostKind::Sos;
      }
      return std::nullopt;
    }

    std::string_view categoryCode(SosCategory category) {
      switch (category) {
        case SosCategory::Medical:
          return "m";
        case SosCategory::Safety:
          return "s";
        case SosCategory::Fire:
          return "f";
        case SosCategory::Other:
          return "o";
      }
      abort();
    }

    std::optional<SosCategory> categoryFromCode(std::string_view code) {
      if (code == "m") {
        return SosCategory::Medical;
      }
      if (code == "s") {
        return SosCategory::Safety;
      }
      if (code == "f") {
        return SosCategory::Fire;
      }
      if (code == "o") {
        return SosCategory::Other;
      }
      return std::nullopt;
    }

    constexpr std::string_view kBase36Digits =
        "0123456789abcdefghijklmnopqrstuvwxyz";

    // Exactly `width` base36 digits of `value`, most significant dropped.
    std::string base36(uint64_t value, size_t width) {
      std::string digits(width, '0');
      for (size_t i = width; i > 0; --i) {
        digits[i - 1] = kBase36Digits[value % 36];
        value /= 36;
      }
      return digits;
    }

    std::string_view trim(std::string_view text) {
      constexpr std::string_view kSpace = " \t\n\r\f\v";
      auto begin = text.find_first_not_of(kSpace);
      if (begin == std::string_view::npos) {
        return {};
      }
      auto end = text.find_last_not_of(kSpace);
      return text.substr(begin, end - begin + 1);
    }
  }  // namespace

  std::string_view kindCode(PostKind kind) {
    switch (kind) {
      case PostKind::Have:
        return "h";
      case PostKind::Want:
        return "w";
      case PostKind::Sos:
        return "s";
    }
    abort();
  }

  outcome::result<void> validatePost(const SurvivalPost &post,
                                     const PostLimits &limits) {
    if (post.kind != PostKind::Have and post.kind != PostKind::Want
        and post.kind != PostKind::Sos) {
      return PostError::UNKNOWN_KIND;
    }
    if (post.item.empty()) {
      return PostError::EMPTY_DESCRIPTION;
    }
    if (post.item.size() > limits.max_description_bytes) {
      return PostError::DESCRIPTION_TOO_LONG;
    }
    if (post.id.size() < limits.min_id_length
        or post.id.size() > limits.max_id_length) {
      return PostError::BAD_ID_LENGTH;
    }
    if (post.house == 0) {
      return PostError::BAD_HOUSE_NUMBER;
    }
    if (post.timestamp <= 0) {
      return PostError::BAD_TIMESTAMP;
    }
    if (not codec::isValidUtf8(post.item) or not codec::isValidUtf8(post.id)) {
      return PostError::NOT_UTF8;
    }
    if (post.responders.has_value()) {
      for (auto &responder : *post.responders) {
        if (not codec::isValidUtf8(responder)) {
          return PostError::NOT_UTF8;
        }
      }
    }
    if (postSize(post) > limits.max_post_bytes) {
      return PostError::TOO_LARGE;
    }
    return outcome::success();
  }

  size_t postSize(const SurvivalPost &post) {
    return nlohmann::json(post).dump().size();
  }

  std::string generatePostId() {
    static std::atomic<uint32_t> counter{0};
    thread_local std::mt19937 rng{std::random_device{}()};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    std::uniform_int_distribution<uint32_t> random{0, 36 * 36 - 1};
    return base36(static_cast<uint64_t>(ms), 4) + base36(random(rng), 2)
         + base36(counter++, 2);
  }

  outcome::result<SurvivalPost> makePost(PostKind kind,
                                         std::string_view item,
                                         uint32_t house,
                                         const PostLimits &limits,
                                         std::optional<SosCategory> category) {
    SurvivalPost post{
        .kind = kind,
        .item = std::string{trim(item)},
        .house = house,
        .timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count(),
        .id = generatePostId(),
    };
    if (kind == PostKind::Sos) {
      post.category = category;
    }
    BOOST_OUTCOME_TRY(validatePost(post, limits));
    return post;
  }

  void to_json(nlohmann::json &j, const SurvivalPost &post) {
    j = nlohmann::json{
        {"t", kindCode(post.kind)},
        {"i", post.item},
        {"h", post.house},
        {"ts", post.timestamp},
        {"id", post.id},
    };
    if (post.responders.has_value()) {
      j["r"] = *post.responders;
    }
    if (post.category.has_value()) {
      j["c"] = categoryCode(*post.category);
    }
    if (post.resolved.has_value()) {
      j["resolved"] = *post.resolved;
    }
  }

  outcome::result<SurvivalPost> postFromJson(const nlohmann::json &j,
                                             const PostLimits &limits) {
    if (not j.is_object()) {
      return PostError::MALFORMED;
    }
    auto t = j.find("t");
    auto i = j.find("i");
    auto h = j.find("h");
    auto ts = j.find("ts");
    auto id = j.find("id");
    if (t == j.end() or not t->is_string() or i == j.end()
        or not i->is_string() or h == j.end() or not h->is_number_integer()
        or ts == j.end() or not ts->is_number_integer() or id == j.end()
        or not id->is_string()) {
      return PostError::MALFORMED;
    }

    auto kind = kindFromCode(t->get_ref<const std::string &>());
    if (not kind.has_value()) {
      return PostError::UNKNOWN_KIND;
    }
    auto house = h->get<int64_t>();
    if (house <= 0 or house > std::numeric_limits<uint32_t>::max()) {
      return PostError::BAD_HOUSE_NUMBER;
    }

    SurvivalPost post{
        .kind = *kind,
        .item = i->get<std::string>(),
        .house = static_cast<uint32_t>(house),
        .timestamp = ts->get<int64_t>(),
        .id = id->get<std::string>(),
    };

    if (auto r = j.find("r"); r != j.end()) {
      if (not r->is_array()) {
        return PostError::MALFORMED;
      }
      std::vector<std::string> responders;
      for (auto &responder : *r) {
        if (not responder.is_string()) {
          return PostError::MALFORMED;
        }
        responders.emplace_back(responder.get<std::string>());
      }
      post.responders = std::move(responders);
    }
    if (auto c = j.find("c"); c != j.end()) {
      if (not c->is_string()) {
        return PostError::MALFORMED;
      }
      auto category = categoryFromCode(c->get_ref<const std::string &>());
      if (not category.has_value()) {
        return PostError::UNKNOWN_CATEGORY;
      }
      post.category = category;
    }
    if (auto resolved = j.find("resolved"); resolved != j.end()) {
      if (not resolved->is_boolean()) {
        return PostError::MALFORMED;
      }
      post.resolved = resolved->get<bool>();
    }

    auto valid = validatePost(post, limits);
    if (not valid.has_value()) {
      return valid.error();
    }
    return post;
  }
}  // namespace meshgossip::gossip
