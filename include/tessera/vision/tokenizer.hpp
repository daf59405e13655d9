#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace tessera::vision {

/// Vocabulary tokenizer for the text decoder.
///
/// Vocabulary: one token per line, id = zero-based line number. Spaces inside
/// tokens are written with a marker (SentencePiece "▁" by default).
/// Tokens of the form <...> are special, except byte tokens <0xHH>.
/// Encoding is greedy longest-match; unknown characters map to <unk> when the
/// vocabulary has it and are dropped otherwise.
class Tokenizer {
 public:
  static constexpr std::string_view kDefaultSpaceMarker = "\xE2\x96\x81";

  explicit Tokenizer(std::vector<std::string> vocab,
                     std::string space_marker = std::string(kDefaultSpaceMarker));

  /// Load a vocabulary file. Throws std::runtime_error if it cannot be read or is empty.
  [[nodiscard]] static Tokenizer from_file(
      const std::string& path,
      std::string space_marker = std::string(kDefaultSpaceMarker));

  [[nodiscard]] std::vector<std::int64_t> encode(std::string_view text) const;

  [[nodiscard]] std::string decode(std::span<const std::int64_t> ids,
                                   bool skip_special = true) const;

  [[nodiscard]] std::optional<std::int64_t> token_id(std::string_view token) const;
  [[nodiscard]] bool is_special(std::int64_t id) const noexcept;
  [[nodiscard]] std::size_t vocab_size() const noexcept { return vocab_.size(); }

 private:
  std::vector<std::string> vocab_;
  std::unordered_map<std::string, std::int64_t> ids_;
  std::string space_marker_;
  std::size_t max_token_bytes_{0};
  std::optional<std::int64_t> unk_id_;
};

}  // namespace tessera::vision
