#include <tessera/vision/tokenizer.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>

namespace tessera::vision {

namespace {

/// <0xHH> byte-fallback token -> byte value.
std::optional<char> byte_token_value(std::string_view token) {
  if (token.size() != 6 || token.substr(0, 3) != "<0x" || token.back() != '>') {
    return std::nullopt;
  }
  const auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
  };
  const int hi = hex(token[3]);
  const int lo = hex(token[4]);
  if (hi < 0 || lo < 0) return std::nullopt;
  return static_cast<char>(hi * 16 + lo);
}

std::size_t utf8_length(unsigned char lead) {
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

void replace_all(std::string& s, std::string_view from, std::string_view to) {
  if (from.empty()) return;
  std::size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

}  // namespace

Tokenizer::Tokenizer(std::vector<std::string> vocab, std::string space_marker)
    : vocab_(std::move(vocab)), space_marker_(std::move(space_marker)) {
  ids_.reserve(vocab_.size());
  for (std::size_t i = 0; i < vocab_.size(); ++i) {
    ids_.emplace(vocab_[i], static_cast<std::int64_t>(i));
    max_token_bytes_ = std::max(max_token_bytes_, vocab_[i].size());
  }
  unk_id_ = token_id("<unk>");
}

Tokenizer Tokenizer::from_file(const std::string& path, std::string space_marker) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("Tokenizer: cannot open vocabulary file: " + path);
  }
  std::vector<std::string> vocab;
  std::string line;
  while (std::getline(f, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    vocab.push_back(line);
  }
  if (vocab.empty()) {
    throw std::runtime_error("Tokenizer: vocabulary file is empty: " + path);
  }
  return Tokenizer(std::move(vocab), std::move(space_marker));
}

std::vector<std::int64_t> Tokenizer::encode(std::string_view text) const {
  std::string work(text);
  replace_all(work, " ", space_marker_);

  std::vector<std::int64_t> out;
  std::size_t pos = 0;
  while (pos < work.size()) {
    const std::size_t longest = std::min(max_token_bytes_, work.size() - pos);
    bool matched = false;
    for (std::size_t len = longest; len > 0; --len) {
      auto it = ids_.find(work.substr(pos, len));
      if (it != ids_.end()) {
        out.push_back(it->second);
        pos += len;
        matched = true;
        break;
      }
    }
    if (!matched) {
      if (unk_id_) out.push_back(*unk_id_);
      pos += utf8_length(static_cast<unsigned char>(work[pos]));
    }
  }
  return out;
}

std::string Tokenizer::decode(std::span<const std::int64_t> ids, bool skip_special) const {
  std::string out;
  for (const auto id : ids) {
    if (id < 0 || static_cast<std::size_t>(id) >= vocab_.size()) continue;
    const std::string& token = vocab_[static_cast<std::size_t>(id)];
    if (auto byte = byte_token_value(token)) {
      out.push_back(*byte);
      continue;
    }
    if (skip_special && is_special(id)) continue;
    out += token;
  }
  replace_all(out, space_marker_, " ");
  return out;
}

std::optional<std::int64_t> Tokenizer::token_id(std::string_view token) const {
  auto it = ids_.find(std::string(token));
  if (it == ids_.end()) return std::nullopt;
  return it->second;
}

bool Tokenizer::is_special(std::int64_t id) const noexcept {
  if (id < 0 || static_cast<std::size_t>(id) >= vocab_.size()) return false;
  const std::string& token = vocab_[static_cast<std::size_t>(id)];
  return token.size() > 2 && token.front() == '<' && token.back() == '>' &&
         !byte_token_value(token).has_value();
}

}  // namespace tessera::vision
