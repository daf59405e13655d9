#include <tessera/vision/response_cleaner.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <sstream>
#include <vector>

namespace tessera::vision {

namespace {

constexpr std::array<std::string_view, 9> kImageExtensions = {
    ".jpg", ".jpeg", ".png", ".gif", ".bmp", ".tiff", ".tif", ".webp", ".heic"};

std::string to_lower_copy(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return out;
}

bool ends_with(std::string_view s, std::string_view suffix) {
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

std::string_view strip_leading_markup(std::string_view text) {
  bool changed = true;
  while (changed && !text.empty()) {
    changed = false;
    const auto first = static_cast<unsigned char>(text.front());
    if (std::isspace(first) || text.front() == ':' || text.front() == '>') {
      text.remove_prefix(1);
      changed = true;
    } else if (text.front() == '<') {
      const auto close = text.find('>');
      const auto ws = text.find_first_of(" \t\r\n");
      if (close != std::string_view::npos && (ws == std::string_view::npos || ws > close)) {
        text.remove_prefix(close + 1);
        changed = true;
      }
    }
  }
  return text;
}

bool is_role_line(const std::string& lower) {
  for (std::string_view role : {"user", "system"}) {
    if (lower == role) return true;
    if (lower.size() > role.size() && lower.compare(0, role.size(), role) == 0 &&
        lower[role.size()] == ':') {
      return true;
    }
  }
  return false;
}

bool looks_like_path(const std::string& line) {
  if (line.find(' ') != std::string::npos) return false;
  if (line.front() == '/') return true;
  if (line.size() >= 3 && std::isalpha(static_cast<unsigned char>(line[0])) &&
      line[1] == ':' && (line[2] == '\\' || line[2] == '/')) {
    return true;
  }
  const std::string lower = to_lower_copy(line);
  return std::any_of(kImageExtensions.begin(), kImageExtensions.end(),
                     [&](std::string_view ext) { return ends_with(lower, ext); });
}

}  // namespace

std::string trim_copy(std::string_view value) {
  const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  auto begin = std::find_if(value.begin(), value.end(), not_space);
  auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
  if (begin >= end) return std::string();
  return std::string(begin, end);
}

std::string clean_response(std::string_view raw, const ResponseCleanerOptions& options) {
  std::string_view text = raw;
  if (!options.role_marker.empty()) {
    const auto pos = text.rfind(options.role_marker);
    if (pos != std::string_view::npos) {
      text.remove_prefix(pos + options.role_marker.size());
    }
  }
  text = strip_leading_markup(text);

  const std::string prompt_lower = to_lower_copy(trim_copy(options.prompt));
  std::vector<std::string> kept;
  std::istringstream lines{std::string(text)};
  std::string line;
  while (std::getline(lines, line)) {
    const std::string trimmed = trim_copy(line);
    if (!trimmed.empty()) {
      const std::string lower = to_lower_copy(trimmed);
      if (!prompt_lower.empty() && lower == prompt_lower) continue;
      if (is_role_line(lower)) continue;
      if (!options.image_placeholder.empty() && trimmed == options.image_placeholder) continue;
      if (looks_like_path(trimmed)) continue;
    }
    kept.push_back(line);
  }

  std::string joined;
  for (std::size_t i = 0; i < kept.size(); ++i) {
    if (i > 0) joined.push_back('\n');
    joined += kept[i];
  }
  std::string cleaned = trim_copy(joined);
  if (cleaned.empty()) {
    return trim_copy(raw);
  }
  return cleaned;
}

}  // namespace tessera::vision
