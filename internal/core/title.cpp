#include "title.hpp"

#include <array>
#include <string_view>

namespace upload::core {

namespace {

constexpr std::array<std::string_view, 3> kPlaceholders = {"Unknown", "Untitled", "Untitled Asset"};

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

} // namespace

std::optional<std::string> NormalizeTitle(const std::string& title) {
  auto trimmed = Trim(title);
  if (trimmed.empty()) return std::nullopt;
  for (auto placeholder : kPlaceholders) {
    if (trimmed == placeholder) return std::nullopt;
  }
  return trimmed;
}

std::string FileNameStem(const std::string& file_name) {
  auto base = file_name;
  if (auto slash = base.find_last_of("/\\"); slash != std::string::npos) {
    base = base.substr(slash + 1);
  }
  auto dot = base.find_last_of('.');
  if (dot == std::string::npos || dot == 0) return base;
  return base.substr(0, dot);
}

std::optional<std::string> ResolveTitle(const std::string& provided, const std::string& file_name) {
  if (auto title = NormalizeTitle(provided)) return title;
  return NormalizeTitle(FileNameStem(file_name));
}

} // namespace upload::core
