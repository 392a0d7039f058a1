#pragma once

#include <optional>
#include <string>

namespace upload::core {

// Trimmed title, or nullopt for blanks and the "Unknown" / "Untitled" /
// "Untitled Asset" placeholders.
std::optional<std::string> NormalizeTitle(const std::string& title);

// "dir/report.final.pdf" -> "report.final"
std::string FileNameStem(const std::string& file_name);

// Provided title, else the file name stem, else nullopt.
std::optional<std::string> ResolveTitle(const std::string& provided, const std::string& file_name);

} // namespace upload::core
