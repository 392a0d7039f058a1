#include "asset_kind.hpp"

#include <algorithm>
#include <cctype>

namespace upload::model {

namespace {

std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

} // namespace

AssetClass ParseAssetClass(std::string_view value) {
  if (Lower(value) == "deliverable") {
    return AssetClass::kDeliverable;
  }
  return AssetClass::kAsset;
}

std::string_view ToString(AssetClass asset_class) {
  return asset_class == AssetClass::kDeliverable ? "deliverable" : "asset";
}

AssetKind ClassifyContentType(std::string_view content_type) {
  // strip parameters ("text/plain; charset=utf-8")
  auto       mime = Lower(content_type.substr(0, content_type.find(';')));
  const auto end  = mime.find_last_not_of(' ');
  mime            = end == std::string::npos ? std::string{} : mime.substr(0, end + 1);

  if (StartsWith(mime, "image/")) {
    return ImageKind{mime == "image/svg+xml"};
  }
  if (StartsWith(mime, "video/")) {
    return VideoKind{};
  }
  if (StartsWith(mime, "audio/")) {
    return AudioKind{};
  }
  if (mime == "application/pdf") {
    return DocumentKind{true};
  }
  if (StartsWith(mime, "text/") || StartsWith(mime, "application/msword") || StartsWith(mime, "application/vnd.openxmlformats-officedocument") ||
      StartsWith(mime, "application/vnd.ms-")) {
    return DocumentKind{false};
  }
  return OpaqueKind{};
}

std::string_view KindName(const AssetKind& kind) {
  if (std::holds_alternative<ImageKind>(kind)) {
    return "image";
  }
  if (std::holds_alternative<VideoKind>(kind)) {
    return "video";
  }
  if (std::holds_alternative<AudioKind>(kind)) {
    return "audio";
  }
  if (std::holds_alternative<DocumentKind>(kind)) {
    return "document";
  }
  return "opaque";
}

std::vector<std::string> ProcessingSteps(const AssetKind& kind) {
  if (const auto* image = std::get_if<ImageKind>(&kind)) {
    if (image->vector) {
      return {"thumbnail"};
    }
    return {"thumbnail", "metadata_extraction", "color_analysis"};
  }
  if (std::holds_alternative<VideoKind>(kind)) {
    return {"thumbnail", "preview"};
  }
  if (const auto* document = std::get_if<DocumentKind>(&kind)) {
    if (document->paged) {
      return {"thumbnail", "page_count"};
    }
    return {};
  }
  return {};
}

} // namespace upload::model
