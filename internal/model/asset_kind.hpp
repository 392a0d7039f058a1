#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace upload::model {

// Asset class comes from the category the asset is filed under.
enum class AssetClass : std::uint8_t {
  kAsset       = 1,
  kDeliverable = 2,
};

AssetClass       ParseAssetClass(std::string_view value);
std::string_view ToString(AssetClass asset_class);

struct ImageKind {
  bool vector = false;
};

struct VideoKind {};

struct AudioKind {};

struct DocumentKind {
  bool paged = false;
};

struct OpaqueKind {};

// Processing capability, resolved once from the verified content type.
using AssetKind = std::variant<OpaqueKind, ImageKind, VideoKind, AudioKind, DocumentKind>;

AssetKind ClassifyContentType(std::string_view content_type);

std::string_view KindName(const AssetKind& kind);

// Derivative pipelines requested for the asset after creation.
std::vector<std::string> ProcessingSteps(const AssetKind& kind);

} // namespace upload::model
