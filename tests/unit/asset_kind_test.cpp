#include "internal/model/asset_kind.hpp"

#include <cassert>
#include <iostream>
#include <variant>

namespace {

using namespace upload::model;

void TestImagesAreClassified() {
  auto kind = ClassifyContentType("image/jpeg");
  assert(std::holds_alternative<ImageKind>(kind));
  assert(!std::get<ImageKind>(kind).vector);
  assert(ProcessingSteps(kind).size() == 3);

  auto svg = ClassifyContentType("image/svg+xml");
  assert(std::get<ImageKind>(svg).vector);
  assert(ProcessingSteps(svg) == std::vector<std::string>{"thumbnail"});
}

void TestParametersAndCaseAreIgnored() {
  assert(KindName(ClassifyContentType("VIDEO/MP4")) == "video");
  assert(KindName(ClassifyContentType("text/plain; charset=utf-8")) == "document");
  assert(KindName(ClassifyContentType("audio/mpeg ;q=1")) == "audio");
}

void TestPdfIsPagedDocument() {
  auto kind = ClassifyContentType("application/pdf");
  assert(std::get<DocumentKind>(kind).paged);
  assert((ProcessingSteps(kind) == std::vector<std::string>{"thumbnail", "page_count"}));
}

void TestUnknownIsOpaque() {
  assert(std::holds_alternative<OpaqueKind>(ClassifyContentType("application/octet-stream")));
  assert(std::holds_alternative<OpaqueKind>(ClassifyContentType("")));
  assert(ProcessingSteps(ClassifyContentType("application/zip")).empty());
}

void TestAssetClassParsing() {
  assert(ParseAssetClass("deliverable") == AssetClass::kDeliverable);
  assert(ParseAssetClass("Deliverable") == AssetClass::kDeliverable);
  assert(ParseAssetClass("") == AssetClass::kAsset);
  assert(ParseAssetClass("anything") == AssetClass::kAsset);
  assert(ToString(AssetClass::kDeliverable) == "deliverable");
}

} // namespace

int main() {
  TestImagesAreClassified();
  TestParametersAndCaseAreIgnored();
  TestPdfIsPagedDocument();
  TestUnknownIsOpaque();
  TestAssetClassParsing();

  std::cout << "asset_kind_test: pass\n";
  return 0;
}
