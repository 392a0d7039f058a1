#include "internal/core/title.hpp"

#include <cassert>
#include <iostream>

namespace {

using upload::core::FileNameStem;
using upload::core::NormalizeTitle;
using upload::core::ResolveTitle;

void TestPlaceholdersAreDropped() {
  assert(!NormalizeTitle("Unknown"));
  assert(!NormalizeTitle("Untitled"));
  assert(!NormalizeTitle("  Untitled Asset "));
  assert(!NormalizeTitle("   "));
  assert(!NormalizeTitle(""));
}

void TestPlaceholderMatchIsExact() {
  assert(NormalizeTitle("untitled").value() == "untitled");
  assert(NormalizeTitle("Untitled 2").value() == "Untitled 2");
  assert(NormalizeTitle("  Summer launch\n").value() == "Summer launch");
}

void TestFileNameStem() {
  assert(FileNameStem("photo.jpg") == "photo");
  assert(FileNameStem("dir/report.final.pdf") == "report.final");
  assert(FileNameStem("C:\\scans\\page1.tiff") == "page1");
  assert(FileNameStem("README") == "README");
  assert(FileNameStem(".profile") == ".profile");
}

void TestResolveFallsBackToFileName() {
  assert(ResolveTitle("Hero shot", "IMG_0001.jpg").value() == "Hero shot");
  assert(ResolveTitle("Untitled", "IMG_0001.jpg").value() == "IMG_0001");
  assert(ResolveTitle("", "Unknown.png") == std::nullopt);
  assert(ResolveTitle("", "") == std::nullopt);
}

} // namespace

int main() {
  TestPlaceholdersAreDropped();
  TestPlaceholderMatchIsExact();
  TestFileNameStem();
  TestResolveFallsBackToFileName();

  std::cout << "title_test: pass\n";
  return 0;
}
