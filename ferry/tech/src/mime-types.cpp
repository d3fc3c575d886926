#include "ferry/mime-types.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string_view>

#include "ferry/ascii.hpp"

namespace ferry {

static_assert(std::ranges::is_sorted(kMimeTypes, {}, &MimeTypeEntry::extension), "kMimeTypes must be sorted by extension");

std::string_view MimeTypeFromExtension(std::string_view filename) {
  static constexpr std::size_t kMaxExtensionSize =
      std::ranges::max_element(kMimeTypes, {}, [](const MimeTypeEntry& entry) { return entry.extension.size(); })
          ->extension.size();

  const auto slashPos = filename.find_last_of('/');
  if (slashPos != std::string_view::npos) {
    filename.remove_prefix(slashPos + 1U);
  }
  const auto dotPos = filename.rfind('.');
  if (dotPos == std::string_view::npos || dotPos == 0 || filename.size() - dotPos - 1U > kMaxExtensionSize) {
    return {};
  }

  char extBuf[kMaxExtensionSize];
  const auto endIt = std::transform(filename.begin() + static_cast<std::ptrdiff_t>(dotPos) + 1, filename.end(), extBuf,
                                    [](char ch) { return tolower(ch); });
  const std::string_view ext(extBuf, endIt);

  const auto it = std::ranges::lower_bound(kMimeTypes, ext, {}, &MimeTypeEntry::extension);
  if (it != std::end(kMimeTypes) && it->extension == ext) {
    return it->mimeType;
  }
  return {};
}

}  // namespace ferry
