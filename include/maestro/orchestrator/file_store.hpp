#pragma once

#include "maestro/core/error.hpp"
#include "maestro/model/image.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace maestro {

struct UploadedFile {
  std::string name;
  std::string content;
};

// Files in the top level of an Image's source directory. Writers take the
// Image's exclusive lock so a build never archives a half-written file.
class FileStore {
public:
  // All names are checked before anything is written; one bad name rejects
  // the whole upload with InvalidArgument. Write failures leave the source
  // directory as it was.
  [[nodiscard]] static auto save(Image& image,
                                 const std::vector<UploadedFile>& files)
      -> Result<void>;

  // Regular files only, sorted by name.
  [[nodiscard]] static auto list(const Image& image)
      -> Result<std::vector<std::string>>;

  [[nodiscard]] static auto read(const Image& image, std::string_view name)
      -> Result<std::string>;

  [[nodiscard]] static auto remove(Image& image, std::string_view name)
      -> Result<void>;
};

}  // namespace maestro
