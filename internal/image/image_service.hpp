#pragma once

#include <string>
#include <unordered_map>
#include <vector>

namespace modsync::image {

/*
  Direct "read and decode" capability. Throws on failure.
*/
class ImageSource {
 public:
  virtual ~ImageSource() = default;

  virtual std::string ReadImage(const std::string& path) = 0;
};

/*
  Persistent encoded-copy cache.

  Both operations are best-effort. BulkRead returns only the paths it
  holds; it may throw CapabilityUnavailable when the backing service has
  no cache.
*/
class ImageCacheStore {
 public:
  virtual ~ImageCacheStore() = default;

  virtual std::unordered_map<std::string, std::string> BulkRead(const std::vector<std::string>& paths) = 0;

  virtual void Write(const std::string& path, const std::string& data) = 0;
};

} // namespace modsync::image
