#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace sensorlink::sensor {

struct SpoolOptions {
  std::string dir;
  // ".json" style filter, empty accepts every regular file
  std::string extension;
};

/*
  Directory intake for measurement producers.

  Each regular file is one event. Producers write under a dot-prefixed
  name and rename when done; dot files are never picked up. A file is
  removed only after its event was durably enqueued.
*/
class SpoolSource {
 public:
  explicit SpoolSource(SpoolOptions options);

  // Ready files sorted by name.
  std::vector<std::filesystem::path> List() const;

  static std::string ReadFile(const std::filesystem::path& path);

  // Hands every ready file to submit and deletes it afterwards. Returns the number consumed.
  std::size_t Drain(const std::function<void(const std::filesystem::path& path, std::string contents)>& submit);

  const SpoolOptions& Options() const {
    return options_;
  }

 private:
  SpoolOptions options_;
};

} // namespace sensorlink::sensor
