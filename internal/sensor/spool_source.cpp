#include "spool_source.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sensorlink::sensor {

namespace fs = std::filesystem;

using sensorlink::observability::StringField;
using sensorlink::observability::UintField;

SpoolSource::SpoolSource(SpoolOptions options) : options_(std::move(options)) {
  if (options_.dir.empty()) {
    throw util::InvalidArgument("spool: directory is empty");
  }
}

std::vector<fs::path> SpoolSource::List() const {
  std::error_code ec;
  if (!fs::exists(options_.dir, ec)) {
    throw util::NotFound("spool: directory not found: " + options_.dir);
  }
  if (!fs::is_directory(options_.dir, ec)) {
    throw util::InvalidArgument("spool: path is not a directory: " + options_.dir);
  }

  std::vector<fs::path> files;
  for (const auto& entry : fs::directory_iterator(options_.dir, ec)) {
    if (!entry.is_regular_file(ec)) continue;

    const auto name = entry.path().filename().string();
    if (name.empty() || name.front() == '.') continue;
    if (!options_.extension.empty() && entry.path().extension() != options_.extension) continue;

    files.push_back(entry.path());
  }
  if (ec) {
    throw std::runtime_error("spool: failed listing directory " + options_.dir + ": " + ec.message());
  }

  std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) { return a.filename() < b.filename(); });
  return files;
}

std::string SpoolSource::ReadFile(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw std::runtime_error("spool: failed to open " + path.string());
  }

  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw std::runtime_error("spool: short read on " + path.string());
  }
  return contents;
}

std::size_t SpoolSource::Drain(const std::function<void(const fs::path& path, std::string contents)>& submit) {
  std::size_t consumed = 0;

  for (const auto& path : List()) {
    try {
      submit(path, ReadFile(path));
    } catch (const std::exception& e) {
      SENSORLINK_LOG_ERROR("Spool file not enqueued, keeping it for the next scan", {StringField("path", path.string()), StringField("error", e.what())});
      continue;
    }

    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
      // already enqueued: a leftover file would be submitted twice, so stop here
      throw std::runtime_error("spool: failed to remove " + path.string() + ": " + ec.message());
    }
    ++consumed;
  }

  if (consumed > 0) {
    SENSORLINK_LOG_DEBUG("Spool drained", {StringField("dir", options_.dir), UintField("files", consumed)});
  }
  return consumed;
}

} // namespace sensorlink::sensor
