#pragma once

#include <memory>
#include <string>

namespace dsa::infra {

/// Per-user directories. The scheduler keeps nothing across restarts; the
/// cache directory only holds the stock-name snapshot.
class PathService {
public:
  virtual ~PathService() = default;

  [[nodiscard]] virtual std::string cache_dir() const = 0;

  /// Platform default, or `cache_override` when non-empty
  /// (DSA_CACHE_DIR).
  static std::unique_ptr<PathService> create(std::string cache_override = {});
};

} // namespace dsa::infra
