#pragma once

#include "core/stock_name_service.h"

#include <string>

namespace dsa::infra {

class PathService;

/// INameCache persisted as a tab-separated text file in the cache
/// directory:
///   # dsa stock names v1
///   updated<TAB><unix seconds>
///   <a|hk|us><TAB><code><TAB><name>
class FileNameCache : public dsa::core::INameCache {
public:
  explicit FileNameCache(const PathService &path_service);

  dsa::core::Result<dsa::core::NameSnapshot, dsa::core::Error> load() override;
  dsa::core::Result<void, dsa::core::Error>
  save(const dsa::core::NameSnapshot &snapshot) override;
  [[nodiscard]] std::string location() const override;

  void clear();

private:
  const PathService &path_service_;
};

} // namespace dsa::infra
