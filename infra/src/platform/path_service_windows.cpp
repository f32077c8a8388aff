#ifdef _WIN32

#include "infra/path_service.h"

#include <shlobj.h>
#include <windows.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace dsa::infra {

namespace {

std::string local_app_data() {
  PWSTR wpath = nullptr;
  HRESULT hr = SHGetKnownFolderPath(FOLDERID_LocalAppData, 0, nullptr, &wpath);
  if (FAILED(hr) || wpath == nullptr) {
    throw std::runtime_error("SHGetKnownFolderPath failed");
  }
  const std::wstring wide(wpath);
  CoTaskMemFree(wpath);

  const int bytes = WideCharToMultiByte(CP_UTF8, 0, wide.c_str(),
                                        static_cast<int>(wide.size()), nullptr,
                                        0, nullptr, nullptr);
  if (bytes <= 0) {
    throw std::runtime_error("WideCharToMultiByte failed");
  }
  std::string out(static_cast<size_t>(bytes), '\0');
  WideCharToMultiByte(CP_UTF8, 0, wide.c_str(), static_cast<int>(wide.size()),
                      out.data(), bytes, nullptr, nullptr);
  return out;
}

class PathServiceWindows final : public PathService {
public:
  explicit PathServiceWindows(std::string cache_override)
      : cache_override_(std::move(cache_override)) {}

  [[nodiscard]] std::string cache_dir() const override {
    if (!cache_override_.empty()) {
      return cache_override_;
    }
    return local_app_data() + "\\dsa_scheduler\\cache";
  }

private:
  std::string cache_override_;
};

} // namespace

std::unique_ptr<PathService> PathService::create(std::string cache_override) {
  return std::make_unique<PathServiceWindows>(std::move(cache_override));
}

} // namespace dsa::infra

#endif // _WIN32
