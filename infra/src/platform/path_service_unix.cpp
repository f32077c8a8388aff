#ifndef _WIN32

#include "infra/path_service.h"

#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

#include <stdexcept>
#include <string>
#include <utility>

namespace dsa::infra {

namespace {

std::string home_dir() {
  const char *home = std::getenv("HOME");
  if (home != nullptr && home[0] != '\0') {
    return std::string(home);
  }
  passwd *pw = getpwuid(getuid());
  if (pw != nullptr && pw->pw_dir != nullptr) {
    return std::string(pw->pw_dir);
  }
  throw std::runtime_error("Unable to resolve HOME directory");
}

class PathServiceUnix final : public PathService {
public:
  explicit PathServiceUnix(std::string cache_override)
      : cache_override_(std::move(cache_override)) {}

  [[nodiscard]] std::string cache_dir() const override {
    if (!cache_override_.empty()) {
      return cache_override_;
    }
#ifdef __APPLE__
    return home_dir() + "/Library/Caches/dsa_scheduler";
#else
    const char *xdg = std::getenv("XDG_CACHE_HOME");
    return xdg != nullptr && xdg[0] == '/'
               ? std::string(xdg) + "/dsa_scheduler"
               : home_dir() + "/.cache/dsa_scheduler";
#endif
  }

private:
  std::string cache_override_;
};

} // namespace

std::unique_ptr<PathService> PathService::create(std::string cache_override) {
  return std::make_unique<PathServiceUnix>(std::move(cache_override));
}

} // namespace dsa::infra

#endif // !_WIN32
