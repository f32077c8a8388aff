#include "infra/name_cache.h"

#include "infra/path_service.h"

#include <array>
#include <chrono>
#include <exception>
#include <filesystem>
#include <fstream>
#include <string>
#include <utility>

namespace dsa::infra {

namespace {

constexpr const char *kHeader = "# dsa stock names v1";

constexpr std::array<std::pair<const char *, dsa::core::Market>, 3> kTags = {{
    {"a", dsa::core::Market::AShare},
    {"hk", dsa::core::Market::HongKong},
    {"us", dsa::core::Market::US},
}};

dsa::core::Error malformed(const std::string &path, int line_no) {
  return dsa::core::Error::Internal("Malformed name cache " + path +
                                    " at line " + std::to_string(line_no));
}

} // namespace

FileNameCache::FileNameCache(const PathService &path_service)
    : path_service_(path_service) {}

dsa::core::Result<dsa::core::NameSnapshot, dsa::core::Error>
FileNameCache::load() {
  using R = dsa::core::Result<dsa::core::NameSnapshot, dsa::core::Error>;
  const std::filesystem::path file_path(location());
  dsa::core::NameSnapshot snapshot;
  if (!std::filesystem::exists(file_path)) {
    return R::Ok(std::move(snapshot));
  }

  std::ifstream ifs(file_path);
  if (!ifs) {
    return R::Err(
        dsa::core::Error::Internal("Cannot open name cache " + location()));
  }

  std::string line;
  int line_no = 0;
  while (std::getline(ifs, line)) {
    ++line_no;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    const size_t first_tab = line.find('\t');
    if (first_tab == std::string::npos) {
      return R::Err(malformed(location(), line_no));
    }
    const std::string tag = line.substr(0, first_tab);
    const std::string rest = line.substr(first_tab + 1);

    if (tag == "updated") {
      try {
        snapshot.last_update = std::chrono::system_clock::time_point(
            std::chrono::seconds(std::stoll(rest)));
      } catch (const std::exception &) {
        return R::Err(malformed(location(), line_no));
      }
      continue;
    }

    const size_t second_tab = rest.find('\t');
    if (second_tab == std::string::npos) {
      return R::Err(malformed(location(), line_no));
    }
    bool known = false;
    for (const auto &[name, market] : kTags) {
      if (tag == name) {
        snapshot.names(market)[rest.substr(0, second_tab)] =
            rest.substr(second_tab + 1);
        known = true;
        break;
      }
    }
    if (!known) {
      return R::Err(malformed(location(), line_no));
    }
  }
  return R::Ok(std::move(snapshot));
}

dsa::core::Result<void, dsa::core::Error>
FileNameCache::save(const dsa::core::NameSnapshot &snapshot) {
  const std::filesystem::path file_path(location());
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  if (ec) {
    return dsa::core::Result<void, dsa::core::Error>::Err(
        dsa::core::Error::Internal("Cannot create " +
                                   file_path.parent_path().string() + ": " +
                                   ec.message()));
  }

  std::ofstream ofs(file_path, std::ios::trunc);
  ofs << kHeader << '\n';
  if (snapshot.last_update) {
    ofs << "updated\t"
        << std::chrono::duration_cast<std::chrono::seconds>(
               snapshot.last_update->time_since_epoch())
               .count()
        << '\n';
  }
  for (const auto &[tag, market] : kTags) {
    for (const auto &[code, name] : snapshot.names(market)) {
      ofs << tag << '\t' << code << '\t' << name << '\n';
    }
  }
  ofs.flush();
  if (!ofs) {
    return dsa::core::Result<void, dsa::core::Error>::Err(
        dsa::core::Error::Internal("Failed writing name cache " + location()));
  }
  return dsa::core::Result<void, dsa::core::Error>::Ok();
}

std::string FileNameCache::location() const {
  const std::filesystem::path file_path =
      std::filesystem::path(path_service_.cache_dir()) / "stock_names.tsv";
  return file_path.string();
}

void FileNameCache::clear() {
  std::error_code ec;
  std::filesystem::remove(std::filesystem::path(location()), ec);
}

} // namespace dsa::infra
