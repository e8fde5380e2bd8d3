#include "looprunner/storage/failure_log.hpp"

#include "looprunner/util/log.hpp"
#include "looprunner/util/pattern.hpp"
#include "looprunner/util/util.hpp"

#include <format>
#include <fstream>
#include <system_error>

namespace looprunner {

FailureLog::FailureLog(std::filesystem::path dir) : dir_(std::move(dir)) {
}

auto FailureLog::log_path(std::string_view file_path) const
    -> std::filesystem::path {
  std::string name(file_path);
  while (name.starts_with("./")) {
    name.erase(0, 2);
  }
  replace_all(name, "/", "__");
  if (name.empty()) {
    name = "unknown";
  }
  return dir_ / std::format("{}.log", name);
}

auto FailureLog::append(std::string_view file_path, std::string_view message)
    -> Result<void> {
  std::lock_guard lock(mu_);

  std::error_code ec;
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    log::error("Failed to create failure log directory {}: {}", dir_.string(),
               ec.message());
    return fail(Error::FileOpenFailed);
  }

  auto path = log_path(file_path);
  std::ofstream out(path, std::ios::app);
  if (!out.is_open()) {
    log::error("Failed to open failure log {}", path.string());
    return fail(Error::FileOpenFailed);
  }
  out << '\n'
      << std::string(80, '=') << '\n'
      << '[' << format_timestamp() << "] " << file_path << '\n'
      << message << '\n';
  if (!out) {
    return fail(Error::FileOpenFailed);
  }
  return ok();
}

}  // namespace looprunner
