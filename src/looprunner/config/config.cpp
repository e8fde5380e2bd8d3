#include "looprunner/config/config.hpp"

#include "looprunner/config/yaml_utils.hpp"
#include "looprunner/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

namespace YAML {

template <>
struct convert<looprunner::LoggingConfig> {
  static bool decode(const Node& node, looprunner::LoggingConfig& l) {
    if (!node.IsMap()) {
      return false;
    }
    l.level = looprunner::yaml_get_or<std::string>(node, "level", "info");
    l.file = looprunner::yaml_get_or<std::string>(node, "file", "");
    return true;
  }
};

template <>
struct convert<looprunner::StorageConfig> {
  static bool decode(const Node& node, looprunner::StorageConfig& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.tasks_dir = looprunner::yaml_get_or<std::string>(node, "tasks_dir",
                                                       "./looprunner-tasks");
    return true;
  }
};

template <>
struct convert<looprunner::AgentConfig> {
  static bool decode(const Node& node, looprunner::AgentConfig& a) {
    if (!node.IsMap()) {
      return false;
    }
    looprunner::AgentConfig defaults;
    a.command = looprunner::yaml_get_or(node, "command", defaults.command);
    a.timeout_sec = looprunner::yaml_get_or(node, "timeout_sec", 3600);
    a.verify_timeout_sec =
        looprunner::yaml_get_or(node, "verify_timeout_sec", 1800);
    return true;
  }
};

template <>
struct convert<looprunner::GitConfig> {
  static bool decode(const Node& node, looprunner::GitConfig& g) {
    if (!node.IsMap()) {
      return false;
    }
    g.enabled = looprunner::yaml_get_or(node, "enabled", false);
    g.auto_branch = looprunner::yaml_get_or(node, "auto_branch", false);
    g.auto_commit = looprunner::yaml_get_or(node, "auto_commit", false);
    g.commit_message = looprunner::yaml_get_or<std::string>(
        node, "commit_message", "looprunner: {file_name}");
    return true;
  }
};

template <>
struct convert<looprunner::DefaultsConfig> {
  static bool decode(const Node& node, looprunner::DefaultsConfig& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.concurrency = looprunner::yaml_get_or(node, "concurrency", 5);
    d.max_retries = looprunner::yaml_get_or(node, "max_retries", 3);
    d.allowlist =
        looprunner::yaml_get_or<std::string>(node, "allowlist", "{file_stem}*");
    return true;
  }
};

template <>
struct convert<looprunner::SystemConfig> {
  static bool decode(const Node& node, looprunner::SystemConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto logging = node["logging"]) {
      c.logging = logging.as<looprunner::LoggingConfig>();
    }
    if (auto storage = node["storage"]) {
      c.storage = storage.as<looprunner::StorageConfig>();
    }
    if (auto agent = node["agent"]) {
      c.agent = agent.as<looprunner::AgentConfig>();
    }
    if (auto git = node["git"]) {
      c.git = git.as<looprunner::GitConfig>();
    }
    if (auto defaults = node["defaults"]) {
      c.defaults = defaults.as<looprunner::DefaultsConfig>();
    }
    c.working_dir = looprunner::yaml_get_or<std::string>(node, "working_dir", ".");
    return true;
  }
};

}  // namespace YAML

namespace looprunner {

namespace {

auto validate(const SystemConfig& c) -> Result<void> {
  if (c.agent.command.empty()) {
    log::error("agent.command must not be empty");
    return fail(Error::InvalidArgument);
  }
  if (c.agent.timeout_sec <= 0 || c.agent.verify_timeout_sec <= 0) {
    log::error("agent timeouts must be positive");
    return fail(Error::InvalidArgument);
  }
  if (c.defaults.concurrency < 1) {
    log::error("defaults.concurrency must be at least 1, got {}",
               c.defaults.concurrency);
    return fail(Error::InvalidArgument);
  }
  if (c.defaults.max_retries < 0) {
    log::error("defaults.max_retries must not be negative, got {}",
               c.defaults.max_retries);
    return fail(Error::InvalidArgument);
  }
  if (c.storage.tasks_dir.empty()) {
    log::error("storage.tasks_dir must not be empty");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

void to_yaml(YAML::Emitter& out, const LoggingConfig& l) {
  out << YAML::BeginMap;
  yaml_emit(out, "level", l.level);
  yaml_emit_if_not_empty(out, "file", l.file);
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const AgentConfig& a) {
  AgentConfig defaults;
  out << YAML::BeginMap;
  if (a.command != defaults.command) {
    yaml_emit(out, "command", a.command);
  }
  if (a.timeout_sec != defaults.timeout_sec) {
    yaml_emit(out, "timeout_sec", a.timeout_sec);
  }
  if (a.verify_timeout_sec != defaults.verify_timeout_sec) {
    yaml_emit(out, "verify_timeout_sec", a.verify_timeout_sec);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const GitConfig& g) {
  out << YAML::BeginMap;
  yaml_emit(out, "enabled", g.enabled);
  if (g.auto_branch) {
    yaml_emit(out, "auto_branch", g.auto_branch);
  }
  if (g.auto_commit) {
    yaml_emit(out, "auto_commit", g.auto_commit);
  }
  if (g.commit_message != GitConfig{}.commit_message) {
    yaml_emit(out, "commit_message", g.commit_message);
  }
  out << YAML::EndMap;
}

void to_yaml(YAML::Emitter& out, const DefaultsConfig& d) {
  out << YAML::BeginMap;
  yaml_emit(out, "concurrency", d.concurrency);
  yaml_emit(out, "max_retries", d.max_retries);
  yaml_emit(out, "allowlist", d.allowlist);
  out << YAML::EndMap;
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<SystemConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<SystemConfig> {
  SystemConfig config;
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      log::error("Failed to parse YAML: empty or invalid content");
      return fail(Error::ParseError);
    }
    config = root.as<SystemConfig>();
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
  if (auto r = validate(config); !r) {
    return std::unexpected(r.error());
  }
  return ok(std::move(config));
}

auto ConfigLoader::to_string(const SystemConfig& config) -> std::string {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "logging" << YAML::Value;
  to_yaml(out, config.logging);
  if (config.storage.tasks_dir != StorageConfig{}.tasks_dir) {
    out << YAML::Key << "storage" << YAML::Value << YAML::BeginMap;
    yaml_emit(out, "tasks_dir", config.storage.tasks_dir);
    out << YAML::EndMap;
  }
  out << YAML::Key << "agent" << YAML::Value;
  to_yaml(out, config.agent);
  out << YAML::Key << "git" << YAML::Value;
  to_yaml(out, config.git);
  out << YAML::Key << "defaults" << YAML::Value;
  to_yaml(out, config.defaults);
  if (config.working_dir != ".") {
    yaml_emit(out, "working_dir", config.working_dir);
  }
  out << YAML::EndMap;
  return out.c_str();
}

}  // namespace looprunner
