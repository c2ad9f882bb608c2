#include "utilities/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <yaml-cpp/yaml.h>

namespace sharedict {

void Config::validate() const {
  if (chunkBits < 1 || chunkBits > 24)
    throw ConfigError("chunk_bits must be between 1 and 24, got " +
                      std::to_string(chunkBits));
  if (!(rebuildThreshold >= 0.0))
    throw ConfigError("rebuild_threshold must be non-negative");
  if (queueCapacity == 0)
    throw ConfigError("queue_capacity must be at least 1");
  if (codec != "zstd" && codec != "vcdiff")
    throw ConfigError("codec must be \"zstd\" or \"vcdiff\", got \"" + codec +
                      "\"");
  if (sdchPath.empty() || sdchPath.front() != '/')
    throw ConfigError("sdch_path must start with '/'");
}

template <typename T>
static void readKey(const YAML::Node &node, const char *key, T &out) {
  if (!node[key])
    return;
  try {
    out = node[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw ConfigError(std::string("Invalid value for '") + key +
                      "': " + e.what());
  }
}

Config loadConfigFile(const std::string &path) {
  Config cfg;
  if (!std::filesystem::exists(path))
    return cfg;

  YAML::Node node;
  try {
    node = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw ConfigError("Failed to parse " + path + ": " + e.what());
  }
  if (!node.IsMap() && !node.IsNull())
    throw ConfigError(path + ": top level must be a mapping");

  readKey(node, "var_dir", cfg.varDir);
  std::string level;
  readKey(node, "log_level", level);
  if (!level.empty()) {
    try {
      cfg.logLevel = Logger::parseLevel(level);
    } catch (const std::invalid_argument &e) {
      throw ConfigError(e.what());
    }
  }
  readKey(node, "log_file", cfg.logFile);
  readKey(node, "chunk_bits", cfg.chunkBits);
  readKey(node, "rebuild_threshold", cfg.rebuildThreshold);
  readKey(node, "queue_capacity", cfg.queueCapacity);
  readKey(node, "codec", cfg.codec);
  readKey(node, "zstd_level", cfg.zstdLevel);
  readKey(node, "vcdiff_binary", cfg.vcdiffBinary);
  readKey(node, "sync_writes", cfg.syncWrites);
  readKey(node, "compact_after_bytes", cfg.compactAfterBytes);
  readKey(node, "archive_revisions", cfg.archiveRevisions);
  readKey(node, "sdch_domain", cfg.sdchDomain);
  readKey(node, "sdch_path", cfg.sdchPath);

  cfg.validate();
  return cfg;
}

void applyEnvironment(Config &cfg) {
  if (const char *env = std::getenv("SHAREDICT_VAR_DIR"); env && *env)
    cfg.varDir = env;
  if (const char *env = std::getenv("SHAREDICT_LOG_LEVEL"); env && *env) {
    try {
      cfg.logLevel = Logger::parseLevel(env);
    } catch (const std::invalid_argument &e) {
      throw ConfigError(std::string("SHAREDICT_LOG_LEVEL: ") + e.what());
    }
  }
  if (const char *env = std::getenv("SHAREDICT_CODEC"); env && *env)
    cfg.codec = env;
  if (const char *env = std::getenv("SHAREDICT_CHUNK_BITS"); env && *env) {
    try {
      cfg.chunkBits = static_cast<unsigned>(std::stoul(env));
    } catch (const std::exception &e) {
      throw ConfigError(std::string("SHAREDICT_CHUNK_BITS: ") + e.what());
    }
  }
  cfg.validate();
}

Config loadRuntimeConfig() {
  const char *path = std::getenv("SHAREDICT_CONFIG");
  if (!path)
    path = "sharedict_config.yaml";
  Config cfg = loadConfigFile(path);
  applyEnvironment(cfg);
  return cfg;
}

} // namespace sharedict
