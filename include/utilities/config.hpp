#ifndef SHAREDICT_CONFIG_HPP
#define SHAREDICT_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include "utilities/logger.h"

namespace sharedict {

/** Raised for unreadable or malformed configuration. */
class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string &what) : std::runtime_error(what) {}
};

/**
 * @brief Runtime options for the dictionary engine and its CLI.
 *
 * Defaults match the historical behaviour of the proxy: 32 byte average
 * chunks, a 10% rebuild threshold and the vcdiff staging file "dictraw".
 */
struct Config {
  std::string varDir;      // empty: keep var_dir.hpp default
  LogLevel logLevel = LogLevel::INFO;
  std::string logFile;     // empty: <var_dir>/logs/sharedict.log

  unsigned chunkBits = 5;
  double rebuildThreshold = 0.10;
  size_t queueCapacity = 1024;

  std::string codec = "zstd"; // "zstd" or "vcdiff"
  int zstdLevel = 3;
  std::string vcdiffBinary = "vcdiff";

  bool syncWrites = true;
  uint64_t compactAfterBytes = 64ull * 1024 * 1024;
  bool archiveRevisions = false;

  std::string sdchDomain = "localhost";
  std::string sdchPath = "/";

  /** Throws ConfigError when a value is out of range. */
  void validate() const;
};

/**
 * @brief Load a YAML configuration file.
 *
 * A missing file yields the defaults. Keys that are absent keep their default
 * values.
 * @throw ConfigError If the file exists but cannot be parsed, or a value has
 *        the wrong type or range.
 */
Config loadConfigFile(const std::string &path);

/** Apply SHAREDICT_* environment overrides on top of @p cfg. */
void applyEnvironment(Config &cfg);

/**
 * @brief Resolve the configuration the way the binaries do.
 *
 * Reads the file named by SHAREDICT_CONFIG (default
 * "sharedict_config.yaml"), then applies environment overrides.
 */
Config loadRuntimeConfig();

} // namespace sharedict

#endif // SHAREDICT_CONFIG_HPP
