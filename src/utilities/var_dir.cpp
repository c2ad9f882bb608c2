#include "utilities/var_dir.hpp"

#include <cstdlib>
#include <filesystem>

namespace sharedict {

static std::string varDir = [] {
  const char *env = std::getenv("SHAREDICT_VAR_DIR");
  if (env && env[0] != '\0') {
    return std::string(env);
  }
  if (std::filesystem::exists("/var/lib/sharedict"))
    return std::string("/var/lib/sharedict");
  return std::string("var/sharedict");
}();

void setVarDir(const std::string &dir) { varDir = dir; }

const std::string &getVarDir() { return varDir; }

std::string logsDir() { return getVarDir() + "/logs"; }

std::string chunkJournalPath() { return getVarDir() + "/chunks.journal"; }

// The staging file keeps the name the vcdiff tool has always been pointed at.
std::string dictionaryStagingPath() { return getVarDir() + "/dictraw"; }

std::string dictionaryArchiveDir() { return getVarDir() + "/dicts"; }

} // namespace sharedict
