#pragma once

#include <string>

namespace sharedict {

void setVarDir(const std::string &dir);
const std::string &getVarDir();

std::string logsDir();
std::string chunkJournalPath();
std::string dictionaryStagingPath();
std::string dictionaryArchiveDir();

} // namespace sharedict
