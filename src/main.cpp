#include "sharedict/engine.hpp"
#include "sharedict/journal_chunk_store.hpp"
#include "sharedict/vcdiff_process_codec.hpp"
#include "sharedict/zstd_delta_codec.hpp"
#include "utilities/atomic_file.hpp"
#include "utilities/config.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/var_dir.hpp"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sharedict;

namespace {

void usage() {
  std::cout << "Usage: sharedict ingest <file>... [--out <dir>] [--metrics]\n"
            << "       sharedict popular [limit]\n"
            << "       sharedict dictionary\n"
            << "       sharedict compact\n";
}

std::unique_ptr<DeltaCodec> makeCodec(const Config &cfg) {
  if (cfg.codec == "vcdiff")
    return std::make_unique<VcdiffProcessCodec>(cfg.vcdiffBinary,
                                                dictionaryStagingPath());
  return std::make_unique<ZstdDeltaCodec>(cfg.zstdLevel);
}

int ingestCommand(const Config &cfg, JournalChunkStore &store,
                  DictionaryStage &stage, const std::vector<std::string> &args) {
  std::vector<std::string> files;
  std::string outDir;
  bool printMetrics = false;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--out" && i + 1 < args.size()) {
      outDir = args[++i];
    } else if (args[i] == "--metrics") {
      printMetrics = true;
    } else {
      files.push_back(args[i]);
    }
  }
  if (files.empty()) {
    usage();
    return 1;
  }
  if (!outDir.empty())
    std::filesystem::create_directories(outDir);

  auto codec = makeCodec(cfg);
  Engine engine(store, stage, *codec,
                EngineOptions{cfg.chunkBits, cfg.rebuildThreshold,
                              cfg.queueCapacity});
  int rc = 0;
  for (const auto &file : files) {
    std::vector<std::byte> content;
    try {
      content = readFileBytes(file);
    } catch (const std::system_error &e) {
      std::cerr << file << ": " << e.what() << std::endl;
      rc = 1;
      continue;
    }
    std::vector<std::byte> diff;
    try {
      diff = engine.ingest(content);
    } catch (const DeltaError &e) {
      std::cerr << file << ": " << e.what() << std::endl;
      rc = 1;
      continue;
    }
    const double pct =
        content.empty() ? 0.0
                        : 100.0 * static_cast<double>(diff.size()) /
                              static_cast<double>(content.size());
    std::printf("%s Ratio: %zu/%zu (%f%%)\n", file.c_str(), diff.size(),
                content.size(), pct);
    Logger::info("%s Ratio: %zu/%zu (%f%%)", file.c_str(), diff.size(),
                 content.size(), pct);
    if (!outDir.empty()) {
      auto target = std::filesystem::path(outDir) /
                    (std::filesystem::path(file).filename().string() + "." +
                     codec->name());
      Logger::debug("Writing diff to %s", target.c_str());
      writeFileAtomically(target.string(), diff, cfg.syncWrites);
    }
  }
  engine.drain();
  std::cout << engine.statsLine() << std::endl;
  auto rev = stage.current();
  std::cout << "dictionary revision " << rev->serial << " ("
            << rev->content.size() << " bytes)" << std::endl;
  if (printMetrics)
    std::cout << MetricsRegistry::instance().toPrometheus();
  return rc;
}

int popularCommand(const JournalChunkStore &store,
                   const std::vector<std::string> &args) {
  size_t limit = 20;
  if (!args.empty())
    limit = std::stoul(args[0]);
  auto popular = store.popularChunks();
  std::cout << "Chunks: " << store.size() << ", popular: " << popular.size()
            << std::endl;
  // Most frequent first for display.
  size_t shown = 0;
  for (auto it = popular.rbegin(); it != popular.rend() && shown < limit;
       ++it, ++shown) {
    std::cout << toHex(it->hash) << '\t' << it->count << '\t'
              << it->content.size() << std::endl;
  }
  return 0;
}

int dictionaryCommand(const DictionaryStage &stage) {
  auto rev = stage.current();
  std::cout << "Serial: " << rev->serial << "\n"
            << "Bytes: " << rev->content.size() << "\n"
            << "Content-Type: " << DictionaryStage::CONTENT_TYPE << "\n"
            << "User-Agent-Id: " << rev->userAgentId << "\n"
            << "Server-Id: " << rev->serverId << "\n"
            << "Staging file: " << stage.stagingPath() << std::endl;
  return 0;
}

} // namespace

int main(int argc, char **argv) {
  if (argc < 2) {
    usage();
    return 1;
  }
  const std::string cmd = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  Config cfg;
  try {
    cfg = loadRuntimeConfig();
  } catch (const ConfigError &e) {
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }
  if (!cfg.varDir.empty())
    setVarDir(cfg.varDir);

  std::string logFile = cfg.logFile;
  if (logFile.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(logsDir(), ec);
    logFile = ec ? Logger::CONSOLE_ONLY_OUTPUT : logsDir() + "/sharedict.log";
  }
  try {
    Logger::init(logFile, cfg.logLevel);
  } catch (const std::exception &e) {
    std::cerr << "FATAL: Logger initialization failed: " << e.what()
              << std::endl;
    return 1;
  }

  std::unique_ptr<JournalChunkStore> store;
  std::unique_ptr<DictionaryStage> stage;
  try {
    store = std::make_unique<JournalChunkStore>(
        chunkJournalPath(),
        JournalOptions{cfg.syncWrites, cfg.compactAfterBytes});
    stage = std::make_unique<DictionaryStage>(StageOptions{
        dictionaryStagingPath(), dictionaryArchiveDir(), cfg.archiveRevisions,
        cfg.sdchDomain, cfg.sdchPath, cfg.syncWrites});
  } catch (const StoreError &e) {
    Logger::getInstance().log(LogLevel::FATAL, "main", e.what());
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  } catch (const StageError &e) {
    Logger::getInstance().log(LogLevel::FATAL, "main", e.what());
    std::cerr << "FATAL: " << e.what() << std::endl;
    return 1;
  }

  try {
    if (cmd == "ingest")
      return ingestCommand(cfg, *store, *stage, args);
    if (cmd == "popular")
      return popularCommand(*store, args);
    if (cmd == "dictionary")
      return dictionaryCommand(*stage);
    if (cmd == "compact") {
      store->compact();
      std::cout << "Compacted " << store->path() << " to "
                << store->journalBytes() << " bytes" << std::endl;
      return 0;
    }
  } catch (const std::exception &e) {
    Logger::getInstance().log(LogLevel::ERROR, "main", e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
  usage();
  return 1;
}
