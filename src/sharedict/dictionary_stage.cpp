#include "sharedict/dictionary_stage.hpp"
#include "utilities/atomic_file.hpp"
#include "utilities/logger.h"

#include <cppcodec/base64_url_unpadded.hpp>
#include <filesystem>
#include <sodium.h>
#include <system_error>

using base64 = cppcodec::base64_url_unpadded;

namespace sharedict {

namespace {
const char *COMPONENT = "dictionary_stage";
constexpr size_t ID_BYTES = 6;
} // namespace

DictionaryStage::DictionaryStage(StageOptions options)
    : options_(std::move(options)) {
  if (options_.stagingPath.empty())
    throw std::invalid_argument("DictionaryStage: staging path is empty");
  if (sodium_init() < 0)
    throw StageError("Failed to initialize libsodium");

  std::error_code ec;
  std::filesystem::path parent =
      std::filesystem::path(options_.stagingPath).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec)
      throw StageError("Cannot create " + parent.string() + ": " +
                       ec.message());
  }

  try {
    if (std::filesystem::exists(options_.stagingPath)) {
      std::vector<std::byte> bytes = readFileBytes(options_.stagingPath);
      const uint64_t serial = bytes.empty() ? 0 : 1;
      current_ = makeRevision(serial, std::move(bytes));
      Logger::getInstance().log(
          LogLevel::INFO, COMPONENT,
          "Loaded staged dictionary " + options_.stagingPath + " (" +
              std::to_string(current_->content.size()) + " bytes)");
    } else {
      writeFileAtomically(options_.stagingPath, {}, options_.syncWrites);
      current_ = makeRevision(0, {});
    }
  } catch (const std::system_error &e) {
    throw StageError(std::string("Cannot initialise dictionary staging: ") +
                     e.what());
  }
}

std::shared_ptr<const DictionaryRevision> DictionaryStage::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

std::string DictionaryStage::header() const {
  return "Domain: " + options_.domain + "\nPath: " + options_.path + "\n\n";
}

std::vector<std::byte> DictionaryStage::resource() const {
  auto rev = current();
  const std::string h = header();
  std::vector<std::byte> out;
  out.reserve(h.size() + rev->content.size());
  for (char c : h)
    out.push_back(static_cast<std::byte>(c));
  out.insert(out.end(), rev->content.begin(), rev->content.end());
  return out;
}

void DictionaryStage::computeIds(const std::string &header,
                                 const std::vector<std::byte> &content,
                                 std::string &userAgentId,
                                 std::string &serverId) {
  unsigned char digest[crypto_hash_sha256_BYTES];
  crypto_hash_sha256_state st;
  crypto_hash_sha256_init(&st);
  crypto_hash_sha256_update(
      &st, reinterpret_cast<const unsigned char *>(header.data()),
      header.size());
  crypto_hash_sha256_update(
      &st, reinterpret_cast<const unsigned char *>(content.data()),
      content.size());
  crypto_hash_sha256_final(&st, digest);
  userAgentId = base64::encode(digest, ID_BYTES);
  serverId = base64::encode(digest + ID_BYTES, ID_BYTES);
}

std::shared_ptr<const DictionaryRevision>
DictionaryStage::makeRevision(uint64_t serial,
                              std::vector<std::byte> content) const {
  auto rev = std::make_shared<DictionaryRevision>();
  rev->serial = serial;
  rev->content = std::move(content);
  computeIds(header(), rev->content, rev->userAgentId, rev->serverId);
  return rev;
}

std::shared_ptr<const DictionaryRevision>
DictionaryStage::publish(std::vector<std::byte> content) {
  std::lock_guard<std::mutex> publishLock(publishMutex_);
  const uint64_t serial = current()->serial + 1;
  auto rev = makeRevision(serial, std::move(content));

  try {
    writeFileAtomically(options_.stagingPath, rev->content,
                        options_.syncWrites);
  } catch (const std::system_error &e) {
    throw StageError(std::string("Publishing dictionary revision ") +
                     std::to_string(serial) + " failed: " + e.what());
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = rev;
  }

  if (options_.archiveRevisions)
    archive(*rev);

  Logger::getInstance().log(LogLevel::INFO, COMPONENT,
                            "Published dictionary revision " +
                                std::to_string(rev->serial) + " (" +
                                std::to_string(rev->content.size()) +
                                " bytes, id " + rev->userAgentId + ")");
  return rev;
}

void DictionaryStage::archive(const DictionaryRevision &rev) const {
  try {
    std::filesystem::create_directories(options_.archiveDir);
    writeFileAtomically(
        (std::filesystem::path(options_.archiveDir) / rev.name()).string(),
        rev.content, options_.syncWrites);
  } catch (const std::exception &e) {
    // Not fatal: the staged revision is already live.
    Logger::getInstance().log(LogLevel::WARN, COMPONENT,
                              "Could not archive revision " + rev.name() +
                                  ": " + e.what());
  }
}

} // namespace sharedict
