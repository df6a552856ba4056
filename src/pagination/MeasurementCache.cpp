#include "MeasurementCache.h"

#include <Logging.h>
#include <Serialization.h>

#include <fstream>

#define TAG "MCACHE"

namespace folio {

namespace {
constexpr uint8_t CACHE_FILE_VERSION = 1;
}  // namespace

MeasurementCache::MeasurementCache(std::string cachePath) : cachePath_(std::move(cachePath)) {}

void MeasurementCache::bind(const std::string& fingerprint) {
  if (fingerprint == fingerprint_) return;
  if (!entries_.empty()) {
    LOG_DBG(TAG, "Settings changed (%s -> %s), dropping %d entries", fingerprint_.c_str(), fingerprint.c_str(),
            static_cast<int>(entries_.size()));
  }
  entries_.clear();
  fingerprint_ = fingerprint;
}

const ChapterMeasurement* MeasurementCache::find(const uint32_t chapterIndex, const uint64_t contentHash) const {
  const auto it = entries_.find(chapterIndex);
  if (it == entries_.end() || it->second.contentHash != contentHash) {
    return nullptr;
  }
  return &it->second.measurement;
}

void MeasurementCache::put(const uint32_t chapterIndex, const uint64_t contentHash,
                           const ChapterMeasurement& measurement) {
  Entry& entry = entries_[chapterIndex];
  entry.contentHash = contentHash;
  entry.measurement = measurement;
}

uint64_t MeasurementCache::hashContent(const std::string& html, const std::string& styles) {
  // FNV-1a over both strings with a separator byte
  uint64_t hash = 14695981039346656037ULL;
  const auto mix = [&hash](const std::string& s) {
    for (const char c : s) {
      hash ^= static_cast<uint8_t>(c);
      hash *= 1099511628211ULL;
    }
  };
  mix(html);
  hash ^= 0xFF;
  hash *= 1099511628211ULL;
  mix(styles);
  return hash;
}

bool MeasurementCache::save() const {
  if (cachePath_.empty()) return false;

  std::ofstream file(cachePath_, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) {
    LOG_ERR(TAG, "Failed to open %s for writing", cachePath_.c_str());
    return false;
  }

  serialization::writePod(file, CACHE_FILE_VERSION);
  serialization::writeString(file, fingerprint_);
  serialization::writePod(file, static_cast<uint32_t>(entries_.size()));
  for (const auto& item : entries_) {
    const Entry& entry = item.second;
    serialization::writePod(file, item.first);
    serialization::writePod(file, entry.contentHash);
    serialization::writePod(file, entry.measurement.pageCount);
    serialization::writePod(file, static_cast<uint32_t>(entry.measurement.blocks.size()));
    for (const auto& block : entry.measurement.blocks) {
      serialization::writePod(file, block.pageInChapter);
      serialization::writePod(file, block.textOffset);
      serialization::writePod(file, block.textLength);
      serialization::writeString(file, block.snippet);
    }
  }

  if (!file.good()) {
    LOG_ERR(TAG, "Write failed: %s", cachePath_.c_str());
    return false;
  }
  LOG_DBG(TAG, "Saved %d entries to %s", static_cast<int>(entries_.size()), cachePath_.c_str());
  return true;
}

bool MeasurementCache::load() {
  if (cachePath_.empty()) return false;

  std::ifstream file(cachePath_, std::ios::binary);
  if (!file.is_open()) {
    return false;
  }

  uint8_t version = 0;
  if (!serialization::readPodChecked(file, version) || version != CACHE_FILE_VERSION) {
    LOG_ERR(TAG, "Version mismatch: got %u, expected %u", version, CACHE_FILE_VERSION);
    return false;
  }

  std::string fingerprint;
  if (!serialization::readString(file, fingerprint, 256)) {
    LOG_ERR(TAG, "Corrupt header in %s", cachePath_.c_str());
    return false;
  }
  if (fingerprint != fingerprint_) {
    LOG_DBG(TAG, "Cache is for %s, need %s", fingerprint.c_str(), fingerprint_.c_str());
    return false;
  }

  uint32_t count = 0;
  if (!serialization::readPodChecked(file, count) || count > MAX_ENTRIES) {
    LOG_ERR(TAG, "Invalid entry count in %s", cachePath_.c_str());
    return false;
  }

  std::map<uint32_t, Entry> loaded;
  for (uint32_t i = 0; i < count; i++) {
    uint32_t chapterIndex = 0;
    uint32_t blockCount = 0;
    Entry entry;
    if (!serialization::readPodChecked(file, chapterIndex) || !serialization::readPodChecked(file, entry.contentHash) ||
        !serialization::readPodChecked(file, entry.measurement.pageCount) ||
        !serialization::readPodChecked(file, blockCount) || blockCount > MAX_BLOCKS) {
      LOG_ERR(TAG, "Truncated entry %u in %s", i, cachePath_.c_str());
      return false;
    }
    if (entry.measurement.pageCount == 0) {
      LOG_ERR(TAG, "Entry %u of %s has no pages", i, cachePath_.c_str());
      return false;
    }

    entry.measurement.blocks.reserve(blockCount);
    for (uint32_t b = 0; b < blockCount; b++) {
      BlockPosition block;
      block.blockIndex = b;
      if (!serialization::readPodChecked(file, block.pageInChapter) ||
          !serialization::readPodChecked(file, block.textOffset) ||
          !serialization::readPodChecked(file, block.textLength) ||
          !serialization::readString(file, block.snippet, 1024)) {
        LOG_ERR(TAG, "Truncated block in entry %u of %s", i, cachePath_.c_str());
        return false;
      }
      entry.measurement.blocks.push_back(std::move(block));
    }
    loaded[chapterIndex] = std::move(entry);
  }

  entries_ = std::move(loaded);
  LOG_DBG(TAG, "Loaded %d entries from %s", static_cast<int>(entries_.size()), cachePath_.c_str());
  return true;
}

}  // namespace folio
