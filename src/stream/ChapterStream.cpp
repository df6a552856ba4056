#include "ChapterStream.h"

#include <Logging.h>

#include <algorithm>
#include <cstdlib>

#define TAG "STREAM"

namespace folio {

ChapterStream::ChapterStream(ChapterProvider& provider, const StreamConfig& config)
    : provider_(provider), config_(config) {}

ChapterStream::~ChapterStream() { close(); }

void ChapterStream::close() {
  if (cancelled_) {
    *cancelled_ = true;
    cancelled_.reset();
  }
  pendingRanges_.clear();
}

void ChapterStream::open(const std::string& bookId, const StartPosition& start) {
  close();

  bookId_ = bookId;
  meta_ = BookMeta();
  cache_.clear();
  loaded_.clear();
  snapshot_.reset();
  currentChapter_ = 0;
  loading_ = true;
  error_ = Error::Ok;
  lastFetchError_ = Error::Ok;
  cancelled_ = std::make_shared<bool>(false);

  LOG_INF(TAG, "Opening %s", bookId.c_str());
  fetchMeta(cancelled_, start, false);
}

void ChapterStream::fetchMeta(const std::shared_ptr<bool>& cancelled, const StartPosition& start,
                              const bool parseTriggered) {
  provider_.getChapterMeta(bookId_, [this, cancelled, start, parseTriggered](Result<BookMeta> result) {
    if (*cancelled) return;

    if (result.ok()) {
      onMetaLoaded(cancelled, std::move(result.value), start);
      return;
    }

    if (result.err != Error::NotPrepared || parseTriggered) {
      LOG_ERR(TAG, "Failed to load chapter meta: %s", errorToString(result.err));
      fail(result.err);
      return;
    }

    // Not split into chapters yet: ask for a parse, then retry once
    LOG_INF(TAG, "Book not prepared, triggering chapter parse");
    provider_.triggerChapterParse(bookId_, [this, cancelled, start](Result<void> parsed) {
      if (*cancelled) return;
      if (!parsed.ok()) {
        LOG_ERR(TAG, "Chapter parse failed: %s", errorToString(parsed.err));
        fail(parsed.err);
        return;
      }
      fetchMeta(cancelled, start, true);
    });
  });
}

uint32_t ChapterStream::findStartChapter(const StartPosition& start, const std::vector<ChapterMeta>& chapters) const {
  if (chapters.empty()) return 0;

  if (start.chapterIndex >= 0) {
    return std::min(static_cast<uint32_t>(start.chapterIndex), static_cast<uint32_t>(chapters.size() - 1));
  }
  if (start.charOffset == 0) return 0;

  // Last chapter whose offset does not exceed the target
  const auto it = std::upper_bound(chapters.begin(), chapters.end(), start.charOffset,
                                   [](const uint32_t offset, const ChapterMeta& m) { return offset < m.charOffset; });
  if (it == chapters.begin()) return 0;
  return static_cast<uint32_t>(std::distance(chapters.begin(), it) - 1);
}

void ChapterStream::onMetaLoaded(const std::shared_ptr<bool>& cancelled, BookMeta meta, const StartPosition& start) {
  const auto count = static_cast<uint32_t>(meta.chapters.size());
  if (count == 0) {
    meta_ = std::move(meta);
    snapshot_.reset();
    loading_ = false;
    LOG_INF(TAG, "Book has no chapters");
    notify(StreamChange::Opened);
    return;
  }

  const uint32_t startChapter = findStartChapter(start, meta.chapters);
  const uint32_t from = startChapter > config_.window ? startChapter - config_.window : 0;
  const uint32_t to = std::min(count - 1, startChapter + config_.window);
  LOG_DBG(TAG, "%u chapters, start %u, initial window %u-%u", count, startChapter, from, to);

  // Meta is held back until the window arrives so that nothing sees meta without content
  auto pendingMeta = std::make_shared<BookMeta>(std::move(meta));
  provider_.getChapters(bookId_, from, to,
                        [this, cancelled, pendingMeta, startChapter](Result<std::vector<ChapterContent>> result) {
                          if (*cancelled) return;
                          if (!result.ok()) {
                            LOG_ERR(TAG, "Failed to load initial chapters: %s", errorToString(result.err));
                            fail(result.err);
                            return;
                          }

                          meta_ = std::move(*pendingMeta);
                          cache_.clear();
                          loaded_.clear();
                          merge(result.value);
                          currentChapter_ = startChapter;
                          evictDistantChapters(startChapter);
                          snapshot_.reset();
                          loading_ = false;
                          LOG_INF(TAG, "Opened with %d chapters loaded", static_cast<int>(cache_.size()));
                          notify(StreamChange::Opened);
                        });
}

void ChapterStream::fail(const Error err) {
  error_ = err;
  loading_ = false;
  notify(StreamChange::Failed);
}

void ChapterStream::merge(std::vector<ChapterContent>& chapters) {
  const size_t count = meta_.chapters.size();
  for (auto& chapter : chapters) {
    if (chapter.chapterIndex >= count) {
      LOG_DBG(TAG, "Dropping chapter %u outside the book", chapter.chapterIndex);
      continue;
    }
    const uint32_t index = chapter.chapterIndex;
    cache_[index] = std::make_shared<const ChapterContent>(std::move(chapter));
    loaded_.insert(index);
  }
  snapshot_.reset();
}

PaginationSnapshot ChapterStream::chaptersForPagination() const {
  if (snapshot_) return snapshot_;

  auto chapters = std::make_shared<std::vector<PaginationChapter>>();
  chapters->reserve(meta_.chapters.size());
  for (const auto& m : meta_.chapters) {
    PaginationChapter pc;
    pc.chapterIndex = m.chapterIndex;
    pc.href = m.href;
    pc.charLength = m.charLength;
    const auto it = cache_.find(m.chapterIndex);
    if (it != cache_.end()) {
      pc.content = it->second;
    }
    chapters->push_back(std::move(pc));
  }
  snapshot_ = std::move(chapters);
  return snapshot_;
}

std::shared_ptr<const ChapterContent> ChapterStream::chapter(const uint32_t index) const {
  const auto it = cache_.find(index);
  return it != cache_.end() ? it->second : nullptr;
}

std::vector<uint32_t> ChapterStream::loadedIndices() const {
  std::vector<uint32_t> indices;
  indices.reserve(cache_.size());
  for (const auto& entry : cache_) {
    indices.push_back(entry.first);
  }
  return indices;
}

void ChapterStream::updateCurrentChapter(const uint32_t index) {
  const uint32_t previous = currentChapter_;
  currentChapter_ = index;
  const auto count = static_cast<uint32_t>(meta_.chapters.size());
  if (count == 0) return;
  if (index == previous) return;

  // Edges of the loaded set (std::map keeps keys ordered)
  const uint32_t loadedMin = cache_.empty() ? index : cache_.begin()->first;
  const uint32_t loadedMax = cache_.empty() ? index : cache_.rbegin()->first;

  if (static_cast<int64_t>(index) >= static_cast<int64_t>(loadedMax) - config_.prefetchThreshold &&
      loadedMax < count - 1) {
    LOG_DBG(TAG, "Prefetch forward from %u", loadedMax + 1);
    ensureChaptersLoaded(static_cast<int64_t>(loadedMax) + 1, static_cast<int64_t>(loadedMax) + config_.prefetchBatch);
  }
  if (static_cast<int64_t>(index) <= static_cast<int64_t>(loadedMin) + config_.prefetchThreshold && loadedMin > 0) {
    LOG_DBG(TAG, "Prefetch backward from %u", loadedMin - 1);
    ensureChaptersLoaded(static_cast<int64_t>(loadedMin) - config_.prefetchBatch, static_cast<int64_t>(loadedMin) - 1);
  }

  if (evictDistantChapters(currentChapter_)) {
    notify(StreamChange::ChaptersEvicted);
  }
}

bool ChapterStream::evictDistantChapters(const uint32_t currentIndex) {
  if (cache_.size() <= config_.maxCache) return false;

  std::vector<uint32_t> indices = loadedIndices();
  // Nearest first; on equal distance the lower index wins
  std::stable_sort(indices.begin(), indices.end(), [currentIndex](const uint32_t a, const uint32_t b) {
    const int64_t da = std::llabs(static_cast<int64_t>(a) - currentIndex);
    const int64_t db = std::llabs(static_cast<int64_t>(b) - currentIndex);
    return da < db;
  });

  const size_t before = cache_.size();
  for (size_t i = config_.maxCache; i < indices.size(); i++) {
    cache_.erase(indices[i]);
    loaded_.erase(indices[i]);
  }
  snapshot_.reset();
  LOG_DBG(TAG, "Evicted %d chapters around %u", static_cast<int>(before - cache_.size()), currentIndex);
  return true;
}

void ChapterStream::ensureChaptersLoaded(const int64_t from, const int64_t to) {
  const auto count = static_cast<int64_t>(meta_.chapters.size());
  if (count == 0 || !cancelled_) return;

  const int64_t clampedFrom = std::max<int64_t>(0, from);
  const int64_t clampedTo = std::min<int64_t>(count - 1, to);
  if (clampedFrom > clampedTo) return;

  // Only the missing part, read straight from the cache
  int64_t missingFrom = -1;
  int64_t missingTo = -1;
  for (int64_t i = clampedFrom; i <= clampedTo; i++) {
    if (loaded_.count(static_cast<uint32_t>(i)) == 0) {
      if (missingFrom < 0) missingFrom = i;
      missingTo = i;
    }
  }
  if (missingFrom < 0) return;

  const auto actualFrom = static_cast<uint32_t>(missingFrom);
  const auto actualTo = static_cast<uint32_t>(missingTo);
  const std::string key = std::to_string(actualFrom) + "-" + std::to_string(actualTo);
  if (pendingRanges_.count(key) != 0) {
    LOG_DBG(TAG, "Range %s already pending", key.c_str());
    return;
  }

  const bool wasFetching = isFetchingChapters();
  pendingRanges_.insert(key);
  if (!wasFetching) {
    notify(StreamChange::FetchStateChanged);
  }

  const std::shared_ptr<bool> cancelled = cancelled_;
  provider_.getChapters(bookId_, actualFrom, actualTo,
                        [this, cancelled, key](Result<std::vector<ChapterContent>> result) {
                          if (*cancelled) return;

                          pendingRanges_.erase(key);
                          if (result.ok()) {
                            merge(result.value);
                            lastFetchError_ = Error::Ok;
                            evictDistantChapters(currentChapter_);
                            notify(StreamChange::ChaptersMerged);
                          } else {
                            LOG_ERR(TAG, "Failed to load chapters %s: %s", key.c_str(), errorToString(result.err));
                            lastFetchError_ = result.err;
                          }
                          notify(StreamChange::FetchStateChanged);
                        });
}

void ChapterStream::notify(const StreamChange change) {
  if (listener_) {
    listener_(change);
  }
}

}  // namespace folio
