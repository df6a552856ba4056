#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "../config/ReaderSettings.h"
#include "../core/Result.h"
#include "../core/Types.h"
#include "ChapterProvider.h"

namespace folio {

enum class StreamChange : uint8_t {
  Opened,             // meta and the initial window published together
  ChaptersMerged,
  ChaptersEvicted,
  FetchStateChanged,  // isFetchingChapters() or lastFetchError() changed
  Failed,             // open() gave up, see error()
};

struct StartPosition {
  uint32_t charOffset = 0;
  int32_t chapterIndex = -1;  // takes precedence over charOffset when set

  static StartPosition atCharOffset(const uint32_t offset) {
    StartPosition p;
    p.charOffset = offset;
    return p;
  }
  static StartPosition atChapter(const uint32_t index) {
    StartPosition p;
    p.chapterIndex = static_cast<int32_t>(index);
    return p;
  }
};

/**
 * Bounded window of chapter HTML around the reading position.
 *
 * Chapters are fetched in batches from a ChapterProvider, prefetched when
 * the reader nears a loaded edge, and evicted by distance from the current
 * chapter. All mutation happens on the caller's thread; completions that
 * arrive after close() are dropped.
 */
class ChapterStream {
 public:
  using Listener = std::function<void(StreamChange)>;

  explicit ChapterStream(ChapterProvider& provider, const StreamConfig& config = StreamConfig());
  ~ChapterStream();

  ChapterStream(const ChapterStream&) = delete;
  ChapterStream& operator=(const ChapterStream&) = delete;

  void open(const std::string& bookId, const StartPosition& start = StartPosition());
  void close();

  void setListener(Listener listener) { listener_ = std::move(listener); }

  const std::vector<ChapterMeta>& chaptersMeta() const { return meta_.chapters; }
  const std::string& styles() const { return meta_.styles; }
  uint32_t totalCharacters() const { return meta_.totalCharacters; }
  const std::string& bookId() const { return bookId_; }

  // Same length as chaptersMeta(); the pointer only changes when the loaded set does
  PaginationSnapshot chaptersForPagination() const;

  bool isLoading() const { return loading_; }
  bool isFetchingChapters() const { return !pendingRanges_.empty(); }
  Error error() const { return error_; }
  Error lastFetchError() const { return lastFetchError_; }

  bool isChapterLoaded(uint32_t index) const { return loaded_.count(index) != 0; }
  std::shared_ptr<const ChapterContent> chapter(uint32_t index) const;
  std::vector<uint32_t> loadedIndices() const;
  size_t loadedCount() const { return cache_.size(); }
  uint32_t currentChapter() const { return currentChapter_; }

  /**
   * Report the visible chapter. Prefetches near the loaded edges and evicts
   * distant chapters. Repeating the last reported index does nothing.
   */
  void updateCurrentChapter(uint32_t index);

  /**
   * Fetch whatever is missing in [from, to] (clamped to the book) in one request.
   * Failures are logged and leave the cache unchanged; call again to retry.
   */
  void ensureChaptersLoaded(int64_t from, int64_t to);

 private:
  void fetchMeta(const std::shared_ptr<bool>& cancelled, const StartPosition& start, bool parseTriggered);
  void onMetaLoaded(const std::shared_ptr<bool>& cancelled, BookMeta meta, const StartPosition& start);
  void fail(Error err);
  void merge(std::vector<ChapterContent>& chapters);
  bool evictDistantChapters(uint32_t currentIndex);
  void notify(StreamChange change);

  uint32_t findStartChapter(const StartPosition& start, const std::vector<ChapterMeta>& chapters) const;

  ChapterProvider& provider_;
  StreamConfig config_;
  Listener listener_;

  std::string bookId_;
  BookMeta meta_;
  std::map<uint32_t, std::shared_ptr<const ChapterContent>> cache_;
  std::unordered_set<uint32_t> loaded_;  // keys of cache_, hashed for lookups
  std::set<std::string> pendingRanges_;
  mutable PaginationSnapshot snapshot_;

  std::shared_ptr<bool> cancelled_;
  uint32_t currentChapter_ = 0;
  bool loading_ = false;
  Error error_ = Error::Ok;
  Error lastFetchError_ = Error::Ok;
};

}  // namespace folio
