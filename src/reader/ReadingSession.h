#pragma once

#include <TextMetrics.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "../anchor/ProgressMapper.h"
#include "../anchor/ProgressReporter.h"
#include "../config/ReaderSettings.h"
#include "../core/EventLoop.h"
#include "../core/Result.h"
#include "../core/Types.h"
#include "../pagination/LayoutSettings.h"
#include "../pagination/PaginationController.h"
#include "../stream/ChapterStream.h"

namespace folio {

class LayoutMeasurer;
class MeasurementCache;
class PaginationEngine;

/**
 * One open book: streams chapters, keeps the page index current and keeps
 * the reader on the same content while pages are re-counted.
 *
 * The host renders pages, reports the one on screen with onPageVisible() and
 * moves to whatever page the PageListener announces after a pass.
 */
class ReadingSession {
 public:
  using PageListener =
      std::function<void(uint32_t page, const PaginationResult& result, PaginationChange change)>;

  // metrics overrides the font estimate used for measuring (may be null)
  ReadingSession(EventLoop& loop, ChapterProvider& provider, ProgressSink& sink,
                 std::shared_ptr<const TextMetrics> metrics = nullptr);
  ~ReadingSession();

  ReadingSession(const ReadingSession&) = delete;
  ReadingSession& operator=(const ReadingSession&) = delete;

  void setPageListener(PageListener listener) { pageListener_ = std::move(listener); }

  /**
   * Start reading bookId at a saved location string (any supported format,
   * empty for the beginning). Closes a previously open book.
   */
  Result<void> open(const std::string& bookId, const std::string& savedLocation, const ReaderSettings& settings);

  // Typography or page geometry changed
  Result<void> setSettings(const ReaderSettings& settings);

  Result<void> onPageVisible(uint32_t page);

  // Sends pending progress, then drops the book and everything scheduled for it
  void close();

  bool isOpen() const { return stream_ != nullptr; }
  bool isReady() const;
  uint32_t currentPage() const { return currentPage_; }
  uint32_t totalPages() const;
  const PaginationResult* pagination() const;
  const ChapterStream* stream() const { return stream_.get(); }
  Error error() const;

  // Pages worth rendering around the current one; empty before the first pass
  PageWindow pageWindow() const;

  bool hasAnchor() const { return hasAnchor_; }
  const ReadingAnchor& currentAnchor() const { return anchor_; }

  // Location string for the current page, "" before the first pass
  std::string location() const;

 private:
  Result<void> checkOpen() const;
  Result<void> checkReady() const;

  void onStreamChange(StreamChange change);
  void onPagination(const PaginationResult& result, PaginationChange change);
  uint32_t resolvePage(const PaginationResult& result) const;
  ProgressMapper mapper(const PaginationResult& result) const;

  static LayoutSettings layoutFrom(const ReaderSettings& settings);

  EventLoop& loop_;
  ChapterProvider& provider_;
  ProgressSink& sink_;
  std::shared_ptr<const TextMetrics> metrics_;
  PageListener pageListener_;

  ReaderSettings settings_;
  StoredPosition saved_;
  ReadingAnchor anchor_;
  bool hasAnchor_ = false;
  uint32_t currentPage_ = 0;

  // Torn down bottom-up: the stream first, the measurer last
  std::unique_ptr<LayoutMeasurer> measurer_;
  std::unique_ptr<MeasurementCache> cache_;
  std::unique_ptr<PaginationEngine> engine_;
  std::unique_ptr<PaginationController> controller_;
  std::unique_ptr<ProgressReporter> reporter_;
  std::unique_ptr<ChapterStream> stream_;
};

}  // namespace folio
