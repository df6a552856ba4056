#include "ReadingSession.h"

#include <Logging.h>

#include <algorithm>

#include "../anchor/AnchorCodec.h"
#include "../anchor/ProgressMapper.h"
#include "../pagination/LayoutMeasurer.h"
#include "../pagination/MeasurementCache.h"
#include "../pagination/PaginationEngine.h"

#define TAG "SESSION"

namespace folio {

ReadingSession::ReadingSession(EventLoop& loop, ChapterProvider& provider, ProgressSink& sink,
                               std::shared_ptr<const TextMetrics> metrics)
    : loop_(loop), provider_(provider), sink_(sink), metrics_(std::move(metrics)) {}

ReadingSession::~ReadingSession() { close(); }

LayoutSettings ReadingSession::layoutFrom(const ReaderSettings& settings) {
  LayoutSettings layout;
  layout.typography.fontSize = settings.fontSize;
  layout.typography.lineHeight = settings.lineHeight;
  layout.typography.fontFamily = settings.fontFamily;
  layout.pageWidth = settings.pageWidth;
  layout.pageHeight = settings.pageHeight;
  return layout;
}

Result<void> ReadingSession::open(const std::string& bookId, const std::string& savedLocation,
                                  const ReaderSettings& settings) {
  if (bookId.empty()) {
    LOG_ERR(TAG, "Cannot open a book without an id");
    return ErrVoid(Error::InvalidOperation);
  }
  close();

  settings_ = settings;
  saved_ = deserializeAnchor(savedLocation);
  anchor_ = saved_.anchor;
  hasAnchor_ = saved_.hasAnchor;
  currentPage_ = 0;

  measurer_.reset(new LayoutMeasurer(settings.snippetLength, metrics_));
  cache_.reset(new MeasurementCache(settings.measurementCacheFile));
  if (!settings.measurementCacheFile.empty()) {
    cache_->bind(layoutFrom(settings).fingerprint());
    if (cache_->load()) {
      LOG_DBG(TAG, "Reusing %d cached measurements", static_cast<int>(cache_->size()));
    }
  }
  engine_.reset(new PaginationEngine(*measurer_, cache_.get()));
  controller_.reset(new PaginationController(loop_, *engine_, settings.paginationDebounceMs));
  controller_->setListener(
      [this](const PaginationResult& result, const PaginationChange change) { onPagination(result, change); });
  reporter_.reset(new ProgressReporter(loop_, sink_, settings.progressDebounceMs));
  stream_.reset(new ChapterStream(provider_, settings.stream));
  stream_->setListener([this](const StreamChange change) { onStreamChange(change); });

  StartPosition start;
  if (saved_.hasAnchor) {
    start = StartPosition::atChapter(saved_.anchor.chapterIndex);
  } else if (saved_.charOffset > 0) {
    start = StartPosition::atCharOffset(saved_.charOffset);
  }

  LOG_INF(TAG, "Opening %s at \"%s\"", bookId.c_str(), savedLocation.c_str());
  stream_->open(bookId, start);
  return Ok();
}

void ReadingSession::close() {
  if (!stream_) return;

  if (reporter_) reporter_->flush();
  if (cache_ && !settings_.measurementCacheFile.empty() && cache_->size() > 0 && !cache_->save()) {
    LOG_ERR(TAG, "Failed to save measurement cache");
  }

  stream_.reset();
  reporter_.reset();
  controller_.reset();
  engine_.reset();
  cache_.reset();
  measurer_.reset();
  LOG_DBG(TAG, "Closed");
}

Result<void> ReadingSession::checkOpen() const {
  if (!stream_) return ErrVoid(Error::InvalidState);
  return Ok();
}

Result<void> ReadingSession::checkReady() const {
  TRY(checkOpen());
  if (!controller_->isReady()) return ErrVoid(Error::NotPrepared);
  return Ok();
}

Result<void> ReadingSession::setSettings(const ReaderSettings& settings) {
  TRY(checkOpen());

  settings_.fontSize = settings.fontSize;
  settings_.lineHeight = settings.lineHeight;
  settings_.fontFamily = settings.fontFamily;
  settings_.pageWidth = settings.pageWidth;
  settings_.pageHeight = settings.pageHeight;
  settings_.pageWindow = settings.pageWindow;

  // Before the book opens the settings are applied together with the first chapters
  if (!stream_->isLoading() && stream_->error() == Error::Ok) {
    controller_->setLayoutSettings(layoutFrom(settings_));
  }
  return Ok();
}

Result<void> ReadingSession::onPageVisible(const uint32_t page) {
  TRY(checkReady());

  const PaginationResult& result = controller_->result();
  if (page >= result.totalPages) {
    LOG_ERR(TAG, "Page %u outside the book (%u pages)", page, result.totalPages);
    return ErrVoid(Error::OutOfRange);
  }

  const auto anchor = pageToAnchor(page, result.chapterPageRanges, result.blockMaps);
  if (!anchor.ok()) {
    return ErrVoid(anchor.err);
  }

  currentPage_ = page;
  anchor_ = anchor.value;
  hasAnchor_ = true;

  const uint32_t chapterIndex = anchor_.chapterIndex;
  stream_->updateCurrentChapter(chapterIndex);
  if (!stream_->isChapterLoaded(chapterIndex)) {
    stream_->ensureChaptersLoaded(static_cast<int64_t>(chapterIndex) - 2, static_cast<int64_t>(chapterIndex) + 2);
  }

  const ProgressMapper progress = mapper(result);
  reporter_->pageSettled(anchor_, progress.pageToCharOffset(page),
                         ProgressMapper::percentage(page, result.totalPages));
  return Ok();
}

void ReadingSession::onStreamChange(const StreamChange change) {
  switch (change) {
    case StreamChange::Opened:
      reporter_->start(stream_->bookId());
      // One blocking pass for settings, styles and the first chapters
      controller_->setLayoutSettings(layoutFrom(settings_));
      controller_->setStyles(stream_->styles());
      controller_->setChapters(stream_->chaptersForPagination());
      break;
    case StreamChange::ChaptersMerged:
    case StreamChange::ChaptersEvicted:
      controller_->setChapters(stream_->chaptersForPagination());
      break;
    case StreamChange::FetchStateChanged:
      if (stream_->lastFetchError() != Error::Ok) {
        LOG_INF(TAG, "Chapter fetch failed (%s), pages stay estimated", errorToString(stream_->lastFetchError()));
      }
      break;
    case StreamChange::Failed:
      LOG_ERR(TAG, "Could not open %s: %s", stream_->bookId().c_str(), errorToString(stream_->error()));
      break;
  }
}

ProgressMapper ReadingSession::mapper(const PaginationResult& result) const {
  return ProgressMapper(stream_->chaptersMeta(), result.chapterPageRanges, result.totalPages);
}

uint32_t ReadingSession::resolvePage(const PaginationResult& result) const {
  if (result.totalPages == 0) return 0;

  // Once the reader has a position it is the anchor, whatever the pass
  if (hasAnchor_) {
    return anchorToPage(anchor_, result.chapterPageRanges, result.blockMaps, settings_.fuzzyPrefix);
  }
  return mapper(result).restorePage(saved_, result.blockMaps, result.fingerprint, settings_.fuzzyPrefix);
}

void ReadingSession::onPagination(const PaginationResult& result, const PaginationChange change) {
  const uint32_t page = resolvePage(result);
  if (page != currentPage_) {
    LOG_DBG(TAG, "%s pass moved page %u -> %u", change == PaginationChange::Blocking ? "Blocking" : "Silent",
            currentPage_, page);
  }
  currentPage_ = page;
  if (pageListener_) {
    pageListener_(page, result, change);
  }
}

bool ReadingSession::isReady() const { return controller_ && controller_->isReady(); }

uint32_t ReadingSession::totalPages() const { return controller_ ? controller_->result().totalPages : 0; }

const PaginationResult* ReadingSession::pagination() const { return controller_ ? &controller_->result() : nullptr; }

PageWindow ReadingSession::pageWindow() const {
  return calcPageWindow(currentPage_, totalPages(), settings_.pageWindow);
}

Error ReadingSession::error() const { return stream_ ? stream_->error() : Error::Ok; }

std::string ReadingSession::location() const {
  if (!isReady() || !hasAnchor_) return "";
  const PaginationResult& result = controller_->result();
  return serializeAnchor(anchor_, mapper(result).pageToCharOffset(currentPage_));
}

}  // namespace folio
