#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "../core/Result.h"
#include "../core/Types.h"

namespace folio {

/**
 * Source of chapter metadata and HTML (a book service, a local store).
 * Completions may run synchronously or later from the event loop.
 */
class ChapterProvider {
 public:
  using MetaCallback = std::function<void(Result<BookMeta>)>;
  using ChaptersCallback = std::function<void(Result<std::vector<ChapterContent>>)>;
  using ParseCallback = std::function<void(Result<void>)>;

  virtual ~ChapterProvider() = default;

  // Fails with Error::NotPrepared while the book has not been split into chapters
  virtual void getChapterMeta(const std::string& bookId, MetaCallback done) = 0;

  // Inclusive range of chapter indices
  virtual void getChapters(const std::string& bookId, uint32_t from, uint32_t to, ChaptersCallback done) = 0;

  virtual void triggerChapterParse(const std::string& bookId, ParseCallback done) = 0;
};

}  // namespace folio
