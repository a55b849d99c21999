// ==============================================================================
// indexlens/batch.hpp - Параллельный разбор списка имён
// ==============================================================================
//
// Назначение:
// - Разбор больших списков имён индексов на нескольких потоках
// - Порядок результатов совпадает с порядком входа
//
// ==============================================================================

#ifndef INDEXLENS_BATCH_HPP
#define INDEXLENS_BATCH_HPP

#include <indexlens/identifier.hpp>

#include <string>
#include <vector>

namespace indexlens {

/// Разобрать все имена. threads == 0 означает число ядер.
/// Результат идентичен последовательному вызову parse_identifier().
/// on_fallback из opts может вызываться из рабочих потоков.
std::vector<ParsedIdentifier> parse_batch(const std::vector<std::string>& identifiers,
                                          const ParseOptions& opts = {}, unsigned threads = 0);

/// Эффективное число потоков для заданного объёма работы
unsigned effective_thread_count(unsigned requested, std::size_t items);

}  // namespace indexlens

#endif  // INDEXLENS_BATCH_HPP
