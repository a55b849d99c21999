// ==============================================================================
// batch.cpp - Параллельный разбор списка имён
// ==============================================================================

#include "indexlens/batch.hpp"

#include <algorithm>
#include <thread>

namespace indexlens {

namespace {

/// Ниже этого объёма потоки не запускаются
constexpr std::size_t MIN_ITEMS_PER_THREAD = 256;

}  // namespace

unsigned effective_thread_count(unsigned requested, std::size_t items) {
    unsigned threads = requested;
    if (threads == 0) {
        threads = std::thread::hardware_concurrency();
    }
    if (threads == 0) {
        threads = 1;
    }
    std::size_t by_load = std::max<std::size_t>(1, items / MIN_ITEMS_PER_THREAD);
    return static_cast<unsigned>(std::min<std::size_t>(threads, by_load));
}

std::vector<ParsedIdentifier> parse_batch(const std::vector<std::string>& identifiers,
                                          const ParseOptions& opts, unsigned threads) {
    std::vector<ParsedIdentifier> results(identifiers.size());

    unsigned workers = effective_thread_count(threads, identifiers.size());
    if (workers <= 1) {
        for (std::size_t i = 0; i < identifiers.size(); ++i) {
            results[i] = parse_identifier(identifiers[i], opts);
        }
        return results;
    }

    // Каждый поток пишет только в свой непрерывный диапазон results
    std::size_t chunk = (identifiers.size() + workers - 1) / workers;
    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (unsigned w = 0; w < workers; ++w) {
        std::size_t begin = w * chunk;
        std::size_t end = std::min(identifiers.size(), begin + chunk);
        if (begin >= end) {
            break;
        }
        pool.emplace_back([&identifiers, &results, &opts, begin, end]() {
            for (std::size_t i = begin; i < end; ++i) {
                results[i] = parse_identifier(identifiers[i], opts);
            }
        });
    }
    for (auto& t : pool) {
        t.join();
    }
    return results;
}

}  // namespace indexlens
