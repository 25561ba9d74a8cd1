/**
 * @file instrument_cache.cpp
 */

#include "model/instrument_cache.h"
#include "core/errors.h"
#include <algorithm>
#include <mutex>

namespace quantgate::model {

void InMemoryInstrumentCache::add(InstrumentPtr instrument) {
    if (!instrument) {
        throw InvalidArgumentError("cannot cache a null instrument");
    }
    std::unique_lock lock(mutex_);
    instruments_[instrument->id] = std::move(instrument);
}

void InMemoryInstrumentCache::add_currency(const Currency& currency) {
    std::unique_lock lock(mutex_);
    currencies_[currency.code] = currency;
}

InstrumentPtr InMemoryInstrumentCache::instrument(const InstrumentId& id) const {
    std::shared_lock lock(mutex_);
    auto it = instruments_.find(id);
    return it == instruments_.end() ? nullptr : it->second;
}

std::optional<Currency> InMemoryInstrumentCache::currency(const std::string& code) const {
    std::shared_lock lock(mutex_);
    auto it = currencies_.find(code);
    if (it == currencies_.end()) return std::nullopt;
    return it->second;
}

std::vector<InstrumentPtr> InMemoryInstrumentCache::instruments() const {
    std::vector<InstrumentPtr> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(instruments_.size());
        for (const auto& [id, inst] : instruments_) out.push_back(inst);
    }
    std::sort(out.begin(), out.end(), [](const InstrumentPtr& a, const InstrumentPtr& b) {
        return a->id < b->id;
    });
    return out;
}

std::size_t InMemoryInstrumentCache::instrument_count() const {
    std::shared_lock lock(mutex_);
    return instruments_.size();
}

std::size_t InMemoryInstrumentCache::currency_count() const {
    std::shared_lock lock(mutex_);
    return currencies_.size();
}

} // namespace quantgate::model
