/**
 * @file instrument_cache.h
 * @brief Instrument/currency registry consumed by instrument providers
 */

#pragma once

#include "model/currency.h"
#include "model/instrument.h"
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace quantgate::model {

/**
 * @class InstrumentCache
 * @brief Registry owned outside the normalization layer
 *
 * add() replaces any instrument with the same id. add_currency() is
 * idempotent per code; concurrent registration of the same code is
 * last-writer-wins.
 */
class InstrumentCache {
public:
    virtual ~InstrumentCache() = default;

    virtual void add(InstrumentPtr instrument) = 0;
    virtual void add_currency(const Currency& currency) = 0;

    virtual InstrumentPtr instrument(const InstrumentId& id) const = 0;
    virtual std::optional<Currency> currency(const std::string& code) const = 0;
    virtual std::vector<InstrumentPtr> instruments() const = 0;
};

class InMemoryInstrumentCache : public InstrumentCache {
public:
    void add(InstrumentPtr instrument) override;
    void add_currency(const Currency& currency) override;

    InstrumentPtr instrument(const InstrumentId& id) const override;
    std::optional<Currency> currency(const std::string& code) const override;
    std::vector<InstrumentPtr> instruments() const override;

    std::size_t instrument_count() const;
    std::size_t currency_count() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<InstrumentId, InstrumentPtr> instruments_;
    std::unordered_map<std::string, Currency> currencies_;
};

} // namespace quantgate::model
