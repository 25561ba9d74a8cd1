/**
 * @file currency.h
 * @brief Currency and Money value types
 */

#pragma once

#include "model/fixed_point.h"
#include "model/types.h"
#include <string>

namespace quantgate::model {

/**
 * @struct Currency
 * @brief Asset identity keyed by code (e.g. "BTC", "USDT")
 */
struct Currency {
    std::string code;
    int precision{8};
    std::string name;
    CurrencyType type{CurrencyType::CRYPTO};

    bool operator==(const Currency& o) const {
        return code == o.code && precision == o.precision && name == o.name && type == o.type;
    }
    bool operator!=(const Currency& o) const { return !(*this == o); }

    static Currency crypto(std::string code, int precision) {
        Currency c;
        c.name = code;
        c.code = std::move(code);
        c.precision = precision;
        return c;
    }
};

/**
 * @struct Money
 * @brief Decimal amount denominated in a currency
 */
struct Money {
    Decimal amount;
    Currency currency;

    static Money zero(const Currency& ccy) {
        return Money{Decimal::zero(ccy.precision), ccy};
    }

    bool operator==(const Money& o) const { return amount == o.amount && currency == o.currency; }
    bool operator!=(const Money& o) const { return !(*this == o); }

    std::string to_string() const { return amount.to_string() + " " + currency.code; }
};

} // namespace quantgate::model
