/**
 * @file reason_mapper.h
 * @brief Canonical reason mapping interface.
 */

#pragma once

#include <string>
#include <string_view>

namespace quantgate {

struct ReasonMapping {
    std::string status;      // normalized status: accepted/canceled/rejected/expired
    std::string reason_code; // canonical reason code
    std::string reason_text; // human-readable text

    bool operator==(const ReasonMapping& o) const {
        return status == o.status && reason_code == o.reason_code && reason_text == o.reason_text;
    }
};

class IReasonMapper {
public:
    virtual ~IReasonMapper() = default;
    virtual std::string canonical_code(std::string_view raw_code) const = 0;
    virtual ReasonMapping map(std::string_view normalized_status,
                              std::string_view raw_reason) const = 0;
    // REST error payload {"code": -2010, "msg": "..."}
    virtual ReasonMapping map_error(int code, std::string_view msg) const = 0;
};

// Binance order reject reasons ("r" field) and REST error codes.
class BinanceReasonMapper : public IReasonMapper {
public:
    std::string canonical_code(std::string_view raw_code) const override;
    ReasonMapping map(std::string_view normalized_status,
                      std::string_view raw_reason) const override;
    ReasonMapping map_error(int code, std::string_view msg) const override;
};

} // namespace quantgate
