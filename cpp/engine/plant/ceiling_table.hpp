/*
===============================================================================
Plant: Ceiling Lookup Table (Sizing-to-Capacity)
File: cpp/engine/plant/ceiling_table.hpp
===============================================================================

Equipment catalogs are ordered breakpoint lists: "a pump rated for flow <= K
draws P kW". Sizing picks the smallest rated entry that covers the demand,
never an under-rated one:

    lookup(x) = first row with key >= x

Out of range (x above the last breakpoint) is resolved by OverflowPolicy:
  - Clamp: return the last (largest-capacity) row, flagged `clamped`.
  - Throw: raise Error{kTableOverflow}.

Tables are immutable after construction and safe to share across threads.
*/

#pragma once

#include "engine/core/error.hpp"
#include "engine/core/numeric.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace skid {

enum class OverflowPolicy : std::uint8_t {
    Clamp = 0,  // fall back to the largest-capacity entry
    Throw = 1   // raise Error{kTableOverflow}
};

template <typename V>
class CeilingTable final {
public:
    struct Row final {
        double key = 0.0;
        V value{};
    };

    struct Hit final {
        double key = 0.0;     // breakpoint that matched
        V value{};
        bool clamped = false; // query exceeded every breakpoint
    };

    CeilingTable(std::string name, std::vector<Row> rows, OverflowPolicy policy = OverflowPolicy::Clamp)
        : name_(std::move(name)), rows_(std::move(rows)), policy_(policy) {
        validate();
    }

    const std::string& name() const noexcept { return name_; }
    const std::vector<Row>& rows() const noexcept { return rows_; }
    OverflowPolicy policy() const noexcept { return policy_; }
    bool empty() const noexcept { return rows_.empty(); }
    std::size_t size() const noexcept { return rows_.size(); }

    // Same rows, different overflow policy.
    CeilingTable with_policy(OverflowPolicy policy) const {
        return CeilingTable(name_, rows_, policy);
    }

    // Ceiling lookup. Empty table -> nullopt; NaN query -> kInvalidInput.
    std::optional<Hit> lookup(double x) const {
        SKID_ENSURE(!std::isnan(x), ErrorCode::kInvalidInput, name_ + ": lookup query is NaN");
        if (rows_.empty()) return std::nullopt;

        auto it = std::lower_bound(rows_.begin(), rows_.end(), x,
                                   [](const Row& r, double q) { return r.key < q; });
        if (it != rows_.end()) {
            return Hit{it->key, it->value, false};
        }

        if (policy_ == OverflowPolicy::Throw) {
            SKID_THROW(ErrorCode::kTableOverflow,
                       name_ + ": query " + std::to_string(x) + " exceeds largest breakpoint " +
                           std::to_string(rows_.back().key));
        }
        return Hit{rows_.back().key, rows_.back().value, true};
    }

private:
    void validate() const {
        SKID_ENSURE(!name_.empty(), ErrorCode::kTableDefinition, "CeilingTable: name empty");
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            SKID_ENSURE(is_finite(rows_[i].key), ErrorCode::kTableDefinition, name_ + ": non-finite breakpoint");
            if (i > 0) {
                SKID_ENSURE(rows_[i].key > rows_[i - 1].key, ErrorCode::kTableDefinition,
                            name_ + ": breakpoints must be strictly increasing");
            }
        }
    }

    std::string name_;
    std::vector<Row> rows_;
    OverflowPolicy policy_ = OverflowPolicy::Clamp;
};

} // namespace skid
