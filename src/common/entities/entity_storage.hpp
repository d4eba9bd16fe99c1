#ifndef BASTION_COMMON_ENTITIES_ENTITY_STORAGE_HPP
#define BASTION_COMMON_ENTITIES_ENTITY_STORAGE_HPP

#include "common/assert.hpp"
#include "common/defs.hpp"
#include "common/entities/entity_id.hpp"

#include <utility>
#include <vector>

namespace bastion {

/// One table of a module. Rows are kept in insertion order and addressed by the
/// table's id type, so the id handed out by `push_back` is the row's position.
///
/// A table holds at most `max_size` rows. The all-ones id marks "no row" and is
/// never handed out.
template<typename Value, typename Id>
class EntityStorage final {
public:
    static constexpr size_t max_size = static_cast<size_t>(Id::invalid_value);

    auto begin() const { return rows_.begin(); }
    auto end() const { return rows_.end(); }
    size_t size() const { return rows_.size(); }

    bool in_bounds(Id id) const { return id && position(id) < rows_.size(); }

    /// Unchecked access in release builds.
    /// \pre `in_bounds(id)`.
    Value& operator[](Id id) {
        BASTION_DEBUG_ASSERT(in_bounds(id), "Row id is not part of the table.");
        return rows_[position(id)];
    }

    const Value& operator[](Id id) const {
        BASTION_DEBUG_ASSERT(in_bounds(id), "Row id is not part of the table.");
        return rows_[position(id)];
    }

    /// Returns null for ids that do not name a row.
    const Value* try_get(Id id) const { return in_bounds(id) ? &rows_[position(id)] : nullptr; }

    Id push_back(Value value) {
        BASTION_DEBUG_ASSERT(rows_.size() < max_size, "Table is full.");
        Id id(static_cast<typename Id::UnderlyingType>(rows_.size()));
        rows_.push_back(std::move(value));
        return id;
    }

private:
    static size_t position(Id id) { return static_cast<size_t>(id.value()); }

private:
    std::vector<Value> rows_;
};

} // namespace bastion

#endif // BASTION_COMMON_ENTITIES_ENTITY_STORAGE_HPP
