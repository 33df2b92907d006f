#pragma once

#include "model/types.h"
#include <vector>
#include <cstddef>

namespace fin {

// Storage boundary of the pipeline. Each upsert_ignore call inserts the
// records whose natural id is not stored yet and silently skips the rest.
// Returns the number of rows actually inserted.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual size_t upsert_ignore(const std::vector<Customer>& batch) = 0;
    virtual size_t upsert_ignore(const std::vector<Merchant>& batch) = 0;
    virtual size_t upsert_ignore(const std::vector<Payment>& batch) = 0;
    virtual size_t upsert_ignore(const std::vector<Settlement>& batch) = 0;

    virtual size_t row_count(EntityKind kind) const = 0;
};

} // namespace fin
