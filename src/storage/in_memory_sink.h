#pragma once

#include "storage/persistence_sink.h"
#include <map>
#include <string>

namespace fin {

class InMemorySink : public PersistenceSink {
public:
    size_t upsert_ignore(const std::vector<Customer>& batch) override { return insert(customers_, batch); }
    size_t upsert_ignore(const std::vector<Merchant>& batch) override { return insert(merchants_, batch); }
    size_t upsert_ignore(const std::vector<Payment>& batch) override { return insert(payments_, batch); }
    size_t upsert_ignore(const std::vector<Settlement>& batch) override { return insert(settlements_, batch); }

    size_t row_count(EntityKind kind) const override {
        switch (kind) {
            case EntityKind::CUSTOMER: return customers_.size();
            case EntityKind::MERCHANT: return merchants_.size();
            case EntityKind::PAYMENT: return payments_.size();
            case EntityKind::SETTLEMENT: return settlements_.size();
        }
        return 0;
    }

    const std::map<std::string, Customer>& customers() const { return customers_; }
    const std::map<std::string, Merchant>& merchants() const { return merchants_; }
    const std::map<std::string, Payment>& payments() const { return payments_; }
    const std::map<std::string, Settlement>& settlements() const { return settlements_; }

private:
    template <typename T>
    static size_t insert(std::map<std::string, T>& table, const std::vector<T>& batch) {
        size_t inserted = 0;
        for (const auto& row : batch) {
            if (table.emplace(row.id, row).second) ++inserted;
        }
        return inserted;
    }

    std::map<std::string, Customer> customers_;
    std::map<std::string, Merchant> merchants_;
    std::map<std::string, Payment> payments_;
    std::map<std::string, Settlement> settlements_;
};

} // namespace fin
