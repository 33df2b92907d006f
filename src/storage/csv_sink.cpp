#include "storage/csv_sink.h"
#include "utils/csv_writer.h"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace fin {

CsvSink::CsvSink(const std::string& directory) : directory_(directory) {
    fs::create_directories(directory_);

    customers_.path = table_path(EntityKind::CUSTOMER);
    merchants_.path = table_path(EntityKind::MERCHANT);
    payments_.path = table_path(EntityKind::PAYMENT);
    settlements_.path = table_path(EntityKind::SETTLEMENT);

    load_ids(customers_);
    load_ids(merchants_);
    load_ids(payments_);
    load_ids(settlements_);
}

std::string CsvSink::table_path(EntityKind kind) const {
    return (fs::path(directory_) / (std::string(to_string(kind)) + ".csv")).string();
}

CsvSink::Table& CsvSink::table(EntityKind kind) {
    switch (kind) {
        case EntityKind::CUSTOMER: return customers_;
        case EntityKind::MERCHANT: return merchants_;
        case EntityKind::PAYMENT: return payments_;
        case EntityKind::SETTLEMENT: break;
    }
    return settlements_;
}

const CsvSink::Table& CsvSink::table(EntityKind kind) const {
    switch (kind) {
        case EntityKind::CUSTOMER: return customers_;
        case EntityKind::MERCHANT: return merchants_;
        case EntityKind::PAYMENT: return payments_;
        case EntityKind::SETTLEMENT: break;
    }
    return settlements_;
}

// First column of every data row is the natural id
void CsvSink::load_ids(Table& t) {
    if (!fs::exists(t.path)) return;

    std::ifstream file(t.path);
    if (!file.is_open()) throw std::runtime_error("Cannot open: " + t.path);

    std::string line;
    std::getline(file, line); // skip header

    while (std::getline(file, line)) {
        if (line.empty()) continue;
        std::istringstream ss(line);
        std::string id;
        std::getline(ss, id, ',');
        t.ids.insert(id);
    }
}

template <typename T>
size_t CsvSink::append(EntityKind kind, const std::vector<T>& batch) {
    Table& t = table(kind);
    bool needs_header = !fs::exists(t.path) || fs::file_size(t.path) == 0;

    std::ofstream f(t.path, std::ios::app);
    if (!f.is_open()) throw std::runtime_error("Cannot open: " + t.path);

    if (needs_header) f << CsvWriter::header(kind) << "\n";

    std::vector<std::string> written = write_rows(f, t.ids, batch);

    // Buffered rows can still fail on flush; their ids are dropped again
    f.flush();
    if (!f) {
        for (const auto& id : written) t.ids.erase(id);
        throw std::runtime_error("Write failed: " + t.path);
    }
    return written.size();
}

size_t CsvSink::upsert_ignore(const std::vector<Customer>& batch) {
    return append(EntityKind::CUSTOMER, batch);
}

size_t CsvSink::upsert_ignore(const std::vector<Merchant>& batch) {
    return append(EntityKind::MERCHANT, batch);
}

size_t CsvSink::upsert_ignore(const std::vector<Payment>& batch) {
    return append(EntityKind::PAYMENT, batch);
}

size_t CsvSink::upsert_ignore(const std::vector<Settlement>& batch) {
    return append(EntityKind::SETTLEMENT, batch);
}

size_t CsvSink::row_count(EntityKind kind) const {
    return table(kind).ids.size();
}

} // namespace fin
