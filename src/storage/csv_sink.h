#pragma once

#include "storage/persistence_sink.h"
#include "utils/csv_writer.h"
#include <ostream>
#include <string>
#include <unordered_set>
#include <vector>

namespace fin {

// One CSV table per entity type inside a directory. Ids already present in
// existing files are read back on construction, so loading the same batch
// again (in this or a later process) appends nothing.
class CsvSink : public PersistenceSink {
public:
    explicit CsvSink(const std::string& directory);

    size_t upsert_ignore(const std::vector<Customer>& batch) override;
    size_t upsert_ignore(const std::vector<Merchant>& batch) override;
    size_t upsert_ignore(const std::vector<Payment>& batch) override;
    size_t upsert_ignore(const std::vector<Settlement>& batch) override;

    size_t row_count(EntityKind kind) const override;

    std::string table_path(EntityKind kind) const;
    const std::string& directory() const { return directory_; }

    // Writes the rows whose id is not in ids and returns their ids. An id is
    // recorded only once its row reached the stream; writing stops at the
    // first stream failure.
    template <typename T>
    static std::vector<std::string> write_rows(std::ostream& out,
                                               std::unordered_set<std::string>& ids,
                                               const std::vector<T>& batch) {
        std::vector<std::string> written;
        for (const auto& row : batch) {
            if (ids.count(row.id) > 0) continue;
            CsvWriter::write_row(out, row);
            if (!out) break;
            ids.insert(row.id);
            written.push_back(row.id);
        }
        return written;
    }

private:
    struct Table {
        std::string path;
        std::unordered_set<std::string> ids;
    };

    Table& table(EntityKind kind);
    const Table& table(EntityKind kind) const;
    static void load_ids(Table& t);

    template <typename T>
    size_t append(EntityKind kind, const std::vector<T>& batch);

    std::string directory_;
    Table customers_;
    Table merchants_;
    Table payments_;
    Table settlements_;
};

} // namespace fin
