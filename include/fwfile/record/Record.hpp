#pragma once
/// @file Record.hpp
/// @brief Decoded line and in-memory file being edited

#include "../schema/Schema.hpp"

#include <algorithm>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace FwFile {

/// @brief One line of the file
/// @details `raw` is exactly the record type's width; edits are bounded slice
///          writes into it, never reallocations.
struct Record {
    std::string typeTag;
    std::string raw;
};

/// @brief Ordered record set plus the schema it was decoded with
/// @details Built fresh per command (decode), mutated in memory, then either
///          written back or discarded. Record order is preserved across edits.
class FixedWidthFile {
  public:
    FixedWidthFile() = default;
    explicit FixedWidthFile(std::shared_ptr<const Schema> schema) : schema_(std::move(schema)) {}

    const Schema& schema() const { return *schema_; }
    const std::shared_ptr<const Schema>& schemaPtr() const noexcept { return schema_; }

    std::vector<Record>& records() noexcept { return records_; }
    const std::vector<Record>& records() const noexcept { return records_; }

    /// @brief Number of records with the given tag
    size_t count(const std::string& tag) const {
        return static_cast<size_t>(
            std::count_if(records_.begin(), records_.end(),
                          [&tag](const Record& r) { return r.typeTag == tag; }));
    }

    /// @brief Whether the last line ends with the line terminator
    bool finalTerminator() const noexcept { return finalTerminator_; }
    void setFinalTerminator(bool value) noexcept { finalTerminator_ = value; }

  private:
    std::shared_ptr<const Schema> schema_;
    std::vector<Record> records_;
    bool finalTerminator_ = true;
};

} // namespace FwFile
