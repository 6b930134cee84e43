#pragma once
/// @file SchemaLoader.hpp
/// @brief Schema files (`Record { ... }` statement lines) and the built-in layout

#include "Schema.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace FwFile {

/// @brief Reads and writes schema files
/// @details One statement per line, blank lines and `#` comments ignored:
/// @code
/// Record { "tag": "TRANSACTION", "width": 120, "tagField": "field_id", "tagValue": "02", "selector": "counter" }
/// Field { "record": "TRANSACTION", "name": "amount", "offset": 8, "length": 12, "kind": "decimal", "scale": 2 }
/// Aggregate { "record": "FOOTER", "field": "total_count", "function": "count", "source": "TRANSACTION" }
/// Transaction { "record": "TRANSACTION", "counter": "counter", "amount": "amount", "currency": "currency", "trailer": "FOOTER" }
/// @endcode
/// A Field statement must follow the Record statement it belongs to.
class SchemaLoader {
  public:
    /// @brief Reads path and parses it with loadText
    std::shared_ptr<const Schema> loadFile(const std::string& path, std::error_code& ec);

    /// @brief Parses schema text
    /// @return nullptr with ec=InvalidSchema (syntax, unknown key, validation)
    ///         or an OS error from loadFile
    std::shared_ptr<const Schema> loadText(std::string_view text, std::error_code& ec);

    /// @brief Renders schema as text that loadText reads back to the same schema
    static std::string format(const Schema& schema);

    const std::string& lastError() const noexcept { return lastError_; }

    /// @brief 1-based schema line of the last failure, 0 if not line related
    size_t errorLine() const noexcept { return errorLine_; }

  private:
    bool fail(std::error_code& ec, std::error_code code, size_t line, std::string detail);

    std::string lastError_;
    size_t errorLine_ = 0;
};

/// @brief The 120-byte HEADER(01)/TRANSACTION(02)/FOOTER(03) bank file layout
/// @details count(TRANSACTION) -> FOOTER.total_count,
///          sum(TRANSACTION.amount) -> FOOTER.control_sum.
std::shared_ptr<const Schema> defaultSchema();

} // namespace FwFile
