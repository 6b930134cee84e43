#pragma once
/// @file FileTransaction.hpp
/// @brief read -> decode -> one mutation -> encode -> atomic replace

#include "../access/TransactionAppender.hpp"
#include "../codec/Codec.hpp"

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace FwFile {

/// @brief One edit session on one file path
/// @details Any failure during read, decode, mutation or encode returns before a
///          single byte is written; the write itself goes to a temporary file that
///          is renamed over the original. Read-only operations never write.
/// @note Single-writer contract: no lock is taken, callers must not run two
///       edits on the same path at once.
class FileTransaction {
  public:
    /// @brief Mutation applied to the decoded file; return false with ec to abort
    using Mutation = std::function<bool(FixedWidthFile&, std::error_code&)>;

    FileTransaction(std::string path, std::shared_ptr<const Schema> schema,
                    LineTerminator terminator = LineTerminator::Lf);

    /// @brief Reads and decodes the file
    bool load(FixedWidthFile& out, std::error_code& ec);

    /// @brief Reads one field value (no write phase)
    std::optional<std::string> get(const std::string& typeTag, const std::string& fieldName,
                                   const std::optional<std::string>& selector,
                                   std::error_code& ec);

    /// @brief Sets one field and commits
    bool set(const std::string& typeTag, const std::string& fieldName, const std::string& value,
             const std::optional<std::string>& selector, std::error_code& ec);

    /// @brief Appends a transaction and commits
    /// @return Counter of the new record
    std::optional<std::string> add(const std::string& amount, const std::string& currency,
                                   std::error_code& ec);

    /// @brief Rewrites every aggregate field from the records and commits
    bool recomputeAggregates(std::error_code& ec);

    /// @brief Lists inconsistent aggregates (no write phase)
    std::vector<AggregateMismatch> verify(std::error_code& ec);

    /// @brief Lists stored values the schema rejects (no write phase)
    std::vector<ValueViolation> checkValues(std::error_code& ec);

    /// @brief Generic commit path used by the operations above
    bool apply(const Mutation& mutation, std::error_code& ec);

    const std::string& path() const noexcept { return path_; }

    /// @brief Context of the last failure, including the failing stage
    const std::string& lastError() const noexcept { return lastError_; }

  private:
    bool fail(std::error_code& ec, std::error_code code, std::string detail);

    std::string path_;
    Codec codec_;
    std::string lastError_;
};

} // namespace FwFile
