#pragma once
/// @file TransactionAppender.hpp
/// @brief Appends transaction records and keeps aggregate fields consistent

#include "../record/Record.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace FwFile {

/// @brief Aggregate field whose stored value disagrees with the records
struct AggregateMismatch {
    size_t recordIndex = 0;
    std::string recordTag;
    std::string field;
    std::string stored;
    std::string expected;
};

/// @brief Stored field value the schema would not accept on write
struct ValueViolation {
    size_t recordIndex = 0;
    std::string recordTag;
    std::string field;
    std::string stored; ///< Raw field bytes
    std::string reason;
};

/// @brief Transaction insertion and aggregate maintenance over a FixedWidthFile
/// @details Insertion policy: immediately before the first record of the layout's
///          trailer type, or at the end if there is none. Every operation works on a
///          staged copy and commits only on success, so a failure leaves the file
///          exactly as it was.
class TransactionAppender {
  public:
    explicit TransactionAppender(FixedWidthFile& file) : file_(&file) {}

    /// @brief Adds one transaction record
    /// @details Counter = max(existing counters) + 1, starting at 1. Aggregates are
    ///          recomputed afterwards.
    /// @return Counter value as written (zero-padded), or nullopt with
    ///         ec=SchemaMismatch/ValueTooLong/InvalidValue
    std::optional<std::string> add(const std::string& amount, const std::string& currency,
                                   std::error_code& ec);

    /// @brief Recomputes and writes every schema aggregate
    bool recomputeAggregates(std::error_code& ec);

    /// @brief Lists aggregates whose stored value differs from the recomputed one
    std::vector<AggregateMismatch> verify(std::error_code& ec);

    /// @brief Lists stored values outside a field's allowed set or not readable as numbers
    std::vector<ValueViolation> checkValues() const;

    const std::string& lastError() const noexcept { return lastError_; }

  private:
    bool nextCounter(const FixedWidthFile& file, const TransactionLayout& txn,
                     std::string& out, std::error_code& ec);
    bool buildRecord(const RecordTypeSpec& type, Record& out, std::error_code& ec);
    bool computeAggregate(const FixedWidthFile& file, const AggregateSpec& agg, std::string& out,
                          std::error_code& ec);
    bool applyAggregates(FixedWidthFile& file, std::error_code& ec);
    bool fail(std::error_code& ec, std::error_code code, std::string detail);

    FixedWidthFile* file_;
    std::string lastError_;
};

} // namespace FwFile
