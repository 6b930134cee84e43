#pragma once
/// @file Schema.hpp
/// @brief Record types, aggregates and transaction layout of a fixed-width file

#include "FieldSpec.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace FwFile {

/// @brief Layout of one record type (one line kind)
struct RecordTypeSpec {
    std::string tag;           ///< Logical name, e.g. "TRANSACTION"
    size_t width = 0;          ///< Exact line width in bytes (terminator excluded)
    std::vector<FieldSpec> fields;
    std::string tagField;      ///< Name of the field carrying the tag bytes
    std::string tagValue;      ///< Expected tag field content; empty means `tag`
    std::string selectorField; ///< Field compared against a Selector; may be empty

    /// @brief Field lookup by name
    /// @return nullptr if absent
    const FieldSpec* field(std::string_view name) const noexcept;

    /// @brief Tag bytes padded to the tag field width (filled in by Schema)
    const std::string& tagBytes() const noexcept { return tagBytes_; }

  private:
    friend class Schema;
    std::string tagBytes_;
};

/// @brief Derived field kept consistent with other records
struct AggregateSpec {
    enum class Function { Count, Sum };

    std::string recordTag;   ///< Record type holding the aggregate (e.g. FOOTER)
    std::string field;       ///< Aggregate field name
    Function function = Function::Count;
    std::string sourceTag;   ///< Record type aggregated over (e.g. TRANSACTION)
    std::string sourceField; ///< Summed field (Sum only)
};

/// @brief Names the record type and fields `add` fills in
struct TransactionLayout {
    std::string recordTag;
    std::string counterField;
    std::string amountField;
    std::string currencyField;
    std::string trailerTag; ///< New records go before the first record of this type
};

/// @brief Immutable, validated description of a file format
/// @details Built once per session. A failed construction leaves an empty schema,
///          sets ec to Errc::InvalidSchema and keeps the reason in validationError().
class Schema {
  public:
    Schema() = default;

    Schema(std::vector<RecordTypeSpec> types, std::vector<AggregateSpec> aggregates,
           std::optional<TransactionLayout> transaction, std::error_code& ec);

    /// @brief Record type by tag
    /// @return nullptr with ec=UnknownRecordType if absent
    const RecordTypeSpec* findRecordType(std::string_view tag, std::error_code& ec) const;

    /// @brief Field by record tag and field name
    /// @return nullptr with ec=UnknownRecordType or UnknownField
    const FieldSpec* findField(std::string_view tag, std::string_view name,
                               std::error_code& ec) const;

    /// @brief Selects the record type of a line by width, then tag bytes
    /// @return nullptr if no record type matches
    const RecordTypeSpec* matchLine(std::string_view line) const noexcept;

    /// @brief Record types in declaration order
    const std::vector<RecordTypeSpec>& recordTypes() const noexcept { return types_; }
    const std::vector<AggregateSpec>& aggregates() const noexcept { return aggregates_; }
    const std::optional<TransactionLayout>& transaction() const noexcept { return transaction_; }

    /// @brief True when some record type has this exact width
    bool hasWidth(size_t width) const noexcept;

    bool empty() const noexcept { return types_.empty(); }

    const std::string& validationError() const noexcept { return validationError_; }

  private:
    bool validate(std::string& why);
    bool validateRecordType(RecordTypeSpec& type, std::string& why) const;
    bool validateAggregate(const AggregateSpec& agg, std::string& why) const;
    bool validateTransaction(const TransactionLayout& txn, std::string& why) const;

    std::vector<RecordTypeSpec> types_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<AggregateSpec> aggregates_;
    std::optional<TransactionLayout> transaction_;
    std::string validationError_;
};

const char* toString(AggregateSpec::Function fn) noexcept;
bool parseAggregateFunction(std::string_view text, AggregateSpec::Function& out) noexcept;

} // namespace FwFile
