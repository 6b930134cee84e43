#pragma once
/// @file FieldAccessor.hpp
/// @brief Resolves (record type, field, selector) to bytes and reads/writes them

#include "../record/Record.hpp"

#include <optional>
#include <string>
#include <system_error>

namespace FwFile {

/// @brief Resolved position of a field inside the file
struct FieldLocation {
    size_t recordIndex = 0;
    const RecordTypeSpec* type = nullptr;
    const FieldSpec* field = nullptr;
};

/// @brief Typed get/set over a FixedWidthFile held by reference
/// @details Resolution rules:
///          - unknown tag -> UnknownRecordType, unknown field -> UnknownField
///          - a selector keeps records whose selector field equals it
///            (numeric fields compare by value, so "3" matches "000003");
///            a selector on a type without selector field -> SchemaMismatch
///          - no candidate -> RecordNotFound, several -> AmbiguousSelection
class FieldAccessor {
  public:
    explicit FieldAccessor(FixedWidthFile& file) : file_(&file) {}

    /// @brief Finds the single record and field addressed by the arguments
    bool resolve(const std::string& typeTag, const std::string& fieldName,
                 const std::optional<std::string>& selector, FieldLocation& out,
                 std::error_code& ec);

    /// @brief Reads the canonical logical value; never modifies the file
    std::optional<std::string> get(const std::string& typeTag, const std::string& fieldName,
                                   const std::optional<std::string>& selector,
                                   std::error_code& ec);

    /// @brief Overwrites only [offset, offset+length) of the resolved record
    /// @return false with ec=ValueTooLong/InvalidValue (record untouched) or a resolution error
    bool set(const std::string& typeTag, const std::string& fieldName, const std::string& value,
             const std::optional<std::string>& selector, std::error_code& ec);

    /// @brief Reads a field of the record at index
    std::optional<std::string> getAt(size_t recordIndex, const std::string& fieldName,
                                     std::error_code& ec);

    /// @brief Writes a field of the record at index (same encoding rules as set)
    bool setAt(size_t recordIndex, const std::string& fieldName, const std::string& value,
               std::error_code& ec);

    const std::string& lastError() const noexcept { return lastError_; }

  private:
    bool locateAt(size_t recordIndex, const std::string& fieldName, FieldLocation& out,
                  std::error_code& ec);
    std::optional<std::string> read(const FieldLocation& loc, std::error_code& ec);
    bool write(const FieldLocation& loc, const std::string& value, std::error_code& ec);
    bool fail(std::error_code& ec, std::error_code code, std::string detail);

    FixedWidthFile* file_;
    std::string lastError_;
};

} // namespace FwFile
