#pragma once
/// @file Errors.hpp
/// @brief Error codes reported by the fixed-width editing core

#include <string>
#include <system_error>

namespace FwFile {

/// @brief Failure kinds of schema, codec and field operations
/// @details Values are carried in std::error_code under the "fwfile" category.
///          OS failures keep std::generic_category and are never remapped.
enum class Errc {
    InvalidSchema = 1,  ///< Schema rejected at construction/load time
    MalformedRecord,    ///< Line length or tag matches no record type
    UnknownRecordType,  ///< Tag not defined by the schema
    UnknownField,       ///< Field not defined for the record type
    AmbiguousSelection, ///< Several candidate records and no usable selector
    RecordNotFound,     ///< No record matched the selection
    ValueTooLong,       ///< Encoded value exceeds the field width
    SchemaMismatch,     ///< Operation needs something the schema does not define
    InvalidValue,       ///< Value cannot be represented by the field kind
    AggregateMismatch,  ///< Stored aggregate disagrees with the records
};

/// @brief Category shared by all Errc values
const std::error_category& fwfileCategory() noexcept;

/// @brief Builds an error_code from Errc (found by ADL)
std::error_code make_error_code(Errc e) noexcept;

} // namespace FwFile

namespace std {
template <> struct is_error_code_enum<FwFile::Errc> : true_type {};
} // namespace std
