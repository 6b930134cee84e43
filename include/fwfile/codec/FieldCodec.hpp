#pragma once
/// @file FieldCodec.hpp
/// @brief Conversion between logical values and the exact bytes of one field

#include "../schema/FieldSpec.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace FwFile {

/// @brief Exact fixed-point number kept as a digit string
/// @details `units` holds the value in 10^-scale steps without leading zeros
///          ("0" for zero), so field widths beyond int64 range still round-trip.
///          Numeric fields are Decimal values with scale 0.
struct Decimal {
    bool negative = false;
    std::string units = "0";
    unsigned scale = 0;

    /// @brief Parses "[+-]digits[.digits]" with at most `scale` fraction digits
    /// @return false with ec=InvalidValue on syntax error or lost precision
    static bool parse(std::string_view text, unsigned scale, Decimal& out, std::error_code& ec);

    /// @brief Parses "[+-]digits" where the last `scale` digits are the fraction
    static bool parseImplied(std::string_view text, unsigned scale, Decimal& out,
                             std::error_code& ec);

    /// @brief Builds from an integer count of 10^-scale units
    static Decimal fromUnits(int64_t units, unsigned scale);

    /// @brief Canonical text: "-12.50", "0", "7.00"
    std::string toString() const;

    /// @brief Digits with the point removed: "-1250"
    std::string toImpliedString() const;

    /// @brief Value in 10^-scale units
    /// @return false with ec=InvalidValue when outside int64 range
    bool toUnits(int64_t& out, std::error_code& ec) const;

    bool isZero() const noexcept { return units == "0"; }
};

/// @brief Removes padding from the justified side (and spaces around numbers)
std::string_view stripPadding(const FieldSpec& spec, std::string_view bytes) noexcept;

/// @brief Decodes field bytes into the canonical logical value
/// @details Text: bytes with padding stripped. Numeric: integer without leading
///          zeros. Decimal: "int.frac" with exactly `scale` fraction digits.
/// @return false with ec=InvalidValue if a number field holds non-numeric bytes
bool decodeField(const FieldSpec& spec, std::string_view bytes, std::string& out,
                 std::error_code& ec);

/// @brief Encodes a logical value into exactly spec.length bytes
/// @return false with ec=ValueTooLong or InvalidValue; out is left unchanged on failure
bool encodeField(const FieldSpec& spec, std::string_view value, std::string& out,
                 std::error_code& ec);

/// @brief Canonical form of a user value as decodeField would return it after a set
bool canonicalValue(const FieldSpec& spec, std::string_view value, std::string& out,
                    std::error_code& ec);

} // namespace FwFile
