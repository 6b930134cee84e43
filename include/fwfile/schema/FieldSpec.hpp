#pragma once
/// @file FieldSpec.hpp
/// @brief Layout and value conventions of one fixed-width field

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace FwFile {

/// @brief How the field bytes are interpreted
enum class FieldKind {
    Text,    ///< Raw characters, padding stripped on read
    Numeric, ///< Signed integer, leading pad/zeros ignored on read
    Decimal, ///< Fixed-point number with `scale` fraction digits
};

/// @brief Which side the value sits on; padding fills the other side
enum class Justify { Left, Right };

/// @brief Field layout inside a record
/// @details `offset`/`length` are byte positions within the record line.
///          For Decimal fields `impliedDecimal` selects between "000050000"
///          (point implied before the last `scale` digits) and "000500.00".
struct FieldSpec {
    std::string name;
    size_t offset = 0;
    size_t length = 0;
    FieldKind kind = FieldKind::Text;
    Justify justify = Justify::Left;
    char padChar = ' ';
    unsigned scale = 0;
    bool impliedDecimal = true;
    std::vector<std::string> allowedValues; ///< Empty means unrestricted (Text only)

    size_t end() const noexcept { return offset + length; }
    bool isNumber() const noexcept { return kind != FieldKind::Text; }

    /// @brief Text field with left justification and space padding
    static FieldSpec text(std::string name, size_t offset, size_t length) {
        FieldSpec f;
        f.name = std::move(name);
        f.offset = offset;
        f.length = length;
        return f;
    }

    /// @brief Integer field, right-justified and zero-padded
    static FieldSpec numeric(std::string name, size_t offset, size_t length) {
        FieldSpec f = text(std::move(name), offset, length);
        f.kind = FieldKind::Numeric;
        f.justify = Justify::Right;
        f.padChar = '0';
        return f;
    }

    /// @brief Fixed-point field, right-justified and zero-padded
    static FieldSpec decimal(std::string name, size_t offset, size_t length, unsigned scale,
                             bool implied = true) {
        FieldSpec f = numeric(std::move(name), offset, length);
        f.kind = FieldKind::Decimal;
        f.scale = scale;
        f.impliedDecimal = implied;
        return f;
    }
};

const char* toString(FieldKind kind) noexcept;
const char* toString(Justify justify) noexcept;
bool parseFieldKind(std::string_view text, FieldKind& out) noexcept;
bool parseJustify(std::string_view text, Justify& out) noexcept;

} // namespace FwFile
