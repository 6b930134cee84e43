#pragma once
/// @file Codec.hpp
/// @brief File bytes <-> FixedWidthFile

#include "../record/Record.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace FwFile {

/// @brief Line terminator convention, fixed per Codec instance
enum class LineTerminator { Lf, CrLf };

/// @brief Decoder/encoder of whole fixed-width files
/// @details Contract: encode(decode(bytes)) == bytes when no field was modified,
///          including the presence or absence of a final terminator.
class Codec {
  public:
    explicit Codec(std::shared_ptr<const Schema> schema,
                   LineTerminator terminator = LineTerminator::Lf);

    /// @brief Splits bytes into lines and types each line by width and tag bytes
    /// @param[out] out Replaced with the decoded file on success, untouched on failure
    /// @return false with ec=MalformedRecord; lastError() names the 1-based line
    bool decode(std::string_view bytes, FixedWidthFile& out, std::error_code& ec);

    /// @brief Concatenates records with the terminator in stored order
    /// @return false with ec=MalformedRecord if a record's size disagrees with its type
    bool encode(const FixedWidthFile& file, std::string& out, std::error_code& ec);

    const std::string& terminator() const noexcept { return terminator_; }
    const std::shared_ptr<const Schema>& schema() const noexcept { return schema_; }

    /// @brief Context of the last failure (line number, widths, tag)
    const std::string& lastError() const noexcept { return lastError_; }

    /// @brief 1-based line (decode) or record (encode) of the last failure, 0 if none
    size_t errorLine() const noexcept { return errorLine_; }

  private:
    bool fail(std::error_code& ec, size_t line, std::string detail);

    std::shared_ptr<const Schema> schema_;
    std::string terminator_;
    std::string lastError_;
    size_t errorLine_ = 0;
};

} // namespace FwFile
