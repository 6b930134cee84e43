#include "fwfile/access/FieldAccessor.hpp"

#include "fwfile/Errors.hpp"
#include "fwfile/codec/FieldCodec.hpp"
#include "fwfile/util/Logger.hpp"

#include <algorithm>
#include <cstddef>
#include <string_view>
#include <utility>
#include <vector>

namespace FwFile {

namespace {

std::string_view slice(const Record& r, const FieldSpec& f) {
    return std::string_view(r.raw).substr(f.offset, f.length);
}

} // namespace

bool FieldAccessor::resolve(const std::string& typeTag, const std::string& fieldName,
                            const std::optional<std::string>& selector, FieldLocation& out,
                            std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    std::error_code lookup;
    const RecordTypeSpec* type = file_->schema().findRecordType(typeTag, lookup);
    if (!type)
        return fail(ec, lookup, "record type '" + typeTag + "' is not defined by the schema");
    const FieldSpec* field = type->field(fieldName);
    if (!field) {
        return fail(ec, Errc::UnknownField,
                    "field '" + fieldName + "' is not defined for '" + typeTag + "'");
    }

    const FieldSpec* selField = nullptr;
    std::string wanted;
    bool unmatchable = false;
    if (selector) {
        if (type->selectorField.empty()) {
            return fail(ec, Errc::SchemaMismatch,
                        "'" + typeTag + "' records have no selector field");
        }
        selField = type->field(type->selectorField);
        // 셀렉터를 필드 규칙으로 정규화한다. 필드에 들어갈 수 없는 값은 어떤 레코드와도 일치하지 않는다.
        std::error_code canon;
        unmatchable = !canonicalValue(*selField, *selector, wanted, canon);
    }

    std::vector<size_t> candidates;
    const auto& records = file_->records();
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].typeTag != typeTag)
            continue;
        if (selField) {
            if (unmatchable)
                continue;
            std::string have;
            std::error_code dec;
            if (!decodeField(*selField, slice(records[i], *selField), have, dec) || have != wanted)
                continue;
        }
        candidates.push_back(i);
    }

    if (candidates.empty()) {
        if (selector) {
            return fail(ec, Errc::RecordNotFound,
                        "no '" + typeTag + "' record with " + type->selectorField + " = '" +
                            *selector + "'");
        }
        return fail(ec, Errc::RecordNotFound, "file has no '" + typeTag + "' record");
    }
    if (candidates.size() > 1) {
        std::string detail = std::to_string(candidates.size()) + " '" + typeTag + "' records match";
        if (selector)
            detail += " " + type->selectorField + " = '" + *selector + "'";
        else if (!type->selectorField.empty())
            detail += "; pass a selector on '" + type->selectorField + "'";
        return fail(ec, Errc::AmbiguousSelection, detail);
    }

    out.recordIndex = candidates.front();
    out.type = type;
    out.field = field;
    return true;
}

std::optional<std::string> FieldAccessor::get(const std::string& typeTag,
                                              const std::string& fieldName,
                                              const std::optional<std::string>& selector,
                                              std::error_code& ec) {
    FieldLocation loc;
    if (!resolve(typeTag, fieldName, selector, loc, ec))
        return std::nullopt;
    return read(loc, ec);
}

bool FieldAccessor::set(const std::string& typeTag, const std::string& fieldName,
                        const std::string& value, const std::optional<std::string>& selector,
                        std::error_code& ec) {
    FieldLocation loc;
    if (!resolve(typeTag, fieldName, selector, loc, ec))
        return false;
    return write(loc, value, ec);
}

std::optional<std::string> FieldAccessor::getAt(size_t recordIndex, const std::string& fieldName,
                                                std::error_code& ec) {
    FieldLocation loc;
    if (!locateAt(recordIndex, fieldName, loc, ec))
        return std::nullopt;
    return read(loc, ec);
}

bool FieldAccessor::setAt(size_t recordIndex, const std::string& fieldName,
                          const std::string& value, std::error_code& ec) {
    FieldLocation loc;
    if (!locateAt(recordIndex, fieldName, loc, ec))
        return false;
    return write(loc, value, ec);
}

bool FieldAccessor::locateAt(size_t recordIndex, const std::string& fieldName, FieldLocation& out,
                             std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    const auto& records = file_->records();
    if (recordIndex >= records.size()) {
        return fail(ec, Errc::RecordNotFound,
                    "record index " + std::to_string(recordIndex) + " out of range (" +
                        std::to_string(records.size()) + " records)");
    }
    const std::string& tag = records[recordIndex].typeTag;
    std::error_code lookup;
    const RecordTypeSpec* type = file_->schema().findRecordType(tag, lookup);
    if (!type)
        return fail(ec, lookup, "record type '" + tag + "' is not defined by the schema");
    const FieldSpec* field = type->field(fieldName);
    if (!field)
        return fail(ec, Errc::UnknownField, "field '" + fieldName + "' is not defined for '" + tag + "'");

    out.recordIndex = recordIndex;
    out.type = type;
    out.field = field;
    return true;
}

std::optional<std::string> FieldAccessor::read(const FieldLocation& loc, std::error_code& ec) {
    const Record& r = file_->records()[loc.recordIndex];
    std::string value;
    if (!decodeField(*loc.field, slice(r, *loc.field), value, ec)) {
        fail(ec, ec,
             "field '" + loc.field->name + "' of record " + std::to_string(loc.recordIndex + 1) +
                 " holds '" + std::string(slice(r, *loc.field)) + "', not a valid " +
                 toString(loc.field->kind) + " value");
        return std::nullopt;
    }
    return value;
}

bool FieldAccessor::write(const FieldLocation& loc, const std::string& value,
                          std::error_code& ec) {
    const FieldSpec& f = *loc.field;
    if (f.name == loc.type->tagField) {
        return fail(ec, Errc::InvalidValue,
                    "field '" + f.name + "' is the tag field of '" + loc.type->tag +
                        "' and cannot be set");
    }

    std::string bytes;
    if (!encodeField(f, value, bytes, ec)) {
        std::string detail = "value '" + value + "' ";
        if (ec == Errc::ValueTooLong) {
            detail += "does not fit field '" + f.name + "' (" + std::to_string(f.length) + " bytes)";
        } else if (!f.allowedValues.empty()) {
            detail += "is not one of the values allowed for '" + f.name + "'";
        } else {
            detail += "is not a valid " + std::string(toString(f.kind)) + " value for '" + f.name + "'";
        }
        return fail(ec, ec, detail);
    }

    // 길이가 같은 바이트만 제자리에 덮어쓴다. 다른 필드/레코드의 바이트는 건드리지 않는다.
    Record& r = file_->records()[loc.recordIndex];
    std::copy(bytes.begin(), bytes.end(), r.raw.begin() + static_cast<std::ptrdiff_t>(f.offset));
    FW_LOG_DEBUG("set {}.{} of record {} to '{}'", loc.type->tag, f.name, loc.recordIndex + 1,
                 bytes);
    return true;
}

bool FieldAccessor::fail(std::error_code& ec, std::error_code code, std::string detail) {
    lastError_ = std::move(detail);
    ec = code;
    FW_LOG_DEBUG("field access: {}: {}", ec.message(), lastError_);
    return false;
}

} // namespace FwFile
