#include "fwfile/access/TransactionAppender.hpp"

#include "fwfile/Errors.hpp"
#include "fwfile/access/FieldAccessor.hpp"
#include "fwfile/codec/FieldCodec.hpp"
#include "fwfile/util/Logger.hpp"
#include "fwfile/util/textFormatUtil.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <utility>

namespace FwFile {

namespace {

/// @brief Reads a numeric/decimal field as 10^-scale units
bool readUnits(const Record& r, const FieldSpec& f, int64_t& out, std::error_code& ec) {
    std::string canonical;
    if (!decodeField(f, std::string_view(r.raw).substr(f.offset, f.length), canonical, ec))
        return false;
    Decimal d;
    unsigned scale = f.kind == FieldKind::Decimal ? f.scale : 0;
    if (!Decimal::parse(canonical, scale, d, ec))
        return false;
    return d.toUnits(out, ec);
}

bool addChecked(int64_t a, int64_t b, int64_t& out) noexcept {
    if ((b > 0 && a > std::numeric_limits<int64_t>::max() - b) ||
        (b < 0 && a < std::numeric_limits<int64_t>::min() - b))
        return false;
    out = a + b;
    return true;
}

} // namespace

std::optional<std::string> TransactionAppender::add(const std::string& amount,
                                                    const std::string& currency,
                                                    std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    const auto& txn = file_->schema().transaction();
    if (!txn) {
        fail(ec, Errc::SchemaMismatch, "schema defines no transaction record layout");
        return std::nullopt;
    }
    std::error_code lookup;
    const RecordTypeSpec* type = file_->schema().findRecordType(txn->recordTag, lookup);
    if (!type) {
        fail(ec, Errc::SchemaMismatch,
             "transaction record type '" + txn->recordTag + "' is not defined");
        return std::nullopt;
    }

    // 모든 변경은 사본에서 수행하고 마지막에 한 번에 반영한다. 중간 실패 시 원본은 그대로다.
    FixedWidthFile staged = *file_;

    std::string counter;
    if (!nextCounter(staged, *txn, counter, ec))
        return std::nullopt;

    Record rec;
    if (!buildRecord(*type, rec, ec))
        return std::nullopt;

    auto& records = staged.records();
    size_t pos = records.size();
    if (!txn->trailerTag.empty()) {
        auto it = std::find_if(records.begin(), records.end(), [&](const Record& r) {
            return r.typeTag == txn->trailerTag;
        });
        pos = static_cast<size_t>(it - records.begin());
    }
    records.insert(records.begin() + static_cast<std::ptrdiff_t>(pos), std::move(rec));

    FieldAccessor acc(staged);
    if (!acc.setAt(pos, txn->counterField, counter, ec)) {
        fail(ec, ec, "counter: " + acc.lastError());
        return std::nullopt;
    }
    if (!acc.setAt(pos, txn->amountField, amount, ec)) {
        fail(ec, ec, "amount: " + acc.lastError());
        return std::nullopt;
    }
    if (!acc.setAt(pos, txn->currencyField, currency, ec)) {
        fail(ec, ec, "currency: " + acc.lastError());
        return std::nullopt;
    }
    if (!applyAggregates(staged, ec))
        return std::nullopt;

    const FieldSpec* counterSpec = type->field(txn->counterField);
    std::string written = records[pos].raw.substr(counterSpec->offset, counterSpec->length);

    *file_ = std::move(staged);
    FW_LOG_INFO("added {} {} (amount {}, currency {}) at record {}", txn->recordTag, written,
                amount, currency, pos + 1);
    return written;
}

bool TransactionAppender::recomputeAggregates(std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    FixedWidthFile staged = *file_;
    if (!applyAggregates(staged, ec))
        return false;
    *file_ = std::move(staged);
    return true;
}

std::vector<AggregateMismatch> TransactionAppender::verify(std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    std::vector<AggregateMismatch> result;

    FieldAccessor acc(*file_);
    const auto& records = file_->records();
    for (const auto& agg : file_->schema().aggregates()) {
        std::string expected;
        if (!computeAggregate(*file_, agg, expected, ec))
            return {};
        const FieldSpec* target = file_->schema().findField(agg.recordTag, agg.field, ec);
        if (!target) {
            fail(ec, ec, "aggregate target " + agg.recordTag + "." + agg.field);
            return {};
        }
        std::string expectedCanonical;
        std::error_code canon;
        if (!canonicalValue(*target, expected, expectedCanonical, canon))
            expectedCanonical = expected;

        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].typeTag != agg.recordTag)
                continue;
            std::error_code rd;
            auto stored = acc.getAt(i, agg.field, rd);
            std::string storedText =
                stored ? *stored : records[i].raw.substr(target->offset, target->length);
            if (!stored || *stored != expectedCanonical) {
                result.push_back(
                    AggregateMismatch{i, agg.recordTag, agg.field, storedText, expectedCanonical});
            }
        }
    }
    return result;
}

std::vector<ValueViolation> TransactionAppender::checkValues() const {
    std::vector<ValueViolation> result;
    const auto& records = file_->records();
    for (size_t i = 0; i < records.size(); ++i) {
        std::error_code lookup;
        const RecordTypeSpec* type = file_->schema().findRecordType(records[i].typeTag, lookup);
        if (!type)
            continue;
        for (const auto& f : type->fields) {
            const std::string raw = records[i].raw.substr(f.offset, f.length);
            std::string value;
            std::error_code rd;
            if (!decodeField(f, raw, value, rd)) {
                result.push_back(ValueViolation{i, type->tag, f.name, raw, rd.message()});
                continue;
            }
            if (f.allowedValues.empty() ||
                std::find(f.allowedValues.begin(), f.allowedValues.end(), value) !=
                    f.allowedValues.end())
                continue;
            result.push_back(ValueViolation{i, type->tag, f.name, raw,
                                            "not one of " + util::joinList(f.allowedValues)});
        }
    }
    if (!result.empty())
        FW_LOG_DEBUG("{} stored value(s) rejected by the schema", result.size());
    return result;
}

bool TransactionAppender::nextCounter(const FixedWidthFile& file, const TransactionLayout& txn,
                                      std::string& out, std::error_code& ec) {
    std::error_code lookup;
    const FieldSpec* counter = file.schema().findField(txn.recordTag, txn.counterField, lookup);
    if (!counter)
        return fail(ec, lookup, "counter field '" + txn.counterField + "'");

    int64_t maxCounter = 0;
    const auto& records = file.records();
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].typeTag != txn.recordTag)
            continue;
        int64_t value = 0;
        if (!readUnits(records[i], *counter, value, ec)) {
            return fail(ec, ec,
                        "record " + std::to_string(i + 1) + ": counter '" +
                            records[i].raw.substr(counter->offset, counter->length) +
                            "' is not a number");
        }
        maxCounter = std::max(maxCounter, value);
    }
    if (maxCounter == std::numeric_limits<int64_t>::max())
        return fail(ec, Errc::ValueTooLong, "counter space exhausted");
    out = std::to_string(maxCounter + 1);
    return true;
}

bool TransactionAppender::buildRecord(const RecordTypeSpec& type, Record& out,
                                      std::error_code& ec) {
    std::string raw(type.width, ' ');
    for (const auto& f : type.fields) {
        std::string bytes;
        if (f.isNumber()) {
            if (!encodeField(f, "0", bytes, ec))
                return fail(ec, ec, "cannot initialise field '" + f.name + "'");
        } else {
            bytes.assign(f.length, f.padChar);
        }
        raw.replace(f.offset, f.length, bytes);
    }
    const FieldSpec* tagField = type.field(type.tagField);
    raw.replace(tagField->offset, tagField->length, type.tagBytes());
    out.typeTag = type.tag;
    out.raw = std::move(raw);
    return true;
}

bool TransactionAppender::computeAggregate(const FixedWidthFile& file, const AggregateSpec& agg,
                                           std::string& out, std::error_code& ec) {
    const auto& records = file.records();
    if (agg.function == AggregateSpec::Function::Count) {
        out = std::to_string(file.count(agg.sourceTag));
        return true;
    }

    std::error_code lookup;
    const FieldSpec* source = file.schema().findField(agg.sourceTag, agg.sourceField, lookup);
    if (!source)
        return fail(ec, lookup, "aggregate source " + agg.sourceTag + "." + agg.sourceField);

    int64_t sum = 0;
    for (size_t i = 0; i < records.size(); ++i) {
        if (records[i].typeTag != agg.sourceTag)
            continue;
        int64_t value = 0;
        if (!readUnits(records[i], *source, value, ec)) {
            return fail(ec, ec,
                        "record " + std::to_string(i + 1) + ": " + agg.sourceField + " '" +
                            records[i].raw.substr(source->offset, source->length) +
                            "' cannot be summed");
        }
        if (!addChecked(sum, value, sum)) {
            return fail(ec, Errc::InvalidValue,
                        "sum of " + agg.sourceTag + "." + agg.sourceField + " overflows");
        }
    }
    unsigned scale = source->kind == FieldKind::Decimal ? source->scale : 0;
    out = Decimal::fromUnits(sum, scale).toString();
    return true;
}

bool TransactionAppender::applyAggregates(FixedWidthFile& file, std::error_code& ec) {
    FieldAccessor acc(file);
    const auto& records = file.records();
    for (const auto& agg : file.schema().aggregates()) {
        std::string value;
        if (!computeAggregate(file, agg, value, ec))
            return false;
        for (size_t i = 0; i < records.size(); ++i) {
            if (records[i].typeTag != agg.recordTag)
                continue;
            if (!acc.setAt(i, agg.field, value, ec)) {
                return fail(ec, ec,
                            "aggregate " + agg.recordTag + "." + agg.field + ": " +
                                acc.lastError());
            }
        }
    }
    return true;
}

bool TransactionAppender::fail(std::error_code& ec, std::error_code code, std::string detail) {
    lastError_ = std::move(detail);
    ec = code;
    FW_LOG_DEBUG("transaction: {}: {}", ec.message(), lastError_);
    return false;
}

} // namespace FwFile
