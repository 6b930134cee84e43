#include "fwfile/schema/Schema.hpp"

#include "fwfile/Errors.hpp"

#include <algorithm>
#include <utility>

namespace FwFile {

const char* toString(FieldKind kind) noexcept {
    switch (kind) {
    case FieldKind::Text:
        return "text";
    case FieldKind::Numeric:
        return "numeric";
    case FieldKind::Decimal:
        return "decimal";
    }
    return "text";
}

const char* toString(Justify justify) noexcept {
    return justify == Justify::Left ? "left" : "right";
}

bool parseFieldKind(std::string_view text, FieldKind& out) noexcept {
    if (text == "text")
        out = FieldKind::Text;
    else if (text == "numeric")
        out = FieldKind::Numeric;
    else if (text == "decimal")
        out = FieldKind::Decimal;
    else
        return false;
    return true;
}

bool parseJustify(std::string_view text, Justify& out) noexcept {
    if (text == "left")
        out = Justify::Left;
    else if (text == "right")
        out = Justify::Right;
    else
        return false;
    return true;
}

const char* toString(AggregateSpec::Function fn) noexcept {
    return fn == AggregateSpec::Function::Count ? "count" : "sum";
}

bool parseAggregateFunction(std::string_view text, AggregateSpec::Function& out) noexcept {
    if (text == "count")
        out = AggregateSpec::Function::Count;
    else if (text == "sum")
        out = AggregateSpec::Function::Sum;
    else
        return false;
    return true;
}

const FieldSpec* RecordTypeSpec::field(std::string_view name) const noexcept {
    for (const auto& f : fields) {
        if (f.name == name)
            return &f;
    }
    return nullptr;
}

Schema::Schema(std::vector<RecordTypeSpec> types, std::vector<AggregateSpec> aggregates,
               std::optional<TransactionLayout> transaction, std::error_code& ec)
    : types_(std::move(types)), aggregates_(std::move(aggregates)),
      transaction_(std::move(transaction)) {
    ec.clear();
    std::string why;
    if (!validate(why)) {
        types_.clear();
        index_.clear();
        aggregates_.clear();
        transaction_.reset();
        validationError_ = std::move(why);
        ec = make_error_code(Errc::InvalidSchema);
    }
}

const RecordTypeSpec* Schema::findRecordType(std::string_view tag, std::error_code& ec) const {
    ec.clear();
    auto it = index_.find(std::string(tag));
    if (it == index_.end()) {
        ec = make_error_code(Errc::UnknownRecordType);
        return nullptr;
    }
    return &types_[it->second];
}

const FieldSpec* Schema::findField(std::string_view tag, std::string_view name,
                                   std::error_code& ec) const {
    const RecordTypeSpec* type = findRecordType(tag, ec);
    if (!type)
        return nullptr;
    const FieldSpec* f = type->field(name);
    if (!f)
        ec = make_error_code(Errc::UnknownField);
    return f;
}

const RecordTypeSpec* Schema::matchLine(std::string_view line) const noexcept {
    for (const auto& type : types_) {
        if (type.width != line.size())
            continue;
        const FieldSpec* tf = type.field(type.tagField);
        if (line.compare(tf->offset, tf->length, type.tagBytes_) == 0)
            return &type;
    }
    return nullptr;
}

bool Schema::hasWidth(size_t width) const noexcept {
    return std::any_of(types_.begin(), types_.end(),
                       [width](const RecordTypeSpec& t) { return t.width == width; });
}

bool Schema::validate(std::string& why) {
    if (types_.empty()) {
        why = "schema defines no record types";
        return false;
    }

    for (size_t i = 0; i < types_.size(); ++i) {
        if (!validateRecordType(types_[i], why))
            return false;
        if (!index_.emplace(types_[i].tag, i).second) {
            why = "duplicate record type '" + types_[i].tag + "'";
            return false;
        }
    }

    // 같은 폭 + 같은 tag 바이트를 가진 타입이 둘이면 decode 시 레코드 타입을 결정할 수 없다.
    for (size_t i = 0; i < types_.size(); ++i) {
        for (size_t j = i + 1; j < types_.size(); ++j) {
            const auto& a = types_[i];
            const auto& b = types_[j];
            if (a.width != b.width)
                continue;
            const FieldSpec* fa = a.field(a.tagField);
            const FieldSpec* fb = b.field(b.tagField);
            if (fa->offset == fb->offset && fa->length == fb->length &&
                a.tagBytes_ == b.tagBytes_) {
                why = "record types '" + a.tag + "' and '" + b.tag +
                      "' cannot be told apart (same width and tag bytes)";
                return false;
            }
        }
    }

    for (const auto& agg : aggregates_) {
        if (!validateAggregate(agg, why))
            return false;
    }
    if (transaction_ && !validateTransaction(*transaction_, why))
        return false;
    return true;
}

bool Schema::validateRecordType(RecordTypeSpec& type, std::string& why) const {
    if (type.tag.empty()) {
        why = "record type with empty tag";
        return false;
    }
    const std::string where = "record type '" + type.tag + "'";
    if (type.width == 0) {
        why = where + ": width must be positive";
        return false;
    }

    std::vector<const FieldSpec*> byOffset;
    for (const auto& f : type.fields) {
        if (f.name.empty()) {
            why = where + ": field with empty name";
            return false;
        }
        if (f.length == 0) {
            why = where + ": field '" + f.name + "' has zero length";
            return false;
        }
        if (f.offset + f.length > type.width) {
            why = where + ": field '" + f.name + "' ends at " + std::to_string(f.end()) +
                  " past record width " + std::to_string(type.width);
            return false;
        }
        if (f.isNumber()) {
            // decode는 정렬 반대쪽의 pad 문자를 벗겨내므로, 값에 쓰일 수 있는 문자는
            // 오른쪽 정렬의 '0' 을 빼고는 pad로 쓸 수 없다.
            const char p = f.padChar;
            const bool valueChar = (p >= '0' && p <= '9') || p == '+' || p == '-';
            if (valueChar && !(p == '0' && f.justify == Justify::Right)) {
                why = where + ": field '" + f.name + "' cannot use pad '" + std::string(1, p) +
                      "' with " + toString(f.justify) + " justification";
                return false;
            }
            if (!f.allowedValues.empty()) {
                why = where + ": allowed values are only supported on text fields ('" + f.name +
                      "' is " + toString(f.kind) + ")";
                return false;
            }
        }
        for (const auto& v : f.allowedValues) {
            if (v.size() > f.length) {
                why = where + ": allowed value '" + v + "' does not fit field '" + f.name + "'";
                return false;
            }
        }
        byOffset.push_back(&f);
    }

    std::sort(byOffset.begin(), byOffset.end(),
              [](const FieldSpec* a, const FieldSpec* b) { return a->offset < b->offset; });
    for (size_t i = 0; i < byOffset.size(); ++i) {
        for (size_t j = 0; j < i; ++j) {
            if (byOffset[j]->name == byOffset[i]->name) {
                why = where + ": duplicate field '" + byOffset[i]->name + "'";
                return false;
            }
        }
        if (i > 0 && byOffset[i - 1]->end() > byOffset[i]->offset) {
            why = where + ": fields '" + byOffset[i - 1]->name + "' and '" + byOffset[i]->name +
                  "' overlap";
            return false;
        }
    }

    const FieldSpec* tagField = type.field(type.tagField);
    if (!tagField) {
        why = where + ": tag field '" + type.tagField + "' is not defined";
        return false;
    }
    const std::string& value = type.tagValue.empty() ? type.tag : type.tagValue;
    if (value.size() > tagField->length) {
        why = where + ": tag value '" + value + "' longer than tag field (" +
              std::to_string(tagField->length) + " bytes)";
        return false;
    }
    std::string pad(tagField->length - value.size(), tagField->padChar);
    type.tagBytes_ = tagField->justify == Justify::Left ? value + pad : pad + value;

    if (!type.selectorField.empty() && !type.field(type.selectorField)) {
        why = where + ": selector field '" + type.selectorField + "' is not defined";
        return false;
    }
    return true;
}

bool Schema::validateAggregate(const AggregateSpec& agg, std::string& why) const {
    const std::string where = "aggregate '" + agg.recordTag + "." + agg.field + "'";
    std::error_code ec;
    const FieldSpec* target = findField(agg.recordTag, agg.field, ec);
    if (!target) {
        why = where + ": target " + ec.message();
        return false;
    }
    if (!target->isNumber()) {
        why = where + ": target field must be numeric or decimal";
        return false;
    }
    if (!findRecordType(agg.sourceTag, ec)) {
        why = where + ": source record type '" + agg.sourceTag + "' is not defined";
        return false;
    }
    if (agg.function == AggregateSpec::Function::Sum) {
        const FieldSpec* source = findField(agg.sourceTag, agg.sourceField, ec);
        if (!source) {
            why = where + ": source field '" + agg.sourceField + "': " + ec.message();
            return false;
        }
        if (!source->isNumber()) {
            why = where + ": summed field must be numeric or decimal";
            return false;
        }
        const unsigned sourceScale = source->kind == FieldKind::Decimal ? source->scale : 0;
        const unsigned targetScale = target->kind == FieldKind::Decimal ? target->scale : 0;
        if (targetScale < sourceScale) {
            why = where + ": target scale " + std::to_string(targetScale) +
                  " cannot hold sums of '" + agg.sourceTag + "." + agg.sourceField +
                  "' (scale " + std::to_string(sourceScale) + ")";
            return false;
        }
    }
    return true;
}

bool Schema::validateTransaction(const TransactionLayout& txn, std::string& why) const {
    std::error_code ec;
    const RecordTypeSpec* type = findRecordType(txn.recordTag, ec);
    if (!type) {
        why = "transaction record type '" + txn.recordTag + "' is not defined";
        return false;
    }
    const FieldSpec* counter = type->field(txn.counterField);
    if (!counter || counter->kind != FieldKind::Numeric) {
        why = "transaction counter field '" + txn.counterField + "' must be a numeric field of '" +
              txn.recordTag + "'";
        return false;
    }
    const FieldSpec* amount = type->field(txn.amountField);
    if (!amount || !amount->isNumber()) {
        why = "transaction amount field '" + txn.amountField +
              "' must be a numeric or decimal field of '" + txn.recordTag + "'";
        return false;
    }
    if (!type->field(txn.currencyField)) {
        why = "transaction currency field '" + txn.currencyField + "' is not defined on '" +
              txn.recordTag + "'";
        return false;
    }
    if (!txn.trailerTag.empty() && !findRecordType(txn.trailerTag, ec)) {
        why = "trailer record type '" + txn.trailerTag + "' is not defined";
        return false;
    }
    return true;
}

} // namespace FwFile
