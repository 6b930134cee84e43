#include "fwfile/schema/SchemaLoader.hpp"

#include "fwfile/Errors.hpp"
#include "fwfile/util/FileIo.hpp"
#include "fwfile/util/Logger.hpp"
#include "fwfile/util/textFormatUtil.hpp"

#include <algorithm>
#include <initializer_list>
#include <unordered_map>
#include <utility>
#include <vector>

namespace FwFile {

namespace {

/// @brief Typed access to the key/value pairs of one statement
class StatementReader {
  public:
    explicit StatementReader(const util::Statement& st) : st_(st) {}

    /// @brief Rejects keys outside the given set
    bool onlyKeys(std::initializer_list<const char*> keys, std::string& why) const {
        for (const auto& kv : st_.kv) {
            bool known = std::any_of(keys.begin(), keys.end(),
                                     [&](const char* k) { return kv.first == k; });
            if (!known) {
                why = "unknown key '" + kv.first + "' in " + st_.type + " statement";
                return false;
            }
        }
        return true;
    }

    bool has(const char* key) const { return st_.kv.find(key) != st_.kv.end(); }

    bool str(const char* key, bool required, std::string& out, std::string& why) const {
        auto it = st_.kv.find(key);
        if (it == st_.kv.end()) {
            if (required)
                why = st_.type + " statement needs \"" + key + "\"";
            return !required;
        }
        if (!it->second.first) {
            why = "\"" + std::string(key) + "\" must be a quoted string";
            return false;
        }
        out = it->second.second;
        return true;
    }

    bool num(const char* key, bool required, long& out, std::string& why) const {
        auto it = st_.kv.find(key);
        if (it == st_.kv.end()) {
            if (required)
                why = st_.type + " statement needs \"" + key + "\"";
            return !required;
        }
        std::error_code ec;
        if (it->second.first || !util::parseLongStrict(it->second.second, out, ec) || out < 0) {
            why = "\"" + std::string(key) + "\" must be a non-negative integer";
            return false;
        }
        return true;
    }

  private:
    const util::Statement& st_;
};

bool readRecord(const StatementReader& r, RecordTypeSpec& out, std::string& why) {
    if (!r.onlyKeys({"tag", "width", "tagField", "tagValue", "selector"}, why))
        return false;
    long width = 0;
    if (!r.str("tag", true, out.tag, why) || !r.num("width", true, width, why) ||
        !r.str("tagField", true, out.tagField, why) || !r.str("tagValue", false, out.tagValue, why) ||
        !r.str("selector", false, out.selectorField, why))
        return false;
    out.width = static_cast<size_t>(width);
    return true;
}

bool readField(const StatementReader& r, std::string& record, FieldSpec& out, std::string& why) {
    if (!r.onlyKeys({"record", "name", "offset", "length", "kind", "justify", "pad", "scale",
                     "implied", "allowed"},
                    why))
        return false;
    long offset = 0;
    long length = 0;
    if (!r.str("record", true, record, why) || !r.str("name", true, out.name, why) ||
        !r.num("offset", true, offset, why) || !r.num("length", true, length, why))
        return false;
    out.offset = static_cast<size_t>(offset);
    out.length = static_cast<size_t>(length);

    std::string kind = "text";
    if (!r.str("kind", false, kind, why))
        return false;
    if (!parseFieldKind(kind, out.kind)) {
        why = "unknown field kind '" + kind + "'";
        return false;
    }
    // 숫자 필드의 기본값은 오른쪽 정렬 + '0' 패딩이다.
    out.justify = out.isNumber() ? Justify::Right : Justify::Left;
    out.padChar = out.isNumber() ? '0' : ' ';

    std::string text;
    if (r.has("justify")) {
        if (!r.str("justify", true, text, why))
            return false;
        if (!parseJustify(text, out.justify)) {
            why = "unknown justify '" + text + "'";
            return false;
        }
        // 왼쪽 정렬 숫자를 '0' 으로 채우면 값의 일부로 읽히므로 기본 pad를 공백으로 바꾼다.
        if (out.isNumber() && out.justify == Justify::Left)
            out.padChar = ' ';
    }
    if (r.has("pad")) {
        if (!r.str("pad", true, text, why))
            return false;
        if (text.size() != 1) {
            why = "\"pad\" must be exactly one character";
            return false;
        }
        out.padChar = text[0];
    }

    long scale = 0;
    long implied = 1;
    if (!r.num("scale", false, scale, why) || !r.num("implied", false, implied, why))
        return false;
    if (scale > 18) {
        why = "\"scale\" must be at most 18";
        return false;
    }
    if (implied > 1) {
        why = "\"implied\" must be 0 or 1";
        return false;
    }
    out.scale = static_cast<unsigned>(scale);
    out.impliedDecimal = implied == 1;

    if (r.has("allowed")) {
        if (!r.str("allowed", true, text, why))
            return false;
        out.allowedValues = util::splitList(text);
    }
    return true;
}

bool readAggregate(const StatementReader& r, AggregateSpec& out, std::string& why) {
    if (!r.onlyKeys({"record", "field", "function", "source", "sourceField"}, why))
        return false;
    std::string fn;
    if (!r.str("record", true, out.recordTag, why) || !r.str("field", true, out.field, why) ||
        !r.str("function", true, fn, why) || !r.str("source", true, out.sourceTag, why) ||
        !r.str("sourceField", false, out.sourceField, why))
        return false;
    if (!parseAggregateFunction(fn, out.function)) {
        why = "unknown aggregate function '" + fn + "'";
        return false;
    }
    return true;
}

bool readTransaction(const StatementReader& r, TransactionLayout& out, std::string& why) {
    if (!r.onlyKeys({"record", "counter", "amount", "currency", "trailer"}, why))
        return false;
    return r.str("record", true, out.recordTag, why) && r.str("counter", true, out.counterField, why) &&
           r.str("amount", true, out.amountField, why) &&
           r.str("currency", true, out.currencyField, why) &&
           r.str("trailer", false, out.trailerTag, why);
}

util::KvList::value_type str(const char* key, std::string value) {
    return {key, {true, std::move(value)}};
}

util::KvList::value_type num(const char* key, size_t value) {
    return {key, {false, std::to_string(value)}};
}

} // namespace

std::shared_ptr<const Schema> SchemaLoader::loadFile(const std::string& path,
                                                     std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    errorLine_ = 0;

    std::string text;
    if (!util::readWholeFile(path, text, ec)) {
        fail(ec, ec, 0, "cannot read schema file " + path);
        return nullptr;
    }
    auto schema = loadText(text, ec);
    if (!schema)
        lastError_ = path + ": " + lastError_;
    return schema;
}

std::shared_ptr<const Schema> SchemaLoader::loadText(std::string_view text, std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    errorLine_ = 0;

    std::vector<util::Statement> statements;
    size_t badLine = 0;
    std::error_code parseEc;
    if (!util::parseStatements(text, statements, badLine, parseEc)) {
        fail(ec, Errc::InvalidSchema, badLine, "syntax error");
        return nullptr;
    }

    std::vector<RecordTypeSpec> types;
    std::unordered_map<std::string, size_t> byTag;
    std::vector<AggregateSpec> aggregates;
    std::optional<TransactionLayout> transaction;

    for (const auto& st : statements) {
        StatementReader reader(st);
        std::string why;
        bool ok = false;

        if (st.type == "Record") {
            RecordTypeSpec type;
            ok = readRecord(reader, type, why);
            if (ok && byTag.count(type.tag)) {
                why = "record type '" + type.tag + "' declared twice";
                ok = false;
            }
            if (ok) {
                byTag.emplace(type.tag, types.size());
                types.push_back(std::move(type));
            }
        } else if (st.type == "Field") {
            std::string record;
            FieldSpec field;
            ok = readField(reader, record, field, why);
            if (ok) {
                auto it = byTag.find(record);
                if (it == byTag.end()) {
                    why = "field '" + field.name + "' refers to undeclared record '" + record + "'";
                    ok = false;
                } else {
                    types[it->second].fields.push_back(std::move(field));
                }
            }
        } else if (st.type == "Aggregate") {
            AggregateSpec agg;
            ok = readAggregate(reader, agg, why);
            if (ok)
                aggregates.push_back(std::move(agg));
        } else if (st.type == "Transaction") {
            TransactionLayout txn;
            ok = readTransaction(reader, txn, why);
            if (ok && transaction) {
                why = "only one Transaction statement is allowed";
                ok = false;
            }
            if (ok)
                transaction = std::move(txn);
        } else {
            why = "unknown statement '" + st.type + "'";
        }

        if (!ok) {
            fail(ec, Errc::InvalidSchema, st.line, why);
            return nullptr;
        }
    }

    auto schema = std::make_shared<Schema>(std::move(types), std::move(aggregates),
                                           std::move(transaction), ec);
    if (ec) {
        fail(ec, ec, 0, schema->validationError());
        return nullptr;
    }
    FW_LOG_DEBUG("schema loaded: {} record types, {} aggregates", schema->recordTypes().size(),
                 schema->aggregates().size());
    return schema;
}

std::string SchemaLoader::format(const Schema& schema) {
    std::string out;
    for (const auto& type : schema.recordTypes()) {
        util::KvList rec{str("tag", type.tag), num("width", type.width),
                         str("tagField", type.tagField)};
        if (!type.tagValue.empty())
            rec.push_back(str("tagValue", type.tagValue));
        if (!type.selectorField.empty())
            rec.push_back(str("selector", type.selectorField));
        out += util::formatLine("Record", rec);

        for (const auto& f : type.fields) {
            util::KvList kv{str("record", type.tag),
                            str("name", f.name),
                            num("offset", f.offset),
                            num("length", f.length),
                            str("kind", toString(f.kind)),
                            str("justify", toString(f.justify)),
                            str("pad", std::string(1, f.padChar))};
            if (f.kind == FieldKind::Decimal) {
                kv.push_back(num("scale", f.scale));
                kv.push_back(num("implied", f.impliedDecimal ? 1 : 0));
            }
            if (!f.allowedValues.empty())
                kv.push_back(str("allowed", util::joinList(f.allowedValues)));
            out += util::formatLine("Field", kv);
        }
    }
    for (const auto& agg : schema.aggregates()) {
        util::KvList kv{str("record", agg.recordTag), str("field", agg.field),
                        str("function", toString(agg.function)), str("source", agg.sourceTag)};
        if (!agg.sourceField.empty())
            kv.push_back(str("sourceField", agg.sourceField));
        out += util::formatLine("Aggregate", kv);
    }
    if (const auto& txn = schema.transaction()) {
        util::KvList kv{str("record", txn->recordTag), str("counter", txn->counterField),
                        str("amount", txn->amountField), str("currency", txn->currencyField)};
        if (!txn->trailerTag.empty())
            kv.push_back(str("trailer", txn->trailerTag));
        out += util::formatLine("Transaction", kv);
    }
    return out;
}

bool SchemaLoader::fail(std::error_code& ec, std::error_code code, size_t line,
                        std::string detail) {
    errorLine_ = line;
    lastError_ = line ? "line " + std::to_string(line) + ": " + detail : std::move(detail);
    ec = code;
    FW_LOG_DEBUG("schema: {}: {}", ec.message(), lastError_);
    return false;
}

std::shared_ptr<const Schema> defaultSchema() {
    RecordTypeSpec header;
    header.tag = "HEADER";
    header.width = 120;
    header.tagField = "field_id";
    header.tagValue = "01";
    header.fields = {FieldSpec::text("field_id", 0, 2), FieldSpec::text("name", 2, 28),
                     FieldSpec::text("surname", 30, 30), FieldSpec::text("patronymic", 60, 30),
                     FieldSpec::text("address", 90, 28)};

    FieldSpec currency = FieldSpec::text("currency", 20, 3);
    currency.allowedValues = {"USD", "EUR", "GBP"};

    RecordTypeSpec transaction;
    transaction.tag = "TRANSACTION";
    transaction.width = 120;
    transaction.tagField = "field_id";
    transaction.tagValue = "02";
    transaction.selectorField = "counter";
    transaction.fields = {FieldSpec::text("field_id", 0, 2), FieldSpec::numeric("counter", 2, 6),
                          FieldSpec::decimal("amount", 8, 12, 2), currency,
                          FieldSpec::text("reserved", 23, 95)};

    RecordTypeSpec footer;
    footer.tag = "FOOTER";
    footer.width = 120;
    footer.tagField = "field_id";
    footer.tagValue = "03";
    footer.fields = {FieldSpec::text("field_id", 0, 2), FieldSpec::numeric("total_count", 2, 6),
                     FieldSpec::decimal("control_sum", 8, 12, 2),
                     FieldSpec::text("reserved", 20, 98)};

    AggregateSpec count;
    count.recordTag = "FOOTER";
    count.field = "total_count";
    count.function = AggregateSpec::Function::Count;
    count.sourceTag = "TRANSACTION";

    AggregateSpec sum;
    sum.recordTag = "FOOTER";
    sum.field = "control_sum";
    sum.function = AggregateSpec::Function::Sum;
    sum.sourceTag = "TRANSACTION";
    sum.sourceField = "amount";

    TransactionLayout txn;
    txn.recordTag = "TRANSACTION";
    txn.counterField = "counter";
    txn.amountField = "amount";
    txn.currencyField = "currency";
    txn.trailerTag = "FOOTER";

    std::error_code ec;
    auto schema = std::make_shared<Schema>(
        std::vector<RecordTypeSpec>{std::move(header), std::move(transaction), std::move(footer)},
        std::vector<AggregateSpec>{std::move(count), std::move(sum)}, std::move(txn), ec);
    if (ec) {
        FW_LOG_ERROR("built-in schema rejected: {}", schema->validationError());
        return nullptr;
    }
    return schema;
}

} // namespace FwFile
