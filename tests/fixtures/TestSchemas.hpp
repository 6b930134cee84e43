#pragma once
/// @file TestSchemas.hpp
/// @brief Schemas and line builders shared by the test suites

#include <fwfile/fwfile.hpp>

#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace FwFileTest {

inline std::string padRight(const std::string& s, size_t n, char pad = ' ') {
    std::string out = s.substr(0, n);
    out.append(n - out.size(), pad);
    return out;
}

inline std::string padLeft(const std::string& s, size_t n, char pad = '0') {
    std::string out = s.substr(0, n);
    out.insert(0, n - out.size(), pad);
    return out;
}

/// @brief HEADER(40): tag[0,2)="HD" name[2,10) address[10,30) filler[30,40)
///        TRANSACTION(20): amount[0,10) decimal(2) currency[10,13)
///        transaction_counter[13,19) tag[19,20)="T"
inline std::shared_ptr<const FwFile::Schema> workedExampleSchema() {
    using FwFile::FieldSpec;

    FwFile::RecordTypeSpec header;
    header.tag = "HEADER";
    header.width = 40;
    header.tagField = "tag";
    header.tagValue = "HD";
    header.fields = {FieldSpec::text("tag", 0, 2), FieldSpec::text("name", 2, 8),
                     FieldSpec::text("address", 10, 20), FieldSpec::text("filler", 30, 10)};

    FwFile::RecordTypeSpec txn;
    txn.tag = "TRANSACTION";
    txn.width = 20;
    txn.tagField = "tag";
    txn.tagValue = "T";
    txn.selectorField = "transaction_counter";
    txn.fields = {FieldSpec::decimal("amount", 0, 10, 2), FieldSpec::text("currency", 10, 3),
                  FieldSpec::numeric("transaction_counter", 13, 6), FieldSpec::text("tag", 19, 1)};

    FwFile::TransactionLayout layout;
    layout.recordTag = "TRANSACTION";
    layout.counterField = "transaction_counter";
    layout.amountField = "amount";
    layout.currencyField = "currency";

    std::error_code ec;
    return std::make_shared<FwFile::Schema>(std::vector<FwFile::RecordTypeSpec>{header, txn},
                                            std::vector<FwFile::AggregateSpec>{}, layout, ec);
}

inline std::string exampleHeader(const std::string& name, const std::string& address) {
    return "HD" + padRight(name, 8) + padRight(address, 20) + std::string(10, ' ');
}

/// @param amountUnits amount in cents, e.g. "1250" for 12.50
inline std::string exampleTxn(const std::string& amountUnits, const std::string& currency,
                              const std::string& counter) {
    return padLeft(amountUnits, 10) + padRight(currency, 3) + padLeft(counter, 6) + "T";
}

/// @brief Header plus transactions 000001..000003 (10.00 USD, 20.00 EUR, 30.00 USD)
inline std::string exampleFileBytes() {
    return exampleHeader("ACME", "1 Main St") + "\n" + exampleTxn("1000", "USD", "1") + "\n" +
           exampleTxn("2000", "EUR", "2") + "\n" + exampleTxn("3000", "USD", "3") + "\n";
}

inline std::string bankHeader(const std::string& name, const std::string& surname) {
    return "01" + padRight(name, 28) + padRight(surname, 30) + padRight("", 30) +
           padRight("", 28) + "  ";
}

/// @param amountUnits amount in cents
inline std::string bankTxn(const std::string& counter, const std::string& amountUnits,
                           const std::string& currency) {
    return "02" + padLeft(counter, 6) + padLeft(amountUnits, 12) + padRight(currency, 3) +
           std::string(95, ' ') + "  ";
}

inline std::string bankFooter(const std::string& count, const std::string& sumUnits) {
    return "03" + padLeft(count, 6) + padLeft(sumUnits, 12) + std::string(98, ' ') + "  ";
}

inline void writeFile(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << bytes;
}

inline std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace FwFileTest
