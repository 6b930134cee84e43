#include "fwfile/repository/FileTransaction.hpp"

#include "fwfile/Errors.hpp"
#include "fwfile/access/FieldAccessor.hpp"
#include "fwfile/util/FileIo.hpp"
#include "fwfile/util/Logger.hpp"

#include <utility>

namespace FwFile {

FileTransaction::FileTransaction(std::string path, std::shared_ptr<const Schema> schema,
                                 LineTerminator terminator)
    : path_(std::move(path)), codec_(std::move(schema), terminator) {}

bool FileTransaction::load(FixedWidthFile& out, std::error_code& ec) {
    ec.clear();
    lastError_.clear();

    std::string bytes;
    if (!util::readWholeFile(path_, bytes, ec))
        return fail(ec, ec, "cannot read " + path_);
    if (!codec_.decode(bytes, out, ec))
        return fail(ec, ec, path_ + ": " + codec_.lastError());
    FW_LOG_DEBUG("loaded {} ({} records, {} bytes)", path_, out.records().size(), bytes.size());
    return true;
}

std::optional<std::string> FileTransaction::get(const std::string& typeTag,
                                                const std::string& fieldName,
                                                const std::optional<std::string>& selector,
                                                std::error_code& ec) {
    FixedWidthFile file;
    if (!load(file, ec))
        return std::nullopt;
    FieldAccessor acc(file);
    auto value = acc.get(typeTag, fieldName, selector, ec);
    if (!value) {
        fail(ec, ec, acc.lastError());
        return std::nullopt;
    }
    return value;
}

bool FileTransaction::set(const std::string& typeTag, const std::string& fieldName,
                          const std::string& value, const std::optional<std::string>& selector,
                          std::error_code& ec) {
    std::string detail;
    bool ok = apply(
        [&](FixedWidthFile& file, std::error_code& mec) {
            FieldAccessor acc(file);
            if (!acc.set(typeTag, fieldName, value, selector, mec)) {
                detail = acc.lastError();
                return false;
            }
            return true;
        },
        ec);
    if (!ok && !detail.empty())
        lastError_ = detail;
    return ok;
}

std::optional<std::string> FileTransaction::add(const std::string& amount,
                                                const std::string& currency,
                                                std::error_code& ec) {
    std::optional<std::string> counter;
    std::string detail;
    bool ok = apply(
        [&](FixedWidthFile& file, std::error_code& mec) {
            TransactionAppender appender(file);
            counter = appender.add(amount, currency, mec);
            if (!counter) {
                detail = appender.lastError();
                return false;
            }
            return true;
        },
        ec);
    if (!ok) {
        if (!detail.empty())
            lastError_ = detail;
        return std::nullopt;
    }
    return counter;
}

bool FileTransaction::recomputeAggregates(std::error_code& ec) {
    std::string detail;
    bool ok = apply(
        [&](FixedWidthFile& file, std::error_code& mec) {
            TransactionAppender appender(file);
            if (!appender.recomputeAggregates(mec)) {
                detail = appender.lastError();
                return false;
            }
            return true;
        },
        ec);
    if (!ok && !detail.empty())
        lastError_ = detail;
    return ok;
}

std::vector<AggregateMismatch> FileTransaction::verify(std::error_code& ec) {
    FixedWidthFile file;
    if (!load(file, ec))
        return {};
    TransactionAppender appender(file);
    auto result = appender.verify(ec);
    if (ec) {
        fail(ec, ec, appender.lastError());
        return {};
    }
    return result;
}

std::vector<ValueViolation> FileTransaction::checkValues(std::error_code& ec) {
    FixedWidthFile file;
    if (!load(file, ec))
        return {};
    return TransactionAppender(file).checkValues();
}

bool FileTransaction::apply(const Mutation& mutation, std::error_code& ec) {
    FixedWidthFile file;
    if (!load(file, ec))
        return false;

    if (!mutation(file, ec)) {
        if (!ec)
            ec = make_error_code(Errc::InvalidValue);
        return fail(ec, ec, "mutation rejected");
    }

    std::string bytes;
    if (!codec_.encode(file, bytes, ec))
        return fail(ec, ec, path_ + ": " + codec_.lastError());

    // 여기까지 실패하면 파일은 한 바이트도 바뀌지 않는다.
    if (!util::atomicWriteFile(path_, bytes, ec))
        return fail(ec, ec, "cannot replace " + path_);

    FW_LOG_INFO("wrote {} ({} records, {} bytes)", path_, file.records().size(), bytes.size());
    return true;
}

bool FileTransaction::fail(std::error_code& ec, std::error_code code, std::string detail) {
    lastError_ = std::move(detail);
    ec = code;
    FW_LOG_DEBUG("file transaction: {}: {}", ec.message(), lastError_);
    return false;
}

} // namespace FwFile
