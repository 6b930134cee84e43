#include "fwfile/codec/Codec.hpp"

#include "fwfile/Errors.hpp"
#include "fwfile/util/Logger.hpp"

#include <utility>

namespace FwFile {

namespace {

std::string printable(std::string_view bytes) {
    std::string out;
    for (char c : bytes) {
        unsigned char u = static_cast<unsigned char>(c);
        if (u < 0x20 || u == 0x7f) {
            static const char hex[] = "0123456789abcdef";
            out += "\\x";
            out += hex[u >> 4];
            out += hex[u & 0xf];
        } else {
            out.push_back(c);
        }
    }
    return out;
}

std::string widthList(const Schema& schema) {
    std::string out;
    for (const auto& t : schema.recordTypes()) {
        if (!out.empty())
            out += ", ";
        out += t.tag + "=" + std::to_string(t.width);
    }
    return out;
}

} // namespace

Codec::Codec(std::shared_ptr<const Schema> schema, LineTerminator terminator)
    : schema_(std::move(schema)), terminator_(terminator == LineTerminator::CrLf ? "\r\n" : "\n") {}

bool Codec::decode(std::string_view bytes, FixedWidthFile& out, std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    errorLine_ = 0;

    FixedWidthFile file(schema_);
    file.setFinalTerminator(true);
    if (bytes.empty()) {
        out = std::move(file);
        return true;
    }

    // 마지막 줄의 terminator 유무를 기억해야 encode 결과가 원본과 바이트 단위로 같아진다.
    size_t pos = 0;
    size_t lineNo = 0;
    while (pos < bytes.size()) {
        ++lineNo;
        size_t next = bytes.find(terminator_, pos);
        std::string_view line;
        if (next == std::string_view::npos) {
            line = bytes.substr(pos);
            pos = bytes.size();
            file.setFinalTerminator(false);
        } else {
            line = bytes.substr(pos, next - pos);
            pos = next + terminator_.size();
        }

        const RecordTypeSpec* type = schema_->matchLine(line);
        if (!type) {
            if (!schema_->hasWidth(line.size())) {
                return fail(ec, lineNo, "line " + std::to_string(lineNo) + ": length " +
                                    std::to_string(line.size()) +
                                    " matches no record type (widths: " + widthList(*schema_) +
                                    ")");
            }
            return fail(ec, lineNo, "line " + std::to_string(lineNo) + ": tag bytes of '" +
                                printable(line.substr(0, 16)) +
                                "' match no record type of width " +
                                std::to_string(line.size()));
        }
        file.records().push_back(Record{type->tag, std::string(line)});
    }

    FW_LOG_DEBUG("decoded {} records ({} bytes)", file.records().size(), bytes.size());
    out = std::move(file);
    return true;
}

bool Codec::encode(const FixedWidthFile& file, std::string& out, std::error_code& ec) {
    ec.clear();
    lastError_.clear();
    errorLine_ = 0;

    std::string buf;
    const auto& records = file.records();
    for (size_t i = 0; i < records.size(); ++i) {
        const Record& r = records[i];
        std::error_code lookup;
        const RecordTypeSpec* type = schema_->findRecordType(r.typeTag, lookup);
        if (!type) {
            return fail(ec, i + 1, "record " + std::to_string(i + 1) + ": unknown record type '" +
                                r.typeTag + "'");
        }
        if (r.raw.size() != type->width) {
            return fail(ec, i + 1, "record " + std::to_string(i + 1) + " (" + r.typeTag + "): size " +
                                std::to_string(r.raw.size()) + ", expected " +
                                std::to_string(type->width));
        }
        buf += r.raw;
        if (i + 1 < records.size() || file.finalTerminator())
            buf += terminator_;
    }
    out = std::move(buf);
    return true;
}

bool Codec::fail(std::error_code& ec, size_t line, std::string detail) {
    errorLine_ = line;
    lastError_ = std::move(detail);
    ec = make_error_code(Errc::MalformedRecord);
    FW_LOG_DEBUG("codec: {}", lastError_);
    return false;
}

} // namespace FwFile
