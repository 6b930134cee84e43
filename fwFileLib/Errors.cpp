#include "fwfile/Errors.hpp"

namespace FwFile {

namespace {

class FwFileCategory : public std::error_category {
  public:
    const char* name() const noexcept override { return "fwfile"; }

    std::string message(int value) const override {
        switch (static_cast<Errc>(value)) {
        case Errc::InvalidSchema:
            return "invalid schema";
        case Errc::MalformedRecord:
            return "malformed record";
        case Errc::UnknownRecordType:
            return "unknown record type";
        case Errc::UnknownField:
            return "unknown field";
        case Errc::AmbiguousSelection:
            return "ambiguous selection";
        case Errc::RecordNotFound:
            return "record not found";
        case Errc::ValueTooLong:
            return "value too long";
        case Errc::SchemaMismatch:
            return "schema mismatch";
        case Errc::InvalidValue:
            return "invalid value";
        case Errc::AggregateMismatch:
            return "aggregate mismatch";
        }
        return "unknown fwfile error";
    }
};

} // namespace

const std::error_category& fwfileCategory() noexcept {
    static const FwFileCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return std::error_code(static_cast<int>(e), fwfileCategory());
}

} // namespace FwFile
