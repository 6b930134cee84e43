#include "fwfile/codec/FieldCodec.hpp"

#include "fwfile/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace FwFile {

namespace {

bool allDigits(std::string_view s) noexcept {
    return std::all_of(s.begin(), s.end(),
                       [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

std::string_view trimSpaces(std::string_view s) noexcept {
    while (!s.empty() && s.front() == ' ')
        s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ')
        s.remove_suffix(1);
    return s;
}

bool takeSign(std::string_view& s) noexcept {
    if (!s.empty() && (s.front() == '+' || s.front() == '-')) {
        bool negative = s.front() == '-';
        s.remove_prefix(1);
        return negative;
    }
    return false;
}

std::string stripLeadingZeros(std::string_view digits) {
    size_t i = 0;
    while (i + 1 < digits.size() && digits[i] == '0')
        ++i;
    std::string out(digits.substr(i));
    return out.empty() ? std::string("0") : out;
}

void finish(Decimal& d, bool negative, std::string_view units, unsigned scale) {
    d.units = stripLeadingZeros(units);
    d.scale = scale;
    // -0 은 0 으로 정규화해 get/set 왕복 결과가 하나로 수렴하게 한다.
    d.negative = negative && !d.isZero();
}

std::string pad(const FieldSpec& spec, std::string_view value) {
    std::string out;
    out.reserve(spec.length);
    if (spec.justify == Justify::Left) {
        out.assign(value);
        out.append(spec.length - value.size(), spec.padChar);
    } else {
        out.assign(spec.length - value.size(), spec.padChar);
        out.append(value);
    }
    return out;
}

} // namespace

bool Decimal::parse(std::string_view text, unsigned scale, Decimal& out, std::error_code& ec) {
    ec.clear();
    std::string_view s = trimSpaces(text);
    bool negative = takeSign(s);

    std::string_view intPart = s;
    std::string_view fracPart;
    size_t dot = s.find('.');
    if (dot != std::string_view::npos) {
        intPart = s.substr(0, dot);
        fracPart = s.substr(dot + 1);
    }
    if ((intPart.empty() && fracPart.empty()) || !allDigits(intPart) || !allDigits(fracPart)) {
        ec = make_error_code(Errc::InvalidValue);
        return false;
    }

    // scale을 넘는 소수 자리는 0일 때만 허용한다 (값 손실 금지).
    if (fracPart.size() > scale) {
        if (fracPart.substr(scale).find_first_not_of('0') != std::string_view::npos) {
            ec = make_error_code(Errc::InvalidValue);
            return false;
        }
        fracPart = fracPart.substr(0, scale);
    }

    std::string units(intPart);
    units.append(fracPart);
    units.append(scale - fracPart.size(), '0');
    finish(out, negative, units, scale);
    return true;
}

bool Decimal::parseImplied(std::string_view text, unsigned scale, Decimal& out,
                           std::error_code& ec) {
    ec.clear();
    std::string_view s = trimSpaces(text);
    bool negative = takeSign(s);
    if (s.empty() || !allDigits(s)) {
        ec = make_error_code(Errc::InvalidValue);
        return false;
    }
    finish(out, negative, s, scale);
    return true;
}

Decimal Decimal::fromUnits(int64_t units, unsigned scale) {
    Decimal d;
    d.scale = scale;
    d.negative = units < 0;
    uint64_t absVal = d.negative ? static_cast<uint64_t>(-(units + 1)) + 1
                                 : static_cast<uint64_t>(units);
    d.units = std::to_string(absVal);
    return d;
}

std::string Decimal::toString() const {
    std::string out = negative ? "-" : "";
    if (scale == 0)
        return out + units;
    std::string digits = units;
    if (digits.size() < scale + 1)
        digits.insert(0, scale + 1 - digits.size(), '0');
    digits.insert(digits.size() - scale, 1, '.');
    return out + digits;
}

std::string Decimal::toImpliedString() const {
    return negative ? "-" + units : units;
}

bool Decimal::toUnits(int64_t& out, std::error_code& ec) const {
    ec.clear();
    const uint64_t limit = negative
                               ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                               : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    uint64_t acc = 0;
    for (char c : units) {
        uint64_t digit = static_cast<uint64_t>(c - '0');
        if (acc > (limit - digit) / 10) {
            ec = make_error_code(Errc::InvalidValue);
            return false;
        }
        acc = acc * 10 + digit;
    }
    out = negative ? static_cast<int64_t>(0 - acc) : static_cast<int64_t>(acc);
    return true;
}

std::string_view stripPadding(const FieldSpec& spec, std::string_view bytes) noexcept {
    if (spec.justify == Justify::Right) {
        while (!bytes.empty() && bytes.front() == spec.padChar)
            bytes.remove_prefix(1);
    } else {
        while (!bytes.empty() && bytes.back() == spec.padChar)
            bytes.remove_suffix(1);
    }
    if (spec.isNumber())
        bytes = trimSpaces(bytes);
    return bytes;
}

bool decodeField(const FieldSpec& spec, std::string_view bytes, std::string& out,
                 std::error_code& ec) {
    ec.clear();
    std::string_view v = stripPadding(spec, bytes);
    if (spec.kind == FieldKind::Text) {
        out.assign(v);
        return true;
    }

    Decimal d;
    d.scale = spec.kind == FieldKind::Decimal ? spec.scale : 0;
    if (!v.empty()) {
        bool ok = (spec.kind == FieldKind::Decimal && !spec.impliedDecimal)
                      ? Decimal::parse(v, d.scale, d, ec)
                      : Decimal::parseImplied(v, d.scale, d, ec);
        if (!ok)
            return false;
    }
    out = d.toString();
    return true;
}

bool encodeField(const FieldSpec& spec, std::string_view value, std::string& out,
                 std::error_code& ec) {
    ec.clear();
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        ec = make_error_code(Errc::InvalidValue);
        return false;
    }

    if (spec.kind == FieldKind::Text) {
        if (!spec.allowedValues.empty() &&
            std::find(spec.allowedValues.begin(), spec.allowedValues.end(), value) ==
                spec.allowedValues.end()) {
            ec = make_error_code(Errc::InvalidValue);
            return false;
        }
        if (value.size() > spec.length) {
            ec = make_error_code(Errc::ValueTooLong);
            return false;
        }
        out = pad(spec, value);
        return true;
    }

    Decimal d;
    unsigned scale = spec.kind == FieldKind::Decimal ? spec.scale : 0;
    if (!Decimal::parse(value, scale, d, ec))
        return false;

    std::string body = (spec.kind == FieldKind::Decimal && !spec.impliedDecimal)
                           ? d.toString()
                           : d.toImpliedString();

    // zero-fill 우측 정렬 음수는 부호를 맨 앞에 둔다: -0000042
    if (d.negative && spec.padChar == '0' && spec.justify == Justify::Right) {
        std::string_view digits = std::string_view(body).substr(1);
        if (digits.size() + 1 > spec.length) {
            ec = make_error_code(Errc::ValueTooLong);
            return false;
        }
        out = "-" + std::string(spec.length - 1 - digits.size(), '0') + std::string(digits);
        return true;
    }

    if (body.size() > spec.length) {
        ec = make_error_code(Errc::ValueTooLong);
        return false;
    }
    out = pad(spec, body);
    return true;
}

bool canonicalValue(const FieldSpec& spec, std::string_view value, std::string& out,
                    std::error_code& ec) {
    std::string bytes;
    if (!encodeField(spec, value, bytes, ec))
        return false;
    return decodeField(spec, bytes, out, ec);
}

} // namespace FwFile
