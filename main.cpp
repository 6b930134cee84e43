#include "fwfile/fwfile.hpp"

#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/format.h>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 64;
constexpr int kExitIo = 74;
constexpr int kDomainBase = 10;

const char* kUsage =
    "usage: fwedit [--schema FILE] [--crlf] [--log-level LEVEL] <command> ...\n"
    "\n"
    "commands:\n"
    "  get <file> <type_tag> <field> [--selector VALUE]\n"
    "  set <file> <type_tag> <field> <value> [--selector VALUE]\n"
    "  add <file> <amount> <currency>\n"
    "  verify <file>\n"
    "  recompute <file>\n"
    "  dump <file>\n"
    "  schema\n"
    "\n"
    "options:\n"
    "  --schema FILE          schema file (default: built-in 120-byte bank layout)\n"
    "  --crlf                 lines end with \\r\\n instead of \\n\n"
    "  --log-level LEVEL      trace|debug|info|warn|error|off (default: warn)\n"
    "  --selector VALUE       picks one record by its selector field\n"
    "  --transaction_counter VALUE\n"
    "                         same as --selector\n"
    "\n"
    "exit codes: 0 ok, 64 usage, 74 i/o, 11-20 data errors (10 + error number);\n"
    "            verify exits 19 for rejected stored values, 20 for stale aggregates\n";

struct Options {
    std::string schemaPath;
    FwFile::LineTerminator terminator = FwFile::LineTerminator::Lf;
    std::optional<std::string> selector;
    std::vector<std::string> args; ///< command followed by its positional arguments
};

int usage(const std::string& message) {
    if (!message.empty())
        fmt::print(stderr, "fwedit: {}\n", message);
    fmt::print(stderr, "{}", kUsage);
    return kExitUsage;
}

/// @brief fwfile errors -> 10 + value, anything from the OS -> 74
int exitCodeFor(const std::error_code& ec) {
    if (!ec)
        return kExitOk;
    if (ec.category() == FwFile::fwfileCategory())
        return kDomainBase + ec.value();
    return kExitIo;
}

int report(const std::error_code& ec, const std::string& detail) {
    FW_LOG_DEBUG("exit on {} error {}", ec.category().name(), ec.value());
    fmt::print(stderr, "fwedit: {}{}{}\n", ec.message(), detail.empty() ? "" : ": ", detail);
    return exitCodeFor(ec);
}

/// @return -1 on success, else the exit code to return
int parseArgs(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        auto value = [&](std::string& out) {
            if (i + 1 >= argc)
                return false;
            out = argv[++i];
            return true;
        };

        if (a == "-h" || a == "--help") {
            fmt::print("{}", kUsage);
            return kExitOk;
        } else if (a == "--schema") {
            if (!value(opt.schemaPath))
                return usage("--schema needs a file");
        } else if (a == "--crlf") {
            opt.terminator = FwFile::LineTerminator::CrLf;
        } else if (a == "--log-level") {
            std::string text;
            FwFile::Logger::Level level = FwFile::Logger::Level::Warn;
            if (!value(text) || !FwFile::Logger::parseLevel(text, level))
                return usage("--log-level needs one of trace|debug|info|warn|error|off");
            FwFile::Logger::instance().setLevel(level);
        } else if (a == "--selector" || a == "--transaction_counter") {
            std::string text;
            if (!value(text))
                return usage(a + " needs a value");
            opt.selector = std::move(text);
        } else if (a.size() > 1 && a[0] == '-' && a[1] == '-') {
            return usage("unknown option " + a);
        } else {
            opt.args.push_back(std::move(a));
        }
    }
    if (opt.args.empty())
        return usage("missing command");
    return -1;
}

std::shared_ptr<const FwFile::Schema> loadSchema(const Options& opt, std::error_code& ec,
                                                 std::string& detail) {
    if (opt.schemaPath.empty()) {
        auto schema = FwFile::defaultSchema();
        if (!schema)
            ec = FwFile::Errc::InvalidSchema;
        return schema;
    }
    FwFile::SchemaLoader loader;
    auto schema = loader.loadFile(opt.schemaPath, ec);
    if (!schema)
        detail = loader.lastError();
    return schema;
}

int cmdDump(FwFile::FileTransaction& txn) {
    std::error_code ec;
    FwFile::FixedWidthFile file;
    if (!txn.load(file, ec))
        return report(ec, txn.lastError());

    FwFile::FieldAccessor acc(file);
    const auto& records = file.records();
    for (size_t i = 0; i < records.size(); ++i) {
        const auto* type = file.schema().findRecordType(records[i].typeTag, ec);
        if (!type)
            return report(ec, records[i].typeTag);
        fmt::print("#{} {}\n", i + 1, type->tag);
        for (const auto& f : type->fields) {
            std::error_code fec;
            auto value = acc.getAt(i, f.name, fec);
            if (value) {
                fmt::print("  {:<16} [{:>3},{:>3}) '{}'\n", f.name, f.offset, f.end(), *value);
            } else {
                fmt::print("  {:<16} [{:>3},{:>3}) <{}> '{}'\n", f.name, f.offset, f.end(),
                           fec.message(), records[i].raw.substr(f.offset, f.length));
            }
        }
    }
    return kExitOk;
}

int cmdVerify(FwFile::FileTransaction& txn) {
    std::error_code ec;
    auto mismatches = txn.verify(ec);
    if (ec)
        return report(ec, txn.lastError());
    auto violations = txn.checkValues(ec);
    if (ec)
        return report(ec, txn.lastError());
    for (const auto& v : violations) {
        fmt::print("record {} {}.{}: stored '{}', {}\n", v.recordIndex + 1, v.recordTag, v.field,
                   v.stored, v.reason);
    }
    for (const auto& m : mismatches) {
        fmt::print("record {} {}.{}: stored '{}', expected '{}'\n", m.recordIndex + 1,
                   m.recordTag, m.field, m.stored, m.expected);
    }
    // 잘못 저장된 값이 집계 불일치보다 우선한다.
    if (!violations.empty()) {
        std::error_code invalid = FwFile::Errc::InvalidValue;
        return report(invalid, fmt::format("{} stored value(s) rejected by the schema",
                                           violations.size()));
    }
    if (!mismatches.empty()) {
        std::error_code mismatch = FwFile::Errc::AggregateMismatch;
        return report(mismatch, fmt::format("{} aggregate field(s) disagree with the records",
                                            mismatches.size()));
    }
    fmt::print("ok\n");
    return kExitOk;
}

int run(const Options& opt) {
    const std::string& cmd = opt.args[0];
    const size_t argc = opt.args.size() - 1;

    std::error_code ec;
    std::string detail;
    auto schema = loadSchema(opt, ec, detail);
    if (!schema)
        return report(ec, detail);

    if (cmd == "schema") {
        if (argc != 0)
            return usage("schema takes no arguments");
        fmt::print("{}", FwFile::SchemaLoader::format(*schema));
        return kExitOk;
    }

    auto expect = [&](size_t n, const char* shape) {
        return argc == n ? -1 : usage(std::string("usage: ") + shape);
    };
    if (cmd != "get" && cmd != "set" && cmd != "add" && cmd != "verify" && cmd != "recompute" &&
        cmd != "dump")
        return usage("unknown command '" + cmd + "'");
    if (argc < 1)
        return usage(cmd + " needs a file");

    FwFile::FileTransaction txn(opt.args[1], schema, opt.terminator);

    if (cmd == "get") {
        int rc = expect(3, "get <file> <type_tag> <field> [--selector VALUE]");
        if (rc >= 0)
            return rc;
        auto value = txn.get(opt.args[2], opt.args[3], opt.selector, ec);
        if (!value)
            return report(ec, txn.lastError());
        fmt::print("{}\n", *value);
        return kExitOk;
    }
    if (cmd == "set") {
        int rc = expect(4, "set <file> <type_tag> <field> <value> [--selector VALUE]");
        if (rc >= 0)
            return rc;
        if (!txn.set(opt.args[2], opt.args[3], opt.args[4], opt.selector, ec))
            return report(ec, txn.lastError());
        return kExitOk;
    }
    if (cmd == "add") {
        int rc = expect(3, "add <file> <amount> <currency>");
        if (rc >= 0)
            return rc;
        auto counter = txn.add(opt.args[2], opt.args[3], ec);
        if (!counter)
            return report(ec, txn.lastError());
        fmt::print("{}\n", *counter);
        return kExitOk;
    }

    int rc = expect(1, "verify|recompute|dump <file>");
    if (rc >= 0)
        return rc;
    if (cmd == "verify")
        return cmdVerify(txn);
    if (cmd == "recompute") {
        if (!txn.recomputeAggregates(ec))
            return report(ec, txn.lastError());
        return kExitOk;
    }
    return cmdDump(txn);
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    int rc = parseArgs(argc, argv, opt);
    if (rc >= 0)
        return rc;
    return run(opt);
}
