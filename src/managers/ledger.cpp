#include "ledger.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <platform/platform.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <map>

Ledger::Ledger(const fs::path& state_dir)
    : state_dir_(state_dir),
      uploaded_path_(state_dir / UPLOADED_CSV),
      skipped_path_(state_dir / SKIPPED_CSV) {
}

const std::vector<std::string>& Ledger::uploaded_columns() {
    static const std::vector<std::string> cols = {
        "original_path", "filename_at_upload", "size_bytes",
        "last_modified_timestamp_source", "upload_timestamp_utc",
        "metadata_sent_json", "upload_status"
    };
    return cols;
}

const std::vector<std::string>& Ledger::skipped_columns() {
    static const std::vector<std::string> cols = {
        "file_path", "reason_skipped", "size_bytes",
        "last_modified_timestamp_source", "log_timestamp_utc"
    };
    return cols;
}

// ── CSV ────────────────────────────────────────────────────

std::string Ledger::csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string Ledger::csv_row(const std::vector<std::string>& fields) {
    std::string row;
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) row += ',';
        row += csv_escape(fields[i]);
    }
    row += '\n';
    return row;
}

std::vector<std::vector<std::string>> Ledger::parse_csv(const std::string& content,
                                                       size_t& complete_len) {
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool in_quotes = false;
    complete_len = 0;

    for (size_t i = 0; i < content.size(); ++i) {
        char c = content[i];

        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < content.size() && content[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            row.push_back(field);
            field.clear();
        } else if (c == '\r') {
            // CRLF: the '\n' terminates the row
        } else if (c == '\n') {
            row.push_back(field);
            field.clear();
            rows.push_back(row);
            row.clear();
            complete_len = i + 1;
        } else {
            field += c;
        }
    }

    return rows;
}

// ── Load ───────────────────────────────────────────────────

void Ledger::ensure_file(const fs::path& path, const std::vector<std::string>& columns) {
    std::error_code ec;
    if (fs::exists(path, ec)) {
        if (!fs::is_regular_file(path, ec)) {
            throw LedgerWriteError("Ledger path is not a regular file: " + path.string());
        }
        if (fs::file_size(path, ec) > 0) return;
    }

    std::string err;
    if (!platform::durable_append(path, csv_row(columns), err)) {
        throw LedgerWriteError(fmt::format("Cannot create ledger file {}: {}", path.string(), err));
    }
}

static std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw LedgerError("Cannot read ledger file " + path.string());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Header name -> column index, verifying that every required column is present.
static std::map<std::string, size_t> map_header(const fs::path& path,
                                                const std::vector<std::string>& header,
                                                const std::vector<std::string>& required) {
    std::map<std::string, size_t> idx;
    for (size_t i = 0; i < header.size(); ++i) {
        idx[header[i]] = i;
    }
    for (const auto& col : required) {
        if (idx.find(col) == idx.end()) {
            throw LedgerError(fmt::format("Ledger file {} is missing column '{}'", path.string(), col));
        }
    }
    return idx;
}

static std::string cell(const std::vector<std::string>& row, size_t i) {
    return i < row.size() ? row[i] : "";
}

static int64_t to_int64(const std::string& s) {
    try {
        return static_cast<int64_t>(std::stoll(s));
    } catch (const std::exception&) {
        return 0;
    }
}

static double to_double(const std::string& s) {
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        return 0.0;
    }
}

// Parse a ledger file and cut it back to its last complete row, so the next
// append never lands inside a torn (possibly still quoted) field.
std::vector<std::vector<std::string>> Ledger::read_rows(const fs::path& path) {
    std::string content = read_file(path);
    size_t complete_len = 0;
    auto rows = parse_csv(content, complete_len);

    if (complete_len < content.size()) {
        log_warn(fmt::format("{} has an incomplete final row (interrupted write); discarding {} bytes",
                             path.string(), content.size() - complete_len));
        std::string err;
        if (!platform::durable_truncate(path, complete_len, err)) {
            throw LedgerWriteError(fmt::format("Cannot repair ledger {}: {}", path.string(), err));
        }
    }
    return rows;
}

void Ledger::read_uploaded() {
    auto rows = read_rows(uploaded_path_);
    if (rows.empty()) return;

    auto idx = map_header(uploaded_path_, rows[0], uploaded_columns());
    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (cell(row, idx["upload_status"]) != UPLOAD_STATUS_SUCCESS) continue;

        LedgerEntry e;
        e.path = cell(row, idx["original_path"]);
        if (e.path.empty()) continue;
        e.status = LedgerStatus::UPLOADED;
        e.filename_at_upload = cell(row, idx["filename_at_upload"]);
        e.size_bytes = to_int64(cell(row, idx["size_bytes"]));
        e.mtime = to_double(cell(row, idx["last_modified_timestamp_source"]));
        e.timestamp = cell(row, idx["upload_timestamp_utc"]);
        index_[e.path] = e;
    }
}

void Ledger::read_skipped() {
    auto rows = read_rows(skipped_path_);
    if (rows.empty()) return;

    auto idx = map_header(skipped_path_, rows[0], skipped_columns());
    for (size_t r = 1; r < rows.size(); ++r) {
        const auto& row = rows[r];
        LedgerEntry e;
        e.path = cell(row, idx["file_path"]);
        if (e.path.empty()) continue;
        e.status = LedgerStatus::SKIPPED;
        e.reason = cell(row, idx["reason_skipped"]);
        e.size_bytes = to_int64(cell(row, idx["size_bytes"]));
        e.mtime = to_double(cell(row, idx["last_modified_timestamp_source"]));
        e.timestamp = cell(row, idx["log_timestamp_utc"]);
        index_[e.path] = e;
    }
}

void Ledger::load() {
    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        throw LedgerWriteError(fmt::format("Cannot create state directory {}: {}",
                                           state_dir_.string(), ec.message()));
    }

    ensure_file(uploaded_path_, uploaded_columns());
    ensure_file(skipped_path_, skipped_columns());

    index_.clear();
    // Uploaded rows are read last so they win over a stray skipped row
    read_skipped();
    read_uploaded();

    // A header torn by a crash during creation leaves an empty file behind
    ensure_file(uploaded_path_, uploaded_columns());
    ensure_file(skipped_path_, skipped_columns());

    log_debug(fmt::format("Ledger loaded: {} uploaded, {} skipped",
                          uploaded_count(), skipped_count()));
}

// ── Queries ────────────────────────────────────────────────

bool Ledger::contains(const std::string& path) const {
    return index_.find(path) != index_.end();
}

std::optional<LedgerEntry> Ledger::find(const std::string& path) const {
    auto it = index_.find(path);
    if (it == index_.end()) return std::nullopt;
    return it->second;
}

size_t Ledger::uploaded_count() const {
    size_t n = 0;
    for (const auto& [path, e] : index_) {
        if (e.status == LedgerStatus::UPLOADED) n++;
    }
    return n;
}

size_t Ledger::skipped_count() const {
    return index_.size() - uploaded_count();
}

// ── Writes ─────────────────────────────────────────────────

void Ledger::append(const fs::path& path, const std::string& row) {
    std::string err;
    if (!platform::durable_append(path, row, err)) {
        throw LedgerWriteError(fmt::format("Failed to write ledger {}: {}", path.string(), err));
    }
}

void Ledger::record_uploaded(const FileRecord& file,
                             const std::string& filename_at_upload,
                             const Metadata& metadata_sent) {
    auto existing = find(file.path);
    if (existing && existing->status == LedgerStatus::UPLOADED) {
        log_warn(fmt::format("{} is already recorded as uploaded; not writing a second row", file.path));
        return;
    }

    nlohmann::json meta_json = nlohmann::json::object();
    for (const auto& [k, v] : metadata_sent) {
        meta_json[k] = v;
    }

    LedgerEntry e;
    e.path = file.path;
    e.status = LedgerStatus::UPLOADED;
    e.size_bytes = file.size_bytes;
    e.mtime = file.mtime;
    e.filename_at_upload = filename_at_upload;
    e.timestamp = now_iso_utc();

    append(uploaded_path_, csv_row({
        e.path,
        e.filename_at_upload,
        std::to_string(e.size_bytes),
        fmt::format("{}", e.mtime),
        e.timestamp,
        meta_json.dump(),
        UPLOAD_STATUS_SUCCESS,
    }));

    index_[e.path] = e;
}

void Ledger::record_skipped(const FileRecord& file, const std::string& reason) {
    LedgerEntry e;
    e.path = file.path;
    e.status = LedgerStatus::SKIPPED;
    e.reason = reason;
    e.size_bytes = file.size_bytes;
    e.mtime = file.mtime;
    e.timestamp = now_iso_utc();

    append(skipped_path_, csv_row({
        e.path,
        e.reason,
        std::to_string(e.size_bytes),
        fmt::format("{}", e.mtime),
        e.timestamp,
    }));

    // An existing uploaded entry stays authoritative for membership
    auto it = index_.find(e.path);
    if (it == index_.end() || it->second.status != LedgerStatus::UPLOADED) {
        index_[e.path] = e;
    }
}
