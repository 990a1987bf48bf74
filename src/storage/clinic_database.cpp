/**
 * @file clinic_database.cpp
 * @brief Implementation of the clinic records database
 */

#include <dental/storage/clinic_database.hpp>

#include <dental/compat/format.hpp>

#include <sqlite3.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <unordered_map>
#include <utility>
#include <variant>

namespace dental::storage {

// Use common_system's result helpers
using kcenon::common::make_error;
using kcenon::common::ok;

using namespace dental::error_codes;

// ============================================================================
// Helper Functions
// ============================================================================

namespace {

/// Current schema version written on creation
constexpr int schema_version_current = 1;

constexpr const char* schema_sql = R"(
    CREATE TABLE IF NOT EXISTS schema_version (
        version     INTEGER PRIMARY KEY,
        description TEXT NOT NULL,
        applied_at  TEXT NOT NULL DEFAULT (datetime('now'))
    );

    CREATE TABLE IF NOT EXISTS patients (
        patient_pk     INTEGER PRIMARY KEY AUTOINCREMENT,
        patient_name   TEXT NOT NULL CHECK (length(patient_name) > 0),
        phone_number   TEXT NOT NULL UNIQUE,
        treatment_type TEXT,
        teeth_location TEXT,
        created_at     TEXT NOT NULL DEFAULT (datetime('now')),
        updated_at     TEXT NOT NULL DEFAULT (datetime('now'))
    );

    CREATE INDEX IF NOT EXISTS idx_patients_phone ON patients(phone_number);

    CREATE TABLE IF NOT EXISTS appointments (
        appointment_pk   INTEGER PRIMARY KEY AUTOINCREMENT,
        patient_pk       INTEGER NOT NULL REFERENCES patients(patient_pk),
        appointment_date TEXT NOT NULL,
        treatment_type   TEXT NOT NULL CHECK (length(treatment_type) > 0),
        dentist          TEXT NOT NULL CHECK (length(dentist) > 0),
        fee              REAL CHECK (fee IS NULL OR fee >= 0),
        notes            TEXT,
        created_at       TEXT NOT NULL DEFAULT (datetime('now'))
    );

    CREATE INDEX IF NOT EXISTS idx_appointments_patient
        ON appointments(patient_pk);
    CREATE INDEX IF NOT EXISTS idx_appointments_date
        ON appointments(appointment_date);

    INSERT OR IGNORE INTO schema_version (version, description)
        VALUES (1, 'Initial clinic schema');
)";

constexpr const char* patient_columns =
    "patient_pk, patient_name, phone_number, treatment_type, teeth_location, "
    "created_at, updated_at";

constexpr const char* appointment_columns =
    "appointment_pk, patient_pk, appointment_date, treatment_type, dentist, "
    "fee, notes, created_at";

/**
 * @brief Parse a SQLite datetime('now') value (UTC) to time_point
 */
auto parse_timestamp(const char* str) -> std::chrono::system_clock::time_point {
    if (!str || *str == '\0') {
        return {};
    }
    std::tm tm{};
    if (std::sscanf(str, "%d-%d-%d %d:%d:%d", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return {};
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
#ifdef _WIN32
    auto time = _mkgmtime(&tm);
#else
    auto time = timegm(&tm);
#endif
    return std::chrono::system_clock::from_time_t(time);
}

/**
 * @brief Get text from statement column, returning empty string for NULL
 */
auto get_text(sqlite3_stmt* stmt, int col) -> std::string {
    const auto* text =
        reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string{};
}

void bind_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    // A null data pointer would bind NULL instead of ''
    const char* data = value.data() ? value.data() : "";
    sqlite3_bind_text(stmt, idx, data, static_cast<int>(value.size()),
                      SQLITE_TRANSIENT);
}

void bind_optional_text(sqlite3_stmt* stmt, int idx, std::string_view value) {
    if (value.empty()) {
        sqlite3_bind_null(stmt, idx);
    } else {
        bind_text(stmt, idx, value);
    }
}

void bind_optional_double(sqlite3_stmt* stmt, int idx,
                          const std::optional<double>& value) {
    if (value.has_value()) {
        sqlite3_bind_double(stmt, idx, *value);
    } else {
        sqlite3_bind_null(stmt, idx);
    }
}

/**
 * @brief Map a SQLite result code onto a store error code
 */
auto to_store_error_code(int rc) -> int {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        return database_constraint_error;
    }
    return database_query_error;
}

}  // namespace

// ============================================================================
// Construction / Destruction
// ============================================================================

auto clinic_database::open(std::string_view db_path)
    -> Result<std::unique_ptr<clinic_database>> {
    return open(db_path, database_config{});
}

auto clinic_database::open(std::string_view db_path,
                           const database_config& config)
    -> Result<std::unique_ptr<clinic_database>> {
    sqlite3* db = nullptr;

    auto rc = sqlite3_open(std::string(db_path).c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string error_msg =
            db ? sqlite3_errmsg(db) : "Failed to allocate memory";
        if (db) {
            sqlite3_close(db);
        }
        return make_error<std::unique_ptr<clinic_database>>(
            database_open_error,
            compat::format("Failed to open database: {}", error_msg),
            "storage");
    }

    // Enable foreign keys
    rc = sqlite3_exec(db, "PRAGMA foreign_keys = ON;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<clinic_database>>(
            database_open_error, "Failed to enable foreign keys", "storage");
    }

    if (config.wal_mode && db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode = WAL;", nullptr, nullptr,
                          nullptr);
        if (rc != SQLITE_OK) {
            sqlite3_close(db);
            return make_error<std::unique_ptr<clinic_database>>(
                database_open_error, "Failed to enable WAL mode", "storage");
        }
    }

    // Negative value means KB
    auto cache_sql = compat::format("PRAGMA cache_size = -{};",
                                    config.cache_size_mb * 1024);
    rc = sqlite3_exec(db, cache_sql.c_str(), nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<clinic_database>>(
            database_open_error, "Failed to set cache size", "storage");
    }

    // Commits must reach the disk before an operation reports success
    rc = sqlite3_exec(db, "PRAGMA synchronous = FULL;", nullptr, nullptr,
                      nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);
        return make_error<std::unique_ptr<clinic_database>>(
            database_open_error, "Failed to set synchronous mode", "storage");
    }

    sqlite3_busy_timeout(db, config.busy_timeout_ms);

    auto instance = std::unique_ptr<clinic_database>(
        new clinic_database(db, std::string(db_path)));

    auto schema_result = instance->initialize_schema();
    if (schema_result.is_err()) {
        return make_error<std::unique_ptr<clinic_database>>(
            database_schema_error,
            compat::format("Schema creation failed: {}",
                           schema_result.error().message),
            "storage");
    }

    return instance;
}

clinic_database::clinic_database(sqlite3* db, std::string path)
    : db_(db), path_(std::move(path)) {}

clinic_database::~clinic_database() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

clinic_database::clinic_database(clinic_database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)) {
    other.db_ = nullptr;
}

auto clinic_database::operator=(clinic_database&& other) noexcept
    -> clinic_database& {
    if (this != &other) {
        if (db_) {
            sqlite3_close(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        other.db_ = nullptr;
    }
    return *this;
}

auto clinic_database::initialize_schema() -> VoidResult {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return tx.begin_error();
    }

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db_, schema_sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return make_error<std::monostate>(database_schema_error, message,
                                          "storage");
    }

    return tx.commit();
}

// ============================================================================
// Patient Operations
// ============================================================================

auto clinic_database::find_patient_by_phone(std::string_view phone) const
    -> Result<std::optional<patient_record>> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<std::optional<patient_record>>(tx.begin_error().error());
    }

    auto result = query_patient_by_phone(phone);
    if (result.is_err()) {
        return result;
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<std::optional<patient_record>>(commit_result.error());
    }
    return result;
}

auto clinic_database::find_patient_by_pk(int64_t pk) const
    -> Result<std::optional<patient_record>> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<std::optional<patient_record>>(tx.begin_error().error());
    }

    auto result = query_patient_by_pk(pk);
    if (result.is_err()) {
        return result;
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<std::optional<patient_record>>(commit_result.error());
    }
    return result;
}

auto clinic_database::upsert_patient(std::string_view name,
                                     std::string_view phone,
                                     std::string_view treatment_type,
                                     std::string_view teeth_location)
    -> Result<patient_record> {
    if (name.empty()) {
        return make_error<patient_record>(missing_required_field,
                                          "Patient name is required", "storage");
    }
    if (phone.empty()) {
        return make_error<patient_record>(invalid_phone,
                                          "Phone number is required", "storage");
    }

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<patient_record>(tx.begin_error().error());
    }

    auto existing = query_patient_by_phone(phone);
    if (existing.is_err()) {
        return Result<patient_record>(existing.error());
    }

    int64_t pk = 0;
    sqlite3_stmt* stmt = nullptr;

    if (existing.value().has_value()) {
        pk = existing.value()->pk;

        const char* sql = R"(
            UPDATE patients
               SET patient_name = ?, treatment_type = ?, teeth_location = ?,
                   updated_at = datetime('now')
             WHERE patient_pk = ?;
        )";

        auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return Result<patient_record>(
                last_error(rc, "Failed to prepare patient update"));
        }

        bind_text(stmt, 1, name);
        bind_optional_text(stmt, 2, treatment_type);
        bind_optional_text(stmt, 3, teeth_location);
        sqlite3_bind_int64(stmt, 4, pk);

        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return Result<patient_record>(
                last_error(rc, "Failed to update patient"));
        }
    } else {
        const char* sql = R"(
            INSERT INTO patients (
                patient_name, phone_number, treatment_type, teeth_location
            ) VALUES (?, ?, ?, ?)
            RETURNING patient_pk;
        )";

        auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
        if (rc != SQLITE_OK) {
            return Result<patient_record>(
                last_error(rc, "Failed to prepare patient insert"));
        }

        bind_text(stmt, 1, name);
        bind_text(stmt, 2, phone);
        bind_optional_text(stmt, 3, treatment_type);
        bind_optional_text(stmt, 4, teeth_location);

        rc = sqlite3_step(stmt);
        if (rc != SQLITE_ROW) {
            auto error = last_error(rc, "Failed to insert patient");
            sqlite3_finalize(stmt);
            return Result<patient_record>(error);
        }
        pk = sqlite3_column_int64(stmt, 0);

        // Drive the statement to completion so the insert is finished
        rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return Result<patient_record>(
                last_error(rc, "Failed to insert patient"));
        }
    }

    auto stored = query_patient_by_pk(pk);
    if (stored.is_err()) {
        return Result<patient_record>(stored.error());
    }
    if (!stored.value().has_value()) {
        return make_error<patient_record>(database_query_error,
                                          "Stored patient could not be read back",
                                          "storage");
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<patient_record>(commit_result.error());
    }
    return std::move(*stored.value());
}

auto clinic_database::update_patient_fields(std::string_view phone,
                                            std::string_view name,
                                            std::string_view treatment_type,
                                            std::string_view teeth_location)
    -> Result<patient_record> {
    if (name.empty()) {
        return make_error<patient_record>(missing_required_field,
                                          "Patient name is required", "storage");
    }

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<patient_record>(tx.begin_error().error());
    }

    auto existing = query_patient_by_phone(phone);
    if (existing.is_err()) {
        return Result<patient_record>(existing.error());
    }
    if (!existing.value().has_value()) {
        return make_error<patient_record>(
            patient_not_found,
            compat::format("Patient with phone '{}' not found", phone),
            "storage");
    }

    const char* sql = R"(
        UPDATE patients
           SET patient_name = ?, treatment_type = ?, teeth_location = ?,
               updated_at = datetime('now')
         WHERE patient_pk = ?;
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<patient_record>(
            last_error(rc, "Failed to prepare patient update"));
    }

    auto pk = existing.value()->pk;
    bind_text(stmt, 1, name);
    bind_optional_text(stmt, 2, treatment_type);
    bind_optional_text(stmt, 3, teeth_location);
    sqlite3_bind_int64(stmt, 4, pk);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<patient_record>(last_error(rc, "Failed to update patient"));
    }

    auto stored = query_patient_by_pk(pk);
    if (stored.is_err()) {
        return Result<patient_record>(stored.error());
    }
    if (!stored.value().has_value()) {
        return make_error<patient_record>(database_query_error,
                                          "Updated patient could not be read back",
                                          "storage");
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<patient_record>(commit_result.error());
    }
    return std::move(*stored.value());
}

auto clinic_database::delete_patient_by_phone(std::string_view phone)
    -> Result<std::size_t> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<std::size_t>(tx.begin_error().error());
    }

    auto existing = query_patient_by_phone(phone);
    if (existing.is_err()) {
        return Result<std::size_t>(existing.error());
    }
    if (!existing.value().has_value()) {
        return make_error<std::size_t>(
            patient_not_found,
            compat::format("Patient with phone '{}' not found", phone),
            "storage");
    }
    auto pk = existing.value()->pk;

    // Children first, the foreign key forbids orphaned appointments
    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(
        db_, "DELETE FROM appointments WHERE patient_pk = ?;", -1, &stmt,
        nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::size_t>(
            last_error(rc, "Failed to prepare appointment delete"));
    }
    sqlite3_bind_int64(stmt, 1, pk);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::size_t>(
            last_error(rc, "Failed to delete appointments"));
    }
    auto removed = static_cast<std::size_t>(sqlite3_changes(db_));

    rc = sqlite3_prepare_v2(db_, "DELETE FROM patients WHERE patient_pk = ?;",
                            -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::size_t>(
            last_error(rc, "Failed to prepare patient delete"));
    }
    sqlite3_bind_int64(stmt, 1, pk);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::size_t>(last_error(rc, "Failed to delete patient"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<std::size_t>(commit_result.error());
    }
    return removed;
}

auto clinic_database::search_patients(std::string_view term) const
    -> Result<std::vector<patient_with_appointments>> {
    using result_type = Result<std::vector<patient_with_appointments>>;

    std::string filter;
    std::string pattern;
    if (!term.empty()) {
        pattern = to_contains_pattern(term);
        filter = R"(
            WHERE p.patient_name LIKE ?1 ESCAPE '\'
               OR p.phone_number LIKE ?1 ESCAPE '\'
               OR p.treatment_type LIKE ?1 ESCAPE '\'
               OR p.teeth_location LIKE ?1 ESCAPE '\'
               OR EXISTS (
                   SELECT 1 FROM appointments a
                    WHERE a.patient_pk = p.patient_pk
                      AND a.treatment_type LIKE ?1 ESCAPE '\'
               )
        )";
    }

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return result_type(tx.begin_error().error());
    }

    std::vector<patient_with_appointments> results;
    std::unordered_map<int64_t, std::size_t> index_by_pk;

    auto patient_sql = compat::format(
        "SELECT {} FROM patients p {} ORDER BY p.patient_pk;", patient_columns,
        filter);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, patient_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(last_error(rc, "Failed to prepare patient search"));
    }
    if (!pattern.empty()) {
        bind_text(stmt, 1, pattern);
    }

    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        patient_with_appointments entry;
        entry.patient = parse_patient_row(stmt);
        index_by_pk.emplace(entry.patient.pk, results.size());
        results.push_back(std::move(entry));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return result_type(last_error(rc, "Failed to search patients"));
    }

    if (!results.empty()) {
        auto appointment_sql = compat::format(
            "SELECT {} FROM appointments "
            "WHERE patient_pk IN (SELECT p.patient_pk FROM patients p {}) "
            "ORDER BY patient_pk, appointment_date, appointment_pk;",
            appointment_columns, filter);

        rc = sqlite3_prepare_v2(db_, appointment_sql.c_str(), -1, &stmt,
                                nullptr);
        if (rc != SQLITE_OK) {
            return result_type(
                last_error(rc, "Failed to prepare appointment search"));
        }
        if (!pattern.empty()) {
            bind_text(stmt, 1, pattern);
        }

        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            auto appointment = parse_appointment_row(stmt);
            auto it = index_by_pk.find(appointment.patient_pk);
            if (it != index_by_pk.end()) {
                results[it->second].appointments.push_back(
                    std::move(appointment));
            }
        }
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            return result_type(last_error(rc, "Failed to load appointments"));
        }
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return result_type(commit_result.error());
    }
    return results;
}

auto clinic_database::patient_count() const -> Result<size_t> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<size_t>(tx.begin_error().error());
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM patients;", -1,
                                 &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<size_t>(last_error(rc, "Failed to prepare query"));
    }

    size_t count = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return Result<size_t>(last_error(rc, "Failed to count patients"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<size_t>(commit_result.error());
    }
    return count;
}

// ============================================================================
// Appointment Operations
// ============================================================================

auto clinic_database::add_appointment(int64_t patient_pk,
                                      const core::clinic_date& date,
                                      std::string_view treatment_type,
                                      std::string_view dentist,
                                      std::optional<double> fee,
                                      std::string_view notes)
    -> Result<appointment_record> {
    if (!date.ok()) {
        return make_error<appointment_record>(invalid_date,
                                              "Appointment date is invalid",
                                              "storage");
    }
    if (treatment_type.empty()) {
        return make_error<appointment_record>(
            missing_required_field, "Appointment treatment type is required",
            "storage");
    }
    if (dentist.empty()) {
        return make_error<appointment_record>(missing_required_field,
                                              "Dentist name is required",
                                              "storage");
    }
    if (fee.has_value() && !(*fee >= 0.0)) {
        return make_error<appointment_record>(
            invalid_fee, "Fee must be a non-negative number", "storage");
    }

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<appointment_record>(tx.begin_error().error());
    }

    auto owner = query_patient_by_pk(patient_pk);
    if (owner.is_err()) {
        return Result<appointment_record>(owner.error());
    }
    if (!owner.value().has_value()) {
        return make_error<appointment_record>(
            patient_not_found,
            compat::format("Patient {} not found", patient_pk), "storage");
    }

    const char* sql = R"(
        INSERT INTO appointments (
            patient_pk, appointment_date, treatment_type, dentist, fee, notes
        ) VALUES (?, ?, ?, ?, ?, ?)
        RETURNING appointment_pk;
    )";

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<appointment_record>(
            last_error(rc, "Failed to prepare appointment insert"));
    }

    auto date_text = core::format_date(date);
    sqlite3_bind_int64(stmt, 1, patient_pk);
    bind_text(stmt, 2, date_text);
    bind_text(stmt, 3, treatment_type);
    bind_text(stmt, 4, dentist);
    bind_optional_double(stmt, 5, fee);
    bind_optional_text(stmt, 6, notes);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        auto error = last_error(rc, "Failed to insert appointment");
        sqlite3_finalize(stmt);
        return Result<appointment_record>(error);
    }
    auto pk = sqlite3_column_int64(stmt, 0);

    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<appointment_record>(
            last_error(rc, "Failed to insert appointment"));
    }

    auto stored = query_appointment_by_pk(pk);
    if (stored.is_err()) {
        return stored;
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<appointment_record>(commit_result.error());
    }
    return stored;
}

auto clinic_database::add_appointment(const patient_record& patient,
                                      const core::clinic_date& date,
                                      std::string_view treatment_type,
                                      std::string_view dentist,
                                      std::optional<double> fee,
                                      std::string_view notes)
    -> Result<appointment_record> {
    return add_appointment(patient.pk, date, treatment_type, dentist, fee,
                           notes);
}

auto clinic_database::appointments_for_patient(int64_t patient_pk) const
    -> Result<std::vector<appointment_record>> {
    using result_type = Result<std::vector<appointment_record>>;

    auto sql = compat::format(
        "SELECT {} FROM appointments WHERE patient_pk = ? "
        "ORDER BY appointment_date, appointment_pk;",
        appointment_columns);

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return result_type(tx.begin_error().error());
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(last_error(rc, "Failed to prepare query"));
    }
    sqlite3_bind_int64(stmt, 1, patient_pk);

    std::vector<appointment_record> results;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        results.push_back(parse_appointment_row(stmt));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return result_type(last_error(rc, "Failed to list appointments"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return result_type(commit_result.error());
    }
    return results;
}

auto clinic_database::appointments_on_date(const core::clinic_date& date) const
    -> Result<std::vector<appointment_reminder>> {
    using result_type = Result<std::vector<appointment_reminder>>;

    if (!date.ok()) {
        return make_error<std::vector<appointment_reminder>>(
            invalid_date, "Reminder date is invalid", "storage");
    }

    const char* sql = R"(
        SELECT a.appointment_pk, a.patient_pk, a.appointment_date,
               a.treatment_type, a.dentist, a.fee, a.notes, a.created_at,
               p.patient_name, p.phone_number
          FROM appointments a
          JOIN patients p ON p.patient_pk = a.patient_pk
         WHERE a.appointment_date = ?
         ORDER BY a.appointment_pk;
    )";

    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return result_type(tx.begin_error().error());
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return result_type(last_error(rc, "Failed to prepare query"));
    }

    auto date_text = core::format_date(date);
    bind_text(stmt, 1, date_text);

    std::vector<appointment_reminder> results;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        appointment_reminder reminder;
        reminder.appointment = parse_appointment_row(stmt);
        reminder.patient_name = get_text(stmt, 8);
        reminder.patient_phone = get_text(stmt, 9);
        results.push_back(std::move(reminder));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return result_type(last_error(rc, "Failed to list appointments"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return result_type(commit_result.error());
    }
    return results;
}

auto clinic_database::appointment_count() const -> Result<size_t> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<size_t>(tx.begin_error().error());
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM appointments;", -1,
                                 &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<size_t>(last_error(rc, "Failed to prepare query"));
    }

    size_t count = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return Result<size_t>(last_error(rc, "Failed to count appointments"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<size_t>(commit_result.error());
    }
    return count;
}

// ============================================================================
// Database Information
// ============================================================================

auto clinic_database::path() const -> std::string_view { return path_; }

auto clinic_database::schema_version() const -> Result<int> {
    scoped_transaction tx(db_);
    if (!tx.is_active()) {
        return Result<int>(tx.begin_error().error());
    }

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, "SELECT MAX(version) FROM schema_version;",
                                 -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<int>(last_error(rc, "Failed to prepare query"));
    }

    int version = 0;
    rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        version = sqlite3_column_int(stmt, 0);
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_ROW) {
        return Result<int>(last_error(rc, "Failed to read schema version"));
    }

    auto commit_result = tx.commit();
    if (commit_result.is_err()) {
        return Result<int>(commit_result.error());
    }
    return version;
}

auto clinic_database::is_open() const noexcept -> bool {
    return db_ != nullptr;
}

// ============================================================================
// Internal Helpers
// ============================================================================

auto clinic_database::query_patient_by_phone(std::string_view phone) const
    -> Result<std::optional<patient_record>> {
    auto sql = compat::format("SELECT {} FROM patients WHERE phone_number = ?;",
                              patient_columns);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::optional<patient_record>>(
            last_error(rc, "Failed to prepare patient lookup"));
    }
    bind_text(stmt, 1, phone);
    return fetch_single_patient(stmt);
}

auto clinic_database::query_patient_by_pk(int64_t pk) const
    -> Result<std::optional<patient_record>> {
    auto sql = compat::format("SELECT {} FROM patients WHERE patient_pk = ?;",
                              patient_columns);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<std::optional<patient_record>>(
            last_error(rc, "Failed to prepare patient lookup"));
    }
    sqlite3_bind_int64(stmt, 1, pk);
    return fetch_single_patient(stmt);
}

auto clinic_database::fetch_single_patient(void* stmt_ptr) const
    -> Result<std::optional<patient_record>> {
    auto* stmt = static_cast<sqlite3_stmt*>(stmt_ptr);

    auto rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        auto record = parse_patient_row(stmt);
        sqlite3_finalize(stmt);
        return std::optional<patient_record>(std::move(record));
    }

    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        return Result<std::optional<patient_record>>(
            last_error(rc, "Failed to look up patient"));
    }
    return std::optional<patient_record>{};
}

auto clinic_database::query_appointment_by_pk(int64_t pk) const
    -> Result<appointment_record> {
    auto sql = compat::format(
        "SELECT {} FROM appointments WHERE appointment_pk = ?;",
        appointment_columns);

    sqlite3_stmt* stmt = nullptr;
    auto rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<appointment_record>(
            last_error(rc, "Failed to prepare appointment lookup"));
    }
    sqlite3_bind_int64(stmt, 1, pk);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        auto error = rc == SQLITE_DONE
                         ? error_info{database_query_error,
                                      "Stored appointment could not be read back",
                                      "storage"}
                         : last_error(rc, "Failed to look up appointment");
        sqlite3_finalize(stmt);
        return Result<appointment_record>(error);
    }

    auto record = parse_appointment_row(stmt);
    sqlite3_finalize(stmt);
    return record;
}

auto clinic_database::parse_patient_row(void* stmt_ptr) const
    -> patient_record {
    auto* stmt = static_cast<sqlite3_stmt*>(stmt_ptr);
    patient_record record;

    record.pk = sqlite3_column_int64(stmt, 0);
    record.name = get_text(stmt, 1);
    record.phone = get_text(stmt, 2);
    record.treatment_type = get_text(stmt, 3);
    record.teeth_location = get_text(stmt, 4);

    auto created_str = get_text(stmt, 5);
    record.created_at = parse_timestamp(created_str.c_str());

    auto updated_str = get_text(stmt, 6);
    record.updated_at = parse_timestamp(updated_str.c_str());

    return record;
}

auto clinic_database::parse_appointment_row(void* stmt_ptr, int first_col) const
    -> appointment_record {
    auto* stmt = static_cast<sqlite3_stmt*>(stmt_ptr);
    appointment_record record;

    record.pk = sqlite3_column_int64(stmt, first_col + 0);
    record.patient_pk = sqlite3_column_int64(stmt, first_col + 1);
    record.date = core::parse_date(get_text(stmt, first_col + 2))
                      .value_or(core::clinic_date{});
    record.treatment_type = get_text(stmt, first_col + 3);
    record.dentist = get_text(stmt, first_col + 4);
    if (sqlite3_column_type(stmt, first_col + 5) != SQLITE_NULL) {
        record.fee = sqlite3_column_double(stmt, first_col + 5);
    }
    record.notes = get_text(stmt, first_col + 6);

    auto created_str = get_text(stmt, first_col + 7);
    record.created_at = parse_timestamp(created_str.c_str());

    return record;
}

auto clinic_database::last_error(int rc, std::string_view context) const
    -> error_info {
    std::string detail = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    return error_info{to_store_error_code(rc),
                      compat::format("{}: {}", context, detail), "storage"};
}

auto clinic_database::to_contains_pattern(std::string_view term)
    -> std::string {
    std::string pattern;
    pattern.reserve(term.size() + 2);
    pattern += '%';
    for (char c : term) {
        if (c == '%' || c == '_' || c == '\\') {
            pattern += '\\';
        }
        pattern += c;
    }
    pattern += '%';
    return pattern;
}

}  // namespace dental::storage
