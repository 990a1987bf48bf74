/**
 * @file clinic_database.hpp
 * @brief Clinic records database for patients and appointments
 *
 * This file provides the clinic_database class, the record store of the
 * clinic. It owns the SQLite schema (patients, appointments) and exposes
 * create/read/update/delete operations plus filtered searches.
 *
 * Every public operation runs inside one unit of work (scoped_transaction):
 * either all of its statements take effect or none do, and failures come
 * back as Result errors.
 */

#pragma once

#include "appointment_record.hpp"
#include "patient_record.hpp"
#include "scoped_transaction.hpp"

#include <dental/core/clinic_date.hpp>
#include <dental/core/result.hpp>

#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

// Forward declaration of SQLite handle
struct sqlite3;

namespace dental::storage {

/**
 * @brief Configuration for the clinic database
 */
struct database_config {
    /// Enable WAL (Write-Ahead Logging) journal mode
    bool wal_mode = true;

    /// Page cache size in megabytes
    size_t cache_size_mb = 8;

    /// How long a statement waits on a locked database, in milliseconds
    int busy_timeout_ms = 5000;
};

/**
 * @brief Clinic records database manager
 *
 * Cascade delete is explicit: deleting a patient removes its appointments
 * first, then the patient row, inside one unit of work. The foreign key on
 * appointments guarantees that no appointment outlives its patient.
 *
 * Thread Safety: This class is NOT thread-safe. External synchronization
 * is required for concurrent access.
 *
 * @example
 * @code
 * auto db_result = clinic_database::open("dentistry_clinic.db");
 * if (db_result.is_err()) {
 *     // Handle error
 * }
 * auto db = std::move(db_result.value());
 *
 * auto patient = db->upsert_patient("Ann", "+10000000", "Cleaning", "");
 * auto visit = db->add_appointment(patient.value(), core::today(),
 *                                  "Cleaning", "Noha", 25.5);
 *
 * auto matches = db->search_patients("clean");
 * @endcode
 */
class clinic_database {
public:
    /**
     * @brief Open or create a database with default configuration
     *
     * Creates the schema if it does not exist yet.
     *
     * @param db_path Path to the database file, or ":memory:" for in-memory DB
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path)
        -> Result<std::unique_ptr<clinic_database>>;

    /**
     * @brief Open or create a database with custom configuration
     *
     * @param db_path Path to the database file, or ":memory:" for in-memory DB
     * @param config Configuration options for database behavior
     * @return Result containing the database instance or error
     */
    [[nodiscard]] static auto open(std::string_view db_path,
                                   const database_config& config)
        -> Result<std::unique_ptr<clinic_database>>;

    /**
     * @brief Destructor - closes database connection
     */
    ~clinic_database();

    // Non-copyable, movable
    clinic_database(const clinic_database&) = delete;
    auto operator=(const clinic_database&) -> clinic_database& = delete;
    clinic_database(clinic_database&&) noexcept;
    auto operator=(clinic_database&&) noexcept -> clinic_database&;

    // ========================================================================
    // Patient Operations
    // ========================================================================

    /**
     * @brief Find a patient by exact phone number
     *
     * @param phone Phone number to look up
     * @return Result containing the patient, or an empty optional if absent
     */
    [[nodiscard]] auto find_patient_by_phone(std::string_view phone) const
        -> Result<std::optional<patient_record>>;

    /**
     * @brief Find a patient by primary key
     */
    [[nodiscard]] auto find_patient_by_pk(int64_t pk) const
        -> Result<std::optional<patient_record>>;

    /**
     * @brief Insert a patient or overwrite the one with the same phone
     *
     * If a patient with @p phone exists, its name, treatment type and teeth
     * location are replaced. Otherwise a new patient is inserted.
     *
     * @return Result containing the stored patient or error
     */
    [[nodiscard]] auto upsert_patient(std::string_view name,
                                      std::string_view phone,
                                      std::string_view treatment_type = "",
                                      std::string_view teeth_location = "")
        -> Result<patient_record>;

    /**
     * @brief Update the mutable fields of an existing patient
     *
     * @return Result containing the updated patient, or a patient_not_found
     *         error if no patient has @p phone
     */
    [[nodiscard]] auto update_patient_fields(std::string_view phone,
                                             std::string_view name,
                                             std::string_view treatment_type,
                                             std::string_view teeth_location)
        -> Result<patient_record>;

    /**
     * @brief Delete a patient and all of its appointments
     *
     * @param phone Phone number of the patient
     * @return Result containing the number of appointments removed, or a
     *         patient_not_found error
     */
    [[nodiscard]] auto delete_patient_by_phone(std::string_view phone)
        -> Result<std::size_t>;

    /**
     * @brief Search patients and their appointments
     *
     * With an empty term every patient is returned. Otherwise a patient
     * matches when its name, phone, treatment type or teeth location, or the
     * treatment type of any of its appointments, contains @p term ignoring
     * ASCII case. The term is matched literally ('%' and '_' are not
     * wildcards).
     *
     * @param term Search term
     * @return Result containing patients ordered by primary key, each with
     *         its appointments ordered by date
     */
    [[nodiscard]] auto search_patients(std::string_view term = "") const
        -> Result<std::vector<patient_with_appointments>>;

    /**
     * @brief Get total patient count
     */
    [[nodiscard]] auto patient_count() const -> Result<size_t>;

    // ========================================================================
    // Appointment Operations
    // ========================================================================

    /**
     * @brief Create an appointment for a patient
     *
     * @param patient_pk Primary key of the owning patient
     * @param date Appointment date
     * @param treatment_type Treatment performed (required)
     * @param dentist Dentist name (required)
     * @param fee Fee, must be >= 0 when present
     * @param notes Free-text notes
     * @return Result containing the stored appointment, or a
     *         patient_not_found error if the patient does not exist
     */
    [[nodiscard]] auto add_appointment(int64_t patient_pk,
                                       const core::clinic_date& date,
                                       std::string_view treatment_type,
                                       std::string_view dentist,
                                       std::optional<double> fee = std::nullopt,
                                       std::string_view notes = "")
        -> Result<appointment_record>;

    /**
     * @brief Create an appointment for a patient record
     */
    [[nodiscard]] auto add_appointment(const patient_record& patient,
                                       const core::clinic_date& date,
                                       std::string_view treatment_type,
                                       std::string_view dentist,
                                       std::optional<double> fee = std::nullopt,
                                       std::string_view notes = "")
        -> Result<appointment_record>;

    /**
     * @brief List the appointments owned by a patient, ordered by date
     */
    [[nodiscard]] auto appointments_for_patient(int64_t patient_pk) const
        -> Result<std::vector<appointment_record>>;

    /**
     * @brief List every appointment scheduled on a calendar date
     *
     * @return Result containing reminder entries ordered by appointment key
     */
    [[nodiscard]] auto appointments_on_date(const core::clinic_date& date) const
        -> Result<std::vector<appointment_reminder>>;

    /**
     * @brief Get total appointment count
     */
    [[nodiscard]] auto appointment_count() const -> Result<size_t>;

    // ========================================================================
    // Unit of Work
    // ========================================================================

    /**
     * @brief Execute a function within one unit of work
     *
     * Operations called from @p func join the enclosing unit of work. The
     * work is committed when @p func returns success and rolled back when
     * it returns an error or throws.
     *
     * @tparam Func Callable returning Result<T> or VoidResult
     * @param func Function to execute
     * @return The result of @p func, or the commit/rollback error
     *
     * @example
     * @code
     * auto result = db.transaction([&]() -> Result<appointment_record> {
     *     auto patient = db.upsert_patient(name, phone);
     *     if (patient.is_err()) return Result<appointment_record>(patient.error());
     *     return db.add_appointment(patient.value(), date, "Filling", "Noha");
     * });
     * @endcode
     */
    template <typename Func>
    [[nodiscard]] auto transaction(Func&& func) -> std::invoke_result_t<Func> {
        using result_type = std::invoke_result_t<Func>;

        scoped_transaction tx(db_);
        if (!tx.is_active()) {
            return result_type(tx.begin_error().error());
        }

        try {
            auto result = std::forward<Func>(func)();
            if (result.is_err()) {
                tx.rollback();
                return result;
            }

            auto commit_result = tx.commit();
            if (commit_result.is_err()) {
                return result_type(commit_result.error());
            }
            return result;
        } catch (const std::exception& e) {
            tx.rollback();
            return result_type(error_info{
                error_codes::database_transaction_error,
                std::string("Transaction failed: ") + e.what(), "storage"});
        }
    }

    // ========================================================================
    // Database Information
    // ========================================================================

    /**
     * @brief Get the database file path
     */
    [[nodiscard]] auto path() const -> std::string_view;

    /**
     * @brief Get the schema version recorded in the database
     * @return Highest applied version or error information
     */
    [[nodiscard]] auto schema_version() const -> Result<int>;

    /**
     * @brief Check if the database connection is open
     */
    [[nodiscard]] auto is_open() const noexcept -> bool;

private:
    /**
     * @brief Private constructor - use open() factory method
     */
    explicit clinic_database(sqlite3* db, std::string path);

    /**
     * @brief Create tables and indexes that do not exist yet
     */
    [[nodiscard]] auto initialize_schema() -> VoidResult;

    /**
     * @brief Patient lookups that run inside the caller's unit of work
     */
    [[nodiscard]] auto query_patient_by_phone(std::string_view phone) const
        -> Result<std::optional<patient_record>>;
    [[nodiscard]] auto query_patient_by_pk(int64_t pk) const
        -> Result<std::optional<patient_record>>;

    /**
     * @brief Step a prepared patient query and parse at most one row
     *
     * Finalizes @p stmt.
     */
    [[nodiscard]] auto fetch_single_patient(void* stmt) const
        -> Result<std::optional<patient_record>>;

    /**
     * @brief Read one appointment by primary key inside the caller's unit of
     *        work
     */
    [[nodiscard]] auto query_appointment_by_pk(int64_t pk) const
        -> Result<appointment_record>;

    /**
     * @brief Parse a patient record from a prepared statement
     */
    [[nodiscard]] auto parse_patient_row(void* stmt) const -> patient_record;

    /**
     * @brief Parse an appointment record from a prepared statement
     *
     * @param first_col Index of the first appointment column
     */
    [[nodiscard]] auto parse_appointment_row(void* stmt, int first_col = 0) const
        -> appointment_record;

    /**
     * @brief Build an error from the connection's last SQLite failure
     */
    [[nodiscard]] auto last_error(int rc, std::string_view context) const
        -> error_info;

    /**
     * @brief Escape a search term into a SQL LIKE "contains" pattern
     *
     * Uses '\' as the escape character.
     */
    [[nodiscard]] static auto to_contains_pattern(std::string_view term)
        -> std::string;

    /// SQLite database handle
    sqlite3* db_{nullptr};

    /// Database file path
    std::string path_;
};

}  // namespace dental::storage
