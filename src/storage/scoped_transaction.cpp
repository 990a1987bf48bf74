/**
 * @file scoped_transaction.cpp
 * @brief Implementation of the RAII unit of work
 */

#include <dental/storage/scoped_transaction.hpp>

#include <dental/compat/format.hpp>

#include <sqlite3.h>

#include <string>
#include <variant>

namespace dental::storage {

using kcenon::common::make_error;
using kcenon::common::ok;

namespace {

constexpr const char* begin_sql = "SAVEPOINT unit_of_work;";
constexpr const char* release_sql = "RELEASE unit_of_work;";
constexpr const char* rollback_sql =
    "ROLLBACK TO unit_of_work; RELEASE unit_of_work;";

auto execute(sqlite3* db, const char* sql) -> VoidResult {
    if (!db) {
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "Database not open", "storage");
    }

    char* errmsg = nullptr;
    auto rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string message = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return make_error<std::monostate>(
            error_codes::database_transaction_error,
            compat::format("Transaction statement failed: {}", message),
            "storage");
    }
    return ok();
}

}  // namespace

scoped_transaction::scoped_transaction(sqlite3* db)
    : db_(db), begin_result_(execute(db, begin_sql)) {
    active_ = begin_result_.is_ok();
}

scoped_transaction::~scoped_transaction() {
    rollback();
}

auto scoped_transaction::commit() -> VoidResult {
    if (!active_) {
        return make_error<std::monostate>(error_codes::database_transaction_error,
                                          "Transaction not active", "storage");
    }

    auto result = execute(db_, release_sql);
    if (result.is_err()) {
        rollback();
        return result;
    }

    committed_ = true;
    active_ = false;
    return result;
}

void scoped_transaction::rollback() noexcept {
    if (active_ && !committed_) {
        (void)execute(db_, rollback_sql);
        active_ = false;
    }
}

auto scoped_transaction::is_active() const noexcept -> bool {
    return active_ && !committed_;
}

}  // namespace dental::storage
