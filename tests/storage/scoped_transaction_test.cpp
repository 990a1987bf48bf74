/**
 * @file scoped_transaction_test.cpp
 * @brief Unit tests for the RAII unit of work
 */

#include <dental/storage/scoped_transaction.hpp>

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <string>

using namespace dental;
using namespace dental::storage;

namespace {

/**
 * @brief Owns an in-memory SQLite connection with one scratch table
 */
class memory_db {
public:
    memory_db() {
        REQUIRE(sqlite3_open(":memory:", &db_) == SQLITE_OK);
        exec("CREATE TABLE items (value TEXT NOT NULL);");
    }

    ~memory_db() { sqlite3_close(db_); }

    memory_db(const memory_db&) = delete;
    auto operator=(const memory_db&) -> memory_db& = delete;

    [[nodiscard]] auto handle() const -> sqlite3* { return db_; }

    void exec(const std::string& sql) {
        REQUIRE(sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr) == SQLITE_OK);
    }

    void insert(const std::string& value) {
        exec("INSERT INTO items (value) VALUES ('" + value + "');");
    }

    [[nodiscard]] auto count() const -> int {
        sqlite3_stmt* stmt = nullptr;
        REQUIRE(sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM items;", -1, &stmt,
                                   nullptr) == SQLITE_OK);
        int result = -1;
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            result = sqlite3_column_int(stmt, 0);
        }
        sqlite3_finalize(stmt);
        return result;
    }

    [[nodiscard]] auto in_transaction() const -> bool {
        return sqlite3_get_autocommit(db_) == 0;
    }

private:
    sqlite3* db_{nullptr};
};

}  // namespace

TEST_CASE("scoped_transaction: commit keeps the changes", "[storage][transaction]") {
    memory_db db;

    {
        scoped_transaction tx(db.handle());
        REQUIRE(tx.is_active());
        CHECK(db.in_transaction());

        db.insert("a");
        db.insert("b");

        auto result = tx.commit();
        REQUIRE(result.is_ok());
        CHECK_FALSE(tx.is_active());
    }

    CHECK(db.count() == 2);
    CHECK_FALSE(db.in_transaction());
}

TEST_CASE("scoped_transaction: destruction without commit rolls back",
          "[storage][transaction]") {
    memory_db db;
    db.insert("kept");

    {
        scoped_transaction tx(db.handle());
        REQUIRE(tx.is_active());
        db.insert("discarded");
        CHECK(db.count() == 2);
    }

    CHECK(db.count() == 1);
    CHECK_FALSE(db.in_transaction());
}

TEST_CASE("scoped_transaction: explicit rollback", "[storage][transaction]") {
    memory_db db;

    scoped_transaction tx(db.handle());
    db.insert("a");
    tx.rollback();

    CHECK_FALSE(tx.is_active());
    CHECK(db.count() == 0);

    auto result = tx.commit();
    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::database_transaction_error);
}

TEST_CASE("scoped_transaction: inner rollback keeps the outer work",
          "[storage][transaction]") {
    memory_db db;

    {
        scoped_transaction outer(db.handle());
        REQUIRE(outer.is_active());
        db.insert("outer");

        {
            scoped_transaction inner(db.handle());
            REQUIRE(inner.is_active());
            db.insert("inner");
        }

        CHECK(db.count() == 1);
        REQUIRE(outer.commit().is_ok());
    }

    CHECK(db.count() == 1);
}

TEST_CASE("scoped_transaction: outer rollback discards committed inner work",
          "[storage][transaction]") {
    memory_db db;

    {
        scoped_transaction outer(db.handle());
        db.insert("outer");

        {
            scoped_transaction inner(db.handle());
            db.insert("inner");
            REQUIRE(inner.commit().is_ok());
        }

        CHECK(db.count() == 2);
    }

    CHECK(db.count() == 0);
    CHECK_FALSE(db.in_transaction());
}

TEST_CASE("scoped_transaction: null handle fails to begin",
          "[storage][transaction]") {
    scoped_transaction tx(nullptr);

    CHECK_FALSE(tx.is_active());
    auto error = tx.begin_error();
    REQUIRE(error.is_err());
    CHECK(error.error().code == error_codes::database_transaction_error);
}
