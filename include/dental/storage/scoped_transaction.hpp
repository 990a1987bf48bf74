/**
 * @file scoped_transaction.hpp
 * @brief RAII unit of work over a SQLite connection
 *
 * Each scoped_transaction opens a SQLite savepoint. Outside any transaction
 * a savepoint behaves like BEGIN ... COMMIT; inside an enclosing unit of
 * work it nests, so a failed inner operation can be undone without touching
 * the outer one, and the outer rollback still discards everything.
 */

#pragma once

#include <dental/core/result.hpp>

// Forward declaration of SQLite handle
struct sqlite3;

namespace dental::storage {

/**
 * @brief RAII transaction guard
 *
 * If commit() is not called before destruction, the unit of work is rolled
 * back.
 *
 * @example
 * @code
 * {
 *     scoped_transaction tx(db);
 *     if (!tx.is_active()) {
 *         return tx.begin_error();
 *     }
 *     // ... statements ...
 *     auto result = tx.commit();
 * } // auto-rollback if commit() not called
 * @endcode
 */
class scoped_transaction {
public:
    /**
     * @brief Construct and open the unit of work
     *
     * @param db Open SQLite handle
     * @note Check is_active() for success; begin_error() holds the reason
     */
    explicit scoped_transaction(sqlite3* db);

    /**
     * @brief Destructor - rollback if not committed
     */
    ~scoped_transaction();

    // Non-copyable, non-movable
    scoped_transaction(const scoped_transaction&) = delete;
    auto operator=(const scoped_transaction&) -> scoped_transaction& = delete;
    scoped_transaction(scoped_transaction&&) = delete;
    auto operator=(scoped_transaction&&) -> scoped_transaction& = delete;

    /**
     * @brief Commit the unit of work
     *
     * After a successful commit the destructor does nothing. A failed commit
     * rolls back before returning.
     *
     * @return Success or error result
     */
    [[nodiscard]] auto commit() -> VoidResult;

    /**
     * @brief Explicitly rollback the unit of work
     */
    void rollback() noexcept;

    /**
     * @brief Check if the unit of work is open
     *
     * @return true if begun and neither committed nor rolled back
     */
    [[nodiscard]] auto is_active() const noexcept -> bool;

    /**
     * @brief Error raised while opening the unit of work
     */
    [[nodiscard]] auto begin_error() const -> VoidResult { return begin_result_; }

private:
    sqlite3* db_;
    VoidResult begin_result_;
    bool committed_{false};
    bool active_{false};
};

}  // namespace dental::storage
