/**
 * @file desk_app.hpp
 * @brief Console front desk for the dental clinic
 *
 * Wires the records database, the clinic service and the periodic refresh
 * together and drives them from a line-oriented command prompt.
 */

#ifndef DENTAL_APPS_DENTAL_DESK_DESK_APP_HPP
#define DENTAL_APPS_DENTAL_DESK_DESK_APP_HPP

#include "config.hpp"

#include <dental/core/result.hpp>
#include <dental/core/teeth_selection.hpp>
#include <dental/di/ilogger.hpp>
#include <dental/services/clinic_service.hpp>
#include <dental/storage/clinic_database.hpp>
#include <dental/workflow/reminder_service.hpp>

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dental::desk {

/**
 * @brief Console application
 *
 * Commands:
 *   list                 Show every patient and appointment
 *   search <term>        Show matching records
 *   add                  Add or update a patient and book an appointment
 *   modify               Edit a patient selected by phone number
 *   delete               Delete a patient and its appointments
 *   teeth                Edit the teeth location of a patient
 *   reminders            Show today's appointments
 *   help                 Show the command list
 *   quit                 Leave the application
 *
 * Closing the input stream in the middle of a form cancels it without
 * writing anything.
 */
class desk_app {
public:
    /**
     * @brief Construct the application
     *
     * @param config Application configuration
     * @param in Command and form input
     * @param out Screen output
     * @param logger Logger to inject; when null, the process logger is
     *        initialized from config and used through di::LoggerService
     */
    desk_app(desk_config config, std::istream& in, std::ostream& out,
             std::shared_ptr<di::ILogger> logger = nullptr);

    ~desk_app();

    desk_app(const desk_app&) = delete;
    desk_app& operator=(const desk_app&) = delete;

    /**
     * @brief Open the database and start the periodic refresh
     */
    [[nodiscard]] auto initialize() -> VoidResult;

    /**
     * @brief Read and execute commands until quit or end of input
     * @return Process exit code
     */
    auto run() -> int;

    /**
     * @brief Execute one command line
     * @return false when the command asks to quit
     */
    auto execute(std::string_view line) -> bool;

    /**
     * @brief Stop the refresh task and release the database and logger
     */
    void shutdown();

    /**
     * @brief Render the four quadrants of a selection in display order
     */
    static void render_teeth(std::ostream& out,
                             const core::teeth_selection& selection);

private:
    // Commands
    void cmd_list(std::string_view term);
    void cmd_add();
    void cmd_modify();
    void cmd_delete();
    void cmd_teeth();
    void cmd_reminders();
    void print_commands();

    // Form helpers
    [[nodiscard]] auto prompt(std::string_view label,
                              std::string_view current = {})
        -> std::optional<std::string>;
    [[nodiscard]] auto choose(std::string_view label,
                              const std::vector<std::string>& options)
        -> std::optional<std::string>;
    [[nodiscard]] auto confirm(std::string_view question) -> std::optional<bool>;

    /**
     * @brief Interactive teeth selector
     *
     * @return The serialized selection on "ok", std::nullopt on "cancel"
     */
    [[nodiscard]] auto select_teeth(std::string_view initial)
        -> std::optional<std::string>;

    /**
     * @brief Ask for a phone number and load that patient
     */
    [[nodiscard]] auto prompt_existing_patient()
        -> std::optional<storage::patient_record>;

    void show_error(const error_info& error);
    void show_cancelled();

    desk_config config_;
    std::istream& in_;
    std::ostream& out_;

    std::shared_ptr<di::ILogger> logger_;
    bool owns_logger_{false};

    std::unique_ptr<storage::clinic_database> database_;
    std::unique_ptr<services::clinic_service> clinic_;
    std::unique_ptr<workflow::reminder_service> reminders_;
};

}  // namespace dental::desk

#endif  // DENTAL_APPS_DENTAL_DESK_DESK_APP_HPP
