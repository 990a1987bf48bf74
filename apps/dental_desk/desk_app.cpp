/**
 * @file desk_app.cpp
 * @brief Console front desk implementation
 */

#include "desk_app.hpp"

#include <dental/compat/format.hpp>
#include <dental/core/clinic_date.hpp>
#include <dental/core/validation.hpp>
#include <dental/integration/logger_adapter.hpp>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string_view>
#include <utility>

namespace dental::desk {

namespace {

constexpr std::size_t max_column_width = 28;

auto to_lower(std::string_view text) -> std::string {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

auto to_upper(std::string_view text) -> std::string {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

/**
 * @brief Split on spaces and commas, dropping empty pieces
 */
auto split_tokens(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;
    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
        } else {
            current += c;
        }
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

auto is_utf8_continuation(char c) -> bool {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

/**
 * @brief Number of terminal columns @p str takes, one per UTF-8 code point
 */
auto display_width(std::string_view str) -> std::size_t {
    return static_cast<std::size_t>(
        std::count_if(str.begin(), str.end(), [](char c) { return !is_utf8_continuation(c); }));
}

/**
 * @brief Cut @p str to @p max_len columns, never inside a UTF-8 sequence
 */
auto truncate(const std::string& str, std::size_t max_len) -> std::string {
    if (display_width(str) <= max_len) {
        return str;
    }

    std::size_t kept = 0;
    std::size_t end = 0;
    while (end < str.size()) {
        if (!is_utf8_continuation(str[end])) {
            if (kept == max_len - 3) {
                break;
            }
            ++kept;
        }
        ++end;
    }
    return str.substr(0, end) + "...";
}

void print_separator(std::ostream& out, const std::vector<std::size_t>& widths) {
    for (std::size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) {
            out << "+";
        }
        out << std::string(widths[i] + 2, '-');
    }
    out << "\n";
}

void print_row(std::ostream& out, const std::vector<std::string>& values,
               const std::vector<std::size_t>& widths) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out << "|";
        }
        auto cell = truncate(values[i], widths[i]);
        out << " " << cell << std::string(widths[i] - display_width(cell), ' ') << " ";
    }
    out << "\n";
}

auto format_fee(const std::optional<double>& fee) -> std::string {
    return fee.has_value() ? compat::format("{:.2f}", *fee) : std::string{};
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

desk_app::desk_app(desk_config config, std::istream& in, std::ostream& out,
                   std::shared_ptr<di::ILogger> logger)
    : config_(std::move(config)), in_(in), out_(out), logger_(std::move(logger)) {}

desk_app::~desk_app() {
    shutdown();
}

auto desk_app::initialize() -> VoidResult {
    if (!logger_) {
        integration::logger_config log_config;
        log_config.log_directory = config_.logging.directory;
        log_config.min_level =
            integration::logger_adapter::parse_log_level(config_.logging.level)
                .value_or(integration::log_level::info);
        log_config.enable_console = config_.logging.console;
        log_config.enable_file = config_.logging.file;
        integration::logger_adapter::initialize(log_config);

        logger_ = std::make_shared<di::LoggerService>();
        owns_logger_ = true;
    }

    storage::database_config db_config;
    db_config.wal_mode = config_.database.wal_mode;

    auto db_result =
        storage::clinic_database::open(config_.database.path.string(), db_config);
    if (db_result.is_err()) {
        logger_->error_fmt("Cannot open clinic database {}: {}",
                           config_.database.path.string(),
                           db_result.error().message);
        return VoidResult(db_result.error());
    }
    database_ = std::move(db_result.value());

    auto version = database_->schema_version();
    if (version.is_err()) {
        logger_->error_fmt("Cannot read schema version of {}: {}",
                           database_->path(), version.error().message);
        database_.reset();
        return VoidResult(version.error());
    }
    logger_->info_fmt("Opened clinic database at {} (schema v{})",
                      database_->path(), version.value());

    clinic_ = std::make_unique<services::clinic_service>(*database_, logger_);

    auto first = clinic_->refresh(core::today());
    if (first.is_ok()) {
        logger_->info_fmt("{} patient record(s) loaded", first.value().patient_count);
    }

    if (config_.reminders.enabled) {
        workflow::reminder_service_config reminder_config;
        reminder_config.refresh_interval = config_.reminders.refresh_interval;
        reminder_config.on_cycle_error = [logger = logger_](const error_info& error) {
            logger->warn_fmt("Periodic refresh failed: {}", error.message);
        };

        reminders_ = std::make_unique<workflow::reminder_service>(*clinic_,
                                                                  reminder_config);
        reminders_->start();
        logger_->debug_fmt("Periodic refresh every {}s",
                           config_.reminders.refresh_interval.count());
    }

    return kcenon::common::ok();
}

void desk_app::shutdown() {
    if (reminders_) {
        reminders_->stop();
        reminders_.reset();
    }
    clinic_.reset();
    if (database_) {
        database_.reset();
        logger_->info("Clinic database closed");
    }
    if (owns_logger_) {
        integration::logger_adapter::shutdown();
        owns_logger_ = false;
    }
}

// =============================================================================
// Command Loop
// =============================================================================

auto desk_app::run() -> int {
    out_ << "dental_desk - type 'help' for the list of commands\n";

    std::string line;
    while (true) {
        out_ << "\ndental> " << std::flush;
        if (!std::getline(in_, line)) {
            out_ << "\n";
            break;
        }
        if (!execute(line)) {
            break;
        }
    }
    return 0;
}

auto desk_app::execute(std::string_view line) -> bool {
    auto trimmed = core::trim(line);
    if (trimmed.empty()) {
        return true;
    }

    auto space = trimmed.find_first_of(" \t");
    auto command = to_lower(trimmed.substr(0, space));
    auto argument = space == std::string::npos ? std::string{}
                                               : core::trim(trimmed.substr(space));

    if (!clinic_ && command != "help" && command != "quit" && command != "exit") {
        out_ << "The clinic database is not open.\n";
        return true;
    }

    if (command == "list") {
        cmd_list("");
    } else if (command == "search") {
        cmd_list(argument);
    } else if (command == "add") {
        cmd_add();
    } else if (command == "modify") {
        cmd_modify();
    } else if (command == "delete") {
        cmd_delete();
    } else if (command == "teeth") {
        cmd_teeth();
    } else if (command == "reminders") {
        cmd_reminders();
    } else if (command == "help") {
        print_commands();
    } else if (command == "quit" || command == "exit") {
        return false;
    } else {
        out_ << "Unknown command '" << command << "'. Type 'help' for the list.\n";
    }
    return true;
}

void desk_app::print_commands() {
    out_ << R"(
Commands:
  list              Show every patient and appointment
  search <term>     Show records whose patient fields or appointment
                    treatment contain <term>
  add               Add or update a patient and book an appointment
  modify            Edit a patient selected by phone number
  delete            Delete a patient and all of its appointments
  teeth             Edit the teeth location of a patient
  reminders         Show today's appointments
  help              Show this list
  quit              Leave dental_desk
)";
}

// =============================================================================
// Commands
// =============================================================================

void desk_app::cmd_list(std::string_view term) {
    auto result = clinic_->search(term);
    if (result.is_err()) {
        show_error(result.error());
        return;
    }

    const std::vector<std::string> headers = {
        "Patient", "Phone",   "Patient Treatment", "Teeth Location", "Date",
        "Treatment", "Dentist", "Fee",             "Notes"};

    std::vector<std::vector<std::string>> rows;
    for (const auto& entry : result.value()) {
        const auto& patient = entry.patient;
        if (entry.appointments.empty()) {
            rows.push_back({patient.name, patient.phone, patient.treatment_type,
                            patient.teeth_location, "", "", "", "", ""});
            continue;
        }
        for (const auto& appointment : entry.appointments) {
            rows.push_back({patient.name, patient.phone, patient.treatment_type,
                            patient.teeth_location,
                            core::format_date(appointment.date),
                            appointment.treatment_type, appointment.dentist,
                            format_fee(appointment.fee), appointment.notes});
        }
    }

    std::vector<std::size_t> widths;
    for (const auto& header : headers) {
        widths.push_back(display_width(header));
    }
    for (const auto& row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::min(max_column_width, std::max(widths[i], display_width(row[i])));
        }
    }

    out_ << "\n";
    print_row(out_, headers, widths);
    print_separator(out_, widths);
    for (const auto& row : rows) {
        print_row(out_, row, widths);
    }
    out_ << "\n" << result.value().size() << " patient(s) shown.\n";
}

void desk_app::cmd_add() {
    services::patient_form patient;
    services::appointment_form visit;

    out_ << "-- Patient Info --\n";
    auto name = prompt("Patient Name");
    if (!name) return show_cancelled();
    patient.name = *name;

    auto phone = prompt("Phone Number");
    if (!phone) return show_cancelled();
    patient.phone = *phone;

    auto treatment = prompt("Patient Treatment (optional)");
    if (!treatment) return show_cancelled();
    patient.treatment_type = *treatment;

    auto pick_teeth = confirm("Select teeth?");
    if (!pick_teeth) return show_cancelled();
    if (*pick_teeth) {
        auto teeth = select_teeth("");
        if (teeth) {
            patient.teeth_location = *teeth;
        }
    }

    out_ << "-- Appointment Info --\n";
    auto date = prompt("Appointment Date (YYYY-MM-DD)", core::format_date(core::today()));
    if (!date) return show_cancelled();
    visit.date = *date;

    auto visit_treatment = choose("Treatment Type", config_.clinic.treatments);
    if (!visit_treatment) return show_cancelled();
    visit.treatment_type = *visit_treatment;

    auto dentist = choose("Dentist", config_.clinic.dentists);
    if (!dentist) return show_cancelled();
    visit.dentist = *dentist;

    auto fee = prompt("Fee (optional)");
    if (!fee) return show_cancelled();
    visit.fee = *fee;

    auto notes = prompt("Notes (optional)");
    if (!notes) return show_cancelled();
    visit.notes = *notes;

    auto result = clinic_->add_patient_with_appointment(patient, visit);
    if (result.is_err()) {
        show_error(result.error());
        return;
    }

    out_ << "Patient '" << result.value().patient.name
         << "' and appointment added successfully.\n";
}

void desk_app::cmd_modify() {
    auto existing = prompt_existing_patient();
    if (!existing) return;

    services::patient_form form;
    form.phone = existing->phone;

    auto name = prompt("Patient Name", existing->name);
    if (!name) return show_cancelled();
    form.name = *name;

    auto treatment = prompt("Patient Treatment ('-' to clear)", existing->treatment_type);
    if (!treatment) return show_cancelled();
    form.treatment_type = core::trim(*treatment) == "-" ? std::string{} : *treatment;

    form.teeth_location = existing->teeth_location;
    auto pick_teeth = confirm("Edit teeth?");
    if (!pick_teeth) return show_cancelled();
    if (*pick_teeth) {
        auto teeth = select_teeth(existing->teeth_location);
        if (teeth) {
            form.teeth_location = *teeth;
        }
    }

    auto result = clinic_->modify_patient(form);
    if (result.is_err()) {
        show_error(result.error());
        return;
    }
    out_ << "Patient details updated.\n";
}

void desk_app::cmd_delete() {
    auto existing = prompt_existing_patient();
    if (!existing) return;

    auto sure = confirm(compat::format(
        "Are you sure you want to delete patient '{}'?", existing->name));
    if (!sure) return show_cancelled();
    if (!*sure) {
        out_ << "Nothing deleted.\n";
        return;
    }

    auto result = clinic_->delete_patient(existing->phone);
    if (result.is_err()) {
        show_error(result.error());
        return;
    }
    out_ << "Patient with phone '" << existing->phone << "' deleted ("
         << result.value() << " appointment(s) removed).\n";
}

void desk_app::cmd_teeth() {
    auto existing = prompt_existing_patient();
    if (!existing) return;

    auto teeth = select_teeth(existing->teeth_location);
    if (!teeth) {
        out_ << "Teeth location unchanged.\n";
        return;
    }

    services::patient_form form;
    form.name = existing->name;
    form.phone = existing->phone;
    form.treatment_type = existing->treatment_type;
    form.teeth_location = *teeth;

    auto result = clinic_->modify_patient(form);
    if (result.is_err()) {
        show_error(result.error());
        return;
    }
    out_ << "Teeth location for '" << result.value().name << "': "
         << (result.value().teeth_location.empty() ? "(none)"
                                                   : result.value().teeth_location)
         << "\n";
}

void desk_app::cmd_reminders() {
    auto lines = clinic_->reminder_lines(core::today());
    if (lines.is_err()) {
        show_error(lines.error());
        return;
    }

    out_ << "Appointment Reminders\n";
    for (const auto& line : lines.value()) {
        out_ << "  " << line << "\n";
    }
}

// =============================================================================
// Teeth Selector
// =============================================================================

void desk_app::render_teeth(std::ostream& out,
                            const core::teeth_selection& selection) {
    auto render_quadrant = [&](core::quadrant q) {
        std::string cells;
        for (int position : core::display_positions(q)) {
            auto id = core::make_tooth_id(q, position);
            cells += selection.contains(id) ? compat::format("[{}]", position)
                                            : compat::format(" {} ", position);
        }
        return cells;
    };
    auto heading = [](core::quadrant q) {
        return compat::format("{} ({})", core::quadrant_label(q),
                              core::quadrant_prefix(q));
    };

    using core::quadrant;
    const std::pair<quadrant, quadrant> rows[] = {
        {quadrant::upper_left, quadrant::upper_right},
        {quadrant::lower_left, quadrant::lower_right}};

    for (const auto& [left, right] : rows) {
        out << compat::format("  {:<24} | {}\n", heading(left), heading(right));
        out << compat::format("  {:<24} | {}\n", render_quadrant(left),
                              render_quadrant(right));
    }
}

auto desk_app::select_teeth(std::string_view initial) -> std::optional<std::string> {
    core::teeth_selection selection(initial);

    while (true) {
        out_ << "\n";
        render_teeth(out_, selection);
        out_ << "Selected: " << (selection.empty() ? "(none)" : selection.to_string())
             << "\n";

        auto line = prompt("Toggle teeth (e.g. UL3 LR5), 'clear', 'ok' or 'cancel'");
        if (!line) {
            return std::nullopt;
        }

        auto command = to_lower(core::trim(*line));
        if (command == "ok") {
            return selection.to_string();
        }
        if (command == "cancel") {
            return std::nullopt;
        }
        if (command == "clear") {
            selection.clear();
            continue;
        }

        for (const auto& token : split_tokens(*line)) {
            auto id = to_upper(token);
            if (!core::is_valid_tooth_id(id)) {
                out_ << "Unknown tooth '" << token << "'\n";
                continue;
            }
            selection.toggle(id);
        }
    }
}

// =============================================================================
// Form Helpers
// =============================================================================

auto desk_app::prompt(std::string_view label, std::string_view current)
    -> std::optional<std::string> {
    out_ << label;
    if (!current.empty()) {
        out_ << " [" << current << "]";
    }
    out_ << ": " << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        return std::nullopt;
    }
    if (core::trim(line).empty() && !current.empty()) {
        return std::string(current);
    }
    return line;
}

auto desk_app::choose(std::string_view label, const std::vector<std::string>& options)
    -> std::optional<std::string> {
    for (std::size_t i = 0; i < options.size(); ++i) {
        out_ << "  " << (i + 1) << ") " << options[i] << "\n";
    }

    while (true) {
        auto answer = prompt(label);
        if (!answer) {
            return std::nullopt;
        }

        auto trimmed = core::trim(*answer);
        if (trimmed.empty()) {
            // Left to validation, which reports the field as required
            return std::string{};
        }

        if (std::all_of(trimmed.begin(), trimmed.end(),
                        [](unsigned char c) { return std::isdigit(c) != 0; }) &&
            trimmed.size() < 4) {
            auto index = static_cast<std::size_t>(std::stoi(trimmed));
            if (index >= 1 && index <= options.size()) {
                return options[index - 1];
            }
        }

        auto lower = to_lower(trimmed);
        for (const auto& option : options) {
            if (to_lower(option) == lower) {
                return option;
            }
        }

        out_ << "Please choose 1-" << options.size() << " or type one of the names.\n";
    }
}

auto desk_app::confirm(std::string_view question) -> std::optional<bool> {
    auto answer = prompt(compat::format("{} [y/N]", question));
    if (!answer) {
        return std::nullopt;
    }
    auto lower = to_lower(core::trim(*answer));
    return lower == "y" || lower == "yes";
}

auto desk_app::prompt_existing_patient() -> std::optional<storage::patient_record> {
    auto phone = prompt("Patient Phone Number");
    if (!phone) {
        show_cancelled();
        return std::nullopt;
    }

    auto found = clinic_->find_patient(*phone);
    if (found.is_err()) {
        show_error(found.error());
        return std::nullopt;
    }
    if (!found.value().has_value()) {
        out_ << "Patient not found.\n";
        return std::nullopt;
    }
    return found.value();
}

void desk_app::show_error(const error_info& error) {
    out_ << to_string(classify_error(error)) << ": " << error.message << "\n";
}

void desk_app::show_cancelled() {
    out_ << "\nCancelled, nothing was saved.\n";
}

}  // namespace dental::desk
