/**
 * @file clinic_service.cpp
 * @brief Implementation of the clinic workflows
 */

#include <dental/services/clinic_service.hpp>

#include <dental/compat/format.hpp>
#include <dental/core/teeth_selection.hpp>
#include <dental/core/validation.hpp>

#include <utility>

namespace dental::services {

using kcenon::common::make_error;

namespace {

/**
 * @brief Resolve the appointment date field; blank means today
 */
auto resolve_date(std::string_view text) -> Result<core::clinic_date> {
    auto trimmed = core::trim(text);
    if (trimmed.empty()) {
        return core::today();
    }

    auto parsed = core::parse_date(trimmed);
    if (!parsed.has_value()) {
        return make_error<core::clinic_date>(
            error_codes::invalid_date,
            compat::format("Invalid appointment date '{}', expected YYYY-MM-DD.",
                           trimmed),
            "validation");
    }
    return *parsed;
}

/**
 * @brief Canonical form of a teeth selection entered as free text
 */
auto canonical_teeth(std::string_view text) -> std::string {
    return core::serialize_teeth(core::parse_teeth(text));
}

}  // namespace

clinic_service::clinic_service(storage::clinic_database& database,
                               std::shared_ptr<di::ILogger> logger)
    : database_(database),
      logger_(logger ? std::move(logger) : di::null_logger()) {}

// =============================================================================
// User Actions
// =============================================================================

auto clinic_service::add_patient_with_appointment(const patient_form& patient,
                                                  const appointment_form& visit)
    -> Result<saved_visit> {
    auto name = core::check_required(patient.name, "Patient name cannot be empty.");
    if (name.is_err()) {
        report_failure("save patient and appointment", name.error());
        return Result<saved_visit>(name.error());
    }

    auto phone = core::check_phone(patient.phone);
    if (phone.is_err()) {
        report_failure("save patient and appointment", phone.error());
        return Result<saved_visit>(phone.error());
    }

    auto date = resolve_date(visit.date);
    if (date.is_err()) {
        report_failure("save patient and appointment", date.error());
        return Result<saved_visit>(date.error());
    }

    auto treatment = core::check_required(visit.treatment_type,
                                          "Appointment treatment type is required.");
    if (treatment.is_err()) {
        report_failure("save patient and appointment", treatment.error());
        return Result<saved_visit>(treatment.error());
    }

    auto dentist = core::check_required(visit.dentist, "Dentist name is required.");
    if (dentist.is_err()) {
        report_failure("save patient and appointment", dentist.error());
        return Result<saved_visit>(dentist.error());
    }

    auto fee = core::check_optional_fee(visit.fee);
    if (fee.is_err()) {
        report_failure("save patient and appointment", fee.error());
        return Result<saved_visit>(fee.error());
    }

    auto patient_treatment = core::trim(patient.treatment_type);
    auto teeth = canonical_teeth(patient.teeth_location);
    auto notes = core::trim(visit.notes);

    std::lock_guard lock(mutex_);

    auto result = database_.transaction([&]() -> Result<saved_visit> {
        auto stored = database_.upsert_patient(name.value(), phone.value(),
                                               patient_treatment, teeth);
        if (stored.is_err()) {
            return Result<saved_visit>(stored.error());
        }

        auto appointment = database_.add_appointment(
            stored.value(), date.value(), treatment.value(), dentist.value(),
            fee.value(), notes);
        if (appointment.is_err()) {
            return Result<saved_visit>(appointment.error());
        }

        return saved_visit{std::move(stored.value()),
                           std::move(appointment.value())};
    });

    if (result.is_err()) {
        report_failure("save patient and appointment", result.error());
        return result;
    }

    logger_->info_fmt("Patient '{}' and appointment on {} saved",
                      result.value().patient.name,
                      core::format_date(result.value().appointment.date));
    return result;
}

auto clinic_service::modify_patient(const patient_form& patient)
    -> Result<storage::patient_record> {
    auto phone = core::check_phone(patient.phone);
    if (phone.is_err()) {
        report_failure("modify patient", phone.error());
        return Result<storage::patient_record>(phone.error());
    }

    auto name = core::check_required(patient.name, "Patient name cannot be empty.");
    if (name.is_err()) {
        report_failure("modify patient", name.error());
        return Result<storage::patient_record>(name.error());
    }

    auto treatment = core::trim(patient.treatment_type);
    auto teeth = canonical_teeth(patient.teeth_location);

    std::lock_guard lock(mutex_);

    auto result = database_.update_patient_fields(phone.value(), name.value(),
                                                  treatment, teeth);
    if (result.is_err()) {
        report_failure("modify patient", result.error());
        return result;
    }

    logger_->info_fmt("Patient with phone '{}' updated", phone.value());
    return result;
}

auto clinic_service::delete_patient(std::string_view phone)
    -> Result<std::size_t> {
    auto valid_phone = core::check_phone(phone);
    if (valid_phone.is_err()) {
        report_failure("delete patient", valid_phone.error());
        return Result<std::size_t>(valid_phone.error());
    }

    std::lock_guard lock(mutex_);

    auto result = database_.delete_patient_by_phone(valid_phone.value());
    if (result.is_err()) {
        report_failure("delete patient", result.error());
        return result;
    }

    logger_->info_fmt("Patient with phone '{}' deleted ({} appointment(s) removed)",
                      valid_phone.value(), result.value());
    return result;
}

auto clinic_service::find_patient(std::string_view phone)
    -> Result<std::optional<storage::patient_record>> {
    auto valid_phone = core::check_phone(phone);
    if (valid_phone.is_err()) {
        return Result<std::optional<storage::patient_record>>(valid_phone.error());
    }

    std::lock_guard lock(mutex_);

    auto result = database_.find_patient_by_phone(valid_phone.value());
    if (result.is_err()) {
        report_failure("look up patient", result.error());
    }
    return result;
}

auto clinic_service::search(std::string_view term)
    -> Result<std::vector<storage::patient_with_appointments>> {
    auto trimmed = core::trim(term);

    std::lock_guard lock(mutex_);

    auto result = database_.search_patients(trimmed);
    if (result.is_err()) {
        report_failure("search records", result.error());
        return result;
    }

    logger_->debug_fmt("Search '{}' matched {} patient(s)", trimmed,
                       result.value().size());
    return result;
}

// =============================================================================
// Reminders
// =============================================================================

auto clinic_service::reminders_on(const core::clinic_date& date)
    -> Result<std::vector<storage::appointment_reminder>> {
    std::lock_guard lock(mutex_);

    auto result = database_.appointments_on_date(date);
    if (result.is_err()) {
        report_failure("retrieve appointment reminders", result.error());
    }
    return result;
}

auto clinic_service::reminder_lines(const core::clinic_date& date)
    -> Result<std::vector<std::string>> {
    auto reminders = reminders_on(date);
    if (reminders.is_err()) {
        return Result<std::vector<std::string>>(reminders.error());
    }

    std::vector<std::string> lines;
    if (reminders.value().empty()) {
        lines.emplace_back("No appointments scheduled for today.");
        return lines;
    }

    lines.reserve(reminders.value().size());
    for (const auto& reminder : reminders.value()) {
        lines.push_back(format_reminder(reminder));
    }
    return lines;
}

auto clinic_service::refresh(const core::clinic_date& date)
    -> Result<refresh_summary> {
    std::lock_guard lock(mutex_);

    auto patients = database_.patient_count();
    if (patients.is_err()) {
        report_failure("refresh records", patients.error());
        return Result<refresh_summary>(patients.error());
    }

    auto due = database_.appointments_on_date(date);
    if (due.is_err()) {
        report_failure("refresh records", due.error());
        return Result<refresh_summary>(due.error());
    }

    refresh_summary summary;
    summary.date = date;
    summary.patient_count = patients.value();
    summary.appointments_today = due.value().size();

    if (summary.appointments_today > 0) {
        logger_->info_fmt("There are {} appointment(s) scheduled for today.",
                          summary.appointments_today);
    }
    return summary;
}

auto clinic_service::format_reminder(const storage::appointment_reminder& reminder)
    -> std::string {
    const auto& appointment = reminder.appointment;
    return compat::format("{} has an appointment for {} with Dr. {} today ({}).",
                          reminder.patient_name, appointment.treatment_type,
                          appointment.dentist, core::format_date(appointment.date));
}

// =============================================================================
// Internal Helpers
// =============================================================================

void clinic_service::report_failure(std::string_view action,
                                    const error_info& error) {
    switch (classify_error(error)) {
        case error_kind::validation:
        case error_kind::not_found:
            logger_->warn_fmt("Cannot {}: {}", action, error.message);
            break;
        case error_kind::store:
            logger_->error_fmt("Failed to {}, changes rolled back: {} (code {})",
                               action, error.message, error.code);
            break;
    }
}

}  // namespace dental::services
