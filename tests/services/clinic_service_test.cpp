/**
 * @file clinic_service_test.cpp
 * @brief Unit tests for the form-level clinic workflows
 */

#include <dental/services/clinic_service.hpp>

#include "mocks/mock_logger.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sqlite3.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

using namespace dental;
using namespace dental::services;
using namespace dental::storage;
using dental::di::testing::mock_logger;
using dental::integration::log_level;

namespace {

auto create_test_database() -> std::unique_ptr<clinic_database> {
    auto result = clinic_database::open(":memory:");
    REQUIRE(result.is_ok());
    return std::move(result.value());
}

auto ann_form() -> patient_form {
    return patient_form{"Ann", "+10000000", "Cleaning", "UR2,LL1"};
}

auto cleaning_visit() -> appointment_form {
    return appointment_form{"2024-03-01", "Cleaning", "Noha", "25.5", "First visit"};
}

}  // namespace

// ============================================================================
// Add Patient With Appointment
// ============================================================================

TEST_CASE("clinic_service: add stores patient and appointment together",
          "[services][clinic]") {
    auto db = create_test_database();
    auto logger = std::make_shared<mock_logger>();
    clinic_service clinic(*db, logger);

    auto result = clinic.add_patient_with_appointment(ann_form(), cleaning_visit());

    REQUIRE(result.is_ok());
    const auto& visit = result.value();
    CHECK(visit.patient.name == "Ann");
    CHECK(visit.patient.teeth_location == "LL1, UR2");
    CHECK(visit.appointment.patient_pk == visit.patient.pk);
    CHECK(core::format_date(visit.appointment.date) == "2024-03-01");
    REQUIRE(visit.appointment.fee.has_value());
    CHECK(*visit.appointment.fee == 25.5);
    CHECK(visit.appointment.notes == "First visit");

    CHECK(db->patient_count().value() == 1);
    CHECK(db->appointment_count().value() == 1);
    CHECK(logger->contains(log_level::info, "Patient 'Ann'"));
}

TEST_CASE("clinic_service: fields are trimmed before saving",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    patient_form patient{"  Ann  ", " +10000000 ", " Cleaning ", ""};
    appointment_form visit{" 2024-03-01 ", " Cleaning ", " Noha ", " ", "  "};

    auto result = clinic.add_patient_with_appointment(patient, visit);

    REQUIRE(result.is_ok());
    CHECK(result.value().patient.name == "Ann");
    CHECK(result.value().patient.phone == "+10000000");
    CHECK(result.value().patient.treatment_type == "Cleaning");
    CHECK(result.value().appointment.dentist == "Noha");
    CHECK_FALSE(result.value().appointment.fee.has_value());
    CHECK(result.value().appointment.notes.empty());
}

TEST_CASE("clinic_service: blank appointment date means today",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    auto visit = cleaning_visit();
    visit.date = "";

    auto result = clinic.add_patient_with_appointment(ann_form(), visit);

    REQUIRE(result.is_ok());
    CHECK(result.value().appointment.date == core::today());
}

TEST_CASE("clinic_service: existing phone updates the patient",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    REQUIRE(clinic.add_patient_with_appointment(ann_form(), cleaning_visit()).is_ok());

    patient_form renamed{"Ann Lee", "+10000000", "Filling", ""};
    appointment_form second{"2024-03-05", "Filling", "Essam", "", ""};
    auto result = clinic.add_patient_with_appointment(renamed, second);

    REQUIRE(result.is_ok());
    CHECK(db->patient_count().value() == 1);
    CHECK(db->appointment_count().value() == 2);

    auto found = clinic.find_patient("+10000000");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    CHECK(found.value()->name == "Ann Lee");
    CHECK(found.value()->treatment_type == "Filling");
}

TEST_CASE("clinic_service: invalid input is rejected before the store",
          "[services][clinic][validation]") {
    auto db = create_test_database();
    auto logger = std::make_shared<mock_logger>();
    clinic_service clinic(*db, logger);

    auto patient = ann_form();
    auto visit = cleaning_visit();
    int expected_code = 0;

    SECTION("empty name") {
        patient.name = "   ";
        expected_code = error_codes::missing_required_field;
    }
    SECTION("malformed phone") {
        patient.phone = "123";
        expected_code = error_codes::invalid_phone;
    }
    SECTION("malformed date") {
        visit.date = "01/03/2024";
        expected_code = error_codes::invalid_date;
    }
    SECTION("missing treatment") {
        visit.treatment_type = "";
        expected_code = error_codes::missing_required_field;
    }
    SECTION("missing dentist") {
        visit.dentist = "";
        expected_code = error_codes::missing_required_field;
    }
    SECTION("negative fee") {
        visit.fee = "-10";
        expected_code = error_codes::invalid_fee;
    }
    SECTION("non-numeric fee") {
        visit.fee = "ten";
        expected_code = error_codes::invalid_fee;
    }

    auto result = clinic.add_patient_with_appointment(patient, visit);

    REQUIRE(result.is_err());
    CHECK(result.error().code == expected_code);
    CHECK(classify_error(result.error()) == error_kind::validation);
    CHECK(db->patient_count().value() == 0);
    CHECK(db->appointment_count().value() == 0);
    CHECK(logger->count(log_level::warn) == 1);
    CHECK(logger->count(log_level::error) == 0);
}

TEST_CASE("clinic_service: name is checked before phone",
          "[services][clinic][validation]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    patient_form patient{"", "bad", "", ""};
    auto result = clinic.add_patient_with_appointment(patient, cleaning_visit());

    REQUIRE(result.is_err());
    CHECK(result.error().message == "Patient name cannot be empty.");
}

TEST_CASE("clinic_service: store failure rolls back and logs an error",
          "[services][clinic][store]") {
    const auto test_path =
        (std::filesystem::temp_directory_path() / "dental_service_store_test.sqlite")
            .string();
    std::filesystem::remove(test_path);

    {
        auto opened = clinic_database::open(test_path);
        REQUIRE(opened.is_ok());
        auto db = std::move(opened.value());
        auto logger = std::make_shared<mock_logger>();
        clinic_service clinic(*db, logger);

        // Break the appointments table behind the service's back
        sqlite3* other = nullptr;
        REQUIRE(sqlite3_open(test_path.c_str(), &other) == SQLITE_OK);
        REQUIRE(sqlite3_exec(other, "DROP TABLE appointments;", nullptr, nullptr,
                             nullptr) == SQLITE_OK);
        sqlite3_close(other);

        auto result = clinic.add_patient_with_appointment(ann_form(), cleaning_visit());

        REQUIRE(result.is_err());
        CHECK(classify_error(result.error()) == error_kind::store);
        CHECK(logger->count(log_level::error) == 1);
        CHECK(logger->contains(log_level::error, "changes rolled back"));

        // The patient upsert was part of the same unit of work
        CHECK(db->patient_count().value() == 0);
    }

    std::filesystem::remove(test_path);
    std::filesystem::remove(test_path + "-wal");
    std::filesystem::remove(test_path + "-shm");
}

// ============================================================================
// Modify / Delete / Find
// ============================================================================

TEST_CASE("clinic_service: modify overwrites patient fields",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);
    REQUIRE(clinic.add_patient_with_appointment(ann_form(), cleaning_visit()).is_ok());

    auto result = clinic.modify_patient(
        patient_form{"Ann Smith", "+10000000", "", "UL8, UL1"});

    REQUIRE(result.is_ok());
    CHECK(result.value().name == "Ann Smith");
    CHECK(result.value().treatment_type.empty());
    CHECK(result.value().teeth_location == "UL1, UL8");
    CHECK(db->appointment_count().value() == 1);
}

TEST_CASE("clinic_service: modify unknown phone is not found",
          "[services][clinic]") {
    auto db = create_test_database();
    auto logger = std::make_shared<mock_logger>();
    clinic_service clinic(*db, logger);

    auto result = clinic.modify_patient(patient_form{"Ann", "+10000000", "", ""});

    REQUIRE(result.is_err());
    CHECK(classify_error(result.error()) == error_kind::not_found);
    CHECK(logger->count(log_level::warn) == 1);
}

TEST_CASE("clinic_service: delete removes patient and appointments",
          "[services][clinic]") {
    auto db = create_test_database();
    auto logger = std::make_shared<mock_logger>();
    clinic_service clinic(*db, logger);
    REQUIRE(clinic.add_patient_with_appointment(ann_form(), cleaning_visit()).is_ok());
    auto second = cleaning_visit();
    second.date = "2024-04-01";
    REQUIRE(clinic.add_patient_with_appointment(ann_form(), second).is_ok());

    auto result = clinic.delete_patient(" +10000000 ");

    REQUIRE(result.is_ok());
    CHECK(result.value() == 2);
    CHECK(db->patient_count().value() == 0);
    CHECK(db->appointment_count().value() == 0);
    CHECK(logger->contains(log_level::info, "2 appointment(s) removed"));
}

TEST_CASE("clinic_service: delete unknown phone is not found",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    auto result = clinic.delete_patient("+10000000");

    REQUIRE(result.is_err());
    CHECK(result.error().code == error_codes::patient_not_found);
}

TEST_CASE("clinic_service: find_patient validates the phone",
          "[services][clinic]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    auto invalid = clinic.find_patient("abc");
    REQUIRE(invalid.is_err());
    CHECK(invalid.error().code == error_codes::invalid_phone);

    auto absent = clinic.find_patient("+10000000");
    REQUIRE(absent.is_ok());
    CHECK_FALSE(absent.value().has_value());
}

// ============================================================================
// Search
// ============================================================================

TEST_CASE("clinic_service: search filters by treatment", "[services][search]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    REQUIRE(clinic.add_patient_with_appointment(
        patient_form{"Ann", "+10000000", "Cleaning", ""},
        appointment_form{"2024-03-01", "Cleaning", "Noha", "", ""}).is_ok());
    REQUIRE(clinic.add_patient_with_appointment(
        patient_form{"Bob", "+20000000", "Filling", ""},
        appointment_form{"2024-03-01", "Filling", "Essam", "", ""}).is_ok());

    auto filtered = clinic.search("  clean ");
    REQUIRE(filtered.is_ok());
    REQUIRE(filtered.value().size() == 1);
    CHECK(filtered.value()[0].patient.name == "Ann");

    auto everyone = clinic.search("");
    REQUIRE(everyone.is_ok());
    CHECK(everyone.value().size() == 2);
}

// ============================================================================
// Reminders and Refresh
// ============================================================================

TEST_CASE("clinic_service: reminder lines for a quiet day",
          "[services][reminder]") {
    auto db = create_test_database();
    clinic_service clinic(*db);

    auto lines = clinic.reminder_lines(core::today());

    REQUIRE(lines.is_ok());
    REQUIRE(lines.value().size() == 1);
    CHECK(lines.value()[0] == "No appointments scheduled for today.");
}

TEST_CASE("clinic_service: reminder lines name patient, treatment and dentist",
          "[services][reminder]") {
    auto db = create_test_database();
    clinic_service clinic(*db);
    auto today = core::today();

    REQUIRE(clinic.add_patient_with_appointment(
        patient_form{"Ann", "+10000000", "", ""},
        appointment_form{core::format_date(today), "Filling", "Noha", "", ""}).is_ok());
    REQUIRE(clinic.add_patient_with_appointment(
        patient_form{"Bob", "+20000000", "", ""},
        appointment_form{"2000-01-01", "Cleaning", "Essam", "", ""}).is_ok());

    auto reminders = clinic.reminders_on(today);
    REQUIRE(reminders.is_ok());
    REQUIRE(reminders.value().size() == 1);

    auto lines = clinic.reminder_lines(today);
    REQUIRE(lines.is_ok());
    REQUIRE(lines.value().size() == 1);
    CHECK(lines.value()[0] ==
          "Ann has an appointment for Filling with Dr. Noha today (" +
              core::format_date(today) + ").");
}

TEST_CASE("clinic_service: refresh counts today's appointments",
          "[services][reminder]") {
    auto db = create_test_database();
    auto logger = std::make_shared<mock_logger>();
    clinic_service clinic(*db, logger);
    auto today = core::today();

    SECTION("nothing booked is not announced") {
        auto summary = clinic.refresh(today);

        REQUIRE(summary.is_ok());
        CHECK(summary.value().patient_count == 0);
        CHECK(summary.value().appointments_today == 0);
        CHECK_FALSE(logger->contains(log_level::info, "scheduled for today"));
    }

    SECTION("booked appointments are announced") {
        REQUIRE(clinic.add_patient_with_appointment(
            patient_form{"Ann", "+10000000", "", ""},
            appointment_form{"", "Filling", "Noha", "", ""}).is_ok());
        logger->reset();

        auto summary = clinic.refresh(today);

        REQUIRE(summary.is_ok());
        CHECK(summary.value().date == today);
        CHECK(summary.value().patient_count == 1);
        CHECK(summary.value().appointments_today == 1);
        CHECK(logger->contains(log_level::info,
                               "There are 1 appointment(s) scheduled for today."));
    }
}
