#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace hovel {

enum class EngineErrc {
    Success = 0,
    TableNotFound,
    TableAlreadyExists,
    ColumnNotFound,
    ColumnAlreadyExists,
    DatabaseNotFound,
    DatabaseAlreadyExists,
    CannotDropDefaultDb,
    NoColumns,
    InvalidName,
    InvalidEmail,
    InvalidValue,
    IncompleteData,
    InvalidDataType,
    InvalidOperation,
    IoError
};

const std::error_category& engine_error_category() noexcept;
std::error_code make_error_code(EngineErrc value) noexcept;

// Error raised inside the core; Engine::execute turns it into a QueryResult.
class Error final : public std::system_error {
public:
    Error(EngineErrc code, const std::string& message);
    Error(std::error_code code, const std::string& message);

    // Message without the category suffix that what() appends.
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

private:
    std::string detail_{};
};

// Unreadable or malformed persisted schema. Never converted into a query error.
class SchemaCorruptedError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

[[noreturn]] void throw_error(EngineErrc code, const std::string& message);
[[noreturn]] void throw_io_error(std::error_code cause, const std::string& what);

// Transport status class (HTTP-like) for an engine error code.
[[nodiscard]] int status_class(std::error_code code) noexcept;

}  // namespace hovel

namespace std {

template <>
struct is_error_code_enum<hovel::EngineErrc> : true_type {
};

}  // namespace std
