#include "hovel/common/errors.hpp"

namespace hovel {

namespace {

class EngineErrorCategory final : public std::error_category {
public:
    const char* name() const noexcept override
    {
        return "hovel.engine";
    }

    std::string message(int condition) const override
    {
        switch (static_cast<EngineErrc>(condition)) {
        case EngineErrc::Success:
            return "success";
        case EngineErrc::TableNotFound:
            return "table not found";
        case EngineErrc::TableAlreadyExists:
            return "table already exists";
        case EngineErrc::ColumnNotFound:
            return "column not found";
        case EngineErrc::ColumnAlreadyExists:
            return "column already exists";
        case EngineErrc::DatabaseNotFound:
            return "database not found";
        case EngineErrc::DatabaseAlreadyExists:
            return "database already exists";
        case EngineErrc::CannotDropDefaultDb:
            return "cannot drop default database";
        case EngineErrc::NoColumns:
            return "table requires at least one column";
        case EngineErrc::InvalidName:
            return "invalid name";
        case EngineErrc::InvalidEmail:
            return "invalid email format";
        case EngineErrc::InvalidValue:
            return "invalid value for datatype";
        case EngineErrc::IncompleteData:
            return "incomplete data";
        case EngineErrc::InvalidDataType:
            return "invalid datatype";
        case EngineErrc::InvalidOperation:
            return "invalid operation";
        case EngineErrc::IoError:
            return "io error";
        default:
            return "unknown engine error";
        }
    }
};

const EngineErrorCategory kCategory{};

}  // namespace

const std::error_category& engine_error_category() noexcept
{
    return kCategory;
}

std::error_code make_error_code(EngineErrc value) noexcept
{
    return {static_cast<int>(value), engine_error_category()};
}

Error::Error(EngineErrc code, const std::string& message)
    : std::system_error{make_error_code(code), message}
    , detail_{message}
{
}

Error::Error(std::error_code code, const std::string& message)
    : std::system_error{code, message}
    , detail_{message}
{
}

void throw_error(EngineErrc code, const std::string& message)
{
    throw Error{code, message};
}

void throw_io_error(std::error_code cause, const std::string& what)
{
    throw Error{EngineErrc::IoError, "IO Error: " + what + ": " + cause.message()};
}

int status_class(std::error_code code) noexcept
{
    if (!code) {
        return 200;
    }
    if (code.category() != engine_error_category()) {
        return 500;
    }

    switch (static_cast<EngineErrc>(code.value())) {
    case EngineErrc::TableNotFound:
    case EngineErrc::ColumnNotFound:
    case EngineErrc::DatabaseNotFound:
        return 404;
    case EngineErrc::TableAlreadyExists:
    case EngineErrc::ColumnAlreadyExists:
    case EngineErrc::DatabaseAlreadyExists:
        return 409;
    case EngineErrc::CannotDropDefaultDb:
        return 403;
    case EngineErrc::NoColumns:
    case EngineErrc::InvalidName:
    case EngineErrc::InvalidEmail:
    case EngineErrc::InvalidValue:
    case EngineErrc::IncompleteData:
    case EngineErrc::InvalidDataType:
    case EngineErrc::InvalidOperation:
        return 400;
    case EngineErrc::IoError:
    default:
        return 500;
    }
}

}  // namespace hovel
