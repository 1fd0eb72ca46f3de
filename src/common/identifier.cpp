#include "hovel/common/identifier.hpp"

#include "hovel/common/errors.hpp"

#include <cctype>
#include <string>

namespace hovel {

namespace {

bool is_valid_name_char(unsigned char ch) noexcept
{
    return std::isalnum(ch) != 0 || ch == '_';
}

}  // namespace

bool is_valid_name(std::string_view name) noexcept
{
    if (name.empty()) {
        return false;
    }
    for (char ch : name) {
        if (!is_valid_name_char(static_cast<unsigned char>(ch))) {
            return false;
        }
    }
    return true;
}

void validate_name(std::string_view name)
{
    if (!is_valid_name(name)) {
        throw_error(EngineErrc::InvalidName,
                    "Name " + std::string{name} + " cannot be used for a table or a column");
    }
}

}  // namespace hovel
