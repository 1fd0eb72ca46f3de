#pragma once

#include <string_view>

namespace hovel {

// Table, column and database names: non-empty, ASCII alphanumerics and '_'.
[[nodiscard]] bool is_valid_name(std::string_view name) noexcept;

// Throws Error{InvalidName} for a name rejected by is_valid_name.
void validate_name(std::string_view name);

}  // namespace hovel
