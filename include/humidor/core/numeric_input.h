#pragma once

#include <cstdint>
#include <string>

namespace humidor {

// Text coming from edit fields. A leading '$' and surrounding whitespace are
// accepted; anything else that is not a finite number is rejected.
bool ParseDecimalText(const std::string& text, double* out, std::string* error);

// Whole, non-negative unit counts.
bool ParseCountText(const std::string& text, std::int32_t* out, std::string* error);

}  // namespace humidor
