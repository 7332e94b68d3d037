#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace cloudstrap::util {

/*
  Random material backed by OpenSSL's CSPRNG.
*/

// Uniformly draws `length` characters from `alphabet` (rejection sampling,
// no modulo bias). Throws std::runtime_error if the CSPRNG fails.
std::string RandomString(std::string_view alphabet, std::size_t length);

// prefix + 15 characters from letters, digits and "@#$%".
std::string GenerateDatabasePassword(std::string_view prefix);

std::string Base64Encode(std::string_view data);

} // namespace cloudstrap::util
