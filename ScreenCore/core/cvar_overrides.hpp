#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

class CvarNotFoundException final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class CvarTypeMismatchException final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Sets cvars by name from outside the code that declares them, e.g. from a config file
 *
 * Numbers are converted to the cvar's storage type. An integer cvar only accepts whole numbers that fit in 32 bits,
 * and an enum cvar only accepts its enum's values. A string sets a string cvar, an enum cvar by value name, or an
 * integer cvar by its value written as text
 */
namespace CvarOverrides {
    void set_number(std::string_view cvar_name, double value);

    void set_string(std::string_view cvar_name, const std::string& value);
}
