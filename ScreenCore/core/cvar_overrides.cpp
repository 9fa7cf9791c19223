#include "cvar_overrides.hpp"

#include <charconv>
#include <cmath>
#include <limits>

#include <spdlog/fmt/fmt.h>

#include "console/cvars.hpp"
#include "core/system_interface.hpp"

static std::shared_ptr<spdlog::logger> logger;

static CVarType get_cvar_type(const std::string_view cvar_name) {
    const auto type = CVarSystem::Get()->GetCVarType(StringUtils::StringHash{cvar_name});
    if(!type) {
        throw CvarNotFoundException{fmt::format("No such cvar: {}", cvar_name)};
    }

    return *type;
}

static int32_t to_int32(const std::string_view cvar_name, const double value) {
    if(!std::isfinite(value) || std::trunc(value) != value ||
       value < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
       value > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        throw CvarTypeMismatchException{
            fmt::format("CVar {} holds a 32-bit integer, but was given {}", cvar_name, value)
        };
    }

    return static_cast<int32_t>(value);
}

/**
 * Throws unless the cvar is a plain integer, or an enum that has the value
 */
static void check_enum_value(const std::string_view cvar_name, const int32_t value) {
    const auto values = CVarSystem::Get()->GetEnumValues(StringUtils::StringHash{cvar_name});
    if(values.empty()) {
        return;
    }

    for(const auto& enum_value : values) {
        if(enum_value.value == value) {
            return;
        }
    }

    throw CvarTypeMismatchException{fmt::format("{} is not a valid value for CVar {}", value, cvar_name)};
}

static void set_int_cvar(const std::string_view cvar_name, const int32_t value) {
    check_enum_value(cvar_name, value);

    CVarSystem::Get()->SetIntCVar(StringUtils::StringHash{cvar_name}, value);
    logger->debug("{} = {}", cvar_name, value);
}

namespace CvarOverrides {
    void set_number(const std::string_view cvar_name, const double value) {
        if(logger == nullptr) {
            logger = SystemInterface::get().get_logger("CvarOverrides");
        }

        switch(get_cvar_type(cvar_name)) {
        case CVarType::INT:
            set_int_cvar(cvar_name, to_int32(cvar_name, value));
            break;

        case CVarType::FLOAT:
            CVarSystem::Get()->SetFloatCVar(StringUtils::StringHash{cvar_name}, value);
            logger->debug("{} = {}", cvar_name, value);
            break;

        case CVarType::STRING:
            throw CvarTypeMismatchException{fmt::format("CVar {} holds a string, but was given a number", cvar_name)};
        }
    }

    void set_string(const std::string_view cvar_name, const std::string& value) {
        if(logger == nullptr) {
            logger = SystemInterface::get().get_logger("CvarOverrides");
        }

        switch(get_cvar_type(cvar_name)) {
        case CVarType::STRING:
            CVarSystem::Get()->SetStringCVar(StringUtils::StringHash{cvar_name}, value.c_str());
            logger->debug("{} = {}", cvar_name, value);
            break;

        case CVarType::INT: {
            for(const auto& enum_value : CVarSystem::Get()->GetEnumValues(StringUtils::StringHash{cvar_name})) {
                if(enum_value.name == value) {
                    set_int_cvar(cvar_name, enum_value.value);
                    return;
                }
            }

            auto parsed = int32_t{};
            const auto [end, error] = std::from_chars(value.data(), value.data() + value.size(), parsed);
            if(error != std::errc{} || end != value.data() + value.size()) {
                throw CvarTypeMismatchException{
                    fmt::format("CVar {} holds an integer, but was given \"{}\"", cvar_name, value)
                };
            }
            set_int_cvar(cvar_name, parsed);
        }
            break;

        case CVarType::FLOAT:
            throw CvarTypeMismatchException{
                fmt::format("CVar {} holds a number, but was given \"{}\"", cvar_name, value)
            };
        }
    }
}
