// cvars.h : console variable system

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <magic_enum.hpp>
#include <tl/optional.hpp>

#include "console/string_utils.hpp"

class CVarParameter;

enum class CVarType : char
{
	INT,
	FLOAT,
	STRING,
};

enum class CVarFlags : uint32_t
{
	None = 0,
	Noedit = 1 << 1,
	EditReadOnly = 1 << 2,
	Advanced = 1 << 3,

	EditCheckbox = 1 << 8,
	EditFloatDrag = 1 << 9,
};

/**
 * One named value of an integer cvar that stores an enum
 */
struct CVarEnumValue
{
	int32_t value;
	std::string name;
};

class CVarSystem
{

public:
	static CVarSystem* Get();

	//pimpl
	virtual CVarParameter* GetCVar(StringUtils::StringHash hash) = 0;

	virtual tl::optional<CVarType> GetCVarType(StringUtils::StringHash hash) = 0;

	virtual double* GetFloatCVar(StringUtils::StringHash hash) = 0;

	virtual int32_t* GetIntCVar(StringUtils::StringHash hash) = 0;

	virtual const char* GetStringCVar(StringUtils::StringHash hash) = 0;

	virtual void SetFloatCVar(StringUtils::StringHash hash, double value) = 0;

	virtual void SetIntCVar(StringUtils::StringHash hash, int32_t value) = 0;

	virtual void SetStringCVar(StringUtils::StringHash hash, const char* value) = 0;

	virtual void SetEnumValues(StringUtils::StringHash hash, std::vector<CVarEnumValue> values) = 0;

	/**
	 * Values an enum cvar may hold. Empty for cvars that don't store an enum
	 */
	virtual std::vector<CVarEnumValue> GetEnumValues(StringUtils::StringHash hash) = 0;

	
	virtual CVarParameter* CreateFloatCVar(const char* name, const char* description, double defaultValue, double currentValue) = 0;
	
	virtual CVarParameter* CreateIntCVar(const char* name, const char* description, int32_t defaultValue, int32_t currentValue) = 0;
	
	virtual CVarParameter* CreateStringCVar(const char* name, const char* description, const char* defaultValue, const char* currentValue) = 0;

	/**
	 * Restores every cvar to the value it was registered with
	 */
	virtual void ResetToDefaults() = 0;
};

template<typename T>
struct AutoCVar
{
protected:
	int index;
	using CVarType = T;
};

struct AutoCVar_Float : AutoCVar<double>
{
	AutoCVar_Float(const char* name, const char* description, double defaultValue, CVarFlags flags = CVarFlags::None);

	double Get();
	double* GetPtr();
	float GetFloat();
	float* GetFloatPtr();
	void Set(double val);
};

struct AutoCVar_Int : AutoCVar<int32_t>
{
	AutoCVar_Int(const char* name, const char* description, int32_t defaultValue, CVarFlags flags = CVarFlags::None);
	int32_t Get();
	int32_t* GetPtr();
	void Set(int32_t val);

	void Toggle();
};

struct AutoCVar_String : AutoCVar<std::string>
{
	AutoCVar_String(const char* name, const char* description, const char* defaultValue, CVarFlags flags = CVarFlags::None);

	const char* Get();
	void Set(std::string&& val);
};

/**
 * Integer cvar that holds one of the values of EnumType. The enum's names are registered with the cvar system, so
 * the cvar can be set by name
 */
template <typename EnumType>
struct AutoCVar_Enum : AutoCVar_Int {
	AutoCVar_Enum(const char* name, const char* description, EnumType defaultValue, CVarFlags flags = CVarFlags::None);

	/**
	 * Returns the default value if the stored integer isn't one of the enum's values
	 */
	EnumType Get();

	void Set(EnumType val);

private:
	EnumType defaultValue;
};

template <typename EnumType>
AutoCVar_Enum<EnumType>::AutoCVar_Enum(
	const char* name, const char* description, EnumType defaultValue, CVarFlags flags
) : AutoCVar_Int{ name, description, static_cast<int32_t>(defaultValue), flags }, defaultValue{ defaultValue } {
	auto values = std::vector<CVarEnumValue>{};
	for (const auto& [value, value_name] : magic_enum::enum_entries<EnumType>()) {
		values.push_back(CVarEnumValue{ static_cast<int32_t>(value), std::string{ value_name } });
	}
	CVarSystem::Get()->SetEnumValues(StringUtils::StringHash{ name }, std::move(values));
}

template <typename EnumType>
EnumType AutoCVar_Enum<EnumType>::Get() {
	return magic_enum::enum_cast<EnumType>(AutoCVar_Int::Get()).value_or(defaultValue);
}

template <typename EnumType>
void AutoCVar_Enum<EnumType>::Set(EnumType val) {
	AutoCVar_Int::Set(static_cast<int32_t>(val));
}
