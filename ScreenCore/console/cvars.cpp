#include "cvars.hpp"

#include <shared_mutex>
#include <stdexcept>
#include <type_traits>

#include <EASTL/unordered_map.h>
#include <spdlog/fmt/fmt.h>

class CVarParameter
{
public:
	friend class CVarSystemImpl;

	int32_t arrayIndex;

	CVarType type;
	CVarFlags flags;
	std::string name;
	std::string description;

	std::vector<CVarEnumValue> enumValues;
};

template<typename T>
struct CVarStorage
{
	T initial;
	T current;
	CVarParameter* parameter;
};

template<typename T>
struct CVarArray
{
	CVarStorage<T>* cvars{ nullptr };
	int32_t lastCVar{ 0 };
	int32_t capacity;

	explicit CVarArray(size_t size) : capacity{ static_cast<int32_t>(size) }
	{
		cvars = new CVarStorage<T>[size]();
	}

	~CVarArray()
	{
		delete[] cvars;
	}

	CVarStorage<T>* GetCurrentStorage(int32_t index)
	{
		return &cvars[index];
	}

	T* GetCurrentPtr(int32_t index)
	{
		return &cvars[index].current;
	};

	T GetCurrent(int32_t index)
	{
		return cvars[index].current;
	};

	void SetCurrent(const T& val, int32_t index)
	{
		cvars[index].current = val;
	}

	int Add(const T& initialValue, const T& value, CVarParameter* param)
	{
		if (lastCVar >= capacity) {
			throw std::runtime_error{ fmt::format("Too many cvars, could not add {}", param->name) };
		}

		int index = lastCVar;

		cvars[index].current = value;
		cvars[index].initial = initialValue;
		cvars[index].parameter = param;

		param->arrayIndex = index;
		lastCVar++;
		return index;
	}

	void Reset()
	{
		for (int32_t i = 0; i < lastCVar; i++) {
			cvars[i].current = cvars[i].initial;
		}
	}
};

class CVarSystemImpl final : public CVarSystem
{
public:
	CVarParameter* GetCVar(StringUtils::StringHash hash) override final;

	CVarParameter* CreateFloatCVar(const char* name, const char* description, double defaultValue, double currentValue) override final;

	CVarParameter* CreateIntCVar(const char* name, const char* description, int32_t defaultValue, int32_t currentValue) override final;

	CVarParameter* CreateStringCVar(const char* name, const char* description, const char* defaultValue, const char* currentValue) override final;

	tl::optional<CVarType> GetCVarType(StringUtils::StringHash hash) override final;

	double* GetFloatCVar(StringUtils::StringHash hash) override final;
	int32_t* GetIntCVar(StringUtils::StringHash hash) override final;
	const char* GetStringCVar(StringUtils::StringHash hash) override final;

	void SetFloatCVar(StringUtils::StringHash hash, double value) override final;

	void SetIntCVar(StringUtils::StringHash hash, int32_t value) override final;

	void SetStringCVar(StringUtils::StringHash hash, const char* value) override final;

	void SetEnumValues(StringUtils::StringHash hash, std::vector<CVarEnumValue> values) override final;

	std::vector<CVarEnumValue> GetEnumValues(StringUtils::StringHash hash) override final;

	void ResetToDefaults() override final;

	constexpr static int MAX_INT_CVARS = 1000;
	CVarArray<int32_t> intCVars2{ MAX_INT_CVARS };

	constexpr static int MAX_FLOAT_CVARS = 1000;
	CVarArray<double> floatCVars{ MAX_FLOAT_CVARS };

	constexpr static int MAX_STRING_CVARS = 200;
	CVarArray<std::string> stringCVars{ MAX_STRING_CVARS };

	template<typename T>
	CVarArray<T>* GetCVarArray()
	{
		if constexpr (std::is_same_v<T, int32_t>) {
			return &intCVars2;
		} else if constexpr (std::is_same_v<T, double>) {
			return &floatCVars;
		} else {
			return &stringCVars;
		}
	}

	template<typename T>
	static constexpr CVarType TypeOf()
	{
		if constexpr (std::is_same_v<T, int32_t>) {
			return CVarType::INT;
		} else if constexpr (std::is_same_v<T, double>) {
			return CVarType::FLOAT;
		} else {
			return CVarType::STRING;
		}
	}

	template<typename T>
	static void CheckType(const CVarParameter& par)
	{
		if (par.type != TypeOf<T>()) {
			throw std::runtime_error{ fmt::format("CVar {} accessed with the wrong type", par.name) };
		}
	}

	template<typename T>
	T* GetCVarCurrent(uint32_t namehash) {
		CVarParameter* par = GetCVar(namehash);
		if (!par) {
			return nullptr;
		}
		else {
			CheckType<T>(*par);
			return GetCVarArray<T>()->GetCurrentPtr(par->arrayIndex);
		}
	}

	template<typename T>
	void SetCVarCurrent(uint32_t namehash, const T& value)
	{
		CVarParameter* cvar = GetCVar(namehash);
		if (cvar)
		{
			CheckType<T>(*cvar);
			GetCVarArray<T>()->SetCurrent(value, cvar->arrayIndex);
		}
	}

	static CVarSystemImpl* Get()
	{
		return static_cast<CVarSystemImpl*>(CVarSystem::Get());
	}

private:
	std::shared_mutex mutex_;

	CVarParameter* InitCVar(const char* name, const char* description);

	eastl::unordered_map<uint32_t, CVarParameter> savedCVars;
};

double* CVarSystemImpl::GetFloatCVar(StringUtils::StringHash hash)
{
	return GetCVarCurrent<double>(hash);
}

int32_t* CVarSystemImpl::GetIntCVar(StringUtils::StringHash hash)
{
	return GetCVarCurrent<int32_t>(hash);
}

const char* CVarSystemImpl::GetStringCVar(StringUtils::StringHash hash)
{
	auto* value = GetCVarCurrent<std::string>(hash);
	return value != nullptr ? value->c_str() : nullptr;
}

CVarSystem* CVarSystem::Get()
{
	static CVarSystemImpl cvarSys{};
	return &cvarSys;
}

CVarParameter* CVarSystemImpl::GetCVar(StringUtils::StringHash hash)
{
	std::shared_lock lock(mutex_);
	auto it = savedCVars.find(hash);

	if (it != savedCVars.end())
	{
		return &(*it).second;
	}

	return nullptr;
}

tl::optional<CVarType> CVarSystemImpl::GetCVarType(StringUtils::StringHash hash)
{
	if (auto* par = GetCVar(hash); par != nullptr) {
		return par->type;
	}

	return tl::nullopt;
}

void CVarSystemImpl::SetFloatCVar(StringUtils::StringHash hash, double value)
{
	SetCVarCurrent<double>(hash, value);
}

void CVarSystemImpl::SetIntCVar(StringUtils::StringHash hash, int32_t value)
{
	SetCVarCurrent<int32_t>(hash, value);
}

void CVarSystemImpl::SetStringCVar(StringUtils::StringHash hash, const char* value)
{
	SetCVarCurrent<std::string>(hash, value);
}

void CVarSystemImpl::SetEnumValues(StringUtils::StringHash hash, std::vector<CVarEnumValue> values)
{
	CVarParameter* par = GetCVar(hash);
	if (!par) {
		throw std::runtime_error{ fmt::format("No cvar with hash {} to attach enum values to", hash.computedHash) };
	}
	CheckType<int32_t>(*par);

	std::unique_lock lock(mutex_);
	par->enumValues = std::move(values);
}

std::vector<CVarEnumValue> CVarSystemImpl::GetEnumValues(StringUtils::StringHash hash)
{
	CVarParameter* par = GetCVar(hash);
	if (!par) {
		return {};
	}

	std::shared_lock lock(mutex_);
	return par->enumValues;
}

void CVarSystemImpl::ResetToDefaults()
{
	std::unique_lock lock(mutex_);
	intCVars2.Reset();
	floatCVars.Reset();
	stringCVars.Reset();
}

CVarParameter* CVarSystemImpl::CreateFloatCVar(const char* name, const char* description, double defaultValue, double currentValue)
{
	std::unique_lock lock(mutex_);
	CVarParameter* param = InitCVar(name, description);
	if (!param) return nullptr;

	param->type = CVarType::FLOAT;

	GetCVarArray<double>()->Add(defaultValue, currentValue, param);

	return param;
}

CVarParameter* CVarSystemImpl::CreateIntCVar(const char* name, const char* description, int32_t defaultValue, int32_t currentValue)
{
	std::unique_lock lock(mutex_);
	CVarParameter* param = InitCVar(name, description);
	if (!param) return nullptr;

	param->type = CVarType::INT;

	GetCVarArray<int32_t>()->Add(defaultValue, currentValue, param);

	return param;
}

CVarParameter* CVarSystemImpl::CreateStringCVar(const char* name, const char* description, const char* defaultValue, const char* currentValue)
{
	std::unique_lock lock(mutex_);
	CVarParameter* param = InitCVar(name, description);
	if (!param) return nullptr;

	param->type = CVarType::STRING;

	GetCVarArray<std::string>()->Add(defaultValue, currentValue, param);

	return param;
}

CVarParameter* CVarSystemImpl::InitCVar(const char* name, const char* description)
{
	uint32_t namehash = StringUtils::StringHash{ name };
	if (savedCVars.find(namehash) != savedCVars.end()) {
		return nullptr;
	}

	auto& param = savedCVars[namehash];
	param.name = name;
	param.description = description;
	param.flags = CVarFlags::None;

	return &param;
}

template<typename T>
T GetCVarCurrentByIndex(int32_t index) {
	return CVarSystemImpl::Get()->GetCVarArray<T>()->GetCurrent(index);
}

template<typename T>
T* PtrGetCVarCurrentByIndex(int32_t index) {
	return CVarSystemImpl::Get()->GetCVarArray<T>()->GetCurrentPtr(index);
}

template<typename T>
void SetCVarCurrentByIndex(int32_t index, const T& data) {
	CVarSystemImpl::Get()->GetCVarArray<T>()->SetCurrent(data, index);
}

AutoCVar_Float::AutoCVar_Float(const char* name, const char* description, double defaultValue, CVarFlags flags)
{
	CVarParameter* cvar = CVarSystem::Get()->CreateFloatCVar(name, description, defaultValue, defaultValue);
	if (cvar == nullptr) {
		throw std::runtime_error{ fmt::format("Duplicate cvar {}", name) };
	}
	cvar->flags = flags;
	index = cvar->arrayIndex;
}

double AutoCVar_Float::Get()
{
	return GetCVarCurrentByIndex<CVarType>(index);
}

double* AutoCVar_Float::GetPtr()
{
	return PtrGetCVarCurrentByIndex<CVarType>(index);
}

float AutoCVar_Float::GetFloat()
{
	return static_cast<float>(Get());
}

float* AutoCVar_Float::GetFloatPtr()
{
	float* result = reinterpret_cast<float*>(GetPtr());
	return result;
}

void AutoCVar_Float::Set(double f)
{
	SetCVarCurrentByIndex<CVarType>(index, f);
}

AutoCVar_Int::AutoCVar_Int(const char* name, const char* description, int32_t defaultValue, CVarFlags flags)
{
	CVarParameter* cvar = CVarSystem::Get()->CreateIntCVar(name, description, defaultValue, defaultValue);
	if (cvar == nullptr) {
		throw std::runtime_error{ fmt::format("Duplicate cvar {}", name) };
	}
	cvar->flags = flags;
	index = cvar->arrayIndex;
}

int32_t AutoCVar_Int::Get()
{
	return GetCVarCurrentByIndex<CVarType>(index);
}

int32_t* AutoCVar_Int::GetPtr()
{
	return PtrGetCVarCurrentByIndex<CVarType>(index);
}

void AutoCVar_Int::Set(int32_t val)
{
	SetCVarCurrentByIndex<CVarType>(index, val);
}

void AutoCVar_Int::Toggle()
{
	bool enabled = Get() != 0;

	Set(enabled ? 0 : 1);
}

AutoCVar_String::AutoCVar_String(const char* name, const char* description, const char* defaultValue, CVarFlags flags)
{
	CVarParameter* cvar = CVarSystem::Get()->CreateStringCVar(name, description, defaultValue, defaultValue);
	if (cvar == nullptr) {
		throw std::runtime_error{ fmt::format("Duplicate cvar {}", name) };
	}
	cvar->flags = flags;
	index = cvar->arrayIndex;
}

const char* AutoCVar_String::Get()
{
	return PtrGetCVarCurrentByIndex<CVarType>(index)->c_str();
}

void AutoCVar_String::Set(std::string&& val)
{
	SetCVarCurrentByIndex<CVarType>(index, val);
}
