#pragma once
#include <string>
#include <string_view>
#include <functional>
#include <unordered_map>
#include <atomic>
#include <type_traits>

#include <filesystem>

#include "kine/core/result.hpp"

namespace kine::core {

enum class CVarFlags : uint32_t {
    none = 0,
    save = 1 << 0,
    read_only = 1 << 1,
};

inline CVarFlags operator|(CVarFlags a, CVarFlags b) {
    return static_cast<CVarFlags>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline bool operator&(CVarFlags a, CVarFlags b) {
    return (static_cast<uint32_t>(a) & static_cast<uint32_t>(b)) != 0;
}

struct ICVar {
    std::string name;
    std::string description;
    CVarFlags flags = CVarFlags::none;
    virtual ~ICVar();
    virtual std::string toString() const = 0;
    virtual void setFromString(const std::string& val) = 0;
};

class CVarSystem {
public:
    static void registerCVar(ICVar* cvar);
    static void unregisterCVar(ICVar* cvar);
    static ICVar* find(const std::string& name);

    // Applies a textual value to a registered variable. Read-only variables
    // and values that fail to parse are rejected.
    static Result<void> set(const std::string& name, const std::string& value);

    // Both return the number of variables written / applied.
    static Result<size_t> saveToIni(const std::filesystem::path& path);
    static Result<size_t> loadFromIni(const std::filesystem::path& path);
};

template <typename T>
class CVar : public ICVar {
    static_assert(std::is_arithmetic_v<T>, "CVar only supports arithmetic types.");
public:
    using OnChangeFunc = std::function<void(T)>;

    CVar(const char* name, const char* desc, T defaultValue, CVarFlags flags = CVarFlags::none, OnChangeFunc onChange = nullptr)
        : m_default(defaultValue), m_onChange(std::move(onChange))
    {
        this->name = name;
        this->description = desc;
        this->flags = flags;
        m_value.store(defaultValue, std::memory_order_relaxed);
        CVarSystem::registerCVar(this);
    }

    T get() const {
        return m_value.load(std::memory_order_relaxed);
    }

    T defaultValue() const { return m_default; }

    void set(T val) {
        m_value.store(val, std::memory_order_relaxed);
        if (m_onChange) m_onChange(val);
    }

    void reset() { set(m_default); }

    std::string toString() const override {
        if constexpr (std::is_same_v<T, bool>) {
            return get() ? "true" : "false";
        } else {
            return std::to_string(get());
        }
    }

    // Throws std::invalid_argument / std::out_of_range on malformed input
    void setFromString(const std::string& val) override {
        T newValue{};
        if constexpr (std::is_same_v<T, float>) {
            newValue = std::stof(val);
        } else if constexpr (std::is_same_v<T, double>) {
            newValue = std::stod(val);
        } else if constexpr (std::is_same_v<T, int>) {
            newValue = std::stoi(val);
        } else if constexpr (std::is_same_v<T, bool>) {
            newValue = (val == "1" || val == "true" || val == "True");
        } else {
             if constexpr (std::is_floating_point_v<T>) newValue = static_cast<T>(std::stof(val));
             else newValue = static_cast<T>(std::stoi(val));
        }
        set(newValue);
    }

private:
    std::atomic<T> m_value;
    T m_default;
    OnChangeFunc m_onChange;
};

#define AUTO_CVAR_FLOAT(Name, Desc, Default, ...) kine::core::CVar<float> Name(#Name, Desc, Default, ##__VA_ARGS__)
#define AUTO_CVAR_BOOL(Name, Desc, Default, ...) kine::core::CVar<bool> Name(#Name, Desc, Default, ##__VA_ARGS__)

}
