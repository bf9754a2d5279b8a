#pragma once

#include <string>
#include <typeindex>
#include <hyprlang.hpp>
#include "../macros.hpp"

// lets CConfigValue live in headers without pulling in the config manager
// NOLINTNEXTLINE
void            local__configValuePopulate(void* const** p, const std::string& val);
std::type_index local__configValueTypeIdx(const std::string& val);

// Caches the hyprlang data pointer for a registered option. The pointer stays valid across reloads,
// so these are usually kept as function-local statics.
template <typename T>
class CConfigValue {
  public:
    CConfigValue(const std::string& val) {
#ifdef HYPRTABS_DEBUG
        const auto TYPE     = local__configValueTypeIdx(val);
        const bool STRINGEX = (typeid(T) == typeid(std::string) && TYPE == typeid(Hyprlang::STRING));

        RASSERT(typeid(T) == TYPE || STRINGEX, "Mismatched type in CConfigValue<T>, got {} but has {}", typeid(T).name(), TYPE.name());
#endif

        local__configValuePopulate(&p_, val);
    }

    T* ptr() const {
        return *static_cast<T* const*>(p_);
    }

    T operator*() const {
        return *ptr();
    }

  private:
    void* const* p_ = nullptr;
};

template <>
inline std::string* CConfigValue<std::string>::ptr() const {
    RASSERT(false, "Impossible to implement ptr() of CConfigValue<std::string>");
    return nullptr;
}

template <>
inline std::string CConfigValue<std::string>::operator*() const {
    return std::string{*(Hyprlang::STRING*)p_};
}

template <>
inline Hyprlang::STRING* CConfigValue<Hyprlang::STRING>::ptr() const {
    return (Hyprlang::STRING*)p_;
}

template <>
inline Hyprlang::STRING CConfigValue<Hyprlang::STRING>::operator*() const {
    return *(Hyprlang::STRING*)p_;
}
