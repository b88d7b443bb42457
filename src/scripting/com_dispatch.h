#ifndef EXPORTFLOW_COM_DISPATCH_H
#define EXPORTFLOW_COM_DISPATCH_H

#ifdef _WIN32

#include "../common/os_utils.h"
#include <oleauto.h>
#include <wrl/client.h>
#include <string>
#include <vector>

namespace exportflow {
namespace scripting {

/**
 * @brief Joins the calling thread to a single-threaded COM apartment for its lifetime
 */
class ComApartment {
public:
    ComApartment();
    ~ComApartment();

    ComApartment(const ComApartment&) = delete;
    ComApartment& operator=(const ComApartment&) = delete;

private:
    bool m_initialized;
};

// Owning VARIANT
class Variant {
public:
    Variant();
    explicit Variant(long value);
    explicit Variant(bool value);
    explicit Variant(const std::string& utf8);
    ~Variant();

    Variant(Variant&& other) noexcept;
    Variant& operator=(Variant&& other) noexcept;
    Variant(const Variant&) = delete;
    Variant& operator=(const Variant&) = delete;

    VARIANT* get() { return &m_value; }
    const VARIANT& value() const { return m_value; }

private:
    VARIANT m_value;
};

/**
 * @brief Late-bound calls on an automation object
 *
 * Every failed call throws AutomationError(PLATFORM) naming the member and
 * the HRESULT; callers translate that into the domain error they need.
 */
class DispatchObject {
public:
    DispatchObject() = default;
    explicit DispatchObject(Microsoft::WRL::ComPtr<IDispatch> dispatch);

    bool valid() const { return m_dispatch != nullptr; }
    IDispatch* raw() const { return m_dispatch.Get(); }

    DispatchObject getObject(const std::wstring& member) const;
    DispatchObject callObject(const std::wstring& member, std::vector<Variant> args) const;
    long getLong(const std::wstring& member) const;
    std::string getString(const std::wstring& member) const;
    void put(const std::wstring& member, Variant value) const;
    void call(const std::wstring& member, std::vector<Variant> args = {}) const;

private:
    Variant invoke(const std::wstring& member, WORD flags, std::vector<Variant>& args) const;
    static DispatchObject fromVariant(Variant& result, const std::wstring& member);

    Microsoft::WRL::ComPtr<IDispatch> m_dispatch;
};

} // namespace scripting
} // namespace exportflow

#endif // _WIN32

#endif // EXPORTFLOW_COM_DISPATCH_H
