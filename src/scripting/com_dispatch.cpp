#include "com_dispatch.h"

#ifdef _WIN32

#include "../common/error_handler.h"
#include <sstream>
#include <iomanip>

namespace exportflow {
namespace scripting {

namespace {

std::string hresultText(HRESULT hr) {
    std::ostringstream out;
    out << "HRESULT 0x" << std::hex << std::setw(8) << std::setfill('0') << static_cast<unsigned long>(hr);
    return out.str();
}

} // anonymous namespace

ComApartment::ComApartment() : m_initialized(false) {
    HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
    if (SUCCEEDED(hr)) {
        m_initialized = true;
    } else if (hr != RPC_E_CHANGED_MODE) {
        throw AutomationError(ErrorType::PLATFORM, "COM initialization failed", hresultText(hr));
    }
}

ComApartment::~ComApartment() {
    if (m_initialized) {
        CoUninitialize();
    }
}

Variant::Variant() {
    VariantInit(&m_value);
}

Variant::Variant(long value) {
    VariantInit(&m_value);
    m_value.vt = VT_I4;
    m_value.lVal = value;
}

Variant::Variant(bool value) {
    VariantInit(&m_value);
    m_value.vt = VT_BOOL;
    m_value.boolVal = value ? VARIANT_TRUE : VARIANT_FALSE;
}

Variant::Variant(const std::string& utf8) {
    VariantInit(&m_value);
    std::wstring wide = os::UnicodeUtils::utf8ToWideString(utf8);
    m_value.vt = VT_BSTR;
    m_value.bstrVal = SysAllocStringLen(wide.data(), static_cast<UINT>(wide.size()));
}

Variant::~Variant() {
    VariantClear(&m_value);
}

Variant::Variant(Variant&& other) noexcept {
    m_value = other.m_value;
    VariantInit(&other.m_value);
}

Variant& Variant::operator=(Variant&& other) noexcept {
    if (this != &other) {
        VariantClear(&m_value);
        m_value = other.m_value;
        VariantInit(&other.m_value);
    }
    return *this;
}

DispatchObject::DispatchObject(Microsoft::WRL::ComPtr<IDispatch> dispatch)
    : m_dispatch(std::move(dispatch)) {}

Variant DispatchObject::invoke(const std::wstring& member, WORD flags, std::vector<Variant>& args) const {
    std::string memberName = os::UnicodeUtils::wideStringToUtf8(member);
    if (!m_dispatch) {
        throw AutomationError(ErrorType::PLATFORM, "Call on empty automation object", memberName);
    }

    DISPID dispid = 0;
    LPOLESTR name = const_cast<LPOLESTR>(member.c_str());
    HRESULT hr = m_dispatch->GetIDsOfNames(IID_NULL, &name, 1, LOCALE_USER_DEFAULT, &dispid);
    if (FAILED(hr)) {
        throw AutomationError(ErrorType::PLATFORM, "Unknown automation member", memberName + ": " + hresultText(hr));
    }

    // IDispatch expects arguments in reverse order
    std::vector<VARIANT> raw;
    raw.reserve(args.size());
    for (auto it = args.rbegin(); it != args.rend(); ++it) {
        raw.push_back(it->value());
    }

    DISPPARAMS params = {};
    params.cArgs = static_cast<UINT>(raw.size());
    params.rgvarg = raw.empty() ? nullptr : raw.data();

    DISPID putId = DISPID_PROPERTYPUT;
    if (flags & DISPATCH_PROPERTYPUT) {
        params.cNamedArgs = 1;
        params.rgdispidNamedArgs = &putId;
    }

    Variant result;
    EXCEPINFO excep = {};
    hr = m_dispatch->Invoke(dispid, IID_NULL, LOCALE_USER_DEFAULT, flags, &params,
                            (flags & DISPATCH_PROPERTYPUT) ? nullptr : result.get(), &excep, nullptr);
    if (FAILED(hr)) {
        std::string description;
        if (excep.bstrDescription) {
            description = os::UnicodeUtils::wideStringToUtf8(
                std::wstring(excep.bstrDescription, SysStringLen(excep.bstrDescription)));
        }
        SysFreeString(excep.bstrSource);
        SysFreeString(excep.bstrDescription);
        SysFreeString(excep.bstrHelpFile);
        throw AutomationError(ErrorType::PLATFORM, "Automation call failed",
                              memberName + ": " + hresultText(hr) + (description.empty() ? "" : " " + description));
    }
    return result;
}

DispatchObject DispatchObject::fromVariant(Variant& result, const std::wstring& member) {
    const VARIANT& value = result.value();
    if (value.vt != VT_DISPATCH || value.pdispVal == nullptr) {
        throw AutomationError(ErrorType::PLATFORM, "Automation member did not return an object",
                              os::UnicodeUtils::wideStringToUtf8(member));
    }
    Microsoft::WRL::ComPtr<IDispatch> dispatch(value.pdispVal);
    return DispatchObject(dispatch);
}

DispatchObject DispatchObject::getObject(const std::wstring& member) const {
    std::vector<Variant> none;
    Variant result = invoke(member, DISPATCH_PROPERTYGET | DISPATCH_METHOD, none);
    return fromVariant(result, member);
}

DispatchObject DispatchObject::callObject(const std::wstring& member, std::vector<Variant> args) const {
    Variant result = invoke(member, DISPATCH_METHOD | DISPATCH_PROPERTYGET, args);
    return fromVariant(result, member);
}

long DispatchObject::getLong(const std::wstring& member) const {
    std::vector<Variant> none;
    Variant result = invoke(member, DISPATCH_PROPERTYGET, none);
    Variant converted;
    HRESULT hr = VariantChangeType(converted.get(), result.get(), 0, VT_I4);
    if (FAILED(hr)) {
        throw AutomationError(ErrorType::PLATFORM, "Automation member is not numeric",
                              os::UnicodeUtils::wideStringToUtf8(member));
    }
    return converted.value().lVal;
}

std::string DispatchObject::getString(const std::wstring& member) const {
    std::vector<Variant> none;
    Variant result = invoke(member, DISPATCH_PROPERTYGET, none);
    Variant converted;
    if (FAILED(VariantChangeType(converted.get(), result.get(), 0, VT_BSTR)) || !converted.value().bstrVal) {
        return "";
    }
    BSTR text = converted.value().bstrVal;
    return os::UnicodeUtils::wideStringToUtf8(std::wstring(text, SysStringLen(text)));
}

void DispatchObject::put(const std::wstring& member, Variant value) const {
    std::vector<Variant> args;
    args.push_back(std::move(value));
    invoke(member, DISPATCH_PROPERTYPUT, args);
}

void DispatchObject::call(const std::wstring& member, std::vector<Variant> args) const {
    invoke(member, DISPATCH_METHOD, args);
}

} // namespace scripting
} // namespace exportflow

#endif // _WIN32
