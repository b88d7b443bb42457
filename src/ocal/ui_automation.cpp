#include "ui_automation.h"
#include "window_management.h"
#include "mouse_control.h"
#include "../common/os_utils.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"

#ifdef _WIN32
#include <objbase.h>
#include <oleauto.h>
#include <uiautomation.h>
#include <wrl/client.h>
#include <map>
#endif

namespace exportflow {
namespace ocal {
namespace uia {

std::string uiElementKindToString(UiElementKind kind) {
    switch (kind) {
        case UiElementKind::TREE_ITEM: return "TreeItem";
        case UiElementKind::DATA_ITEM: return "DataItem";
        case UiElementKind::LIST_ITEM: return "ListItem";
    }
    return "Unknown";
}

#ifdef _WIN32

using Microsoft::WRL::ComPtr;

namespace {

CONTROLTYPEID controlTypeFor(UiElementKind kind) {
    switch (kind) {
        case UiElementKind::TREE_ITEM: return UIA_TreeItemControlTypeId;
        case UiElementKind::DATA_ITEM: return UIA_DataItemControlTypeId;
        case UiElementKind::LIST_ITEM: return UIA_ListItemControlTypeId;
    }
    return UIA_CustomControlTypeId;
}

std::string elementName(IUIAutomationElement* element) {
    BSTR name = nullptr;
    if (FAILED(element->get_CurrentName(&name)) || !name) {
        return "";
    }
    std::string text = os::UnicodeUtils::wideStringToUtf8(std::wstring(name, SysStringLen(name)));
    SysFreeString(name);
    return text;
}

std::string nodeId(const UiNode& node) {
    return uiElementKindToString(node.kind) + "[" + std::to_string(node.index) + "]:" + node.text;
}

} // anonymous namespace

struct DesktopUiTree::Impl {
    bool comInitialized = false;
    ComPtr<IUIAutomation> automation;
    HWND window = nullptr;
    ComPtr<IUIAutomationElement> root;
    std::map<UiElementKind, std::vector<ComPtr<IUIAutomationElement>>> cache;

    Impl() {
        HRESULT hr = CoInitializeEx(nullptr, COINIT_APARTMENTTHREADED);
        // RPC_E_CHANGED_MODE: COM is already usable in another apartment model
        comInitialized = SUCCEEDED(hr);
        if (FAILED(hr) && hr != RPC_E_CHANGED_MODE) {
            throw AutomationError(ErrorType::PLATFORM, "COM initialization failed",
                                  "HRESULT " + std::to_string(static_cast<long>(hr)));
        }

        hr = CoCreateInstance(CLSID_CUIAutomation, nullptr, CLSCTX_INPROC_SERVER, IID_PPV_ARGS(&automation));
        if (FAILED(hr) || !automation) {
            if (comInitialized) {
                CoUninitialize();
            }
            throw AutomationError(ErrorType::PLATFORM, "UI Automation is not available",
                                  "HRESULT " + std::to_string(static_cast<long>(hr)));
        }
    }

    ~Impl() {
        cache.clear();
        root.Reset();
        automation.Reset();
        if (comInitialized) {
            CoUninitialize();
        }
    }

    IUIAutomationElement* resolve(const UiNode& node) {
        auto it = cache.find(node.kind);
        if (it == cache.end() || node.index >= it->second.size() || !it->second[node.index]) {
            throw ControlResolutionError(nodeId(node), "element is not in the latest listing");
        }
        return it->second[node.index].Get();
    }

    mouse::Point centerOf(const UiNode& node) {
        RECT rect = {};
        if (FAILED(resolve(node)->get_CurrentBoundingRectangle(&rect)) ||
            rect.right <= rect.left || rect.bottom <= rect.top) {
            throw ControlResolutionError(nodeId(node), "element has no visible bounds");
        }
        return mouse::Point((rect.left + rect.right) / 2, (rect.top + rect.bottom) / 2);
    }
};

DesktopUiTree::DesktopUiTree() : m_impl(std::make_unique<Impl>()) {}

DesktopUiTree::~DesktopUiTree() = default;

bool DesktopUiTree::attachWindow(const std::string& titlePattern) {
    window::WindowHandle handle = window::findByTitlePattern(titlePattern);
    if (handle == window::INVALID_WINDOW_HANDLE) {
        return false;
    }

    ComPtr<IUIAutomationElement> root;
    HRESULT hr = m_impl->automation->ElementFromHandle(static_cast<HWND>(handle), &root);
    if (FAILED(hr) || !root) {
        SLOG_WARNING().message("Window found but not accessible").context("pattern", titlePattern);
        return false;
    }

    m_impl->window = static_cast<HWND>(handle);
    m_impl->root = root;
    m_impl->cache.clear();
    SLOG_DEBUG().message("Attached to window").context("pattern", titlePattern);
    return true;
}

void DesktopUiTree::focusWindow() {
    if (!m_impl->window) {
        throw ControlResolutionError("window", "no window attached");
    }
    window::bringToFront(m_impl->window);
}

std::vector<UiNode> DesktopUiTree::descendants(UiElementKind kind) {
    if (!m_impl->root) {
        throw ControlResolutionError("window", "no window attached");
    }

    VARIANT controlType;
    VariantInit(&controlType);
    controlType.vt = VT_I4;
    controlType.lVal = controlTypeFor(kind);

    ComPtr<IUIAutomationCondition> condition;
    HRESULT hr = m_impl->automation->CreatePropertyCondition(UIA_ControlTypePropertyId, controlType, &condition);
    VariantClear(&controlType);
    if (FAILED(hr) || !condition) {
        throw AutomationError(ErrorType::PLATFORM, "Failed to create UI Automation condition",
                              uiElementKindToString(kind));
    }

    ComPtr<IUIAutomationElementArray> elements;
    hr = m_impl->root->FindAll(TreeScope_Subtree, condition.Get(), &elements);

    auto& cached = m_impl->cache[kind];
    cached.clear();
    std::vector<UiNode> nodes;
    if (FAILED(hr) || !elements) {
        return nodes;
    }

    int length = 0;
    elements->get_Length(&length);
    for (int i = 0; i < length; ++i) {
        ComPtr<IUIAutomationElement> element;
        if (FAILED(elements->GetElement(i, &element)) || !element) {
            continue;
        }
        nodes.emplace_back(elementName(element.Get()), kind, cached.size());
        cached.push_back(element);
    }
    return nodes;
}

void DesktopUiTree::select(const UiNode& node) {
    IUIAutomationElement* element = m_impl->resolve(node);

    ComPtr<IUIAutomationSelectionItemPattern> selection;
    HRESULT hr = element->GetCurrentPatternAs(UIA_SelectionItemPatternId, IID_PPV_ARGS(&selection));
    if (SUCCEEDED(hr) && selection && SUCCEEDED(selection->Select())) {
        return;
    }

    if (!mouse::clickAt(m_impl->centerOf(node), mouse::ClickType::SINGLE)) {
        throw ControlResolutionError(nodeId(node), "click injection failed");
    }
}

void DesktopUiTree::activate(const UiNode& node) {
    if (!mouse::clickAt(m_impl->centerOf(node), mouse::ClickType::DOUBLE)) {
        throw ControlResolutionError(nodeId(node), "double-click injection failed");
    }
}

#else

struct DesktopUiTree::Impl {};

DesktopUiTree::DesktopUiTree() : m_impl(std::make_unique<Impl>()) {}

DesktopUiTree::~DesktopUiTree() = default;

namespace {

[[noreturn]] void throwUnsupported() {
    throw AutomationError(ErrorType::PLATFORM, "UI Automation is only available on Windows",
                          "launcher window automation requires a Windows desktop session");
}

} // anonymous namespace

bool DesktopUiTree::attachWindow(const std::string& titlePattern) {
    (void)titlePattern;
    throwUnsupported();
}

void DesktopUiTree::focusWindow() {
    throwUnsupported();
}

std::vector<UiNode> DesktopUiTree::descendants(UiElementKind kind) {
    (void)kind;
    throwUnsupported();
}

void DesktopUiTree::select(const UiNode& node) {
    (void)node;
    throwUnsupported();
}

void DesktopUiTree::activate(const UiNode& node) {
    (void)node;
    throwUnsupported();
}

#endif // _WIN32

} // namespace uia
} // namespace ocal
} // namespace exportflow
