#ifndef EXPORTFLOW_UI_AUTOMATION_H
#define EXPORTFLOW_UI_AUTOMATION_H

#include <string>
#include <vector>
#include <memory>
#include <utility>

namespace exportflow {
namespace ocal {
namespace uia {

enum class UiElementKind {
    TREE_ITEM,
    DATA_ITEM,
    LIST_ITEM
};

std::string uiElementKindToString(UiElementKind kind);

/**
 * Snapshot of one accessible element under the attached window
 *
 * index addresses the element within the most recent descendants() result
 * of the same kind; a later call for that kind invalidates it.
 */
struct UiNode {
    std::string text;
    UiElementKind kind;
    size_t index;

    UiNode() : kind(UiElementKind::TREE_ITEM), index(0) {}
    UiNode(std::string t, UiElementKind k, size_t i) : text(std::move(t)), kind(k), index(i) {}
};

/**
 * Accessibility tree of a top-level desktop window
 *
 * Element operations throw ControlResolutionError when the node is stale or
 * cannot be driven, and AutomationError(PLATFORM) where no accessibility
 * binding exists.
 */
class IUiTree {
public:
    virtual ~IUiTree() = default;

    // Returns false when no visible window title matches the pattern
    virtual bool attachWindow(const std::string& titlePattern) = 0;
    virtual void focusWindow() = 0;
    virtual std::vector<UiNode> descendants(UiElementKind kind) = 0;
    virtual void select(const UiNode& node) = 0;
    virtual void activate(const UiNode& node) = 0;
};

/**
 * IUiTree over Windows UI Automation
 */
class DesktopUiTree : public IUiTree {
public:
    DesktopUiTree();
    ~DesktopUiTree() override;

    DesktopUiTree(const DesktopUiTree&) = delete;
    DesktopUiTree& operator=(const DesktopUiTree&) = delete;

    bool attachWindow(const std::string& titlePattern) override;
    void focusWindow() override;
    std::vector<UiNode> descendants(UiElementKind kind) override;
    void select(const UiNode& node) override;
    void activate(const UiNode& node) override;

private:
    struct Impl;
    std::unique_ptr<Impl> m_impl;
};

} // namespace uia
} // namespace ocal
} // namespace exportflow

#endif // EXPORTFLOW_UI_AUTOMATION_H
