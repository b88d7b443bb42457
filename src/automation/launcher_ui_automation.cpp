#include "launcher_ui_automation.h"
#include "control_locator.h"
#include "../common/string_utils.h"
#include "../common/error_handler.h"
#include "../common/structured_logger.h"
#include <set>
#include <algorithm>

namespace exportflow {
namespace automation {

using ocal::uia::UiElementKind;
using ocal::uia::UiNode;
using utils::StringUtils;

namespace {
    constexpr std::chrono::milliseconds kWindowPollInterval(500);
    constexpr std::chrono::milliseconds kSelectionSettleDelay(300);
    constexpr size_t kListedRowsInError = 10;
}

LauncherUiAutomation::LauncherUiAutomation(ocal::uia::IUiTree& tree, IClock& clock, const ConnectionSettings& settings)
    : m_tree(tree), m_clock(clock), m_settings(settings) {}

void LauncherUiAutomation::openConnection() {
    attachWindow();
    m_tree.focusWindow();
    selectServer();
    activateConnection();
}

void LauncherUiAutomation::attachWindow() {
    PollOutcome outcome = pollUntil(m_clock, PollPolicy(kWindowPollInterval, m_settings.uiSearchTimeout), [this]() {
        return m_tree.attachWindow(m_settings.windowTitlePattern);
    });

    if (!outcome.satisfied) {
        throw ConnectionError("launcher window not found", m_settings.serverLabel, m_settings.connectionLabel,
                              "no window title matches '" + m_settings.windowTitlePattern + "'");
    }
}

void LauncherUiAutomation::selectServer() {
    std::string target = ControlLocator::normalize(m_settings.serverLabel);
    if (target.empty()) {
        return;
    }

    std::vector<UiNode> nodes = m_tree.descendants(UiElementKind::TREE_ITEM);
    std::vector<std::string> texts;
    for (const auto& node : nodes) {
        texts.push_back(StringUtils::trim(node.text));
    }

    auto match = ControlLocator::selectBest(texts, target, m_settings.minMatchScore);
    if (!match) {
        SLOG_WARNING().message("Server node not found in launcher tree, continuing with connection grid")
            .context("server_label", m_settings.serverLabel);
        return;
    }

    SLOG_INFO().message("Selecting server node").context("node", texts[match->index]).context("score", match->score);
    m_tree.select(nodes[match->index]);
    m_clock.sleepFor(kSelectionSettleDelay);
}

std::vector<UiNode> LauncherUiAutomation::collectRows() {
    std::vector<UiNode> rows;
    std::set<std::string> seen;
    for (UiElementKind kind : {UiElementKind::DATA_ITEM, UiElementKind::LIST_ITEM}) {
        for (auto& node : m_tree.descendants(kind)) {
            std::string text = StringUtils::trim(node.text);
            if (text.empty() || !seen.insert(text).second) {
                continue;
            }
            node.text = text;
            rows.push_back(node);
        }
    }
    return rows;
}

void LauncherUiAutomation::activateConnection() {
    std::string target = ControlLocator::normalize(StringUtils::replaceAll(m_settings.connectionLabel, "...", " "));
    if (target.empty()) {
        throw ConnectionError("connection label is empty", m_settings.serverLabel, m_settings.connectionLabel);
    }

    std::vector<UiNode> rows = collectRows();
    if (rows.empty()) {
        throw ConnectionError("no connection rows visible in the launcher", m_settings.serverLabel,
                              m_settings.connectionLabel);
    }

    std::vector<std::string> texts;
    for (const auto& row : rows) {
        texts.push_back(row.text);
    }

    auto match = ControlLocator::selectBest(texts, target, m_settings.minMatchScore);
    if (!match) {
        std::vector<std::string> visible(texts.begin(), texts.begin() + std::min(texts.size(), kListedRowsInError));
        throw ConnectionError("connection row not found in the launcher grid", m_settings.serverLabel,
                              m_settings.connectionLabel, "visible rows: " + StringUtils::join(visible, ", "));
    }

    SLOG_INFO().message("Opening connection by double-click").context("row", texts[match->index]).context("score", match->score);
    m_tree.activate(rows[match->index]);
}

} // namespace automation
} // namespace exportflow
