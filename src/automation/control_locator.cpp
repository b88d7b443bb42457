#include "control_locator.h"
#include "../common/string_utils.h"
#include <set>

namespace exportflow {
namespace automation {

using utils::StringUtils;

std::string ControlLocator::normalize(const std::string& label) {
    return StringUtils::normalizeLabel(label);
}

int ControlLocator::matchScore(const std::string& text, const std::string& normalizedTarget) {
    std::string normalizedText = normalize(text);
    if (normalizedText.empty()) {
        return -1;
    }

    if (normalizedText == normalizedTarget) {
        return 100;
    }
    if (!normalizedTarget.empty() && normalizedText.find(normalizedTarget) != std::string::npos) {
        return 90;
    }
    if (normalizedText.size() >= 6 && normalizedTarget.find(normalizedText) != std::string::npos) {
        return 70;
    }

    std::vector<std::string> targetTokens = StringUtils::tokens(normalizedTarget);
    std::vector<std::string> textTokenList = StringUtils::tokens(normalizedText);
    std::set<std::string> textTokens(textTokenList.begin(), textTokenList.end());

    int score = 0;
    for (const auto& token : targetTokens) {
        if (token.size() <= 1) {
            continue;
        }
        if (textTokens.count(token)) {
            score += 8;
        } else if (normalizedText.find(token) != std::string::npos) {
            score += 5;
        }
    }

    if (!targetTokens.empty() && StringUtils::startsWith(normalizedText, targetTokens.front())) {
        score += 10;
    }
    return score;
}

std::optional<LocatorMatch> ControlLocator::selectBest(const std::vector<std::string>& candidates,
                                                       const std::string& normalizedTarget,
                                                       int minScore) {
    std::optional<LocatorMatch> best;
    for (size_t i = 0; i < candidates.size(); ++i) {
        int score = matchScore(candidates[i], normalizedTarget);
        if (!best || score > best->score) {
            best = LocatorMatch{i, score};
        }
    }

    if (!best || best->score < minScore) {
        return std::nullopt;
    }
    return best;
}

} // namespace automation
} // namespace exportflow
