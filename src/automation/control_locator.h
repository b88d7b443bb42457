#ifndef EXPORTFLOW_CONTROL_LOCATOR_H
#define EXPORTFLOW_CONTROL_LOCATOR_H

#include <string>
#include <vector>
#include <optional>

namespace exportflow {
namespace automation {

struct LocatorMatch {
    size_t index;
    int score;
};

/**
 * @brief Fuzzy label matching for launcher tree nodes and grid rows
 *
 * Scoring (text against an already-normalized target):
 * - empty text: -1
 * - equal: 100
 * - target contained in text: 90
 * - text contained in target and at least 6 characters: 70
 * - otherwise +8 for each target word (longer than one character) that is a
 *   word of the text, +5 when it only occurs inside the text, and +10 when
 *   the text starts with the first target word
 */
class ControlLocator {
public:
    static std::string normalize(const std::string& label);

    static int matchScore(const std::string& text, const std::string& normalizedTarget);

    /**
     * @brief Highest-scoring candidate, first one on ties
     * @return nullopt when the best score is below minScore or there are no candidates
     */
    static std::optional<LocatorMatch> selectBest(const std::vector<std::string>& candidates,
                                                  const std::string& normalizedTarget,
                                                  int minScore);
};

} // namespace automation
} // namespace exportflow

#endif // EXPORTFLOW_CONTROL_LOCATOR_H
