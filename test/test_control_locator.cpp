#include "test_support.h"
#include "automation/control_locator.h"

using namespace exportflow;
using namespace exportflow::testing;
using automation::ControlLocator;

namespace {
const std::string kConnection = "H181 RP1 ENEL SP CCS Produ\xC3\xA7\xC3\xA3o (without SSO)";
}

void testScoreTiers() {
    std::string target = ControlLocator::normalize(kConnection);

    expectEqual(ControlLocator::matchScore("", target), -1, "empty text");
    expectEqual(ControlLocator::matchScore("  --  ", target), -1, "punctuation-only text");
    expectEqual(ControlLocator::matchScore("h181 rp1 enel sp ccs PRODUCAO without sso", target), 100, "equal after normalization");
    expectEqual(ControlLocator::matchScore(kConnection + " [backup]", target), 90, "target inside text");
    expectEqual(ControlLocator::matchScore("H181 RP1", target), 70, "text inside target");
    expectEqual(ControlLocator::matchScore("RP1", target), 8, "short fragment only scores by word overlap");
}

void testTokenOverlap() {
    std::string target = ControlLocator::normalize(kConnection);
    // enel, sp and ccs are whole words of the text
    expectEqual(ControlLocator::matchScore("ENEL SP CCS QA", target), 24, "whole-word overlap");

    std::string server = ControlLocator::normalize("SAP ERP");
    // both words only occur inside longer words, and the text starts with the first word
    expectEqual(ControlLocator::matchScore("SAPGUI ERP2", server), 20, "partial overlap with prefix bonus");
}

void testSelectBest() {
    std::string target = ControlLocator::normalize("00 SAP ERP");
    std::vector<std::string> nodes = {"Favoritos", "00 SAP ERP", "01 SAP ERP QA", "00 SAP ERP"};

    auto match = ControlLocator::selectBest(nodes, target, 1);
    expect(match.has_value(), "match found");
    expectEqual(match->index, size_t(1), "first of the equal best candidates");
    expectEqual(match->score, 100, "exact score");

    expect(!ControlLocator::selectBest({"Favoritos", "Hist\xC3\xB3rico"}, target, 1).has_value(),
           "no candidate reaches the minimum");
    expect(!ControlLocator::selectBest({}, target, 1).has_value(), "no candidates");
    expect(ControlLocator::selectBest({"SAP"}, target, 1).has_value(), "weak match above minimum");
    expect(!ControlLocator::selectBest({"SAP"}, target, 50).has_value(), "weak match below raised minimum");
}

int main() {
    return runTests("ControlLocator", {
        {"score tiers", testScoreTiers},
        {"token overlap", testTokenOverlap},
        {"best candidate selection", testSelectBest}
    });
}
