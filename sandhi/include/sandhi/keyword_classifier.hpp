#pragma once
// Keyword Classifier: catalog-driven stand-in for a real recognizer
//
// Used by the CLI and tests only. Scores each catalog intent by how many of
// its keywords occur in the text (case-insensitive); the best score wins,
// ties go to the alphabetically first intent.

#include "catalog.hpp"
#include "collaborators.hpp"
#include <algorithm>

namespace sandhi {

class KeywordClassifier : public Classifier {
public:
    static constexpr const char* UNKNOWN_INTENT = "unknown";
    static constexpr double UNKNOWN_CONFIDENCE = 0.3;

    explicit KeywordClassifier(const StaticIntentCatalog& catalog)
        : catalog_(catalog) {}

    Classification classify(const std::string& text, const ValueMap&) override {
        auto intents = catalog_.all();
        std::sort(intents.begin(), intents.end(),
                  [](const IntentInfo& a, const IntentInfo& b) { return a.name < b.name; });

        Classification best{UNKNOWN_INTENT, UNKNOWN_CONFIDENCE};
        size_t best_hits = 0;
        for (const auto& info : intents) {
            size_t hits = 0;
            for (const auto& kw : info.keywords) {
                if (contains_ci(text, kw)) ++hits;
            }
            if (hits > best_hits) {
                best_hits = hits;
                best.intent = info.name;
                // One hit is a fair guess, three or more is near certain
                best.confidence = std::min(0.95, 0.7 + 0.1 * static_cast<double>(hits));
            }
        }
        return best;
    }

private:
    const StaticIntentCatalog& catalog_;
};

} // namespace sandhi
