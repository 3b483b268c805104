#pragma once

#include <string>
#include <vector>

#include "common/models.hpp"

namespace timekeep {

// Classifier maps an app identifier to a category label. User rules are
// tried first in insertion order, then the built-in keyword groups in fixed
// order. All matching is case-insensitive substring matching.
class Classifier
{
public:
    struct SiteGroup {
        const char *category;
        std::vector<const char *> keywords;
    };

    struct KeywordGroup {
        const char *category;
        std::vector<const char *> keywords;
        // Only the browser group has site subgroups; a match there wins over
        // the group's own category.
        std::vector<SiteGroup> sites;
    };

    Classifier() = default;
    explicit Classifier(CustomRules customRules);

    std::string classify(const std::string &appId) const;

    static std::string classifyBuiltIn(const std::string &appId);
    static const std::vector<KeywordGroup> &builtInGroups();

private:
    CustomRules m_customRules;
};

std::string toLower(std::string value);
bool containsCaseInsensitive(const std::string &value, const std::string &needle);
bool matchesAnyPattern(const std::string &value, const std::vector<std::string> &patterns);

} // namespace timekeep
