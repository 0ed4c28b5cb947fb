// EN: Selection Criteria implementation
// FR: Implémentation des Critères de Sélection

#include "selection/selection_criteria.hpp"
#include "core/errors.hpp"

#include <cstring>
#include <stdexcept>

namespace DTP {
namespace Selection {

namespace {
    bool startsWith(const std::string& value, const char* prefix) {
        return value.compare(0, std::strlen(prefix), prefix) == 0;
    }
}

std::string selectorTypeToString(SelectorType type) {
    switch (type) {
        case SelectorType::FQN:    return "fqn";
        case SelectorType::TAG:    return "tag";
        case SelectorType::SOURCE: return "source";
        default:                   return "unknown";
    }
}

SelectorType stringToSelectorType(const std::string& name) {
    if (name == "fqn") return SelectorType::FQN;
    if (name == "tag") return SelectorType::TAG;
    if (name == "source") return SelectorType::SOURCE;
    throw std::invalid_argument("Unknown SelectorType: " + name);
}

std::string SelectionCriteria::toString() const {
    std::string spec;
    if (select_childrens_parents) spec += SELECTOR_CHILDRENS_PARENTS;
    if (select_parents) spec += SELECTOR_PARENTS;

    if (selector_type == SelectorType::TAG) {
        spec += SELECTOR_TAG_PREFIX;
    } else if (selector_type == SelectorType::SOURCE) {
        spec += SELECTOR_SOURCE_PREFIX;
    }
    spec += selector_value;

    if (select_children) spec += SELECTOR_CHILDREN;
    return spec;
}

SelectionCriteria parseSelectionCriteria(const std::string& spec) {
    if (spec.empty()) {
        throw InvalidSelectorError(spec, "selector is empty");
    }

    SelectionCriteria criteria;
    criteria.raw = spec;
    std::string body = spec;

    if (body.front() == SELECTOR_CHILDRENS_PARENTS) {
        criteria.select_childrens_parents = true;
        body.erase(0, 1);
        if (!body.empty() && body.front() == SELECTOR_PARENTS) {
            throw InvalidSelectorError(spec, "'@' cannot be combined with a leading '+'");
        }
    } else if (body.front() == SELECTOR_PARENTS) {
        criteria.select_parents = true;
        body.erase(0, 1);
    }

    if (!body.empty() && body.back() == SELECTOR_CHILDREN) {
        criteria.select_children = true;
        body.pop_back();
    }

    // EN: "@x+" is ambiguous and rejected rather than coerced
    // FR: "@x+" est ambigu et rejeté plutôt que converti
    if (criteria.select_childrens_parents && criteria.select_children) {
        throw InvalidSelectorError(spec, "'@' cannot be combined with a trailing '+'");
    }

    if (startsWith(body, SELECTOR_TAG_PREFIX)) {
        criteria.selector_type = SelectorType::TAG;
        criteria.selector_value = body.substr(std::strlen(SELECTOR_TAG_PREFIX));
    } else if (startsWith(body, SELECTOR_SOURCE_PREFIX)) {
        criteria.selector_type = SelectorType::SOURCE;
        criteria.selector_value = body.substr(std::strlen(SELECTOR_SOURCE_PREFIX));
    } else {
        criteria.selector_type = SelectorType::FQN;
        criteria.selector_value = body;
    }

    if (criteria.selector_value.empty()) {
        throw InvalidSelectorError(spec, "selector has no " + selectorTypeToString(criteria.selector_type) + " value");
    }

    return criteria;
}

} // namespace Selection
} // namespace DTP
