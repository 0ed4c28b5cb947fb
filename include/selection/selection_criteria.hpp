// EN: Selection Criteria for DT-Pipeline - Compiles one selection spec ("+tag:nightly+", "@pkg.dir.*") into a criterion
// FR: Critères de Sélection pour DT-Pipeline - Compile une spec de sélection ("+tag:nightly+", "@pkg.dir.*") en critère

#pragma once

#include <string>

namespace DTP {
namespace Selection {

// EN: Selection DSL tokens
// FR: Jetons du DSL de sélection
constexpr char SELECTOR_PARENTS = '+';
constexpr char SELECTOR_CHILDREN = '+';
constexpr char SELECTOR_CHILDRENS_PARENTS = '@';
constexpr const char* SELECTOR_GLOB = "*";
constexpr const char* SELECTOR_TAG_PREFIX = "tag:";
constexpr const char* SELECTOR_SOURCE_PREFIX = "source:";

// EN: What the selector body is compared against
// FR: Ce à quoi le corps du sélecteur est comparé
enum class SelectorType {
    FQN = 0,        // EN: Namespace path pattern / FR: Motif de chemin d'espace de noms
    TAG = 1,        // EN: Member of the node tag set / FR: Membre de l'ensemble de tags du nœud
    SOURCE = 2      // EN: Namespace path pattern restricted to sources / FR: Motif de chemin restreint aux sources
};

std::string selectorTypeToString(SelectorType type);

// EN: "fqn", "tag" or "source". Throws std::invalid_argument otherwise.
// FR: "fqn", "tag" ou "source". Lance std::invalid_argument sinon.
SelectorType stringToSelectorType(const std::string& name);

// EN: Parsed selection spec. Created per spec string, consumed by one selection call.
// FR: Spec de sélection analysée. Créée par chaîne de spec, consommée par un appel de sélection.
struct SelectionCriteria {
    bool select_parents = false;            // EN: Leading '+' / FR: '+' en tête
    bool select_children = false;           // EN: Trailing '+' / FR: '+' en fin
    bool select_childrens_parents = false;  // EN: Leading '@' / FR: '@' en tête
    SelectorType selector_type = SelectorType::FQN;
    std::string selector_value;
    std::string raw;                        // EN: Spec as given by the user / FR: Spec telle que donnée par l'utilisateur

    // EN: Canonical spec text (e.g. "+tag:a+")
    // FR: Texte canonique de la spec (ex: "+tag:a+")
    std::string toString() const;
};

// EN: Parse one spec: optional leading '@' XOR '+', a body, optional trailing '+'.
//     Throws InvalidSelectorError for "@...+", "@+...", or an empty body.
// FR: Parse une spec: '@' XOR '+' optionnel en tête, un corps, '+' optionnel en fin.
//     Lance InvalidSelectorError pour "@...+", "@+...", ou un corps vide.
SelectionCriteria parseSelectionCriteria(const std::string& spec);

} // namespace Selection
} // namespace DTP
