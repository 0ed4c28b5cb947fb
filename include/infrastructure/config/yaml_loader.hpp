// EN: YAML loading helpers for DT-Pipeline - Parse YAML text with line-numbered syntax error context
// FR: Utilitaires de chargement YAML pour DT-Pipeline - Parse du texte YAML avec contexte d'erreur numéroté

#pragma once

#include <cstddef>
#include <string>

#include <yaml-cpp/yaml.h>

namespace DTP {
namespace YamlLoader {

// EN: Number of context lines shown before and after the offending line
// FR: Nombre de lignes de contexte affichées avant et après la ligne fautive
constexpr int CONTEXT_LINES = 3;

// EN: Render one line as "<number left-justified to width>| <line>"
// FR: Rend une ligne sous la forme "<numéro justifié à gauche>| <ligne>"
std::string formatLineNumber(std::size_t line_number, const std::string& line, std::size_t width = 3);

// EN: Number lines [start, end) of text (0-based, end exclusive, clamped to the text)
// FR: Numérote les lignes [start, end) du texte (base 0, fin exclusive, bornée au texte)
std::string prefixWithLineNumbers(const std::string& text, std::size_t start, std::size_t end);

// EN: Build the full "Syntax error near line N" message for a 0-based error line
// FR: Construit le message complet "Syntax error near line N" pour une ligne d'erreur en base 0
std::string contextualizedYamlError(const std::string& raw_contents, int error_line, const std::string& raw_error);

// EN: Parse YAML text. Throws ValidationError with the contextual message on malformed input.
// FR: Parse du texte YAML. Lance ValidationError avec le message contextuel si l'entrée est malformée.
YAML::Node loadYamlText(const std::string& contents);

// EN: Read a file and parse it with loadYamlText. Throws ValidationError if unreadable.
// FR: Lit un fichier et le parse avec loadYamlText. Lance ValidationError s'il est illisible.
YAML::Node loadYamlFile(const std::string& path);

} // namespace YamlLoader
} // namespace DTP
