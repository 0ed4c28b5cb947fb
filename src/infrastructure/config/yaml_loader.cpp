// EN: Implementation of the YAML loading helpers. Wraps yaml-cpp parse failures into ValidationError.
// FR: Implémentation des utilitaires de chargement YAML. Encapsule les échecs yaml-cpp dans ValidationError.

#include "infrastructure/config/yaml_loader.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace DTP {
namespace YamlLoader {

namespace {
    const char* const YAML_ERROR_SEPARATOR = "------------------------------";

    std::vector<std::string> splitLines(const std::string& text) {
        std::vector<std::string> lines;
        std::string::size_type start = 0;
        while (true) {
            auto pos = text.find('\n', start);
            if (pos == std::string::npos) {
                lines.push_back(text.substr(start));
                break;
            }
            lines.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
        return lines;
    }
}

std::string formatLineNumber(std::size_t line_number, const std::string& line, std::size_t width) {
    std::string number = std::to_string(line_number);
    if (number.size() < width) {
        number.append(width - number.size(), ' ');
    }
    return number + "| " + line;
}

std::string prefixWithLineNumbers(const std::string& text, std::size_t start, std::size_t end) {
    auto lines = splitLines(text);
    end = std::min(end, lines.size());

    std::ostringstream out;
    for (std::size_t i = start; i < end; ++i) {
        if (i > start) out << "\n";
        out << formatLineNumber(i + 1, lines[i]);
    }
    return out.str();
}

std::string contextualizedYamlError(const std::string& raw_contents, int error_line, const std::string& raw_error) {
    std::size_t line = static_cast<std::size_t>(std::max(error_line, 0));
    std::size_t min_line = line > static_cast<std::size_t>(CONTEXT_LINES) ? line - CONTEXT_LINES : 0;
    std::size_t max_line = line + CONTEXT_LINES + 1;

    std::ostringstream message;
    message << "Syntax error near line " << (line + 1) << "\n"
            << YAML_ERROR_SEPARATOR << "\n"
            << prefixWithLineNumbers(raw_contents, min_line, max_line) << "\n"
            << "\n"
            << "Raw Error:\n"
            << YAML_ERROR_SEPARATOR << "\n"
            << raw_error;
    return message.str();
}

YAML::Node loadYamlText(const std::string& contents) {
    try {
        return YAML::Load(contents);
    } catch (const YAML::Exception& e) {
        // EN: Errors without a position cannot be contextualized
        // FR: Les erreurs sans position ne peuvent pas être contextualisées
        if (e.mark.is_null()) {
            throw ValidationError(e.what());
        }
        throw ValidationError(contextualizedYamlError(contents, e.mark.line, e.what()));
    }
}

YAML::Node loadYamlFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ValidationError("Cannot open YAML file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadYamlText(buffer.str());
}

} // namespace YamlLoader
} // namespace DTP
