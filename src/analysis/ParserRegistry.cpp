#include "analysis/ParserRegistry.h"
#include "analysis/providers/TreeSitterPythonParser.h"
#include "analysis/providers/RegexParser.h"
#include <algorithm>
#include <filesystem>

void ParserRegistry::registerParser(std::unique_ptr<IParser> parser) {
    if (!parser) return;
    parsers.push_back(std::move(parser));
}

const IParser* ParserRegistry::parserFor(const std::string& relPath) const {
    std::string ext = std::filesystem::u8path(relPath).extension().u8string();
    return parserForExtension(ext);
}

const IParser* ParserRegistry::parserForExtension(const std::string& ext) const {
    std::string extLower = ext;
    std::transform(extLower.begin(), extLower.end(), extLower.begin(), ::tolower);
    for (const auto& parser : parsers) {
        if (parser->supportsExtension(extLower)) return parser.get();
    }
    return nullptr;
}

bool ParserRegistry::acceptsIdentifier(const std::string& name) const {
    return std::any_of(parsers.begin(), parsers.end(),
                       [&](const std::unique_ptr<IParser>& p) { return p->isValidIdentifier(name); });
}

ParserRegistry ParserRegistry::createDefault() {
    ParserRegistry registry;
    registry.registerParser(std::make_unique<TreeSitterPythonParser>());
    registry.registerParser(std::make_unique<RegexParser>());
    return registry;
}
