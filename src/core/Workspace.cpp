#include "core/Workspace.h"
#include "utils/Logger.h"

Workspace::Workspace(const std::string& rootPath, Config config)
    : cfg(std::move(config)),
      tree(rootPath, cfg),
      registry(ParserRegistry::createDefault()),
      builder(tree, registry, cfg.minSymbolLength) {}

std::shared_ptr<const CrossRefGraph> Workspace::graph() {
    {
        std::lock_guard<std::mutex> lock(graphMutex);
        if (current) return current;
        if (auto stored = builder.load()) {
            Logger::getInstance().debug("Loaded symbol graph from " + builder.graphPath().u8string());
            current = std::make_shared<const CrossRefGraph>(std::move(*stored));
            return current;
        }
    }
    Logger::getInstance().info("Building symbol graph (first run)...");
    return rebuild(true);
}

std::shared_ptr<const CrossRefGraph> Workspace::rebuild(bool incremental) {
    std::lock_guard<std::mutex> lock(graphMutex);
    auto fresh = std::make_shared<const CrossRefGraph>(builder.build(incremental));
    current = fresh;
    return fresh;
}
