// NUKLAI - Node Context Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/node/context.h"
#include "nuklai/db/memory.h"
#include "nuklai/util/config.h"
#include "nuklai/util/logging.h"

#include <stdexcept>
#include <vector>

namespace nuklai {

// ============================================================================
// Logging
// ============================================================================

bool InitializeLogging(const util::ConfigManager& config) {
    util::Logger& logger = util::Logger::Instance();
    logger.Initialize();

    std::string level = config.GetString(util::ConfigKeys::LEVEL, "info",
                                         util::ConfigKeys::SECTION_LOG);
    logger.SetLevel(util::LogLevelFromString(level));

    std::vector<std::string> categories =
        config.GetList(util::ConfigKeys::CATEGORIES, util::ConfigKeys::SECTION_LOG);
    if (categories.empty()) {
        logger.EnableAllCategories();
    } else {
        for (const auto& category : categories) {
            logger.EnableCategory(category);
        }
    }

    auto file = config.TryGetString(util::ConfigKeys::FILE, util::ConfigKeys::SECTION_LOG);
    if (file && !file->empty()) {
        std::string path = util::ConfigManager::ExpandTilde(*file);
        auto sink = std::make_shared<util::FileSink>(path);
        if (!sink->IsOpen()) {
            LOG_ERROR(util::LogCategory::NODE) << "Failed to open log file: " << path;
            return false;
        }
        logger.AddSink(sink);
    }

    LOG_INFO(util::LogCategory::NODE) << "Log level: " << util::LogLevelToString(logger.GetLevel());
    return true;
}

// ============================================================================
// Node Initialization
// ============================================================================

bool InitializeNode(NodeContext& node, const util::ConfigManager& config) {
    emission::Status s = emission::EmissionConfig::FromConfig(config, &node.emissionConfig);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::NODE) << "Invalid emission config: " << s.ToString();
        return false;
    }

    if (!node.stakeDB) {
        LOG_INFO(util::LogCategory::NODE) << "Using in-memory stake database";
        node.stakeDB = std::make_unique<db::MemoryDatabase>();
    }
    node.stakeStore = std::make_unique<emission::StakeStore>(node.stakeDB.get());

    node.initialized.store(true);
    LOG_INFO(util::LogCategory::NODE) << "Node initialized";
    return true;
}

emission::Emission& InitEmission(NodeContext& node,
                                 const emission::BlockSource& blocks,
                                 const emission::ConsensusView& consensus,
                                 Amount totalSupply,
                                 Amount maxSupply,
                                 const Address& emissionAddress) {
    std::lock_guard<std::mutex> lock(node.emissionMutex);

    if (node.emission) {
        return *node.emission;
    }
    if (!node.IsReady()) {
        throw std::logic_error("InitEmission called before InitializeNode");
    }

    node.emission = std::make_unique<emission::Emission>(
        node.emissionConfig, blocks, consensus, *node.stakeStore,
        totalSupply, maxSupply, emissionAddress);
    return *node.emission;
}

void ShutdownNode(NodeContext& node) {
    LOG_INFO(util::LogCategory::NODE) << "Shutting down node";

    {
        std::lock_guard<std::mutex> lock(node.emissionMutex);
        node.emission.reset();
    }
    node.stakeStore.reset();
    node.stakeDB.reset();
    node.initialized.store(false);

    util::Logger::Instance().Flush();
}

} // namespace nuklai
