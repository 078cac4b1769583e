// NUKLAI - Node Context
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// This file defines the NodeContext structure that owns the emission
// ledger and its stake store for one VM instance.

#ifndef NUKLAI_NODE_CONTEXT_H
#define NUKLAI_NODE_CONTEXT_H

#include "nuklai/core/types.h"
#include "nuklai/db/database.h"
#include "nuklai/emission/chain.h"
#include "nuklai/emission/config.h"
#include "nuklai/emission/emission.h"
#include "nuklai/emission/stake_store.h"

#include <atomic>
#include <memory>
#include <mutex>

namespace nuklai {

namespace util {
class ConfigManager;
}

// ============================================================================
// Node Context - Holds the ledger and its collaborators
// ============================================================================

/**
 * NodeContext owns:
 * - The stake record database (in-memory unless one is supplied)
 * - The stake store over that database
 * - The emission ledger, constructed once
 */
struct NodeContext {
    /// Emission parameters, loaded by InitializeNode
    emission::EmissionConfig emissionConfig;

    /// Stake record database; set before InitializeNode to use a persistent one
    std::unique_ptr<db::Database> stakeDB;

    std::unique_ptr<emission::StakeStore> stakeStore;

    /// The emission ledger (null until InitEmission)
    std::unique_ptr<emission::Emission> emission;

    std::atomic<bool> initialized{false};

    /// Guards construction of the ledger
    std::mutex emissionMutex;

    NodeContext() = default;
    ~NodeContext() = default;

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;
    NodeContext(NodeContext&&) = delete;
    NodeContext& operator=(NodeContext&&) = delete;

    bool IsReady() const {
        return initialized.load() && stakeStore != nullptr;
    }
};

// ============================================================================
// Node Initialization Functions
// ============================================================================

/**
 * Apply the [log] section: `level` sets the logger threshold and `file`
 * adds an append-only file sink.
 *
 * @return false if the log file could not be opened
 */
bool InitializeLogging(const util::ConfigManager& config);

/**
 * Load the emission config and open the stake store.
 *
 * @param node The node context to initialize
 * @param config Parsed configuration
 * @return true if initialization succeeded
 */
bool InitializeNode(NodeContext& node, const util::ConfigManager& config);

/**
 * Construct the emission ledger. The first call builds it from the node's
 * config and stake store; later calls return the existing ledger and ignore
 * their arguments.
 *
 * Throws std::logic_error if the node is not initialized, and
 * std::invalid_argument if the ledger parameters are rejected.
 */
emission::Emission& InitEmission(NodeContext& node,
                                 const emission::BlockSource& blocks,
                                 const emission::ConsensusView& consensus,
                                 Amount totalSupply,
                                 Amount maxSupply,
                                 const Address& emissionAddress);

/**
 * Release the ledger, the stake store and the database, and flush logs.
 */
void ShutdownNode(NodeContext& node);

} // namespace nuklai

#endif // NUKLAI_NODE_CONTEXT_H
