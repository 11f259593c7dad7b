// CONCORD - Node Context
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Explicit application context. Owns the store, the transport, the clock and
// the services built on them, so no component reaches for global state.

#ifndef CONCORD_NODE_CONTEXT_H
#define CONCORD_NODE_CONTEXT_H

#include <concord/core/status.h>
#include <concord/knowledge/service.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace concord {

namespace util { class Clock; class ConfigManager; }
namespace db { class GovernanceDB; }
namespace transport { class Transport; }
namespace knowledge { class KnowledgeHandler; }
namespace cascade { class CascadeEngine; }

namespace node {

// ============================================================================
// Node Options
// ============================================================================

enum class StorageBackend {
    LevelDB,
    Memory
};

const char* StorageBackendToString(StorageBackend backend);
std::optional<StorageBackend> ParseStorageBackend(const std::string& str);

/**
 * Typed view of the configuration a node runs with.
 */
struct NodeOptions {
    /// Data directory (governance store and outbox live beneath it)
    std::filesystem::path dataDir;

    StorageBackend storage{StorageBackend::LevelDB};

    std::string logLevel{"info"};
    std::string logFile;            ///< empty disables file logging
    bool printToConsole{true};

    knowledge::KnowledgeConfig knowledge;

    /// Envelope schema this node speaks
    std::string schemaVersion{"v1"};

    /// Default retry budget for cascade tasks
    int32_t maxRetries{3};

    /**
     * Build options from a parsed configuration.
     * INVALID_ARGUMENT for an unknown storage backend, an unsupported
     * schema version, a negative retry budget or an invalid voting policy.
     */
    static Status FromConfig(const util::ConfigManager& config, NodeOptions* out);
};

// ============================================================================
// Node Context
// ============================================================================

struct NodeContext {
    NodeOptions options;

    // ========================================================================
    // Infrastructure
    // ========================================================================

    std::unique_ptr<util::Clock> clock;
    std::unique_ptr<db::GovernanceDB> store;
    std::unique_ptr<transport::Transport> transport;

    // ========================================================================
    // Services
    // ========================================================================

    std::unique_ptr<knowledge::KnowledgeService> knowledge;
    std::unique_ptr<knowledge::KnowledgeHandler> handler;
    std::unique_ptr<cascade::CascadeEngine> cascade;

    bool initialized{false};

    NodeContext();
    ~NodeContext();

    NodeContext(const NodeContext&) = delete;
    NodeContext& operator=(const NodeContext&) = delete;
};

// ============================================================================
// Initialization
// ============================================================================

/// Configure the global logger's sinks and level from the options
void InitLogging(const NodeOptions& options);

/**
 * Open the store and construct the services.
 *
 * @param transport Publisher to use; nullptr selects a spool transport
 *                  writing to <datadir>/outbox
 * @param clock     Time source; nullptr selects the system clock
 * @return STORAGE_ERROR if the store cannot be opened
 */
Status InitializeNode(NodeContext& node,
                      const NodeOptions& options,
                      std::unique_ptr<transport::Transport> transport = nullptr,
                      std::unique_ptr<util::Clock> clock = nullptr);

/// Tear down services before the store they reference
void ShutdownNode(NodeContext& node);

} // namespace node
} // namespace concord

#endif // CONCORD_NODE_CONTEXT_H
