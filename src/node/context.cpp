// CONCORD - Node Context Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/node/context.h>
#include <concord/cascade/engine.h>
#include <concord/db/governancedb.h>
#include <concord/db/memorydb.h>
#include <concord/knowledge/envelope.h>
#include <concord/knowledge/handler.h>
#include <concord/transport/transport.h>
#include <concord/util/config.h>
#include <concord/util/logging.h>
#include <concord/util/time.h>

#include <stdexcept>

namespace concord {
namespace node {

using util::LogCategory::DEFAULT;
using util::LogCategory::CONFIG;

// ============================================================================
// Directory Creation Helper
// ============================================================================

static bool CreateDirectoryIfNeeded(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        return std::filesystem::is_directory(path, ec);
    }
    return std::filesystem::create_directories(path, ec);
}

// ============================================================================
// Storage Backend
// ============================================================================

const char* StorageBackendToString(StorageBackend backend) {
    switch (backend) {
        case StorageBackend::LevelDB: return "leveldb";
        case StorageBackend::Memory:  return "memory";
        default: return "unknown";
    }
}

std::optional<StorageBackend> ParseStorageBackend(const std::string& str) {
    if (str == "leveldb") return StorageBackend::LevelDB;
    if (str == "memory") return StorageBackend::Memory;
    return std::nullopt;
}

// ============================================================================
// NodeOptions
// ============================================================================

Status NodeOptions::FromConfig(const util::ConfigManager& config, NodeOptions* out) {
    namespace keys = util::ConfigKeys;
    NodeOptions opts;

    opts.dataDir = config.GetPath(keys::DATADIR, util::ConfigManager::GetDefaultDataDir());
    opts.logLevel = config.GetString(keys::LOGLEVEL, "info");
    opts.logFile = config.GetPath(keys::LOGFILE, "");
    opts.printToConsole = config.GetBool(keys::PRINTTOCONSOLE, true);

    std::string storage = config.GetString(keys::STORAGE, "leveldb");
    auto backend = ParseStorageBackend(storage);
    if (!backend) {
        return Status::InvalidArgument("unknown storage backend: " + storage);
    }
    opts.storage = *backend;

    // [knowledge]
    auto& kc = opts.knowledge;
    kc.enabled = config.GetBool(keys::ENABLED, true, keys::SECTION_KNOWLEDGE);
    kc.governanceEnabled = config.GetBool(keys::GOVERNANCE_ENABLED, true,
                                          keys::SECTION_KNOWLEDGE);
    kc.group = config.GetString(keys::GROUP, "", keys::SECTION_KNOWLEDGE);
    opts.schemaVersion = config.GetString(keys::SCHEMA_VERSION,
                                          knowledge::CURRENT_SCHEMA_VERSION,
                                          keys::SECTION_KNOWLEDGE);
    if (opts.schemaVersion != knowledge::CURRENT_SCHEMA_VERSION) {
        return Status::InvalidArgument("unsupported schema_version: " + opts.schemaVersion);
    }

    // [node]
    kc.clawId = config.GetString(keys::CLAW_ID, "", keys::SECTION_NODE);
    kc.instanceId = config.GetString(keys::INSTANCE_ID, "", keys::SECTION_NODE);

    // [voting]
    auto& policy = kc.policy;
    policy.enabled = config.GetBool(keys::ENABLED, true, keys::SECTION_VOTING);
    policy.minPoolSize = static_cast<int32_t>(
        config.GetInt(keys::MIN_POOL_SIZE, 3, keys::SECTION_VOTING));
    policy.quorumYes = static_cast<int32_t>(
        config.GetInt(keys::QUORUM_YES, 2, keys::SECTION_VOTING));
    policy.quorumNo = static_cast<int32_t>(
        config.GetInt(keys::QUORUM_NO, 2, keys::SECTION_VOTING));
    policy.timeout = util::Seconds(
        config.GetInt(keys::TIMEOUT_SEC, 86400, keys::SECTION_VOTING));
    policy.allowSelfVote = config.GetBool(keys::ALLOW_SELF_VOTE, false, keys::SECTION_VOTING);

    std::string policyError = policy.Validate();
    if (!policyError.empty()) {
        return Status::InvalidArgument("voting: " + policyError);
    }

    // [cascade]
    int64_t retries = config.GetInt(keys::MAX_RETRIES, cascade::DEFAULT_MAX_RETRIES,
                                    keys::SECTION_CASCADE);
    if (retries < 0 || retries > INT32_MAX) {
        return Status::InvalidArgument("cascade.max_retries out of range");
    }
    opts.maxRetries = static_cast<int32_t>(retries);

    *out = std::move(opts);
    return Status::Ok();
}

// ============================================================================
// NodeContext
// ============================================================================

NodeContext::NodeContext() = default;

NodeContext::~NodeContext() {
    if (initialized) {
        ShutdownNode(*this);
    }
}

// ============================================================================
// Logging
// ============================================================================

void InitLogging(const NodeOptions& options) {
    auto& logger = util::Logger::Instance();
    logger.ClearSinks();

    util::LogLevel level = util::LogLevelFromString(options.logLevel);
    logger.SetLevel(level);

    if (options.printToConsole) {
        util::ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<util::ConsoleSink>(consoleConfig));
    }

    if (!options.logFile.empty()) {
        util::FileSink::Config fileConfig;
        fileConfig.path = options.logFile;
        fileConfig.level = level;
        auto sink = std::make_shared<util::FileSink>(fileConfig);
        if (sink->IsOpen()) {
            logger.AddSink(sink);
        } else {
            LOG_WARN(CONFIG) << "Cannot open log file: " << options.logFile;
        }
    }
}

// ============================================================================
// InitializeNode
// ============================================================================

Status InitializeNode(NodeContext& node,
                      const NodeOptions& options,
                      std::unique_ptr<transport::Transport> transport,
                      std::unique_ptr<util::Clock> clock) {
    node.options = options;

    node.clock = clock ? std::move(clock) : std::make_unique<util::SystemClock>();

    // ========================================================================
    // Step 1: Open the governance store
    // ========================================================================

    if (options.storage == StorageBackend::Memory) {
        node.store = std::make_unique<db::GovernanceDB>(
            std::make_unique<db::MemoryDatabase>());
        LOG_INFO(DEFAULT) << "Using in-memory governance store";
    } else {
        std::filesystem::path storeDir = options.dataDir / "governance";
        if (!CreateDirectoryIfNeeded(options.dataDir)) {
            return Status::StorageError("cannot create data directory: " +
                                        options.dataDir.string());
        }
        try {
            node.store = db::GovernanceDB::Open(storeDir);
        } catch (const std::runtime_error& e) {
            LOG_ERROR(DEFAULT) << "Failed to open governance store: " << e.what();
            return Status::StorageError(e.what());
        }
        LOG_INFO(DEFAULT) << "Governance store: " << storeDir.string();
    }

    // ========================================================================
    // Step 2: Transport
    // ========================================================================

    if (transport) {
        node.transport = std::move(transport);
    } else {
        std::filesystem::path outbox = options.dataDir / "outbox";
        if (!CreateDirectoryIfNeeded(outbox)) {
            return Status::StorageError("cannot create outbox: " + outbox.string());
        }
        node.transport = std::make_unique<transport::SpoolTransport>(outbox);
    }
    LOG_DEBUG(DEFAULT) << "Transport: " << node.transport->Name();

    // ========================================================================
    // Step 3: Services
    // ========================================================================

    node.knowledge = std::make_unique<knowledge::KnowledgeService>(
        options.knowledge, *node.store, node.transport.get(), *node.clock);
    node.handler = std::make_unique<knowledge::KnowledgeHandler>(*node.knowledge, *node.store);
    node.cascade = std::make_unique<cascade::CascadeEngine>(
        *node.store, *node.clock, options.maxRetries);

    node.initialized = true;
    LOG_INFO(DEFAULT) << "Node initialized (group=" << options.knowledge.group
                      << ", claw=" << options.knowledge.clawId << ")";
    return Status::Ok();
}

// ============================================================================
// ShutdownNode
// ============================================================================

void ShutdownNode(NodeContext& node) {
    node.cascade.reset();
    node.handler.reset();
    node.knowledge.reset();
    node.transport.reset();
    node.store.reset();
    node.clock.reset();
    node.initialized = false;
    util::Logger::Instance().Flush();
}

} // namespace node
} // namespace concord
