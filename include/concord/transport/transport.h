// CONCORD - Pub/Sub Transport
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Producer side of the message bus. Delivery is at-least-once; consumers
// rely on envelope idempotency keys to make redelivery harmless.

#ifndef CONCORD_TRANSPORT_TRANSPORT_H
#define CONCORD_TRANSPORT_TRANSPORT_H

#include <concord/core/status.h>

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace concord {
namespace transport {

/// One produced message
struct Message {
    std::string topic;
    std::string key;
    std::string payload;
};

// ============================================================================
// Transport Interface
// ============================================================================

class Transport {
public:
    virtual ~Transport() = default;

    /**
     * Publish a payload on a topic.
     * @return TRANSPORT_ERROR on delivery failure; the caller retries with
     *         the same envelope (and therefore the same idempotency key)
     */
    virtual Status Produce(const std::string& topic,
                           const std::string& key,
                           const std::string& payload) = 0;

    /// Human-readable backend name ("memory", "spool")
    virtual const char* Name() const = 0;
};

// ============================================================================
// In-Memory Bus
// ============================================================================

/**
 * In-process bus. Records every produced message and fans it out to topic
 * subscribers synchronously. Used in tests and for single-process demos.
 */
class MemoryTransport : public Transport {
public:
    using Subscriber = std::function<void(const Message&)>;

    Status Produce(const std::string& topic,
                   const std::string& key,
                   const std::string& payload) override;

    const char* Name() const override { return "memory"; }

    /// Receive every later message on `topic`
    void Subscribe(const std::string& topic, Subscriber subscriber);

    /// Make the next `count` Produce calls fail with TRANSPORT_ERROR
    void FailNext(int count);

    std::vector<Message> Messages() const;
    std::vector<Message> MessagesOn(const std::string& topic) const;
    size_t Count() const;
    void Clear();

private:
    mutable std::mutex mutex_;
    std::vector<Message> messages_;
    std::map<std::string, std::vector<Subscriber>> subscribers_;
    int failNext_{0};
};

// ============================================================================
// Spool Transport
// ============================================================================

/**
 * Outbox that appends one JSON line {"topic","key","payload"} per message
 * to <dir>/<topic>.jsonl. A relay (or `concord-cli ingest`) forwards it.
 */
class SpoolTransport : public Transport {
public:
    explicit SpoolTransport(const std::filesystem::path& dir);

    Status Produce(const std::string& topic,
                   const std::string& key,
                   const std::string& payload) override;

    const char* Name() const override { return "spool"; }

    std::filesystem::path PathFor(const std::string& topic) const;
    const std::filesystem::path& Directory() const { return dir_; }

private:
    std::filesystem::path dir_;
    std::mutex mutex_;
};

} // namespace transport
} // namespace concord

#endif // CONCORD_TRANSPORT_TRANSPORT_H
