// CONCORD - Pub/Sub Transport Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/transport/transport.h>
#include <concord/util/json.h>
#include <concord/util/logging.h>

#include <fstream>

namespace concord {
namespace transport {

using util::LogCategory::TRANSPORT;

// ============================================================================
// MemoryTransport
// ============================================================================

Status MemoryTransport::Produce(const std::string& topic,
                                const std::string& key,
                                const std::string& payload) {
    if (topic.empty()) {
        return Status::InvalidArgument("topic is required");
    }

    std::vector<Subscriber> targets;
    Message message{topic, key, payload};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (failNext_ > 0) {
            --failNext_;
            LOG_WARN(TRANSPORT) << "Injected produce failure on " << topic;
            return Status::TransportError("produce to " + topic + " failed");
        }
        messages_.push_back(message);
        auto it = subscribers_.find(topic);
        if (it != subscribers_.end()) {
            targets = it->second;
        }
    }

    // Deliver outside the lock so subscribers may produce in turn
    for (const auto& subscriber : targets) {
        subscriber(message);
    }
    return Status::Ok();
}

void MemoryTransport::Subscribe(const std::string& topic, Subscriber subscriber) {
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[topic].push_back(std::move(subscriber));
}

void MemoryTransport::FailNext(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    failNext_ = count;
}

std::vector<Message> MemoryTransport::Messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

std::vector<Message> MemoryTransport::MessagesOn(const std::string& topic) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> out;
    for (const auto& m : messages_) {
        if (m.topic == topic) {
            out.push_back(m);
        }
    }
    return out;
}

size_t MemoryTransport::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

void MemoryTransport::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    messages_.clear();
}

// ============================================================================
// SpoolTransport
// ============================================================================

SpoolTransport::SpoolTransport(const std::filesystem::path& dir)
    : dir_(dir) {}

std::filesystem::path SpoolTransport::PathFor(const std::string& topic) const {
    return dir_ / (topic + ".jsonl");
}

Status SpoolTransport::Produce(const std::string& topic,
                               const std::string& key,
                               const std::string& payload) {
    if (topic.empty() || topic.find('/') != std::string::npos) {
        return Status::InvalidArgument("invalid topic '" + topic + "'");
    }

    util::JSONValue::Object line;
    line["topic"] = util::JSONValue(topic);
    line["key"] = util::JSONValue(key);
    line["payload"] = util::JSONValue(payload);
    std::string encoded = util::JSONValue(line).ToJSON();

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        return Status::TransportError("cannot create spool dir " + dir_.string() + ": " + ec.message());
    }

    std::ofstream out(PathFor(topic), std::ios::app | std::ios::binary);
    if (!out) {
        return Status::TransportError("cannot open spool file for " + topic);
    }
    out << encoded << '\n';
    out.flush();
    if (!out) {
        return Status::TransportError("write to spool file for " + topic + " failed");
    }
    LOG_TRACE(TRANSPORT) << "Spooled message on " << topic << " key=" << key;
    return Status::Ok();
}

} // namespace transport
} // namespace concord
