// CONCORD - Knowledge Envelope Handler
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Consumer side of the knowledge topics. Each raw envelope is decoded,
// checked against the governance precondition and the idempotency
// seen-set, then applied to local state.

#ifndef CONCORD_KNOWLEDGE_HANDLER_H
#define CONCORD_KNOWLEDGE_HANDLER_H

#include <concord/core/status.h>
#include <concord/knowledge/envelope.h>

#include <string>

namespace concord {
namespace db {
class GovernanceDB;
}

namespace knowledge {

class KnowledgeService;

struct ProcessResult {
    std::string type;
    std::string idempotencyKey;
    /// accepted, stale, conflict, duplicate or ignored
    std::string outcome;
    std::string detail;
};

class KnowledgeHandler {
public:
    KnowledgeHandler(KnowledgeService& service, db::GovernanceDB& store)
        : service_(service), store_(store) {}

    /**
     * Apply one envelope received on `topic` (empty topic skips the
     * topic/type agreement check).
     *
     * Replays and our own envelopes return OK with outcome "duplicate" or
     * "ignored". The key is recorded only after a successful apply, so a
     * failed apply is retried on redelivery.
     */
    Status Process(const std::string& topic, const std::string& raw, ProcessResult* result);

private:
    KnowledgeService& service_;
    db::GovernanceDB& store_;

    Status Dispatch(const Envelope& envelope, ProcessResult* result);
};

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_HANDLER_H
