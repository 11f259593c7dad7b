// CONCORD - Governance State Store
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Durable store for proposals, votes, facts, the idempotency seen-set,
// cascade tasks and the group roster. Every read-modify-write runs under
// the store mutex and lands as one atomic WriteBatch.

#ifndef CONCORD_DB_GOVERNANCEDB_H
#define CONCORD_DB_GOVERNANCEDB_H

#include <concord/cascade/task.h>
#include <concord/core/status.h>
#include <concord/db/database.h>
#include <concord/knowledge/facts.h>
#include <concord/knowledge/types.h>
#include <concord/knowledge/voting.h>
#include <concord/util/time.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace db {

// ============================================================================
// Decision Record
// ============================================================================

struct DecisionRecord {
    /// False when the proposal had already left pending
    bool updated{false};
    /// Fact derived from an approved statement
    std::optional<knowledge::Fact> fact;
    knowledge::FactApplyResult factResult;
};

// ============================================================================
// Cascade Transition Request
// ============================================================================

struct TransitionRequest {
    std::string traceId;
    std::string taskId;
    cascade::TaskStatus from{cascade::TaskStatus::Pending};
    cascade::TaskStatus to{cascade::TaskStatus::Pending};
    std::string actor;
    std::string reason;
    std::string payload;
    std::string idempotencyKey;
    /// Stored on the task when moving to pending (retry) or failed
    std::string remediation;
    util::TimePoint at;
};

struct TransitionResult {
    /// False when the idempotency key was already applied (replay)
    bool inserted{false};
    /// The recorded transition (the original one on replay)
    cascade::CascadeTransition transition;
    /// Task state after the call
    cascade::CascadeTask task;
};

// ============================================================================
// Governance Database
// ============================================================================

class GovernanceDB {
public:
    /// Take ownership of an opened database
    explicit GovernanceDB(std::unique_ptr<Database> db);

    /**
     * Open or create a LevelDB-backed store.
     * @throws std::runtime_error if the database cannot be opened
     */
    static std::unique_ptr<GovernanceDB> Open(const std::filesystem::path& path,
                                              const Options& options = Options());

    GovernanceDB(const GovernanceDB&) = delete;
    GovernanceDB& operator=(const GovernanceDB&) = delete;

    // ========================================================================
    // Proposals
    // ========================================================================

    /// DUPLICATE_ID if a proposal with the same id exists
    concord::Status CreateProposal(const knowledge::Proposal& proposal);

    concord::Status GetProposal(const std::string& id, knowledge::Proposal* out) const;

    /// Proposals ordered by creation time (newest first); limit 0 = no limit
    concord::Status ListProposals(std::optional<knowledge::ProposalStatus> status,
                         size_t limit,
                         std::vector<knowledge::Proposal>* out) const;

    /**
     * Write a terminal decision onto a pending proposal. An approval also
     * derives the next fact version from the proposal statement; the
     * decision, the history row and the latest row land in one batch, so
     * either all of them are stored or none are.
     * A proposal that is no longer pending is left untouched and
     * `out->updated` is false; this is not an error.
     */
    concord::Status UpdateProposalDecision(const std::string& id,
                                  const knowledge::Decision& decision,
                                  util::TimePoint decidedAt,
                                  DecisionRecord* out);

    // ========================================================================
    // Votes
    // ========================================================================

    /// Insert or replace the vote of (proposalId, voterId)
    concord::Status UpsertVote(const knowledge::Vote& vote);

    concord::Status ListVotes(const std::string& proposalId, std::vector<knowledge::Vote>* out) const;

    // ========================================================================
    // Facts
    // ========================================================================

    concord::Status GetFactLatest(const std::string& group,
                         const std::string& subject,
                         const std::string& predicate,
                         knowledge::Fact* out) const;

    /**
     * Offer a fact write. The apply policy runs against the stored latest
     * version under the store lock; accepted and conflicting writes are
     * appended to history, and the latest row is replaced when the result
     * says `applied`.
     */
    concord::Status UpsertFactLatest(const knowledge::Fact& incoming, knowledge::FactApplyResult* result);

    /// Latest versions, optionally restricted to one group (empty = all)
    concord::Status ListFacts(const std::string& group, size_t limit,
                     std::vector<knowledge::Fact>* out) const;

    /// Every recorded version, oldest first
    concord::Status ListFactHistory(const std::string& group,
                           const std::string& subject,
                           const std::string& predicate,
                           std::vector<knowledge::Fact>* out) const;

    concord::Status CountFacts(const std::string& group, size_t* count) const;

    // ========================================================================
    // Idempotency
    // ========================================================================

    /// Mark a key as seen. `*inserted` is false if it was already present.
    concord::Status RecordIdempotency(const std::string& key, const std::string& meta, bool* inserted);

    bool HasIdempotencyKey(const std::string& key) const;

    // ========================================================================
    // Cascade Tasks
    // ========================================================================

    /// DUPLICATE_ID if (traceId, taskId) exists; INVALID_ARGUMENT on a bad contract
    concord::Status CreateCascadeTask(const cascade::CascadeTask& task);

    concord::Status GetCascadeTask(const std::string& traceId, const std::string& taskId,
                          cascade::CascadeTask* out) const;

    /// Replace the task's input and/or output maps (nullptr keeps the current value)
    concord::Status UpdateCascadeTaskIO(const std::string& traceId, const std::string& taskId,
                               const cascade::FieldMap* input,
                               const cascade::FieldMap* output,
                               util::TimePoint now);

    /**
     * Compare-and-set transition.
     *
     * A key already applied to this task returns OK with `inserted` false
     * and the original transition. Otherwise the stored status must equal
     * `from` (STATE_CONFLICT if not) and `from -> to` must be in the
     * transition table (INVALID_ARGUMENT if not).
     */
    concord::Status AdvanceCascadeTask(const TransitionRequest& request, TransitionResult* result);

    /// True if `idempotencyKey` was already applied to this task
    bool HasAppliedTransition(const std::string& traceId, const std::string& taskId,
                              const std::string& idempotencyKey) const;

    /// Tasks of one trace ordered by sequence
    concord::Status ListCascadeTasks(const std::string& traceId,
                            std::vector<cascade::CascadeTask>* out) const;

    /// Transitions of a trace (optionally one task), in recorded order
    concord::Status ListCascadeTransitions(const std::string& traceId,
                                  const std::string& taskId,
                                  size_t limit,
                                  std::vector<cascade::CascadeTransition>* out) const;

    // ========================================================================
    // Group Roster
    // ========================================================================

    concord::Status UpsertGroupMember(const knowledge::GroupMember& member);

    concord::Status ListGroupMembers(const std::string& group, bool activeOnly,
                            std::vector<knowledge::GroupMember>* out) const;

    /// NOT_FOUND if the member was never seen
    concord::Status SetGroupMemberActive(const std::string& group, const std::string& clawId,
                                bool active, util::TimePoint now);

    /// Backend statistics for diagnostics
    std::string GetStats() const { return db_->GetStats(); }

private:
    std::unique_ptr<Database> db_;
    mutable std::mutex mutex_;

    template<typename T>
    concord::Status ReadRecord(const std::string& key, T* out) const;

    template<typename T, typename Func>
    concord::Status ScanPrefix(const std::string& keyPrefix, Func&& func) const;

    concord::Status StageFactLocked(const knowledge::Fact& incoming, WriteBatch* batch,
                                    knowledge::FactApplyResult* result) const;
    concord::Status GetTaskLocked(const std::string& key, cascade::CascadeTask* out) const;
    concord::Status NextTransitionSeq(const std::string& taskKey, uint64_t* seq) const;
};

// ============================================================================
// Key Builders
// ============================================================================

std::string ProposalKey(const std::string& id);
std::string VoteKey(const std::string& proposalId, const std::string& voterId);
std::string FactKey(const std::string& group, const std::string& subject, const std::string& predicate);
std::string FactHistoryKey(const knowledge::Fact& fact);
std::string IdempotencyRecordKey(const std::string& key);
std::string TaskKey(const std::string& traceId, const std::string& taskId);
std::string TaskSequenceKey(const std::string& traceId, int32_t sequence);
std::string TransitionDedupKey(const std::string& traceId, const std::string& taskId,
                               const std::string& idempotencyKey);
std::string TransitionKey(const std::string& traceId, const std::string& taskId, uint64_t seq);
std::string MemberKey(const std::string& group, const std::string& clawId);

/// Map a backend status into the project error taxonomy
concord::Status FromDbStatus(const db::Status& status, const std::string& context);

} // namespace db
} // namespace concord

#endif // CONCORD_DB_GOVERNANCEDB_H
