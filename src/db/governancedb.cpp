// CONCORD - Governance State Store Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/db/governancedb.h>
#include <concord/util/logging.h>

#include <algorithm>
#include <stdexcept>

namespace concord {
namespace db {

using util::LogCategory::STORE;

namespace {

void AppendPart(std::string& key, const std::string& part) {
    key.append(part);
    key.push_back('\0');
}

} // namespace

// ============================================================================
// Key Builders
// ============================================================================

std::string ProposalKey(const std::string& id) {
    return MakeKey(prefix::PROPOSAL, id);
}

std::string VoteKey(const std::string& proposalId, const std::string& voterId) {
    std::string key = MakeKey(prefix::VOTE);
    AppendPart(key, proposalId);
    key.append(voterId);
    return key;
}

std::string FactKey(const std::string& group, const std::string& subject, const std::string& predicate) {
    std::string key = MakeKey(prefix::FACT);
    AppendPart(key, group);
    AppendPart(key, subject);
    key.append(predicate);
    return key;
}

std::string FactHistoryKey(const knowledge::Fact& fact) {
    std::string key = MakeKey(prefix::FACT_HISTORY);
    AppendPart(key, fact.group);
    AppendPart(key, fact.subject);
    AppendPart(key, fact.predicate);
    AppendBE64(key, static_cast<uint64_t>(fact.version));
    key.append(fact.source);
    return key;
}

std::string IdempotencyRecordKey(const std::string& key) {
    return MakeKey(prefix::IDEMPOTENCY, key);
}

std::string TaskKey(const std::string& traceId, const std::string& taskId) {
    std::string key = MakeKey(prefix::TASK);
    AppendPart(key, traceId);
    key.append(taskId);
    return key;
}

std::string TaskSequenceKey(const std::string& traceId, int32_t sequence) {
    std::string key = MakeKey(prefix::TASK_SEQUENCE);
    AppendPart(key, traceId);
    AppendBE64(key, static_cast<uint64_t>(sequence));
    return key;
}

std::string TransitionDedupKey(const std::string& traceId, const std::string& taskId,
                               const std::string& idempotencyKey) {
    std::string key;
    AppendPart(key, traceId);
    AppendPart(key, taskId);
    key.append(idempotencyKey);
    return IdempotencyRecordKey(key);
}

std::string TransitionKey(const std::string& traceId, const std::string& taskId, uint64_t seq) {
    std::string key = MakeKey(prefix::TRANSITION);
    AppendPart(key, traceId);
    AppendPart(key, taskId);
    AppendBE64(key, seq);
    return key;
}

std::string MemberKey(const std::string& group, const std::string& clawId) {
    std::string key = MakeKey(prefix::MEMBER);
    AppendPart(key, group);
    key.append(clawId);
    return key;
}

concord::Status FromDbStatus(const db::Status& status, const std::string& context) {
    if (status.ok()) {
        return concord::Status::Ok();
    }
    std::string msg = context + ": " + status.ToString();
    if (status.IsNotFound()) {
        return concord::Status::NotFound(msg);
    }
    if (status.IsCorruption()) {
        return concord::Status::Corruption(msg);
    }
    return concord::Status::StorageError(msg);
}

// ============================================================================
// Construction
// ============================================================================

GovernanceDB::GovernanceDB(std::unique_ptr<Database> db)
    : db_(std::move(db))
{
    if (!db_) {
        throw std::invalid_argument("GovernanceDB requires a database");
    }
}

std::unique_ptr<GovernanceDB> GovernanceDB::Open(const std::filesystem::path& path,
                                                 const Options& options) {
    auto [status, database] = OpenDatabase(path, options);
    if (!status.ok()) {
        throw std::runtime_error("Failed to open governance database: " + status.ToString());
    }
    LOG_INFO(STORE) << "Opened governance database at " << path.string();
    return std::make_unique<GovernanceDB>(std::move(database));
}

// ============================================================================
// Record Helpers
// ============================================================================

template<typename T>
concord::Status GovernanceDB::ReadRecord(const std::string& key, T* out) const {
    std::string value;
    db::Status s = db_->Get(key, &value);
    if (!s.ok()) {
        return FromDbStatus(s, "read");
    }
    if (!DeserializeFromString(value, *out)) {
        return concord::Status::Corruption("undecodable record");
    }
    return concord::Status::Ok();
}

template<typename T, typename Func>
concord::Status GovernanceDB::ScanPrefix(const std::string& keyPrefix, Func&& func) const {
    auto iter = db_->NewIterator();
    for (iter->Seek(Slice(keyPrefix)); iter->Valid(); iter->Next()) {
        if (!iter->key().starts_with(Slice(keyPrefix))) {
            break;
        }
        T record;
        if (!DeserializeFromString(iter->value().ToString(), record)) {
            return concord::Status::Corruption("undecodable record under prefix '" +
                                               std::string(1, keyPrefix[0]) + "'");
        }
        if (!func(iter->key(), record)) {
            break;
        }
    }
    return FromDbStatus(iter->status(), "scan");
}

// ============================================================================
// Proposals
// ============================================================================

concord::Status GovernanceDB::CreateProposal(const knowledge::Proposal& proposal) {
    if (proposal.id.empty()) {
        return concord::Status::InvalidArgument("proposal id is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = ProposalKey(proposal.id);
    std::string existing;
    db::Status s = db_->Get(key, &existing);
    if (s.ok()) {
        return concord::Status::DuplicateId("proposal " + proposal.id + " already exists");
    }
    if (!s.IsNotFound()) {
        return FromDbStatus(s, "create proposal");
    }

    s = db_->Put(key, SerializeToString(proposal));
    if (!s.ok()) {
        return FromDbStatus(s, "create proposal");
    }
    LOG_DEBUG(STORE) << "Stored proposal " << proposal.id;
    return concord::Status::Ok();
}

concord::Status GovernanceDB::GetProposal(const std::string& id, knowledge::Proposal* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    concord::Status s = ReadRecord(ProposalKey(id), out);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("proposal " + id + " not found");
    }
    return s;
}

concord::Status GovernanceDB::ListProposals(std::optional<knowledge::ProposalStatus> status,
                                            size_t limit,
                                            std::vector<knowledge::Proposal>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    concord::Status s = ScanPrefix<knowledge::Proposal>(
        MakeKey(prefix::PROPOSAL),
        [&](const Slice&, const knowledge::Proposal& p) {
            if (!status || p.status == *status) {
                out->push_back(p);
            }
            return true;
        });
    if (!s.ok()) {
        return s;
    }

    std::stable_sort(out->begin(), out->end(),
                     [](const knowledge::Proposal& a, const knowledge::Proposal& b) {
                         return a.createdAt > b.createdAt;
                     });
    if (limit > 0 && out->size() > limit) {
        out->resize(limit);
    }
    return concord::Status::Ok();
}

concord::Status GovernanceDB::UpdateProposalDecision(const std::string& id,
                                             const knowledge::Decision& decision,
                                             util::TimePoint decidedAt,
                                             DecisionRecord* out) {
    *out = DecisionRecord();
    if (!decision.IsTerminal()) {
        return concord::Status::InvalidArgument("decision for " + id + " is not terminal");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    knowledge::Proposal proposal;
    concord::Status s = ReadRecord(ProposalKey(id), &proposal);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("proposal " + id + " not found");
    }
    if (!s.ok()) {
        return s;
    }

    if (proposal.status != knowledge::ProposalStatus::Pending) {
        LOG_DEBUG(STORE) << "Ignoring late decision for " << id << " (already "
                         << knowledge::ProposalStatusToString(proposal.status) << ")";
        return concord::Status::Ok();
    }

    proposal.status = decision.status;
    proposal.yes = decision.yes;
    proposal.no = decision.no;
    proposal.reason = decision.reason;
    proposal.decidedAt = decidedAt;

    WriteBatch batch;
    batch.Put(ProposalKey(id), SerializeToString(proposal));

    DecisionRecord record;
    if (decision.status == knowledge::ProposalStatus::Approved) {
        knowledge::FactTriple triple = knowledge::ParseStatement(proposal);
        int64_t version = 1;
        knowledge::Fact latest;
        s = ReadRecord(FactKey(proposal.group, triple.subject, triple.predicate), &latest);
        if (s.ok()) {
            version = latest.version + 1;
        } else if (!s.IsNotFound()) {
            return s;
        }

        knowledge::Fact fact = knowledge::DeriveFact(proposal, version, decidedAt);
        s = StageFactLocked(fact, &batch, &record.factResult);
        if (!s.ok()) {
            return s;
        }
        record.fact = fact;
    }

    db::Status ws = db_->Write(&batch);
    if (!ws.ok()) {
        return FromDbStatus(ws, "record decision");
    }
    record.updated = true;
    *out = record;
    return concord::Status::Ok();
}

// ============================================================================
// Votes
// ============================================================================

concord::Status GovernanceDB::UpsertVote(const knowledge::Vote& vote) {
    if (vote.proposalId.empty() || vote.voterId.empty()) {
        return concord::Status::InvalidArgument("vote requires proposal id and voter id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    db::Status s = db_->Put(VoteKey(vote.proposalId, vote.voterId), SerializeToString(vote));
    if (!s.ok()) {
        return FromDbStatus(s, "upsert vote");
    }
    LOG_DEBUG(STORE) << "Stored vote " << vote.voterId << "=" << knowledge::VoteValueToString(vote.value)
                     << " on " << vote.proposalId;
    return concord::Status::Ok();
}

concord::Status GovernanceDB::ListVotes(const std::string& proposalId,
                                        std::vector<knowledge::Vote>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::VOTE);
    AppendPart(keyPrefix, proposalId);
    return ScanPrefix<knowledge::Vote>(keyPrefix, [&](const Slice&, const knowledge::Vote& v) {
        out->push_back(v);
        return true;
    });
}

// ============================================================================
// Facts
// ============================================================================

concord::Status GovernanceDB::GetFactLatest(const std::string& group,
                                            const std::string& subject,
                                            const std::string& predicate,
                                            knowledge::Fact* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    concord::Status s = ReadRecord(FactKey(group, subject, predicate), out);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("no fact for " + subject + "/" + predicate);
    }
    return s;
}

concord::Status GovernanceDB::UpsertFactLatest(const knowledge::Fact& incoming,
                                               knowledge::FactApplyResult* result) {
    std::lock_guard<std::mutex> lock(mutex_);

    WriteBatch batch;
    concord::Status s = StageFactLocked(incoming, &batch, result);
    if (!s.ok()) {
        return s;
    }
    if (!batch.Empty()) {
        db::Status ws = db_->Write(&batch);
        if (!ws.ok()) {
            return FromDbStatus(ws, "upsert fact");
        }
    }
    return concord::Status::Ok();
}

concord::Status GovernanceDB::StageFactLocked(const knowledge::Fact& incoming, WriteBatch* batch,
                                              knowledge::FactApplyResult* result) const {
    if (incoming.group.empty() || incoming.subject.empty() || incoming.predicate.empty()) {
        return concord::Status::InvalidArgument("fact requires group, subject and predicate");
    }
    const std::string latestKey = FactKey(incoming.group, incoming.subject, incoming.predicate);
    knowledge::Fact existing;
    bool haveExisting = false;
    concord::Status s = ReadRecord(latestKey, &existing);
    if (s.ok()) {
        haveExisting = true;
    } else if (!s.IsNotFound()) {
        return s;
    }

    *result = knowledge::EvaluateFactApply(haveExisting ? &existing : nullptr, incoming);

    if (result->status == knowledge::FactApplyStatus::Stale) {
        LOG_DEBUG(STORE) << "Discarded stale fact " << incoming.subject << "/" << incoming.predicate
                         << " v" << incoming.version << " (" << result->reason << ")";
        return concord::Status::Ok();
    }

    // Same-version races keep both contenders in history
    if (result->applied || result->reason == "same_version_race") {
        batch->Put(FactHistoryKey(incoming), SerializeToString(incoming));
    }
    if (result->applied) {
        batch->Put(latestKey, SerializeToString(incoming));
    }
    return concord::Status::Ok();
}

concord::Status GovernanceDB::ListFacts(const std::string& group, size_t limit,
                                        std::vector<knowledge::Fact>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::FACT);
    if (!group.empty()) {
        AppendPart(keyPrefix, group);
    }
    return ScanPrefix<knowledge::Fact>(keyPrefix, [&](const Slice&, const knowledge::Fact& f) {
        out->push_back(f);
        return limit == 0 || out->size() < limit;
    });
}

concord::Status GovernanceDB::ListFactHistory(const std::string& group,
                                              const std::string& subject,
                                              const std::string& predicate,
                                              std::vector<knowledge::Fact>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::FACT_HISTORY);
    AppendPart(keyPrefix, group);
    AppendPart(keyPrefix, subject);
    AppendPart(keyPrefix, predicate);
    return ScanPrefix<knowledge::Fact>(keyPrefix, [&](const Slice&, const knowledge::Fact& f) {
        out->push_back(f);
        return true;
    });
}

concord::Status GovernanceDB::CountFacts(const std::string& group, size_t* count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    *count = 0;
    std::string keyPrefix = MakeKey(prefix::FACT);
    if (!group.empty()) {
        AppendPart(keyPrefix, group);
    }
    return ScanPrefix<knowledge::Fact>(keyPrefix, [&](const Slice&, const knowledge::Fact&) {
        ++*count;
        return true;
    });
}

// ============================================================================
// Idempotency
// ============================================================================

concord::Status GovernanceDB::RecordIdempotency(const std::string& key, const std::string& meta,
                                                bool* inserted) {
    *inserted = false;
    if (key.empty()) {
        return concord::Status::InvalidArgument("idempotency key is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string recordKey = IdempotencyRecordKey(key);
    std::string existing;
    db::Status s = db_->Get(recordKey, &existing);
    if (s.ok()) {
        return concord::Status::Ok();
    }
    if (!s.IsNotFound()) {
        return FromDbStatus(s, "idempotency lookup");
    }

    s = db_->Put(recordKey, meta);
    if (!s.ok()) {
        return FromDbStatus(s, "idempotency record");
    }
    *inserted = true;
    return concord::Status::Ok();
}

bool GovernanceDB::HasIdempotencyKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string value;
    return db_->Get(IdempotencyRecordKey(key), &value).ok();
}

// ============================================================================
// Cascade Tasks
// ============================================================================

concord::Status GovernanceDB::GetTaskLocked(const std::string& key, cascade::CascadeTask* out) const {
    return ReadRecord(key, out);
}

concord::Status GovernanceDB::NextTransitionSeq(const std::string& taskKey, uint64_t* seq) const {
    // taskKey is 't' + trace \0 task; transitions share the suffix
    std::string keyPrefix = MakeKey(prefix::TRANSITION);
    keyPrefix.append(taskKey, 1, std::string::npos);
    keyPrefix.push_back('\0');

    uint64_t count = 0;
    concord::Status s = ScanPrefix<cascade::CascadeTransition>(
        keyPrefix, [&](const Slice&, const cascade::CascadeTransition&) {
            ++count;
            return true;
        });
    *seq = count + 1;
    return s;
}

concord::Status GovernanceDB::CreateCascadeTask(const cascade::CascadeTask& task) {
    if (task.traceId.empty()) {
        return concord::Status::InvalidArgument("trace id is required");
    }
    std::string problem = task.Contract().Validate();
    if (!problem.empty()) {
        return concord::Status::InvalidArgument(problem);
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = TaskKey(task.traceId, task.taskId);
    std::string existing;
    db::Status s = db_->Get(key, &existing);
    if (s.ok()) {
        return concord::Status::DuplicateId("task " + task.taskId + " already exists in " + task.traceId);
    }
    if (!s.IsNotFound()) {
        return FromDbStatus(s, "create task");
    }

    // One task per stage; the gate looks up a single predecessor
    const std::string seqKey = TaskSequenceKey(task.traceId, task.sequence);
    std::string holder;
    s = db_->Get(seqKey, &holder);
    if (s.ok()) {
        return concord::Status::DuplicateId("sequence " + std::to_string(task.sequence) + " in " +
                                            task.traceId + " is taken by " + holder);
    }
    if (!s.IsNotFound()) {
        return FromDbStatus(s, "create task");
    }

    WriteBatch batch;
    batch.Put(key, SerializeToString(task));
    batch.Put(seqKey, task.taskId);
    s = db_->Write(&batch);
    if (!s.ok()) {
        return FromDbStatus(s, "create task");
    }
    LOG_DEBUG(STORE) << "Stored task " << task.traceId << "/" << task.taskId
                     << " seq=" << task.sequence;
    return concord::Status::Ok();
}

concord::Status GovernanceDB::GetCascadeTask(const std::string& traceId, const std::string& taskId,
                                             cascade::CascadeTask* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    concord::Status s = GetTaskLocked(TaskKey(traceId, taskId), out);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("task " + traceId + "/" + taskId + " not found");
    }
    return s;
}

concord::Status GovernanceDB::UpdateCascadeTaskIO(const std::string& traceId, const std::string& taskId,
                                                  const cascade::FieldMap* input,
                                                  const cascade::FieldMap* output,
                                                  util::TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = TaskKey(traceId, taskId);
    cascade::CascadeTask task;
    concord::Status s = GetTaskLocked(key, &task);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("task " + traceId + "/" + taskId + " not found");
    }
    if (!s.ok()) {
        return s;
    }
    if (cascade::IsTerminal(task.status)) {
        return concord::Status::StateConflict("task " + taskId + " is " +
                                              cascade::TaskStatusToString(task.status));
    }

    if (input) task.input = *input;
    if (output) task.output = *output;
    task.updatedAt = now;

    db::Status ws = db_->Put(key, SerializeToString(task));
    return FromDbStatus(ws, "update task io");
}

concord::Status GovernanceDB::AdvanceCascadeTask(const TransitionRequest& request,
                                                 TransitionResult* result) {
    if (request.idempotencyKey.empty()) {
        return concord::Status::InvalidArgument("idempotency key is required");
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string key = TaskKey(request.traceId, request.taskId);
    cascade::CascadeTask task;
    concord::Status s = GetTaskLocked(key, &task);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("task " + request.traceId + "/" + request.taskId + " not found");
    }
    if (!s.ok()) {
        return s;
    }

    // Replay of an already applied key: hand back the original transition
    const std::string dedupKey = TransitionDedupKey(request.traceId, request.taskId, request.idempotencyKey);
    std::string appliedAt;
    db::Status ds = db_->Get(dedupKey, &appliedAt);
    if (ds.ok()) {
        cascade::CascadeTransition original;
        s = ReadRecord(appliedAt, &original);
        if (!s.ok()) {
            return s;
        }
        result->inserted = false;
        result->transition = original;
        result->task = task;
        LOG_DEBUG(STORE) << "Replayed transition " << request.idempotencyKey << " on " << request.taskId;
        return concord::Status::Ok();
    }
    if (!ds.IsNotFound()) {
        return FromDbStatus(ds, "transition dedup");
    }

    if (task.status != request.from) {
        return concord::Status::StateConflict(
            "task " + request.taskId + " is " + cascade::TaskStatusToString(task.status) +
            ", expected " + cascade::TaskStatusToString(request.from));
    }
    if (!cascade::CanTransition(request.from, request.to)) {
        return concord::Status::InvalidArgument(
            std::string("transition ") + cascade::TaskStatusToString(request.from) + " -> " +
            cascade::TaskStatusToString(request.to) + " is not allowed");
    }

    uint64_t seq = 0;
    s = NextTransitionSeq(key, &seq);
    if (!s.ok()) {
        return s;
    }

    cascade::CascadeTransition transition;
    transition.traceId = request.traceId;
    transition.taskId = request.taskId;
    transition.seq = seq;
    transition.from = request.from;
    transition.to = request.to;
    transition.actor = request.actor;
    transition.reason = request.reason;
    transition.payload = request.payload;
    transition.idempotencyKey = request.idempotencyKey;
    transition.createdAt = request.at;

    task.status = request.to;
    task.updatedAt = request.at;
    if (request.from == cascade::TaskStatus::SelfTest &&
        (request.to == cascade::TaskStatus::Pending || request.to == cascade::TaskStatus::Failed)) {
        ++task.retryCount;
    }
    if (request.to == cascade::TaskStatus::Pending || request.to == cascade::TaskStatus::Failed) {
        task.lastError = request.reason;
        task.remediation = request.remediation;
    }
    if (request.to == cascade::TaskStatus::Validated) {
        task.lastError.clear();
        task.remediation.clear();
    }
    if (request.to == cascade::TaskStatus::Committed) {
        task.committedAt = request.at;
    }

    const std::string transitionKey = TransitionKey(request.traceId, request.taskId, seq);
    WriteBatch batch;
    batch.Put(key, SerializeToString(task));
    batch.Put(transitionKey, SerializeToString(transition));
    batch.Put(dedupKey, transitionKey);
    db::Status ws = db_->Write(&batch);
    if (!ws.ok()) {
        return FromDbStatus(ws, "advance task");
    }

    result->inserted = true;
    result->transition = transition;
    result->task = task;
    return concord::Status::Ok();
}

bool GovernanceDB::HasAppliedTransition(const std::string& traceId, const std::string& taskId,
                                        const std::string& idempotencyKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string value;
    return db_->Get(TransitionDedupKey(traceId, taskId, idempotencyKey), &value).ok();
}

concord::Status GovernanceDB::ListCascadeTasks(const std::string& traceId,
                                               std::vector<cascade::CascadeTask>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::TASK);
    AppendPart(keyPrefix, traceId);
    concord::Status s = ScanPrefix<cascade::CascadeTask>(
        keyPrefix, [&](const Slice&, const cascade::CascadeTask& t) {
            out->push_back(t);
            return true;
        });
    if (!s.ok()) {
        return s;
    }
    std::stable_sort(out->begin(), out->end(),
                     [](const cascade::CascadeTask& a, const cascade::CascadeTask& b) {
                         return a.sequence < b.sequence;
                     });
    return concord::Status::Ok();
}

concord::Status GovernanceDB::ListCascadeTransitions(const std::string& traceId,
                                                     const std::string& taskId,
                                                     size_t limit,
                                                     std::vector<cascade::CascadeTransition>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::TRANSITION);
    AppendPart(keyPrefix, traceId);
    if (!taskId.empty()) {
        AppendPart(keyPrefix, taskId);
    }
    concord::Status s = ScanPrefix<cascade::CascadeTransition>(
        keyPrefix, [&](const Slice&, const cascade::CascadeTransition& tr) {
            out->push_back(tr);
            return true;
        });
    if (!s.ok()) {
        return s;
    }
    std::stable_sort(out->begin(), out->end(),
                     [](const cascade::CascadeTransition& a, const cascade::CascadeTransition& b) {
                         return a.createdAt < b.createdAt;
                     });
    if (limit > 0 && out->size() > limit) {
        out->erase(out->begin(), out->end() - static_cast<std::ptrdiff_t>(limit));
    }
    return concord::Status::Ok();
}

// ============================================================================
// Group Roster
// ============================================================================

concord::Status GovernanceDB::UpsertGroupMember(const knowledge::GroupMember& member) {
    if (member.group.empty() || member.clawId.empty()) {
        return concord::Status::InvalidArgument("member requires group and claw id");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    db::Status s = db_->Put(MemberKey(member.group, member.clawId), SerializeToString(member));
    return FromDbStatus(s, "upsert member");
}

concord::Status GovernanceDB::ListGroupMembers(const std::string& group, bool activeOnly,
                                               std::vector<knowledge::GroupMember>* out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    out->clear();
    std::string keyPrefix = MakeKey(prefix::MEMBER);
    AppendPart(keyPrefix, group);
    return ScanPrefix<knowledge::GroupMember>(
        keyPrefix, [&](const Slice&, const knowledge::GroupMember& m) {
            if (!activeOnly || m.active) {
                out->push_back(m);
            }
            return true;
        });
}

concord::Status GovernanceDB::SetGroupMemberActive(const std::string& group, const std::string& clawId,
                                                   bool active, util::TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string key = MemberKey(group, clawId);
    knowledge::GroupMember member;
    concord::Status s = ReadRecord(key, &member);
    if (s.IsNotFound()) {
        return concord::Status::NotFound("member " + clawId + " not in " + group);
    }
    if (!s.ok()) {
        return s;
    }
    member.active = active;
    member.lastSeen = now;
    db::Status ws = db_->Put(key, SerializeToString(member));
    return FromDbStatus(ws, "set member active");
}

} // namespace db
} // namespace concord
