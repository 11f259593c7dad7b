// CONCORD CLI - Command Line Interface
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// The concord-cli tool opens the local governance store and drives the
// knowledge service and the cascade engine. Envelopes are spooled to
// <datadir>/outbox/<topic>.jsonl.

#include <concord/cascade/engine.h>
#include <concord/core/status.h>
#include <concord/db/governancedb.h>
#include <concord/knowledge/handler.h>
#include <concord/knowledge/service.h>
#include <concord/node/context.h>
#include <concord/transport/transport.h>
#include <concord/util/config.h>
#include <concord/util/json.h>
#include <concord/util/logging.h>
#include <concord/util/time.h>

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace concord {
namespace cli {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "CONCORD CLI";

constexpr size_t DEFAULT_LIST_LIMIT = 20;

using util::JSONValue;
using util::LogCategory::CLI;

// ============================================================================
// CLI Configuration
// ============================================================================

struct CLIConfig {
    util::ConfigManager settings;

    // Output options
    bool jsonOutput{false};

    // Command
    std::string command;
    std::vector<std::string> args;

    // Flags
    bool showHelp{false};
    bool showVersion{false};
};

// ============================================================================
// Help Text
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n";
    std::cout << "Usage: concord-cli [-key=value ...] [options] <command> [command options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "  --json                     Print results as JSON\n";
    std::cout << "\nConfiguration overrides:\n";
    std::cout << "  -datadir=DIR               Data directory (default: ~/.concord)\n";
    std::cout << "  -conf=FILE                 Config file (default: <datadir>/concord.conf)\n";
    std::cout << "  -storage=leveldb|memory    Governance store backend\n";
    std::cout << "  -section.key=value         Any config key, e.g. -node.claw_id=claw-a\n";
    std::cout << "\nCommands:\n";
    std::cout << "  status\n";
    std::cout << "  propose   --statement=S [--title=T] [--tags=a,b] [--group=G] [--id=ID]\n";
    std::cout << "  vote      --proposal-id=ID --vote=yes|no [--reason=R] [--as-claw=C]\n";
    std::cout << "            [--pool-size=N]\n";
    std::cout << "  decisions [--status=S] [--limit=N] [--refresh]\n";
    std::cout << "  facts     [--group=G] [--limit=N]\n";
    std::cout << "  ingest    [--topic=T] [--file=F]     (JSON lines, '-' for stdin)\n";
    std::cout << "  task create   --trace=T --task=ID [--sequence=N] [--title=S]\n";
    std::cout << "                [--require=a,b] [--produce=a,b] [--rules=r1,r2]\n";
    std::cout << "                [--input=k=v,...] [--max-retries=N]\n";
    std::cout << "  task advance  --trace=T --task=ID --from=S --to=S [--actor=A]\n";
    std::cout << "                [--reason=R] [--key=K]\n";
    std::cout << "  task selftest --trace=T --task=ID [--output=k=v,...] [--actor=A]\n";
    std::cout << "  task commit   --trace=T --task=ID [--actor=A]\n";
    std::cout << "  task release  --trace=T --task=ID [--actor=A]\n";
    std::cout << "  task fail     --trace=T --task=ID [--reason=R] [--actor=A]\n";
    std::cout << "  task list     --trace=T [--transitions]\n";
    std::cout << "\nExamples:\n";
    std::cout << "  concord-cli -node.claw_id=claw-a propose --statement=\"db | uses | leveldb\"\n";
    std::cout << "  concord-cli --json vote --proposal-id=kp-0011223344556677 --vote=yes\n";
    std::cout << "  concord-cli decisions --refresh --status=approved\n";
    std::cout << "\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n";
    std::cout << "Copyright (c) 2024 CONCORD Developers\n";
    std::cout << "MIT License\n";
}

// ============================================================================
// Command Line Parsing
// ============================================================================

bool ParseCommandLine(int argc, char* argv[], CLIConfig& config) {
    std::string error;
    int first = config.settings.ParseCommandLine(argc, argv, &error);
    if (first < 0) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }

    static struct option longOptions[] = {
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {"json", no_argument, nullptr, 1001},
        {nullptr, 0, nullptr, 0}
    };

    // Scan only the global options between the overrides and the command
    std::vector<char*> globalArgv;
    globalArgv.push_back(argv[0]);
    for (int i = first; i < argc; ++i) {
        globalArgv.push_back(argv[i]);
    }
    globalArgv.push_back(nullptr);
    int globalArgc = static_cast<int>(globalArgv.size()) - 1;

    int opt;
    int optionIndex = 0;

    // Reset getopt ('+' stops at the first non-option: the command)
    optind = 0;

    while ((opt = getopt_long(globalArgc, globalArgv.data(), "+hv", longOptions,
                              &optionIndex)) != -1) {
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return true;
            case 'v':
                config.showVersion = true;
                return true;
            case 1001:  // --json
                config.jsonOutput = true;
                break;
            case '?':
            default:
                return false;
        }
    }

    for (int i = optind; i < globalArgc; ++i) {
        if (config.command.empty()) {
            config.command = globalArgv[i];
        } else {
            config.args.push_back(globalArgv[i]);
        }
    }
    return true;
}

// ============================================================================
// Command Option Parsing
// ============================================================================

struct OptionSpec {
    const char* name;
    bool hasArg;
};

using OptionMap = std::map<std::string, std::string>;

/// Parse --name=value / --name value / --flag options of one command
bool ParseOptions(const std::string& command,
                  const std::vector<std::string>& args,
                  const std::vector<OptionSpec>& specs,
                  OptionMap* out) {
    std::vector<std::string> storage;
    storage.push_back(command);
    storage.insert(storage.end(), args.begin(), args.end());

    std::vector<char*> argvPtrs;
    for (auto& s : storage) {
        argvPtrs.push_back(&s[0]);
    }
    argvPtrs.push_back(nullptr);
    int argc = static_cast<int>(storage.size());

    std::vector<struct option> longOptions;
    for (size_t i = 0; i < specs.size(); ++i) {
        longOptions.push_back({specs[i].name,
                               specs[i].hasArg ? required_argument : no_argument,
                               nullptr, static_cast<int>(1000 + i)});
    }
    longOptions.push_back({nullptr, 0, nullptr, 0});

    int opt;
    int optionIndex = 0;
    optind = 0;

    while ((opt = getopt_long(argc, argvPtrs.data(), "+", longOptions.data(),
                              &optionIndex)) != -1) {
        if (opt < 1000 || opt >= static_cast<int>(1000 + specs.size())) {
            return false;
        }
        const OptionSpec& spec = specs[opt - 1000];
        (*out)[spec.name] = spec.hasArg ? std::string(optarg) : std::string("true");
    }

    if (optind < argc) {
        std::cerr << command << ": unexpected argument '" << argvPtrs[optind] << "'\n";
        return false;
    }
    return true;
}

std::string GetOption(const OptionMap& options, const std::string& name,
                      const std::string& defaultValue = "") {
    auto it = options.find(name);
    return it == options.end() ? defaultValue : it->second;
}

bool HasOption(const OptionMap& options, const std::string& name) {
    return options.count(name) > 0;
}

bool ParseInt(const std::string& str, int64_t* out) {
    if (str.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(str.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return false;
    }
    *out = static_cast<int64_t>(value);
    return true;
}

/// Integer option; INVALID_ARGUMENT if present but malformed
Status GetIntOption(const OptionMap& options, const std::string& name,
                    int64_t defaultValue, int64_t* out) {
    auto it = options.find(name);
    if (it == options.end()) {
        *out = defaultValue;
        return Status::Ok();
    }
    if (!ParseInt(it->second, out)) {
        return Status::InvalidArgument("--" + name + " must be an integer");
    }
    return Status::Ok();
}

std::vector<std::string> SplitList(const std::string& str) {
    std::vector<std::string> items;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        size_t end = item.find_last_not_of(" \t");
        if (start != std::string::npos) {
            items.push_back(item.substr(start, end - start + 1));
        }
    }
    return items;
}

/// "k=v,k2=v2" -> field map
Status ParseFields(const std::string& str, cascade::FieldMap* out) {
    for (const auto& item : SplitList(str)) {
        size_t eq = item.find('=');
        if (eq == std::string::npos || eq == 0) {
            return Status::InvalidArgument("expected key=value, got '" + item + "'");
        }
        (*out)[item.substr(0, eq)] = item.substr(eq + 1);
    }
    return Status::Ok();
}

// ============================================================================
// JSON Rendering
// ============================================================================

JSONValue TimeToJSON(util::TimePoint tp) {
    if (util::IsZero(tp)) {
        return JSONValue();
    }
    return JSONValue(util::FormatISO8601Millis(tp));
}

JSONValue ProposalToJSON(const knowledge::Proposal& p) {
    JSONValue::Object obj;
    obj["id"] = p.id;
    obj["group"] = p.group;
    obj["title"] = p.title;
    obj["statement"] = p.statement;
    obj["tags"] = JSONValue::FromStrings(p.tags);
    obj["proposerId"] = p.proposerId;
    obj["traceId"] = p.traceId;
    obj["status"] = knowledge::ProposalStatusToString(p.status);
    obj["yes"] = p.yes;
    obj["no"] = p.no;
    obj["reason"] = p.reason;
    obj["createdAt"] = TimeToJSON(p.createdAt);
    obj["decidedAt"] = TimeToJSON(p.decidedAt);
    return JSONValue(std::move(obj));
}

JSONValue FactToJSON(const knowledge::Fact& f) {
    JSONValue::Object obj;
    obj["id"] = f.id;
    obj["group"] = f.group;
    obj["subject"] = f.subject;
    obj["predicate"] = f.predicate;
    obj["object"] = f.object;
    obj["version"] = f.version;
    obj["source"] = f.source;
    obj["proposalId"] = f.proposalId;
    obj["tags"] = JSONValue::FromStrings(f.tags);
    obj["createdAt"] = TimeToJSON(f.createdAt);
    return JSONValue(std::move(obj));
}

JSONValue DecisionToJSON(const knowledge::Decision& d) {
    JSONValue::Object obj;
    obj["status"] = knowledge::ProposalStatusToString(d.status);
    obj["yes"] = d.yes;
    obj["no"] = d.no;
    obj["reason"] = d.reason;
    return JSONValue(std::move(obj));
}

JSONValue FieldsToJSON(const cascade::FieldMap& fields) {
    JSONValue::Object obj;
    for (const auto& kv : fields) {
        obj[kv.first] = kv.second;
    }
    return JSONValue(std::move(obj));
}

JSONValue TaskToJSON(const cascade::CascadeTask& t) {
    JSONValue::Object obj;
    obj["traceId"] = t.traceId;
    obj["taskId"] = t.taskId;
    obj["sequence"] = t.sequence;
    obj["title"] = t.title;
    obj["status"] = cascade::TaskStatusToString(t.status);
    obj["requiredInput"] = JSONValue::FromStrings(t.requiredInput);
    obj["producedOutput"] = JSONValue::FromStrings(t.producedOutput);
    obj["validationRules"] = JSONValue::FromStrings(t.validationRules);
    obj["input"] = FieldsToJSON(t.input);
    obj["output"] = FieldsToJSON(t.output);
    obj["retryCount"] = t.retryCount;
    obj["maxRetries"] = t.maxRetries;
    obj["lastError"] = t.lastError;
    obj["remediation"] = t.remediation;
    obj["createdAt"] = TimeToJSON(t.createdAt);
    obj["updatedAt"] = TimeToJSON(t.updatedAt);
    obj["committedAt"] = TimeToJSON(t.committedAt);
    return JSONValue(std::move(obj));
}

JSONValue TransitionToJSON(const cascade::CascadeTransition& t) {
    JSONValue::Object obj;
    obj["traceId"] = t.traceId;
    obj["taskId"] = t.taskId;
    obj["seq"] = t.seq;
    obj["from"] = cascade::TaskStatusToString(t.from);
    obj["to"] = cascade::TaskStatusToString(t.to);
    obj["actor"] = t.actor;
    obj["reason"] = t.reason;
    obj["idempotencyKey"] = t.idempotencyKey;
    obj["createdAt"] = TimeToJSON(t.createdAt);
    return JSONValue(std::move(obj));
}

void PrintJSON(const JSONValue& value) {
    std::cout << value.ToJSON(true) << "\n";
}

void PrintTransitionLine(const cascade::CascadeTransition& t) {
    std::cout << "  #" << t.seq << " " << cascade::TaskStatusToString(t.from)
              << " -> " << cascade::TaskStatusToString(t.to);
    if (!t.reason.empty()) std::cout << " (" << t.reason << ")";
    if (!t.actor.empty()) std::cout << " by " << t.actor;
    std::cout << "\n";
}

// ============================================================================
// Error Reporting
// ============================================================================

int Fail(const Status& status) {
    LOG_DEBUG(CLI) << "Command failed: " << status.ToString();
    std::cerr << "error: " << status.ToString() << "\n";
    return 1;
}

/// TRANSPORT_ERROR after a committed local write: report, keep exit code 1
int FailAfterCommit(const Status& status, const std::vector<knowledge::Envelope>& envelopes) {
    std::cerr << "error: " << status.ToString() << "\n";
    std::cerr << "local state was saved; " << envelopes.size()
              << " envelope(s) were not published\n";
    return 1;
}

// ============================================================================
// Knowledge Commands
// ============================================================================

int CmdStatus(node::NodeContext& node, const CLIConfig& config) {
    knowledge::StatusReport report;
    Status s = node.knowledge->GetStatus(&report);
    if (!s.ok()) return Fail(s);

    if (config.jsonOutput) {
        JSONValue::Object counts;
        for (const auto& kv : report.counts) {
            counts[kv.first] = static_cast<uint64_t>(kv.second);
        }
        JSONValue::Object topics;
        topics["proposals"] = report.topics.proposals;
        topics["votes"] = report.topics.votes;
        topics["decisions"] = report.topics.decisions;
        topics["facts"] = report.topics.facts;
        topics["presence"] = report.topics.presence;
        topics["capabilities"] = report.topics.capabilities;

        JSONValue::Object obj;
        obj["enabled"] = report.enabled;
        obj["governanceEnabled"] = report.governanceEnabled;
        obj["group"] = report.group;
        obj["clawId"] = report.clawId;
        obj["instanceId"] = report.instanceId;
        obj["topics"] = JSONValue(std::move(topics));
        obj["proposals"] = JSONValue(std::move(counts));
        obj["facts"] = static_cast<uint64_t>(report.facts);
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    std::cout << "knowledge:   " << (report.enabled ? "enabled" : "disabled") << "\n";
    std::cout << "governance:  " << (report.governanceEnabled ? "enabled" : "disabled") << "\n";
    std::cout << "group:       " << report.group << "\n";
    std::cout << "claw:        " << report.clawId;
    if (!report.instanceId.empty()) std::cout << " (" << report.instanceId << ")";
    std::cout << "\n";
    std::cout << "proposals:  ";
    for (const auto& kv : report.counts) {
        std::cout << " " << kv.first << "=" << kv.second;
    }
    std::cout << "\n";
    std::cout << "facts:       " << report.facts << "\n";
    return 0;
}

int CmdPropose(node::NodeContext& node, const CLIConfig& config) {
    OptionMap opts;
    if (!ParseOptions("propose", config.args,
                      {{"statement", true}, {"title", true}, {"tags", true},
                       {"group", true}, {"id", true}}, &opts)) {
        return 1;
    }

    knowledge::ProposeRequest request;
    request.statement = GetOption(opts, "statement");
    request.title = GetOption(opts, "title");
    request.tags = SplitList(GetOption(opts, "tags"));
    request.group = GetOption(opts, "group");
    request.id = GetOption(opts, "id");

    knowledge::ProposeResult result;
    Status s = node.knowledge->Propose(request, &result);
    if (s.code() == Status::TRANSPORT_ERROR) return FailAfterCommit(s, result.envelopes);
    if (!s.ok()) return Fail(s);

    if (config.jsonOutput) {
        JSONValue::Object obj;
        obj["proposal"] = ProposalToJSON(result.proposal);
        obj["idempotencyKey"] = result.idempotencyKey;
        obj["published"] = result.published;
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    std::cout << "proposal " << result.proposal.id << " created ("
              << knowledge::ProposalStatusToString(result.proposal.status) << ")\n";
    std::cout << "  group:     " << result.proposal.group << "\n";
    std::cout << "  statement: " << result.proposal.statement << "\n";
    std::cout << "  published: " << (result.published ? "yes" : "no") << "\n";
    return 0;
}

int CmdVote(node::NodeContext& node, const CLIConfig& config) {
    OptionMap opts;
    if (!ParseOptions("vote", config.args,
                      {{"proposal-id", true}, {"vote", true}, {"reason", true},
                       {"as-claw", true}, {"pool-size", true}}, &opts)) {
        return 1;
    }

    knowledge::VoteRequest request;
    request.proposalId = GetOption(opts, "proposal-id");
    request.value = GetOption(opts, "vote");
    request.reason = GetOption(opts, "reason");
    request.voterId = GetOption(opts, "as-claw");

    int64_t poolSize = 0;
    Status s = GetIntOption(opts, "pool-size", 0, &poolSize);
    if (!s.ok()) return Fail(s);
    if (poolSize < 0 || poolSize > INT32_MAX) {
        return Fail(Status::InvalidArgument("--pool-size out of range"));
    }
    request.poolSize = static_cast<int32_t>(poolSize);

    knowledge::VoteResult result;
    s = node.knowledge->CastVote(request, &result);
    if (s.code() == Status::TRANSPORT_ERROR) return FailAfterCommit(s, result.envelopes);
    if (!s.ok()) return Fail(s);

    const auto& outcome = result.outcome;
    if (config.jsonOutput) {
        JSONValue::Object obj;
        obj["proposal"] = ProposalToJSON(outcome.proposal);
        obj["decision"] = DecisionToJSON(outcome.decision);
        obj["poolSize"] = outcome.poolSize;
        obj["decisionRecorded"] = outcome.resolved.decisionRecorded;
        if (outcome.resolved.fact) {
            JSONValue::Object fact = FactToJSON(*outcome.resolved.fact).GetObject();
            fact["apply"] = knowledge::FactApplyStatusToString(outcome.resolved.factResult.status);
            fact["applyReason"] = outcome.resolved.factResult.reason;
            obj["fact"] = JSONValue(std::move(fact));
        }
        obj["published"] = result.published;
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    std::cout << "vote recorded on " << outcome.proposal.id << "\n";
    std::cout << "  decision: " << knowledge::ProposalStatusToString(outcome.decision.status)
              << " (yes=" << outcome.decision.yes << " no=" << outcome.decision.no
              << " pool=" << outcome.poolSize << ")";
    if (!outcome.decision.reason.empty()) std::cout << " " << outcome.decision.reason;
    std::cout << "\n";
    if (outcome.resolved.fact) {
        const auto& fact = *outcome.resolved.fact;
        std::cout << "  fact:     " << fact.subject << " " << fact.predicate << " "
                  << fact.object << " v" << fact.version << " ["
                  << knowledge::FactApplyStatusToString(outcome.resolved.factResult.status)
                  << "]\n";
    }
    return 0;
}

int CmdDecisions(node::NodeContext& node, const CLIConfig& config) {
    OptionMap opts;
    if (!ParseOptions("decisions", config.args,
                      {{"status", true}, {"limit", true}, {"refresh", false}}, &opts)) {
        return 1;
    }

    std::optional<knowledge::ProposalStatus> filter;
    if (HasOption(opts, "status")) {
        filter = knowledge::ParseProposalStatus(GetOption(opts, "status"));
        if (!filter) {
            return Fail(Status::InvalidArgument("unknown status: " + GetOption(opts, "status")));
        }
    }

    int64_t limit = 0;
    Status s = GetIntOption(opts, "limit", DEFAULT_LIST_LIMIT, &limit);
    if (!s.ok()) return Fail(s);
    if (limit <= 0) return Fail(Status::InvalidArgument("--limit must be positive"));

    knowledge::ReevaluateResult refresh;
    if (HasOption(opts, "refresh")) {
        s = node.knowledge->ReevaluatePending(0, &refresh);
        if (s.code() == Status::TRANSPORT_ERROR) return FailAfterCommit(s, refresh.envelopes);
        if (!s.ok()) return Fail(s);
    }
    const std::vector<knowledge::VoteOutcome>& refreshed = refresh.resolved;

    std::vector<knowledge::Proposal> proposals;
    s = node.knowledge->ListDecisions(filter, static_cast<size_t>(limit), &proposals);
    if (!s.ok()) return Fail(s);

    if (config.jsonOutput) {
        JSONValue::Array items;
        for (const auto& p : proposals) {
            items.push_back(ProposalToJSON(p));
        }
        JSONValue::Object obj;
        obj["decisions"] = JSONValue(std::move(items));
        obj["refreshed"] = static_cast<uint64_t>(refreshed.size());
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    if (!refreshed.empty()) {
        std::cout << refreshed.size() << " pending proposal(s) resolved on refresh\n";
    }
    if (proposals.empty()) {
        std::cout << "no proposals\n";
        return 0;
    }
    for (const auto& p : proposals) {
        std::cout << p.id << "  " << knowledge::ProposalStatusToString(p.status)
                  << "  yes=" << p.yes << " no=" << p.no;
        if (!p.reason.empty()) std::cout << "  " << p.reason;
        std::cout << "\n    " << (p.title.empty() ? p.statement : p.title) << "\n";
    }
    return 0;
}

int CmdFacts(node::NodeContext& node, const CLIConfig& config) {
    OptionMap opts;
    if (!ParseOptions("facts", config.args, {{"group", true}, {"limit", true}}, &opts)) {
        return 1;
    }

    std::string group = GetOption(opts, "group", node.options.knowledge.group);
    int64_t limit = 0;
    Status s = GetIntOption(opts, "limit", DEFAULT_LIST_LIMIT, &limit);
    if (!s.ok()) return Fail(s);
    if (limit <= 0) return Fail(Status::InvalidArgument("--limit must be positive"));

    std::vector<knowledge::Fact> facts;
    s = node.knowledge->ListFacts(group, static_cast<size_t>(limit), &facts);
    if (!s.ok()) return Fail(s);

    if (config.jsonOutput) {
        JSONValue::Array items;
        for (const auto& f : facts) {
            items.push_back(FactToJSON(f));
        }
        JSONValue::Object obj;
        obj["facts"] = JSONValue(std::move(items));
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    if (facts.empty()) {
        std::cout << "no facts\n";
        return 0;
    }
    for (const auto& f : facts) {
        std::cout << f.id << "  v" << f.version << "  " << f.subject << " "
                  << f.predicate << " " << f.object << "\n";
        std::cout << "    source: " << f.source << "\n";
    }
    return 0;
}

int CmdIngest(node::NodeContext& node, const CLIConfig& config) {
    OptionMap opts;
    if (!ParseOptions("ingest", config.args, {{"topic", true}, {"file", true}}, &opts)) {
        return 1;
    }

    std::string topic = GetOption(opts, "topic");
    std::string path = GetOption(opts, "file", "-");

    std::ifstream file;
    std::istream* in = &std::cin;
    if (path != "-") {
        file.open(path);
        if (!file.is_open()) {
            return Fail(Status::InvalidArgument("cannot open " + path));
        }
        in = &file;
    }

    std::map<std::string, size_t> outcomes;
    JSONValue::Array items;
    size_t failures = 0;
    size_t lineNo = 0;
    std::string line;

    while (std::getline(*in, line)) {
        ++lineNo;
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        knowledge::ProcessResult result;
        Status s = node.handler->Process(topic, line, &result);
        std::string outcome = s.ok() ? result.outcome : std::string("error");
        ++outcomes[outcome];
        if (!s.ok()) {
            ++failures;
            LOG_WARN(CLI) << "line " << lineNo << ": " << s.ToString();
        }

        if (config.jsonOutput) {
            JSONValue::Object obj;
            obj["line"] = static_cast<uint64_t>(lineNo);
            obj["type"] = result.type;
            obj["idempotencyKey"] = result.idempotencyKey;
            obj["outcome"] = outcome;
            obj["detail"] = s.ok() ? result.detail : s.ToString();
            items.push_back(JSONValue(std::move(obj)));
        } else {
            std::cout << lineNo << ": " << (result.type.empty() ? "?" : result.type)
                      << " " << outcome;
            if (!s.ok()) {
                std::cout << " " << s.ToString();
            } else if (!result.detail.empty()) {
                std::cout << " " << result.detail;
            }
            std::cout << "\n";
        }
    }

    if (config.jsonOutput) {
        JSONValue::Object summary;
        for (const auto& kv : outcomes) {
            summary[kv.first] = static_cast<uint64_t>(kv.second);
        }
        JSONValue::Object obj;
        obj["results"] = JSONValue(std::move(items));
        obj["summary"] = JSONValue(std::move(summary));
        PrintJSON(JSONValue(std::move(obj)));
    } else {
        std::cout << "processed " << lineNo << " line(s):";
        for (const auto& kv : outcomes) {
            std::cout << " " << kv.first << "=" << kv.second;
        }
        std::cout << "\n";
    }
    return failures == 0 ? 0 : 1;
}

// ============================================================================
// Task Commands
// ============================================================================

int PrintTransitionResult(const db::TransitionResult& result, const CLIConfig& config) {
    if (config.jsonOutput) {
        JSONValue::Object obj;
        obj["inserted"] = result.inserted;
        obj["transition"] = TransitionToJSON(result.transition);
        obj["task"] = TaskToJSON(result.task);
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }
    std::cout << result.task.taskId << ": "
              << cascade::TaskStatusToString(result.task.status)
              << (result.inserted ? "" : " (replay)") << "\n";
    PrintTransitionLine(result.transition);
    return 0;
}

int CmdTaskCreate(node::NodeContext& node, const CLIConfig& config,
                  const std::vector<std::string>& args) {
    OptionMap opts;
    if (!ParseOptions("task create", args,
                      {{"trace", true}, {"task", true}, {"sequence", true},
                       {"title", true}, {"require", true}, {"produce", true},
                       {"rules", true}, {"input", true}, {"max-retries", true}}, &opts)) {
        return 1;
    }

    cascade::CreateTaskRequest request;
    request.traceId = GetOption(opts, "trace");
    request.taskId = GetOption(opts, "task");
    request.title = GetOption(opts, "title");
    request.requiredInput = SplitList(GetOption(opts, "require"));
    request.producedOutput = SplitList(GetOption(opts, "produce"));
    request.validationRules = SplitList(GetOption(opts, "rules"));

    int64_t sequence = 0;
    Status s = GetIntOption(opts, "sequence", 1, &sequence);
    if (!s.ok()) return Fail(s);
    if (sequence <= 0 || sequence > INT32_MAX) {
        return Fail(Status::InvalidArgument("--sequence must be positive"));
    }
    request.sequence = static_cast<int32_t>(sequence);

    int64_t maxRetries = 0;
    s = GetIntOption(opts, "max-retries", -1, &maxRetries);
    if (!s.ok()) return Fail(s);
    if (maxRetries > INT32_MAX) {
        return Fail(Status::InvalidArgument("--max-retries out of range"));
    }
    request.maxRetries = static_cast<int32_t>(maxRetries);

    s = ParseFields(GetOption(opts, "input"), &request.input);
    if (!s.ok()) return Fail(s);

    cascade::CascadeTask task;
    s = node.cascade->CreateTask(request, &task);
    if (!s.ok()) return Fail(s);

    if (config.jsonOutput) {
        PrintJSON(TaskToJSON(task));
        return 0;
    }
    std::cout << "task " << task.taskId << " created in trace " << task.traceId
              << " (sequence " << task.sequence << ", "
              << cascade::TaskStatusToString(task.status) << ")\n";
    return 0;
}

int CmdTaskAdvance(node::NodeContext& node, const CLIConfig& config,
                   const std::vector<std::string>& args) {
    OptionMap opts;
    if (!ParseOptions("task advance", args,
                      {{"trace", true}, {"task", true}, {"from", true}, {"to", true},
                       {"actor", true}, {"reason", true}, {"key", true},
                       {"remediation", true}}, &opts)) {
        return 1;
    }

    auto from = cascade::ParseTaskStatus(GetOption(opts, "from"));
    auto to = cascade::ParseTaskStatus(GetOption(opts, "to"));
    if (!from || !to) {
        return Fail(Status::InvalidArgument("--from and --to must name task states"));
    }

    cascade::AdvanceRequest request;
    request.traceId = GetOption(opts, "trace");
    request.taskId = GetOption(opts, "task");
    request.from = *from;
    request.to = *to;
    request.actor = GetOption(opts, "actor", node.options.knowledge.clawId);
    request.reason = GetOption(opts, "reason");
    request.idempotencyKey = GetOption(opts, "key");
    request.remediation = GetOption(opts, "remediation");

    db::TransitionResult result;
    Status s = node.cascade->Advance(request, &result);
    if (!s.ok()) return Fail(s);
    return PrintTransitionResult(result, config);
}

int CmdTaskSelfTest(node::NodeContext& node, const CLIConfig& config,
                    const std::vector<std::string>& args) {
    OptionMap opts;
    if (!ParseOptions("task selftest", args,
                      {{"trace", true}, {"task", true}, {"output", true},
                       {"actor", true}}, &opts)) {
        return 1;
    }

    cascade::FieldMap output;
    Status s = ParseFields(GetOption(opts, "output"), &output);
    if (!s.ok()) return Fail(s);

    cascade::SelfTestResult result;
    s = node.cascade->RunSelfTest(GetOption(opts, "trace"), GetOption(opts, "task"), output,
                                  GetOption(opts, "actor", node.options.knowledge.clawId),
                                  &result);
    if (!s.ok()) return Fail(s);

    const auto& v = result.validation;
    if (config.jsonOutput) {
        JSONValue::Object validation;
        validation["ok"] = v.ok;
        validation["missingInput"] = JSONValue::FromStrings(v.missingInput);
        validation["missingOutput"] = JSONValue::FromStrings(v.missingOutput);
        validation["invalidRules"] = JSONValue::FromStrings(v.invalidRules);
        validation["remediation"] = v.remediation;

        JSONValue::Object obj;
        obj["validation"] = JSONValue(std::move(validation));
        obj["next"] = cascade::TaskStatusToString(result.next);
        obj["task"] = TaskToJSON(result.transition.task);
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    std::cout << result.transition.task.taskId << ": "
              << (v.ok ? "validation passed" : "validation failed (" + v.FailureReason() + ")")
              << " -> " << cascade::TaskStatusToString(result.next) << "\n";
    if (!v.ok) {
        std::cout << "  remediation: " << v.remediation << "\n";
        std::cout << "  retries:     " << result.transition.task.retryCount << "/"
                  << result.transition.task.maxRetries << "\n";
    }
    return 0;
}

/// commit, release and fail: one fixed edge from the task's current state
int CmdTaskStep(node::NodeContext& node, const CLIConfig& config,
                const std::string& sub, const std::vector<std::string>& args) {
    OptionMap opts;
    if (!ParseOptions("task " + sub, args,
                      {{"trace", true}, {"task", true}, {"actor", true}, {"reason", true}},
                      &opts)) {
        return 1;
    }

    std::string traceId = GetOption(opts, "trace");
    std::string taskId = GetOption(opts, "task");
    std::string actor = GetOption(opts, "actor", node.options.knowledge.clawId);

    db::TransitionResult result;
    Status s;
    if (sub == "commit") {
        s = node.cascade->Commit(traceId, taskId, actor, &result);
    } else if (sub == "release") {
        s = node.cascade->Release(traceId, taskId, actor, &result);
    } else {
        s = node.cascade->Fail(traceId, taskId, actor,
                               GetOption(opts, "reason", "failed_by_operator"), &result);
    }
    if (!s.ok()) return Fail(s);
    return PrintTransitionResult(result, config);
}

int CmdTaskList(node::NodeContext& node, const CLIConfig& config,
                const std::vector<std::string>& args) {
    OptionMap opts;
    if (!ParseOptions("task list", args, {{"trace", true}, {"transitions", false}}, &opts)) {
        return 1;
    }

    std::string traceId = GetOption(opts, "trace");
    if (traceId.empty()) {
        return Fail(Status::InvalidArgument("--trace is required"));
    }
    bool withTransitions = HasOption(opts, "transitions");

    std::vector<cascade::CascadeTask> tasks;
    Status s = node.cascade->ListTasks(traceId, &tasks);
    if (!s.ok()) return Fail(s);

    std::vector<cascade::CascadeTransition> transitions;
    if (withTransitions) {
        s = node.cascade->ListTransitions(traceId, "", 0, &transitions);
        if (!s.ok()) return Fail(s);
    }

    if (config.jsonOutput) {
        JSONValue::Array taskItems;
        for (const auto& t : tasks) {
            taskItems.push_back(TaskToJSON(t));
        }
        JSONValue::Object obj;
        obj["traceId"] = traceId;
        obj["tasks"] = JSONValue(std::move(taskItems));
        if (withTransitions) {
            JSONValue::Array items;
            for (const auto& t : transitions) {
                items.push_back(TransitionToJSON(t));
            }
            obj["transitions"] = JSONValue(std::move(items));
        }
        PrintJSON(JSONValue(std::move(obj)));
        return 0;
    }

    if (tasks.empty()) {
        std::cout << "no tasks in trace " << traceId << "\n";
        return 0;
    }
    for (const auto& t : tasks) {
        std::cout << t.sequence << ". " << t.taskId << "  "
                  << cascade::TaskStatusToString(t.status)
                  << "  retries=" << t.retryCount << "/" << t.maxRetries;
        if (!t.lastError.empty()) std::cout << "  last_error=" << t.lastError;
        std::cout << "\n";
        if (withTransitions) {
            for (const auto& tr : transitions) {
                if (tr.taskId == t.taskId) PrintTransitionLine(tr);
            }
        }
    }
    return 0;
}

int CmdTask(node::NodeContext& node, const CLIConfig& config) {
    if (config.args.empty()) {
        std::cerr << "Error: task requires a subcommand (create, advance, selftest, commit, release, fail, list)\n";
        return 1;
    }
    const std::string& sub = config.args[0];
    std::vector<std::string> rest(config.args.begin() + 1, config.args.end());

    if (sub == "create") return CmdTaskCreate(node, config, rest);
    if (sub == "advance") return CmdTaskAdvance(node, config, rest);
    if (sub == "selftest") return CmdTaskSelfTest(node, config, rest);
    if (sub == "commit" || sub == "release" || sub == "fail") {
        return CmdTaskStep(node, config, sub, rest);
    }
    if (sub == "list") return CmdTaskList(node, config, rest);

    std::cerr << "Error: unknown task subcommand '" << sub << "'\n";
    return 1;
}

// ============================================================================
// Configuration Loading
// ============================================================================

/// Read the config file (if any) underneath the command-line overrides
bool LoadConfigFile(int argc, char* argv[], CLIConfig& config) {
    std::string dataDir = config.settings.GetPath(util::ConfigKeys::DATADIR,
                                                  util::ConfigManager::GetDefaultDataDir());
    std::string explicitConf = config.settings.GetPath("conf");
    std::string confPath = explicitConf.empty()
        ? dataDir + "/" + util::DEFAULT_CONFIG_FILENAME
        : explicitConf;

    std::ifstream confFile(confPath);
    if (!confFile.good()) {
        if (!explicitConf.empty()) {
            std::cerr << "Error: cannot read config file " << confPath << "\n";
            return false;
        }
        return true;
    }
    confFile.close();

    util::ConfigManager merged;
    auto parsed = merged.ParseFile(confPath);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << "\n";
        return false;
    }
    // Command-line values win over the file
    std::string error;
    if (merged.ParseCommandLine(argc, argv, &error) < 0) {
        std::cerr << "Error: " << error << "\n";
        return false;
    }
    config.settings = std::move(merged);
    return true;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    CLIConfig config;

    // Parse command line
    if (!ParseCommandLine(argc, argv, config)) {
        std::cerr << "Error parsing command line. Use --help for usage.\n";
        return 1;
    }

    // Handle special flags
    if (config.showHelp) {
        PrintHelp();
        return 0;
    }

    if (config.showVersion) {
        PrintVersion();
        return 0;
    }

    // Check for command
    if (config.command.empty()) {
        std::cerr << "Error: No command specified.\n";
        std::cerr << "Use 'concord-cli --help' for usage information.\n";
        return 1;
    }

    if (!LoadConfigFile(argc, argv, config)) {
        return 1;
    }

    node::NodeOptions options;
    Status s = node::NodeOptions::FromConfig(config.settings, &options);
    if (!s.ok()) return Fail(s);

    // Keep stderr quiet unless asked for
    if (!config.settings.HasKey(util::ConfigKeys::LOGLEVEL)) {
        options.logLevel = "warn";
    }
    node::InitLogging(options);

    node::NodeContext node;
    s = node::InitializeNode(node, options);
    if (!s.ok()) return Fail(s);

    int rc;
    if (config.command == "status") {
        rc = CmdStatus(node, config);
    } else if (config.command == "propose") {
        rc = CmdPropose(node, config);
    } else if (config.command == "vote") {
        rc = CmdVote(node, config);
    } else if (config.command == "decisions") {
        rc = CmdDecisions(node, config);
    } else if (config.command == "facts") {
        rc = CmdFacts(node, config);
    } else if (config.command == "ingest") {
        rc = CmdIngest(node, config);
    } else if (config.command == "task") {
        rc = CmdTask(node, config);
    } else {
        std::cerr << "Error: unknown command '" << config.command << "'\n";
        std::cerr << "Use 'concord-cli --help' for usage information.\n";
        rc = 1;
    }

    node::ShutdownNode(node);
    return rc;
}

} // namespace cli
} // namespace concord

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return concord::cli::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
