#pragma once
#include "task.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

enum class ConsensusStatus { Pending, Accepted, NoQuorum, TimedOut };

std::string to_string(ConsensusStatus s);

struct ConsensusOptions {
    // Minimum similarity for a free-text answer to join an existing bucket.
    double similarity_threshold{0.9};
};

// Answers judged equivalent. The representative is the first answer placed.
struct VoteBucket {
    std::string signature;
    AgentAnswer representative;
    std::vector<std::string> supporters;

    std::size_t support() const { return supporters.size(); }
};

struct ConsensusOutcome {
    ConsensusStatus status{ConsensusStatus::Pending};
    std::optional<AgentAnswer> accepted;
    std::map<std::string, std::size_t> tally;  // signature -> support
    std::size_t answers_received{0};
    std::size_t failed_calls{0};
    std::size_t quorum{0};
    std::string detail;
};

// Structured payloads (anything but a JSON string) match exactly.
bool is_structured(const nlohmann::json& payload);

// SHA-1 of the canonical JSON dump for structured payloads, of the normalized
// text for free text.
std::string answer_signature(const AgentAnswer& a);

// 1.0 for identical structured payloads, 0.0 for mismatched kinds. Free text
// uses embedding cosine similarity when both answers carry embeddings of the
// same dimension, token-set Jaccard similarity otherwise.
double answer_similarity(const AgentAnswer& a, const AgentAnswer& b);

// One voting round over the answers of `expected_calls` agent calls (2f+1
// unless given). Thread-safe: answers and call failures may be reported from
// any thread while another thread waits.
//
// A bucket with at least f+1 supporters is accepted as soon as the calls still
// outstanding can no longer tie or overtake it; with 2f+1 calls that is the
// moment it reaches f+1 and leads. With every expected call reported and no
// bucket at f+1 strictly ahead of all others the round ends no-quorum. A round
// still pending at its deadline is timed-out. Reports after the round is
// terminal are ignored.
class ConsensusRound {
public:
    ConsensusRound(int round_number, int f, ConsensusOptions options = {}, std::size_t expected_calls = 0);

    int round_number() const { return round_; }
    int fault_tolerance() const { return f_; }
    std::size_t quorum_size() const { return (std::size_t)(2 * f_ + 1); }
    std::size_t acceptance_threshold() const { return (std::size_t)(f_ + 1); }
    std::size_t expected_calls() const { return expected_; }

    // Both return true if the round is terminal after the call. An empty
    // answer counts as a failed call.
    bool submit(AgentAnswer answer);
    bool report_failure(const std::string& agent_id, const std::string& error);

    // Marks a still-pending round timed-out.
    void expire();

    ConsensusOutcome await(std::chrono::steady_clock::time_point deadline);
    ConsensusOutcome outcome() const;
    std::vector<VoteBucket> buckets() const;

private:
    void place_locked(AgentAnswer answer);
    void evaluate_locked();
    ConsensusOutcome snapshot_locked() const;

    int round_;
    int f_;
    ConsensusOptions options_;
    std::size_t expected_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<VoteBucket> buckets_;
    std::size_t answers_{0};
    std::vector<std::string> errors_;
    ConsensusStatus status_{ConsensusStatus::Pending};
    std::optional<std::size_t> winner_;
};

class ConsensusEngine {
public:
    explicit ConsensusEngine(ConsensusOptions options = {});

    // Reduces answers that have already been collected; every supplied answer
    // is tallied. The batch is taken to be everything that arrived within
    // `timeout`, so fewer than 2f+1 answers is timed-out unless a bucket is
    // already decided. `timeout` is not waited on.
    ConsensusOutcome resolve(const std::vector<AgentAnswer>& answers, int f, std::chrono::milliseconds timeout) const;

    std::shared_ptr<ConsensusRound> open_round(int round_number, int f) const;

    const ConsensusOptions& options() const { return options_; }

private:
    ConsensusOptions options_;
};
