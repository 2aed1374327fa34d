#include "../include/consensus.hpp"
#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>

std::string to_string(ConsensusStatus s) {
    switch (s) {
    case ConsensusStatus::Pending: return "pending";
    case ConsensusStatus::Accepted: return "accepted";
    case ConsensusStatus::NoQuorum: return "no-quorum";
    case ConsensusStatus::TimedOut: return "timed-out";
    }
    return "unknown";
}

bool is_structured(const nlohmann::json& payload) {
    return !payload.is_string();
}

std::string answer_signature(const AgentAnswer& a) {
    if (is_structured(a.payload)) return sha1_hex("json:" + a.payload.dump());
    return sha1_hex("text:" + normalize_text(a.payload.get<std::string>()));
}

double answer_similarity(const AgentAnswer& a, const AgentAnswer& b) {
    bool sa = is_structured(a.payload), sb = is_structured(b.payload);
    if (sa != sb) return 0.0;
    if (sa) return a.payload == b.payload ? 1.0 : 0.0;

    std::string ta = normalize_text(a.payload.get<std::string>());
    std::string tb = normalize_text(b.payload.get<std::string>());
    if (ta == tb) return 1.0;
    if (!a.embedding.empty() && a.embedding.size() == b.embedding.size()) {
        return cosine_similarity(a.embedding, b.embedding);
    }
    return token_jaccard(ta, tb);
}

ConsensusRound::ConsensusRound(int round_number, int f, ConsensusOptions options, std::size_t expected_calls)
    : round_(round_number), f_(f), options_(options), expected_(expected_calls) {
    if (f < 0) throw std::invalid_argument("fault tolerance must be >= 0");
    if (expected_ == 0) expected_ = quorum_size();
}

bool ConsensusRound::submit(AgentAnswer answer) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (status_ != ConsensusStatus::Pending) {
        log_debug("consensus", "round " + std::to_string(round_) + ": late answer from " + answer.agent_id + " ignored");
        return true;
    }
    if (answer.empty()) {
        errors_.push_back(answer.agent_id + ": empty answer");
    } else {
        place_locked(std::move(answer));
        ++answers_;
    }
    evaluate_locked();
    if (status_ != ConsensusStatus::Pending) cv_.notify_all();
    return status_ != ConsensusStatus::Pending;
}

bool ConsensusRound::report_failure(const std::string& agent_id, const std::string& error) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (status_ != ConsensusStatus::Pending) return true;
    errors_.push_back(agent_id + ": " + error);
    evaluate_locked();
    if (status_ != ConsensusStatus::Pending) cv_.notify_all();
    return status_ != ConsensusStatus::Pending;
}

void ConsensusRound::expire() {
    std::lock_guard<std::mutex> lock(mtx_);
    if (status_ != ConsensusStatus::Pending) return;
    status_ = ConsensusStatus::TimedOut;
    cv_.notify_all();
}

ConsensusOutcome ConsensusRound::await(std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait_until(lock, deadline, [this]{ return status_ != ConsensusStatus::Pending; });
    if (status_ == ConsensusStatus::Pending) status_ = ConsensusStatus::TimedOut;
    return snapshot_locked();
}

ConsensusOutcome ConsensusRound::outcome() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return snapshot_locked();
}

std::vector<VoteBucket> ConsensusRound::buckets() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return buckets_;
}

void ConsensusRound::place_locked(AgentAnswer answer) {
    const std::string agent = answer.agent_id;
    if (is_structured(answer.payload)) {
        std::string sig = answer_signature(answer);
        for (auto& b : buckets_) {
            if (b.signature == sig) {
                b.supporters.push_back(agent);
                return;
            }
        }
        buckets_.push_back(VoteBucket{sig, std::move(answer), {agent}});
        return;
    }

    VoteBucket* best = nullptr;
    double best_score = 0.0;
    for (auto& b : buckets_) {
        if (is_structured(b.representative.payload)) continue;
        double s = answer_similarity(b.representative, answer);
        if (s >= options_.similarity_threshold && (!best || s > best_score)) {
            best = &b;
            best_score = s;
        }
    }
    if (best) {
        best->supporters.push_back(agent);
        return;
    }
    std::string sig = answer_signature(answer);
    buckets_.push_back(VoteBucket{sig, std::move(answer), {agent}});
}

void ConsensusRound::evaluate_locked() {
    std::size_t reported = answers_ + errors_.size();
    std::size_t outstanding = reported >= expected_ ? 0 : expected_ - reported;
    for (std::size_t i = 0; i < buckets_.size(); ++i) {
        std::size_t support = buckets_[i].support();
        if (support < acceptance_threshold() || outstanding >= support) continue;
        bool decided = true;
        for (std::size_t k = 0; k < buckets_.size(); ++k) {
            if (k != i && buckets_[k].support() + outstanding >= support) decided = false;
        }
        if (decided) {
            status_ = ConsensusStatus::Accepted;
            winner_ = i;
            return;
        }
    }
    if (outstanding == 0) status_ = ConsensusStatus::NoQuorum;
}

ConsensusOutcome ConsensusRound::snapshot_locked() const {
    ConsensusOutcome out;
    out.status = status_;
    out.answers_received = answers_;
    out.failed_calls = errors_.size();
    out.quorum = quorum_size();
    for (const auto& b : buckets_) out.tally[b.signature] = b.support();
    if (winner_) out.accepted = buckets_[*winner_].representative;

    std::size_t top = 0;
    for (const auto& b : buckets_) top = std::max(top, b.support());
    switch (status_) {
    case ConsensusStatus::Accepted:
        out.detail = std::to_string(buckets_[*winner_].support()) + " of " + std::to_string(answers_) +
                     " answers agree (need " + std::to_string(acceptance_threshold()) + ")";
        break;
    case ConsensusStatus::NoQuorum:
        out.detail = "no answer reached " + std::to_string(acceptance_threshold()) + " votes: " +
                     std::to_string(buckets_.size()) + " buckets, largest " + std::to_string(top) +
                     ", " + std::to_string(answers_) + " of " + std::to_string(expected_) + " agents answered";
        break;
    case ConsensusStatus::TimedOut:
        out.detail = "only " + std::to_string(answers_) + " of " + std::to_string(expected_) +
                     " answers arrived before the deadline";
        break;
    case ConsensusStatus::Pending:
        out.detail = std::to_string(answers_) + " of " + std::to_string(expected_) + " answers so far";
        break;
    }
    if (!errors_.empty() && status_ != ConsensusStatus::Accepted) {
        out.detail += "; last call error: " + errors_.back();
    }
    return out;
}

ConsensusEngine::ConsensusEngine(ConsensusOptions options) : options_(options) {
    if (options_.similarity_threshold < 0.0 || options_.similarity_threshold > 1.0) {
        throw std::invalid_argument("similarity threshold must be within [0, 1]");
    }
}

ConsensusOutcome ConsensusEngine::resolve(const std::vector<AgentAnswer>& answers, int f,
                                          std::chrono::milliseconds timeout) const {
    ConsensusRound round(1, f, options_, std::max(answers.size(), (std::size_t)(2 * f + 1)));
    for (const auto& a : answers) round.submit(a);
    if (round.outcome().status == ConsensusStatus::Pending) {
        log_debug("consensus", std::to_string(answers.size()) + " of " + std::to_string(round.quorum_size()) +
                  " answers within " + std::to_string(timeout.count()) + "ms");
        round.expire();
    }
    return round.outcome();
}

std::shared_ptr<ConsensusRound> ConsensusEngine::open_round(int round_number, int f) const {
    return std::make_shared<ConsensusRound>(round_number, f, options_);
}
