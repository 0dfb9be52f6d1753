#ifndef TOKENFLOW_MODULES_TOKENS_TOKEN_MANAGER_H
#define TOKENFLOW_MODULES_TOKENS_TOKEN_MANAGER_H

#include "core/types/context.h"
#include "core/types/token.h"
#include "modules/compiler/executable_diagram.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace tokenflow {

// Token published on a loop-back edge is held back until the scheduler has advanced the epoch
struct DeferredToken {
    EdgeIndex edge = 0;
    EnvelopePtr payload;
};

struct EmitResult {
    std::vector<Token> published;
    std::vector<DeferredToken> deferred;
    std::optional<PortName> branch; // exclusive port that fired, if any
};

// Per-run token bookkeeping:
//   seq[(edge, epoch)] -> last sequence
//   store[(edge, epoch, seq)] -> Token
//   cursor[(node, edge, epoch)] -> last consumed sequence
// All maps (and branch decisions) sit behind one mutex; every method is a single critical section.
class TokenManager {
public:
    explicit TokenManager(std::shared_ptr<const ExecutableDiagram> diagram);

    Epoch current_epoch() const;
    // Increments the epoch and returns the new value
    Epoch begin_epoch();

    Token publish_token(const Edge& edge, EnvelopePtr payload, Epoch epoch);
    Token publish_token(EdgeIndex edge, EnvelopePtr payload, Epoch epoch);

    // Null or missing entries are skipped. More than one exclusive port firing throws
    // std::invalid_argument before anything is published.
    EmitResult emit_outputs(const NodeId& node_id, const PortMap& outputs, Epoch epoch);

    // All-or-nothing claim of the latest unconsumed token on every incoming edge
    PortMap consume_inbound(const NodeId& node_id, Epoch epoch);

    bool has_new_inputs(const NodeId& node_id, Epoch epoch, JoinPolicy policy) const;
    bool has_new_inputs(const NodeId& node_id, Epoch epoch) const; // node's own policy

    // Latest decision, not epoch scoped
    std::optional<PortName> get_branch_decision(const NodeId& node_id) const;
    std::optional<PortName> branch_decision_at(const NodeId& node_id, Epoch epoch) const;

    // Re-publishes the latest unconsumed token of every matching edge from `from` into `to`
    // and marks the old one consumed. Returns the number of tokens carried.
    std::size_t carry_forward(Epoch from, Epoch to, const std::function<bool(const ExecutableEdge&)>& predicate);

    // For every matching edge with nothing at `to` yet, publishes the newest token found at `from`
    // or earlier, consumed or not. Returns the number of tokens replayed.
    std::size_t replay_latest(Epoch from, Epoch to, const std::function<bool(const ExecutableEdge&)>& predicate);

    // Edges holding an unconsumed token at `epoch`
    std::size_t pending_tokens(Epoch epoch) const;

    Sequence last_sequence(const Edge& edge, Epoch epoch) const;
    std::optional<Token> latest_token(const Edge& edge, Epoch epoch) const;

    nlohmann::json snapshot() const;
    void restore(const nlohmann::json& state);

    const ExecutableDiagram& diagram() const { return *diagram_; }

private:
    using SeqKey = std::pair<EdgeIndex, Epoch>;
    using StoreKey = std::tuple<EdgeIndex, Epoch, Sequence>;
    using CursorKey = std::tuple<NodeId, EdgeIndex, Epoch>;

    std::shared_ptr<const ExecutableDiagram> diagram_;
    std::unordered_map<std::string, EdgeIndex> edge_ids_;

    mutable std::mutex mutex_;
    Epoch epoch_ = 0;
    std::map<SeqKey, Sequence> seq_;
    std::map<StoreKey, Token> store_;
    std::map<CursorKey, Sequence> cursor_;
    std::unordered_map<NodeId, PortName> branch_decisions_;
    std::map<std::pair<NodeId, Epoch>, PortName> branch_history_;
    std::set<NodeId> first_consumed_; // person_jobs whose `first` edges are retired
    std::uint64_t next_token_id_ = 1;

    // *_locked: caller holds mutex_
    Token publish_locked(EdgeIndex edge, EnvelopePtr payload, Epoch epoch, nlohmann::json metadata);
    Sequence sequence_locked(EdgeIndex edge, Epoch epoch) const;
    Sequence cursor_locked(const NodeId& node_id, EdgeIndex edge, Epoch epoch) const;
    bool qualifies_locked(const ExecutableEdge& edge, Epoch epoch) const;
    bool retired_locked(const ExecutableEdge& edge) const;
    EdgeIndex index_of(const Edge& edge) const;
};

} // namespace tokenflow

#endif // TOKENFLOW_MODULES_TOKENS_TOKEN_MANAGER_H
