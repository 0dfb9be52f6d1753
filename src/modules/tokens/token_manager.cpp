#include "modules/tokens/token_manager.h"
#include "core/types/errors.h"
#include "common/logging/logger.h"
#include <algorithm>
#include <chrono>
#include <stdexcept>

namespace tokenflow {

namespace {

bool is_present(const PortMap& outputs, const PortName& port) {
    auto it = outputs.find(port);
    return it != outputs.end() && it->second && !it->second->is_null();
}

long long to_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

} // namespace

TokenManager::TokenManager(std::shared_ptr<const ExecutableDiagram> diagram)
    : diagram_(std::move(diagram)) {
    if (!diagram_) {
        throw std::invalid_argument("TokenManager requires a compiled diagram");
    }
    for (EdgeIndex i = 0; i < diagram_->edges().size(); ++i) {
        edge_ids_[diagram_->edge(i).id] = i;
    }
}

Epoch TokenManager::current_epoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return epoch_;
}

Epoch TokenManager::begin_epoch() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++epoch_;
}

EdgeIndex TokenManager::index_of(const Edge& edge) const {
    auto index = diagram_->find_edge(edge);
    if (!index) {
        throw std::invalid_argument("Unknown edge: " + to_string(edge));
    }
    return *index;
}

Token TokenManager::publish_token(const Edge& edge, EnvelopePtr payload, Epoch epoch) {
    return publish_token(index_of(edge), std::move(payload), epoch);
}

Token TokenManager::publish_token(EdgeIndex edge, EnvelopePtr payload, Epoch epoch) {
    if (edge >= diagram_->edges().size()) {
        throw std::out_of_range("Edge index out of range: " + std::to_string(edge));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return publish_locked(edge, std::move(payload), epoch, nlohmann::json::object());
}

Token TokenManager::publish_locked(EdgeIndex edge, EnvelopePtr payload, Epoch epoch, nlohmann::json metadata) {
    if (epoch < 0) {
        throw std::invalid_argument("Epoch must be non-negative");
    }
    Sequence& last = seq_[{edge, epoch}];
    const Sequence next = last + 1;

    Token token;
    token.id = "tok-" + std::to_string(next_token_id_);
    token.edge = diagram_->edge(edge).edge;
    token.epoch = epoch;
    token.sequence = next;
    token.payload = std::move(payload);
    token.timestamp = std::chrono::system_clock::now();
    token.metadata = std::move(metadata);

    store_.emplace(StoreKey{edge, epoch, next}, token);
    last = next;
    ++next_token_id_;
    SPDLOG_LOGGER_TRACE(logger(), "token {} published on {} (epoch {}, seq {})",
                        token.id, to_string(token.edge), epoch, next);
    return token;
}

Sequence TokenManager::sequence_locked(EdgeIndex edge, Epoch epoch) const {
    auto it = seq_.find({edge, epoch});
    return it == seq_.end() ? 0 : it->second;
}

Sequence TokenManager::cursor_locked(const NodeId& node_id, EdgeIndex edge, Epoch epoch) const {
    auto it = cursor_.find(CursorKey{node_id, edge, epoch});
    return it == cursor_.end() ? 0 : it->second;
}

EmitResult TokenManager::emit_outputs(const NodeId& node_id, const PortMap& outputs, Epoch epoch) {
    const Node& node = diagram_->node(node_id);
    const PortSpec& spec = port_spec(node.type);

    std::vector<PortName> fired;
    for (const auto& port : spec.exclusive_outputs) {
        if (is_present(outputs, port)) fired.push_back(port);
    }
    if (fired.size() > 1) {
        throw std::invalid_argument("Branching node '" + node_id + "' emitted on " +
                                    std::to_string(fired.size()) + " mutually exclusive ports");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    EmitResult result;
    if (!fired.empty()) {
        branch_decisions_[node_id] = fired.front();
        branch_history_[{node_id, epoch}] = fired.front();
        result.branch = fired.front();
    }
    for (EdgeIndex index : diagram_->outgoing(node_id)) {
        const ExecutableEdge& edge = diagram_->edge(index);
        auto it = outputs.find(edge.edge.source_port);
        if (it == outputs.end() || !it->second || it->second->is_null()) continue;
        if (edge.loop_back) {
            result.deferred.push_back({index, it->second});
            continue;
        }
        nlohmann::json metadata = {{"source_node", node_id}, {"source_port", edge.edge.source_port}};
        result.published.push_back(publish_locked(index, it->second, epoch, std::move(metadata)));
    }
    return result;
}

PortMap TokenManager::consume_inbound(const NodeId& node_id, Epoch epoch) {
    const auto& incoming = diagram_->incoming(node_id);
    std::lock_guard<std::mutex> lock(mutex_);

    // 先计算全部 claim，再统一提交，保证不会部分消费
    std::vector<std::pair<EdgeIndex, Sequence>> claims;
    for (EdgeIndex index : incoming) {
        if (retired_locked(diagram_->edge(index))) continue;
        const Sequence latest = sequence_locked(index, epoch);
        const Sequence cursor = cursor_locked(node_id, index, epoch);
        if (latest < cursor) {
            throw SchedulerInvariantError("cursor regression on " + to_string(diagram_->edge(index).edge) +
                                          " (cursor " + std::to_string(cursor) + ", latest " +
                                          std::to_string(latest) + ")");
        }
        if (latest > cursor) claims.emplace_back(index, latest);
    }
    for (const auto& [index, latest] : claims) {
        if (!store_.count(StoreKey{index, epoch, latest})) {
            throw SchedulerInvariantError("missing token for " + to_string(diagram_->edge(index).edge) +
                                          " seq " + std::to_string(latest));
        }
    }

    PortMap inputs;
    for (const auto& [index, latest] : claims) {
        cursor_[CursorKey{node_id, index, epoch}] = latest;
        const Token& token = store_.at(StoreKey{index, epoch, latest});
        inputs[diagram_->edge(index).edge.target_port] = token.payload;
    }
    if (diagram_->node(node_id).type == NodeType::PERSON_JOB) {
        first_consumed_.insert(node_id);
    }
    return inputs;
}

bool TokenManager::retired_locked(const ExecutableEdge& edge) const {
    return edge.edge.target_port == kFirstPort &&
           diagram_->node(edge.edge.target).type == NodeType::PERSON_JOB &&
           first_consumed_.count(edge.edge.target) > 0;
}

bool TokenManager::qualifies_locked(const ExecutableEdge& edge, Epoch epoch) const {
    if (retired_locked(edge)) return false;
    const Node& source = diagram_->node(edge.edge.source);
    if (!is_branching(source.type)) return true;
    const auto& exclusive = port_spec(source.type).exclusive_outputs;
    if (std::find(exclusive.begin(), exclusive.end(), edge.edge.source_port) == exclusive.end()) {
        return true;
    }
    auto it = branch_history_.find({source.id, epoch});
    return it == branch_history_.end() || it->second == edge.edge.source_port;
}

bool TokenManager::has_new_inputs(const NodeId& node_id, Epoch epoch, JoinPolicy policy) const {
    const auto& incoming = diagram_->incoming(node_id);
    if (incoming.empty()) return true;

    std::lock_guard<std::mutex> lock(mutex_);
    int qualifying = 0;
    int with_token = 0;
    int required = 0;
    int required_missing = 0;
    for (EdgeIndex index : incoming) {
        const ExecutableEdge& edge = diagram_->edge(index);
        if (!qualifies_locked(edge, epoch)) continue;
        ++qualifying;
        const bool has_token = sequence_locked(index, epoch) > cursor_locked(node_id, index, epoch);
        if (has_token) ++with_token;
        if (!edge.skippable) {
            ++required;
            if (!has_token) ++required_missing;
        }
    }
    if (qualifying == 0) return false;

    switch (policy.kind) {
        case JoinPolicy::Kind::ALL:
            // skippable edges never block; if nothing else qualifies one of them must deliver
            return required == 0 ? with_token > 0 : required_missing == 0;
        case JoinPolicy::Kind::ANY:
            return with_token > 0;
        case JoinPolicy::Kind::K_OF_N:
            return with_token >= policy.k;
    }
    return false;
}

bool TokenManager::has_new_inputs(const NodeId& node_id, Epoch epoch) const {
    return has_new_inputs(node_id, epoch, diagram_->node(node_id).join_policy);
}

std::optional<PortName> TokenManager::get_branch_decision(const NodeId& node_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branch_decisions_.find(node_id);
    if (it == branch_decisions_.end()) return std::nullopt;
    return it->second;
}

std::optional<PortName> TokenManager::branch_decision_at(const NodeId& node_id, Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = branch_history_.find({node_id, epoch});
    if (it == branch_history_.end()) return std::nullopt;
    return it->second;
}

std::size_t TokenManager::carry_forward(Epoch from, Epoch to,
                                        const std::function<bool(const ExecutableEdge&)>& predicate) {
    if (to <= from) {
        throw std::invalid_argument("carry_forward target epoch must be later than the source epoch");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t carried = 0;
    for (EdgeIndex index = 0; index < diagram_->edges().size(); ++index) {
        const ExecutableEdge& edge = diagram_->edge(index);
        if (predicate && !predicate(edge)) continue;
        const Sequence latest = sequence_locked(index, from);
        const Sequence cursor = cursor_locked(edge.edge.target, index, from);
        if (latest <= cursor) continue;

        EnvelopePtr payload = store_.at(StoreKey{index, from, latest}).payload;
        cursor_[CursorKey{edge.edge.target, index, from}] = latest;
        publish_locked(index, std::move(payload), to, {{"carried_from", from}});
        ++carried;
    }
    if (carried > 0) {
        SPDLOG_LOGGER_DEBUG(logger(), "carried {} tokens from epoch {} to {}", carried, from, to);
    }
    return carried;
}

std::size_t TokenManager::replay_latest(Epoch from, Epoch to,
                                        const std::function<bool(const ExecutableEdge&)>& predicate) {
    if (to <= from) {
        throw std::invalid_argument("replay_latest target epoch must be later than the source epoch");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t replayed = 0;
    for (EdgeIndex index = 0; index < diagram_->edges().size(); ++index) {
        const ExecutableEdge& edge = diagram_->edge(index);
        if (predicate && !predicate(edge)) continue;
        if (retired_locked(edge) || sequence_locked(index, to) > 0) continue;

        for (Epoch e = from; e >= 0; --e) {
            const Sequence latest = sequence_locked(index, e);
            if (latest == 0) continue;
            EnvelopePtr payload = store_.at(StoreKey{index, e, latest}).payload;
            publish_locked(index, std::move(payload), to, {{"replayed_from", e}});
            ++replayed;
            break;
        }
    }
    if (replayed > 0) {
        SPDLOG_LOGGER_DEBUG(logger(), "replayed {} tokens into epoch {}", replayed, to);
    }
    return replayed;
}

std::size_t TokenManager::pending_tokens(Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t pending = 0;
    for (EdgeIndex index = 0; index < diagram_->edges().size(); ++index) {
        const NodeId& target = diagram_->edge(index).edge.target;
        if (sequence_locked(index, epoch) > cursor_locked(target, index, epoch)) ++pending;
    }
    return pending;
}

Sequence TokenManager::last_sequence(const Edge& edge, Epoch epoch) const {
    const EdgeIndex index = index_of(edge);
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_locked(index, epoch);
}

std::optional<Token> TokenManager::latest_token(const Edge& edge, Epoch epoch) const {
    const EdgeIndex index = index_of(edge);
    std::lock_guard<std::mutex> lock(mutex_);
    const Sequence latest = sequence_locked(index, epoch);
    if (latest == 0) return std::nullopt;
    return store_.at(StoreKey{index, epoch, latest});
}

nlohmann::json TokenManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json state;
    state["epoch"] = epoch_;
    state["next_token_id"] = next_token_id_;

    state["sequences"] = nlohmann::json::array();
    for (const auto& [key, seq] : seq_) {
        state["sequences"].push_back({{"edge", diagram_->edge(key.first).id}, {"epoch", key.second}, {"seq", seq}});
    }
    state["tokens"] = nlohmann::json::array();
    for (const auto& [key, token] : store_) {
        state["tokens"].push_back({
            {"id", token.id},
            {"edge", diagram_->edge(std::get<0>(key)).id},
            {"epoch", token.epoch},
            {"sequence", token.sequence},
            {"payload", token.payload ? *token.payload : nlohmann::json(nullptr)},
            {"timestamp_ms", to_millis(token.timestamp)},
            {"metadata", token.metadata}
        });
    }
    state["cursors"] = nlohmann::json::array();
    for (const auto& [key, seq] : cursor_) {
        state["cursors"].push_back({
            {"node", std::get<0>(key)},
            {"edge", diagram_->edge(std::get<1>(key)).id},
            {"epoch", std::get<2>(key)},
            {"seq", seq}
        });
    }
    state["branch_decisions"] = branch_decisions_;
    state["branch_history"] = nlohmann::json::array();
    for (const auto& [key, port] : branch_history_) {
        state["branch_history"].push_back({{"node", key.first}, {"epoch", key.second}, {"port", port}});
    }
    state["first_consumed"] = first_consumed_;
    return state;
}

void TokenManager::restore(const nlohmann::json& state) {
    auto edge_of = [this](const nlohmann::json& id) {
        auto it = edge_ids_.find(id.get<std::string>());
        if (it == edge_ids_.end()) {
            throw std::invalid_argument("Snapshot references unknown edge '" + id.get<std::string>() + "'");
        }
        return it->second;
    };

    // build everything first so a bad snapshot leaves the current state untouched
    Epoch epoch = 0;
    std::uint64_t next_token_id = 1;
    std::map<SeqKey, Sequence> seq;
    std::map<StoreKey, Token> store;
    std::map<CursorKey, Sequence> cursor;
    std::unordered_map<NodeId, PortName> decisions;
    std::map<std::pair<NodeId, Epoch>, PortName> history;
    std::set<NodeId> first_consumed;
    try {
        epoch = state.at("epoch").get<Epoch>();
        next_token_id = state.value("next_token_id", std::uint64_t{1});
        for (const auto& s : state.at("sequences")) {
            seq[{edge_of(s.at("edge")), s.at("epoch").get<Epoch>()}] = s.at("seq").get<Sequence>();
        }
        for (const auto& t : state.at("tokens")) {
            const EdgeIndex index = edge_of(t.at("edge"));
            Token token;
            token.id = t.at("id").get<std::string>();
            token.edge = diagram_->edge(index).edge;
            token.epoch = t.at("epoch").get<Epoch>();
            token.sequence = t.at("sequence").get<Sequence>();
            token.payload = make_envelope(t.at("payload"));
            token.timestamp = std::chrono::system_clock::time_point(
                std::chrono::milliseconds(t.value("timestamp_ms", 0LL)));
            token.metadata = t.value("metadata", nlohmann::json::object());
            store.emplace(StoreKey{index, token.epoch, token.sequence}, std::move(token));
        }
        for (const auto& c : state.at("cursors")) {
            cursor[CursorKey{c.at("node").get<NodeId>(), edge_of(c.at("edge")), c.at("epoch").get<Epoch>()}] =
                c.at("seq").get<Sequence>();
        }
        decisions = state.value("branch_decisions", nlohmann::json::object())
                        .get<std::unordered_map<NodeId, PortName>>();
        for (const auto& h : state.value("branch_history", nlohmann::json::array())) {
            history[{h.at("node").get<NodeId>(), h.at("epoch").get<Epoch>()}] = h.at("port").get<PortName>();
        }
        first_consumed = state.value("first_consumed", nlohmann::json::array()).get<std::set<NodeId>>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Malformed token snapshot: ") + e.what());
    }

    for (const auto& [key, last] : seq) {
        for (Sequence s = 1; s <= last; ++s) {
            if (!store.count(StoreKey{key.first, key.second, s})) {
                throw std::invalid_argument("Token snapshot has a sequence gap on edge '" +
                                            diagram_->edge(key.first).id + "'");
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    epoch_ = epoch;
    next_token_id_ = next_token_id;
    seq_ = std::move(seq);
    store_ = std::move(store);
    cursor_ = std::move(cursor);
    branch_decisions_ = std::move(decisions);
    branch_history_ = std::move(history);
    first_consumed_ = std::move(first_consumed);
}

} // namespace tokenflow
