#include "session_registry.hpp"

#include <algorithm>
#include <ranges>

bool SessionRegistry::register_session(NewSession fresh) {
    std::lock_guard lock(mutex_);
    return insert_locked(std::move(fresh));
}

bool SessionRegistry::register_unless_tracked(NewSession fresh) {
    std::lock_guard lock(mutex_);
    if (fresh.shell_pid) {
        for (const auto& [id, entry] : sessions_) {
            if (entry.session.shell_pid == fresh.shell_pid) return false;
        }
    }
    insert_locked(std::move(fresh));
    return true;
}

bool SessionRegistry::insert_locked(NewSession fresh) {
    auto now = Clock::now();

    Session s;
    s.id = fresh.id;
    s.name = std::move(fresh.name);
    s.shell_pid = fresh.shell_pid;
    s.agent_pid = fresh.agent_pid;
    s.group = group_for(fresh.working_dir);
    s.working_dir = std::move(fresh.working_dir);
    s.created_at = now;
    s.status_changed_at = now;

    bool replaced = sessions_.contains(fresh.id);
    sessions_[fresh.id] = Entry{.seq = next_seq_++, .session = std::move(s)};
    ++total_created_;
    return replaced;
}

std::expected<void, RegistryError> SessionRegistry::update_status(const std::string& id,
                                                                  SessionStatus status,
                                                                  std::optional<int> exit_code) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return std::unexpected(RegistryError::NotFound);
    }
    apply_transition(it->second.session, Transition{status, exit_code}, Clock::now());
    return {};
}

std::vector<Session> SessionRegistry::snapshot() const {
    std::vector<const Entry*> ordered;
    std::vector<Session> out;
    {
        std::lock_guard lock(mutex_);
        ordered.reserve(sessions_.size());
        for (const auto& [id, entry] : sessions_) ordered.push_back(&entry);
        std::ranges::sort(ordered, {}, &Entry::seq);

        out.reserve(ordered.size());
        for (const auto* e : ordered) out.push_back(e->session);
    }
    return out;
}

std::optional<Session> SessionRegistry::get(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return std::nullopt;
    return it->second.session;
}

std::vector<MonitorTarget> SessionRegistry::active_targets() const {
    std::vector<MonitorTarget> targets;
    std::lock_guard lock(mutex_);
    for (const auto& [id, entry] : sessions_) {
        const auto& s = entry.session;
        if (!is_active(s.status) || !s.shell_pid) continue;
        targets.push_back({.id = s.id, .shell_pid = *s.shell_pid, .agent_pid = s.agent_pid});
    }
    return targets;
}

bool SessionRegistry::is_tracked_shell(int pid) const {
    std::lock_guard lock(mutex_);
    return std::ranges::any_of(sessions_, [pid](const auto& kv) {
        return kv.second.session.shell_pid == pid;
    });
}

bool SessionRegistry::adopt_agent(const std::string& id, int agent_pid) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;
    auto& s = it->second.session;
    if (s.agent_pid) return false;
    s.agent_pid = agent_pid;
    return true;
}

bool SessionRegistry::modify(const std::string& id, const Step& step) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return false;

    auto& s = it->second.session;
    if (auto t = step(s)) {
        apply_transition(s, *t, Clock::now());
    }
    return true;
}

std::vector<Session> SessionRegistry::prune_finished(TimePoint cutoff) {
    std::vector<Session> removed;
    std::lock_guard lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        const auto& s = it->second.session;
        if (is_terminal(s.status) && s.finished_at && *s.finished_at < cutoff) {
            removed.push_back(std::move(it->second.session));
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    return removed;
}

uint64_t SessionRegistry::total_created() const {
    std::lock_guard lock(mutex_);
    return total_created_;
}

size_t SessionRegistry::size() const {
    std::lock_guard lock(mutex_);
    return sessions_.size();
}

bool SessionRegistry::apply_transition(Session& s, const Transition& t, TimePoint now) {
    if (is_terminal(s.status)) return false;

    auto old = s.status;
    s.status = t.status;
    s.exit_code = t.exit_code;

    if (t.status == SessionStatus::Running && old != SessionStatus::Running) {
        s.work_started_at = now;
    }
    if (is_terminal(t.status)) {
        s.finished_at = now;
    }
    if (t.status != old) {
        s.status_changed_at = now;
    }
    return t.status != old;
}
