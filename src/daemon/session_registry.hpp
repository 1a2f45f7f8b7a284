#pragma once

#include "session.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct NewSession {
    std::string id;
    std::string name;
    std::optional<int> shell_pid;
    std::optional<int> agent_pid;
    std::optional<std::string> working_dir;
};

enum class RegistryError { NotFound };

// What the monitor needs to know about a live session, copied out under the lock.
struct MonitorTarget {
    std::string id;
    int shell_pid = 0;
    std::optional<int> agent_pid;
};

// Thread-safe map of session id -> Session. The lock guards in-memory state
// only; callers perform process and disk I/O before or after, never inside.
class SessionRegistry {
public:
    using Step = std::function<std::optional<Transition>(Session&)>;

    SessionRegistry() = default;

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Creates an IDLE record. An existing record with the same id is
    // overwritten; returns true in that case.
    bool register_session(NewSession fresh);

    // Same as register_session, but refuses (returns false) when another
    // record already tracks fresh.shell_pid.
    bool register_unless_tracked(NewSession fresh);

    // Terminal records accept the call without changing.
    std::expected<void, RegistryError> update_status(const std::string& id,
                                                     SessionStatus status,
                                                     std::optional<int> exit_code);

    // Copies of every record, in registration order.
    std::vector<Session> snapshot() const;
    std::optional<Session> get(const std::string& id) const;

    std::vector<MonitorTarget> active_targets() const;
    bool is_tracked_shell(int pid) const;

    // Sets agent_pid if it has never been set. Returns false otherwise.
    bool adopt_agent(const std::string& id, int agent_pid);

    // Runs step on the live record under the lock and applies the transition
    // it returns, if any. Returns false when id is unknown.
    bool modify(const std::string& id, const Step& step);

    // Removes terminal sessions that finished before cutoff and returns them.
    std::vector<Session> prune_finished(TimePoint cutoff);

    uint64_t total_created() const;
    size_t size() const;

private:
    struct Entry {
        uint64_t seq = 0;
        Session session;
    };

    bool insert_locked(NewSession fresh);
    static bool apply_transition(Session& s, const Transition& t, TimePoint now);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> sessions_;
    uint64_t next_seq_ = 0;
    uint64_t total_created_ = 0;
};
