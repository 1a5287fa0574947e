#pragma once

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <optional>
#include <filesystem>
#include <type_traits>
#include <core/types.hpp>
#include <core/resource_spec.hpp>
#include <core/instance_status.hpp>

namespace fs = std::filesystem;

struct SuspensionEntry {
    std::string time;               // ISO timestamp
    std::string reason;
    std::string actor;              // user id or "auto-system"
};

struct Instance {
    std::string id;                 // container name, sole key with the tool
    ResourceSpec resources;
    std::string config;             // "{ram}GB RAM / {cpu} CPU / {disk}GB Disk"
    InstanceStatus status = InstanceStatus::Stopped;
    std::string created_at;         // ISO timestamp, reset on reinstall
    std::string pool;               // storage pool
    std::vector<SuspensionEntry> suspension_history;  // append-only
    std::vector<std::string> shared_with;

    bool suspended() const { return status == InstanceStatus::Suspended; }
    bool is_shared_with(const std::string& user) const;

    // Replace resources and refresh the cached config string.
    void set_resources(const ResourceSpec& spec);
};

struct AdminRegistry {
    std::string main_admin;
    std::vector<std::string> admins;  // delegated, never contains main_admin

    bool is_main_admin(const std::string& user) const;
    bool is_admin(const std::string& user) const;
};

struct PortForward {
    std::string instance_id;
    int internal_port = 0;
    int host_port = 0;
};

struct PortTable {
    std::map<std::string, int> slots;
    std::map<std::string, std::vector<PortForward>> active;

    int slots_for(const std::string& user) const;
    size_t active_count(const std::string& user) const;
    std::set<int> used_ports() const;
};

// Instance plus the id of the user who owns it.
struct OwnedInstance {
    std::string owner;
    Instance instance;
};

// The three persisted collections.
struct FleetState {
    std::map<std::string, std::vector<Instance>> instances;  // owner -> instances
    AdminRegistry admins;
    PortTable ports;

    Instance* find(const std::string& id, std::string* owner = nullptr);
    const Instance* find(const std::string& id, std::string* owner = nullptr) const;
    bool exists(const std::string& id) const;

    // Remove an instance record. Returns false if absent. Empty owner
    // lists are dropped.
    bool erase(const std::string& id);

    // Mark every running instance stopped. Returns how many changed.
    int stop_all_running();

    size_t instance_count() const;
};

// ── Codecs (one YAML document per collection) ───────────────

std::string encode_instances(const std::map<std::string, std::vector<Instance>>& instances);
Result<std::map<std::string, std::vector<Instance>>> decode_instances(const std::string& text);

std::string encode_admins(const AdminRegistry& admins);
Result<AdminRegistry> decode_admins(const std::string& text);

std::string encode_ports(const PortTable& ports);
Result<PortTable> decode_ports(const std::string& text);

// Authoritative in-memory fleet record, persisted as three YAML documents
// under the state directory. All mutation goes through mutate()/commit(),
// which serialize on one mutex.
class InstanceStore {
public:
    explicit InstanceStore(fs::path state_dir);

    // Load all three documents. Missing files load as empty; a corrupt file
    // is a Persistence error and leaves the in-memory state untouched.
    Result<void> load();

    // Write each collection to <name>.tmp and rename it into place.
    Result<void> save();

    // Run fn under the store lock and return whatever it returns.
    template <typename Fn>
    auto mutate(Fn&& fn) -> decltype(fn(std::declval<FleetState&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        return fn(state_);
    }

    // mutate() followed by save().
    template <typename Fn>
    Result<void> commit(Fn&& fn) {
        mutate(std::forward<Fn>(fn));
        return save();
    }

    FleetState snapshot() const;

    std::optional<OwnedInstance> find(const std::string& id) const;
    std::vector<Instance> instances_of(const std::string& owner) const;
    bool exists(const std::string& id) const;

    // Map an owner's 1-based instance number to its id.
    Result<std::string> resolve_number(const std::string& owner, int number) const;

    const fs::path& state_dir() const { return state_dir_; }

private:
    Result<void> write_atomic(const std::string& name, const std::string& content);

    fs::path state_dir_;
    FleetState state_;
    mutable std::mutex mutex_;
    std::mutex save_mutex_;   // orders whole saves; taken before mutex_
};
