#include "instance_store.hpp"
#include "log.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

// ── Record helpers ──────────────────────────────────────────

bool Instance::is_shared_with(const std::string& user) const {
    return std::find(shared_with.begin(), shared_with.end(), user) != shared_with.end();
}

void Instance::set_resources(const ResourceSpec& spec) {
    resources = spec;
    config = format_config_string(spec);
}

bool AdminRegistry::is_main_admin(const std::string& user) const {
    return !main_admin.empty() && user == main_admin;
}

bool AdminRegistry::is_admin(const std::string& user) const {
    return is_main_admin(user) ||
           std::find(admins.begin(), admins.end(), user) != admins.end();
}

int PortTable::slots_for(const std::string& user) const {
    auto it = slots.find(user);
    return it == slots.end() ? 0 : it->second;
}

size_t PortTable::active_count(const std::string& user) const {
    auto it = active.find(user);
    return it == active.end() ? 0 : it->second.size();
}

std::set<int> PortTable::used_ports() const {
    std::set<int> used;
    for (const auto& [user, forwards] : active) {
        for (const auto& f : forwards) used.insert(f.host_port);
    }
    return used;
}

Instance* FleetState::find(const std::string& id, std::string* owner) {
    for (auto& [uid, list] : instances) {
        for (auto& inst : list) {
            if (inst.id == id) {
                if (owner) *owner = uid;
                return &inst;
            }
        }
    }
    return nullptr;
}

const Instance* FleetState::find(const std::string& id, std::string* owner) const {
    return const_cast<FleetState*>(this)->find(id, owner);
}

bool FleetState::exists(const std::string& id) const {
    return find(id) != nullptr;
}

bool FleetState::erase(const std::string& id) {
    for (auto it = instances.begin(); it != instances.end(); ++it) {
        auto& list = it->second;
        auto pos = std::find_if(list.begin(), list.end(),
                                [&](const Instance& i) { return i.id == id; });
        if (pos == list.end()) continue;
        list.erase(pos);
        if (list.empty()) instances.erase(it);
        return true;
    }
    return false;
}

int FleetState::stop_all_running() {
    int changed = 0;
    for (auto& [uid, list] : instances) {
        for (auto& inst : list) {
            if (inst.status == InstanceStatus::Running) {
                inst.status = InstanceStatus::Stopped;
                changed++;
            }
        }
    }
    return changed;
}

size_t FleetState::instance_count() const {
    size_t n = 0;
    for (const auto& [uid, list] : instances) n += list.size();
    return n;
}

// ── Codecs ──────────────────────────────────────────────────

std::string encode_instances(const std::map<std::string, std::vector<Instance>>& instances) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [owner, list] : instances) {
        out << YAML::Key << owner << YAML::Value << YAML::BeginSeq;
        for (const auto& i : list) {
            out << YAML::BeginMap;
            out << YAML::Key << "container_name" << YAML::Value << i.id;
            out << YAML::Key << "ram" << YAML::Value << fmt::format("{}GB", i.resources.ram_gb);
            out << YAML::Key << "cpu" << YAML::Value << std::to_string(i.resources.cpu);
            out << YAML::Key << "storage" << YAML::Value << fmt::format("{}GB", i.resources.disk_gb);
            out << YAML::Key << "config" << YAML::Value << i.config;
            out << YAML::Key << "status" << YAML::Value << status_name(i.status);
            out << YAML::Key << "suspended" << YAML::Value << i.suspended();
            out << YAML::Key << "created_at" << YAML::Value << i.created_at;
            out << YAML::Key << "pool" << YAML::Value << i.pool;

            out << YAML::Key << "suspension_history" << YAML::Value << YAML::BeginSeq;
            for (const auto& e : i.suspension_history) {
                out << YAML::BeginMap;
                out << YAML::Key << "time" << YAML::Value << e.time;
                out << YAML::Key << "reason" << YAML::Value << e.reason;
                out << YAML::Key << "by" << YAML::Value << e.actor;
                out << YAML::EndMap;
            }
            out << YAML::EndSeq;

            out << YAML::Key << "shared_with" << YAML::Value << YAML::BeginSeq;
            for (const auto& u : i.shared_with) out << u;
            out << YAML::EndSeq;

            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

static Instance decode_instance(const YAML::Node& n) {
    Instance i;
    i.id = n["container_name"].as<std::string>("");
    i.resources.ram_gb = parse_gb(n["ram"].as<std::string>("0"));
    i.resources.cpu = safe_stoi(n["cpu"].as<std::string>("0"));
    i.resources.disk_gb = parse_gb(n["storage"].as<std::string>("0"));
    i.config = n["config"].as<std::string>("");
    if (i.config.empty()) i.config = format_config_string(i.resources);

    // Unknown or missing status loads as stopped; a legacy suspended flag wins.
    auto status = parse_status(n["status"].as<std::string>(""));
    i.status = status.value_or(InstanceStatus::Stopped);
    if (n["suspended"].as<bool>(false)) i.status = InstanceStatus::Suspended;

    i.created_at = n["created_at"].as<std::string>("");
    i.pool = n["pool"].as<std::string>("");

    if (n["suspension_history"] && n["suspension_history"].IsSequence()) {
        for (const auto& h : n["suspension_history"]) {
            SuspensionEntry e;
            e.time = h["time"].as<std::string>("");
            e.reason = h["reason"].as<std::string>("");
            e.actor = h["by"].as<std::string>(h["actor"].as<std::string>(""));
            i.suspension_history.push_back(e);
        }
    }

    if (n["shared_with"] && n["shared_with"].IsSequence()) {
        for (const auto& u : n["shared_with"]) {
            auto id = u.as<std::string>("");
            if (!id.empty() && !i.is_shared_with(id)) i.shared_with.push_back(id);
        }
    }
    return i;
}

Result<std::map<std::string, std::vector<Instance>>> decode_instances(const std::string& text) {
    using R = Result<std::map<std::string, std::vector<Instance>>>;
    std::map<std::string, std::vector<Instance>> result;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root || root.IsNull()) return R::Ok(result);
        if (!root.IsMap()) {
            return R::Err(ErrorKind::Persistence, "instance document must be a mapping");
        }
        for (const auto& entry : root) {
            auto owner = entry.first.as<std::string>();
            if (!entry.second.IsSequence()) {
                return R::Err(ErrorKind::Persistence,
                    fmt::format("instances of '{}' must be a sequence", owner));
            }
            auto& list = result[owner];
            for (const auto& n : entry.second) {
                Instance i = decode_instance(n);
                if (i.id.empty()) {
                    return R::Err(ErrorKind::Persistence,
                        fmt::format("instance of '{}' has no container_name", owner));
                }
                list.push_back(std::move(i));
            }
        }
    } catch (const YAML::Exception& e) {
        return R::Err(ErrorKind::Persistence, std::string("corrupt instance document: ") + e.what());
    }
    return R::Ok(result);
}

std::string encode_admins(const AdminRegistry& admins) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "main_admin" << YAML::Value << admins.main_admin;
    out << YAML::Key << "admins" << YAML::Value << YAML::BeginSeq;
    for (const auto& a : admins.admins) out << a;
    out << YAML::EndSeq;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<AdminRegistry> decode_admins(const std::string& text) {
    AdminRegistry reg;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root || root.IsNull()) return Result<AdminRegistry>::Ok(reg);
        if (!root.IsMap()) {
            return Result<AdminRegistry>::Err(ErrorKind::Persistence,
                                              "admin document must be a mapping");
        }
        reg.main_admin = root["main_admin"].as<std::string>("");
        if (root["admins"] && root["admins"].IsSequence()) {
            for (const auto& n : root["admins"]) {
                auto id = n.as<std::string>("");
                if (id.empty() || id == reg.main_admin) continue;
                if (std::find(reg.admins.begin(), reg.admins.end(), id) != reg.admins.end()) continue;
                reg.admins.push_back(id);
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AdminRegistry>::Err(ErrorKind::Persistence,
                                          std::string("corrupt admin document: ") + e.what());
    }
    return Result<AdminRegistry>::Ok(reg);
}

std::string encode_ports(const PortTable& ports) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "users" << YAML::Value << YAML::BeginMap;
    for (const auto& [user, n] : ports.slots) {
        out << YAML::Key << user << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "slots" << YAML::Value << n;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;

    out << YAML::Key << "active_ports" << YAML::Value << YAML::BeginMap;
    for (const auto& [user, forwards] : ports.active) {
        out << YAML::Key << user << YAML::Value << YAML::BeginSeq;
        for (const auto& f : forwards) {
            out << YAML::BeginMap;
            out << YAML::Key << "container" << YAML::Value << f.instance_id;
            out << YAML::Key << "internal_port" << YAML::Value << f.internal_port;
            out << YAML::Key << "host_port" << YAML::Value << f.host_port;
            out << YAML::EndMap;
        }
        out << YAML::EndSeq;
    }
    out << YAML::EndMap;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

Result<PortTable> decode_ports(const std::string& text) {
    PortTable table;
    try {
        YAML::Node root = YAML::Load(text);
        if (!root || root.IsNull()) return Result<PortTable>::Ok(table);
        if (!root.IsMap()) {
            return Result<PortTable>::Err(ErrorKind::Persistence,
                                          "port document must be a mapping");
        }
        if (root["users"] && root["users"].IsMap()) {
            for (const auto& entry : root["users"]) {
                int n = entry.second["slots"].as<int>(0);
                table.slots[entry.first.as<std::string>()] = std::max(0, n);
            }
        }
        if (root["active_ports"] && root["active_ports"].IsMap()) {
            for (const auto& entry : root["active_ports"]) {
                if (!entry.second.IsSequence()) continue;
                auto& list = table.active[entry.first.as<std::string>()];
                for (const auto& n : entry.second) {
                    PortForward f;
                    f.instance_id = n["container"].as<std::string>("");
                    f.internal_port = n["internal_port"].as<int>(0);
                    f.host_port = n["host_port"].as<int>(0);
                    list.push_back(f);
                }
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<PortTable>::Err(ErrorKind::Persistence,
                                      std::string("corrupt port document: ") + e.what());
    }
    return Result<PortTable>::Ok(table);
}

// ── InstanceStore ───────────────────────────────────────────

InstanceStore::InstanceStore(fs::path state_dir)
    : state_dir_(std::move(state_dir)) {}

static Result<std::string> read_document(const fs::path& path) {
    if (!fs::exists(path)) return Result<std::string>::Ok("");
    std::ifstream in(path);
    if (!in) {
        return Result<std::string>::Err(ErrorKind::Persistence,
                                        "cannot read " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return Result<std::string>::Ok(buf.str());
}

Result<void> InstanceStore::load() {
    auto inst_text = read_document(state_dir_ / INSTANCES_FILE);
    if (inst_text.is_err()) return Result<void>::Fail(inst_text);
    auto admin_text = read_document(state_dir_ / ADMINS_FILE);
    if (admin_text.is_err()) return Result<void>::Fail(admin_text);
    auto port_text = read_document(state_dir_ / PORTS_FILE);
    if (port_text.is_err()) return Result<void>::Fail(port_text);

    auto instances = decode_instances(inst_text.value);
    if (instances.is_err()) return Result<void>::Fail(instances);
    auto admins = decode_admins(admin_text.value);
    if (admins.is_err()) return Result<void>::Fail(admins);
    auto ports = decode_ports(port_text.value);
    if (ports.is_err()) return Result<void>::Fail(ports);

    std::lock_guard<std::mutex> lock(mutex_);
    state_.instances = std::move(instances.value);
    state_.admins = std::move(admins.value);
    state_.ports = std::move(ports.value);
    warden_log(fmt::format("store: loaded {} instances from {}",
                           state_.instance_count(), state_dir_.string()));
    return Result<void>::Ok();
}

Result<void> InstanceStore::write_atomic(const std::string& name, const std::string& content) {
    fs::path target = state_dir_ / name;
    fs::path tmp = state_dir_ / (name + ".tmp");

    std::error_code ec;
    fs::create_directories(state_dir_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Persistence,
            fmt::format("cannot create {}: {}", state_dir_.string(), ec.message()));
    }

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Result<void>::Err(ErrorKind::Persistence,
                                     "cannot open " + tmp.string() + " for writing");
        }
        out << content;
        out.flush();
        if (!out) {
            return Result<void>::Err(ErrorKind::Persistence, "write failed for " + tmp.string());
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(ErrorKind::Persistence,
            fmt::format("cannot replace {}: {}", target.string(), ec.message()));
    }
    return Result<void>::Ok();
}

Result<void> InstanceStore::save() {
    std::lock_guard<std::mutex> save_lock(save_mutex_);

    std::string inst_doc, admin_doc, port_doc;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        inst_doc = encode_instances(state_.instances);
        admin_doc = encode_admins(state_.admins);
        port_doc = encode_ports(state_.ports);
    }

    // One collection at a time; a failure stops before the next file.
    const std::pair<const char*, const std::string*> docs[] = {
        {INSTANCES_FILE, &inst_doc}, {ADMINS_FILE, &admin_doc}, {PORTS_FILE, &port_doc}};
    for (const auto& [name, doc] : docs) {
        auto r = write_atomic(name, *doc);
        if (r.is_err()) {
            warden_log("store: save failed: " + r.error);
            return r;
        }
    }
    return Result<void>::Ok();
}

FleetState InstanceStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<OwnedInstance> InstanceStore::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string owner;
    const Instance* inst = state_.find(id, &owner);
    if (!inst) return std::nullopt;
    return OwnedInstance{owner, *inst};
}

std::vector<Instance> InstanceStore::instances_of(const std::string& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.instances.find(owner);
    if (it == state_.instances.end()) return {};
    return it->second;
}

bool InstanceStore::exists(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.exists(id);
}

Result<std::string> InstanceStore::resolve_number(const std::string& owner, int number) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = state_.instances.find(owner);
    if (it == state_.instances.end() || it->second.empty()) {
        return Result<std::string>::Err(ErrorKind::NotFound,
                                        fmt::format("user '{}' has no instances", owner));
    }
    if (number < 1 || number > static_cast<int>(it->second.size())) {
        return Result<std::string>::Err(ErrorKind::Validation,
            fmt::format("instance number must be between 1 and {}", it->second.size()));
    }
    return Result<std::string>::Ok(it->second[number - 1].id);
}
