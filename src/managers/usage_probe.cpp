#include "usage_probe.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <sstream>
#include <vector>

namespace {

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream ss(line);
    std::vector<std::string> words;
    std::string w;
    while (ss >> w) words.push_back(w);
    return words;
}

std::optional<double> to_double(std::string s) {
    while (!s.empty() && (s.back() == ',' || s.back() == '%')) s.pop_back();
    if (s.empty()) return std::nullopt;
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::optional<long> to_long(const std::string& s) {
    try {
        size_t pos = 0;
        long v = std::stol(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

} // namespace

std::optional<double> parse_top_cpu(const std::string& top_output) {
    std::istringstream in(top_output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find("Cpu(s):") == std::string::npos) continue;

        // A fully idle CPU prints "0.0 ni,100.0 id," with no space after the comma
        std::replace(line.begin(), line.end(), ',', ' ');
        auto words = split_words(line);
        for (size_t i = 0; i < words.size(); i++) {
            // procps-ng: "95.5 id"   older procps: "95.5%id"
            if (words[i] == "id" && i > 0) {
                auto idle = to_double(words[i - 1]);
                if (idle) return 100.0 - *idle;
            }
            auto pos = words[i].find("%id");
            if (pos != std::string::npos && pos > 0) {
                auto idle = to_double(words[i].substr(0, pos));
                if (idle) return 100.0 - *idle;
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<MemoryUsage> parse_free_memory(const std::string& free_output) {
    std::istringstream in(free_output);
    std::string line;
    while (std::getline(in, line)) {
        auto words = split_words(line);
        if (words.size() < 3 || words[0] != "Mem:") continue;
        auto total = to_long(words[1]);
        auto used = to_long(words[2]);
        if (!total || !used) return std::nullopt;
        return MemoryUsage{*total, *used};
    }
    return std::nullopt;
}

std::optional<DiskUsage> parse_df_root(const std::string& df_output) {
    std::istringstream in(df_output);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (header) { header = false; continue; }
        auto words = split_words(line);
        if (words.size() < 6 || words.back() != "/") continue;
        return DiskUsage{words[1], words[2], words[4]};
    }
    return std::nullopt;
}

std::optional<std::string> parse_info_status(const std::string& info_output) {
    std::istringstream in(info_output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("Status:", 0) == 0) {
            std::string value = line.substr(7);
            trim(value);
            if (!value.empty()) return value;
        }
    }
    return std::nullopt;
}

UsageProbe::UsageProbe(CommandExecutor& exec) : exec_(exec) {}

Result<double> UsageProbe::host_cpu() {
    auto r = exec_.execute("top -bn1", PROBE_TIMEOUT_SECS);
    if (r.is_err()) return Result<double>::Fail(r);
    auto cpu = parse_top_cpu(r.value);
    if (!cpu) {
        return Result<double>::Err(ErrorKind::Execution, "no CPU line in host top output");
    }
    return Result<double>::Ok(*cpu);
}

Result<double> UsageProbe::instance_cpu(const std::string& id) {
    auto r = exec_.execute(fmt::format("lxc exec {} -- top -bn1", id), PROBE_TIMEOUT_SECS);
    if (r.is_err()) return Result<double>::Fail(r);
    auto cpu = parse_top_cpu(r.value);
    if (!cpu) {
        return Result<double>::Err(ErrorKind::Execution,
                                   fmt::format("no CPU line in top output of {}", id));
    }
    return Result<double>::Ok(*cpu);
}

Result<MemoryUsage> UsageProbe::instance_memory(const std::string& id) {
    auto r = exec_.execute(fmt::format("lxc exec {} -- free -m", id), PROBE_TIMEOUT_SECS);
    if (r.is_err()) return Result<MemoryUsage>::Fail(r);
    auto mem = parse_free_memory(r.value);
    if (!mem) {
        return Result<MemoryUsage>::Err(ErrorKind::Execution,
                                        fmt::format("no Mem: row in free output of {}", id));
    }
    return Result<MemoryUsage>::Ok(*mem);
}

Result<DiskUsage> UsageProbe::instance_disk(const std::string& id) {
    auto r = exec_.execute(fmt::format("lxc exec {} -- df -h /", id), PROBE_TIMEOUT_SECS);
    if (r.is_err()) return Result<DiskUsage>::Fail(r);
    auto disk = parse_df_root(r.value);
    if (!disk) {
        return Result<DiskUsage>::Err(ErrorKind::Execution,
                                      fmt::format("no root filesystem in df output of {}", id));
    }
    return Result<DiskUsage>::Ok(*disk);
}

Result<std::string> UsageProbe::tool_status(const std::string& id) {
    auto r = exec_.execute(fmt::format("lxc info {}", id), PROBE_TIMEOUT_SECS);
    if (r.is_err()) return r;
    auto status = parse_info_status(r.value);
    if (!status) {
        return Result<std::string>::Err(ErrorKind::Execution,
                                        fmt::format("no Status: line for {}", id));
    }
    return Result<std::string>::Ok(*status);
}

Result<InstanceUsage> UsageProbe::instance_usage(const std::string& id) {
    auto cpu = instance_cpu(id);
    if (cpu.is_err()) return Result<InstanceUsage>::Fail(cpu);
    auto mem = instance_memory(id);
    if (mem.is_err()) return Result<InstanceUsage>::Fail(mem);
    return Result<InstanceUsage>::Ok(InstanceUsage{cpu.value, mem.value.percent()});
}
