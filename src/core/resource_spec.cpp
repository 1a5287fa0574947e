#include "resource_spec.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <climits>

// limits.memory is passed in MB and has to fit an int
static constexpr int MAX_RAM_GB = INT_MAX / 1024;

Result<void> validate_resources(int ram_gb, int cpu, int disk_gb) {
    if (ram_gb <= 0 || cpu <= 0 || disk_gb <= 0) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("RAM, CPU and disk must be positive integers (got {}GB / {} / {}GB)",
                        ram_gb, cpu, disk_gb));
    }
    if (ram_gb > MAX_RAM_GB) {
        return Result<void>::Err(ErrorKind::Validation,
            fmt::format("RAM must be at most {}GB (got {}GB)", MAX_RAM_GB, ram_gb));
    }
    return Result<void>::Ok();
}

std::string format_config_string(const ResourceSpec& spec) {
    return fmt::format("{}GB RAM / {} CPU / {}GB Disk", spec.ram_gb, spec.cpu, spec.disk_gb);
}

std::string memory_limit_arg(int ram_gb) {
    return fmt::format("{}MB", static_cast<long long>(ram_gb) * 1024);
}

int parse_gb(const std::string& value) {
    if (value.empty()) return 0;

    size_t i = 0;
    while (i < value.size() && std::isdigit(static_cast<unsigned char>(value[i]))) {
        i++;
    }
    if (i == 0) return 0;

    std::string suffix = value.substr(i);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(), ::toupper);
    if (!suffix.empty() && suffix != "G" && suffix != "GB") return 0;

    try {
        return std::stoi(value.substr(0, i));
    } catch (const std::out_of_range&) {
        return 0;
    }
}

Result<ResourceSpec> resolve_resize(const ResourceSpec& current, const ResizeRequest& request) {
    if (request.empty()) {
        return Result<ResourceSpec>::Err(ErrorKind::Validation,
            "Specify at least one resource to change (ram, cpu or disk)");
    }

    auto check = [](const std::optional<int>& v, const char* name) -> Result<void> {
        if (v && *v <= 0) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("{} must be a positive integer (got {})", name, *v));
        }
        return Result<void>::Ok();
    };
    for (auto r : {check(request.ram_gb, "RAM"), check(request.cpu, "CPU"),
                   check(request.disk_gb, "Disk")}) {
        if (r.is_err()) return Result<ResourceSpec>::Fail(r);
    }

    bool add = request.mode == ResizeRequest::Mode::Add;
    auto apply = [add](int base, const std::optional<int>& v, long long limit,
                       const char* name, int& out) -> Result<void> {
        if (!v) return Result<void>::Ok();
        long long want = add ? static_cast<long long>(base) + *v : *v;
        if (want > limit) {
            return Result<void>::Err(ErrorKind::Validation,
                fmt::format("{} would be {}, above the limit of {}", name, want, limit));
        }
        out = static_cast<int>(want);
        return Result<void>::Ok();
    };

    ResourceSpec next = current;
    for (auto r : {apply(current.ram_gb, request.ram_gb, MAX_RAM_GB, "RAM", next.ram_gb),
                   apply(current.cpu, request.cpu, INT_MAX, "CPU", next.cpu),
                   apply(current.disk_gb, request.disk_gb, INT_MAX, "Disk", next.disk_gb)}) {
        if (r.is_err()) return Result<ResourceSpec>::Fail(r);
    }
    return Result<ResourceSpec>::Ok(next);
}
