#include "liveness_oracle.hpp"

#include <array>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace kiosk {

namespace {

// Kernel command-name limits: TASK_COMM_LEN - 1, MAXCOMLEN, PRFNSZ - 1
constexpr std::array<ImageNameRule, 3> kImageNameRules = {{
    {"linux", 15},
    {"freebsd", 19},
    {"sunos", 15},
}};

constexpr ImageNameRule kGenericRule = {"generic", 0};

constexpr std::string_view kDeletedSuffix = " (deleted)";

constexpr std::string_view build_platform() {
#if defined(__linux__)
    return "linux";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__sun)
    return "sunos";
#else
    return "generic";
#endif
}

std::string basename_of(std::string_view path) {
    if (path.ends_with(kDeletedSuffix)) {
        path.remove_suffix(kDeletedSuffix.size());
    }
    return std::filesystem::path(path).filename().string();
}

} // namespace

const ImageNameRule& image_name_rule(const std::string_view platform) {
    for (const auto& rule : kImageNameRules) {
        if (rule.platform == platform) return rule;
    }
    return kGenericRule;
}

const ImageNameRule& current_image_name_rule() {
    return image_name_rule(build_platform());
}

LivenessOracle::LivenessOracle(IProcessTable* table, std::string own_image_name, const ImageNameRule& rule)
    : table_(table)
    , own_image_name_(std::move(own_image_name))
    , rule_(rule) {
}

std::string LivenessOracle::image_name_of(const ProcessInfo& info) {
    if (!info.executable_path.empty()) {
        return basename_of(info.executable_path);
    }
    return info.name;
}

std::string LivenessOracle::resolve_own_image_name(IProcessTable& table, const std::string_view argv0) {
    if (const auto self = table.find_process(static_cast<int>(getpid()))) {
        if (std::string name = image_name_of(*self); !name.empty()) {
            return name;
        }
    }
    return basename_of(argv0);
}

bool LivenessOracle::matches(const ProcessInfo& info) const {
    if (!info.executable_path.empty()) {
        return basename_of(info.executable_path) == own_image_name_;
    }

    // Only the (possibly truncated) kernel command name is visible
    std::string_view expected = own_image_name_;
    if (rule_.command_name_limit > 0 && expected.size() > rule_.command_name_limit) {
        expected = expected.substr(0, rule_.command_name_limit);
    }
    return !info.name.empty() && info.name == expected;
}

bool LivenessOracle::is_alive_and_same_app(const int pid) const {
    if (pid <= 0 || !table_) return false;

    const auto info = table_->find_process(pid);
    if (!info) {
        spdlog::debug("PID {} not found in process table", pid);
        return false;
    }
    if (info->is_zombie()) {
        spdlog::debug("PID {} is a zombie", pid);
        return false;
    }
    if (!matches(*info)) {
        spdlog::debug("PID {} is {}, not {}", pid, image_name_of(*info), own_image_name_);
        return false;
    }
    return true;
}

} // namespace kiosk
