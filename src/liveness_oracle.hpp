#pragma once

#include "interfaces/i_process_table.hpp"
#include <cstddef>
#include <string>
#include <string_view>

namespace kiosk {

// How a platform names process images in its process table
struct ImageNameRule {
    std::string_view platform;
    std::size_t command_name_limit;  // kernel truncation of the command name, 0 = none
};

// Rule for the platform this binary was built for
[[nodiscard]] const ImageNameRule& current_image_name_rule();

// Rule for a named platform ("linux", "freebsd", "sunos"); generic if unknown
[[nodiscard]] const ImageNameRule& image_name_rule(std::string_view platform);

// Decides whether a recorded lock owner is a live instance of this
// application. A PID that exists but belongs to another program (PID reuse)
// does not count.
class LivenessOracle {
public:
    // Non-owning: table must outlive the oracle.
    LivenessOracle(IProcessTable* table, std::string own_image_name,
                   const ImageNameRule& rule = current_image_name_rule());

    [[nodiscard]] bool is_alive_and_same_app(int pid) const;

    [[nodiscard]] const std::string& own_image_name() const { return own_image_name_; }

    // Image name of a process: basename of its executable when known,
    // otherwise its command name.
    static std::string image_name_of(const ProcessInfo& info);

    // Image name of the running process, looked up in the table; falls back
    // to the basename of argv0.
    static std::string resolve_own_image_name(IProcessTable& table, std::string_view argv0);

private:
    [[nodiscard]] bool matches(const ProcessInfo& info) const;

    IProcessTable* table_ = nullptr;
    std::string own_image_name_;
    ImageNameRule rule_;
};

} // namespace kiosk
