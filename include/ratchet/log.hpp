#pragma once

#include <ratchet/common.hpp>

#include <span>
#include <string_view>

namespace ratchet {

class Log {
public:
    /*
     * Append the fields as one JSON object, with a "ts" timestamp in
     * seconds, to the log file of this launch.
     */
    static void log(std::span<StringViewPair const> fields);

    /*
     * Whether generator transitions should be logged, from the
     * `trace` key of the `[log]` section of the configuration.
     */
    static bool enabled();

    /*
     * Log file of this launch: logs/<launch time>.log in the project
     * configuration directory, or in the per-user one if there is no
     * project directory.
     */
    static std::string_view path();
};

} // namespace ratchet
