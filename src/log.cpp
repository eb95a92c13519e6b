#include <ratchet/log.hpp>
#include <ratchet/configuration.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ratchet {

static std::tm & launch_time()
{
    static struct LaunchTime : public std::tm
    {
        LaunchTime()
        {
            auto now = std::chrono::system_clock::now();
            std::time_t now_time_t = std::chrono::system_clock::to_time_t(now);
            *(std::tm*)this = *std::localtime(&now_time_t);
        }
    } launch_tm;
    return launch_tm;
}

std::string_view Log::path()
{
    static std::string const log_path = [] {
        std::stringstream logfn_ss;
        logfn_ss << std::put_time(&launch_time(), "%FT%TZ.log");
        std::string logfn = logfn_ss.str();
        try {
            return std::string(Configuration::path_local(ratchet::span<std::string_view const>({
                "logs",
                logfn
            })));
        } catch (std::invalid_argument const &) {
            // no project directory
            return std::string(Configuration::path_user(ratchet::span<std::string_view const>({
                "logs",
                logfn
            })));
        }
    }();
    return log_path;
}

static std::ofstream & logf()
{
    static struct LogStream : public std::ofstream
    {
        LogStream()
        {
            open(std::string(Log::path()), std::ios::app);
        }
    } logf;
    return logf;
}

void Log::log(std::span<StringViewPair const> fields)
{
    boost::json::object obj;

    auto now = std::chrono::system_clock::now();
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();

    for (auto&& [key, value] : fields) {
        obj[key] = value;
    }

    obj["ts"] = now_ms / 1000.0;

    logf() << obj << std::endl;
}

bool Log::enabled()
{
    try {
        Configuration config(ratchet::span<std::string_view const>({"config"}));
        return config[ratchet::span<std::string_view const>({"log", "trace"})] == "true";
    } catch (std::exception const & e) {
        // unset HOME, an unlockable or unparsable file
        std::cerr << "ratchet: tracing disabled, configuration unreadable: " << e.what() << std::endl;
        return false;
    }
}

static struct EnsureLaunchTimeCreated
{
    EnsureLaunchTimeCreated()
    { launch_time(); }
} ensure_launchtime_created;

} // namespace ratchet
