#include <ratchet/trace.hpp>
#include <ratchet/log.hpp>

#include <atomic>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

namespace ratchet::detail {

std::uint64_t next_generator_id() noexcept
{
    static std::atomic<std::uint64_t> next_id{1};
    return next_id ++;
}

bool tracing() noexcept
{
    static bool const enabled = Log::enabled();
    return enabled;
}

void trace(std::string_view event, std::uint64_t generator, std::size_t position, std::string_view what) noexcept
{
    try {
        std::string generator_str = std::to_string(generator);
        std::string position_str = std::to_string(position);
        std::vector<StringViewPair> fields{
            {"event", event},
            {"generator", generator_str},
            {"position", position_str},
        };
        if (!what.empty()) {
            fields.emplace_back("what", what);
        }
        Log::log(fields);
    } catch (std::exception const & e) {
        std::cerr << "ratchet: could not log generator " << event << ": " << e.what() << std::endl;
    }
}

} // namespace ratchet::detail
