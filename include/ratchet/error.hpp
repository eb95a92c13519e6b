#pragma once

#include <system_error>
#include <type_traits>

namespace ratchet {

// Contract violations a generator reports to its caller.
enum class errc {
    torn_down = 1,              // resumed after teardown, or through an empty handle
    exhausted,                  // resumed after the body already finished
    busy,                       // resumed from inside its own body
    cleanup_already_registered, // a second cleanup action was deferred
};

std::error_category const & generator_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

class GeneratorError : public std::system_error
{
public:
    explicit GeneratorError(errc e);

    errc which() const noexcept
    { return static_cast<errc>(code().value()); }
};

} // namespace ratchet

namespace std {
template <>
struct is_error_code_enum<ratchet::errc> : true_type {};
} // namespace std
