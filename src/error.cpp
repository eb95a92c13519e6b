#include <ratchet/error.hpp>

#include <string>

namespace ratchet {

namespace {

class GeneratorCategory : public std::error_category
{
public:
    char const * name() const noexcept override
    { return "ratchet.generator"; }

    std::string message(int ev) const override
    {
        switch (static_cast<errc>(ev)) {
        case errc::torn_down:
            return "generator resumed after teardown";
        case errc::exhausted:
            return "generator resumed after it finished";
        case errc::busy:
            return "generator resumed from inside its own body";
        case errc::cleanup_already_registered:
            return "generator already has a cleanup action";
        }
        return "unknown generator error";
    }
};

} // namespace

std::error_category const & generator_category() noexcept
{
    static GeneratorCategory const category;
    return category;
}

std::error_code make_error_code(errc e) noexcept
{
    return {static_cast<int>(e), generator_category()};
}

GeneratorError::GeneratorError(errc e)
: std::system_error(make_error_code(e))
{ }

} // namespace ratchet
