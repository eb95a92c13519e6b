#include <ratchet/generator.hpp>
#include <ratchet/log.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <string>

namespace {

// Fibonacci numbers, up to the last one that fits in 64 bits.
struct Fibonacci
{
    using signature = std::uint64_t();
    struct Next { std::uint64_t a, b; };
    struct Last { std::uint64_t b; };
    struct Done {};
    using position = ratchet::Position<Next, Last, Done>;
    using yield = ratchet::Yield<std::uint64_t, position>;

    ratchet::Step<std::uint64_t> operator()(ratchet::Start, yield & y)
    { return y.yield(0, Next{1, 1}); }

    ratchet::Step<std::uint64_t> operator()(Next & at, yield & y)
    {
        if (at.b > std::numeric_limits<std::uint64_t>::max() - at.a) {
            return y.yield(at.a, Last{at.b});
        }
        return y.yield(at.a, Next{at.b, at.a + at.b});
    }

    ratchet::Step<std::uint64_t> operator()(Last & at, yield & y)
    { return y.yield<Done>(at.b); }

    ratchet::Step<std::uint64_t> operator()(Done, yield & y)
    { return y.finish(); }
};

} // namespace

int main(int argc, char **argv) {
    unsigned long count = 20;
    if (argc > 1) {
        try {
            count = std::stoul(argv[1]);
        } catch (std::logic_error const &) {
            std::cerr << "Usage: " << argv[0] << " [count]" << std::endl;
            return 1;
        }
    }

    std::string count_str = std::to_string(count);
    ratchet::Log::log(ratchet::span<ratchet::StringViewPair>({
        {"tool", "fibonacci"},
        {"count", count_str},
    }));

    auto numbers = ratchet::make_generator<Fibonacci>();
    for (unsigned long i = 0; i < count; ++ i) {
        auto number = numbers();
        if (!number) {
            std::cerr << "Stopped after " << i << " numbers, the next one does not fit in 64 bits." << std::endl;
            break;
        }
        std::cout << *number << std::endl;
    }

    return 0;
}
