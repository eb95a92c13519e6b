#define BOOST_TEST_MAIN
#include <boost/test/unit_test.hpp>

#include <ratchet/generator.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace ratchet;

namespace {

// a, b = b, a + b; yields a
struct Fibonacci
{
    using signature = long();
    struct Next { long a, b; };
    using position = Position<Next>;
    using yield = Yield<long, position>;

    Fibonacci(long a, long b)
    : first(a), second(b)
    { }

    Step<long> operator()(Start, yield & y)
    { return y.yield(first, Next{second, first + second}); }

    Step<long> operator()(Next & at, yield & y)
    { return y.yield(at.a, Next{at.b, at.a + at.b}); }

    long first, second;
};

// adds each per-call argument to a running total held in the body
struct Accumulates
{
    using signature = long(long);
    struct Added {};
    using position = Position<Added>;
    using yield = Yield<long, position>;

    explicit Accumulates(long limit)
    : limit(limit)
    { }

    Step<long> operator()(Start, yield & y, long amount)
    {
        total = amount;
        return y.yield<Added>(total);
    }

    Step<long> operator()(Added, yield & y, long amount)
    {
        total += amount;
        if (total > limit) {
            return y.finish();
        }
        return y.yield<Added>(total);
    }

    long limit;
    long total = 0;
};

// two sites with different locals; each resume takes a separator
struct Joins
{
    using signature = std::string(char);
    struct Word { size_t index; };
    struct Tail { std::string joined; };
    using position = Position<Word, Tail>;
    using yield = Yield<std::string, position>;

    explicit Joins(std::vector<std::string> words)
    : words(std::move(words))
    { }

    Step<std::string> operator()(Start, yield & y, char)
    {
        if (words.empty()) {
            return y.finish();
        }
        return y.yield(words[0], Word{0});
    }

    Step<std::string> operator()(Word & at, yield & y, char separator)
    {
        if (at.index + 1 < words.size()) {
            return y.yield(words[at.index + 1], Word{at.index + 1});
        }
        std::string joined;
        for (auto & word : words) {
            if (!joined.empty()) {
                joined += separator;
            }
            joined += word;
        }
        return y.yield(joined, Tail{joined});
    }

    Step<std::string> operator()(Tail & at, yield & y, char)
    {
        return y.yield(at.joined + at.joined, Tail{at.joined + at.joined});
    }

    std::vector<std::string> words;
};

struct Reenters
{
    using signature = int();
    struct Caught { int code; };
    using position = Position<Caught>;
    using yield = Yield<int, position>;

    explicit Reenters(Generator<int()> & self)
    : self(self)
    { }

    Step<int> operator()(Start, yield & y)
    {
        try {
            self();
        } catch (GeneratorError const & e) {
            return y.yield(static_cast<int>(e.which()), Caught{static_cast<int>(e.which())});
        }
        return y.yield(0, Caught{0});
    }

    Step<int> operator()(Caught &, yield & y)
    {
        self();
        return y.finish();
    }

    Generator<int()> & self;
};

struct Throws
{
    using signature = int();
    struct Once {};
    using position = Position<Once>;
    using yield = Yield<int, position>;

    Step<int> operator()(Start, yield & y)
    { return y.yield<Once>(1); }

    Step<int> operator()(Once, yield &)
    { throw std::runtime_error("body failed"); }
};

struct Counted
{
    using signature = int();
    using position = Position<>;
    using yield = Yield<int, position>;

    Counted(Cleanup & cleanup, int & cleanups)
    { cleanup.defer([&cleanups] { ++ cleanups; }); }

    Step<int> operator()(Start, yield & y)
    { return y.finish(); }
};

template <typename Signature>
std::vector<long> drain(Generator<Signature> & gen, size_t count)
{
    std::vector<long> values;
    for (size_t i = 0; i < count; ++ i) {
        values.push_back(*gen());
    }
    return values;
}

} // namespace

BOOST_AUTO_TEST_SUITE(PositionTest)

BOOST_AUTO_TEST_CASE(indices)
{
    using P = Position<Joins::Word, Joins::Tail>;
    BOOST_CHECK_EQUAL(P::count, 2u);
    BOOST_CHECK_EQUAL(P::index<Start>, 0u);
    BOOST_CHECK_EQUAL(P::index<Joins::Word>, 1u);
    BOOST_CHECK_EQUAL(P::index<Joins::Tail>, 2u);
    BOOST_CHECK_EQUAL(P::index<Exhausted>, 3u);
    BOOST_CHECK(P::has<Joins::Word>);
    BOOST_CHECK(!P::has<Start>);
    BOOST_CHECK(!P::has<Fibonacci::Next>);
}

BOOST_AUTO_TEST_CASE(distinct_sites)
{
    BOOST_CHECK((detail::distinct<Start, Exhausted, Joins::Word, Joins::Tail>::value));
    BOOST_CHECK((!detail::distinct<Start, Exhausted, Joins::Word, Joins::Word>::value));
    BOOST_CHECK((!detail::distinct<Start, Exhausted, Start>::value));
}

BOOST_AUTO_TEST_CASE(transitions)
{
    auto gen = make_generator<Joins>(std::vector<std::string>{"a", "b"});
    using P = Joins::position;
    BOOST_CHECK_EQUAL(gen.position(), P::index<Start>);
    BOOST_CHECK_EQUAL(*gen(','), "a");
    BOOST_CHECK_EQUAL(gen.position(), P::index<Joins::Word>);
    BOOST_CHECK_EQUAL(*gen(','), "b");
    BOOST_CHECK_EQUAL(gen.position(), P::index<Joins::Word>);
    BOOST_CHECK_EQUAL(*gen(';'), "a;b");
    BOOST_CHECK_EQUAL(gen.position(), P::index<Joins::Tail>);
    BOOST_CHECK_EQUAL(*gen(';'), "a;ba;b");
    BOOST_CHECK(!gen.exhausted());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(MachineTest)

BOOST_AUTO_TEST_CASE(sequence_fidelity)
{
    auto gen = make_generator<Fibonacci>(0L, 1L);
    BOOST_CHECK((drain(gen, 8) == std::vector<long>{0, 1, 1, 2, 3, 5, 8, 13}));
}

BOOST_AUTO_TEST_CASE(per_call_parameters)
{
    auto gen = make_generator<Accumulates>(10L);
    BOOST_CHECK_EQUAL(*gen(3), 3);
    BOOST_CHECK_EQUAL(*gen(4), 7);
    BOOST_CHECK_EQUAL(*gen.resume(2), 9);
    BOOST_CHECK(!gen(5).has_value());
    BOOST_CHECK(gen.exhausted());
    BOOST_CHECK_EQUAL(gen.position(), Accumulates::position::index<Exhausted>);
}

BOOST_AUTO_TEST_CASE(isolation)
{
    auto first = make_generator<Fibonacci>(0L, 1L);
    auto second = make_generator<Fibonacci>(0L, 1L);
    BOOST_CHECK_NE(first.id(), second.id());

    drain(first, 5);
    BOOST_CHECK_EQUAL(*second(), 0);
    BOOST_CHECK_EQUAL(*first(), 5);
}

BOOST_AUTO_TEST_CASE(interleaved)
{
    auto alone = make_generator<Fibonacci>(2L, 1L);
    std::vector<long> expected = drain(alone, 6);

    auto left = make_generator<Fibonacci>(2L, 1L);
    auto right = make_generator<Fibonacci>(2L, 1L);
    std::vector<long> left_values, right_values;
    for (int i = 0; i < 6; ++ i) {
        left_values.push_back(*left());
        if (i % 2 == 0) {
            right_values.push_back(*right());
            right_values.push_back(*right());
        }
    }
    BOOST_CHECK(left_values == expected);
    BOOST_CHECK(right_values == expected);
}

BOOST_AUTO_TEST_CASE(same_shape_interchangeable)
{
    std::vector<Generator<long()>> gens;
    gens.push_back(make_generator<Fibonacci>(0L, 1L));
    gens.push_back(make_generator<Fibonacci>(5L, 5L));
    BOOST_CHECK_EQUAL(*gens[0](), 0);
    BOOST_CHECK_EQUAL(*gens[1](), 5);
    BOOST_CHECK_EQUAL(*gens[1](), 5);
    BOOST_CHECK_EQUAL(*gens[1](), 10);
}

BOOST_AUTO_TEST_CASE(exhausted_is_an_error)
{
    auto gen = make_generator<Accumulates>(0L);
    BOOST_CHECK_EQUAL(*gen(1), 1);
    BOOST_CHECK(!gen(1).has_value());
    try {
        gen(1);
        BOOST_FAIL("resume after finish did not throw");
    } catch (GeneratorError const & e) {
        BOOST_CHECK(e.which() == errc::exhausted);
        BOOST_CHECK(e.code() == errc::exhausted);
    }
    // the failed resume left it exhausted rather than restarted
    BOOST_CHECK(gen.exhausted());
    BOOST_CHECK_THROW(gen(1), GeneratorError);
}

BOOST_AUTO_TEST_CASE(empty_handle_is_torn_down)
{
    Generator<long()> empty;
    BOOST_CHECK(!empty);
    try {
        empty();
        BOOST_FAIL("resume of an empty generator did not throw");
    } catch (GeneratorError const & e) {
        BOOST_CHECK(e.which() == errc::torn_down);
    }
    BOOST_CHECK_THROW(empty.exhausted(), GeneratorError);
}

BOOST_AUTO_TEST_CASE(use_after_reset)
{
    int cleanups = 0;
    auto gen = make_generator<Counted>(cleanups);
    BOOST_CHECK(gen);
    gen.reset();
    BOOST_CHECK_EQUAL(cleanups, 1);
    BOOST_CHECK(!gen);
    try {
        gen();
        BOOST_FAIL("resume after reset did not throw");
    } catch (GeneratorError const & e) {
        BOOST_CHECK(e.which() == errc::torn_down);
    }
    gen.reset();
    BOOST_CHECK_EQUAL(cleanups, 1);
}

BOOST_AUTO_TEST_CASE(use_after_move)
{
    int cleanups = 0;
    auto gen = make_generator<Counted>(cleanups);
    auto moved = std::move(gen);
    BOOST_CHECK_THROW(gen(), GeneratorError);
    BOOST_CHECK(!moved().has_value());
    BOOST_CHECK_EQUAL(cleanups, 0);

    moved = make_generator<Counted>(cleanups);
    BOOST_CHECK_EQUAL(cleanups, 1);
}

BOOST_AUTO_TEST_CASE(reentrant_resume_is_busy)
{
    Generator<int()> gen;
    gen = make_generator<Reenters>(gen);
    BOOST_CHECK_EQUAL(*gen(), static_cast<int>(errc::busy));
    BOOST_CHECK(!gen.exhausted());

    // uncaught in the body, the error reaches the caller and ends the generator
    try {
        gen();
        BOOST_FAIL("reentrant resume did not throw");
    } catch (GeneratorError const & e) {
        BOOST_CHECK(e.which() == errc::busy);
    }
    BOOST_CHECK(gen.exhausted());
}

BOOST_AUTO_TEST_CASE(body_exception_propagates)
{
    auto gen = make_generator<Throws>();
    BOOST_CHECK_EQUAL(*gen(), 1);
    BOOST_CHECK_THROW(gen(), std::runtime_error);
    BOOST_CHECK(gen.exhausted());
    BOOST_CHECK_THROW(gen(), GeneratorError);
}

BOOST_AUTO_TEST_CASE(error_messages)
{
    BOOST_CHECK_EQUAL(generator_category().name(), std::string("ratchet.generator"));
    BOOST_CHECK(!make_error_code(errc::torn_down).message().empty());
    BOOST_CHECK(make_error_code(errc::busy) != make_error_code(errc::exhausted));
    GeneratorError e(errc::cleanup_already_registered);
    BOOST_CHECK(e.code().category() == generator_category());
}

BOOST_AUTO_TEST_SUITE_END()
