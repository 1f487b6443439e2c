#include "pearl.hpp"
#include "test_helpers.hpp"

#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <tuple>
#include <vector>

using namespace pearl;
using namespace pearl::test;

namespace {

    int native_multiply(int a, int b) {
        return a * b;
    }

} // anonymous namespace

namespace pearl {
    namespace test {

        // ============================================================================
        // Host Subs
        // ============================================================================

        void test_sub_host_required_params() {
            Interpreter interp;
            Sub add(interp, "main::add", [](int a, int b) { return a + b; });
            Sub mul(interp, "main::mul", &native_multiply);

            AssertHelper::assert_equals(25, interp.eval<int>("add(10, 15)"), "Lambda sub");
            AssertHelper::assert_equals(42, interp.eval<int>("mul(6, 7)"), "Function pointer sub");
            AssertHelper::assert_equals(std::string("main::add"), add.name(), "Glob name");
            AssertHelper::assert_true(add.is_host(), "Host sub");
            AssertHelper::assert_contains(add.source_file(), "test_sub.cpp", "Defining source file");
        }

        void test_sub_host_trailing_array() {
            Interpreter interp;
            Sub count(interp, "main::count_args", [](std::vector<int> rest) { return rest.size(); });
            Sub sum(interp, "main::sum_after", [](std::string label, std::vector<int> rest) {
                int total = 0;
                for (int v : rest) total += v;
                return label + "=" + std::to_string(total);
            });

            AssertHelper::assert_equals(5, interp.eval<int>("count_args(1, 2, 3, 4, 5)"), "Trailing vector gets every argument");
            AssertHelper::assert_equals(0, interp.eval<int>("count_args()"), "Trailing vector may be empty");
            AssertHelper::assert_equals(std::string("sum=6"), interp.eval<std::string>("sum_after('sum', 1, 2, 3)"),
                                        "Trailing vector after a required parameter");
        }

        void test_sub_host_optional_params() {
            Interpreter interp;
            Sub greet(interp, "main::greet", [](std::string name, std::optional<std::string> greeting) {
                return greeting.value_or("Hello") + ", " + name;
            });

            AssertHelper::assert_equals(std::string("Hello, Ann"), interp.eval<std::string>("greet('Ann')"),
                                        "Omitted optional");
            AssertHelper::assert_equals(std::string("Hello, Ann"), interp.eval<std::string>("greet('Ann', undef)"),
                                        "Undef optional");
            AssertHelper::assert_equals(std::string("Hi, Ann"), interp.eval<std::string>("greet('Ann', 'Hi')"),
                                        "Given optional");
        }

        void test_sub_host_trailing_hash() {
            Interpreter interp;
            Sub options(interp, "main::options", [](std::string tag, std::map<std::string, int> opts) {
                int total = 0;
                for (const auto& [key, value] : opts) total += value;
                return tag + ":" + std::to_string(opts.size()) + ":" + std::to_string(total);
            });
            Sub odd(interp, "main::odd_tail", [](std::map<std::string, std::optional<int>> opts) {
                return opts.count("last") == 1 && !opts["last"].has_value();
            });

            AssertHelper::assert_equals(std::string("t:2:3"), interp.eval<std::string>("options('t', a => 1, b => 2)"),
                                        "Key/value pairs");
            AssertHelper::assert_true(interp.eval<bool>("odd_tail(first => 1, 'last')"),
                                      "Odd tail leaves its value undef");
        }

        void test_sub_host_tuple_return() {
            Interpreter interp;
            Sub divmod(interp, "main::divmod", [](int a, int b) {
                return std::make_tuple(a / b, a % b);
            });

            AssertHelper::assert_equals(std::string("3,2"), interp.eval<std::string>("join ',', divmod(17, 5)"),
                                        "Tuple returns a list");
            AssertHelper::assert_equals(2, interp.eval<int>("my @r = divmod(17, 5); scalar @r"), "Two values");
        }

        void test_sub_host_raw_arguments() {
            Interpreter interp;
            Sub raw(interp, "main::raw_count", [](Arguments& args) { return args.size(); });
            Sub first(interp, "main::first_or", [](Arguments& args) {
                return args.get<std::optional<std::string>>(0).value_or("none");
            });

            AssertHelper::assert_equals(3, interp.eval<int>("raw_count(1, 'two', [3])"), "Raw argument count");
            AssertHelper::assert_equals(std::string("none"), interp.eval<std::string>("first_or()"),
                                        "Optional past the end");
            AssertHelper::assert_equals(std::string("x"), interp.eval<std::string>("first_or('x')"), "Present");
        }

        void test_sub_host_argument_alias() {
            Interpreter interp;
            Sub bump(interp, "main::bump", [](Arguments& args) {
                Scalar first = args[0];
                first.set(first.as<int>() + 1);
            });

            AssertHelper::assert_equals(42, interp.eval<int>("my $n = 41; bump($n); $n"),
                                        "Arguments alias the caller's variables");
        }

        void test_sub_host_missing_argument() {
            Interpreter interp;
            Sub add(interp, "main::needs_two", [](int a, int b) { return a + b; });

            std::string msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.eval("needs_two(1)");
            }, "Missing required argument");
            AssertHelper::assert_contains(msg, "No argument on stack at index 1", "Message names the index");

            Sub raw(interp, "main::second", [](Arguments& args) { return args[1].as<int>(); });
            msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.eval("second(1)");
            }, "Raw subscript past the end");
            AssertHelper::assert_contains(msg, "No argument on stack", "Raw message");
        }

        void test_sub_host_conversion_error() {
            Interpreter interp;
            Sub square(interp, "main::square", [](int x) { return x * x; });

            std::string msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.eval("square('abc')");
            }, "Non-numeric argument");
            AssertHelper::assert_contains(msg, "Conversion error", "Conversion failure becomes a die");
        }

        void test_sub_host_exception_becomes_die() {
            Interpreter interp;
            Sub explode(interp, "main::explode", []() { throw std::runtime_error("native boom"); });

            std::string caught = interp.eval<std::string>("eval { explode(); 1 } ? 'survived' : $@");
            AssertHelper::assert_contains(caught, "native boom", "Perl eval catches the C++ exception");

            std::string msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.call("explode");
            }, "Call from C++");
            AssertHelper::assert_contains(msg, "native boom", "Message survives the round trip");

            // The interpreter is still usable
            AssertHelper::assert_equals(2, interp.eval<int>("1 + 1"), "Interpreter after a die");
        }

        void test_sub_host_magic_arguments() {
            Interpreter interp;
            Sub twice(interp, "main::twice", [](int x) { return x * 2; });
            Sub label(interp, "main::label", [](std::string name, std::optional<std::string> suffix) {
                return name + suffix.value_or("?");
            });

            AssertHelper::assert_equals(84, interp.eval<int>("'abc42' =~ /(\\d+)/; twice($1)"),
                                        "Capture variable is read through its magic");
            AssertHelper::assert_equals(std::string("key=val"),
                                        interp.eval<std::string>("'key=val' =~ /(\\w+)(=\\w+)/; label($1, $2)"),
                                        "Captures bind to required and optional parameters");
            AssertHelper::assert_equals(std::string("x?"),
                                        interp.eval<std::string>("'x' =~ /(x)(y)?/; label($1, $2)"),
                                        "Unmatched group is undef");

            interp.eval("package Seven; sub TIESCALAR { bless {}, shift } sub FETCH { 7 } package main; "
                        "our $seven; tie $seven, 'Seven'; 1");
            AssertHelper::assert_equals(14, interp.eval<int>("twice($seven)"), "Tied argument");
        }

        void test_sub_anonymous_host() {
            Interpreter interp;
            Sub doubler(interp, "", [](int x) { return x * 2; });
            AssertHelper::assert_equals(uint32_t(1), doubler.refcount(), "Anonymous sub is owned by the wrapper");

            interp.global_scalar("main::doubler").set(doubler.make_ref());
            AssertHelper::assert_equals(42, interp.eval<int>("$main::doubler->(21)"), "Called through a reference");
        }

        void test_sub_host_body_released() {
            Interpreter interp;
            auto offset = std::make_shared<int>(1);
            {
                Sub shifted(interp, "", [offset](int x) { return x + *offset; });
                AssertHelper::assert_equals(long(2), offset.use_count(), "Body holds the capture");
                AssertHelper::assert_equals(3, shifted.call<int>(2), "Body runs");
            }
            AssertHelper::assert_equals(long(1), offset.use_count(), "Freeing the sub destroys its body");
        }

        // ============================================================================
        // Calling Perl
        // ============================================================================

        void test_sub_call_perl() {
            Interpreter interp;
            interp.eval("sub concat { join '-', @_ } 1");

            auto concat = interp.find_sub("main::concat");
            AssertHelper::assert_true(concat.has_value(), "Sub exists");
            AssertHelper::assert_false(concat->is_host(), "Perl sub");
            AssertHelper::assert_equals(std::string("a-1-2.5"),
                                        concat->call<std::string>(std::string("a"), 1, 2.5), "Mixed arguments");

            Scalar code = interp.eval("sub { $_[0] + 1 }");
            Sub increment(code);
            AssertHelper::assert_equals(2, increment.call<int>(1), "Code reference");
        }

        void test_sub_call_contexts() {
            Interpreter interp;
            interp.eval("sub pair { return (1, 'two') } sub single { return (7) } "
                        "sub context { wantarray ? 'list' : defined(wantarray) ? 'scalar' : 'void' } 1");

            auto [number, word] = interp.call<std::tuple<int, std::string>>("pair");
            AssertHelper::assert_equals(1, number, "First slot");
            AssertHelper::assert_equals(std::string("two"), word, "Second slot");

            auto [seven, missing] = interp.call<std::tuple<int, std::optional<int>>>("single");
            AssertHelper::assert_equals(7, seven, "Present slot");
            AssertHelper::assert_false(missing.has_value(), "Missing slot reads as undef");

            AssertHelper::assert_equals(std::string("scalar"), interp.call<std::string>("context"), "Scalar context");
            AssertHelper::assert_equals(std::string("list"),
                                        std::get<0>(interp.call<std::tuple<std::string>>("context")), "List context");

            auto all = interp.call_list("pair");
            AssertHelper::assert_equals(size_t(2), all.size(), "call_list returns every value");
            AssertHelper::assert_equals(uint32_t(1), all[1].refcount(), "Results are independent copies");
        }

        void test_sub_call_die() {
            Interpreter interp;
            interp.eval("sub fail { die \"broken\\n\" } 1");

            std::string msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.call("fail");
            }, "Perl die");
            AssertHelper::assert_equals(std::string("broken\n"), msg, "Message is $@");

            msg = AssertHelper::assert_throws<InterpreterError>([&] {
                interp.call("no_such_sub");
            }, "Missing sub");
            AssertHelper::assert_contains(msg, "Undefined subroutine", "Missing sub message");
        }

        void test_sub_host_calls_back_into_perl() {
            Interpreter interp;
            interp.eval("sub twice { $_[0] * 2 } 1");
            Sub outer(interp, "main::outer", [&interp](int x) {
                return interp.call<int>("twice", x) + 1;
            });

            AssertHelper::assert_equals(21, interp.eval<int>("outer(10)"), "Nested call");
        }

    } // namespace test
} // namespace pearl
