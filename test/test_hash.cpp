#include "pearl.hpp"
#include "test_helpers.hpp"

#include <algorithm>

using namespace pearl;
using namespace pearl::test;

namespace {

    // FETCH hands out a fresh object every time, so the test can see when
    // the values read during iteration are released
    const char* kTrackerPackages = R"perl(
        package Tracker;
        our $destroyed = 0;
        sub new { bless {}, shift }
        sub DESTROY { $destroyed++ }

        package TrackerHash;
        my %next = (a => 'b', b => 'c');
        sub TIEHASH { bless {}, shift }
        sub FETCH { Tracker->new }
        sub EXISTS { exists $next{$_[1]} || $_[1] eq 'c' }
        sub FIRSTKEY { 'a' }
        sub NEXTKEY { $next{$_[1]} }
        package main;
        1;
    )perl";

} // anonymous namespace

namespace pearl {
    namespace test {

        void test_hash_store_fetch() {
            Interpreter interp;
            Hash hash(interp);
            AssertHelper::assert_true(hash.empty(), "New hash is empty");

            hash.store("name", std::string("pearl"));
            hash.store("size", 3);

            AssertHelper::assert_equals(size_t(2), hash.size(), "Two keys");
            AssertHelper::assert_true(hash.exists("name"), "Key exists");
            AssertHelper::assert_false(hash.exists("missing"), "Missing key");
            AssertHelper::assert_false(hash["missing"].has_value(), "Subscript of a missing key");
            AssertHelper::assert_equals(std::string("pearl"), hash["name"]->as<std::string>(), "Subscript");
            AssertHelper::assert_equals(3, *hash.fetch<int>("size"), "Typed fetch");
            AssertHelper::assert_false(hash.fetch<int>("missing").has_value(), "Typed fetch of a missing key");

            hash.store("size", 4);
            AssertHelper::assert_equals(4, *hash.fetch<int>("size"), "Store replaces");
            AssertHelper::assert_equals(size_t(2), hash.size(), "Replace keeps the key count");
        }

        void test_hash_remove() {
            Interpreter interp;
            Hash hash(interp);
            hash.store("key", 10);

            auto removed = hash.remove("key");
            AssertHelper::assert_true(removed.has_value(), "Remove returns the prior value");
            AssertHelper::assert_equals(10, removed->as<int>(), "Prior value");
            AssertHelper::assert_false(hash.exists("key"), "Key is gone");
            AssertHelper::assert_false(hash.remove("key").has_value(), "Second remove finds nothing");
        }

        void test_hash_unicode_keys() {
            Interpreter interp;
            interp.eval("our %h; 1");
            auto hash = interp.find_hash("main::h");
            AssertHelper::assert_true(hash.has_value(), "Global hash exists");

            hash->store("ключ", 5);
            AssertHelper::assert_equals(5, interp.eval<int>("use utf8; $main::h{'ключ'}"),
                                        "Perl finds the UTF-8 key");
            AssertHelper::assert_equals(4, interp.eval<int>("length((keys %main::h)[0])"),
                                        "Key is four characters");

            interp.eval("use utf8; $main::h{'тест'} = 'значение'; 1");
            auto value = hash->fetch<std::string>("тест");
            AssertHelper::assert_true(value.has_value(), "C++ finds a key stored by Perl");
            AssertHelper::assert_equals(std::string("значение"), *value, "Value");

            auto keys = hash->keys();
            std::sort(keys.begin(), keys.end());
            AssertHelper::assert_true(keys == std::vector<std::string>({"ключ", "тест"}), "Keys come back as UTF-8");
        }

        void test_hash_conversions() {
            Interpreter interp;
            Scalar ref = interp.eval("{ a => 1, b => 2, c => 3 }");
            Hash hash(ref);

            auto ordered = hash.to_map<int>();
            AssertHelper::assert_equals(size_t(3), ordered.size(), "to_map size");
            AssertHelper::assert_equals(2, ordered["b"], "to_map value");

            auto unordered = hash.to_unordered_map<int>();
            AssertHelper::assert_equals(3, unordered.at("c"), "to_unordered_map value");

            hash.clear();
            AssertHelper::assert_true(hash.empty(), "Clear empties");
        }

        void test_hash_remove_releases() {
            Interpreter interp;
            interp.eval(kTrackerPackages);
            interp.eval("our %tracked = (t => Tracker->new); 1");
            auto tracked = interp.find_hash("main::tracked");

            {
                auto removed = tracked->remove("t");
                AssertHelper::assert_true(removed.has_value(), "Removed value");
                AssertHelper::assert_equals(uint32_t(1), removed->refcount(), "Wrapper is the only owner");
                AssertHelper::assert_equals(0, interp.eval<int>("$Tracker::destroyed"), "Alive while wrapped");
            }
            AssertHelper::assert_equals(1, interp.eval<int>("$Tracker::destroyed"),
                                        "Dropping the wrapper destroys the removed value");
        }

        void test_hash_tied_iteration() {
            Interpreter interp;
            interp.eval(kTrackerPackages);
            interp.eval("our %lazy; tie %lazy, 'TrackerHash'; 1");
            auto lazy = interp.find_hash("main::lazy");

            auto keys = lazy->keys();
            std::sort(keys.begin(), keys.end());
            AssertHelper::assert_true(keys == std::vector<std::string>({"a", "b", "c"}), "Tied keys");

            for (int round = 1; round <= 50; ++round) {
                auto flags = lazy->to_map<bool>();
                AssertHelper::assert_equals(size_t(3), flags.size(), "Every tied value is read");
                AssertHelper::assert_equals(round * 3, interp.eval<int>("$Tracker::destroyed"),
                                            "Values read while iterating are released at once");
            }
        }

    } // namespace test
} // namespace pearl
