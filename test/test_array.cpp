#include "pearl.hpp"
#include "test_helpers.hpp"

#include <cstdint>

using namespace pearl;
using namespace pearl::test;

namespace {

    const char* kTrackerPackage = R"perl(
        package Tracker;
        our $destroyed = 0;
        sub new { bless {}, shift }
        sub DESTROY { $destroyed++ }
        package main;
        1;
    )perl";

} // anonymous namespace

namespace pearl {
    namespace test {

        void test_array_sparse_store() {
            Interpreter interp;
            Array array(interp);
            AssertHelper::assert_true(array.empty(), "New array is empty");

            array.store(9, 42);
            AssertHelper::assert_equals(size_t(10), array.size(), "Store past the end extends");

            AssertHelper::assert_false(array.fetch(7).has_value(), "Skipped slot was never set");
            AssertHelper::assert_false(array.exists(7), "Skipped slot does not exist");
            AssertHelper::assert_false(array[7].defined(), "Subscript of a hole is undef");

            auto stored = array.fetch<int>(9);
            AssertHelper::assert_true(stored.has_value(), "Stored slot is set");
            AssertHelper::assert_equals(42, *stored, "Stored value");
            AssertHelper::assert_true(array.exists(9), "Stored slot exists");
            AssertHelper::assert_false(array.fetch(100).has_value(), "Past the end");
        }

        void test_array_remove() {
            Interpreter interp;
            Array array(interp);
            array.push(std::string("first"));
            array.push(std::string("second"));

            auto removed = array.remove(0);
            AssertHelper::assert_true(removed.has_value(), "Remove returns the prior value");
            AssertHelper::assert_equals(std::string("first"), removed->as<std::string>(), "Prior value");

            AssertHelper::assert_false(array.remove(0).has_value(), "Second remove finds nothing");
            AssertHelper::assert_false(array.exists(0), "Removed slot does not exist");
            AssertHelper::assert_equals(std::string("second"), *array.fetch<std::string>(1), "Neighbour stays");
        }

        void test_array_push_pop() {
            Interpreter interp;
            Array array(interp);
            AssertHelper::assert_false(array.pop().has_value(), "Pop of an empty array");

            array.push(1);
            array.push(2.5);
            array.push(std::string("three"));
            AssertHelper::assert_equals(size_t(3), array.size(), "Three pushes");

            auto last = array.pop();
            AssertHelper::assert_equals(std::string("three"), last->as<std::string>(), "Pop returns the last");
            AssertHelper::assert_equals(uint32_t(1), last->refcount(), "Popped SV is owned by the wrapper");
            AssertHelper::assert_equals(size_t(2), array.size(), "Pop shrinks");

            array.clear();
            AssertHelper::assert_true(array.empty(), "Clear empties");
        }

        void test_array_element_alias() {
            Interpreter interp;
            interp.eval("our @items = (1, 2, 3); 1");
            auto items = interp.find_array("main::items");
            AssertHelper::assert_true(items.has_value(), "Global array exists");

            Scalar second = (*items)[1];
            second.set(20);
            AssertHelper::assert_equals(20, interp.eval<int>("$items[1]"), "Element wrapper aliases the slot");

            items->store(3, 4);
            AssertHelper::assert_equals(4, interp.eval<int>("scalar @items"), "Perl sees the store");
            AssertHelper::assert_true(items->to_vector<int>() == std::vector<int>({1, 20, 3, 4}), "to_vector");
        }

        void test_array_from_reference() {
            Interpreter interp;
            Scalar ref = interp.eval("[qw(a b c)]");
            Array array(ref);
            AssertHelper::assert_equals(size_t(3), array.size(), "Dereferenced size");
            AssertHelper::assert_equals(std::string("b"), array[1].as<std::string>(), "Element");

            AssertHelper::assert_throws<UnexpectedValueType>([&] {
                Array bad(interp.eval("{}"));
            }, "Hash reference is not an array");
        }

        void test_array_undef_slot() {
            Interpreter interp;
            Array array(interp.eval("[1, undef, 3]"));

            AssertHelper::assert_true(array.exists(1), "Slot holding undef exists");
            AssertHelper::assert_false(array.fetch(1).has_value(), "Stored undef fetches as no value");
            AssertHelper::assert_false(array.fetch<int>(1).has_value(), "Typed fetch of stored undef");
            AssertHelper::assert_false(array[1].defined(), "Subscript still gives the undef slot");
            AssertHelper::assert_equals(3, array.fetch(2)->as<int>(), "Defined neighbour");
        }

        void test_array_index_range() {
            Interpreter interp;
            Array array(interp.eval("[10, 20, 30]"));

            AssertHelper::assert_false(array.fetch(SIZE_MAX).has_value(), "Huge index is not counted from the end");
            AssertHelper::assert_false(array.fetch<int>(SIZE_MAX).has_value(), "Typed fetch of a huge index");
            AssertHelper::assert_false(array.exists(SIZE_MAX), "Huge index does not exist");
            AssertHelper::assert_false(array.remove(SIZE_MAX).has_value(), "Huge index removes nothing");
            AssertHelper::assert_throws<PerlError>([&] { array.store(SIZE_MAX, 1); }, "Store at a huge index");

            AssertHelper::assert_equals(size_t(3), array.size(), "Array is untouched");
            AssertHelper::assert_equals(30, *array.fetch<int>(2), "Last element is untouched");
        }

        void test_array_pop_hole() {
            Interpreter interp;
            Array array(interp);
            array.store(3, 1);

            AssertHelper::assert_equals(1, array.pop()->as<int>(), "Pop the stored value");
            auto hole = array.pop();
            AssertHelper::assert_true(hole.has_value(), "Array was not empty");
            AssertHelper::assert_false(hole->defined(), "Hole pops as undef");
            AssertHelper::assert_equals(uint32_t(1), hole->refcount(), "Wrapper owns its own undef");
            AssertHelper::assert_equals(size_t(2), array.size(), "Pop shrinks past the hole");
        }

        void test_array_remove_releases() {
            Interpreter interp;
            interp.eval(kTrackerPackage);
            interp.eval("our @tracked = (Tracker->new, Tracker->new); 1");
            auto tracked = interp.find_array("main::tracked");

            {
                auto removed = tracked->remove(0);
                AssertHelper::assert_true(removed.has_value(), "Removed value");
                AssertHelper::assert_equals(uint32_t(1), removed->refcount(), "Wrapper is the only owner");
                AssertHelper::assert_equals(0, interp.eval<int>("$Tracker::destroyed"), "Alive while wrapped");
            }
            AssertHelper::assert_equals(1, interp.eval<int>("$Tracker::destroyed"),
                                        "Dropping the wrapper destroys the removed value");

            for (int i = 0; i < 100; ++i) {
                tracked->store(1, Scalar(interp.eval("Tracker->new")));
                tracked->remove(1);
            }
            AssertHelper::assert_equals(102, interp.eval<int>("$Tracker::destroyed"),
                                        "Every removed value is destroyed at once");
        }

    } // namespace test
} // namespace pearl
