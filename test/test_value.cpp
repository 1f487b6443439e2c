#include "pearl.hpp"
#include "test_helpers.hpp"

using namespace pearl;
using namespace pearl::test;

namespace pearl {
    namespace test {

        // ============================================================================
        // Reference Counting
        // ============================================================================

        void test_value_retain_and_release() {
            Interpreter interp;
            interp.eval("our $counter = 5; 1");

            auto global = interp.find_scalar("main::counter");
            AssertHelper::assert_true(global.has_value(), "Global should exist");
            uint32_t base = global->refcount();

            {
                Scalar copy = *global;
                AssertHelper::assert_equals(uint32_t(base + 1), copy.refcount(), "Copy takes a reference");

                Scalar moved = std::move(copy);
                AssertHelper::assert_equals(uint32_t(base + 1), moved.refcount(), "Move keeps the count");
            }

            AssertHelper::assert_equals(base, global->refcount(), "Destruction gives the references back");
        }

        void test_value_adopt_fresh() {
            Interpreter interp;
            Scalar fresh(interp, 42);
            AssertHelper::assert_equals(uint32_t(1), fresh.refcount(), "Adopted SV has a single owner");

            Scalar undef(interp);
            AssertHelper::assert_false(undef.defined(), "Default Scalar is undef");
            AssertHelper::assert_equals(uint32_t(1), undef.refcount(), "Undef SV is a fresh SV");
        }

        void test_value_assignment_swaps() {
            Interpreter interp;
            Scalar a(interp, 1);
            Scalar b(interp, 2);
            Scalar keep = b;

            a = b;
            AssertHelper::assert_equals(2, a.as<int>(), "Assignment shares the SV");
            AssertHelper::assert_equals(uint32_t(3), keep.refcount(), "Three wrappers on one SV");
        }

        // ============================================================================
        // Type Checks
        // ============================================================================

        void test_value_wrong_type_keeps_refcount() {
            Interpreter interp;
            Scalar number(interp, 42);
            uint32_t base = number.refcount();

            std::string msg = AssertHelper::assert_throws<UnexpectedValueType>([&] {
                Array array(number.handle(), Ownership::Retain);
            }, "Scalar SV is not an AV");
            AssertHelper::assert_contains(msg, "expected array", "Message names the wanted kind");
            AssertHelper::assert_equals(base, number.refcount(), "Failed wrap must not take a reference");

            AssertHelper::assert_throws<UnexpectedValueType>([&] {
                Hash hash(number);
            }, "Plain scalar is not a hash reference");
            AssertHelper::assert_equals(base, number.refcount(), "Failed deref must not take a reference");

            Scalar aref = interp.eval("[1, 2]");
            AssertHelper::assert_throws<UnexpectedValueType>([&] {
                Hash hash(aref);
            }, "Array reference is not a hash reference");
        }

        void test_value_unexpected_type_details() {
            Interpreter interp;
            Scalar href = interp.eval("{}");
            try {
                Sub sub(href);
            } catch (const UnexpectedValueType& e) {
                AssertHelper::assert_true(e.expected() == ValueKind::Sub, "Expected kind is Sub");
                AssertHelper::assert_true(e.actual() == SvType::Hash, "Actual type is a hash");
                return;
            }
            throw std::runtime_error("Assertion failed: hash reference wrapped as Sub");
        }

        // ============================================================================
        // Derived Wrappers
        // ============================================================================

        void test_value_derived_kinds() {
            Interpreter interp;
            ObjectRegistry::instance().clear();

            Scalar aref = interp.eval("[1, 2, 3]");
            auto array = value_cast<Array>(aref.referent());
            AssertHelper::assert_true(array != nullptr, "Array referent");
            AssertHelper::assert_equals(size_t(3), array->size(), "Array size");

            Scalar href = interp.eval("{ a => 1 }");
            auto referent = href.referent();
            AssertHelper::assert_true(referent->kind() == ValueKind::Hash, "Hash referent");

            Scalar cref = interp.eval("sub { 1 }");
            AssertHelper::assert_true(cref.referent()->kind() == ValueKind::Sub, "Code referent");

            Scalar sref = interp.eval("\\ 'text'");
            AssertHelper::assert_true(sref.referent()->kind() == ValueKind::Scalar, "Scalar referent");

            Scalar plain(interp, 7);
            AssertHelper::assert_true(plain.referent() == nullptr, "Non-reference has no referent");

            Scalar blessed = interp.eval("bless {}, 'Pearl::Test::Plain'");
            auto object = Value::init_derived(blessed.handle(), Ownership::Retain);
            AssertHelper::assert_true(object->kind() == ValueKind::Object, "Blessed reference is an Object");
            AssertHelper::assert_equals(std::string("Object(Pearl::Test::Plain)"),
                                        object->debug_description(), "Object description");

            auto generic = Value::init_derived(plain.handle(), Ownership::Retain);
            AssertHelper::assert_true(generic->kind() == ValueKind::Scalar, "Plain SV is a Scalar");
        }

        void test_value_make_ref() {
            Interpreter interp;
            Array array(interp);
            array.push(1);
            array.push(2);

            Scalar ref = array.make_ref();
            AssertHelper::assert_true(ref.is_ref(), "make_ref yields a reference");
            AssertHelper::assert_equals(uint32_t(2), array.refcount(), "Reference holds the array");

            Array back(ref);
            AssertHelper::assert_equals(size_t(2), back.size(), "Dereferenced array is the same");
            back.push(3);
            AssertHelper::assert_equals(size_t(3), array.size(), "Both wrappers see one AV");
        }

        void test_value_debug_description() {
            Interpreter interp;
            AssertHelper::assert_equals(std::string("Scalar(undef)"), Scalar(interp).debug_description(), "undef");
            AssertHelper::assert_equals(std::string("Scalar(42)"), Scalar(interp, 42).debug_description(), "int");
            AssertHelper::assert_equals(std::string("Scalar(\"hi\")"),
                                        Scalar(interp, std::string("hi")).debug_description(), "text");

            Scalar aref = interp.eval("[1, 2, 3]");
            AssertHelper::assert_equals(std::string("Array(3)"), Array(aref).debug_description(), "array");
        }

    } // namespace test
} // namespace pearl
