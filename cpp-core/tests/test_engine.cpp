/**
 * @file test_engine.cpp
 * @brief Primitive contracts, run against both engines.
 */

#include "dualffi/dynamic_engine.h"
#include "dualffi/engine.h"
#include "dualffi/error.h"
#include "test_support.h"

#if DUALFFI_WITH_DECLARATIVE
#include "dualffi/declarative_engine.h"
#endif

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <cwchar>
#include <memory>
#include <string>
#include <vector>

using namespace dualffi;
using dualffi_test::KeyLengths;
using dualffi_test::TaggedValue;

namespace {

Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

}  // namespace

class EngineTest : public ::testing::TestWithParam<EngineKind> {
protected:
    void SetUp() override {
        EngineConfig config;
        try {
            if (GetParam() == EngineKind::Declarative) {
                config.preference = EngineConfig::Preference::Declarative;
                engine = make_declarative_engine(config);
            } else {
                config.preference = EngineConfig::Preference::Dynamic;
                engine = make_dynamic_engine(config);
            }
        } catch (const EngineUnavailable& e) {
            GTEST_SKIP() << e.what();
        }
        ASSERT_NE(engine, nullptr);
        ASSERT_EQ(engine->kind(), GetParam());
    }

    std::unique_ptr<Engine> engine;
    Library library = dualffi_test::make_test_library();
};

TEST_P(EngineTest, BytesRoundTrip) {
    const Bytes data = {0x00, 0x01, 0x7f, 0x80, 0xff, 0x00, 0x42};
    Buffer buffer = engine->buffer_from_bytes(data);

    EXPECT_EQ(buffer.size(), data.size());
    EXPECT_EQ(engine->bytes_from_buffer(buffer, std::nullopt), data);
}

TEST_P(EngineTest, EmptyBytesRoundTrip) {
    Buffer buffer = engine->buffer_from_bytes(Bytes());
    EXPECT_EQ(buffer.size(), 0u);
    EXPECT_TRUE(engine->bytes_from_buffer(buffer, std::nullopt).empty());
    EXPECT_TRUE(engine->byte_string_from_buffer(buffer).empty());
}

TEST_P(EngineTest, BytesFromBufferHonoursMaxlen) {
    Buffer buffer = engine->buffer_from_bytes({0x01, 0x02, 0x03, 0x04});

    EXPECT_EQ(engine->bytes_from_buffer(buffer, 2), (Bytes{0x01, 0x02}));
    EXPECT_EQ(engine->bytes_from_buffer(buffer, 0), Bytes());
    EXPECT_EQ(engine->bytes_from_buffer(buffer, 64), (Bytes{0x01, 0x02, 0x03, 0x04}));
}

TEST_P(EngineTest, TerminatorPolicy) {
    Buffer buffer = engine->buffer_from_bytes(to_bytes("abc"));
    EXPECT_EQ(buffer.size(), 3u);

    if (GetParam() == EngineKind::Dynamic) {
        ASSERT_EQ(buffer.capacity(), 4u);
        EXPECT_EQ(static_cast<const char*>(buffer.data())[3], '\0');
    } else {
        EXPECT_EQ(buffer.capacity(), 3u);
    }
}

TEST_P(EngineTest, ByteStringStopsAtFirstNull) {
    Bytes data = to_bytes("abc");
    data.push_back(0);
    const Bytes tail = to_bytes("def");
    data.insert(data.end(), tail.begin(), tail.end());

    Buffer buffer = engine->buffer_from_bytes(data);
    EXPECT_EQ(engine->byte_string_from_buffer(buffer), to_bytes("abc"));

    Buffer unterminated = engine->buffer_from_bytes(to_bytes("hello"));
    EXPECT_EQ(engine->byte_string_from_buffer(unterminated), to_bytes("hello"));
}

TEST_P(EngineTest, UnicodeBufferIsNullTerminated) {
    Buffer buffer = engine->buffer_from_unicode(L"key");

    EXPECT_EQ(buffer.count(), 3u);
    EXPECT_EQ(buffer.size(), 3 * sizeof(wchar_t));
    EXPECT_EQ(std::wcscmp(static_cast<const wchar_t*>(buffer.data()), L"key"), 0);
}

TEST_P(EngineTest, BufferPointerAddressesTheBuffer) {
    Buffer buffer = engine->buffer_from_bytes(to_bytes("payload"));
    Buffer pointers = engine->buffer_pointer(buffer);

    EXPECT_EQ(pointers.count(), 1u);
    EXPECT_EQ(pointers.size(), sizeof(void*));
    EXPECT_FALSE(engine->is_null(pointers.pointer()));

    const Value inner = engine->deref(pointers.pointer());
    ASSERT_TRUE(std::holds_alternative<Pointer>(inner));
    EXPECT_EQ(std::get<Pointer>(inner).address(), buffer.data());
    EXPECT_EQ(engine->bytes_from_pointer(std::get<Pointer>(inner), 7), to_bytes("payload"));
}

TEST_P(EngineTest, NullSentinel) {
    EXPECT_TRUE(engine->is_null(engine->null()));
    EXPECT_EQ(engine->null().address(), nullptr);

    Buffer buffer = engine->buffer_from_bytes({0x01});
    EXPECT_FALSE(engine->is_null(buffer.pointer()));
}

TEST_P(EngineTest, IsNullLooksThroughOutParameter) {
    Buffer handle_slot = engine->new_value(&library, "HANDLE *", Value());
    EXPECT_TRUE(engine->is_null(handle_slot.pointer()));

    int resource = 0;
    store_value(handle_slot.element(), handle_slot.data(), Pointer(&resource, void_type()));
    EXPECT_FALSE(engine->is_null(handle_slot.pointer()));

    Buffer pointer_slot = engine->new_value(&library, "void **", Value());
    EXPECT_TRUE(engine->is_null(pointer_slot.pointer()));
}

TEST_P(EngineTest, ErrnoIsThreadErrno) {
    engine->set_errno(EINVAL);
    EXPECT_EQ(engine->get_errno(), EINVAL);
    engine->set_errno(0);
    EXPECT_EQ(engine->get_errno(), 0);
}

TEST_P(EngineTest, StructIsZeroInitialised) {
    Buffer instance = engine->make_struct(library, "KEY_LENGTHS");

    EXPECT_EQ(instance.size(), sizeof(KeyLengths));
    EXPECT_EQ(engine->struct_bytes(instance.pointer()), Bytes(sizeof(KeyLengths), 0));
}

TEST_P(EngineTest, StructFromBufferCopiesExactBytes) {
    const KeyLengths expected = {128, 256, 64};
    Bytes raw(sizeof(expected));
    std::memcpy(raw.data(), &expected, sizeof(expected));

    Buffer source = engine->buffer_from_bytes(raw);
    Buffer instance = engine->struct_from_buffer(library, "KEY_LENGTHS", source.pointer());

    EXPECT_EQ(engine->struct_bytes(instance.pointer()), raw);

    KeyLengths decoded{};
    std::memcpy(&decoded, instance.data(), sizeof(decoded));
    EXPECT_EQ(decoded.min_length, 128u);
    EXPECT_EQ(decoded.max_length, 256u);
    EXPECT_EQ(decoded.increment, 64u);
}

TEST_P(EngineTest, StructFromLongerBufferTakesPrefix) {
    TaggedValue value{};
    value.tag = 7;
    value.value = 0x0102030405060708ULL;

    Bytes raw(sizeof(value) + 5, 0xee);
    std::memcpy(raw.data(), &value, sizeof(value));
    Buffer source = engine->buffer_from_bytes(raw);

    Buffer instance = engine->struct_from_buffer(library, "TAGGED_VALUE", source.pointer());
    EXPECT_EQ(instance.size(), sizeof(TaggedValue));
    EXPECT_EQ(engine->struct_bytes(instance.pointer()),
              Bytes(raw.begin(), raw.begin() + sizeof(TaggedValue)));
}

TEST_P(EngineTest, StructLookupFailures) {
    EXPECT_THROW(engine->make_struct(library, "NO_SUCH_STRUCT"), UnresolvedTypeError);
    EXPECT_THROW(engine->make_struct(library, "int"), std::invalid_argument);
}

TEST_P(EngineTest, ArrayOfNarrowStrings) {
    const char* strings[] = {"alpha", "beta"};
    const Pointer array(strings, void_type());

    const auto values = engine->array_from_pointer(library, "unsigned char *", array, 2);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(std::get<Bytes>(values[0]), to_bytes("alpha"));
    EXPECT_EQ(std::get<Bytes>(values[1]), to_bytes("beta"));

    const auto chars = engine->array_from_pointer(library, "char *", array, 2);
    ASSERT_EQ(chars.size(), 2u);
    EXPECT_EQ(std::get<Bytes>(chars[1]), to_bytes("beta"));
}

TEST_P(EngineTest, ArrayNullStringEntry) {
    const char* strings[] = {"only", nullptr};
    const auto values =
        engine->array_from_pointer(library, "char *", Pointer(strings, void_type()), 2);
    ASSERT_EQ(values.size(), 2u);
    EXPECT_EQ(std::get<Bytes>(values[0]), to_bytes("only"));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(values[1]));
}

TEST_P(EngineTest, ArrayOfWideStrings) {
    const wchar_t* strings[] = {L"one", L"two", L"three"};
    const auto values =
        engine->array_from_pointer(library, "wchar_t *", Pointer(strings, void_type()), 3);
    ASSERT_EQ(values.size(), 3u);
    EXPECT_EQ(std::get<std::wstring>(values[0]), L"one");
    EXPECT_EQ(std::get<std::wstring>(values[2]), L"three");
}

TEST_P(EngineTest, ArrayOfScalarsKeepsMemoryOrder) {
    uint32_t unsigned_values[] = {7, 8, 9};
    const auto decoded = engine->array_from_pointer(
        library, "unsigned int", Pointer(unsigned_values, void_type()), 3);
    ASSERT_EQ(decoded.size(), 3u);
    EXPECT_EQ(std::get<std::uint64_t>(decoded[0]), 7u);
    EXPECT_EQ(std::get<std::uint64_t>(decoded[1]), 8u);
    EXPECT_EQ(std::get<std::uint64_t>(decoded[2]), 9u);

    int32_t signed_values[] = {-1, 5};
    const auto signed_decoded = engine->array_from_pointer(
        library, "int", Pointer(signed_values, void_type()), 2);
    ASSERT_EQ(signed_decoded.size(), 2u);
    EXPECT_EQ(std::get<std::int64_t>(signed_decoded[0]), -1);
    EXPECT_EQ(std::get<std::int64_t>(signed_decoded[1]), 5);
}

TEST_P(EngineTest, ArrayOfStructs) {
    KeyLengths lengths[2] = {{1, 2, 3}, {4, 5, 6}};
    const auto values =
        engine->array_from_pointer(library, "KEY_LENGTHS", Pointer(lengths, void_type()), 2);
    ASSERT_EQ(values.size(), 2u);

    KeyLengths second{};
    const Bytes& raw = std::get<Bytes>(values[1]);
    ASSERT_EQ(raw.size(), sizeof(KeyLengths));
    std::memcpy(&second, raw.data(), sizeof(second));
    EXPECT_EQ(second.min_length, 4u);
    EXPECT_EQ(second.increment, 6u);
}

TEST_P(EngineTest, ZeroLengthArrayNeverTouchesPointer) {
    EXPECT_TRUE(engine->array_from_pointer(library, "int", engine->null(), 0).empty());
    EXPECT_TRUE(engine->array_from_pointer(library, "unsigned char *", engine->null(), 0).empty());

    int bogus = 0;
    EXPECT_TRUE(engine->array_from_pointer(library, "KEY_LENGTHS",
                                           Pointer(&bogus, void_type()), 0).empty());
}

TEST_P(EngineTest, DerefAndUnwrapAgree) {
    int32_t value = 42;
    const Pointer typed = engine->cast(&library, "int *", Pointer(&value, void_type()));

    EXPECT_EQ(typed.address(), &value);
    EXPECT_EQ(std::get<std::int64_t>(engine->deref(typed)), 42);
    EXPECT_EQ(std::get<std::int64_t>(engine->unwrap(typed)), 42);
}

TEST_P(EngineTest, DoubleIndirection) {
    int32_t value = 5;
    int32_t* inner = &value;
    const Pointer outer = engine->cast(&library, "int **", Pointer(&inner, void_type()));

    const Value first = engine->deref(outer);
    ASSERT_TRUE(std::holds_alternative<Pointer>(first));
    EXPECT_EQ(std::get<Pointer>(first).address(), &value);
    EXPECT_EQ(std::get<std::int64_t>(engine->deref(std::get<Pointer>(first))), 5);
}

TEST_P(EngineTest, UnwrapStructContents) {
    Buffer instance = engine->make_struct(library, "KEY_LENGTHS");
    KeyLengths fields = {10, 20, 30};
    std::memcpy(instance.data(), &fields, sizeof(fields));

    const Value contents = engine->unwrap(instance.pointer());
    ASSERT_TRUE(std::holds_alternative<Bytes>(contents));
    EXPECT_EQ(std::get<Bytes>(contents), engine->struct_bytes(instance.pointer()));
    EXPECT_EQ(std::get<Bytes>(engine->deref(instance.pointer())), std::get<Bytes>(contents));
}

TEST_P(EngineTest, DerefNullPointerFails) {
    EXPECT_THROW(engine->deref(engine->null()), std::invalid_argument);
}

TEST_P(EngineTest, SizeOf) {
    EXPECT_EQ(engine->size_of(&library, "int"), sizeof(int));
    EXPECT_EQ(engine->size_of(&library, "size_t"), sizeof(std::size_t));
    EXPECT_EQ(engine->size_of(&library, "unsigned char *"), sizeof(void*));
    EXPECT_EQ(engine->size_of(&library, "KEY_LENGTHS"), sizeof(KeyLengths));
    EXPECT_EQ(engine->size_of(&library, "HANDLE"), sizeof(void*));
    EXPECT_EQ(engine->size_of(&library, "unsigned long int"), sizeof(unsigned long));
    EXPECT_EQ(engine->size_of(&library, "long long int *"), sizeof(void*));
}

TEST_P(EngineTest, NewValueInitialisesPointee) {
    Buffer value = engine->new_value(&library, "unsigned int *", Value(std::uint64_t{17}));
    EXPECT_EQ(value.size(), sizeof(unsigned int));
    EXPECT_EQ(std::get<std::uint64_t>(engine->deref(value.pointer())), 17u);

    Buffer lengths = engine->new_value(&library, "KEY_LENGTHS *", Value());
    EXPECT_EQ(engine->struct_bytes(lengths.pointer()), Bytes(sizeof(KeyLengths), 0));
}

TEST_P(EngineTest, ByteArray) {
    Buffer array = engine->byte_array({0x01, 0x02, 0xff});
    EXPECT_EQ(array.count(), 3u);
    EXPECT_EQ(array.element().size(), 1u);
    EXPECT_EQ(engine->bytes_from_buffer(array, std::nullopt), (Bytes{0x01, 0x02, 0xff}));
}

TEST_P(EngineTest, BytesFromRawPointer) {
    char text[] = "secret";
    const Pointer pointer(text, void_type());

    EXPECT_EQ(engine->bytes_from_pointer(pointer, std::nullopt), to_bytes("secret"));
    EXPECT_EQ(engine->bytes_from_pointer(pointer, 3), to_bytes("sec"));
    EXPECT_THROW(engine->bytes_from_pointer(engine->null(), 3), std::invalid_argument);
}

TEST_P(EngineTest, UnknownTypeIsUnresolved) {
    EXPECT_THROW(engine->resolve(&library, "NOT_DECLARED"), UnresolvedTypeError);
    EXPECT_THROW(engine->resolve(nullptr, "KEY_LENGTHS"), UnresolvedTypeError);
}

INSTANTIATE_TEST_SUITE_P(
    BothEngines,
    EngineTest,
    ::testing::Values(EngineKind::Declarative, EngineKind::Dynamic),
    [](const ::testing::TestParamInfo<EngineKind>& info) {
        return std::string(to_string(info.param));
    });

// ---------------------------------------------------------------------------
// Behaviour that differs between the engines
// ---------------------------------------------------------------------------

TEST(DynamicEngine, AtomicPointerTypes) {
    DynamicEngine engine;

    const NativeType text = engine.resolve(nullptr, "char *");
    EXPECT_TRUE(text.atomic_pointer);
    EXPECT_EQ(text.indirection, 1);

    const NativeType out_param = engine.resolve(nullptr, "char **");
    EXPECT_EQ(out_param.indirection, 2);
    EXPECT_EQ(out_param.base.name, "char");

    // A pointer slot, not a char.
    Buffer slot = engine.new_value(nullptr, "char *", Value());
    EXPECT_EQ(slot.size(), sizeof(char*));
}

TEST(DynamicEngine, ScalarsAllocateThemselves) {
    DynamicEngine engine;
    Buffer value = engine.new_value(nullptr, "int", Value(std::int64_t{-3}));
    EXPECT_EQ(value.size(), sizeof(int));
    EXPECT_EQ(std::get<std::int64_t>(engine.deref(value.pointer())), -3);
}

TEST(DynamicEngine, LibraryTypesAreTheFallback) {
    DynamicEngine engine;
    Library library("custom");
    library.dynamic_types().define("ALG_HANDLE", &ffi_type_pointer);

    const NativeType handle = engine.resolve(&library, "ALG_HANDLE *");
    EXPECT_EQ(handle.base.kind, ScalarKind::Pointer);
    EXPECT_EQ(handle.indirection, 1);

    // Built-in names win over library definitions.
    library.dynamic_types().define("int", &ffi_type_uint8);
    EXPECT_EQ(engine.resolve(&library, "int").size(), sizeof(int));
}

#if DUALFFI_WITH_DECLARATIVE
TEST(DeclarativeEngine, NewValueNeedsPointerType) {
    DeclarativeEngine engine;
    EXPECT_THROW(engine.new_value(nullptr, "int", Value()), std::invalid_argument);

    // "char *" allocates the char it points to.
    Buffer value = engine.new_value(nullptr, "char *", Value());
    EXPECT_EQ(value.size(), sizeof(char));
}

TEST(DeclarativeEngine, HandleTypesAllocateTheHandle) {
    DeclarativeEngine engine;
    Library library = dualffi_test::make_test_library();

    Buffer handle = engine.new_value(&library, "HANDLE", Value());
    EXPECT_EQ(handle.size(), sizeof(void*));
    EXPECT_TRUE(engine.is_null(handle.pointer()));
}

TEST(DeclarativeEngine, OnlyDeclaredTypesAreVisible) {
    DeclarativeEngine engine;
    Library library("dynamic-only");
    library.dynamic_types().define_struct("ONLY_DYNAMIC", {&ffi_type_uint32});

    EXPECT_THROW(engine.make_struct(library, "ONLY_DYNAMIC"), UnresolvedTypeError);
    EXPECT_EQ(engine.resolve(nullptr, "char **").indirection, 2);
    EXPECT_FALSE(engine.resolve(nullptr, "char *").atomic_pointer);
}
#endif
