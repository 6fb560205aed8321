/**
 * @file test_type_spec.cpp
 * @brief Unit tests for type descriptor parsing.
 */

#include "dualffi/type_spec.h"
#include <gtest/gtest.h>
#include <stdexcept>

using dualffi::TypeSpec;

TEST(TypeSpec, PlainScalar) {
    const TypeSpec spec = TypeSpec::parse("unsigned int");
    EXPECT_EQ(spec.base, "unsigned int");
    EXPECT_EQ(spec.indirection, 0);
    EXPECT_FALSE(spec.atomic);
}

TEST(TypeSpec, SingleAndDoublePointer) {
    const TypeSpec single = TypeSpec::parse("unsigned char *");
    EXPECT_EQ(single.base, "unsigned char");
    EXPECT_EQ(single.indirection, 1);

    const TypeSpec twice = TypeSpec::parse("unsigned char **");
    EXPECT_EQ(twice.base, "unsigned char");
    EXPECT_EQ(twice.indirection, 2);
}

TEST(TypeSpec, AtomicPointerIsNotAnIndirection) {
    const TypeSpec spec = TypeSpec::parse("char *");
    EXPECT_EQ(spec.base, "char *");
    EXPECT_EQ(spec.indirection, 0);
    EXPECT_TRUE(spec.atomic);

    const TypeSpec out_param = TypeSpec::parse("char **");
    EXPECT_EQ(out_param.base, "char *");
    EXPECT_EQ(out_param.indirection, 1);
    EXPECT_TRUE(out_param.atomic);

    EXPECT_TRUE(TypeSpec::parse("void *").atomic);
    EXPECT_TRUE(TypeSpec::parse("wchar_t *").atomic);
}

TEST(TypeSpec, NormalizesSpacing) {
    const TypeSpec spec = TypeSpec::parse("  unsigned   char*  ");
    EXPECT_EQ(spec.base, "unsigned char");
    EXPECT_EQ(spec.indirection, 1);

    EXPECT_EQ(TypeSpec::parse("void*").base, "void *");
    EXPECT_EQ(TypeSpec::parse("char * *").to_string(), "char **");
}

TEST(TypeSpec, CanonicalText) {
    EXPECT_EQ(TypeSpec::parse("int").to_string(), "int");
    EXPECT_EQ(TypeSpec::parse("int*").to_string(), "int *");
    EXPECT_EQ(TypeSpec::parse("int **").to_string(), "int **");
    EXPECT_EQ(TypeSpec::parse("wchar_t *").to_string(), "wchar_t *");
}

TEST(TypeSpec, RejectsMalformedTypes) {
    EXPECT_THROW(TypeSpec::parse(""), std::invalid_argument);
    EXPECT_THROW(TypeSpec::parse("*"), std::invalid_argument);
    EXPECT_THROW(TypeSpec::parse("int * const"), std::invalid_argument);
    EXPECT_THROW(TypeSpec::parse("int ***"), std::invalid_argument);
}

TEST(TypeSpec, StringPointerTypes) {
    EXPECT_TRUE(dualffi::is_string_pointer_type("char *"));
    EXPECT_TRUE(dualffi::is_string_pointer_type("unsigned char *"));
    EXPECT_TRUE(dualffi::is_string_pointer_type("wchar_t*"));
    EXPECT_FALSE(dualffi::is_string_pointer_type("unsigned char"));
    EXPECT_FALSE(dualffi::is_string_pointer_type("int *"));
    EXPECT_FALSE(dualffi::is_string_pointer_type("char **"));

#ifdef _WIN32
    EXPECT_TRUE(dualffi::is_string_pointer_type("LPCWSTR"));
#else
    EXPECT_FALSE(dualffi::is_string_pointer_type("LPSTR"));
#endif
}

TEST(TypeSpec, WideStringTypes) {
    EXPECT_TRUE(dualffi::is_wide_string_type("wchar_t *"));
    EXPECT_FALSE(dualffi::is_wide_string_type("char *"));
    EXPECT_FALSE(dualffi::is_wide_string_type("wchar_t"));
}
