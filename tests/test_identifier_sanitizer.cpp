#include <gtest/gtest.h>
#include "IdentifierSanitizer.hpp"

using namespace tablemap;

class IdentifierSanitizerTest : public ::testing::Test {
};

TEST_F(IdentifierSanitizerTest, PlainNameUnchanged) {
    EXPECT_EQ(sanitizeIdentifier("name"), "name");
    EXPECT_EQ(sanitizeIdentifier("author_id"), "author_id");
}

TEST_F(IdentifierSanitizerTest, RemovesWildcardRuns) {
    EXPECT_EQ(sanitizeIdentifier("*col*"), "col");
    EXPECT_EQ(sanitizeIdentifier("***col"), "col");
    EXPECT_EQ(sanitizeIdentifier("co**l"), "col");
}

TEST_F(IdentifierSanitizerTest, TrimsWhitespace) {
    EXPECT_EQ(sanitizeIdentifier("  name\t"), "name");
    EXPECT_EQ(sanitizeIdentifier("\n name \r\n"), "name");
}

TEST_F(IdentifierSanitizerTest, TrimsAfterWildcardRemoval) {
    EXPECT_EQ(sanitizeIdentifier(" * name * "), "name");
}

TEST_F(IdentifierSanitizerTest, TrimsNulBytes) {
    // Protected-member markers look like "\0*\0name"
    std::string marked("\0*\0name", 7);
    EXPECT_EQ(sanitizeIdentifier(marked), "name");
}

TEST_F(IdentifierSanitizerTest, EscapesOneThird) {
    EXPECT_EQ(sanitizeIdentifier("a\xE2\x85\x93"), "a\\\xE2\x85\x93");
}

TEST_F(IdentifierSanitizerTest, LeavesEscapedOneThirdAlone) {
    EXPECT_EQ(sanitizeIdentifier("a\\\xE2\x85\x93"), "a\\\xE2\x85\x93");
}

TEST_F(IdentifierSanitizerTest, EmptyAndWildcardOnly) {
    EXPECT_EQ(sanitizeIdentifier(""), "");
    EXPECT_EQ(sanitizeIdentifier("***"), "");
    EXPECT_EQ(sanitizeIdentifier("   "), "");
}

TEST_F(IdentifierSanitizerTest, Idempotent) {
    const std::vector<std::string> inputs = {
        "name", "*col*", "  spaced  ", "x\xE2\x85\x93y", " *\xE2\x85\x93* ",
        std::string("\0*\0id", 5), "a\\\xE2\x85\x93", "",
    };

    for (const auto& input : inputs) {
        std::string once = sanitizeIdentifier(input);
        EXPECT_EQ(sanitizeIdentifier(once), once) << "input: " << input;
    }
}
