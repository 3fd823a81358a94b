#include <gtest/gtest.h>
#include "util/redact.hpp"

using namespace kvs::util;

TEST(RedactTest, MasksNonEmptyValues) {
    EXPECT_EQ(redact("My_Pass_Sec"), REDACTED);
    EXPECT_EQ(redact(""), "");
}

TEST(RedactTest, ScrubReplacesEveryOccurrence) {
    const auto out = scrub("value=hunter2; again hunter2", {"hunter2"});
    EXPECT_EQ(out, std::string("value=") + REDACTED + "; again " + REDACTED);
}

TEST(RedactTest, ScrubMasksLongestSecretWhole) {
    const auto out = scrub("token abc123xyz", {"abc", "abc123xyz"});
    EXPECT_EQ(out, std::string("token ") + REDACTED);
    EXPECT_EQ(out.find("xyz"), std::string::npos);
}

TEST(RedactTest, ScrubIgnoresEmptySecrets) {
    EXPECT_EQ(scrub("nothing to hide", {"", ""}), "nothing to hide");
}
