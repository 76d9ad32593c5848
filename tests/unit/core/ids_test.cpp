#include <gtest/gtest.h>
#include <vigil/core/ids.h>

#include <set>

using namespace vigil::core;

TEST(Ids, IssueKeyEscapesSeparators) {
    IssueKey key{"src|a", "100%|b", 10};
    auto encoded = encodeIssueKey(key);
    EXPECT_EQ(encoded, "src%7Ca|100%25%7Cb|10");

    auto decoded = decodeIssueKey(encoded);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded.value(), key);
}

TEST(Ids, RejectsMalformedIssueKeys) {
    EXPECT_FALSE(decodeIssueKey("only|two"));
    EXPECT_FALSE(decodeIssueKey("a|b|notanumber"));
    EXPECT_FALSE(decodeIssueKey("a|b|1|extra"));
    EXPECT_FALSE(decodeIssueKey("a%2|b|1"));
    EXPECT_FALSE(decodeIssueKey("|b|1"));
}

TEST(Ids, EntryIdCarriesUser) {
    EXPECT_EQ(encodeEntryId(SourceKey{"wifi", 11}), "wifi|11");
    EXPECT_NE(encodeEntryId(SourceKey{"wifi", 11}), encodeEntryId(SourceKey{"wifi", 10}));
    EXPECT_EQ(encodeEntryId(SourceKey{"a|b", 0}), "a%7Cb|0");
}

TEST(Ids, ActionIdAppendsEscapedActionToIssueKey) {
    IssueActionId id{IssueKey{"src", "issue", 0}, "act|1"};
    EXPECT_EQ(encodeIssueActionId(id), "src|issue|0|act%7C1");
}

TEST(Ids, GeneratedUuidsAreVersion4AndUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
        auto uuid = generateUUID();
        ASSERT_EQ(uuid.size(), 36u);
        EXPECT_EQ(uuid[14], '4');
        seen.insert(uuid);
    }
    EXPECT_EQ(seen.size(), 32u);
}
