#pragma once
#include "../../include/session/id_generator.h"
#include <gtest/gtest.h>
#include <unordered_set>

namespace zstore::zsession
{
    TEST(IdGeneratorTest, LengthAndAlphabet)
    {
        SecureIdGenerator generator(32);
        const auto session_id = generator.generate();
        EXPECT_EQ(session_id.size(), 64u);
        EXPECT_EQ(session_id.find_first_not_of("0123456789abcdef"), std::string::npos);
        EXPECT_TRUE(generator.is_well_formed(session_id));
    }

    TEST(IdGeneratorTest, NoDuplicatesOverManyDraws)
    {
        SecureIdGenerator generator;
        std::unordered_set<std::string> seen;
        for (int i = 0; i < 10000; ++i)
        {
            EXPECT_TRUE(seen.insert(generator.generate()).second);
        }
        EXPECT_EQ(seen.size(), 10000u);
    }

    TEST(IdGeneratorTest, ConsecutiveIdsShareNoPrefix)
    {
        SecureIdGenerator generator(16);
        const auto first = generator.generate();
        const auto second = generator.generate();
        EXPECT_NE(first.substr(0, 16), second.substr(0, 16));
    }

    TEST(IdGeneratorTest, RejectsMalformedTokens)
    {
        SecureIdGenerator generator(16);
        EXPECT_FALSE(generator.is_well_formed(""));
        EXPECT_FALSE(generator.is_well_formed("abc"));
        EXPECT_FALSE(generator.is_well_formed(std::string(32, 'g')));
        EXPECT_FALSE(generator.is_well_formed(std::string(32, 'A')));
        EXPECT_FALSE(generator.is_well_formed(std::string(31, 'a') + ";"));
        EXPECT_FALSE(generator.is_well_formed(std::string(64, 'a')));
        EXPECT_TRUE(generator.is_well_formed(std::string(32, 'a')));
    }

    TEST(IdGeneratorTest, TooFewBytesIsRejected)
    {
        EXPECT_THROW(SecureIdGenerator(8), std::invalid_argument);
        EXPECT_EQ(SecureIdGenerator(24).get_id_length(), 48u);
    }
} // namespace zstore::zsession
