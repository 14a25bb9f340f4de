/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

using namespace BabelBridge;

static ConfigMatcher DefaultMatcher()
{
	return ConfigMatcher({ "{id}-*limitedLP*.conf", "{id}-*LLP*.conf" }, { "{id}-*fullLP*.conf", "{id}-*FLP*.conf" });
}

TEST(ConfigMatcher, RuleToRegex)
{
	EXPECT_EQ("^101-.*limitedLP.*\\.conf$", ConfigRuleToRegex("{id}-*limitedLP*.conf", "101"));
	EXPECT_EQ("^a.b$", ConfigRuleToRegex("a?b", "x"));
}

TEST(ConfigMatcher, FirstRuleWins)
{
	ConfigMatcher m = DefaultMatcher();
	std::vector<fs::path> candidates = {
		"conf/lang/101-cantonese-LLP.conf",
		"conf/lang/101-cantonese-limitedLP.official.conf",
		"conf/lang/101-cantonese-fullLP.official.conf"
	};
	fs::path result;
	ASSERT_EQ(BB_OK, m.Match("101", ResourceTier::Limited, candidates, result));
	EXPECT_EQ(fs::path("conf/lang/101-cantonese-limitedLP.official.conf"), result);

	ASSERT_EQ(BB_OK, m.Match("101", ResourceTier::Full, candidates, result));
	EXPECT_EQ(fs::path("conf/lang/101-cantonese-fullLP.official.conf"), result);
}

TEST(ConfigMatcher, LowerRankedRule)
{
	ConfigMatcher m = DefaultMatcher();
	std::vector<fs::path> candidates = { "conf/lang/202-swahili-LLP.conf", "conf/lang/202-swahili-FLP.conf" };
	fs::path result;
	ASSERT_EQ(BB_OK, m.Match("202", ResourceTier::Limited, candidates, result));
	EXPECT_EQ(fs::path("conf/lang/202-swahili-LLP.conf"), result);
}

TEST(ConfigMatcher, DeterministicAmongCandidates)
{
	ConfigMatcher m = DefaultMatcher();
	std::vector<fs::path> a = { "conf/lang/b/103-bengali-limitedLP.conf", "conf/lang/a/103-bengali-limitedLP.conf" };
	std::vector<fs::path> b = { a[1], a[0] };
	fs::path ra, rb;
	ASSERT_EQ(BB_OK, m.Match("103", ResourceTier::Limited, a, ra));
	ASSERT_EQ(BB_OK, m.Match("103", ResourceTier::Limited, b, rb));
	EXPECT_EQ(ra, rb);
	EXPECT_EQ(fs::path("conf/lang/a/103-bengali-limitedLP.conf"), ra);
}

TEST(ConfigMatcher, ItemIdIsMatchedExactly)
{
	ConfigMatcher m = DefaultMatcher();
	std::vector<fs::path> candidates = { "conf/lang/1010-x-limitedLP.conf", "conf/lang/x101-limitedLP.conf" };
	fs::path result;
	EXPECT_EQ(BB_CONFIGURATION_ERROR, m.Match("101", ResourceTier::Limited, candidates, result));
}

TEST(ConfigMatcher, NoMatchIsConfigurationError)
{
	ConfigMatcher m = DefaultMatcher();
	fs::path result;
	EXPECT_EQ(BB_CONFIGURATION_ERROR, m.Match("104", ResourceTier::Limited, {}, result));
	EXPECT_EQ(BB_CONFIGURATION_ERROR, m.Match("104", ResourceTier::Full, { "conf/lang/104-pashto-limitedLP.conf" }, result));
}

TEST(ConfigMatcher, ResolveFromConfigurationDirectory)
{
	TempDir tmp;
	CreateRecipeDir(tmp.path(), { "101", "102" });
	WriteFile(tmp.path() / "conf" / "lang" / "old" / "102-zulu-LLP.conf", "");
	Params params;
	ASSERT_EQ(BB_OK, InitParams(params, tmp.path(), { "--langs=101 102" }));

	fs::path result;
	ASSERT_EQ(BB_OK, ResolveItemConfig(params, "102", result));
	EXPECT_EQ("102-test-limitedLP.official.conf", result.filename().string());
	EXPECT_EQ(BB_CONFIGURATION_ERROR, ResolveItemConfig(params, "103", result));
}
