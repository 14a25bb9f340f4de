/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

using namespace BabelBridge;

TEST(Params, Defaults)
{
	TempDir tmp;
	Params params;
	ASSERT_EQ(BB_OK, InitParams(params, tmp.path(), {}));
	EXPECT_EQ(21u, params.langs.size());
	EXPECT_EQ(ResourceTier::Limited, params.tier);
	EXPECT_EQ(std::vector<int>({ 5000, 10000, 20000 }), params.subset_sizes);
	EXPECT_EQ(tmp.path() / "data" / "train", params.pth_train);
	EXPECT_EQ(tmp.path() / "data" / "101" / "data" / "train_101", params.ItemPrefixedTrainDir("101"));
	EXPECT_EQ("data/train_sub2", params.StepId(params.SubsetDir(2)));
	EXPECT_EQ("exp/.stages", params.StepId(params.pth_stage_markers));
}

TEST(Params, OptionsAndConfigFile)
{
	TempDir tmp;
	WriteFile(tmp.path() / "babel.conf", "--langs=201 202\n--tier=full\n--train-nj=16\n");
	Params params;
	ASSERT_EQ(BB_OK, InitParams(params, tmp.path(), { "--config=" + (tmp.path() / "babel.conf").string(), "--boost-sil=1.25" }));
	EXPECT_EQ(string_vec({ "201", "202" }), params.langs);
	EXPECT_EQ(ResourceTier::Full, params.tier);
	EXPECT_EQ(params.full_conf_patterns, params.TierPatterns());
	EXPECT_EQ(16, params.train_nj);
	EXPECT_DOUBLE_EQ(1.25, params.boost_sil);

	string_vec o = params.GetOptions();
	EXPECT_NE(o.end(), std::find(o.begin(), o.end(), "--langs=201 202"));
	EXPECT_NE(o.end(), std::find(o.begin(), o.end(), "--boost-sil=1.25"));
}

TEST(Params, InvalidOptions)
{
	TempDir tmp;
	const std::vector<string_vec> invalid = {
		{ "--langs=101 101" },
		{ "--langs=" },
		{ "--langs=10_1" },
		{ "--tier=medium" },
		{ "--subset-sizes=100 50 200" },
		{ "--subset-sizes=10 20" },
		{ "--num-workers=0" },
		{ "--train-nj=-1" },
		{ "--id-delimiter=" }
	};
	for (const string_vec & options : invalid) {
		Params params;
		EXPECT_EQ(BB_CONFIGURATION_ERROR, InitParams(params, tmp.path(), options)) << options[0];
	}
	Params params;
	EXPECT_EQ(BB_CONFIGURATION_ERROR, InitParams(params, tmp.path() / "missing", {}));
	EXPECT_EQ(BB_CONFIGURATION_ERROR, params.Read({ "positional" }));
}
