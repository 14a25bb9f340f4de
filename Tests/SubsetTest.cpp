/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

//ten utterances u0..u9 of speakers s0..s4 (two each) in recordings r0..r4
static void WriteTrainDir(fs::path train)
{
	std::string utt2spk, text, segments, wav, spk2gender;
	for (int i = 0; i < 10; i++) {
		std::string u("u" + std::to_string(i)), s("s" + std::to_string(i / 2)), r("r" + std::to_string(i / 2));
		utt2spk += u + " " + s + "\n";
		text += u + " word" + std::to_string(i) + "\n";
		segments += u + " " + r + " " + std::to_string(i % 2) + ".0 " + std::to_string(i % 2 + 1) + ".0\n";
	}
	for (int i = 0; i < 5; i++) {
		wav += "r" + std::to_string(i) + " audio/r" + std::to_string(i) + ".sph\n";
		spk2gender += "s" + std::to_string(i) + " f\n";
	}
	WriteFile(train / "utt2spk", utt2spk);
	WriteFile(train / "text", text);
	WriteFile(train / "segments", segments);
	WriteFile(train / "wav.scp", wav);
	WriteFile(train / "spk2gender", spk2gender);
}

class SubsetDataDirTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		train = tmp.path() / "train";
		WriteTrainDir(train);
	}

	TempDir tmp;
	fs::path train;
};

TEST_F(SubsetDataDirTest, EvenlySpacedSelection)
{
	fs::path sub(tmp.path() / "train_sub1");
	bool bAlias = true;
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 4, sub, &bAlias));
	EXPECT_FALSE(bAlias);
	EXPECT_FALSE(fs::is_symlink(sub));
	//positions floor(i*10/4): 0 2 5 7
	EXPECT_EQ(string_vec({ "u0 s0", "u2 s1", "u5 s2", "u7 s3" }), ReadNonEmptyLines(sub / "utt2spk"));
	EXPECT_EQ(string_vec({ "u0 word0", "u2 word2", "u5 word5", "u7 word7" }), ReadNonEmptyLines(sub / "text"));
	EXPECT_EQ(string_vec({ "s0 u0", "s1 u2", "s2 u5", "s3 u7" }), ReadNonEmptyLines(sub / "spk2utt"));
}

TEST_F(SubsetDataDirTest, SpeakerAndRecordingFilesFollowTheUtterances)
{
	fs::path sub(tmp.path() / "train_sub1");
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 2, sub));
	//positions 0 and 5
	EXPECT_EQ(string_vec({ "s0 f", "s2 f" }), ReadNonEmptyLines(sub / "spk2gender"));
	EXPECT_EQ(string_vec({ "r0 audio/r0.sph", "r2 audio/r2.sph" }), ReadNonEmptyLines(sub / "wav.scp"));
	EXPECT_EQ(2u, ReadNonEmptyLines(sub / "segments").size());
}

TEST_F(SubsetDataDirTest, SameSourceGivesTheSameSubset)
{
	fs::path sub1(tmp.path() / "train_a"), sub2(tmp.path() / "train_b");
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 3, sub1));
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 3, sub2));
	EXPECT_EQ(ReadFile(sub1 / "utt2spk"), ReadFile(sub2 / "utt2spk"));
	//and again into the same directory
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 3, sub1));
	EXPECT_EQ(ReadFile(sub1 / "utt2spk"), ReadFile(sub2 / "utt2spk"));
}

TEST_F(SubsetDataDirTest, SmallSourceBecomesAnAlias)
{
	fs::path sub(tmp.path() / "train_sub3");
	bool bAlias = false;
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 10, sub, &bAlias));
	EXPECT_TRUE(bAlias);
	EXPECT_TRUE(fs::is_symlink(sub));
	EXPECT_EQ(fs::path("train"), fs::read_symlink(sub));
	EXPECT_EQ(ReadFile(train / "utt2spk"), ReadFile(sub / "utt2spk"));

	//a later subset replaces the link and leaves the source alone
	ASSERT_EQ(BB_OK, SubsetDataDir(train, 5, sub, &bAlias));
	EXPECT_FALSE(bAlias);
	EXPECT_FALSE(fs::is_symlink(sub));
	EXPECT_EQ(5u, ReadNonEmptyLines(sub / "utt2spk").size());
	EXPECT_EQ(10u, ReadNonEmptyLines(train / "utt2spk").size());
}

TEST_F(SubsetDataDirTest, InvalidRequests)
{
	EXPECT_EQ(BB_CONFIGURATION_ERROR, SubsetDataDir(train, 0, tmp.path() / "x"));
	EXPECT_EQ(BB_STATE_ERROR, SubsetDataDir(tmp.path() / "none", 3, tmp.path() / "x"));
}
