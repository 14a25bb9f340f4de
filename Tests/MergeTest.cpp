/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

using ItemDirs = std::vector<std::pair<std::string, fs::path>>;

class CombineDataTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		a = tmp.path() / "train_102";
		b = tmp.path() / "train_101";
		WriteFile(a / "utt2spk", "102_s1-2 102_s1\n102_s1-1 102_s1\n");
		WriteFile(a / "text", "102_s1-2 two\n102_s1-1 one\n");
		WriteFile(a / "segments", "102_s1-2 102_r1 1.0 2.0\n102_s1-1 102_r1 0.0 1.0\n");
		WriteFile(a / "wav.scp", "102_r1 r1.sph\n");
		WriteFile(a / "cmvn.scp", "102_s1 cmvn.ark:1\n");
		WriteFile(b / "utt2spk", "101_s1-1 101_s1\n");
		WriteFile(b / "text", "101_s1-1 three\n");
		WriteFile(b / "segments", "101_s1-1 101_r1 0.0 1.0\n");
		WriteFile(b / "wav.scp", "101_r1 r1.sph\n");
		dest = tmp.path() / "train";
	}

	TempDir tmp;
	fs::path a, b, dest;
};

TEST_F(CombineDataTest, MergesAndSorts)
{
	ASSERT_EQ(BB_OK, CombineDataDirs(dest, ItemDirs{ { "102", a }, { "101", b } }));
	EXPECT_EQ(string_vec({ "101_s1-1 101_s1", "102_s1-1 102_s1", "102_s1-2 102_s1" }), ReadNonEmptyLines(dest / "utt2spk"));
	EXPECT_EQ(string_vec({ "101_s1-1 three", "102_s1-1 one", "102_s1-2 two" }), ReadNonEmptyLines(dest / "text"));
	EXPECT_EQ(string_vec({ "101_r1 r1.sph", "102_r1 r1.sph" }), ReadNonEmptyLines(dest / "wav.scp"));
	EXPECT_EQ(string_vec({ "101_s1 101_s1-1", "102_s1 102_s1-1 102_s1-2" }), ReadNonEmptyLines(dest / "spk2utt"));
	EXPECT_EQ(string_vec({ "101_s1-1 101", "102_s1-1 102", "102_s1-2 102" }), ReadNonEmptyLines(dest / "utt2lang"));
}

TEST_F(CombineDataTest, FileMissingFromSomeSourcesIsLeftOut)
{
	ASSERT_EQ(BB_OK, CombineDataDirs(dest, ItemDirs{ { "102", a }, { "101", b } }));
	EXPECT_FALSE(fs::exists(dest / "cmvn.scp"));
	EXPECT_TRUE(fs::exists(dest / "segments"));
}

TEST_F(CombineDataTest, SameIdInTwoItemsIsDataError)
{
	WriteFile(b / "utt2spk", "102_s1-1 101_s1\n");
	EXPECT_EQ(BB_DATA_ERROR, CombineDataDirs(dest, ItemDirs{ { "102", a }, { "101", b } }));
}

TEST_F(CombineDataTest, MissingUtt2spkIsStateError)
{
	fs::remove(b / "utt2spk");
	EXPECT_EQ(BB_STATE_ERROR, CombineDataDirs(dest, ItemDirs{ { "102", a }, { "101", b } }));
}

//an item dictionary as PrepareUniversalLexicon leaves it
static void WriteItemDict(fs::path dict, const std::string & nonsilence)
{
	WriteFile(dict / "silence_lexicon.txt", "<silence>\tSIL\n<unk>\t<oov>\n<noise>\t<sss>\n<v-noise>\t<vns>\n");
	WriteFile(dict / "nonsilence_lexicon.txt", nonsilence);
}

TEST(CombineLexicons, UnionKeepsAllPronunciations)
{
	TempDir tmp;
	WriteItemDict(tmp.path() / "101", "hello\th e l o\nma\tm a_1\n");
	WriteItemDict(tmp.path() / "102", "hello\th e l o\nma\tm a_3\nworld\tw o r l d\n");
	fs::path dest(tmp.path() / "dict_universal");
	ASSERT_EQ(BB_OK, CombineLexicons(dest, ItemDirs{ { "101", tmp.path() / "101" }, { "102", tmp.path() / "102" } }));

	EXPECT_EQ(string_vec({ "hello\th e l o", "ma\tm a_1", "ma\tm a_3", "world\tw o r l d" }),
		ReadNonEmptyLines(dest / "nonsilence_lexicon.txt"));
	EXPECT_EQ(string_vec({ "ma\t101: m a_1 | 102: m a_3" }), ReadNonEmptyLines(dest / "pron_conflicts.txt"));
	EXPECT_EQ(8u, ReadNonEmptyLines(dest / "lexicon.txt").size());
	EXPECT_TRUE(fs::exists(dest / "nonsilence_phones.txt"));
	EXPECT_TRUE(fs::exists(dest / "extra_questions.txt"));
}

TEST(CombineLexicons, VariantsOfOneItemAreNoConflict)
{
	TempDir tmp;
	WriteItemDict(tmp.path() / "101", "ma\tm a_1\nma\tm a_3\n");
	WriteItemDict(tmp.path() / "102", "hello\th e l o\n");
	fs::path dest(tmp.path() / "dict_universal");
	ASSERT_EQ(BB_OK, CombineLexicons(dest, ItemDirs{ { "101", tmp.path() / "101" }, { "102", tmp.path() / "102" } }));
	EXPECT_TRUE(ReadNonEmptyLines(dest / "pron_conflicts.txt").empty());
}

TEST(CombineLexicons, DifferentSilenceLexiconIsDataError)
{
	TempDir tmp;
	WriteItemDict(tmp.path() / "101", "hello\th e l o\n");
	WriteItemDict(tmp.path() / "102", "hello\th e l o\n");
	WriteFile(tmp.path() / "102" / "silence_lexicon.txt", "<silence>\tSIL\n<unk>\tSPN\n");
	EXPECT_EQ(BB_DATA_ERROR, CombineLexicons(tmp.path() / "dict_universal",
		ItemDirs{ { "101", tmp.path() / "101" }, { "102", tmp.path() / "102" } }));
}

TEST(CombineLexicons, IncompleteItemDictionaryIsStateError)
{
	TempDir tmp;
	WriteItemDict(tmp.path() / "101", "hello\th e l o\n");
	fs::create_directories(tmp.path() / "102");
	EXPECT_EQ(BB_STATE_ERROR, CombineLexicons(tmp.path() / "dict_universal",
		ItemDirs{ { "101", tmp.path() / "101" }, { "102", tmp.path() / "102" } }));
}
