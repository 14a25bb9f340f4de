/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

static string_vec Standardize(const string_vec & pron, const PhoneRules & rules, int expected = BB_OK)
{
	string_vec phones;
	std::string error;
	EXPECT_EQ(expected, StandardizePronunciation(pron, rules, phones, error)) << error;
	return phones;
}

TEST(PhoneNames, BaseAndTags)
{
	EXPECT_EQ("a", PhoneBase("a_T3_L"));
	EXPECT_EQ("a", PhoneBase("a"));
	EXPECT_EQ(string_vec({ "T3", "L" }), PhoneTags("a_T3_L"));
	EXPECT_TRUE(PhoneTags("a").empty());
}

TEST(StandardizePronunciation, PlainPhonesAreKept)
{
	PhoneRules rules;
	EXPECT_EQ(string_vec({ "h", "e", "l", "o" }), Standardize({ "h", "e", "l", "o" }, rules));
}

TEST(StandardizePronunciation, StandaloneTagAppliesToTheSyllable)
{
	PhoneRules rules;
	rules.tones["3"] = "T3";
	EXPECT_EQ(string_vec({ "n", "i", "h_T3", "a_T3", "o_T3" }),
		Standardize({ "n", "i", ".", "h", "a", "o", "_3" }, rules));
	//'#' is a boundary too
	EXPECT_EQ(string_vec({ "n_T3", "i_T3", "h" }), Standardize({ "n", "i", "_3", "#", "h" }, rules));
}

TEST(StandardizePronunciation, DiphthongPartsInheritTags)
{
	PhoneRules rules;
	rules.diphthongs["ai"] = { "a", "i" };
	rules.tones["2"] = "T2";
	EXPECT_EQ(string_vec({ "m", "a_T2", "i_T2" }), Standardize({ "m", "ai_2" }, rules));
	EXPECT_EQ(string_vec({ "a_T2", "i_T2" }), Standardize({ "ai", "_2" }, rules));
}

TEST(StandardizePronunciation, TagWithoutRuleIsKept)
{
	PhoneRules rules;
	rules.tones["1"] = "T1";
	EXPECT_EQ(string_vec({ "e_X", "a_T1" }), Standardize({ "e_X", "a_1" }, rules));
}

TEST(StandardizePronunciation, TagIsAddedOnce)
{
	PhoneRules rules;
	EXPECT_EQ(string_vec({ "a_1" }), Standardize({ "a_1", "_1" }, rules));
}

TEST(StandardizePronunciation, MalformedPronunciations)
{
	PhoneRules rules;
	Standardize({ "_3", "a" }, rules, BB_DATA_ERROR);
	Standardize({ "a", ".", "_3" }, rules, BB_DATA_ERROR);
	Standardize({ "a__3" }, rules, BB_DATA_ERROR);
	Standardize({ "a", "_" }, rules, BB_DATA_ERROR);
	Standardize({ ".", "#" }, rules, BB_DATA_ERROR);
}

TEST(PhoneRules, ReadTables)
{
	TempDir tmp;
	WriteFile(tmp.path() / "diphthongs", "ai a i\nau a u\n");
	WriteFile(tmp.path() / "tones", "_1 _T1\n2 T2\n");
	PhoneRules rules;
	ASSERT_EQ(BB_OK, ReadPhoneRules(tmp.path() / "diphthongs", tmp.path() / "tones", rules));
	EXPECT_EQ(2u, rules.diphthongs.size());
	EXPECT_EQ(string_vec({ "a", "u" }), rules.diphthongs["au"]);
	EXPECT_EQ("T1", rules.tones["1"]);
	EXPECT_EQ("T2", rules.tones["2"]);
}

TEST(PhoneRules, MissingTablesMeanNoRules)
{
	TempDir tmp;
	PhoneRules rules;
	ASSERT_EQ(BB_OK, ReadPhoneRules(tmp.path() / "none1", tmp.path() / "none2", rules));
	EXPECT_TRUE(rules.diphthongs.empty());
	EXPECT_TRUE(rules.tones.empty());
}

TEST(PhoneRules, InvalidRules)
{
	TempDir tmp;
	PhoneRules rules;
	WriteFile(tmp.path() / "diphthongs", "ai\n");
	EXPECT_EQ(BB_DATA_ERROR, ReadPhoneRules(tmp.path() / "diphthongs", fs::path(), rules));
	WriteFile(tmp.path() / "tones", "1 T1 extra\n");
	EXPECT_EQ(BB_DATA_ERROR, ReadPhoneRules(fs::path(), tmp.path() / "tones", rules));
}

class UniversalLexiconTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		raw = tmp.path() / "lexicon.txt";
		dict = tmp.path() / "dict_universal";
		WriteFile(raw,
			"hello\th e l o\n"
			"world\tw o r l d\n"
			"<silence>\tSIL\n"
			"<unk>\t<oov>\n"
			"ma\tm a_1\n"
			"ma\tm a_3\n");
	}

	TempDir tmp;
	fs::path raw, dict;
};

TEST_F(UniversalLexiconTest, WritesTheDictionary)
{
	PhoneRules rules;
	ASSERT_EQ(BB_OK, PrepareUniversalLexicon(raw, dict, rules));

	EXPECT_EQ(string_vec({ "<silence>\tSIL", "<unk>\t<oov>", "<noise>\t<sss>", "<v-noise>\t<vns>" }),
		ReadNonEmptyLines(dict / "silence_lexicon.txt"));
	EXPECT_EQ(string_vec({ "hello\th e l o", "ma\tm a_1", "ma\tm a_3", "world\tw o r l d" }),
		ReadNonEmptyLines(dict / "nonsilence_lexicon.txt"));
	EXPECT_EQ(8u, ReadNonEmptyLines(dict / "lexicon.txt").size());

	EXPECT_EQ(string_vec({ "SIL", "<oov>", "<sss>", "<vns>" }), ReadNonEmptyLines(dict / "silence_phones.txt"));
	EXPECT_EQ(string_vec({ "SIL" }), ReadNonEmptyLines(dict / "optional_silence.txt"));
	EXPECT_EQ(string_vec({ "a_1 a_3", "d", "e", "h", "l", "m", "o", "r", "w" }),
		ReadNonEmptyLines(dict / "nonsilence_phones.txt"));
	EXPECT_EQ(string_vec({ "SIL <oov> <sss> <vns>", "d e h l m o r w", "a_1", "a_3" }),
		ReadNonEmptyLines(dict / "extra_questions.txt"));
}

TEST_F(UniversalLexiconTest, AppliesTheRules)
{
	PhoneRules rules;
	rules.tones["1"] = "T1";
	rules.tones["3"] = "T1";
	ASSERT_EQ(BB_OK, PrepareUniversalLexicon(raw, dict, rules));
	//both tones map to the same tag so the two pronunciations of 'ma' become one
	EXPECT_EQ(string_vec({ "hello\th e l o", "ma\tm a_T1", "world\tw o r l d" }),
		ReadNonEmptyLines(dict / "nonsilence_lexicon.txt"));
}

TEST_F(UniversalLexiconTest, MalformedEntryIsDataError)
{
	WriteFile(raw, "hello\th e l o\nbroken\n");
	PhoneRules rules;
	EXPECT_EQ(BB_DATA_ERROR, PrepareUniversalLexicon(raw, dict, rules));
	EXPECT_FALSE(fs::exists(dict / "lexicon.txt"));

	WriteFile(raw, "hello\th e l o\nbad\t_1 a\n");
	EXPECT_EQ(BB_DATA_ERROR, PrepareUniversalLexicon(raw, dict, rules));
}

TEST_F(UniversalLexiconTest, MissingLexiconIsStateError)
{
	PhoneRules rules;
	EXPECT_EQ(BB_STATE_ERROR, PrepareUniversalLexicon(tmp.path() / "missing.txt", dict, rules));
}

TEST_F(UniversalLexiconTest, ValidatedDictionaryIsAccepted)
{
	PhoneRules rules;
	ASSERT_EQ(BB_OK, PrepareUniversalLexicon(raw, dict, rules));
	EXPECT_EQ(BB_OK, ValidateDict(dict));
	//a phone of the lexicon which is not in the phone sets
	WriteFile(dict / "lexicon.txt", "hello\th e l o x\n<silence>\tSIL\n");
	EXPECT_LT(ValidateDict(dict), 0);
}
