/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

//phone pairs "p1 p2" which are split apart by at least one extra question
using distinguished_set = std::unordered_set<std::string>;

static int CheckExtraQuestions(fs::path lp, const string_vec & silencephones, const string_vec & nonsilencephones, distinguished_set & distinguished)
{
	std::unordered_set<std::string> phones(silencephones.begin(), silencephones.end());
	phones.insert(nonsilencephones.begin(), nonsilencephones.end());

	StringTable exqs;
	if (ReadStringTable(lp.string(), exqs) < 0) return -1;
	int nLine = 0;
	for (const string_vec & q : exqs)
	{
		nLine++;
		std::unordered_set<std::string> inq(q.begin(), q.end());
		for (const std::string & p : q) {
			if (phones.find(p) == phones.end()) {
				LOGTW_ERROR << " " << p << " in line " << nLine << " of " << lp.string() << " is not a known phone.";
				return -1;
			}
			// for each p1 in this question and p2 not in this question (and in nonsilence phones)... mark p1, p2 as being split apart
			for (const std::string & s : nonsilencephones) {
				if (inq.find(s) != inq.end()) continue;
				distinguished.insert(p + " " + s);
				distinguished.insert(s + " " + p);
			}
		}
	}
	return 0;
}

/*
	Validate the dictionary
*/
int ValidateDict(fs::path pthdict)
{
	fs::path pth_silence_phones_txt = (pthdict / "silence_phones.txt");
	fs::path pth_optional_silence_txt = (pthdict / "optional_silence.txt");
	fs::path pth_nonsilence_phones_txt = (pthdict / "nonsilence_phones.txt");
	fs::path pth_lexicon_txt = (pthdict / "lexicon.txt");
	fs::path pth_lexiconp_txt = (pthdict / "lexiconp.txt");
	fs::path pth_extra_questions_txt = (pthdict / "extra_questions.txt");

	std::vector<std::string> silencephones, nonsilencephones;

	//Checking silence_phones.txt -------------------------------
	if (CheckFileExistsAndNotEmpty(pth_silence_phones_txt, true) < 0) return BB_DATA_ERROR;
	if (CheckDuplicates(pth_silence_phones_txt, true, silencephones) < 0) return BB_DATA_ERROR;

	//Checking optional_silence.txt------------------------------
	if (CheckFileExistsAndNotEmpty(pth_optional_silence_txt, true) < 0) return BB_DATA_ERROR;
	StringTable txt;
	if (ReadStringTable(pth_optional_silence_txt.string(), txt) < 0) return BB_ERROR;
	if (txt.size() < 1) {
		LOGTW_ERROR << " phone not found in " << pth_optional_silence_txt.string() << ".";
		return BB_DATA_ERROR;
	}
	else if (txt.size() > 1 || txt[0].size() > 1) {
		LOGTW_ERROR << " only 1 phone is expected in " << pth_optional_silence_txt.string() << ".";
		return BB_DATA_ERROR;
	}
	if (std::find(silencephones.begin(), silencephones.end(), txt[0][0]) == silencephones.end()) {
		LOGTW_ERROR << " the optional silence " << txt[0][0] << " is not a silence phone.";
		return BB_DATA_ERROR;
	}

	//Checking nonsilence_phones.txt -------------------------------
	if (CheckFileExistsAndNotEmpty(pth_nonsilence_phones_txt, true) < 0) return BB_DATA_ERROR;
	if (CheckDuplicates(pth_nonsilence_phones_txt, true, nonsilencephones) < 0) return BB_DATA_ERROR;

	//Checking disjoint: silence_phones.txt, nonsilence_phones.txt
	if (!IsDisjoint(silencephones, nonsilencephones)) {
		LOGTW_ERROR << " silence_phones.txt and nonsilence_phones.txt has overlap: " << join_vector(instersection(silencephones, nonsilencephones), " ");
		return BB_DATA_ERROR;
	}

	//check_lexicon
	bool bLexicon = false;
	if (fs::exists(pth_lexicon_txt)) {
		if (CheckLexicon(pth_lexicon_txt, 0, silencephones, nonsilencephones) < 0) return BB_DATA_ERROR;
		bLexicon = true;
	}
	if (fs::exists(pth_lexiconp_txt)) {
		if (CheckLexicon(pth_lexiconp_txt, 1, silencephones, nonsilencephones) < 0) return BB_DATA_ERROR;
		bLexicon = true;
	}
	if (!bLexicon) {
		LOGTW_ERROR << "Neither lexicon.txt or lexiconp.txt exist in directory " << pthdict.string() << ".";
		return BB_DATA_ERROR;
	}

	//Checking extra_questions.txt -------------------------------
	distinguished_set distinguished;
	if (fs::exists(pth_extra_questions_txt) && !fs::is_empty(pth_extra_questions_txt))
	{
		if (CheckExtraQuestions(pth_extra_questions_txt, silencephones, nonsilencephones, distinguished) < 0) return BB_DATA_ERROR;
	}

	/*
	check nonsilence_phones.txt again for phone-pairs that are never distinguishable.
	(note: this situation is normal and expected for silence phones, so we don't check it.)
	*/
	int num_warn_nosplit = 0;
	StringTable nsp_txt;
	if (ReadStringTable(pth_nonsilence_phones_txt.string(), nsp_txt) < 0) return BB_ERROR;
	for (const string_vec & row : nsp_txt)
	{
		for (size_t i = 0; i < row.size(); i++) {
			for (size_t j = i + 1; j < row.size(); j++) {
				if (distinguished.find(row[i] + " " + row[j]) == distinguished.end()) {
					LOGTW_WARNING << " phones " << row[i] << " and " << row[j] << " share a tree root but can never be distinguished by extra_questions.txt.";
					num_warn_nosplit++;
				}
			}
		}
	}
	if (num_warn_nosplit > 0) {
		LOGTW_WARNING << "NOTE WARNINGS ABOVE: You can build a system with this setup but some phones will be acoustically indistinguishable!";
	}

	LOGTW_INFO << pthdict.string() << " is OK!";
	return BB_OK;
}
