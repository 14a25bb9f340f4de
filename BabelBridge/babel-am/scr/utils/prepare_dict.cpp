/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

std::string PhoneBase(const std::string & phone)
{
	size_t p = phone.find('_');
	if (p == std::string::npos) return phone;
	return phone.substr(0, p);
}

string_vec PhoneTags(const std::string & phone)
{
	string_vec tags;
	size_t p = phone.find('_');
	if (p == std::string::npos) return tags;
	boost::algorithm::split(tags, phone.substr(p + 1), boost::is_any_of("_"));
	return tags;
}

static int WritePhoneLines(fs::path file, const StringTable & t)
{
	if (SaveStringTable(file.string(), t) < 0) return BB_ERROR;
	return BB_OK;
}

/*
	Creates the phone files of a dictionary directory which already has silence_lexicon.txt and lexicon.txt:
	- silence_phones.txt: the phones of the silence lexicon (in order of appearance)
	- optional_silence.txt: SIL
	- nonsilence_phones.txt: one line per base phone with all its tagged variants (the base itself first)
	- extra_questions.txt: the silence phones, the untagged phones and then one question per tag
*/
int PrepareDictDir(fs::path dictdir)
{
	StringTable silence_lexicon, lexicon;
	if (ReadStringTable((dictdir / "silence_lexicon.txt").string(), silence_lexicon) < 0) return BB_ERROR;
	if (ReadStringTable((dictdir / "lexicon.txt").string(), lexicon) < 0) return BB_ERROR;

	//silence phones
	string_vec silphones;
	std::set<std::string> silwords;
	for (const string_vec & _s : silence_lexicon) {
		if (_s.size() < 2) {
			LOGTW_ERROR << " Invalid line in " << (dictdir / "silence_lexicon.txt").string() << ": " << join_vector(_s, " ");
			return BB_DATA_ERROR;
		}
		silwords.insert(_s[0]);
		for (size_t i = 1; i < _s.size(); i++)
			if (std::find(silphones.begin(), silphones.end(), _s[i]) == silphones.end())
				silphones.push_back(_s[i]);
	}
	std::set<std::string> silset(silphones.begin(), silphones.end());

	//non-silence phones grouped on their base phone
	std::map<std::string, std::set<std::string>> _stmp;
	for (const string_vec & _s : lexicon) {
		if (_s.size() < 2) {
			LOGTW_ERROR << " Invalid line in " << (dictdir / "lexicon.txt").string() << ": " << join_vector(_s, " ");
			return BB_DATA_ERROR;
		}
		if (silwords.find(_s[0]) != silwords.end()) continue;
		for (size_t i = 1; i < _s.size(); i++) {
			if (silset.find(_s[i]) != silset.end()) continue;
			_stmp[PhoneBase(_s[i])].insert(_s[i]);
		}
	}

	StringTable nonsilence_phones;
	string_vec untagged;
	std::map<std::string, std::set<std::string>> tagged; //tag -> phones
	for (auto & pair : _stmp) {
		string_vec line;
		if (pair.second.find(pair.first) != pair.second.end()) {
			line.push_back(pair.first);
			untagged.push_back(pair.first);
		}
		for (const std::string & p : pair.second) {
			if (p == pair.first) continue;
			line.push_back(p);
			for (const std::string & tag : PhoneTags(p))
				tagged[tag].insert(p);
		}
		nonsilence_phones.push_back(line);
	}

	StringTable extra_questions;
	extra_questions.push_back(silphones);
	if (untagged.size() > 0) extra_questions.push_back(untagged);
	for (auto & pair : tagged)
		extra_questions.push_back(string_vec(pair.second.begin(), pair.second.end()));

	StringTable silence_phones, optional_silence;
	for (const std::string & s : silphones) silence_phones.push_back({ s });
	optional_silence.push_back({ "SIL" });

	if (WritePhoneLines(dictdir / "silence_phones.txt", silence_phones) < 0
		|| WritePhoneLines(dictdir / "optional_silence.txt", optional_silence) < 0
		|| WritePhoneLines(dictdir / "nonsilence_phones.txt", nonsilence_phones) < 0
		|| WritePhoneLines(dictdir / "extra_questions.txt", extra_questions) < 0)
		return BB_ERROR;

	LOGTW_INFO << "Phone sets of " << dictdir.string() << ": " << silphones.size() << " silence phones, "
		<< nonsilence_phones.size() << " base phones, " << tagged.size() << " tags.";
	return BB_OK;
}
