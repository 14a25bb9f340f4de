/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

/*
	Merges the dictionaries of the items into 'destdict'.
	- All items must have the same silence lexicon.
	- The non-silence lexicon is the union of the item lexicons; all distinct pronunciations of a word are kept.
	  Words with different pronunciations in different items are reported in pron_conflicts.txt.
*/
int CombineLexicons(fs::path destdict, const std::vector<std::pair<std::string, fs::path>> & dictdirs)
{
	if (dictdirs.size() < 1) {
		LOGTW_ERROR << " There are no dictionaries to combine into " << destdict.string() << ".";
		return BB_CONFIGURATION_ERROR;
	}

	StringTable silence_lexicon;
	std::string first_item;
	//word -> pronunciation -> items
	std::map<std::string, std::map<std::string, std::set<std::string>>> words;
	for (const auto & d : dictdirs) {
		fs::path sil(d.second / "silence_lexicon.txt"), nonsil(d.second / "nonsilence_lexicon.txt");
		if (CheckFilesExist({ sil, nonsil }) < 0) {
			LOGTW_ERROR << " [" << d.first << "] The dictionary " << d.second.string() << " is not complete.";
			return BB_STATE_ERROR;
		}
		StringTable t;
		if (ReadStringTable(sil.string(), t) < 0) return BB_ERROR;
		if (first_item.empty()) {
			silence_lexicon = t;
			first_item = d.first;
		}
		else if (!IsTheSame(silence_lexicon, t)) {
			LOGTW_ERROR << " The silence lexicon of item " << d.first << " is different from the silence lexicon of item " << first_item << ".";
			return BB_DATA_ERROR;
		}

		StringTable lex;
		if (ReadStringTable(nonsil.string(), lex) < 0) return BB_ERROR;
		for (const string_vec & e : lex) {
			if (e.size() < 2) {
				LOGTW_ERROR << " [" << d.first << "] Invalid entry in " << nonsil.string() << ": " << join_vector(e, " ");
				return BB_DATA_ERROR;
			}
			std::string pron(join_vector(string_vec(e.begin() + 1, e.end()), " "));
			words[e[0]][pron].insert(d.first);
		}
	}

	if (CreateDir(destdict, true) < 0) return BB_ERROR;

	string_vec silence, nonsilence, conflicts;
	for (const string_vec & e : silence_lexicon)
		silence.push_back(e[0] + "\t" + join_vector(string_vec(e.begin() + 1, e.end()), " "));
	for (const auto & w : words) {
		std::set<std::string> items;
		for (const auto & p : w.second) {
			nonsilence.push_back(w.first + "\t" + p.first);
			items.insert(p.second.begin(), p.second.end());
		}
		if (w.second.size() > 1 && items.size() > 1) {
			std::string c(w.first + "\t");
			int n = 0;
			for (const auto & p : w.second) {
				if (n++ > 0) c += " | ";
				c += join_vector(string_vec(p.second.begin(), p.second.end()), ",") + ": " + p.first;
			}
			conflicts.push_back(c);
		}
	}
	std::set<std::string> lexicon(nonsilence.begin(), nonsilence.end());
	lexicon.insert(silence.begin(), silence.end());

	if (SaveLines(destdict / "silence_lexicon.txt", silence) < 0) return BB_ERROR;
	if (SaveLines(destdict / "nonsilence_lexicon.txt", nonsilence) < 0) return BB_ERROR;
	if (SaveLines(destdict / "lexicon.txt", string_vec(lexicon.begin(), lexicon.end())) < 0) return BB_ERROR;
	if (SaveLines(destdict / "pron_conflicts.txt", conflicts) < 0) return BB_ERROR;
	if (conflicts.size() > 0)
		LOGTW_WARNING << conflicts.size() << " words have different pronunciations in different items, see " << (destdict / "pron_conflicts.txt").string() << ".";

	int ret = PrepareDictDir(destdict);
	if (ret < 0) return ret;
	ret = ValidateDict(destdict);
	if (ret < 0) return ret;

	LOGTW_INFO << "Combined the dictionaries of " << dictdirs.size() << " items into " << destdict.string() << " (" << lexicon.size() << " entries).";
	return BB_OK;
}
