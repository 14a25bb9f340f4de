/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

using KeyedLine = std::pair<std::string, std::string>;

//merges one file of all sources; an id which is in more than one source is an error
static int MergeKeyedFile(const std::string & fname, fs::path destdir, const std::vector<std::pair<std::string, fs::path>> & srcs)
{
	std::vector<KeyedLine> merged;
	std::unordered_map<std::string, std::string> owner;
	for (const auto & src : srcs) {
		string_vec lines;
		if (ReadLines(src.second / fname, lines) < 0) return BB_ERROR;
		for (const std::string & line : lines) {
			std::string key, rest;
			SplitFirstField(line, key, rest);
			auto itOwner = owner.find(key);
			if (itOwner != owner.end()) {
				if (itOwner->second == src.first)
					LOGTW_ERROR << " Duplicate id " << key << " in " << (src.second / fname).string() << ".";
				else
					LOGTW_ERROR << " Id " << key << " of " << fname << " is in item " << itOwner->second << " and in item " << src.first << ".";
				return BB_DATA_ERROR;
			}
			owner.emplace(key, src.first);
			merged.push_back(KeyedLine(key, line));
		}
	}
	std::stable_sort(merged.begin(), merged.end(), [](const KeyedLine & a, const KeyedLine & b) { return a.first < b.first; });
	string_vec out;
	out.reserve(merged.size());
	for (const KeyedLine & kl : merged) out.push_back(kl.second);
	if (SaveLines(destdir / fname, out) < 0) return BB_ERROR;
	return BB_OK;
}

/*
	Combines the (already prefixed) data directories of the items into 'destdir'.
	- A file which is in all sources is merged and sorted on its first field.
	- A file which is only in some of the sources is left out with a warning; utt2spk must be in all of them.
	- spk2utt is regenerated from the merged utt2spk and utt2lang records the item of each utterance.
*/
int CombineDataDirs(fs::path destdir, const std::vector<std::pair<std::string, fs::path>> & srcs)
{
	if (srcs.size() < 1) {
		LOGTW_ERROR << " There is nothing to combine into " << destdir.string() << ".";
		return BB_CONFIGURATION_ERROR;
	}
	try {
		for (const auto & src : srcs) {
			if (!fs::exists(src.second / "utt2spk")) {
				LOGTW_ERROR << " Missing " << (src.second / "utt2spk").string() << " of item " << src.first << ".";
				return BB_STATE_ERROR;
			}
		}
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " Could not check the sources of " << destdir.string() << ". Reason: " << ex.what();
		return BB_ERROR;
	}
	if (CreateDir(destdir, true) < 0) return BB_ERROR;

	string_vec files;
	for (const string_vec * group : { &UttKeyedFiles(), &SpkKeyedFiles(), &RecoKeyedFiles() })
		for (const std::string & f : *group)
			if (f != "utt2lang") files.push_back(f);

	for (const std::string & f : files) {
		int nHave = 0;
		for (const auto & src : srcs)
			if (CheckFilesExist({ src.second / f }, false) == 0) nHave++;
		if (nHave == 0) continue;
		if (nHave < (int)srcs.size()) {
			LOGTW_WARNING << " Not producing " << f << " in " << destdir.string() << ": it is missing from " << (srcs.size() - nHave) << " of the sources.";
			continue;
		}
		int ret = MergeKeyedFile(f, destdir, srcs);
		if (ret < 0) return ret;
	}

	int ret = WriteSpk2Utt(destdir);
	if (ret < 0) return ret;

	//utt2lang
	StringTable utt2lang;
	for (const auto & src : srcs) {
		string_vec lines;
		if (ReadLines(src.second / "utt2spk", lines) < 0) return BB_ERROR;
		for (const std::string & line : lines) {
			std::string utt, rest;
			SplitFirstField(line, utt, rest);
			utt2lang.push_back({ utt, src.first });
		}
	}
	if (SortStringTable(utt2lang, 0) < 0) return BB_ERROR;
	if (SaveStringTable((destdir / "utt2lang").string(), utt2lang) < 0) return BB_ERROR;

	LOGTW_INFO << "Combined " << srcs.size() << " data directories into " << destdir.string() << " (" << utt2lang.size() << " utterances).";
	return BB_OK;
}
