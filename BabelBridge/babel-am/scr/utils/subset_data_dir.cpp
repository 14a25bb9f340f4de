/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

//removes what is at 'p' (only the link itself in case of a symbolic link)
static int RemoveTarget(fs::path p)
{
	try {
		if (fs::is_symlink(p)) fs::remove(p);
		else if (fs::exists(p)) fs::remove_all(p);
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " Could not remove " << p.string() << ". Reason: " << ex.what();
		return BB_ERROR;
	}
	return BB_OK;
}

/*
	Makes 'destdir' a subset of 'numutt' utterances of 'srcdir'.
	If the source does not have more utterances than requested then 'destdir' becomes a relative symbolic
	link to 'srcdir' (both must be in the same directory) and *pAlias is set. Otherwise the utterances at
	the evenly spaced positions floor(i*M/numutt), i = 0..numutt-1, of the sorted utt2spk are selected;
	the same source always gives the same subset.
*/
int SubsetDataDir(fs::path srcdir, int numutt, fs::path destdir, bool * pAlias)
{
	if (pAlias) *pAlias = false;
	if (numutt < 1) {
		LOGTW_ERROR << " Invalid subset size " << numutt << ".";
		return BB_CONFIGURATION_ERROR;
	}
	try {
		if (!fs::exists(srcdir / "utt2spk")) {
			LOGTW_ERROR << " Missing " << (srcdir / "utt2spk").string() << ".";
			return BB_STATE_ERROR;
		}
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " Could not check " << srcdir.string() << ". Reason: " << ex.what();
		return BB_ERROR;
	}

	StringTable utt2spk;
	if (ReadStringTable((srcdir / "utt2spk").string(), utt2spk) < 0) return BB_ERROR;
	if (SortStringTable(utt2spk, 0) < 0) return BB_ERROR;
	const size_t M = utt2spk.size();

	if (RemoveTarget(destdir) < 0) return BB_ERROR;

	if (M <= (size_t)numutt) {
		try {
			fs::create_directory_symlink(srcdir.filename(), destdir);
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << " Could not link " << destdir.string() << " to " << srcdir.string() << ". Reason: " << ex.what();
			return BB_ERROR;
		}
		if (pAlias) *pAlias = true;
		LOGTW_INFO << destdir.filename().string() << " -> " << srcdir.filename().string() << " (" << M << " utterances, " << numutt << " requested).";
		return BB_OK;
	}

	if (CreateDir(destdir, true) < 0) return BB_ERROR;

	std::unordered_set<std::string> utts;
	for (size_t i = 0; i < (size_t)numutt; i++) {
		size_t idx = (size_t)((unsigned long long)i * M / (unsigned long long)numutt);
		utts.insert(utt2spk[idx][0]);
	}

	for (const std::string & f : UttKeyedFiles()) {
		if (!fs::exists(srcdir / f)) continue;
		int ret = FilterScp(utts, srcdir / f, destdir / f);
		if (ret < 0) return ret;
	}
	int ret = WriteSpk2Utt(destdir);
	if (ret < 0) return ret;

	std::unordered_set<std::string> spks;
	StringTable sub_utt2spk;
	if (ReadStringTable((destdir / "utt2spk").string(), sub_utt2spk) < 0) return BB_ERROR;
	for (const string_vec & row : sub_utt2spk)
		if (row.size() > 1) spks.insert(row[1]);
	for (const std::string & f : SpkKeyedFiles()) {
		if (!fs::exists(srcdir / f)) continue;
		ret = FilterScp(spks, srcdir / f, destdir / f);
		if (ret < 0) return ret;
	}

	//recordings: through the segments if there are any, otherwise the recording ids are the utterance ids
	std::unordered_set<std::string> recos;
	if (fs::exists(destdir / "segments")) {
		StringTable segments;
		if (ReadStringTable((destdir / "segments").string(), segments) < 0) return BB_ERROR;
		for (const string_vec & row : segments)
			if (row.size() > 1) recos.insert(row[1]);
	}
	else {
		recos = utts;
	}
	for (const std::string & f : RecoKeyedFiles()) {
		if (!fs::exists(srcdir / f)) continue;
		ret = FilterScp(recos, srcdir / f, destdir / f);
		if (ret < 0) return ret;
	}

	LOGTW_INFO << "Created " << destdir.string() << " with " << numutt << " of " << M << " utterances.";
	return BB_OK;
}
