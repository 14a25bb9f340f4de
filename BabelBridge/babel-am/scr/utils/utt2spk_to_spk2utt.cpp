/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

//converts an utt2spk table to a spk2utt table; the speakers keep the order of their first appearance
int utt2spk_to_spk2utt(StringTable & spk2utt, const StringTable & utt2spk)
{
	//make sure that the output table is empty
	spk2utt.clear();
	string_vec speakers;
	using spk2utt2_map = std::unordered_map<std::string, string_vec>;
	spk2utt2_map hashtable;
	for (StringTable::const_iterator it(utt2spk.begin()), it_end(utt2spk.end()); it != it_end; ++it)
	{
		if ((*it).size() != 2) {
			LOGTW_ERROR << " There should be 2 columns in the utt2spk file!";
			return BB_DATA_ERROR;
		}
		spk2utt2_map::iterator itm = hashtable.find((*it)[1]);
		if (itm == hashtable.end())
		{//new speaker
			speakers.push_back((*it)[1]);
			hashtable.emplace((*it)[1], string_vec{ (*it)[0] });
		}
		else {
			itm->second.push_back((*it)[0]);
		}
	}
	for (const std::string & spk : speakers)
	{
		string_vec _s;
		_s.push_back(spk);
		const string_vec & utts = hashtable[spk];
		_s.insert(_s.end(), utts.begin(), utts.end());
		spk2utt.push_back(_s);
	}
	return BB_OK;
}

int WriteSpk2Utt(fs::path datadir)
{
	StringTable utt2spk, spk2utt;
	if (ReadStringTable((datadir / "utt2spk").string(), utt2spk) < 0) return BB_ERROR;
	int ret = utt2spk_to_spk2utt(spk2utt, utt2spk);
	if (ret < 0) {
		LOGTW_ERROR << " Invalid " << (datadir / "utt2spk").string() << ".";
		return ret;
	}
	if (SortStringTable(spk2utt, 0) < 0) return BB_ERROR;
	if (SaveStringTable((datadir / "spk2utt").string(), spk2utt) < 0) return BB_ERROR;
	return BB_OK;
}
