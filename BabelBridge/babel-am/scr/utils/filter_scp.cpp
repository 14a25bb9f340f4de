/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

/*
Filters an scp file (or any file whose first field is an id), printing out only those lines whose
first field is in 'ids'. The selected lines are copied unchanged.
*/
int FilterScp(const std::unordered_set<std::string> & ids, fs::path in_scp, fs::path out_scp)
{
	string_vec lines, out;
	if (ReadLines(in_scp, lines) < 0) return BB_ERROR;
	int line = 1;
	for (const std::string & l : lines)
	{
		string_vec _w;
		strtk::parse(l, " \t", _w, strtk::split_options::compress_delimiters);
		//NOTE: a leading delimiter gives an empty first token
		if (!_w.empty() && _w[0].empty()) _w.erase(_w.begin());
		if (_w.empty()) {
			LOGTW_ERROR << " Invalid input scp data in " << in_scp.string() << " at line " << line << ".";
			return BB_DATA_ERROR;
		}
		if (ids.find(_w[0]) != ids.end()) out.push_back(l);
		line++;
	}
	if (SaveLines(out_scp, out) < 0) return BB_ERROR;
	return BB_OK;
}

const string_vec & UttKeyedFiles()
{
	static const string_vec files = { "utt2spk", "text", "feats.scp", "segments", "utt2dur", "utt2num_frames", "utt2lang", "utt2uniq" };
	return files;
}

const string_vec & SpkKeyedFiles()
{
	static const string_vec files = { "spk2gender", "cmvn.scp" };
	return files;
}

const string_vec & RecoKeyedFiles()
{
	static const string_vec files = { "wav.scp", "reco2file_and_channel", "reco2dur" };
	return files;
}
