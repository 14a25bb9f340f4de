/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

//how the ids of a data directory file are prefixed
enum PrefixMode {
	PREFIX_NONE,		//copied unchanged
	PREFIX_FIRST,		//utterance, speaker or recording id in the first field
	PREFIX_FIRST_TWO,	//segments: utterance id and recording id
	PREFIX_ALL			//utt2spk, spk2utt: all fields are ids
};

static PrefixMode GetPrefixMode(const std::string & fname)
{
	static const std::map<std::string, PrefixMode> modes = {
		{ "text", PREFIX_FIRST }, { "feats.scp", PREFIX_FIRST }, { "utt2dur", PREFIX_FIRST },
		{ "utt2num_frames", PREFIX_FIRST }, { "utt2uniq", PREFIX_FIRST }, { "cmvn.scp", PREFIX_FIRST },
		{ "spk2gender", PREFIX_FIRST }, { "wav.scp", PREFIX_FIRST }, { "reco2file_and_channel", PREFIX_FIRST },
		{ "reco2dur", PREFIX_FIRST },
		{ "segments", PREFIX_FIRST_TWO },
		{ "utt2spk", PREFIX_ALL }, { "spk2utt", PREFIX_ALL }
	};
	auto it = modes.find(fname);
	return it == modes.end() ? PREFIX_NONE : it->second;
}

std::string PrefixId(const std::string & item, const std::string & id, const std::string & delimiter)
{
	std::string prefix(item + delimiter);
	if (boost::algorithm::starts_with(id, prefix)) return id;
	return prefix + id;
}

//prefixes the first 'nFields' ids of the line (all of them if 0); the separators and the rest of the line are kept
static std::string PrefixFields(const std::string & item, const std::string & line, size_t nFields, const std::string & delimiter,
	std::string & first, std::string & firstOrig, size_t & nFound)
{
	std::string out;
	size_t pos = 0;
	nFound = 0;
	while (pos < line.size()) {
		size_t b = line.find_first_not_of(" \t", pos);
		if (b == std::string::npos) {
			out += line.substr(pos);
			break;
		}
		out += line.substr(pos, b - pos);
		if (nFields > 0 && nFound >= nFields) {
			out += line.substr(b);
			break;
		}
		size_t e = line.find_first_of(" \t", b);
		if (e == std::string::npos) e = line.size();
		std::string id(line.substr(b, e - b));
		std::string pid(PrefixId(item, id, delimiter));
		if (nFound == 0) {
			first = pid;
			firstOrig = id;
		}
		out += pid;
		nFound++;
		pos = e;
	}
	return out;
}

static int PrefixFile(const std::string & item, fs::path in, fs::path out, PrefixMode mode, const std::string & delimiter)
{
	string_vec lines, outlines;
	if (ReadLines(in, lines) < 0) return BB_ERROR;
	//prefixed id -> original id
	std::unordered_map<std::string, std::string> keys;
	size_t nFields = (mode == PREFIX_FIRST ? 1 : (mode == PREFIX_FIRST_TWO ? 2 : 0));
	int nLine = 0;
	for (const std::string & line : lines) {
		nLine++;
		std::string first, firstOrig;
		size_t nFound = 0;
		std::string outline(PrefixFields(item, line, nFields, delimiter, first, firstOrig, nFound));
		if (nFound < 1 || (mode == PREFIX_FIRST_TWO && nFound < 2)) {
			LOGTW_ERROR << " Invalid line " << nLine << " in " << in.string() << ".";
			return BB_DATA_ERROR;
		}
		auto ins = keys.insert({ first, firstOrig });
		if (!ins.second) {
			if (ins.first->second != firstOrig) {
				LOGTW_ERROR << " [" << item << "] The ids " << ins.first->second << " and " << firstOrig << " in " << in.string()
					<< " both become " << first << ". Source ids may not start with '" << item << delimiter << "'.";
			}
			else {
				LOGTW_ERROR << " [" << item << "] Duplicate id " << first << " in " << out.string() << " (line " << nLine << " of " << in.string() << ").";
			}
			return BB_DATA_ERROR;
		}
		outlines.push_back(outline);
	}
	if (SaveLines(out, outlines) < 0) return BB_ERROR;
	return BB_OK;
}

/*
	Copies the data directory of an item while prefixing the utterance, speaker and recording ids with
	'<item><delimiter>'. The rest of the lines (paths, transcripts, times) is kept as it is. Subdirectories
	and hidden files (e.g. the completion marker) are not copied.
*/
int PrependItemId(const std::string & item, fs::path srcdir, fs::path destdir, const std::string & delimiter)
{
	if (CheckFilesExist({ srcdir / "utt2spk" }, false) < 0) {
		LOGTW_ERROR << " [" << item << "] Missing " << (srcdir / "utt2spk").string() << ".";
		return BB_STATE_ERROR;
	}
	if (CreateDir(destdir, true) < 0) return BB_ERROR;

	std::vector<fs::path> files;
	try {
		for (fs::directory_iterator it(srcdir), end_it; it != end_it; ++it) {
			if (!fs::is_regular_file(it->status())) continue;
			if (it->path().filename().string()[0] == '.') continue;
			files.push_back(it->path());
		}
		std::sort(files.begin(), files.end());
		for (const fs::path & f : files) {
			PrefixMode mode = GetPrefixMode(f.filename().string());
			if (mode == PREFIX_NONE) {
				fs::copy_file(f, destdir / f.filename(), fs::copy_option::overwrite_if_exists);
				continue;
			}
			int ret = PrefixFile(item, f, destdir / f.filename(), mode, delimiter);
			if (ret < 0) return ret;
		}
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " [" << item << "] Could not copy " << srcdir.string() << " to " << destdir.string() << ". Reason: " << ex.what();
		return BB_ERROR;
	}

	LOGTW_INFO << "[" << item << "] " << destdir.string() << ": " << files.size() << " files with prefixed ids.";
	return BB_OK;
}
