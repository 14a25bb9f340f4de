/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

//returns -2 if error; -1 if it does not exist; returns 0 if everything is OK (exists and not empty)
int CheckFileExistsAndNotEmpty(fs::path file, bool bShowError)
{
	try
	{
		if (!fs::exists(file) || fs::is_empty(file))
		{
			if (bShowError)
				LOGTW_ERROR << " the file " << file.string() << " does not exist or empty.";
			return -1;
		}
	}
	catch (std::exception const& e)
	{
		LOGTW_FATALERROR << " " << e.what() << ".";
		return -2;
	}
	return 0;
}

//checks if every string in the text file is unique and puts all strings in the _v vector
//if check_valid_ending == true it check for some special character endings
// (phones ending in _B, _E, _S or _I will cause problems with word-position-dependent systems)
int CheckDuplicates(fs::path _path, bool check_valid_ending, std::vector<std::string> & _v)
{
	StringTable txt;
	if (ReadStringTable(_path.string(), txt) < 0) return -1;
	for (StringTable::const_iterator it(txt.begin()), it_end(txt.end()); it != it_end; ++it)
	{
		for (string_vec::const_iterator itc(it->begin()), itc_end(it->end()); itc != itc_end; ++itc)
		{
			const std::string & s(*itc);
			if (check_valid_ending && s.length() > 1) {
				std::string ss = s.substr(s.length() - 2);
				if (ss == "_B" || ss == "_E" || ss == "_S" || ss == "_I")
				{
					LOGTW_ERROR << " the characters _B, _E, _S and _I are not allowed as last characters in " << _path.string() << " (" << s << ").";
					return -1;
				}
			}
			_v.push_back(s);
		}
	}
	if (!is_unique(_v)) {
		LOGTW_ERROR << " duplicates in " << _path.string() << ".";
		return -1;
	}
	return 0;
}

//checks the lexicon for consistency with the phone sets
int CheckLexicon(fs::path lp, int num_prob_cols, const std::vector<std::string> & silencephones, const std::vector<std::string> & nonsilencephones)
{
	if (silencephones.size() < 1 || nonsilencephones.size() < 1) {
		LOGTW_ERROR << " no silence and/or non-silence phones detected.";
		return -1;
	}
	std::unordered_set<std::string> phones(silencephones.begin(), silencephones.end());
	phones.insert(nonsilencephones.begin(), nonsilencephones.end());

	string_vec lines;
	if (ReadLines(lp, lines, false) < 0) return -1;
	std::unordered_set<std::string> seen;
	int nLine = 0;
	for (const std::string & line : lines) {
		nLine++;
		if (!seen.insert(line).second) {
			LOGTW_ERROR << " Duplicate lines in file: " << lp.string() << " (line " << nLine << ").";
			return -1;
		}

		std::string tline(boost::algorithm::trim_copy(line));
		std::vector<std::string> _words;
		strtk::parse(tline, " \t", _words, strtk::split_options::compress_delimiters);
		if (tline.empty() || _words.size() < 1) {
			LOGTW_ERROR << " empty lexicon line in file: " << lp.string() << ".";
			return -1;
		}

		//forbidden word:
		if (_words[0].find("<s>", 0) != std::string::npos ||
			_words[0].find("</s>", 0) != std::string::npos ||
			_words[0].find("<eps>", 0) != std::string::npos ||
			_words[0].find("#0", 0) != std::string::npos)
		{
			LOGTW_ERROR << " Forbidden word in " << _words[0] << " (<s>, </s>, <eps>, #0) in file: " << lp.string() << ".";
			return -1;
		}

		int nextCol = 1;
		for (int n = nextCol; n < nextCol + num_prob_cols && n < (int)_words.size(); n++) {
			double d = 0.0;
			try { d = std::stod(_words[n]); }
			catch (const std::exception&) { d = -1.0; }
			if (!(d > 0.0 && d <= 1.0)) {
				LOGTW_ERROR << " bad pron-prob in lexicon-line " << nLine << " in file: " << lp.string() << ".";
				return -1;
			}
		}
		nextCol += num_prob_cols;
		if ((int)_words.size() < nextCol + 1) {
			LOGTW_ERROR << " " << lp.string() << " contains word " << _words[0] << " with empty pronunciation.";
			return -1;
		}

		for (int n = nextCol; n < (int)_words.size(); n++)
		{
			if (phones.find(_words[n]) == phones.end())
			{
				LOGTW_ERROR << " " << _words[n] << " (word " << _words[0] << ") is not in silence_phones.txt and neither in nonsilence_phones.txt.";
				return -1;
			}
		}
	}
	return 0;
}
