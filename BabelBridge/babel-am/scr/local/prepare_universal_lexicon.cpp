/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"

const StringTable & SilenceLexicon()
{
	static const StringTable silence_lexicon = {
		{ "<silence>", "SIL" },
		{ "<unk>", "<oov>" },
		{ "<noise>", "<sss>" },
		{ "<v-noise>", "<vns>" }
	};
	return silence_lexicon;
}

bool IsSilenceWord(const std::string & word)
{
	for (const string_vec & e : SilenceLexicon())
		if (e[0] == word) return true;
	return false;
}

static bool IsSyllableBoundary(const std::string & token)
{
	return token == "." || token == "#";
}

/*
	Reads the diphthong table (lines of '<phone> <part1> <part2> ...') and the tone table
	(lines of '<tag> <standard tag>', the tags with or without the leading '_').
*/
int ReadPhoneRules(fs::path diphthongs, fs::path tones, PhoneRules & rules)
{
	rules.diphthongs.clear();
	rules.tones.clear();

	if (!diphthongs.empty() && fs::exists(diphthongs)) {
		StringTable t;
		if (ReadStringTable(diphthongs.string(), t) < 0) return BB_ERROR;
		int nLine = 0;
		for (const string_vec & row : t) {
			nLine++;
			if (row.size() < 2) {
				LOGTW_ERROR << " Invalid diphthong rule at line " << nLine << " of " << diphthongs.string() << ".";
				return BB_DATA_ERROR;
			}
			rules.diphthongs[row[0]] = string_vec(row.begin() + 1, row.end());
		}
	}
	else LOGTW_INFO << "No diphthong table (" << diphthongs.string() << "), diphthongs are kept.";

	if (!tones.empty() && fs::exists(tones)) {
		StringTable t;
		if (ReadStringTable(tones.string(), t) < 0) return BB_ERROR;
		int nLine = 0;
		for (const string_vec & row : t) {
			nLine++;
			if (row.size() != 2) {
				LOGTW_ERROR << " Invalid tone rule at line " << nLine << " of " << tones.string() << ".";
				return BB_DATA_ERROR;
			}
			std::string from(boost::algorithm::trim_left_copy_if(row[0], boost::is_any_of("_")));
			std::string to(boost::algorithm::trim_left_copy_if(row[1], boost::is_any_of("_")));
			if (from.empty() || to.empty()) {
				LOGTW_ERROR << " Empty tag at line " << nLine << " of " << tones.string() << ".";
				return BB_DATA_ERROR;
			}
			rules.tones[from] = to;
		}
	}
	else LOGTW_INFO << "No tone table (" << tones.string() << "), tags are kept.";

	return BB_OK;
}

struct TaggedPhone
{
	std::string base;
	string_vec tags;
};

static void AddTag(TaggedPhone & p, const std::string & tag)
{
	if (std::find(p.tags.begin(), p.tags.end(), tag) == p.tags.end())
		p.tags.push_back(tag);
}

/*
	A pronunciation is a list of phone tokens 'base[_tag...]'. A standalone '_tag' token applies the tag to all
	phones of the current syllable; '.' and '#' are syllable boundaries and are removed.
	Diphthongs are split into their parts (the parts keep the tags of the diphthong) and the tags are mapped to
	the standard tags; a tag without a rule is kept as it is.
*/
int StandardizePronunciation(const string_vec & pron, const PhoneRules & rules, string_vec & phones, std::string & error)
{
	phones.clear();
	std::vector<TaggedPhone> out;
	size_t syllable_start = 0;

	auto mapTag = [&rules](const std::string & tag) -> std::string {
		auto it = rules.tones.find(tag);
		return it == rules.tones.end() ? tag : it->second;
	};

	for (const std::string & token : pron) {
		if (token.empty()) continue;
		if (IsSyllableBoundary(token)) {
			syllable_start = out.size();
			continue;
		}
		if (token[0] == '_') {
			std::string tag(token.substr(1));
			if (tag.empty() || tag.find('_') != std::string::npos) {
				error = "invalid tag '" + token + "'";
				return BB_DATA_ERROR;
			}
			if (out.size() == syllable_start) {
				error = "tag '" + token + "' without a phone";
				return BB_DATA_ERROR;
			}
			std::string std_tag(mapTag(tag));
			for (size_t i = syllable_start; i < out.size(); i++)
				AddTag(out[i], std_tag);
			continue;
		}

		string_vec parts;
		boost::algorithm::split(parts, token, boost::is_any_of("_"));
		TaggedPhone p;
		p.base = parts[0];
		for (size_t i = 1; i < parts.size(); i++) {
			if (parts[i].empty()) {
				error = "empty tag in '" + token + "'";
				return BB_DATA_ERROR;
			}
			AddTag(p, mapTag(parts[i]));
		}

		auto itd = rules.diphthongs.find(p.base);
		if (itd == rules.diphthongs.end()) {
			out.push_back(p);
		}
		else {
			for (const std::string & part : itd->second) {
				TaggedPhone pp;
				pp.base = part;
				pp.tags = p.tags;
				out.push_back(pp);
			}
		}
	}

	if (out.empty()) {
		error = "empty pronunciation";
		return BB_DATA_ERROR;
	}
	for (const TaggedPhone & p : out) {
		std::string s(p.base);
		for (const std::string & tag : p.tags) s += "_" + tag;
		phones.push_back(s);
	}
	return BB_OK;
}

static std::string LexiconLine(const std::string & word, const string_vec & phones)
{
	return word + "\t" + join_vector(phones, " ");
}

/*
	Converts the raw lexicon of an item ('word phone phone ...' lines) into the dictionary directory:
	the entries of the silence vocabulary are replaced by the fixed silence lexicon, the other pronunciations
	are standardized. Any malformed entry stops the conversion with BB_DATA_ERROR.
*/
int PrepareUniversalLexicon(fs::path raw_lexicon, fs::path dictdir, const PhoneRules & rules)
{
	if (CheckFileExistsAndNotEmpty(raw_lexicon, true) < 0) return BB_STATE_ERROR;

	string_vec lines;
	if (ReadLines(raw_lexicon, lines) < 0) return BB_ERROR;

	std::set<std::string> nonsilence;
	int nLine = 0, nSkipped = 0;
	for (const std::string & line : lines) {
		nLine++;
		std::string tline(boost::algorithm::trim_copy(line));
		string_vec _w;
		strtk::parse(tline, " \t", _w, strtk::split_options::compress_delimiters);
		if (_w.size() < 2) {
			LOGTW_ERROR << " Malformed entry at line " << nLine << " of " << raw_lexicon.string() << ": '" << line << "'.";
			return BB_DATA_ERROR;
		}
		if (IsSilenceWord(_w[0])) {
			nSkipped++;
			continue;
		}
		string_vec phones;
		std::string error;
		if (StandardizePronunciation(string_vec(_w.begin() + 1, _w.end()), rules, phones, error) < 0) {
			LOGTW_ERROR << " Malformed pronunciation at line " << nLine << " of " << raw_lexicon.string() << " (" << error << "): '" << line << "'.";
			return BB_DATA_ERROR;
		}
		nonsilence.insert(LexiconLine(_w[0], phones));
	}

	if (CreateDir(dictdir, true) < 0) return BB_ERROR;

	string_vec silence;
	for (const string_vec & e : SilenceLexicon())
		silence.push_back(LexiconLine(e[0], string_vec(e.begin() + 1, e.end())));
	std::set<std::string> lexicon(nonsilence.begin(), nonsilence.end());
	lexicon.insert(silence.begin(), silence.end());

	if (SaveLines(dictdir / "silence_lexicon.txt", silence) < 0) return BB_ERROR;
	if (SaveLines(dictdir / "nonsilence_lexicon.txt", string_vec(nonsilence.begin(), nonsilence.end())) < 0) return BB_ERROR;
	if (SaveLines(dictdir / "lexicon.txt", string_vec(lexicon.begin(), lexicon.end())) < 0) return BB_ERROR;
	if (nSkipped > 0) LOGTW_INFO << nSkipped << " silence vocabulary entries of " << raw_lexicon.string() << " were replaced by the silence lexicon.";

	int ret = PrepareDictDir(dictdir);
	if (ret < 0) return ret;
	ret = ValidateDict(dictdir);
	if (ret < 0) return ret;

	LOGTW_INFO << "Universal lexicon saved to " << (dictdir / "lexicon.txt").string() << " (" << lexicon.size() << " entries).";
	return BB_OK;
}
