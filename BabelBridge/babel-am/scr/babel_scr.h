/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#pragma once
#include <babel-am/stdafx.h>
#include "babel-am/utility/Utility.h"
#include "babel-am/scr/Status.h"

//-----------------------------------------------------------------------------------------------------------------
// data directories (utils)
//-----------------------------------------------------------------------------------------------------------------

//files of a data directory whose first field is an utterance id
BABELBRIDGE_API const string_vec & UttKeyedFiles();
//files of a data directory whose first field is a speaker id
BABELBRIDGE_API const string_vec & SpkKeyedFiles();
//files of a data directory whose first field is a recording id
BABELBRIDGE_API const string_vec & RecoKeyedFiles();

BABELBRIDGE_API int utt2spk_to_spk2utt(StringTable & spk2utt, const StringTable & utt2spk);
//writes spk2utt (sorted on the speaker) from the utt2spk file of the data directory
BABELBRIDGE_API int WriteSpk2Utt(fs::path datadir);
//keeps the lines of in_scp whose first field is in 'ids'; the lines are copied unchanged
BABELBRIDGE_API int FilterScp(const std::unordered_set<std::string> & ids, fs::path in_scp, fs::path out_scp);

//union of item data directories; srcs: (item id, data directory)
BABELBRIDGE_API int CombineDataDirs(fs::path destdir, const std::vector<std::pair<std::string, fs::path>> & srcs);
//a stable, evenly spaced subset of numutt utterances, or a link to srcdir if it has no more than numutt utterances
BABELBRIDGE_API int SubsetDataDir(fs::path srcdir, int numutt, fs::path destdir, bool * pAlias = NULL);

//-----------------------------------------------------------------------------------------------------------------
// dictionaries (utils)
//-----------------------------------------------------------------------------------------------------------------

BABELBRIDGE_API int CheckFileExistsAndNotEmpty(fs::path file, bool bShowError);
int CheckDuplicates(fs::path _path, bool check_valid_ending, std::vector<std::string> & _v);
int CheckLexicon(fs::path lp, int num_prob_cols, const std::vector<std::string> & silencephones, const std::vector<std::string> & nonsilencephones);

BABELBRIDGE_API int ValidateDict(fs::path pthdict);
//derives silence_phones.txt, optional_silence.txt, nonsilence_phones.txt and extra_questions.txt
//from silence_lexicon.txt and lexicon.txt in the dictionary directory
BABELBRIDGE_API int PrepareDictDir(fs::path dictdir);
//the base of a tagged phone: a_T3 -> a
BABELBRIDGE_API std::string PhoneBase(const std::string & phone);
//the tags of a tagged phone: a_T3_L -> T3 L
BABELBRIDGE_API string_vec PhoneTags(const std::string & phone);

//-----------------------------------------------------------------------------------------------------------------
// universal lexicon (local)
//-----------------------------------------------------------------------------------------------------------------

//the fixed silence lexicon shared by all items: <silence> SIL, <unk> <oov>, <noise> <sss>, <v-noise> <vns>
BABELBRIDGE_API const StringTable & SilenceLexicon();
BABELBRIDGE_API bool IsSilenceWord(const std::string & word);

struct BABELBRIDGE_API PhoneRules
{
	std::map<std::string, string_vec> diphthongs;	//phone -> its parts
	std::map<std::string, std::string> tones;		//item specific tag -> standard tag
};

//reads the diphthong and tone tables of an item; a missing table file means no rule of that kind
BABELBRIDGE_API int ReadPhoneRules(fs::path diphthongs, fs::path tones, PhoneRules & rules);
//splits diphthongs and standardizes tags of one pronunciation; returns BB_DATA_ERROR with 'error' set on failure
BABELBRIDGE_API int StandardizePronunciation(const string_vec & pron, const PhoneRules & rules, string_vec & phones, std::string & error);
//writes silence_lexicon.txt, nonsilence_lexicon.txt, lexicon.txt and the phone files to dictdir
BABELBRIDGE_API int PrepareUniversalLexicon(fs::path raw_lexicon, fs::path dictdir, const PhoneRules & rules);

//-----------------------------------------------------------------------------------------------------------------
// item prefixing and merging (local)
//-----------------------------------------------------------------------------------------------------------------

//item + delimiter + id; an id which already has this prefix is returned unchanged
BABELBRIDGE_API std::string PrefixId(const std::string & item, const std::string & id, const std::string & delimiter);
//copies a data directory while prefixing all utterance, speaker and recording ids
BABELBRIDGE_API int PrependItemId(const std::string & item, fs::path srcdir, fs::path destdir, const std::string & delimiter);
//merges item dictionaries; dictdirs: (item id, dictionary directory)
BABELBRIDGE_API int CombineLexicons(fs::path destdict, const std::vector<std::pair<std::string, fs::path>> & dictdirs);
