/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#pragma once
#include <babel-am/stdafx.h>
#include "base/kaldi-error.h"
#include "babel-am/utility/TwinLoggerMT.h"

//global logging
extern BABELBRIDGE_API twinLogger::TwinLoggerMT oTwinLog;
#define LOGTW_DEBUG oTwinLog(twinLogger::Debug, __FILE__, __LINE__)
#define LOGTW_INFO oTwinLog(twinLogger::Info)
#define LOGTW_WARNING oTwinLog(twinLogger::Warning)
#define LOGTW_ERROR oTwinLog(twinLogger::Error)
#define LOGTW_FATALERROR oTwinLog(twinLogger::FatalError)

//---Logging override for Kaldi ---------------------
//routes KALDI_LOG/KALDI_WARN/KALDI_ERR messages (e.g. from ParseOptions) to the twin logger; reset restores Kaldi's handler
BABELBRIDGE_API void ReplaceKaldiLogHandlerEx(bool reset = false);
//--------------------------------------------------

using StringTable = std::vector<std::vector<std::string>>;
BABELBRIDGE_API StringTable readData(std::string const path, std::string delimiter = " \t");
BABELBRIDGE_API int ReadStringTable(std::string const path, StringTable & table, std::string delimiter = " \t");
BABELBRIDGE_API int SaveStringTable(std::string const& path, const StringTable & table);
BABELBRIDGE_API int SortStringTable(StringTable & table, int col, bool bMakeUnique = false);
BABELBRIDGE_API bool IsTheSame(const StringTable & table1, const StringTable & table2);

//line based I/O; the lines are kept exactly as they are in the file (no tokenization)
BABELBRIDGE_API int ReadLines(fs::path path, string_vec & lines, bool skipEmpty = true);
BABELBRIDGE_API int SaveLines(fs::path path, const string_vec & lines);
//splits a line into its first field and the rest of the line (the separating whitespace stays in 'rest')
BABELBRIDGE_API void SplitFirstField(const std::string & line, std::string & first, std::string & rest);

BABELBRIDGE_API void ReplaceStringInPlace(std::string& subject, const std::string& search, const std::string& replace);
BABELBRIDGE_API std::string RegexEscape(const std::string & s);
BABELBRIDGE_API std::vector<std::string> instersection(std::vector<std::string> v1, std::vector<std::string> v2);
BABELBRIDGE_API bool IsDisjoint(std::vector<std::string> v1, std::vector<std::string> v2);
BABELBRIDGE_API bool is_positive_int(const std::string& s);

BABELBRIDGE_API int CreateDir(fs::path dir, bool deletecontents = true);
BABELBRIDGE_API int CheckFilesExist(std::vector<fs::path> _files, bool report = true);

template <typename T>
std::string join_vector(const T& v, const std::string& delim) {
	std::ostringstream s;
	for (const auto& i : v) {
		if (&i != &v[0]) {
			s << delim;
		}
		s << i;
	}
	return s.str();
}

//whether the vector only contains unique elements
template <typename T>
bool is_unique(std::vector<T> vec)
{
	std::sort(vec.begin(), vec.end());
	return std::unique(vec.begin(), vec.end()) == vec.end();
}

//-----------------------------------------------------------------------------------------------------------------
//BOOST Wildcard file actions library API
//-----------------------------------------------------------------------------------------------------------------
BABELBRIDGE_API void GetAllMatchingFiles(std::vector< fs::path > & all_matching_files, fs::path dir, boost::regex regex_filename, bool recursive = false);

//-----------------------------------------------------------------------------------------------------------------
//General purpose helpers
//-----------------------------------------------------------------------------------------------------------------
BABELBRIDGE_API int FilterFile(fs::path in, fs::path out, const std::vector<std::pair<std::string, std::string>> & filter);
