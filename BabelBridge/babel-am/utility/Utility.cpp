/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "Utility.h"

//global logging
BABELBRIDGE_API twinLogger::TwinLoggerMT oTwinLog;

//--- Logging override for Kaldi --------------->

//NOTE: this code replaces the Kaldi main logging mechanism with the global twin logging mechanism
static void HandleKaldiLogMessage(const kaldi::LogMessageEnvelope &envelope, const char *message)
{
	switch (envelope.severity) {
	case kaldi::LogMessageEnvelope::kInfo:
		oTwinLog(twinLogger::Info) << message;
		break;
	case kaldi::LogMessageEnvelope::kWarning:
		oTwinLog(twinLogger::Warning) << message;
		break;
	case kaldi::LogMessageEnvelope::kError:
		oTwinLog(twinLogger::Error) << message;
		break;
	case kaldi::LogMessageEnvelope::kAssertFailed:
		oTwinLog(twinLogger::FatalError) << message;
		break;
	default:
		oTwinLog(twinLogger::Debug) << message; //verbose logs (KALDI_VLOG)
	}
}

BABELBRIDGE_API void ReplaceKaldiLogHandlerEx(bool reset)
{
	if (reset) {
		kaldi::SetLogHandler(NULL);
	}
	else {
		kaldi::SetLogHandler(HandleKaldiLogMessage);
	}
}

//<------------------- Logging override for Kaldi


//replaces all occurances of the 'search' string with 'replace' string in the 'subject' string and in place
BABELBRIDGE_API void ReplaceStringInPlace(std::string& subject, const std::string& search, const std::string& replace)
{
	size_t pos = 0;
	while ((pos = subject.find(search, pos)) != std::string::npos) {
		subject.replace(pos, search.length(), replace);
		pos += replace.length();
	}
}

//escapes all characters which have a special meaning in a (perl style) boost::regex
BABELBRIDGE_API std::string RegexEscape(const std::string & s)
{
	static const boost::regex rexp("[.^$|()\\[\\]{}*+?\\\\]");
	return boost::regex_replace(s, rexp, "\\\\$&", boost::match_default | boost::format_perl);
}

//-------------------------------------------------------------------------------------------------------------------

BABELBRIDGE_API StringTable readData(std::string const path, std::string delimiter)
{
	std::ifstream ifs(path);
	if (!ifs) {
		throw std::runtime_error("Error opening file.");
	}

	StringTable table;
	std::string line;
	while (std::getline(ifs, line))	{
		std::vector<std::string> _w;
		boost::algorithm::trim(line);
		if (line.empty()) continue;
		strtk::parse(line, delimiter, _w, strtk::split_options::compress_delimiters);
		table.emplace_back(_w);
	}
	return table;
}

BABELBRIDGE_API int ReadStringTable(std::string const path, StringTable & table, std::string delimiter)
{
	try {
		table = readData(path, delimiter);
		return 0;
	}
	catch (std::exception const& e) {
		LOGTW_ERROR << " " << e.what() << " (Reading file " << path << ")";
		return -1;
	}
}

BABELBRIDGE_API int SaveStringTable(std::string const& path, const StringTable & table)
{
	try {
		//NOTE: binary mode so that no '\r' is added in front of '\n'; the toolkit scripts do not accept it
		fs::ofstream file_(path, std::ios::binary | std::ios::out);
		if (!file_) {
			LOGTW_ERROR << " can't open output file: " << path << ".";
			return -1;
		}
		for (const string_vec & row : table) {
			file_ << join_vector(row, " ") << '\n';
		}
		file_.flush(); file_.close();
		return 0;
	}
	catch (std::exception const& e) {
		LOGTW_ERROR << " " << e.what() << " (Writing file " << path << ")";
		return -1;
	}
}

/*
	In place sort of a StringTable by one column (string order, the whole row breaks ties).
	When requested bMakeUnique erases the rows with a duplicate key in 'col' (the first one is kept).
*/
BABELBRIDGE_API int SortStringTable(StringTable & table, int col, bool bMakeUnique)
{
	for (const string_vec & row : table) {
		if ((int)row.size() < col + 1) {
			LOGTW_ERROR << " The string table size does not match the requested sort column index.";
			return -1;
		}
	}
	std::stable_sort(table.begin(), table.end(), [col](const string_vec & lhs, const string_vec & rhs) {
		if (lhs[col] != rhs[col]) return lhs[col] < rhs[col];
		return lhs < rhs;
	});
	if (bMakeUnique) {
		table.erase(std::unique(table.begin(), table.end(), [col](const string_vec & lhs, const string_vec & rhs) {
			return lhs[col] == rhs[col];
		}), table.end());
	}
	return 0;
}

BABELBRIDGE_API bool IsTheSame(const StringTable & table1, const StringTable & table2)
{
	if (table1.size() != table2.size()) return false;
	for (size_t i = 0; i < table1.size(); i++) {
		if (table1[i] != table2[i]) return false;
	}
	return true;
}

BABELBRIDGE_API int ReadLines(fs::path path, string_vec & lines, bool skipEmpty)
{
	lines.clear();
	fs::ifstream ifs(path, std::ios::binary);
	if (!ifs) {
		LOGTW_ERROR << " Error opening file " << path.string() << ".";
		return -1;
	}
	std::string line;
	while (std::getline(ifs, line)) {
		if (!line.empty() && line.back() == '\r') line.pop_back();
		if (skipEmpty) {
			std::string s(line);
			boost::algorithm::trim(s);
			if (s.empty()) continue;
		}
		lines.push_back(line);
	}
	return 0;
}

BABELBRIDGE_API int SaveLines(fs::path path, const string_vec & lines)
{
	fs::ofstream ofs(path, std::ios::binary | std::ios::out);
	if (!ofs) {
		LOGTW_ERROR << " Can't open output file: " << path.string() << ".";
		return -1;
	}
	for (const std::string & line : lines)
		ofs << line << "\n";
	ofs.flush(); ofs.close();
	if (!ofs) {
		LOGTW_ERROR << " Failed to write " << path.string() << ".";
		return -1;
	}
	return 0;
}

BABELBRIDGE_API void SplitFirstField(const std::string & line, std::string & first, std::string & rest)
{
	size_t b = line.find_first_not_of(" \t");
	if (b == std::string::npos) {
		first = "";
		rest = "";
		return;
	}
	size_t e = line.find_first_of(" \t", b);
	if (e == std::string::npos) {
		first = line.substr(b);
		rest = "";
	}
	else {
		first = line.substr(b, e - b);
		rest = line.substr(e);
	}
}

//returns a vector with the elements which are in both input vectors
BABELBRIDGE_API std::vector<std::string> instersection(std::vector<std::string> v1, std::vector<std::string> v2)
{
	std::vector<std::string> v3;
	std::sort(v1.begin(), v1.end());
	std::sort(v2.begin(), v2.end());
	std::set_intersection(v1.begin(), v1.end(), v2.begin(), v2.end(), std::back_inserter(v3));
	return v3;
}

//returns true if there is no overlap
BABELBRIDGE_API bool IsDisjoint(std::vector<std::string> v1, std::vector<std::string> v2)
{
	return instersection(v1, v2).size() == 0;
}

BABELBRIDGE_API bool is_positive_int(const std::string& s)
{
	return !s.empty() && std::find_if(s.begin(),
		s.end(), [](char c) { return !std::isdigit(static_cast<unsigned char>(c)); }) == s.end();
}

BABELBRIDGE_API int CreateDir(fs::path dir, bool deletecontents) {
	try {
		if (fs::exists(dir)) {
			if (deletecontents) {
				//remove only the contents but not the directory
				for (fs::directory_iterator end_dir_it, it(dir); it != end_dir_it; ++it) {
					fs::remove_all(it->path());
				}
			}
		}
		else {
			if (!fs::create_directories(dir)) {
				LOGTW_ERROR << " could not create directory " << dir.string() << ".";
				return -1;
			}
		}
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " could not create directory " << dir.string() << ". Reason: " << ex.what();
		return -1;
	}
	return 0;
}

/* checks if the files exist and returns -1 if one of the files does not exist, otherwise returns 0.*/
BABELBRIDGE_API int CheckFilesExist(std::vector<fs::path> _files, bool report)
{
	try {
		for (fs::path p : _files) {
			if (!fs::exists(p))
			{
				if (report)
					LOGTW_ERROR << "Expected file " << p.string() << " to exist.";
				return -1;
			}
		}
	}
	catch (const std::exception& ex) {
		if (report)
			LOGTW_ERROR << "Could not check the files. Reason: " << ex.what();
		return -1;
	}
	return 0;
}

//-----------------------------------------------------------------------------------------------------------------
//BOOST Wildcard file actions library API
//-----------------------------------------------------------------------------------------------------------------
/*
dir: the directory in which we are searching
regex_filename: the file name including regex wildcards
IMPORTANT: must model the whole file name in the regex because boost::regex_match is used!
	boost::regex("^(word_boundary\\.).*"))       =>      word_boundary.*
*/
BABELBRIDGE_API void GetAllMatchingFiles(std::vector< fs::path > & all_matching_files, fs::path dir, boost::regex regex_filename, bool recursive)
{
	if (recursive) {
		fs::recursive_directory_iterator end_itr;
		for (fs::recursive_directory_iterator i(dir, fs::symlink_option::recurse); i != end_itr; ++i)
		{
			if (!fs::is_regular_file(i->status())) continue;
			if (!boost::regex_match(i->path().filename().string(), regex_filename)) continue;
			all_matching_files.push_back(i->path());
		}
		return;
	}
	fs::directory_iterator end_itr; // Default ctor yields past-the-end
	for (fs::directory_iterator i(dir); i != end_itr; ++i)
	{
		// Skip if not a file
		if (!fs::is_regular_file(i->status())) continue;
		if (!boost::regex_match(i->path().filename().string(), regex_filename)) continue;
		// File matches, store it
		all_matching_files.push_back(i->path());
	}
}

//-----------------------------------------------------------------------------------------------------------------
//General purpose helpers
//-----------------------------------------------------------------------------------------------------------------

/*
	Filter each line of 'in' with the 'filter' and write it to 'out'
	'filter' is a list of regex expressions with their replacement strings, applied in order to each line.
*/
BABELBRIDGE_API int FilterFile(fs::path in, fs::path out, const std::vector<std::pair<std::string, std::string>> & filter)
{
	try
	{
		string_vec lines;
		if (ReadLines(in, lines, false) < 0) return -1;
		for (std::string & line : lines) {
			for (auto &pair : filter) {
				boost::regex rexp(pair.first);
				line = boost::regex_replace(line, rexp, pair.second);
			}
		}
		if (SaveLines(out, lines) < 0) return -1;
	}
	catch (const std::exception& ex)
	{
		LOGTW_ERROR << "Could not filter file " << in.string() << ". Reason: " << ex.what();
		return -1;
	}
	return 0;
}
