/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "Utility2.h"
#include "Utility.h"

/*
	read in the options from a one line options string
*/
BABELBRIDGE_API int GetOptionsVector(std::string ino, std::vector<std::string> & _ov)
{
	_ov.clear();
	try {
		boost::algorithm::trim(ino);
		if (ino != "") {
			strtk::parse(ino, " \t", _ov, strtk::split_options::compress_delimiters);
		}
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << " wrong parameter sequence: " << ino << " (" << ex.what() << ")";
		return -1;
	}
	return 0;
}

BABELBRIDGE_API int GetIntOptionsVector(std::string ino, std::vector<int> & _ov)
{
	_ov.clear();
	string_vec _s;
	if (GetOptionsVector(ino, _s) < 0) return -1;
	for (const std::string & s : _s) {
		if (!is_positive_int(s)) {
			LOGTW_ERROR << " expected a positive number instead of '" << s << "' in: " << ino;
			return -1;
		}
		_ov.push_back(std::stoi(s));
	}
	return 0;
}

BABELBRIDGE_API int SaveOptionsToFile(fs::path p, std::vector<std::string> _o)
{
	fs::ofstream ofs(p, fs::ofstream::binary | fs::ofstream::out);
	if (!ofs) {
		LOGTW_ERROR << "Failed to save options in " << p.string();
		return -1;
	}
	for (std::string s : _o) {
		//make sure that there are no trailing spaces
		boost::algorithm::trim(s);
		ofs << s << "\n";
	}
	ofs.flush(); ofs.close();
	return 0;
}
