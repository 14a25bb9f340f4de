/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.

Based on : http://www.dreamincode.net/forums/topic/251269-converting-vector-string-to-char-const/
*/

#pragma once

#include <babel-am/stdafx.h>

//This class makes the argument list for kaldi::ParseOptions::Read() in the form of: "int argc, char *argv[]"
//NOTE: 1. properties must be passed as "--property-name=property-value" in one
//		   string (per element in the input vector) and without space around the '='!
//		2. bool properties may be without the "=" as e.g. "--do-this"
//		3. argv[0] is the program name
class BABELBRIDGE_API StrVec2Arg {
public:
	StrVec2Arg(const std::vector< std::string > &, const std::string progname = "");
	StrVec2Arg(const StrVec2Arg &) = delete;
	StrVec2Arg & operator=(const StrVec2Arg &) = delete;

	char *operator[](int i) { return list[i]; }
	char** argv() { return list.data(); }
	int argc() const { return (int)args.size(); }

private:
	std::vector< std::string > args;
	std::vector< char* > list;
};
