/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>

//split a one line, space separated options string (e.g. "--langs=101 102 103" values)
BABELBRIDGE_API int GetOptionsVector(std::string in, std::vector<std::string> & _ov);
BABELBRIDGE_API int GetIntOptionsVector(std::string in, std::vector<int> & _ov);
//writes one option per line
BABELBRIDGE_API int SaveOptionsToFile(fs::path p, std::vector<std::string> _o);
