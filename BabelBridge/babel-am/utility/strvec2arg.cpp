/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.

Based on : http://www.dreamincode.net/forums/topic/251269-converting-vector-string-to-char-const/
*/

#include "babel-am/utility/strvec2arg.h"

StrVec2Arg::StrVec2Arg(const std::vector< std::string > &v, const std::string progname)
{
	args.push_back(progname == "" ? std::string("babel_universal_am") : progname);
	args.insert(args.end(), v.begin(), v.end());
	//NOTE: 'args' is not modified after this point, the pointers stay valid
	for (std::string & s : args)
		list.push_back(&s[0]);
	list.push_back(NULL);
}
