/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>
#include "babel-am/scr/Params.h"

namespace BabelBridge {

	/*
		Selects the configuration file of an item from a set of candidate files.
		Each tier has an ordered list of rules. A rule is a file name glob ('*' and '?') in which {id} stands for
		the item identifier, e.g. "{id}-*limitedLP*.conf". The rules are tried in rank order and the first rule
		matching any candidate wins; among the candidates matching that rule the lexicographically first path
		is returned. The result only depends on (item, tier, candidate set).
	*/
	class BABELBRIDGE_API ConfigMatcher
	{
	public:
		ConfigMatcher() {}
		ConfigMatcher(const string_vec & limited_rules, const string_vec & full_rules);

		//returns BB_OK and sets 'result', or BB_CONFIGURATION_ERROR if no candidate matches
		int Match(const std::string & item, ResourceTier tier, std::vector<fs::path> candidates, fs::path & result) const;

	private:
		const string_vec & Rules(ResourceTier tier) const;

		string_vec m_limited;
		string_vec m_full;
	};

	//converts a rule to a regex matching a whole file name
	BABELBRIDGE_API std::string ConfigRuleToRegex(const std::string & pattern, const std::string & item);

	//scans the configuration directory of the project (recursively) and selects the item's configuration file
	BABELBRIDGE_API int ResolveItemConfig(const Params & params, const std::string & item, fs::path & result);
}
