/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "ConfigMatcher.h"
#include "Status.h"

namespace BabelBridge {

	ConfigMatcher::ConfigMatcher(const string_vec & limited_rules, const string_vec & full_rules)
		: m_limited(limited_rules), m_full(full_rules)
	{
	}

	const string_vec & ConfigMatcher::Rules(ResourceTier tier) const
	{
		return tier == ResourceTier::Limited ? m_limited : m_full;
	}

	BABELBRIDGE_API std::string ConfigRuleToRegex(const std::string & pattern, const std::string & item)
	{
		std::string rex("^");
		size_t i = 0;
		while (i < pattern.size()) {
			if (pattern.compare(i, 4, "{id}") == 0) {
				rex += RegexEscape(item);
				i += 4;
				continue;
			}
			char c = pattern[i];
			if (c == '*') rex += ".*";
			else if (c == '?') rex += ".";
			else rex += RegexEscape(std::string(1, c));
			i++;
		}
		rex += "$";
		return rex;
	}

	int ConfigMatcher::Match(const std::string & item, ResourceTier tier, std::vector<fs::path> candidates, fs::path & result) const
	{
		std::sort(candidates.begin(), candidates.end());
		for (const std::string & rule : Rules(tier)) {
			boost::regex rexp(ConfigRuleToRegex(rule, item));
			for (const fs::path & p : candidates) {
				if (boost::regex_match(p.filename().string(), rexp)) {
					result = p;
					return BB_OK;
				}
			}
		}
		LOGTW_ERROR << "[" << item << "] No configuration file matches the rules: " << join_vector(Rules(tier), " ");
		return BB_CONFIGURATION_ERROR;
	}

	BABELBRIDGE_API int ResolveItemConfig(const Params & params, const std::string & item, fs::path & result)
	{
		std::vector<fs::path> candidates;
		try {
			if (!fs::is_directory(params.pth_conf_lang)) {
				LOGTW_ERROR << "[" << item << "] The configuration directory " << params.pth_conf_lang.string() << " does not exist.";
				return BB_CONFIGURATION_ERROR;
			}
			GetAllMatchingFiles(candidates, params.pth_conf_lang, boost::regex(".*"), true);
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "[" << item << "] Could not list " << params.pth_conf_lang.string() << ". " << ex.what();
			return BB_CONFIGURATION_ERROR;
		}
		ConfigMatcher matcher(params.limited_conf_patterns, params.full_conf_patterns);
		int ret = matcher.Match(item, params.tier, candidates, result);
		if (ret < 0) {
			LOGTW_ERROR << "[" << item << "] searched in " << params.pth_conf_lang.string();
			return ret;
		}
		LOGTW_INFO << "[" << item << "] Configuration: " << result.string();
		return BB_OK;
	}
}
